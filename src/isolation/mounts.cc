#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/isolation/mounts.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/syscalls.hh>
#include <string>
#include <sys/mount.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using std::string;

namespace {

// The new root is assembled here, it is hidden only inside our mount namespace
constexpr const char* staging_dir = "/tmp";

struct BindMount {
    string path;
    uint64_t attrs;
    bool recursive;
};

void create_dirs(const string& path) {
    for (size_t pos = 1; pos <= path.size(); ++pos) {
        if (pos != path.size() && path[pos] != '/') {
            continue;
        }
        auto prefix = path.substr(0, pos);
        if (mkdir(prefix.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) &&
            errno != EEXIST)
        {
            THROW_AS(sandpool::SetupFailure, "mkdir(", prefix, ")", errmsg());
        }
    }
}

void create_mount_point(const string& source, const string& dest) {
    struct stat64 st;
    if (lstat64(source.c_str(), &st)) {
        THROW_AS(sandpool::SetupFailure, "lstat(", source, ")", errmsg());
    }
    auto parent = dest.substr(0, dest.rfind('/'));
    create_dirs(parent);
    if (S_ISDIR(st.st_mode)) {
        create_dirs(dest);
        return;
    }
    FileDescriptor fd{
        dest.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH
    };
    if (!fd.is_open() && errno != EISDIR) {
        THROW_AS(sandpool::SetupFailure, "open(", dest, ", O_CREAT)", errmsg());
    }
}

// Recreates the symlink instead of binding its target. Returns false if @p path is no symlink.
bool recreate_symlink(const string& path) {
    struct stat64 st;
    if (lstat64(path.c_str(), &st)) {
        THROW_AS(sandpool::SetupFailure, "lstat(", path, ")", errmsg());
    }
    if (!S_ISLNK(st.st_mode)) {
        return false;
    }
    char target[4096];
    auto len = readlink(path.c_str(), target, sizeof(target) - 1);
    if (len < 0) {
        THROW_AS(sandpool::SetupFailure, "readlink(", path, ")", errmsg());
    }
    target[len] = '\0';
    auto dest = concat_tostr(staging_dir, path);
    create_dirs(dest.substr(0, dest.rfind('/')));
    if (symlink(target, dest.c_str()) && errno != EEXIST) {
        THROW_AS(sandpool::SetupFailure, "symlink(", dest, ")", errmsg());
    }
    return true;
}

void bind_mount(const BindMount& bind) {
    auto dest = concat_tostr(staging_dir, bind.path);
    create_mount_point(bind.path, dest);

    FileDescriptor mount_fd{open_tree(
        AT_FDCWD,
        bind.path.c_str(),
        OPEN_TREE_CLOEXEC | OPEN_TREE_CLONE | (bind.recursive ? AT_RECURSIVE : 0)
    )};
    if (!mount_fd.is_open()) {
        THROW_AS(sandpool::SetupFailure, "open_tree(", bind.path, ")", errmsg());
    }

    mount_attr mattr = {};
    mattr.attr_set = bind.attrs;
    if (mount_setattr(
            mount_fd, "", AT_EMPTY_PATH | (bind.recursive ? AT_RECURSIVE : 0), &mattr, sizeof(mattr)
        ))
    {
        THROW_AS(sandpool::SetupFailure, "mount_setattr(", bind.path, ")", errmsg());
    }
    if (move_mount(mount_fd, "", AT_FDCWD, dest.c_str(), MOVE_MOUNT_F_EMPTY_PATH)) {
        THROW_AS(sandpool::SetupFailure, "move_mount(dest: ", dest, ")", errmsg());
    }
}

uint64_t attrs_for(sandpool::FsAccess access) noexcept {
    switch (access) {
    case sandpool::FsAccess::READ_ONLY:
        return MOUNT_ATTR_RDONLY | MOUNT_ATTR_NOSUID | MOUNT_ATTR_NODEV | MOUNT_ATTR_NOEXEC;
    case sandpool::FsAccess::READ_WRITE:
        return MOUNT_ATTR_NOSUID | MOUNT_ATTR_NODEV | MOUNT_ATTR_NOEXEC;
    case sandpool::FsAccess::EXECUTE: return MOUNT_ATTR_RDONLY | MOUNT_ATTR_NOSUID | MOUNT_ATTR_NODEV;
    }
    return MOUNT_ATTR_RDONLY | MOUNT_ATTR_NOSUID | MOUNT_ATTR_NODEV | MOUNT_ATTR_NOEXEC;
}

} // namespace

namespace sandpool::mounts {

void set_up_mount_namespace(const worker_protocol::Profile& profile) {
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr)) {
        THROW_AS(SetupFailure, "mount(/, MS_REC | MS_PRIVATE)", errmsg());
    }
    if (mount(nullptr, staging_dir, "tmpfs", MS_NOSUID | MS_NODEV | MS_SILENT, "size=1m,nr_inodes=4096,mode=0755"))
    {
        THROW_AS(SetupFailure, "mount(tmpfs at ", staging_dir, ")", errmsg());
    }

    std::vector<BindMount> binds;
    for (const auto& path : profile.runtime_paths) {
        if (!recreate_symlink(path)) {
            binds.push_back({
                .path = path,
                .attrs = attrs_for(FsAccess::EXECUTE),
                .recursive = true,
            });
        }
    }
    for (const auto& rule : profile.fs_allow) {
        binds.push_back({
            .path = rule.path,
            .attrs = attrs_for(rule.access),
            .recursive = true,
        });
    }
    for (const char* dev : {"/dev/null", "/dev/zero", "/dev/urandom"}) {
        binds.push_back({
            .path = dev,
            .attrs = MOUNT_ATTR_NOSUID | MOUNT_ATTR_NOEXEC,
            .recursive = false,
        });
    }
    // Parents have to be mounted before their descendants
    std::sort(binds.begin(), binds.end(), [](const BindMount& a, const BindMount& b) {
        return a.path < b.path;
    });
    for (const auto& bind : binds) {
        bind_mount(bind);
    }

    if (profile.mount_proc) {
        auto proc = concat_tostr(staging_dir, "/proc");
        create_dirs(proc);
        if (mount(nullptr, proc.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC | MS_SILENT, nullptr)) {
            THROW_AS(SetupFailure, "mount(proc at ", proc, ")", errmsg());
        }
    }

    auto tmp = concat_tostr(staging_dir, "/tmp");
    create_dirs(tmp);
    auto tmp_options = concat_tostr("size=", profile.work_dir_size, ",mode=01777");
    if (mount(nullptr, tmp.c_str(), "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC | MS_SILENT, tmp_options.c_str()))
    {
        THROW_AS(SetupFailure, "mount(tmpfs at ", tmp, ")", errmsg());
    }

    // Nothing may be created outside /tmp
    if (mount(
            nullptr,
            staging_dir,
            nullptr,
            MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV | MS_SILENT,
            nullptr
        ))
    {
        THROW_AS(SetupFailure, "remounting the new root read-only", errmsg());
    }

    if (chdir(staging_dir)) {
        THROW_AS(SetupFailure, "chdir(", staging_dir, ")", errmsg());
    }
    if (syscalls::pivot_root(".", ".")) {
        THROW_AS(SetupFailure, R"(pivot_root(".", "."))", errmsg());
    }
    if (umount2(".", MNT_DETACH)) {
        THROW_AS(SetupFailure, R"(umount2("."))", errmsg());
    }
    if (chdir("/")) {
        THROW_AS(SetupFailure, R"(chdir("/"))", errmsg());
    }
}

} // namespace sandpool::mounts
