#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cmath>
#include <dirent.h>
#include <fcntl.h>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/file_contents.hh>
#include <sandpool/isolation/cgroups.hh>
#include <sandpool/logger.hh>
#include <sandpool/macros/throw.hh>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

using std::string;

namespace {

constexpr const char* cgroup2_mount_point = "/sys/fs/cgroup";
constexpr const char* daemon_leaf = "daemon";
constexpr std::string_view worker_prefix = "worker-";

// Returns errno of the failed operation or 0
int try_write_file_at(int dirfd, const char* path, std::string_view data) noexcept {
    FileDescriptor fd{openat(dirfd, path, O_WRONLY | O_CLOEXEC)};
    if (!fd.is_open()) {
        return errno;
    }
    auto rc = write(fd, data.data(), data.size());
    if (rc < 0) {
        return errno;
    }
    return static_cast<size_t>(rc) == data.size() ? 0 : EIO;
}

std::optional<string> try_read_file_at(int dirfd, const char* path) {
    FileDescriptor fd{openat(dirfd, path, O_RDONLY | O_CLOEXEC)};
    if (!fd.is_open()) {
        return std::nullopt;
    }
    try {
        return get_file_contents(fd);
    } catch (const std::runtime_error& e) {
        errlog("cgroups: reading ", path, " failed: ", e.what());
        return std::nullopt;
    }
}

std::optional<uint64_t> parse_number(std::string_view str) noexcept {
    uint64_t res = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} || ptr != str.data() + str.size() || str.empty()) {
        return std::nullopt;
    }
    return res;
}

void remove_stale_worker_cgroups(int root_fd) {
    FileDescriptor dir_fd{openat(root_fd, ".", O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
    if (!dir_fd.is_open()) {
        THROW("openat(.)", errmsg());
    }
    DIR* dir = fdopendir(dir_fd);
    if (dir == nullptr) {
        THROW("fdopendir()", errmsg());
    }
    (void)dir_fd.release(); // owned by dir now
    std::vector<string> stale;
    while (auto* entry = readdir(dir)) {
        std::string_view name = entry->d_name;
        if (entry->d_type == DT_DIR && name.substr(0, worker_prefix.size()) == worker_prefix) {
            stale.emplace_back(name);
        }
    }
    (void)closedir(dir);

    for (const auto& name : stale) {
        auto kill_path = concat_tostr(name, "/cgroup.kill");
        (void)try_write_file_at(root_fd, kill_path.c_str(), "1");
        if (unlinkat(root_fd, name.c_str(), AT_REMOVEDIR)) {
            stdlog("warning: cannot remove stale cgroup ", name, errmsg());
        } else {
            stdlog("removed stale cgroup ", name);
        }
    }
}

} // namespace

namespace sandpool::cgroups {

string cpu_max_value(double cpu_quota) {
    auto quota = static_cast<uint64_t>(std::llround(cpu_quota * CPU_PERIOD_USEC));
    // The kernel refuses quotas below 1 ms
    quota = std::max<uint64_t>(quota, 1000);
    return concat_tostr(quota, ' ', CPU_PERIOD_USEC);
}

std::optional<uint64_t> read_keyed_value(std::string_view contents, std::string_view key) noexcept {
    while (!contents.empty()) {
        auto newline = contents.find('\n');
        auto line = contents.substr(0, newline);
        contents.remove_prefix(newline == std::string_view::npos ? contents.size() : newline + 1);
        if (line.size() > key.size() && line.substr(0, key.size()) == key &&
            line[key.size()] == ' ')
        {
            return parse_number(line.substr(key.size() + 1));
        }
    }
    return std::nullopt;
}

std::optional<string> parse_proc_cgroup(std::string_view contents) {
    while (!contents.empty()) {
        auto newline = contents.find('\n');
        auto line = contents.substr(0, newline);
        contents.remove_prefix(newline == std::string_view::npos ? contents.size() : newline + 1);
        if (line.substr(0, 3) == "0::") {
            return string{line.substr(3)};
        }
    }
    return std::nullopt;
}

WorkerCgroup::WorkerCgroup(int parent_fd, string name, const Limits& limits)
: parent_fd_{parent_fd}
, name_{std::move(name)} {
    if (mkdirat(parent_fd_, name_.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH)) {
        THROW("mkdirat(", name_, ")", errmsg());
    }
    try {
        dir_fd_ = FileDescriptor{openat(parent_fd_, name_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
        if (!dir_fd_.is_open()) {
            THROW("openat(", name_, ")", errmsg());
        }
        write_file_at(dir_fd_, "memory.max", std::to_string(limits.memory_max));
        // Absent if swap accounting is disabled
        if (int errnum = try_write_file_at(dir_fd_, "memory.swap.max", "0");
            errnum != 0 && errnum != ENOENT)
        {
            THROW("write(memory.swap.max)", errmsg(errnum));
        }
        write_file_at(dir_fd_, "cpu.max", cpu_max_value(limits.cpu_quota));
        write_file_at(dir_fd_, "pids.max", std::to_string(limits.pids_max));
        kill_fd_ = FileDescriptor{openat(dir_fd_, "cgroup.kill", O_WRONLY | O_CLOEXEC)};
        if (!kill_fd_.is_open()) {
            THROW("openat(cgroup.kill)", errmsg());
        }
    } catch (...) {
        remove();
        throw;
    }
}

void WorkerCgroup::remove() noexcept {
    (void)kill_fd_.close();
    (void)dir_fd_.close();
    // The last processes may still be on their way out
    for (int attempt = 0;; ++attempt) {
        if (unlinkat(parent_fd_, name_.c_str(), AT_REMOVEDIR) == 0 || errno == ENOENT) {
            return;
        }
        if (errno != EBUSY || attempt == 100) {
            errlog("cgroups: cannot remove ", name_, errmsg());
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
}

bool WorkerCgroup::kill() noexcept {
    return write(kill_fd_, "1", 1) == 1;
}

std::optional<uint64_t> WorkerCgroup::oom_kill_count() const {
    auto events = try_read_file_at(dir_fd_, "memory.events");
    if (!events) {
        return std::nullopt;
    }
    return read_keyed_value(*events, "oom_kill");
}

std::optional<uint64_t> WorkerCgroup::memory_peak() const {
    auto peak = try_read_file_at(dir_fd_, "memory.peak");
    if (!peak) {
        return std::nullopt;
    }
    if (!peak->empty() && peak->back() == '\n') {
        peak->pop_back();
    }
    return parse_number(*peak);
}

CgroupTree CgroupTree::prepare(const string& configured_root) {
    string path = configured_root;
    if (path.empty()) {
        auto own = parse_proc_cgroup(get_file_contents("/proc/self/cgroup"));
        if (!own) {
            THROW_AS(SetupFailure, "cgroup v2 is not in use: no \"0::\" entry in /proc/self/cgroup");
        }
        path = concat_tostr(cgroup2_mount_point, *own == "/" ? "" : *own);
    }

    FileDescriptor dir_fd{path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC};
    if (!dir_fd.is_open()) {
        THROW_AS(SetupFailure, "cannot open cgroup ", path, errmsg());
    }
    struct stat64 st;
    if (fstat64(dir_fd, &st)) {
        THROW_AS(SetupFailure, "fstat(", path, ")", errmsg());
    }
    if (st.st_uid != geteuid()) {
        THROW_AS(SetupFailure, "cgroup ", path, " is not delegated to uid ", geteuid(), " (owned by uid ", st.st_uid, ")");
    }

    if (mkdirat(dir_fd, daemon_leaf, S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) &&
        errno != EEXIST)
    {
        THROW_AS(SetupFailure, "mkdirat(", path, '/', daemon_leaf, ")", errmsg());
    }
    // Controllers can be enabled for children only if the cgroup has no processes of its own
    auto procs_path = concat_tostr(daemon_leaf, "/cgroup.procs");
    for (int round = 0;; ++round) {
        auto procs = get_file_contents_at(dir_fd, "cgroup.procs");
        if (procs.empty()) {
            break;
        }
        if (round == 16) {
            THROW_AS(SetupFailure, "cannot move all processes out of ", path);
        }
        std::string_view rest = procs;
        while (!rest.empty()) {
            auto newline = rest.find('\n');
            auto pid = rest.substr(0, newline);
            rest.remove_prefix(newline == std::string_view::npos ? rest.size() : newline + 1);
            if (pid.empty()) {
                continue;
            }
            int errnum = try_write_file_at(dir_fd, procs_path.c_str(), pid);
            if (errnum != 0 && errnum != ESRCH) {
                THROW_AS(SetupFailure, "moving process ", pid, " to ", path, '/', daemon_leaf, errmsg(errnum));
            }
        }
    }

    remove_stale_worker_cgroups(dir_fd);

    if (int errnum = try_write_file_at(dir_fd, "cgroup.subtree_control", "+pids +memory +cpu")) {
        THROW_AS(SetupFailure, "enabling controllers in ", path, errmsg(errnum));
    }
    stdlog("using cgroup ", path);
    return CgroupTree{std::move(path), std::move(dir_fd)};
}

std::unique_ptr<WorkerCgroup>
CgroupTree::create_worker_cgroup(string name, const Limits& limits) const {
    return std::make_unique<WorkerCgroup>(dir_fd_, std::move(name), limits);
}

} // namespace sandpool::cgroups
