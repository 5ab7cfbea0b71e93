#include <cerrno>
#include <fcntl.h>
#include <linux/landlock.h>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/isolation/landlock.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/syscalls.hh>
#include <sys/stat.h>

namespace {

constexpr uint64_t abi1_rights = LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE |
    LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR | LANDLOCK_ACCESS_FS_REMOVE_DIR |
    LANDLOCK_ACCESS_FS_REMOVE_FILE | LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR |
    LANDLOCK_ACCESS_FS_MAKE_REG | LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO |
    LANDLOCK_ACCESS_FS_MAKE_BLOCK | LANDLOCK_ACCESS_FS_MAKE_SYM;

// Defined by newer kernel headers only
constexpr uint64_t refer_right = uint64_t{1} << 13; // ABI 2
constexpr uint64_t truncate_right = uint64_t{1} << 14; // ABI 3
constexpr uint64_t ioctl_dev_right = uint64_t{1} << 15; // ABI 5

constexpr uint64_t file_rights = LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE |
    LANDLOCK_ACCESS_FS_READ_FILE | truncate_right | ioctl_dev_right;

} // namespace

namespace sandpool::landlock {

int abi_version() noexcept {
    int abi =
        syscalls::landlock_create_ruleset(nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi < 0 ? 0 : abi;
}

uint64_t handled_access(int abi) noexcept {
    if (abi <= 0) {
        return 0;
    }
    uint64_t res = abi1_rights;
    if (abi >= 2) {
        res |= refer_right;
    }
    if (abi >= 3) {
        res |= truncate_right;
    }
    if (abi >= 5) {
        res |= ioctl_dev_right;
    }
    return res;
}

uint64_t access_rights(RuleAccess access, int abi, bool is_dir) noexcept {
    uint64_t res = 0;
    switch (access) {
    case RuleAccess::READ_ONLY:
        res = LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;
        break;
    case RuleAccess::EXECUTE:
        res = LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_READ_FILE |
            LANDLOCK_ACCESS_FS_READ_DIR;
        break;
    case RuleAccess::DEVICE:
        res = LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_WRITE_FILE | truncate_right;
        break;
    case RuleAccess::READ_WRITE:
        // Device nodes cannot be created anyway, the tmpfs is nodev
        res = handled_access(abi) &
            ~(LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_MAKE_CHAR |
              LANDLOCK_ACCESS_FS_MAKE_BLOCK | ioctl_dev_right);
        break;
    }
    res &= handled_access(abi);
    if (!is_dir) {
        res &= file_rights;
    }
    return res;
}

std::vector<PathRule> rules_for(const worker_protocol::Profile& profile) {
    std::vector<PathRule> rules;
    for (const auto& path : profile.runtime_paths) {
        rules.push_back({.path = path, .access = RuleAccess::EXECUTE});
    }
    for (const char* dev : {"/dev/null", "/dev/zero", "/dev/urandom"}) {
        rules.push_back({.path = dev, .access = RuleAccess::DEVICE});
    }
    rules.push_back({.path = "/tmp", .access = RuleAccess::READ_WRITE});
    if (profile.mount_proc) {
        rules.push_back({.path = "/proc", .access = RuleAccess::READ_ONLY});
    }
    for (const auto& rule : profile.fs_allow) {
        RuleAccess access = RuleAccess::READ_ONLY;
        switch (rule.access) {
        case FsAccess::READ_ONLY: access = RuleAccess::READ_ONLY; break;
        case FsAccess::READ_WRITE: access = RuleAccess::READ_WRITE; break;
        case FsAccess::EXECUTE: access = RuleAccess::EXECUTE; break;
        }
        rules.push_back({.path = rule.path, .access = access});
    }
    return rules;
}

void restrict_self(const std::vector<PathRule>& rules) {
    int abi = abi_version();
    if (abi <= 0) {
        THROW_AS(SetupFailure, "Landlock is not supported by the running kernel");
    }
    landlock_ruleset_attr attr = {};
    attr.handled_access_fs = handled_access(abi);
    FileDescriptor ruleset_fd{syscalls::landlock_create_ruleset(&attr, sizeof(attr), 0)};
    if (!ruleset_fd.is_open()) {
        THROW_AS(SetupFailure, "landlock_create_ruleset()", errmsg());
    }

    for (const auto& rule : rules) {
        FileDescriptor path_fd{rule.path.c_str(), O_PATH | O_CLOEXEC};
        if (!path_fd.is_open()) {
            THROW_AS(SetupFailure, "open(", rule.path, ")", errmsg());
        }
        struct stat64 st;
        if (fstat64(path_fd, &st)) {
            THROW_AS(SetupFailure, "fstat(", rule.path, ")", errmsg());
        }
        landlock_path_beneath_attr path_beneath = {};
        path_beneath.allowed_access = access_rights(rule.access, abi, S_ISDIR(st.st_mode));
        path_beneath.parent_fd = path_fd;
        if (syscalls::landlock_add_rule(
                ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &path_beneath, 0
            ))
        {
            THROW_AS(SetupFailure, "landlock_add_rule(", rule.path, ")", errmsg());
        }
    }

    if (syscalls::landlock_restrict_self(ruleset_fd, 0)) {
        THROW_AS(SetupFailure, "landlock_restrict_self()", errmsg());
    }
}

} // namespace sandpool::landlock
