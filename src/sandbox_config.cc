#include <cerrno>
#include <cmath>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/sandbox_config.hh>
#include <seccomp.h>
#include <set>
#include <sys/stat.h>

namespace {

constexpr const char* reserved_mount_points[] = {"/proc", "/dev", "/tmp"};

bool is_under(std::string_view path, std::string_view dir) noexcept {
    if (dir == "/") {
        return true;
    }
    return path == dir ||
        (path.size() > dir.size() && path.substr(0, dir.size()) == dir && path[dir.size()] == '/');
}

void validate_mountable_path(std::string_view path, std::string_view what) {
    using sandpool::ConfigError;
    if (!sandpool::is_normalized_absolute_path(path)) {
        THROW_AS(ConfigError, what, ": path is not a normalized absolute path: ", path);
    }
    if (path == "/") {
        THROW_AS(ConfigError, what, ": the root directory cannot be exposed");
    }
    for (std::string_view reserved : reserved_mount_points) {
        if (is_under(path, reserved)) {
            THROW_AS(ConfigError, what, ": ", path, " lies under ", reserved, " which the sandbox provides itself");
        }
    }
}

} // namespace

namespace sandpool {

const char* to_str(FsAccess access) noexcept {
    switch (access) {
    case FsAccess::READ_ONLY: return "ro";
    case FsAccess::READ_WRITE: return "rw";
    case FsAccess::EXECUTE: return "exec";
    }
    return "unknown";
}

std::optional<FsAccess> parse_fs_access(std::string_view str) noexcept {
    if (str == "ro") {
        return FsAccess::READ_ONLY;
    }
    if (str == "rw") {
        return FsAccess::READ_WRITE;
    }
    if (str == "exec") {
        return FsAccess::EXECUTE;
    }
    return std::nullopt;
}

FsRule parse_fs_rule(std::string_view str) {
    auto colon = str.rfind(':');
    if (colon == std::string_view::npos) {
        THROW_AS(ConfigError, "fs_allow entry has to be of the form <path>:<ro|rw|exec>, got: ", str);
    }
    auto access = parse_fs_access(str.substr(colon + 1));
    if (!access) {
        THROW_AS(ConfigError, "fs_allow entry has an unknown access mode: ", str.substr(colon + 1));
    }
    return FsRule{
        .path = std::string{str.substr(0, colon)},
        .access = *access,
    };
}

bool is_normalized_absolute_path(std::string_view path) noexcept {
    if (path.empty() || path[0] != '/') {
        return false;
    }
    if (path == "/") {
        return true;
    }
    if (path.back() == '/') {
        return false;
    }
    size_t pos = 1;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        auto component = path.substr(pos, next - pos);
        if (component.empty() || component == "." || component == "..") {
            return false;
        }
        pos = next + 1;
    }
    return true;
}

void validate(const SandboxConfig& config) {
    if (config.timeout.count() <= 0) {
        THROW_AS(ConfigError, "timeout has to be positive");
    }
    if (config.memory_limit < (uint64_t{1} << 20)) {
        THROW_AS(ConfigError, "memory_limit has to be at least 1 MiB");
    }
    if (!std::isfinite(config.cpu_quota) || config.cpu_quota <= 0 || config.cpu_quota > 4096) {
        THROW_AS(ConfigError, "cpu_quota has to be in range (0, 4096]");
    }
    // The worker itself is one of the processes
    if (config.max_processes < 2) {
        THROW_AS(ConfigError, "max_processes has to be at least 2");
    }

    std::set<std::string_view> seen_paths;
    for (const auto& rule : config.fs_allow) {
        validate_mountable_path(rule.path, "fs_allow");
        if (!seen_paths.emplace(rule.path).second) {
            THROW_AS(ConfigError, "fs_allow: path appears more than once: ", rule.path);
        }
        struct stat64 st;
        if (stat64(rule.path.c_str(), &st)) {
            THROW_AS(ConfigError, "fs_allow: cannot access ", rule.path, errmsg());
        }
    }
    for (const auto& path : config.runtime_paths) {
        validate_mountable_path(path, "runtime_paths");
        if (!seen_paths.emplace(path).second) {
            THROW_AS(ConfigError, "runtime_paths: path appears more than once: ", path);
        }
    }

    if (config.interpreter.empty()) {
        THROW_AS(ConfigError, "interpreter cannot be empty");
    }
    const auto& interpreter_path = config.interpreter.front();
    if (!is_normalized_absolute_path(interpreter_path)) {
        THROW_AS(ConfigError, "interpreter: path is not a normalized absolute path: ", interpreter_path);
    }
    bool interpreter_reachable = false;
    for (const auto& path : config.runtime_paths) {
        interpreter_reachable |= is_under(interpreter_path, path);
    }
    for (const auto& rule : config.fs_allow) {
        interpreter_reachable |=
            rule.access == FsAccess::EXECUTE && is_under(interpreter_path, rule.path);
    }
    if (!interpreter_reachable) {
        THROW_AS(ConfigError, "interpreter ", interpreter_path, " is not inside runtime_paths or an executable fs_allow path");
    }

    for (const auto& var : config.env) {
        auto eq = var.find('=');
        if (eq == std::string::npos || eq == 0) {
            THROW_AS(ConfigError, "env: entry has to be of the form NAME=value, got: ", var);
        }
    }
    if (config.work_dir_size < (uint64_t{64} << 10)) {
        THROW_AS(ConfigError, "work_dir_size has to be at least 64 KiB");
    }
    if (config.max_open_files < 8) {
        THROW_AS(ConfigError, "max_open_files has to be at least 8");
    }
    if (config.max_output_bytes == 0 || config.max_output_bytes > (uint32_t{64} << 20)) {
        THROW_AS(ConfigError, "max_output_bytes has to be in range [1, 64 MiB]");
    }
    if (config.max_code_bytes == 0 || config.max_code_bytes > (uint32_t{16} << 20)) {
        THROW_AS(ConfigError, "max_code_bytes has to be in range [1, 16 MiB]");
    }
    for (const auto& name : config.supervisor_allow) {
        if (seccomp_syscall_resolve_name(name.c_str()) == __NR_SCMP_ERROR) {
            THROW_AS(ConfigError, "supervisor_allow: unknown syscall: ", name);
        }
    }
}

} // namespace sandpool
