#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandpool {

enum class FsAccess : uint8_t {
    READ_ONLY = 0,
    READ_WRITE = 1,
    EXECUTE = 2,
};

[[nodiscard]] const char* to_str(FsAccess access) noexcept;

// Accepts "ro", "rw" and "exec"
[[nodiscard]] std::optional<FsAccess> parse_fs_access(std::string_view str) noexcept;

struct FsRule {
    std::string path;
    FsAccess access;

    friend bool operator==(const FsRule&, const FsRule&) = default;
};

// Parses "<path>:<ro|rw|exec>", throws ConfigError
[[nodiscard]] FsRule parse_fs_rule(std::string_view str);

// Immutable after the daemon starts
struct SandboxConfig {
    std::chrono::milliseconds timeout{30'000};
    uint64_t memory_limit = uint64_t{256} << 20;
    // Number of CPUs the worker may use, fractional values allowed
    double cpu_quota = 1.0;
    uint32_t max_processes = 32;
    bool network = false;
    std::vector<FsRule> fs_allow;
    // Read-only and executable inside the sandbox, needed by the interpreter
    std::vector<std::string> runtime_paths = {"/usr", "/lib", "/lib64", "/bin"};
    // The code is fed to the interpreter's stdin
    std::vector<std::string> interpreter = {"/bin/sh", "-s"};
    std::vector<std::string> env = {
        "PATH=/usr/bin:/bin",
        "HOME=/tmp",
        "TMPDIR=/tmp",
    };
    bool mount_proc = true;
    uint64_t work_dir_size = uint64_t{16} << 20;
    uint32_t max_open_files = 256;
    uint32_t max_output_bytes = uint32_t{1} << 20;
    uint32_t max_code_bytes = uint32_t{64} << 10;
    // Syscall names resolved to "allow" by the syscall supervisor
    std::vector<std::string> supervisor_allow;
};

// Throws ConfigError describing the first problem found. Checks that fs_allow paths exist.
void validate(const SandboxConfig& config);

// Absolute, without "." and ".." components, repeated or trailing slashes
[[nodiscard]] bool is_normalized_absolute_path(std::string_view path) noexcept;

} // namespace sandpool
