#pragma once

#include <cstdint>
#include <sandpool/worker/protocol.hh>
#include <string>
#include <vector>

namespace sandpool::landlock {

enum class RuleAccess : uint8_t {
    READ_ONLY,
    READ_WRITE,
    EXECUTE,
    // Reading and writing existing files only
    DEVICE,
};

struct PathRule {
    std::string path;
    RuleAccess access;

    friend bool operator==(const PathRule&, const PathRule&) = default;
};

// Landlock ABI version of the running kernel, 0 if Landlock is unavailable
[[nodiscard]] int abi_version() noexcept;

// All filesystem rights known to ABI @p abi
[[nodiscard]] uint64_t handled_access(int abi) noexcept;

// Rights granted by @p access, limited to those valid for a non-directory if !@p is_dir
[[nodiscard]] uint64_t access_rights(RuleAccess access, int abi, bool is_dir) noexcept;

// Rules matching the mounts made by set_up_mount_namespace() for @p profile
[[nodiscard]] std::vector<PathRule> rules_for(const worker_protocol::Profile& profile);

// Restricts the calling thread to @p rules, requires no_new_privs. Throws SetupFailure.
void restrict_self(const std::vector<PathRule>& rules);

} // namespace sandpool::landlock
