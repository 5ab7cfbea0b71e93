#pragma once

#include <sandpool/file_descriptor.hh>
#include <sandpool/sandbox_config.hh>
#include <string_view>
#include <vector>

namespace sandpool::seccomp {

// Allowed without consulting the syscall supervisor: the worker loop and interpreter startup
[[nodiscard]] const std::vector<std::string_view>& bootstrap_syscalls() noexcept;

// Always fail with EPERM, never reach the syscall supervisor
[[nodiscard]] const std::vector<std::string_view>& denied_syscalls() noexcept;

/**
 * @brief Builds the filter installed by every worker: bootstrap syscalls are allowed, denied
 *   syscalls fail with EPERM and everything else is forwarded to the syscall supervisor
 *   (SCMP_ACT_NOTIFY).
 *
 * @return memfd with the BPF program
 */
[[nodiscard]] FileDescriptor build_worker_filter(const SandboxConfig& config);

// Loads the BPF program from @p bpf_fd with SECCOMP_FILTER_FLAG_NEW_LISTENER and returns the
// notification listener. Requires no_new_privs. Throws SetupFailure.
[[nodiscard]] FileDescriptor install_filter_with_listener(int bpf_fd);

} // namespace sandpool::seccomp
