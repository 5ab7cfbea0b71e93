#pragma once

#include <csignal>
#include <cstddef>
#include <linux/sched.h>
#include <sys/wait.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

extern "C" struct rusage;

namespace syscalls {

inline int
waitid(int id_type, pid_t id, siginfo_t* info, int options, struct rusage* usage) noexcept {
    return static_cast<int>(syscall(SYS_waitid, id_type, id, info, options, usage));
}

inline int pidfd_open(pid_t pid, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

inline int pidfd_send_signal(int pidfd, int sig, siginfo_t* info, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_send_signal, pidfd, sig, info, flags));
}

inline int pivot_root(const char* new_root, const char* put_old) noexcept {
    return static_cast<int>(syscall(SYS_pivot_root, new_root, put_old));
}

// NOLINTNEXTLINE(google-runtime-int)
inline long clone3(struct clone_args* cl_args) noexcept {
    return syscall(SYS_clone3, cl_args, sizeof(*cl_args));
}

inline int execveat(
    int dirfd, const char* pathname, char* const argv[], char* const envp[], int flags
) noexcept {
    return static_cast<int>(syscall(SYS_execveat, dirfd, pathname, argv, envp, flags));
}

inline int seccomp(unsigned int operation, unsigned int flags, void* args) noexcept {
    return static_cast<int>(syscall(SYS_seccomp, operation, flags, args));
}

inline int landlock_create_ruleset(const void* attr, size_t size, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_landlock_create_ruleset, attr, size, flags));
}

inline int landlock_add_rule(
    int ruleset_fd, int rule_type, const void* rule_attr, unsigned int flags
) noexcept {
    return static_cast<int>(syscall(SYS_landlock_add_rule, ruleset_fd, rule_type, rule_attr, flags)
    );
}

inline int landlock_restrict_self(int ruleset_fd, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_landlock_restrict_self, ruleset_fd, flags));
}

} // namespace syscalls
