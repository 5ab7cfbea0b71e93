#include <cerrno>
#include <linux/filter.h>
#include <linux/sched.h>
#include <linux/seccomp.h>
#include <sandpool/converts_safely_to.hh>
#include <sandpool/errors.hh>
#include <sandpool/isolation/bpf_builder.hh>
#include <sandpool/isolation/worker_filter.hh>
#include <sandpool/syscalls.hh>
#include <sys/mman.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr uint64_t namespace_clone_flags = CLONE_NEWNS | CLONE_NEWCGROUP | CLONE_NEWUTS |
    CLONE_NEWIPC | CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNET;

} // namespace

namespace sandpool::seccomp {

const std::vector<std::string_view>& bootstrap_syscalls() noexcept {
    static const std::vector<std::string_view> syscalls = {
        // files and descriptors
        "read", "write", "readv", "writev", "pread64", "pwrite64", "preadv", "pwritev",
        "preadv2", "pwritev2", "open", "openat", "openat2", "creat", "close", "close_range",
        "lseek", "_llseek", "dup", "dup2", "dup3", "fcntl", "fcntl64", "flock", "fsync",
        "fdatasync", "truncate", "ftruncate", "fallocate", "fadvise64", "sendfile",
        "copy_file_range", "splice", "tee", "ioctl", "pipe", "pipe2",
        // metadata and directories
        "stat", "fstat", "lstat", "newfstatat", "fstatat64", "statx", "statfs", "fstatfs",
        "access", "faccessat", "faccessat2", "getdents", "getdents64", "getcwd", "chdir",
        "fchdir", "rename", "renameat", "renameat2", "mkdir", "mkdirat", "rmdir", "link",
        "linkat", "unlink", "unlinkat", "symlink", "symlinkat", "readlink", "readlinkat",
        "chmod", "fchmod", "fchmodat", "umask", "utime", "utimes", "utimensat", "getxattr",
        "lgetxattr", "fgetxattr", "listxattr", "llistxattr", "flistxattr",
        // memory
        "brk", "mmap", "mmap2", "mprotect", "munmap", "mremap", "madvise", "msync", "mincore",
        "membarrier", "memfd_create",
        // signals
        "rt_sigaction", "rt_sigprocmask", "rt_sigreturn", "rt_sigsuspend", "rt_sigpending",
        "rt_sigtimedwait", "sigaltstack", "kill", "tgkill", "tkill", "pause", "alarm",
        "getitimer", "setitimer", "restart_syscall",
        // waiting and time
        "select", "_newselect", "pselect6", "poll", "ppoll", "epoll_create", "epoll_create1",
        "epoll_ctl", "epoll_wait", "epoll_pwait", "epoll_pwait2", "eventfd", "eventfd2",
        "timerfd_create", "timerfd_settime", "timerfd_gettime", "signalfd", "signalfd4",
        "nanosleep", "clock_nanosleep", "clock_gettime", "clock_getres", "gettimeofday",
        "time", "futex", "futex_waitv", "set_robust_list", "get_robust_list", "sched_yield",
        "sched_getaffinity", "sched_getparam", "sched_getscheduler",
        // processes
        "fork", "vfork", "execve", "execveat", "exit", "exit_group", "wait4", "waitid",
        "pidfd_open", "set_tid_address", "rseq", "arch_prctl", "prctl", "getpid", "getppid",
        "gettid", "getuid", "geteuid", "getgid", "getegid", "getgroups", "getresuid",
        "getresgid", "getpgrp", "getpgid", "setpgid", "getsid", "setsid", "uname", "sysinfo",
        "getrlimit", "ugetrlimit", "setrlimit", "prlimit64", "getrusage", "times", "getrandom",
        "getpriority", "capget",
        // local sockets, the network namespace decides what is reachable
        "socketpair", "connect", "bind", "listen", "accept", "accept4", "sendto",
        "recvfrom", "sendmsg", "recvmsg", "sendmmsg", "recvmmsg", "shutdown", "getsockname",
        "getpeername", "getsockopt", "setsockopt",
    };
    return syscalls;
}

const std::vector<std::string_view>& denied_syscalls() noexcept {
    static const std::vector<std::string_view> syscalls = {
        "ptrace", "mount", "umount", "umount2", "pivot_root", "chroot", "unshare", "setns",
        "fsopen", "fsconfig", "fsmount", "fspick", "move_mount", "open_tree", "mount_setattr",
        "kexec_load", "kexec_file_load", "init_module", "finit_module", "delete_module", "bpf",
        "perf_event_open", "userfaultfd", "keyctl", "add_key", "request_key",
        "process_vm_readv", "process_vm_writev", "reboot", "swapon", "swapoff", "acct",
        "quotactl", "quotactl_fd", "open_by_handle_at", "name_to_handle_at", "fanotify_init",
        "seccomp", "iopl", "ioperm", "syslog", "vhangup", "settimeofday", "clock_settime",
        "clock_adjtime", "adjtimex", "sethostname", "setdomainname", "io_uring_setup",
        "io_uring_enter", "io_uring_register", "landlock_create_ruleset",
        "landlock_add_rule", "landlock_restrict_self",
    };
    return syscalls;
}

FileDescriptor build_worker_filter(const SandboxConfig& config) {
    auto bpf = BpfBuilder{SCMP_ACT_NOTIFY};
    for (auto name : bootstrap_syscalls()) {
        (void)bpf.allow_syscall(std::string{name}.c_str());
    }
    // Threads are fine, new namespaces are not
    bpf.allow_syscall("clone", ARG0_MASKED_EQ{namespace_clone_flags, 0});
    // clone3() arguments cannot be inspected, glibc falls back to clone() upon ENOSYS
    bpf.err_syscall(ENOSYS, "clone3");
    if (config.network) {
        bpf.allow_syscall("socket");
    } else {
        // Other families reach the supervisor and show up as denials
        bpf.allow_syscall("socket", ARG0_EQ{AF_UNIX});
    }
    for (auto name : denied_syscalls()) {
        (void)bpf.err_syscall(EPERM, std::string{name}.c_str());
    }
    return bpf.export_to_fd();
}

FileDescriptor install_filter_with_listener(int bpf_fd) {
    auto fd_len = lseek64(bpf_fd, 0, SEEK_END);
    if (fd_len < 0) {
        THROW_AS(SetupFailure, "lseek64()", errmsg());
    }
    if (fd_len == 0 || fd_len % sizeof(sock_filter) != 0) {
        THROW_AS(SetupFailure, "invalid seccomp program length: ", fd_len);
    }
    auto filter_ptr = mmap(nullptr, static_cast<size_t>(fd_len), PROT_READ, MAP_PRIVATE, bpf_fd, 0);
    // NOLINTNEXTLINE(performance-no-int-to-ptr)
    if (filter_ptr == MAP_FAILED) {
        THROW_AS(SetupFailure, "mmap()", errmsg());
    }
    auto fprog_len = static_cast<size_t>(fd_len) / sizeof(sock_filter);
    if (!converts_safely_to<decltype(sock_fprog::len)>(fprog_len)) {
        (void)munmap(filter_ptr, static_cast<size_t>(fd_len));
        THROW_AS(SetupFailure, "seccomp program is too big");
    }
    auto fprog = sock_fprog{
        .len = static_cast<decltype(sock_fprog::len)>(fprog_len),
        .filter = static_cast<sock_filter*>(filter_ptr),
    };
    int listener =
        syscalls::seccomp(SECCOMP_SET_MODE_FILTER, SECCOMP_FILTER_FLAG_NEW_LISTENER, &fprog);
    int errnum = errno;
    (void)munmap(filter_ptr, static_cast<size_t>(fd_len));
    if (listener < 0) {
        THROW_AS(SetupFailure, "seccomp(SECCOMP_FILTER_FLAG_NEW_LISTENER)", errmsg(errnum));
    }
    return FileDescriptor{listener};
}

} // namespace sandpool::seccomp
