#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sandpool/concat_tostr.hh>
#include <sandpool/errmsg.hh>
#include <sandpool/file_contents.hh>
#include <sandpool/isolation/profile_builder.hh>
#include <sandpool/logger.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/noexcept_concat.hh>
#include <sandpool/syscalls.hh>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wp = sandpool::worker_protocol;

namespace {

// Everything the cloned child needs, prepared before clone3() so the child does not allocate
struct ChildArgs {
    int sync_fd;
    int control_fd;
    int exe_fd;
};

template <class... Args>
[[noreturn]] void child_die_with_msg(int control_fd, Args&&... msg) noexcept {
    wp::send_setup_error_noexcept(
        control_fd, noexcept_concat("clone child: ", std::forward<Args>(msg)...)
    );
    _exit(1);
}

template <class... Args>
[[noreturn]] void child_die_with_error(int control_fd, Args&&... msg) noexcept {
    child_die_with_msg(control_fd, std::forward<Args>(msg)..., errmsg());
}

// Runs between clone3() and execveat(): only async-signal-safe calls
[[noreturn]] void run_child(const ChildArgs& args) noexcept {
    if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0)) {
        child_die_with_error(args.control_fd, "prctl(PR_SET_PDEATHSIG)");
    }
    // The signal mask survives execve()
    sigset_t empty_set;
    sigemptyset(&empty_set);
    if (sigprocmask(SIG_SETMASK, &empty_set, nullptr)) {
        child_die_with_error(args.control_fd, "sigprocmask()");
    }
    // Wait until our user namespace has the id maps
    char byte;
    ssize_t rc;
    do {
        rc = read(args.sync_fd, &byte, 1);
    } while (rc < 0 && errno == EINTR);
    if (rc != 1) {
        // The parent gave up on us
        _exit(1);
    }

    int control_fd = args.control_fd;
    if (control_fd == wp::CONTROL_FD) {
        if (fcntl(control_fd, F_SETFD, 0)) {
            child_die_with_error(control_fd, "fcntl(F_SETFD)");
        }
    } else {
        // dup2() does not copy FD_CLOEXEC
        if (dup2(control_fd, wp::CONTROL_FD) < 0) {
            child_die_with_error(control_fd, "dup2()");
        }
        control_fd = wp::CONTROL_FD;
    }

    char arg0[] = "sandpool-worker";
    char* const argv[] = {arg0, nullptr};
    char* const envp[] = {nullptr};
    syscalls::execveat(args.exe_fd, "", argv, envp, AT_EMPTY_PATH);
    child_die_with_error(control_fd, "execveat()");
}

// Kills and reaps the process unless released
class ProcessGuard {
    pid_t pid_;
    int pidfd_;
    sandpool::cgroups::WorkerCgroup* cgroup_;

public:
    ProcessGuard(pid_t pid, int pidfd, sandpool::cgroups::WorkerCgroup* cgroup) noexcept
    : pid_{pid}
    , pidfd_{pidfd}
    , cgroup_{cgroup} {}

    ProcessGuard(const ProcessGuard&) = delete;
    ProcessGuard(ProcessGuard&&) = delete;
    ProcessGuard& operator=(const ProcessGuard&) = delete;
    ProcessGuard& operator=(ProcessGuard&&) = delete;

    void release() noexcept { pid_ = -1; }

    ~ProcessGuard() {
        if (pid_ < 0) {
            return;
        }
        if (!cgroup_->kill() && syscalls::pidfd_send_signal(pidfd_, SIGKILL, nullptr, 0)) {
            errlog("cannot kill worker process ", pid_, errmsg());
        }
        siginfo_t si;
        while (syscalls::waitid(P_PIDFD, pidfd_, &si, WEXITED, nullptr)) {
            if (errno != EINTR) {
                errlog("waitid()", errmsg());
                break;
            }
        }
    }
};

struct Ready {
    FileDescriptor listener;
};

// Waits for Ready or SetupError from the worker
std::variant<Ready, sandpool::SetupError>
await_readiness(int control_fd, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()
        );
        if (left.count() <= 0) {
            return sandpool::SetupError{
                concat_tostr("worker did not become ready within ", timeout.count(), " ms")
            };
        }
        pollfd pfd = {.fd = control_fd, .events = POLLIN, .revents = 0};
        int rc = poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }
        if (rc == 0) {
            continue;
        }

        auto msg = wp::recv_message(control_fd, MSG_DONTWAIT);
        if (!msg) {
            return sandpool::SetupError{"worker exited during setup"};
        }
        switch (msg->kind) {
        case wp::MessageKind::SETUP_ERROR:
            return sandpool::SetupError{std::string{
                reinterpret_cast<const char*>(msg->body.data()), msg->body.size()
            }};
        case wp::MessageKind::READY:
            if (msg->fds.size() != 1 || !msg->body.empty()) {
                return sandpool::SetupError{"malformed Ready message"};
            }
            return Ready{.listener = std::move(msg->fds[0])};
        case wp::MessageKind::PROFILE:
        case wp::MessageKind::JOB:
        case wp::MessageKind::JOB_DONE: break;
        }
        return sandpool::SetupError{concat_tostr("unexpected message: ", wp::to_str(msg->kind))};
    }
}

} // namespace

namespace sandpool {

IsolationProfileBuilder::IsolationProfileBuilder(
    const cgroups::CgroupTree& cgroups, const SandboxConfig& sandbox,
    FileDescriptor seccomp_program, const std::string& worker_executable,
    std::chrono::milliseconds setup_timeout
)
: cgroups_{cgroups}
, limits_{
      .memory_max = sandbox.memory_limit,
      .cpu_quota = sandbox.cpu_quota,
      .pids_max = sandbox.max_processes,
  }
, network_{sandbox.network}
, profile_msg_{wp::serialize(wp::Profile::from(sandbox))}
, seccomp_program_{std::move(seccomp_program)}
, worker_exe_{worker_executable.c_str(), O_PATH | O_CLOEXEC}
, setup_timeout_{setup_timeout} {
    if (!worker_exe_.is_open()) {
        THROW("open(", worker_executable, ")", errmsg());
    }
}

std::variant<LaunchedWorker, SetupError> IsolationProfileBuilder::launch(
    WorkerId id, const std::function<void(pid_t)>& on_process_created
) {
    try {
        auto cgroup = cgroups_.create_worker_cgroup(
            concat_tostr("worker-", id.position, '-', id.generation), limits_
        );

        int sv[2];
        if (socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, sv)) {
            THROW("socketpair()", errmsg());
        }
        FileDescriptor control{sv[0]};
        FileDescriptor child_control{sv[1]};

        int sync_pipe[2];
        if (pipe2(sync_pipe, O_CLOEXEC)) {
            THROW("pipe2()", errmsg());
        }
        FileDescriptor sync_read{sync_pipe[0]};
        FileDescriptor sync_write{sync_pipe[1]};

        ChildArgs child_args = {
            .sync_fd = sync_read,
            .control_fd = child_control,
            .exe_fd = worker_exe_,
        };

        uint64_t flags = CLONE_PIDFD | CLONE_INTO_CGROUP | CLONE_NEWUSER | CLONE_NEWPID |
            CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWCGROUP;
        if (!network_) {
            flags |= CLONE_NEWNET;
        }
        int pidfd_raw = -1;
        clone_args cl_args = {};
        cl_args.flags = flags;
        cl_args.pidfd = reinterpret_cast<uint64_t>(&pidfd_raw);
        cl_args.exit_signal = SIGCHLD;
        cl_args.cgroup = static_cast<uint64_t>(cgroup->dir_fd());

        auto pid = static_cast<pid_t>(syscalls::clone3(&cl_args));
        if (pid < 0) {
            THROW("clone3()", errmsg());
        }
        if (pid == 0) {
            run_child(child_args);
        }
        FileDescriptor pidfd{pidfd_raw};
        ProcessGuard guard{pid, pidfd, cgroup.get()};
        child_control.reset(-1);
        sync_read.reset(-1);
        on_process_created(pid);

        auto proc = concat_tostr("/proc/", pid, '/');
        write_file_at(AT_FDCWD, (proc + "uid_map").c_str(), concat_tostr("0 ", geteuid(), " 1"));
        write_file_at(AT_FDCWD, (proc + "setgroups").c_str(), "deny");
        write_file_at(AT_FDCWD, (proc + "gid_map").c_str(), concat_tostr("0 ", getegid(), " 1"));
        if (write(sync_write, "x", 1) != 1) {
            THROW("write()", errmsg());
        }
        sync_write.reset(-1);

        int program_fd = seccomp_program_;
        wp::send_message(control, profile_msg_, MSG_DONTWAIT, &program_fd, 1);

        auto readiness = await_readiness(control, setup_timeout_);
        if (auto* err = std::get_if<SetupError>(&readiness)) {
            return std::move(*err);
        }
        guard.release();
        return LaunchedWorker{
            .pid = pid,
            .pidfd = std::move(pidfd),
            .control = std::move(control),
            .notify_listener = std::move(std::get<Ready>(readiness).listener),
            .cgroup = std::move(cgroup),
        };
    } catch (const std::exception& e) {
        return SetupError{e.what()};
    }
}

} // namespace sandpool
