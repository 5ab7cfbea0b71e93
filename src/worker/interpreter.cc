#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sandpool/errmsg.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/noexcept_concat.hh>
#include <sandpool/syscalls.hh>
#include <sandpool/worker/interpreter.hh>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace {

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

Pipe make_pipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC)) {
        THROW("pipe2()", errmsg());
    }
    return {.read_end = FileDescriptor{fds[0]}, .write_end = FileDescriptor{fds[1]}};
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK)) {
        THROW("fcntl()", errmsg());
    }
}

std::vector<char*> to_argv(const std::vector<std::string>& strs) {
    std::vector<char*> res;
    res.reserve(strs.size() + 1);
    for (const auto& str : strs) {
        res.emplace_back(const_cast<char*>(str.c_str()));
    }
    res.emplace_back(nullptr);
    return res;
}

template <class... Args>
[[noreturn]] void child_die(Args&&... msg) noexcept {
    auto str = noexcept_concat("sandpool-worker: ", std::forward<Args>(msg)..., errmsg(), '\n');
    (void)write(STDERR_FILENO, str.data(), str.size());
    _exit(127);
}

void set_limit(int resource, rlim_t value) noexcept {
    rlimit lim = {.rlim_cur = value, .rlim_max = value};
    if (setrlimit(resource, &lim)) {
        child_die("setrlimit(", resource, ")");
    }
}

// Runs in the forked child, only async-signal-safe calls
[[noreturn]] void exec_interpreter(
    const sandpool::worker_protocol::Profile& profile, int stdin_fd, int stdout_fd,
    int stderr_fd, char* const argv[], char* const envp[]
) noexcept {
    if (dup2(stdin_fd, STDIN_FILENO) < 0 || dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0)
    {
        child_die("dup2()");
    }
    if (chdir("/tmp")) {
        child_die("chdir(/tmp)");
    }
    set_limit(RLIMIT_NOFILE, profile.max_open_files);
    set_limit(RLIMIT_CORE, 0);
    set_limit(RLIMIT_FSIZE, profile.work_dir_size);
    if (signal(SIGPIPE, SIG_DFL) == SIG_ERR) {
        child_die("signal(SIGPIPE)");
    }
    if (close_range(3, ~0U, 0)) {
        child_die("close_range()");
    }
    execve(argv[0], argv, envp);
    child_die("execve(", argv[0], ")");
}

// Kills every other process of our PID namespace and waits until all children are reaped
void kill_and_reap_all() {
    if (kill(-1, SIGKILL) && errno != ESRCH) {
        THROW("kill(-1)", errmsg());
    }
    for (;;) {
        if (waitpid(-1, nullptr, __WALL) < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECHILD) {
                return;
            }
            THROW("waitpid()", errmsg());
        }
    }
}

} // namespace

namespace sandpool::worker {

JobOutcome run_interpreter(
    const worker_protocol::Profile& profile, std::string_view code, arena::SlotWriter& writer
) {
    if (profile.interpreter.empty()) {
        THROW("no interpreter to run");
    }
    auto argv = to_argv(profile.interpreter);
    auto envp = to_argv(profile.env);
    auto in = make_pipe();
    auto out = make_pipe();
    auto err = make_pipe();

    pid_t pid = fork();
    if (pid < 0) {
        THROW("fork()", errmsg());
    }
    if (pid == 0) {
        exec_interpreter(
            profile, in.read_end, out.write_end, err.write_end, argv.data(), envp.data()
        );
    }

    FileDescriptor pidfd{syscalls::pidfd_open(pid, 0)};
    if (!pidfd.is_open()) {
        THROW("pidfd_open()", errmsg());
    }
    in.read_end.reset(-1);
    out.write_end.reset(-1);
    err.write_end.reset(-1);
    set_nonblocking(in.write_end);
    set_nonblocking(out.read_end);
    set_nonblocking(err.read_end);

    std::array<char, 1 << 16> buff;
    // Reads what is available, closes @p fd on EOF
    auto drain = [&](FileDescriptor& fd, void (arena::SlotWriter::*append)(std::string_view)) {
        for (;;) {
            auto rc = read(fd, buff.data(), buff.size());
            if (rc > 0) {
                (writer.*append)({buff.data(), static_cast<size_t>(rc)});
                continue;
            }
            if (rc == 0) {
                fd.reset(-1);
                return;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN) {
                return;
            }
            THROW("read()", errmsg());
        }
    };

    size_t code_written = 0;
    if (code.empty()) {
        in.write_end.reset(-1);
    }
    bool exited = false;
    int status = 0;
    rusage usage = {};
    while (out.read_end.is_open() || err.read_end.is_open() || !exited) {
        std::array<pollfd, 4> pfds = {{
            {.fd = in.write_end, .events = POLLOUT, .revents = 0},
            {.fd = out.read_end, .events = POLLIN, .revents = 0},
            {.fd = err.read_end, .events = POLLIN, .revents = 0},
            {.fd = exited ? -1 : static_cast<int>(pidfd), .events = POLLIN, .revents = 0},
        }};
        if (poll(pfds.data(), pfds.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }

        if (pfds[0].revents & (POLLOUT | POLLERR | POLLHUP)) {
            auto rc = write(in.write_end, code.data() + code_written, code.size() - code_written);
            if (rc >= 0) {
                code_written += static_cast<size_t>(rc);
                if (code_written == code.size()) {
                    in.write_end.reset(-1);
                }
            } else if (errno == EPIPE) {
                in.write_end.reset(-1); // the interpreter does not read any more
            } else if (errno != EAGAIN && errno != EINTR) {
                THROW("write()", errmsg());
            }
        }
        if (pfds[1].revents) {
            drain(out.read_end, &arena::SlotWriter::append_stdout);
        }
        if (pfds[2].revents) {
            drain(err.read_end, &arena::SlotWriter::append_stderr);
        }
        if (pfds[3].revents & POLLIN) {
            while (wait4(pid, &status, __WALL, &usage) < 0) {
                if (errno != EINTR) {
                    THROW("wait4()", errmsg());
                }
            }
            exited = true;
            in.write_end.reset(-1);
            // Descendants may still hold the output pipes open
            kill_and_reap_all();
        }
    }
    kill_and_reap_all();

    auto to_usec = [](const timeval& tv) {
        return std::chrono::seconds{tv.tv_sec} + std::chrono::microseconds{tv.tv_usec};
    };
    return {
        .exited = WIFEXITED(status),
        .exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1,
        .signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0,
        .cpu_time = to_usec(usage.ru_utime) + to_usec(usage.ru_stime),
        .peak_memory_bytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024,
    };
}

} // namespace sandpool::worker
