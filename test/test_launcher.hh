#pragma once

#include "gtest_with_tester.hh"
#include "throw_assert.hh"

#include <atomic>
#include <functional>
#include <poll.h>
#include <sandpool/file_descriptor.hh>
#include <sandpool/pool/worker_launcher.hh>
#include <sandpool/syscalls.hh>
#include <sandpool/worker/protocol.hh>
#include <spawn.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <variant>

extern char** environ; // NOLINT(readability-redundant-declaration)

namespace test_launcher_detail {
namespace wp = sandpool::worker_protocol;

// Spawns the tester executable without any isolation
class TestLauncher : public sandpool::WorkerLauncher {
public:
    std::atomic<int> launches{0};
    // The next that many launches fail
    std::atomic<int> failures_to_inject{0};
    // Workers install the worker filter and hand over their notification listener
    bool with_seccomp = false;

    std::variant<sandpool::LaunchedWorker, sandpool::SetupError> launch(
        sandpool::WorkerId /*id*/, const std::function<void(pid_t)>& on_process_created
    ) override {
        ++launches;
        if (failures_to_inject > 0) {
            --failures_to_inject;
            return sandpool::SetupError{.description = "injected failure"};
        }

        int sv[2];
        throw_assert(socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, sv) == 0);
        FileDescriptor control{sv[0]};
        FileDescriptor worker_end{sv[1]};

        posix_spawn_file_actions_t actions;
        throw_assert(posix_spawn_file_actions_init(&actions) == 0);
        throw_assert(posix_spawn_file_actions_adddup2(&actions, worker_end, wp::CONTROL_FD) == 0);
        std::string path{tester_executable_path};
        std::string seccomp_flag = "--seccomp";
        char* argv[] = {path.data(), with_seccomp ? seccomp_flag.data() : nullptr, nullptr};
        pid_t pid = -1;
        int rc = posix_spawn(&pid, path.c_str(), &actions, nullptr, argv, environ);
        (void)posix_spawn_file_actions_destroy(&actions);
        if (rc != 0) {
            return sandpool::SetupError{.description = "posix_spawn() failed"};
        }
        (void)worker_end.close();

        FileDescriptor pidfd{syscalls::pidfd_open(pid, 0)};
        throw_assert(pidfd.is_open());
        on_process_created(pid);

        pollfd pfd = {.fd = control, .events = POLLIN, .revents = 0};
        throw_assert(poll(&pfd, 1, 10'000) == 1);
        auto msg = wp::recv_message(control, 0);
        throw_assert(msg && msg->kind == wp::MessageKind::READY);
        FileDescriptor notify_listener;
        if (!msg->fds.empty()) {
            notify_listener = std::move(msg->fds.front());
        }

        return sandpool::LaunchedWorker{
            .pid = pid,
            .pidfd = std::move(pidfd),
            .control = std::move(control),
            .notify_listener = std::move(notify_listener),
            .cgroup = nullptr,
        };
    }
};

} // namespace test_launcher_detail

using test_launcher_detail::TestLauncher;
