#include <csignal>
#include <exception>
#include <fcntl.h>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/isolation/capabilities.hh>
#include <sandpool/isolation/landlock.hh>
#include <sandpool/isolation/mounts.hh>
#include <sandpool/isolation/worker_filter.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/noexcept_concat.hh>
#include <sandpool/worker/interpreter.hh>
#include <sandpool/worker/job_loop.hh>
#include <sandpool/worker/protocol.hh>
#include <unistd.h>

namespace wp = sandpool::worker_protocol;

namespace {

template <class... Args>
[[noreturn]] void die_with_msg(Args&&... msg) noexcept {
    wp::send_setup_error_noexcept(
        wp::CONTROL_FD, noexcept_concat<4000>("worker: ", std::forward<Args>(msg)...)
    );
    _exit(1);
}

template <class... Args>
[[noreturn]] void die_with_error(Args&&... msg) noexcept {
    die_with_msg(std::forward<Args>(msg)..., errmsg());
}

struct ReceivedProfile {
    wp::Profile profile;
    FileDescriptor bpf_fd;
};

ReceivedProfile receive_profile() {
    auto msg = wp::recv_message(wp::CONTROL_FD, 0);
    if (!msg) {
        THROW_AS(sandpool::SetupFailure, "control channel closed before the profile arrived");
    }
    if (msg->kind != wp::MessageKind::PROFILE) {
        THROW_AS(sandpool::SetupFailure, "expected Profile, got ", wp::to_str(msg->kind));
    }
    if (msg->fds.size() != 1) {
        THROW_AS(sandpool::SetupFailure, "Profile carries ", msg->fds.size(), " descriptors");
    }
    return {
        .profile = wp::deserialize_profile(msg->body.data(), msg->body.size()),
        .bpf_fd = std::move(msg->fds[0]),
    };
}

// Leaves only the control channel and @p keep_fd open, standard streams point to /dev/null
void sanitize_fds(int keep_fd) noexcept {
    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd < 0) {
        die_with_error("open(/dev/null)");
    }
    for (int fd = 0; fd < 3; ++fd) {
        if (fd != null_fd && dup2(null_fd, fd) < 0) {
            die_with_error("dup2()");
        }
    }
    if (null_fd > 2 && null_fd != wp::CONTROL_FD && close(null_fd)) {
        die_with_error("close()");
    }
    for (int fd = wp::CONTROL_FD + 1; fd < keep_fd; ++fd) {
        (void)close(fd);
    }
    if (close_range(keep_fd + 1, ~0U, 0)) {
        die_with_error("close_range()");
    }
}

} // namespace

int main() {
    using namespace sandpool; // NOLINT(google-build-using-namespace)

    // The interpreter dying early must not kill us while we write its input
    if (signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        die_with_error("signal(SIGPIPE)");
    }

    wp::Profile profile;
    try {
        auto received = receive_profile();
        profile = std::move(received.profile);
        if (received.bpf_fd <= wp::CONTROL_FD) {
            die_with_msg("seccomp program descriptor collides with the standard streams");
        }
        sanitize_fds(received.bpf_fd);

        mounts::set_up_mount_namespace(profile);
        capabilities::set_hostname("");
        capabilities::set_and_lock_securebits();
        capabilities::drop_all_capabilities();
        capabilities::set_no_new_privs();
        landlock::restrict_self(landlock::rules_for(profile));

        auto listener = seccomp::install_filter_with_listener(received.bpf_fd);
        received.bpf_fd.reset(-1);
        int listener_fd = listener;
        wp::send_message(wp::CONTROL_FD, wp::serialize_ready(), 0, &listener_fd, 1);
    } catch (const std::exception& e) {
        die_with_msg(e.what());
    }

    try {
        worker::serve_jobs(
            wp::CONTROL_FD,
            [&profile](std::string_view code, arena::SlotWriter& writer) {
                return worker::run_interpreter(profile, code, writer);
            }
        );
    } catch (const std::exception&) {
        // Nobody is listening on our stderr, the manager sees the control channel closing
        return 1;
    }
    return 0;
}
