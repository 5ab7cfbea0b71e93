#include <fcntl.h>
#include <gtest/gtest.h>
#include <sandpool/errors.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/worker/protocol.hh>
#include <sys/socket.h>
#include <unistd.h>

using sandpool::ProtocolError;
using namespace sandpool::worker_protocol; // NOLINT(google-build-using-namespace)

namespace {

struct SocketPair {
    FileDescriptor a;
    FileDescriptor b;
};

SocketPair seqpacket_pair() {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, fds)) {
        ADD_FAILURE() << "socketpair() failed";
    }
    return {FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
}

// Body without the kind byte
std::vector<std::byte> body_of(std::vector<std::byte> msg) {
    msg.erase(msg.begin());
    return msg;
}

} // namespace

// NOLINTNEXTLINE
TEST(worker_protocol, profile_survives_serialization) {
    Profile profile{
        .network = false,
        .mount_proc = true,
        .work_dir_size = 1 << 20,
        .max_open_files = 64,
        .runtime_paths = {"/usr", "/lib"},
        .fs_allow = {{.path = "/srv/data", .access = sandpool::FsAccess::READ_WRITE}},
        .interpreter = {"/usr/bin/python3", "-"},
        .env = {"A=1", "B="},
    };
    auto msg = serialize(profile);
    ASSERT_EQ(msg.front(), static_cast<std::byte>(MessageKind::PROFILE));
    auto body = body_of(std::move(msg));
    EXPECT_EQ(deserialize_profile(body.data(), body.size()), profile);
}

// NOLINTNEXTLINE
TEST(worker_protocol, job_done_survives_serialization) {
    JobDone done{
        .correlation_id = 42,
        .exited = false,
        .exit_code = 0,
        .signal = 9,
        .duration = std::chrono::microseconds{1500},
        .cpu_time = std::chrono::microseconds{700},
        .peak_memory_bytes = 12345,
    };
    auto body = body_of(serialize(done));
    auto res = deserialize_job_done(body.data(), body.size());
    EXPECT_EQ(res.correlation_id, 42U);
    EXPECT_FALSE(res.exited);
    EXPECT_EQ(res.signal, 9);
    EXPECT_EQ(res.duration, std::chrono::microseconds{1500});
    EXPECT_EQ(res.cpu_time, std::chrono::microseconds{700});
    EXPECT_EQ(res.peak_memory_bytes, 12345U);
}

// NOLINTNEXTLINE
TEST(worker_protocol, malformed_bodies_are_rejected) {
    auto body = body_of(serialize(Job{.correlation_id = 1, .slot = 2}));
    EXPECT_THROW((void)deserialize_job(body.data(), body.size() - 1), ProtocolError);
    body.push_back(std::byte{0});
    EXPECT_THROW((void)deserialize_job(body.data(), body.size()), ProtocolError);

    auto done = body_of(serialize(JobDone{.correlation_id = 1}));
    done[8] = std::byte{2}; // the exited flag
    EXPECT_THROW((void)deserialize_job_done(done.data(), done.size()), ProtocolError);
}

// NOLINTNEXTLINE
TEST(worker_protocol, messages_carry_descriptors) {
    auto [a, b] = seqpacket_pair();
    FileDescriptor attached{"/dev/null", O_RDONLY | O_CLOEXEC};
    ASSERT_TRUE(attached.is_open());
    int fd = attached;
    send_message(a, serialize(Job{.correlation_id = 5, .slot = 1}), 0, &fd, 1);

    auto msg = recv_message(b, 0);
    ASSERT_TRUE(msg);
    EXPECT_EQ(msg->kind, MessageKind::JOB);
    ASSERT_EQ(msg->fds.size(), 1U);
    EXPECT_TRUE(msg->fds[0].is_open());
    EXPECT_EQ(fcntl(msg->fds[0], F_GETFD), FD_CLOEXEC);
    auto job = deserialize_job(msg->body.data(), msg->body.size());
    EXPECT_EQ(job.correlation_id, 5U);
    EXPECT_EQ(job.slot, 1U);
}

// NOLINTNEXTLINE
TEST(worker_protocol, setup_error_without_allocation) {
    auto [a, b] = seqpacket_pair();
    send_setup_error_noexcept(a, "mount failed");
    auto msg = recv_message(b, 0);
    ASSERT_TRUE(msg);
    EXPECT_EQ(msg->kind, MessageKind::SETUP_ERROR);
    EXPECT_EQ(
        std::string_view(reinterpret_cast<const char*>(msg->body.data()), msg->body.size()),
        "mount failed"
    );
    EXPECT_EQ(serialize_setup_error("mount failed"), [&] {
        auto res = msg->body;
        res.insert(res.begin(), static_cast<std::byte>(MessageKind::SETUP_ERROR));
        return res;
    }());
}

// NOLINTNEXTLINE
TEST(worker_protocol, unknown_kind_and_eof) {
    auto [a, b] = seqpacket_pair();
    const char garbage[] = {static_cast<char>(99), 1, 2};
    ASSERT_EQ(send(a, garbage, sizeof(garbage), 0), static_cast<ssize_t>(sizeof(garbage)));
    EXPECT_THROW((void)recv_message(b, 0), ProtocolError);

    ASSERT_EQ(a.close(), 0);
    EXPECT_FALSE(recv_message(b, 0).has_value());
}
