#include <fcntl.h>
#include <gtest/gtest.h>
#include <sandpool/errors.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/transport/protocol.hh>
#include <sandpool/write_exact.hh>
#include <sys/socket.h>
#include <unistd.h>

using sandpool::ExecutionResult;
using sandpool::ExecutionStatus;
using sandpool::ProtocolError;
using namespace sandpool::client_protocol; // NOLINT(google-build-using-namespace)

namespace {

struct SocketPair {
    FileDescriptor a;
    FileDescriptor b;
};

SocketPair stream_pair() {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds)) {
        ADD_FAILURE() << "socketpair() failed";
    }
    return {FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
}

std::vector<std::byte> bytes(std::initializer_list<int> values) {
    std::vector<std::byte> res;
    for (int v : values) {
        res.push_back(static_cast<std::byte>(v));
    }
    return res;
}

Request reparsed(const Request& req) {
    auto body = serialize(req);
    return deserialize_request(body.data(), body.size());
}

} // namespace

// NOLINTNEXTLINE
TEST(client_protocol, requests) {
    Request execute = ExecuteRequest{.correlation_id = 3, .timeout_ms = 500, .code = "echo a"};
    EXPECT_EQ(reparsed(execute), execute);
    Request no_timeout = ExecuteRequest{.correlation_id = 4, .timeout_ms = std::nullopt, .code = ""};
    EXPECT_EQ(reparsed(no_timeout), no_timeout);
    EXPECT_EQ(reparsed(StatusRequest{}), Request{StatusRequest{}});
    EXPECT_EQ(reparsed(ReleaseRequest{.correlation_id = 9}), Request{ReleaseRequest{.correlation_id = 9}});
}

// NOLINTNEXTLINE
TEST(client_protocol, result_response) {
    ExecutionResult res{
        .correlation_id = 11,
        .status = ExecutionStatus::DENIED,
        .slot = 2,
        .stdout_ref = {.offset = 64, .length = 5, .truncated = true},
        .stderr_ref = {.offset = 128, .length = 0, .truncated = false},
        .exit_code = 1,
        .signal = 0,
        .duration = std::chrono::microseconds{900},
        .cpu_time = std::chrono::microseconds{100},
        .peak_memory_bytes = 4096,
        .oom_killed = false,
        .denied_syscalls = {41, 42},
        .denied_syscalls_count = 7,
        .message = "",
        .worker = "0.3",
    };
    auto body = serialize(Response{res});
    auto parsed = deserialize_response(body.data(), body.size());
    ASSERT_TRUE(std::holds_alternative<ExecutionResult>(parsed));
    const auto& got = std::get<ExecutionResult>(parsed);
    EXPECT_EQ(got.correlation_id, 11U);
    EXPECT_EQ(got.status, ExecutionStatus::DENIED);
    EXPECT_EQ(got.slot, 2U);
    EXPECT_EQ(got.stdout_ref.length, 5U);
    EXPECT_TRUE(got.stdout_ref.truncated);
    EXPECT_FALSE(got.stderr_ref.truncated);
    EXPECT_EQ(got.exit_code, 1);
    EXPECT_EQ(got.denied_syscalls, (std::vector<int>{41, 42}));
    EXPECT_EQ(got.denied_syscalls_count, 7U);
    EXPECT_EQ(got.worker, "0.3");

    res.slot = std::nullopt;
    res.status = ExecutionStatus::REJECTED;
    res.message = "pool at capacity";
    body = serialize(Response{res});
    parsed = deserialize_response(body.data(), body.size());
    EXPECT_FALSE(std::get<ExecutionResult>(parsed).slot.has_value());
    EXPECT_EQ(std::get<ExecutionResult>(parsed).message, "pool at capacity");
}

// NOLINTNEXTLINE
TEST(client_protocol, malformed_bodies) {
    EXPECT_THROW((void)deserialize_request(nullptr, 0), ProtocolError);
    auto unknown = bytes({77});
    EXPECT_THROW((void)deserialize_request(unknown.data(), unknown.size()), ProtocolError);
    EXPECT_THROW((void)deserialize_response(unknown.data(), unknown.size()), ProtocolError);

    auto ping = serialize(Request{PingRequest{}});
    ping.push_back(std::byte{0});
    EXPECT_THROW((void)deserialize_request(ping.data(), ping.size()), ProtocolError);

    auto execute = serialize(Request{ExecuteRequest{.correlation_id = 1, .timeout_ms = 5, .code = "x"}});
    execute.pop_back();
    EXPECT_THROW((void)deserialize_request(execute.data(), execute.size()), ProtocolError);

    auto result = serialize(Response{ExecutionResult{.correlation_id = 1, .status = ExecutionStatus::COMPLETED}});
    result[9] = std::byte{42}; // status
    EXPECT_THROW((void)deserialize_response(result.data(), result.size()), ProtocolError);
}

// NOLINTNEXTLINE
TEST(client_protocol, frames) {
    auto [a, b] = stream_pair();
    auto body = serialize(Request{PingRequest{}});
    write_frame(a, body);
    FileDescriptor null_fd{"/dev/null", O_RDONLY | O_CLOEXEC};
    write_frame(a, body, null_fd);

    auto frame = read_frame(b, 16);
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame->body, body);
    EXPECT_FALSE(frame->fd.is_open());

    frame = read_frame(b, 16);
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame->body, body);
    EXPECT_TRUE(frame->fd.is_open());

    ASSERT_EQ(a.close(), 0);
    EXPECT_FALSE(read_frame(b, 16).has_value());
}

// NOLINTNEXTLINE
TEST(client_protocol, frame_length_is_big_endian) {
    auto [a, b] = stream_pair();
    write_frame(a, bytes({3}));
    char raw[5];
    ASSERT_EQ(read(b, raw, sizeof(raw)), 5);
    EXPECT_EQ(std::string_view(raw, 4), std::string_view("\0\0\0\1", 4));
    EXPECT_EQ(raw[4], 3);
}

// NOLINTNEXTLINE
TEST(client_protocol, invalid_frames) {
    {
        auto [a, b] = stream_pair();
        ASSERT_EQ(write_all(a, std::string_view("\0\0\0\0", 4)), 4U);
        EXPECT_THROW((void)read_frame(b, 16), ProtocolError);
    }
    {
        auto [a, b] = stream_pair();
        write_frame(a, std::vector<std::byte>(17, std::byte{1}));
        EXPECT_THROW((void)read_frame(b, 16), ProtocolError);
    }
    {
        auto [a, b] = stream_pair();
        ASSERT_EQ(write_all(a, std::string_view("\0\0\0\5ab", 6)), 6U);
        ASSERT_EQ(a.close(), 0);
        EXPECT_THROW((void)read_frame(b, 16), std::runtime_error);
    }
}
