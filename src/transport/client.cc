#include <cstdlib>
#include <cstring>
#include <sandpool/daemon_config.hh>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/transport/client.hh>
#include <sandpool/transport/result_arena.hh>
#include <sys/socket.h>
#include <sys/un.h>
#include <variant>

namespace cp = sandpool::client_protocol;

namespace {

// Responses carry at most the denial list and messages besides fixed fields
constexpr size_t MAX_RESPONSE_LEN = 1 << 20;

} // namespace

namespace sandpool {

Client::Client(const std::string& socket_path)
: sock_{socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)} {
    if (!sock_.is_open()) {
        THROW("socket()", errmsg());
    }
    sockaddr_un addr = {};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        THROW_AS(DaemonUnreachable, "socket path is too long: ", socket_path);
    }
    std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size() + 1);
    if (connect(sock_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr))) {
        THROW_AS(DaemonUnreachable, "connect(", socket_path, ")", errmsg());
    }
}

std::string Client::socket_path_from_env() {
    const char* path = std::getenv(socket_path_env_var);
    return path && *path ? path : default_socket_path;
}

cp::Response Client::roundtrip(const cp::Request& request, FileDescriptor* attached_fd) {
    cp::write_frame(sock_, cp::serialize(request));
    auto frame = cp::read_frame(sock_, MAX_RESPONSE_LEN);
    if (!frame) {
        THROW_AS(ProtocolError, "daemon closed the connection");
    }
    auto response = cp::deserialize_response(frame->body.data(), frame->body.size());
    if (auto* err = std::get_if<cp::ErrorResponse>(&response)) {
        THROW_AS(ProtocolError, "daemon: ", err->message);
    }
    if (attached_fd) {
        *attached_fd = std::move(frame->fd);
    }
    return response;
}

ClientResult Client::execute(std::string_view code, std::optional<std::chrono::milliseconds> timeout) {
    auto correlation_id = next_correlation_id_++;
    std::optional<uint32_t> timeout_ms;
    if (timeout) {
        timeout_ms = static_cast<uint32_t>(timeout->count());
    }
    FileDescriptor slot_fd;
    auto response = roundtrip(
        cp::ExecuteRequest{
            .correlation_id = correlation_id,
            .timeout_ms = timeout_ms,
            .code = std::string{code},
        },
        &slot_fd
    );
    auto* res = std::get_if<ExecutionResult>(&response);
    if (!res) {
        THROW_AS(ProtocolError, "unexpected response to Execute");
    }
    if (res->correlation_id != correlation_id) {
        THROW_AS(ProtocolError, "response for correlation id ", res->correlation_id);
    }

    ClientResult cres{.result = std::move(*res)};
    if (!cres.result.slot) {
        return cres;
    }
    if (!slot_fd.is_open()) {
        THROW_AS(ProtocolError, "result without the slot descriptor");
    }
    {
        arena::MappedSlot slot{slot_fd, false};
        cres.stdout_data = slot.view(cres.result.stdout_ref.offset, cres.result.stdout_ref.length);
        cres.stderr_data = slot.view(cres.result.stderr_ref.offset, cres.result.stderr_ref.length);
    }
    slot_fd.reset(-1);

    auto released = roundtrip(cp::ReleaseRequest{.correlation_id = correlation_id}, nullptr);
    if (!std::holds_alternative<cp::ReleasedResponse>(released)) {
        THROW_AS(ProtocolError, "unexpected response to Release");
    }
    return cres;
}

PoolStatus Client::status() {
    auto response = roundtrip(cp::StatusRequest{}, nullptr);
    auto* st = std::get_if<PoolStatus>(&response);
    if (!st) {
        THROW_AS(ProtocolError, "unexpected response to Status");
    }
    return *st;
}

void Client::ping() {
    if (!std::holds_alternative<cp::PongResponse>(roundtrip(cp::PingRequest{}, nullptr))) {
        THROW_AS(ProtocolError, "unexpected response to Ping");
    }
}

} // namespace sandpool
