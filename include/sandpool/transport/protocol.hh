#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sandpool/execution.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/pool/status.hh>
#include <string>
#include <variant>
#include <vector>

// Client <-> daemon protocol over a Unix stream socket. A frame is a 4 byte big-endian body
// length followed by the body. The first byte of the body is the message kind.
namespace sandpool::client_protocol {

constexpr size_t FRAME_HEADER_SIZE = 4;

enum class RequestKind : uint8_t {
    EXECUTE = 1,
    STATUS = 2,
    PING = 3,
    RELEASE = 4,
};

enum class ResponseKind : uint8_t {
    RESULT = 1, // with the read-only slot descriptor attached if the result has a slot
    STATUS = 2,
    PONG = 3,
    RELEASED = 4,
    ERROR = 5,
};

struct ExecuteRequest {
    CorrelationId correlation_id;
    std::optional<uint32_t> timeout_ms;
    std::string code;

    friend bool operator==(const ExecuteRequest&, const ExecuteRequest&) = default;
};

struct StatusRequest {
    friend bool operator==(const StatusRequest&, const StatusRequest&) = default;
};

struct PingRequest {
    friend bool operator==(const PingRequest&, const PingRequest&) = default;
};

// The client is done reading the result's slot
struct ReleaseRequest {
    CorrelationId correlation_id;

    friend bool operator==(const ReleaseRequest&, const ReleaseRequest&) = default;
};

using Request = std::variant<ExecuteRequest, StatusRequest, PingRequest, ReleaseRequest>;

struct PongResponse {};

struct ReleasedResponse {
    CorrelationId correlation_id;
    // false if the correlation id held no slot
    bool released;
};

struct ErrorResponse {
    std::string message;
};

using Response =
    std::variant<ExecutionResult, PoolStatus, PongResponse, ReleasedResponse, ErrorResponse>;

// Serialize the frame body (without the length)
[[nodiscard]] std::vector<std::byte> serialize(const Request& request);
[[nodiscard]] std::vector<std::byte> serialize(const Response& response);

// Parse a frame body, throw ProtocolError upon an unknown kind, malformed or trailing data
[[nodiscard]] Request deserialize_request(const std::byte* data, size_t len);
[[nodiscard]] Response deserialize_response(const std::byte* data, size_t len);

// Writes one frame with @p attached_fd (if >= 0) passed as SCM_RIGHTS. Throws upon error.
void write_frame(int sock_fd, const std::vector<std::byte>& body, int attached_fd = -1);

struct Frame {
    std::vector<std::byte> body;
    // Descriptor attached to the frame, if any
    FileDescriptor fd;
};

/**
 * @brief Reads one frame.
 *
 * @return std::nullopt if the peer closed the connection between frames
 *
 * @errors Throws ProtocolError if the body exceeds @p max_body_len or is empty, and
 *   std::runtime_error upon I/O errors and EOF inside a frame
 */
[[nodiscard]] std::optional<Frame> read_frame(int sock_fd, size_t max_body_len);

} // namespace sandpool::client_protocol
