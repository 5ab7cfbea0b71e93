#pragma once

#include <chrono>
#include <optional>
#include <sandpool/execution.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/pool/status.hh>
#include <sandpool/transport/protocol.hh>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sandpool {

// The daemon socket cannot be connected to
class DaemonUnreachable : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

struct ClientResult {
    ExecutionResult result;
    std::string stdout_data;
    std::string stderr_data;
};

// Synchronous client, one request at a time
class Client {
    FileDescriptor sock_;
    CorrelationId next_correlation_id_ = 1;

    client_protocol::Response roundtrip(const client_protocol::Request& request, FileDescriptor* attached_fd);

public:
    // Throws DaemonUnreachable
    explicit Client(const std::string& socket_path);

    // $SANDPOOL_SOCKET or the default socket path
    [[nodiscard]] static std::string socket_path_from_env();

    /**
     * @brief Executes @p code and copies its output out of the result slot, then releases the
     *   slot.
     *
     * @errors Throws ProtocolError upon a malformed response or an error reported by the daemon
     */
    ClientResult execute(std::string_view code, std::optional<std::chrono::milliseconds> timeout);

    [[nodiscard]] PoolStatus status();

    void ping();
};

} // namespace sandpool
