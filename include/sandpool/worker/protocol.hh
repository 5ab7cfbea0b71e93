#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sandpool/execution.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/sandbox_config.hh>
#include <string>
#include <string_view>
#include <vector>

// Messages exchanged over the SOCK_SEQPACKET control channel between the pool manager and a
// worker. Every message is a single packet: kind byte followed by the body.
namespace sandpool::worker_protocol {

// The worker finds its end of the control channel here
constexpr int CONTROL_FD = 3;

constexpr size_t MAX_MESSAGE_SIZE = 1 << 16;

enum class MessageKind : uint8_t {
    // Manager -> worker
    PROFILE = 1, // with the seccomp program memfd attached
    JOB = 2, // with the arena slot memfd attached
    // Worker -> manager
    READY = 10, // with the seccomp notification listener attached
    SETUP_ERROR = 11,
    JOB_DONE = 12,
};

[[nodiscard]] const char* to_str(MessageKind kind) noexcept;

// What the worker applies to itself before reporting readiness
struct Profile {
    bool network = false;
    bool mount_proc = true;
    uint64_t work_dir_size = 0;
    uint32_t max_open_files = 0;
    std::vector<std::string> runtime_paths;
    std::vector<FsRule> fs_allow;
    std::vector<std::string> interpreter;
    std::vector<std::string> env;

    static Profile from(const SandboxConfig& config);

    friend bool operator==(const Profile&, const Profile&) = default;
};

struct Job {
    CorrelationId correlation_id;
    uint32_t slot;
};

struct JobDone {
    CorrelationId correlation_id;
    // Exactly one of them is meaningful: exit_code if exited, signal otherwise
    bool exited = true;
    int32_t exit_code = 0;
    int32_t signal = 0;
    std::chrono::microseconds duration{0};
    std::chrono::microseconds cpu_time{0};
    uint64_t peak_memory_bytes = 0;
};

[[nodiscard]] std::vector<std::byte> serialize(const Profile& profile);
[[nodiscard]] std::vector<std::byte> serialize(const Job& job);
[[nodiscard]] std::vector<std::byte> serialize(const JobDone& job_done);
[[nodiscard]] std::vector<std::byte> serialize_ready();
[[nodiscard]] std::vector<std::byte> serialize_setup_error(std::string_view description);

// Sends a SetupError packet without allocating memory, usable between clone3() and
// execveat(). The result is ignored as the sender exits right after.
void send_setup_error_noexcept(int sock_fd, std::string_view description) noexcept;

// The deserializers take the body without the kind byte and throw ProtocolError
[[nodiscard]] Profile deserialize_profile(const std::byte* data, size_t len);
[[nodiscard]] Job deserialize_job(const std::byte* data, size_t len);
[[nodiscard]] JobDone deserialize_job_done(const std::byte* data, size_t len);

struct Message {
    MessageKind kind;
    std::vector<std::byte> body; // without the kind byte
    std::vector<FileDescriptor> fds;
};

// Sends the whole message as one packet, throws upon error. @p flags are passed to sendmsg(2).
void send_message(
    int sock_fd, const std::vector<std::byte>& msg, int flags, const int* fds = nullptr,
    size_t fds_len = 0
);

// Returns std::nullopt if the peer closed the channel. Throws upon error, unknown kind, empty
// packet and truncation.
[[nodiscard]] std::optional<Message> recv_message(int sock_fd, int flags);

} // namespace sandpool::worker_protocol
