#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sandpool {

using CorrelationId = uint64_t;

enum class ExecutionStatus : uint8_t {
    COMPLETED = 0,
    TIMED_OUT = 1,
    DENIED = 2,
    CRASHED = 3,
    REJECTED = 4,
};

[[nodiscard]] const char* to_str(ExecutionStatus status) noexcept;

struct ExecutionRequest {
    CorrelationId correlation_id;
    std::string code;
    // Defaults to the configured timeout, larger values are clamped to it
    std::optional<std::chrono::milliseconds> timeout = std::nullopt;
};

// Location of captured output inside an arena slot
struct OutputRef {
    uint32_t offset = 0;
    uint32_t length = 0;
    bool truncated = false;
};

struct ExecutionResult {
    CorrelationId correlation_id;
    ExecutionStatus status;
    // Set iff the output lives in the arena slot; the consumer has to release the slot
    std::optional<uint32_t> slot;
    OutputRef stdout_ref;
    OutputRef stderr_ref;
    // Exit code if the job exited, -1 otherwise
    int exit_code = -1;
    // Signal that killed the job, 0 if it exited
    int signal = 0;
    std::chrono::microseconds duration{0};
    std::chrono::microseconds cpu_time{0};
    uint64_t peak_memory_bytes = 0;
    bool oom_killed = false;
    // Syscalls denied by the supervisor during the job (most recent ones, bounded)
    std::vector<int> denied_syscalls;
    uint64_t denied_syscalls_count = 0;
    // Reason for REJECTED and CRASHED, informational for others
    std::string message;
    // "<position>.<generation>" of the worker that ran the job, empty if none
    std::string worker;
};

} // namespace sandpool
