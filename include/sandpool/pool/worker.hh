#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <sandpool/execution.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/isolation/cgroups.hh>
#include <sandpool/supervisor/denial_log.hh>
#include <string>
#include <sys/types.h>

namespace sandpool {

// Position in the pool and the incarnation of the worker at that position
struct WorkerId {
    uint32_t position;
    uint32_t generation;

    [[nodiscard]] uint64_t key() const noexcept {
        return (uint64_t{position} << 32) | generation;
    }

    [[nodiscard]] static WorkerId from_key(uint64_t key) noexcept {
        return {.position = static_cast<uint32_t>(key >> 32), .generation = static_cast<uint32_t>(key)};
    }

    friend bool operator==(const WorkerId&, const WorkerId&) = default;
};

// "<position>.<generation>"
[[nodiscard]] std::string to_string(WorkerId id);

enum class WorkerState : uint8_t {
    SPAWNING,
    ISOLATING,
    IDLE,
    BUSY,
    RECYCLING,
    CRASHED,
    TERMINATED,
};

[[nodiscard]] const char* to_str(WorkerState state) noexcept;

// Everything needed to drive a ready worker
struct LaunchedWorker {
    pid_t pid = -1;
    FileDescriptor pidfd;
    FileDescriptor control;
    // Not open if the worker runs without seccomp notifications
    FileDescriptor notify_listener;
    // Null if the worker runs without a dedicated cgroup
    std::unique_ptr<cgroups::WorkerCgroup> cgroup;
};

struct SetupError {
    std::string description;
};

// A pool position. Owned and mutated only by the PoolManager under its mutex.
struct Worker {
    WorkerId id{.position = 0, .generation = 0};
    WorkerState state = WorkerState::TERMINATED;
    pid_t pid = -1;
    FileDescriptor pidfd;
    FileDescriptor control;
    std::unique_ptr<cgroups::WorkerCgroup> cgroup;
    std::shared_ptr<supervisor::DenialLog> denials;
    std::chrono::steady_clock::time_point created_at;
    uint64_t executions = 0;
    std::optional<CorrelationId> job;
    // Set once the worker was sent SIGKILL, its exit is awaited
    bool kill_sent = false;
};

} // namespace sandpool
