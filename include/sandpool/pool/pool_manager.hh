#pragma once

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sandpool/daemon_config.hh>
#include <sandpool/execution.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/pool/status.hh>
#include <sandpool/pool/worker.hh>
#include <sandpool/pool/worker_launcher.hh>
#include <sandpool/supervisor/syscall_supervisor.hh>
#include <sandpool/transport/result_arena.hh>
#include <sandpool/worker/protocol.hh>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace sandpool {

struct PoolConfig {
    uint32_t pool_size = 4;
    uint64_t recycle_after = 100;
    uint32_t queue_capacity = 64;
    // Used when a request has none, larger request timeouts are clamped to it
    std::chrono::milliseconds default_timeout{30'000};
    uint32_t max_code_bytes = uint32_t{64} << 10;
    // Delay before respawning a position whose worker failed to start, doubled upon each
    // consecutive failure
    std::chrono::milliseconds respawn_backoff_min{1000};
    std::chrono::milliseconds respawn_backoff_max{60'000};

    static PoolConfig from(const DaemonConfig& config);
};

struct StartReport {
    uint32_t healthy = 0;
    uint32_t failed = 0;
    std::vector<std::string> errors;
};

struct WorkerSnapshot {
    WorkerId id;
    WorkerState state;
    pid_t pid;
    uint64_t executions;
    std::optional<CorrelationId> job;
};

/**
 * @brief Owns the workers and assigns jobs to them, at most one job per worker.
 * @details All pool state lives behind one mutex. Three threads serve the pool: the event
 *   thread (control channels and process exits), the deadline monitor and the spawner that
 *   refills terminated positions.
 */
class PoolManager {
    struct Job {
        CorrelationId correlation_id;
        uint32_t slot;
        std::chrono::milliseconds timeout;
        std::promise<ExecutionResult> promise;
        // Set while the job runs
        uint32_t position = 0;
        std::chrono::steady_clock::time_point dispatched_at{};
        std::chrono::steady_clock::time_point deadline{};
        uint64_t denials_at_start = 0;
        std::optional<uint64_t> oom_kills_at_start;
        bool cancelled = false;
        // Decided before the worker exits: the job resolves with it once the exit is confirmed
        std::optional<ExecutionStatus> forced_status;
        std::string forced_message;
    };

    struct SpawnRequest {
        uint32_t position;
        std::chrono::steady_clock::time_point not_before;
    };

    // Released after unlocking the mutex
    struct Graveyard {
        std::vector<std::unique_ptr<cgroups::WorkerCgroup>> cgroups;
        std::vector<FileDescriptor> fds;
    };

    const PoolConfig config_;
    WorkerLauncher& launcher_;
    arena::ResultArena& arena_;
    supervisor::SyscallSupervisor* supervisor_;
    const std::chrono::steady_clock::time_point created_at_ = std::chrono::steady_clock::now();

    std::mutex mtx_;
    std::vector<Worker> workers_;
    std::deque<uint32_t> idle_; // positions
    std::map<CorrelationId, Job> busy_;
    std::deque<Job> pending_;
    std::unordered_set<CorrelationId> in_flight_;
    std::deque<SpawnRequest> spawn_queue_;
    std::vector<std::chrono::milliseconds> spawn_backoff_;
    bool started_ = false;
    bool stopping_ = false;
    bool shut_down_ = false;

    uint64_t executions_ = 0;
    uint64_t crashed_ = 0;
    uint64_t recycled_ = 0;
    uint64_t timed_out_ = 0;
    uint64_t rejected_ = 0;
    uint64_t failed_spawns_ = 0;

    FileDescriptor epoll_fd_;
    FileDescriptor stop_fd_;
    std::condition_variable deadline_cv_;
    std::condition_variable spawner_cv_;
    std::thread event_thread_;
    std::thread deadline_thread_;
    std::thread spawner_thread_;

    [[nodiscard]] static ExecutionResult
    rejected_result(CorrelationId correlation_id, std::string message);

    // Launches the worker at @p position, returns an error description upon failure
    std::optional<std::string> spawn(uint32_t position);

    void install_locked(uint32_t position, LaunchedWorker&& launched);

    void make_idle_locked(uint32_t position);

    // Pairs idle workers with pending jobs in FIFO order
    void dispatch_pending_locked();

    // If the job cannot be sent, it goes back to the front of the pending queue
    void dispatch_locked(uint32_t position, Job&& job);

    void kill_worker_locked(Worker& worker) noexcept;

    // Kills the worker, its job (if any) resolves with @p status once the worker is gone
    void fail_worker_locked(Worker& worker, ExecutionStatus status, std::string message);

    void handle_control_message_locked(Worker& worker);

    void handle_job_done_locked(Worker& worker, const worker_protocol::JobDone& done);

    void handle_exit_locked(Worker& worker, const siginfo_t& si, Graveyard& graveyard);

    void schedule_spawn_locked(uint32_t position, std::chrono::milliseconds delay);

    [[nodiscard]] Worker* find_worker_locked(WorkerId id) noexcept;

    void fill_job_stats_locked(const Worker& worker, const Job& job, ExecutionResult& res) const;

    void run_events();
    void run_deadline_monitor();
    void run_spawner();

public:
    // @p supervisor may be null if the launched workers have no seccomp listeners. Throws
    // ConfigError if @p arena has fewer slots than pool_size + queue_capacity.
    PoolManager(
        PoolConfig config, WorkerLauncher& launcher, arena::ResultArena& arena,
        supervisor::SyscallSupervisor* supervisor
    );

    PoolManager(const PoolManager&) = delete;
    PoolManager(PoolManager&&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;
    PoolManager& operator=(PoolManager&&) = delete;

    ~PoolManager();

    /**
     * @brief Creates all workers synchronously and starts the pool threads.
     * @details Positions whose worker failed to start are retried in the background.
     */
    StartReport start();

    /**
     * @brief Queues @p request for execution.
     * @details The future is always resolved: with REJECTED at once if the request cannot be
     *   accepted (oversized code, full queue, arena exhausted, duplicate correlation id,
     *   shutdown), otherwise once the job finishes. A result with a slot must be released with
     *   ResultArena::release().
     */
    [[nodiscard]] std::future<ExecutionResult> submit(ExecutionRequest request);

    /**
     * @brief Drops a pending job (resolved as REJECTED) or makes a running job free its slot
     *   upon completion. The running job's deadline still applies.
     *
     * @return whether the job was in flight
     */
    bool cancel(CorrelationId correlation_id);

    // Called by the syscall supervisor, crashes the worker
    void report_violation(uint64_t worker_key, const std::string& reason);

    [[nodiscard]] PoolStatus status();

    [[nodiscard]] std::vector<WorkerSnapshot> workers_snapshot();

    // Rejects pending jobs, kills all workers and joins the threads. Idempotent.
    void shutdown();
};

} // namespace sandpool
