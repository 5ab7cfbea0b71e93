#include <algorithm>
#include <cerrno>
#include <csignal>
#include <sandpool/concat_tostr.hh>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/logger.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/pool/pool_manager.hh>
#include <sandpool/syscalls.hh>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wp = sandpool::worker_protocol;
using std::chrono::steady_clock;

namespace {

constexpr uint64_t STOP_KEY = ~uint64_t{0};

// Positions are below 2^31 so the key never collides with STOP_KEY
uint64_t event_key(sandpool::WorkerId id, bool is_pidfd) noexcept {
    return (uint64_t{id.generation} << 32) | (uint64_t{id.position} << 1) |
        static_cast<uint64_t>(is_pidfd);
}

sandpool::WorkerId event_worker(uint64_t key) noexcept {
    return {
        .position = static_cast<uint32_t>((key & 0xffffffff) >> 1),
        .generation = static_cast<uint32_t>(key >> 32),
    };
}

std::string describe_exit(const siginfo_t& si) {
    switch (si.si_code) {
    case CLD_EXITED: return concat_tostr("exited with code ", si.si_status);
    case CLD_KILLED:
    case CLD_DUMPED: return concat_tostr("killed by signal ", si.si_status);
    default: return "terminated";
    }
}

void reap(int pidfd) noexcept {
    siginfo_t si;
    while (syscalls::waitid(P_PIDFD, pidfd, &si, WEXITED, nullptr)) {
        if (errno != EINTR) {
            errlog("waitid()", errmsg());
            return;
        }
    }
}

// Kills and reaps a worker that never joined the pool
void destroy_launched(sandpool::LaunchedWorker& launched) noexcept {
    if (!(launched.cgroup && launched.cgroup->kill()) &&
        syscalls::pidfd_send_signal(launched.pidfd, SIGKILL, nullptr, 0) && errno != ESRCH)
    {
        errlog("cannot kill worker process ", launched.pid, errmsg());
    }
    reap(launched.pidfd);
}

} // namespace

namespace sandpool {

PoolConfig PoolConfig::from(const DaemonConfig& config) {
    return {
        .pool_size = config.pool_size,
        .recycle_after = config.recycle_after,
        .queue_capacity = config.queue_capacity,
        .default_timeout = config.sandbox.timeout,
        .max_code_bytes = config.sandbox.max_code_bytes,
    };
}

PoolManager::PoolManager(
    PoolConfig config, WorkerLauncher& launcher, arena::ResultArena& arena,
    supervisor::SyscallSupervisor* supervisor
)
: config_{std::move(config)}
, launcher_{launcher}
, arena_{arena}
, supervisor_{supervisor}
, workers_(config_.pool_size)
, spawn_backoff_(config_.pool_size, config_.respawn_backoff_min)
, epoll_fd_{epoll_create1(EPOLL_CLOEXEC)}
, stop_fd_{eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)} {
    // Every running and queued job holds a slot
    if (arena_.slots_num() < uint64_t{config_.pool_size} + config_.queue_capacity) {
        THROW_AS(
            ConfigError,
            "result arena has ",
            arena_.slots_num(),
            " slots, fewer than pool_size + queue_capacity = ",
            uint64_t{config_.pool_size} + config_.queue_capacity
        );
    }
    if (!epoll_fd_.is_open()) {
        THROW("epoll_create1()", errmsg());
    }
    if (!stop_fd_.is_open()) {
        THROW("eventfd()", errmsg());
    }
    epoll_event ev = {.events = EPOLLIN, .data = {.u64 = STOP_KEY}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, stop_fd_, &ev)) {
        THROW("epoll_ctl()", errmsg());
    }
    for (uint32_t pos = 0; pos < workers_.size(); ++pos) {
        workers_[pos].id = {.position = pos, .generation = 0};
    }
}

PoolManager::~PoolManager() { shutdown(); }

ExecutionResult PoolManager::rejected_result(CorrelationId correlation_id, std::string message) {
    ExecutionResult res{.correlation_id = correlation_id, .status = ExecutionStatus::REJECTED};
    res.message = std::move(message);
    return res;
}

Worker* PoolManager::find_worker_locked(WorkerId id) noexcept {
    if (id.position >= workers_.size() || workers_[id.position].id != id) {
        return nullptr;
    }
    return &workers_[id.position];
}

StartReport PoolManager::start() {
    {
        std::lock_guard lock{mtx_};
        if (started_) {
            THROW("pool is already started");
        }
        started_ = true;
    }

    StartReport report;
    for (uint32_t pos = 0; pos < config_.pool_size; ++pos) {
        auto error = spawn(pos);
        if (error) {
            ++report.failed;
            report.errors.emplace_back(concat_tostr("worker ", pos, ": ", *error));
            std::lock_guard lock{mtx_};
            schedule_spawn_locked(pos, config_.respawn_backoff_min);
        } else {
            ++report.healthy;
        }
    }

    event_thread_ = std::thread{[this] { run_events(); }};
    deadline_thread_ = std::thread{[this] { run_deadline_monitor(); }};
    spawner_thread_ = std::thread{[this] { run_spawner(); }};
    return report;
}

std::optional<std::string> PoolManager::spawn(uint32_t position) {
    WorkerId id;
    {
        std::lock_guard lock{mtx_};
        if (stopping_) {
            return "pool is shutting down";
        }
        auto& w = workers_[position];
        ++w.id.generation;
        w.state = WorkerState::SPAWNING;
        w.pid = -1;
        w.executions = 0;
        w.job.reset();
        w.kill_sent = false;
        id = w.id;
    }

    auto res = launcher_.launch(id, [this, id](pid_t pid) {
        std::lock_guard lock{mtx_};
        if (auto* w = find_worker_locked(id)) {
            w->state = WorkerState::ISOLATING;
            w->pid = pid;
        }
    });

    std::unique_lock lock{mtx_};
    auto& w = workers_[position];
    if (auto* err = std::get_if<SetupError>(&res)) {
        ++failed_spawns_;
        w.state = WorkerState::TERMINATED;
        w.pid = -1;
        errlog("worker ", to_string(id), " setup failed: ", err->description);
        return std::move(err->description);
    }

    auto& launched = std::get<LaunchedWorker>(res);
    if (stopping_) {
        w.state = WorkerState::TERMINATED;
        w.pid = -1;
        lock.unlock();
        destroy_launched(launched);
        return "pool is shutting down";
    }
    try {
        install_locked(position, std::move(launched));
    } catch (const std::exception& e) {
        ++failed_spawns_;
        return e.what();
    }
    stdlog("worker ", to_string(id), " ready (pid ", w.pid, ')');
    return std::nullopt;
}

void PoolManager::install_locked(uint32_t position, LaunchedWorker&& launched) {
    auto& w = workers_[position];
    w.pid = launched.pid;
    w.pidfd = std::move(launched.pidfd);
    w.control = std::move(launched.control);
    w.cgroup = std::move(launched.cgroup);
    w.created_at = steady_clock::now();
    w.executions = 0;
    w.job.reset();
    w.kill_sent = false;
    w.state = WorkerState::ISOLATING;

    epoll_event ev = {.events = EPOLLIN, .data = {.u64 = event_key(w.id, true)}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, w.pidfd, &ev)) {
        auto err = errmsg();
        kill_worker_locked(w);
        reap(w.pidfd);
        w.state = WorkerState::TERMINATED;
        w.pid = -1;
        w.pidfd.reset(-1);
        w.control.reset(-1);
        w.cgroup.reset();
        THROW("epoll_ctl(EPOLL_CTL_ADD)", err);
    }

    // From now on the worker's exit is noticed by the event thread
    try {
        ev = {.events = EPOLLIN, .data = {.u64 = event_key(w.id, false)}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, w.control, &ev)) {
            THROW("epoll_ctl(EPOLL_CTL_ADD)", errmsg());
        }
        if (launched.notify_listener.is_open()) {
            if (!supervisor_) {
                THROW("worker has a notification listener but there is no syscall supervisor");
            }
            w.denials = supervisor_->register_worker(
                w.id.key(), to_string(w.id), std::move(launched.notify_listener)
            );
        } else {
            w.denials = std::make_shared<supervisor::DenialLog>();
        }
    } catch (const std::exception& e) {
        fail_worker_locked(w, ExecutionStatus::CRASHED, e.what());
        return;
    }
    make_idle_locked(position);
}

void PoolManager::make_idle_locked(uint32_t position) {
    workers_[position].state = WorkerState::IDLE;
    idle_.push_back(position);
    dispatch_pending_locked();
}

void PoolManager::dispatch_pending_locked() {
    while (!idle_.empty() && !pending_.empty()) {
        auto position = idle_.front();
        idle_.pop_front();
        auto job = std::move(pending_.front());
        pending_.pop_front();
        dispatch_locked(position, std::move(job));
    }
}

void PoolManager::dispatch_locked(uint32_t position, Job&& job) {
    auto& w = workers_[position];
    auto now = steady_clock::now();
    job.position = position;
    job.dispatched_at = now;
    job.deadline = now + job.timeout;
    job.denials_at_start = w.denials->count();
    job.oom_kills_at_start = std::nullopt;
    if (w.cgroup) {
        try {
            job.oom_kills_at_start = w.cgroup->oom_kill_count();
        } catch (const std::exception& e) {
            errlog("worker ", to_string(w.id), ": cannot read memory.events: ", e.what());
        }
    }

    int slot_fd = arena_.fd(job.slot);
    try {
        wp::send_message(
            w.control,
            wp::serialize(wp::Job{.correlation_id = job.correlation_id, .slot = job.slot}),
            MSG_DONTWAIT,
            &slot_fd,
            1
        );
    } catch (const std::exception& e) {
        pending_.push_front(std::move(job));
        fail_worker_locked(
            w, ExecutionStatus::CRASHED, concat_tostr("cannot send the job: ", e.what())
        );
        return;
    }

    w.state = WorkerState::BUSY;
    w.job = job.correlation_id;
    auto correlation_id = job.correlation_id;
    busy_.emplace(correlation_id, std::move(job));
    deadline_cv_.notify_one();
}

void PoolManager::kill_worker_locked(Worker& worker) noexcept {
    auto it = std::find(idle_.begin(), idle_.end(), worker.id.position);
    if (it != idle_.end()) {
        idle_.erase(it);
    }
    if (worker.kill_sent || !worker.pidfd.is_open()) {
        return;
    }
    worker.kill_sent = true;
    if (supervisor_) {
        supervisor_->unregister_worker(worker.id.key());
    }
    if (worker.control.is_open()) {
        (void)epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, worker.control, nullptr);
    }
    if (worker.cgroup && worker.cgroup->kill()) {
        return;
    }
    if (syscalls::pidfd_send_signal(worker.pidfd, SIGKILL, nullptr, 0) && errno != ESRCH) {
        errlog("worker ", worker.id.position, ": pidfd_send_signal()", errmsg());
    }
}

void PoolManager::fail_worker_locked(Worker& worker, ExecutionStatus status, std::string message) {
    if (worker.kill_sent) {
        return;
    }
    if (worker.job) {
        auto it = busy_.find(*worker.job);
        if (it != busy_.end() && !it->second.forced_status) {
            it->second.forced_status = status;
            it->second.forced_message = message;
        }
    }
    if (status == ExecutionStatus::TIMED_OUT) {
        stdlog("worker ", to_string(worker.id), " killed: ", message);
    } else {
        errlog("worker ", to_string(worker.id), " killed: ", message);
    }
    if (worker.state != WorkerState::RECYCLING) {
        worker.state = WorkerState::CRASHED;
    }
    kill_worker_locked(worker);
}

void PoolManager::handle_control_message_locked(Worker& worker) {
    std::optional<wp::Message> msg;
    try {
        msg = wp::recv_message(worker.control, MSG_DONTWAIT);
    } catch (const std::exception& e) {
        fail_worker_locked(
            worker, ExecutionStatus::CRASHED, concat_tostr("control channel: ", e.what())
        );
        return;
    }
    if (!msg) {
        fail_worker_locked(worker, ExecutionStatus::CRASHED, "worker closed its control channel");
        return;
    }
    if (msg->kind != wp::MessageKind::JOB_DONE || !msg->fds.empty()) {
        fail_worker_locked(
            worker,
            ExecutionStatus::CRASHED,
            concat_tostr("unexpected message from the worker: ", wp::to_str(msg->kind))
        );
        return;
    }
    wp::JobDone done;
    try {
        done = wp::deserialize_job_done(msg->body.data(), msg->body.size());
    } catch (const ProtocolError& e) {
        fail_worker_locked(worker, ExecutionStatus::CRASHED, e.what());
        return;
    }
    handle_job_done_locked(worker, done);
}

void PoolManager::fill_job_stats_locked(
    const Worker& worker, const Job& job, ExecutionResult& res
) const {
    res.worker = to_string(worker.id);
    if (worker.denials) {
        res.denied_syscalls_count = worker.denials->count() - job.denials_at_start;
        res.denied_syscalls = worker.denials->recent(res.denied_syscalls_count);
    }
    if (worker.cgroup && job.oom_kills_at_start) {
        try {
            auto oom_kills = worker.cgroup->oom_kill_count();
            res.oom_killed = oom_kills && *oom_kills > *job.oom_kills_at_start;
        } catch (const std::exception& e) {
            errlog("worker ", res.worker, ": cannot read memory.events: ", e.what());
        }
    }
}

void PoolManager::handle_job_done_locked(Worker& worker, const wp::JobDone& done) {
    if (!worker.job || *worker.job != done.correlation_id) {
        fail_worker_locked(
            worker,
            ExecutionStatus::CRASHED,
            concat_tostr("JobDone for job ", done.correlation_id, " the worker does not run")
        );
        return;
    }
    auto it = busy_.find(done.correlation_id);
    auto& job = it->second;
    if (job.forced_status) {
        return; // the job resolves once the worker is gone
    }
    if (!arena_.is_written_by(job.slot, job.correlation_id)) {
        fail_worker_locked(
            worker, ExecutionStatus::CRASHED, "worker reported completion of an unwritten slot"
        );
        return;
    }

    ExecutionResult res{.correlation_id = job.correlation_id, .status = ExecutionStatus::COMPLETED};
    res.exit_code = done.exited ? done.exit_code : -1;
    res.signal = done.exited ? 0 : done.signal;
    res.duration = done.duration;
    res.cpu_time = done.cpu_time;
    res.peak_memory_bytes = done.peak_memory_bytes;
    fill_job_stats_locked(worker, job, res);
    bool failed = !done.exited || done.exit_code != 0;
    if (failed && res.denied_syscalls_count > 0) {
        res.status = ExecutionStatus::DENIED;
    }
    if (job.cancelled) {
        (void)arena_.release(job.slot, job.correlation_id);
    } else {
        auto outputs = arena_.outputs(job.slot);
        res.slot = job.slot;
        res.stdout_ref = outputs.stdout_ref;
        res.stderr_ref = outputs.stderr_ref;
    }

    job.promise.set_value(std::move(res));
    in_flight_.erase(job.correlation_id);
    busy_.erase(it);
    worker.job.reset();
    ++executions_;
    ++worker.executions;

    if (worker.executions >= config_.recycle_after) {
        stdlog("worker ", to_string(worker.id), " recycled after ", worker.executions, " executions");
        worker.state = WorkerState::RECYCLING;
        kill_worker_locked(worker);
        return;
    }
    make_idle_locked(worker.id.position);
}

void PoolManager::handle_exit_locked(Worker& worker, const siginfo_t& si, Graveyard& graveyard) {
    (void)epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, worker.pidfd, nullptr);
    if (!worker.kill_sent) {
        kill_worker_locked(worker); // cleans up the registrations, the process is already gone
    }
    auto exit_description = describe_exit(si);

    bool timed_out = false;
    if (worker.job) {
        auto it = busy_.find(*worker.job);
        auto& job = it->second;
        ExecutionResult res{
            .correlation_id = job.correlation_id,
            .status = job.forced_status.value_or(ExecutionStatus::CRASHED),
        };
        res.message = job.forced_status
            ? job.forced_message
            : concat_tostr("worker ", exit_description, " during the execution");
        res.duration = std::chrono::duration_cast<std::chrono::microseconds>(
            steady_clock::now() - job.dispatched_at
        );
        fill_job_stats_locked(worker, job, res);
        if (worker.cgroup) {
            // No JobDone, the peak of the worker's whole life is the best bound available
            try {
                res.peak_memory_bytes = worker.cgroup->memory_peak().value_or(0);
            } catch (const std::exception& e) {
                errlog("worker ", res.worker, ": cannot read memory.peak: ", e.what());
            }
        }
        if (res.status == ExecutionStatus::TIMED_OUT) {
            timed_out = true;
            ++timed_out_;
        }
        // Nobody can write to the slot any more
        arena_.reclaim(job.slot);

        job.promise.set_value(std::move(res));
        in_flight_.erase(job.correlation_id);
        busy_.erase(it);
        worker.job.reset();
    }

    if (worker.state == WorkerState::RECYCLING) {
        ++recycled_;
    } else if (!timed_out && !stopping_) {
        ++crashed_;
        errlog("worker ", to_string(worker.id), ' ', exit_description);
    }

    worker.state = WorkerState::TERMINATED;
    worker.pid = -1;
    worker.denials.reset();
    graveyard.fds.emplace_back(std::move(worker.pidfd));
    graveyard.fds.emplace_back(std::move(worker.control));
    graveyard.cgroups.emplace_back(std::move(worker.cgroup));
    if (!stopping_) {
        schedule_spawn_locked(worker.id.position, std::chrono::milliseconds{0});
    }
}

void PoolManager::schedule_spawn_locked(uint32_t position, std::chrono::milliseconds delay) {
    spawn_queue_.push_back({.position = position, .not_before = steady_clock::now() + delay});
    spawner_cv_.notify_one();
}

void PoolManager::run_events() {
    epoll_event events[64];
    for (;;) {
        int events_num = epoll_wait(epoll_fd_, events, static_cast<int>(std::size(events)), -1);
        if (events_num < 0) {
            if (errno == EINTR) {
                continue;
            }
            errlog("pool: epoll_wait()", errmsg());
            return;
        }

        Graveyard graveyard;
        std::lock_guard lock{mtx_};
        for (int i = 0; i < events_num; ++i) {
            uint64_t key = events[i].data.u64;
            if (key == STOP_KEY) {
                return;
            }
            auto* worker = find_worker_locked(event_worker(key));
            if (!worker || !worker->pidfd.is_open()) {
                continue; // stale event
            }
            if ((key & 1) == 0) {
                if (!worker->kill_sent) {
                    handle_control_message_locked(*worker);
                }
                continue;
            }

            siginfo_t si = {};
            if (syscalls::waitid(P_PIDFD, worker->pidfd, &si, WEXITED | WNOHANG, nullptr)) {
                errlog("worker ", to_string(worker->id), ": waitid()", errmsg());
                if (errno != ECHILD) {
                    continue;
                }
            } else if (si.si_pid == 0) {
                continue; // not exited yet
            }
            handle_exit_locked(*worker, si, graveyard);
        }
    }
}

void PoolManager::run_deadline_monitor() {
    std::unique_lock lock{mtx_};
    while (!stopping_) {
        auto now = steady_clock::now();
        std::optional<steady_clock::time_point> next_deadline;
        for (auto& [correlation_id, job] : busy_) {
            if (job.forced_status) {
                continue;
            }
            if (job.deadline <= now) {
                fail_worker_locked(
                    workers_[job.position],
                    ExecutionStatus::TIMED_OUT,
                    concat_tostr(
                        "job ", correlation_id, " exceeded the timeout of ", job.timeout.count(), " ms"
                    )
                );
            } else if (!next_deadline || job.deadline < *next_deadline) {
                next_deadline = job.deadline;
            }
        }
        if (next_deadline) {
            deadline_cv_.wait_until(lock, *next_deadline);
        } else {
            deadline_cv_.wait(lock);
        }
    }
}

void PoolManager::run_spawner() {
    std::unique_lock lock{mtx_};
    while (!stopping_) {
        if (spawn_queue_.empty()) {
            spawner_cv_.wait(lock);
            continue;
        }
        auto earliest = std::min_element(
            spawn_queue_.begin(),
            spawn_queue_.end(),
            [](const SpawnRequest& a, const SpawnRequest& b) { return a.not_before < b.not_before; }
        );
        if (earliest->not_before > steady_clock::now()) {
            spawner_cv_.wait_until(lock, earliest->not_before);
            continue;
        }
        auto position = earliest->position;
        spawn_queue_.erase(earliest);

        lock.unlock();
        auto error = spawn(position);
        lock.lock();
        if (!error) {
            spawn_backoff_[position] = config_.respawn_backoff_min;
            continue;
        }
        if (stopping_) {
            return;
        }
        auto& backoff = spawn_backoff_[position];
        errlog(
            "worker ", position, ": spawn failed, retrying in ", backoff.count(), " ms: ", *error
        );
        schedule_spawn_locked(position, backoff);
        backoff = std::min(backoff * 2, config_.respawn_backoff_max);
    }
}

std::future<ExecutionResult> PoolManager::submit(ExecutionRequest request) {
    auto correlation_id = request.correlation_id;
    std::promise<ExecutionResult> promise;
    auto future = promise.get_future();
    auto reject = [&](std::string message) {
        std::lock_guard lock{mtx_};
        ++rejected_;
        promise.set_value(rejected_result(correlation_id, std::move(message)));
        return std::move(future);
    };

    if (request.code.size() > config_.max_code_bytes) {
        return reject(concat_tostr(
            "code has ", request.code.size(), " bytes, the limit is ", config_.max_code_bytes
        ));
    }
    auto timeout = request.timeout ? std::min(*request.timeout, config_.default_timeout)
                                   : config_.default_timeout;
    if (timeout.count() <= 0) {
        return reject("timeout has to be positive");
    }
    std::lock_guard lock{mtx_};
    const char* rejection = nullptr;
    if (stopping_) {
        rejection = "pool is shutting down";
    } else if (idle_.empty() && pending_.size() >= config_.queue_capacity) {
        rejection = "pool at capacity";
    } else if (in_flight_.count(correlation_id)) {
        rejection = "duplicate correlation id";
    }
    std::optional<uint32_t> slot;
    if (!rejection) {
        slot = arena_.reserve(correlation_id);
        if (!slot) {
            rejection = "result arena exhausted";
        }
    }
    if (rejection) {
        ++rejected_;
        promise.set_value(rejected_result(correlation_id, rejection));
        return future;
    }
    try {
        arena_.write_request(*slot, request.code);
    } catch (...) {
        arena_.reclaim(*slot);
        throw;
    }

    in_flight_.insert(correlation_id);
    pending_.push_back(Job{
        .correlation_id = correlation_id,
        .slot = *slot,
        .timeout = timeout,
        .promise = std::move(promise),
    });
    dispatch_pending_locked();
    return future;
}

bool PoolManager::cancel(CorrelationId correlation_id) {
    std::lock_guard lock{mtx_};
    auto pit = std::find_if(pending_.begin(), pending_.end(), [&](const Job& job) {
        return job.correlation_id == correlation_id;
    });
    if (pit != pending_.end()) {
        arena_.reclaim(pit->slot);
        ++rejected_;
        pit->promise.set_value(rejected_result(correlation_id, "cancelled"));
        in_flight_.erase(correlation_id);
        pending_.erase(pit);
        return true;
    }
    auto bit = busy_.find(correlation_id);
    if (bit != busy_.end()) {
        bit->second.cancelled = true;
        return true;
    }
    return false;
}

void PoolManager::report_violation(uint64_t worker_key, const std::string& reason) {
    std::lock_guard lock{mtx_};
    auto* worker = find_worker_locked(WorkerId::from_key(worker_key));
    if (!worker || !worker->pidfd.is_open()) {
        return;
    }
    fail_worker_locked(*worker, ExecutionStatus::CRASHED, concat_tostr("syscall supervisor: ", reason));
}

PoolStatus PoolManager::status() {
    std::lock_guard lock{mtx_};
    PoolStatus res = {
        .pool_size = config_.pool_size,
        .pending = static_cast<uint32_t>(pending_.size()),
        .recycle_after = config_.recycle_after,
        .uptime = std::chrono::duration_cast<std::chrono::seconds>(steady_clock::now() - created_at_),
        .executions = executions_,
        .crashed = crashed_,
        .recycled = recycled_,
        .timed_out = timed_out_,
        .rejected = rejected_,
        .failed_spawns = failed_spawns_,
    };
    for (const auto& w : workers_) {
        switch (w.state) {
        case WorkerState::IDLE:
            ++res.idle;
            ++res.healthy;
            break;
        case WorkerState::BUSY:
            ++res.busy;
            ++res.healthy;
            break;
        case WorkerState::SPAWNING:
        case WorkerState::ISOLATING: ++res.spawning; break;
        case WorkerState::RECYCLING:
        case WorkerState::CRASHED:
        case WorkerState::TERMINATED: break;
        }
    }
    return res;
}

std::vector<WorkerSnapshot> PoolManager::workers_snapshot() {
    std::lock_guard lock{mtx_};
    std::vector<WorkerSnapshot> res;
    res.reserve(workers_.size());
    for (const auto& w : workers_) {
        res.push_back({
            .id = w.id,
            .state = w.state,
            .pid = w.pid,
            .executions = w.executions,
            .job = w.job,
        });
    }
    return res;
}

void PoolManager::shutdown() {
    {
        std::lock_guard lock{mtx_};
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        stopping_ = true;
        for (auto& job : pending_) {
            arena_.reclaim(job.slot);
            ++rejected_;
            job.promise.set_value(rejected_result(job.correlation_id, "pool is shutting down"));
            in_flight_.erase(job.correlation_id);
        }
        pending_.clear();
        spawn_queue_.clear();
        for (auto& w : workers_) {
            if (w.pidfd.is_open()) {
                fail_worker_locked(w, ExecutionStatus::CRASHED, "pool is shutting down");
            }
        }
    }
    deadline_cv_.notify_all();
    spawner_cv_.notify_all();
    if (spawner_thread_.joinable()) {
        spawner_thread_.join();
    }
    if (deadline_thread_.joinable()) {
        deadline_thread_.join();
    }
    if (event_thread_.joinable()) {
        uint64_t one = 1;
        if (write(stop_fd_, &one, sizeof(one)) != sizeof(one)) {
            errlog("pool: cannot signal the stop event", errmsg());
        }
        event_thread_.join();
    }

    // The event thread is gone, reap what is left ourselves
    Graveyard graveyard;
    std::lock_guard lock{mtx_};
    for (auto& w : workers_) {
        if (!w.pidfd.is_open()) {
            continue;
        }
        siginfo_t si = {};
        while (syscalls::waitid(P_PIDFD, w.pidfd, &si, WEXITED, nullptr)) {
            if (errno != EINTR) {
                errlog("worker ", to_string(w.id), ": waitid()", errmsg());
                break;
            }
        }
        handle_exit_locked(w, si, graveyard);
    }
}

} // namespace sandpool
