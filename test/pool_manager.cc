#include "gtest_with_tester.hh"
#include "test_launcher.hh"
#include "throw_assert.hh"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <gmock/gmock.h>
#include <map>
#include <sandpool/errors.hh>
#include <sandpool/pool/pool_manager.hh>
#include <sandpool/supervisor/syscall_supervisor.hh>
#include <sandpool/syscalls.hh>
#include <sandpool/transport/result_arena.hh>
#include <sandpool/worker/protocol.hh>
#include <set>
#include <sys/syscall.h>
#include <tuple>
#include <thread>
#include <unistd.h>

using sandpool::ExecutionRequest;
using sandpool::ExecutionResult;
using sandpool::ExecutionStatus;
using sandpool::PoolConfig;
using sandpool::PoolManager;
using sandpool::WorkerState;
using sandpool::supervisor::PolicyTable;
using sandpool::supervisor::SyscallSupervisor;
using std::chrono::milliseconds;
using testing::HasSubstr;
namespace wp = sandpool::worker_protocol;

namespace {

constexpr sandpool::arena::SlotLayout slot_layout = {
    .request_capacity = 1024,
    .output_capacity = 64,
};

PoolConfig pool_config(uint32_t pool_size, uint32_t queue_capacity, uint64_t recycle_after = 1000) {
    return {
        .pool_size = pool_size,
        .recycle_after = recycle_after,
        .queue_capacity = queue_capacity,
        .default_timeout = milliseconds{10'000},
        .max_code_bytes = slot_layout.request_capacity,
        .respawn_backoff_min = milliseconds{20},
        .respawn_backoff_max = milliseconds{200},
    };
}

ExecutionResult await(std::future<ExecutionResult>& future) {
    throw_assert(future.wait_for(std::chrono::seconds{20}) == std::future_status::ready);
    return future.get();
}

// Waits until @p pred holds for the pool
template <class Pred>
bool eventually(Pred&& pred, milliseconds timeout = milliseconds{10'000}) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds{5});
    }
    return pred();
}

class PoolManagerTest : public testing::Test {
protected:
    TestLauncher launcher;
    sandpool::arena::ResultArena arena{32, slot_layout};
    std::unique_ptr<PoolManager> pool;
    sandpool::CorrelationId next_correlation_id = 1;

    void start_pool(const PoolConfig& config) {
        pool = std::make_unique<PoolManager>(config, launcher, arena, nullptr);
        auto report = pool->start();
        ASSERT_EQ(report.failed, 0U) << testing::PrintToString(report.errors);
        ASSERT_EQ(report.healthy, config.pool_size);
    }

    std::future<ExecutionResult>
    submit(std::string code, std::optional<milliseconds> timeout = std::nullopt) {
        return pool->submit(ExecutionRequest{
            .correlation_id = next_correlation_id++,
            .code = std::move(code),
            .timeout = timeout,
        });
    }

    // Returns stdout of the job and releases its slot
    std::string take_stdout(const ExecutionResult& res) {
        throw_assert(res.slot.has_value());
        std::string out{arena.stdout_data(*res.slot)};
        throw_assert(arena.release(*res.slot, res.correlation_id));
        return out;
    }

    ExecutionResult run(std::string code) {
        auto future = submit(std::move(code));
        return await(future);
    }

    void TearDown() override {
        if (pool) {
            pool->shutdown();
        }
    }
};

} // namespace

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, all_workers_are_idle_after_start) {
    start_pool(pool_config(3, 4));
    auto status = pool->status();
    EXPECT_EQ(status.pool_size, 3U);
    EXPECT_EQ(status.healthy, 3U);
    EXPECT_EQ(status.idle, 3U);
    EXPECT_EQ(status.busy, 0U);
    EXPECT_EQ(status.pending, 0U);

    std::set<pid_t> pids;
    for (const auto& w : pool->workers_snapshot()) {
        EXPECT_EQ(w.state, WorkerState::IDLE);
        EXPECT_EQ(w.executions, 0U);
        EXPECT_FALSE(w.job.has_value());
        pids.insert(w.pid);
    }
    EXPECT_EQ(pids.size(), 3U);
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, output_and_exit_code_are_captured) {
    start_pool(pool_config(1, 4));
    auto res = run("echo:hello;stderr:oops;exit:3");
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_EQ(res.signal, 0);
    EXPECT_EQ(res.worker, "0.1");
    ASSERT_TRUE(res.slot);
    EXPECT_EQ(arena.stderr_data(*res.slot), "oops");
    EXPECT_EQ(take_stdout(res), "hello");
    EXPECT_EQ(pool->status().executions, 1U);
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, oversized_output_is_truncated) {
    start_pool(pool_config(1, 4));
    auto res = run("big:100");
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED);
    EXPECT_TRUE(res.stdout_ref.truncated);
    EXPECT_FALSE(res.stderr_ref.truncated);
    EXPECT_EQ(take_stdout(res), std::string(slot_layout.output_capacity, 'x'));
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, at_most_one_job_per_worker) {
    start_pool(pool_config(2, 16));
    std::vector<std::future<ExecutionResult>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.emplace_back(submit("sleep:20;stamp"));
        auto status = pool->status();
        EXPECT_LE(status.busy, 2U);
    }

    // Executions on one worker are consecutive: every worker reports 0, 1, 2, ...
    std::map<std::string, std::vector<uint64_t>> stamps;
    for (auto& future : futures) {
        auto res = await(future);
        ASSERT_EQ(res.status, ExecutionStatus::COMPLETED) << res.message;
        auto stamp = take_stdout(res);
        auto colon = stamp.find(':');
        ASSERT_NE(colon, std::string::npos);
        stamps[stamp.substr(0, colon)].push_back(std::stoull(stamp.substr(colon + 1)));
    }
    EXPECT_LE(stamps.size(), 2U);
    for (auto& [pid, counts] : stamps) {
        std::sort(counts.begin(), counts.end());
        for (size_t i = 0; i < counts.size(); ++i) {
            EXPECT_EQ(counts[i], i) << "worker " << pid;
        }
    }
    EXPECT_EQ(arena.free_slots_num(), arena.slots_num());
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, worker_is_recycled_after_the_threshold) {
    start_pool(pool_config(1, 4, 2));
    auto first = run("stamp");
    auto second = run("stamp");
    auto third = run("stamp");
    EXPECT_EQ(first.worker, "0.1");
    EXPECT_EQ(second.worker, "0.1");
    EXPECT_EQ(third.worker, "0.2");

    auto first_stamp = take_stdout(first);
    auto second_stamp = take_stdout(second);
    auto third_stamp = take_stdout(third);
    auto pid_of = [](const std::string& stamp) { return stamp.substr(0, stamp.find(':')); };
    EXPECT_EQ(pid_of(first_stamp), pid_of(second_stamp));
    EXPECT_NE(pid_of(second_stamp), pid_of(third_stamp));
    // The replacement starts counting from zero
    EXPECT_THAT(third_stamp, testing::EndsWith(":0"));

    auto status = pool->status();
    EXPECT_EQ(status.recycled, 1U);
    EXPECT_EQ(status.crashed, 0U);
    EXPECT_EQ(status.executions, 3U);
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, timeout_kills_the_worker) {
    start_pool(pool_config(1, 4));
    auto start = std::chrono::steady_clock::now();
    auto future = submit("sleep:60000", milliseconds{200});
    auto res = await(future);
    EXPECT_EQ(res.status, ExecutionStatus::TIMED_OUT);
    EXPECT_THAT(res.message, HasSubstr("exceeded the timeout of 200 ms"));
    EXPECT_FALSE(res.slot.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{10});

    // The worker never stays busy and a replacement serves the next job
    ASSERT_TRUE(eventually([&] { return pool->status().idle == 1; }));
    auto next = run("echo:alive");
    EXPECT_EQ(next.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(next.worker, "0.2");
    EXPECT_EQ(take_stdout(next), "alive");

    auto status = pool->status();
    EXPECT_EQ(status.timed_out, 1U);
    EXPECT_EQ(status.crashed, 0U);
    EXPECT_EQ(arena.free_slots_num(), arena.slots_num());
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, request_timeout_is_clamped_to_the_default) {
    auto config = pool_config(1, 4);
    config.default_timeout = milliseconds{150};
    start_pool(config);
    auto future = submit("sleep:60000", milliseconds{100'000});
    auto res = await(future);
    EXPECT_EQ(res.status, ExecutionStatus::TIMED_OUT);
    EXPECT_THAT(res.message, HasSubstr("150 ms"));
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, crash_is_reported_and_worker_replaced) {
    start_pool(pool_config(1, 4));
    auto res = run("echo:partial;crash");
    EXPECT_EQ(res.status, ExecutionStatus::CRASHED);
    EXPECT_FALSE(res.slot.has_value());
    EXPECT_FALSE(res.message.empty());

    auto next = run("echo:ok");
    EXPECT_EQ(next.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(take_stdout(next), "ok");
    EXPECT_TRUE(eventually([&] { return pool->status().crashed == 1; }));
    EXPECT_EQ(arena.free_slots_num(), arena.slots_num());
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, excess_submissions_are_rejected_and_queue_is_fifo) {
    constexpr uint32_t pool_size = 1;
    constexpr uint32_t queue_capacity = 2;
    start_pool(pool_config(pool_size, queue_capacity));

    std::vector<std::future<ExecutionResult>> futures;
    futures.emplace_back(submit("sleep:300;stamp"));
    for (int i = 0; i < 4; ++i) {
        futures.emplace_back(submit("stamp"));
    }

    std::vector<ExecutionResult> results;
    for (auto& future : futures) {
        results.emplace_back(await(future));
    }
    size_t accepted = 0;
    std::vector<std::string> stamps;
    for (auto& res : results) {
        if (res.status == ExecutionStatus::REJECTED) {
            EXPECT_EQ(res.message, "pool at capacity");
            EXPECT_FALSE(res.slot.has_value());
            continue;
        }
        ++accepted;
        EXPECT_EQ(res.status, ExecutionStatus::COMPLETED);
        stamps.emplace_back(take_stdout(res));
    }
    EXPECT_EQ(accepted, pool_size + queue_capacity);
    EXPECT_EQ(results[3].status, ExecutionStatus::REJECTED);
    EXPECT_EQ(results[4].status, ExecutionStatus::REJECTED);

    // Queued jobs were served in submission order
    ASSERT_EQ(stamps.size(), 3U);
    EXPECT_THAT(stamps[0], testing::EndsWith(":0"));
    EXPECT_THAT(stamps[1], testing::EndsWith(":1"));
    EXPECT_THAT(stamps[2], testing::EndsWith(":2"));
    EXPECT_EQ(pool->status().rejected, 2U);
    EXPECT_EQ(arena.free_slots_num(), arena.slots_num());
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, arena_sized_for_pool_and_queue_accepts_every_queued_job) {
    constexpr uint32_t pool_size = 2;
    constexpr uint32_t queue_capacity = 10;
    constexpr uint32_t excess = 3;
    sandpool::arena::ResultArena exact_arena{pool_size + queue_capacity, slot_layout};
    PoolManager exact_pool{pool_config(pool_size, queue_capacity), launcher, exact_arena, nullptr};
    auto report = exact_pool.start();
    ASSERT_EQ(report.healthy, pool_size) << testing::PrintToString(report.errors);

    std::vector<std::future<ExecutionResult>> futures;
    for (uint32_t i = 0; i < pool_size + queue_capacity + excess; ++i) {
        futures.emplace_back(exact_pool.submit({.correlation_id = 100 + i, .code = "sleep:100"}));
    }
    uint32_t completed = 0;
    uint32_t rejected = 0;
    for (auto& future : futures) {
        auto res = await(future);
        if (res.status == ExecutionStatus::REJECTED) {
            ++rejected;
            EXPECT_EQ(res.message, "pool at capacity");
            continue;
        }
        EXPECT_EQ(res.status, ExecutionStatus::COMPLETED) << res.message;
        ++completed;
        ASSERT_TRUE(res.slot);
        EXPECT_TRUE(exact_arena.release(*res.slot, res.correlation_id));
    }
    EXPECT_EQ(completed, pool_size + queue_capacity);
    EXPECT_EQ(rejected, excess);
    exact_pool.shutdown();
    EXPECT_EQ(exact_arena.free_slots_num(), exact_arena.slots_num());
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, arena_smaller_than_pool_and_queue_is_refused) {
    // 32 slots cannot hold 1 running and 40 queued jobs
    EXPECT_THROW(
        PoolManager(pool_config(1, 40), launcher, arena, nullptr), sandpool::ConfigError
    );
    EXPECT_EQ(launcher.launches, 0);
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, invalid_requests_are_rejected) {
    start_pool(pool_config(1, 4));
    auto res = run(std::string(slot_layout.request_capacity + 1, 'a'));
    EXPECT_EQ(res.status, ExecutionStatus::REJECTED);
    EXPECT_THAT(res.message, HasSubstr("the limit is"));

    auto future = submit("echo:x", milliseconds{0});
    res = await(future);
    EXPECT_EQ(res.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(res.message, "timeout has to be positive");

    auto running = pool->submit({.correlation_id = 1000, .code = "sleep:200"});
    auto duplicate = pool->submit({.correlation_id = 1000, .code = "echo:x"});
    res = await(duplicate);
    EXPECT_EQ(res.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(res.message, "duplicate correlation id");
    res = await(running);
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED);
    (void)take_stdout(res);
    EXPECT_EQ(arena.free_slots_num(), arena.slots_num());
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, cancel) {
    start_pool(pool_config(1, 4));
    auto running = pool->submit({.correlation_id = 1, .code = "sleep:200;echo:x"});
    auto pending = pool->submit({.correlation_id = 2, .code = "echo:y"});

    EXPECT_TRUE(pool->cancel(2));
    auto res = await(pending);
    EXPECT_EQ(res.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(res.message, "cancelled");

    EXPECT_TRUE(pool->cancel(1));
    res = await(running);
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED);
    EXPECT_FALSE(res.slot.has_value()); // freed on completion

    EXPECT_FALSE(pool->cancel(3));
    EXPECT_EQ(arena.free_slots_num(), arena.slots_num());
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, failed_spawns_are_retried) {
    launcher.failures_to_inject = 2;
    pool = std::make_unique<PoolManager>(pool_config(2, 4), launcher, arena, nullptr);
    auto report = pool->start();
    EXPECT_EQ(report.healthy, 0U);
    EXPECT_EQ(report.failed, 2U);
    ASSERT_EQ(report.errors.size(), 2U);
    EXPECT_THAT(report.errors[0], HasSubstr("injected failure"));

    ASSERT_TRUE(eventually([&] { return pool->status().healthy == 2; }));
    EXPECT_EQ(pool->status().failed_spawns, 2U);
    auto res = run("echo:late");
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(take_stdout(res), "late");
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, shutdown_resolves_everything) {
    start_pool(pool_config(1, 4));
    auto running = submit("sleep:60000");
    auto pending = submit("echo:never");
    ASSERT_TRUE(eventually([&] { return pool->status().busy == 1; }));

    pool->shutdown();
    auto res = await(pending);
    EXPECT_EQ(res.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(res.message, "pool is shutting down");
    res = await(running);
    EXPECT_EQ(res.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(res.message, "pool is shutting down");

    res = run("echo:late");
    EXPECT_EQ(res.status, ExecutionStatus::REJECTED);
    EXPECT_EQ(res.message, "pool is shutting down");
    for (const auto& w : pool->workers_snapshot()) {
        EXPECT_EQ(w.state, WorkerState::TERMINATED);
    }
    pool->shutdown(); // idempotent
    EXPECT_EQ(arena.free_slots_num(), arena.slots_num());
}

// NOLINTNEXTLINE
TEST_F(PoolManagerTest, denied_syscalls_are_recorded_per_job) {
    SyscallSupervisor supervisor{PolicyTable{}};
    launcher.with_seccomp = true;
    PoolManager filtered_pool{pool_config(1, 4), launcher, arena, &supervisor};
    supervisor.set_violation_handler([&](uint64_t worker_key, const std::string& reason) {
        filtered_pool.report_violation(worker_key, reason);
    });
    supervisor.start();
    auto report = filtered_pool.start();
    ASSERT_EQ(report.healthy, 1U) << testing::PrintToString(report.errors);
    EXPECT_EQ(supervisor.registered_workers_num(), 1U);

    auto run_filtered = [&](std::string code) {
        auto future = filtered_pool.submit(ExecutionRequest{
            .correlation_id = next_correlation_id++,
            .code = std::move(code),
        });
        auto res = await(future);
        throw_assert(res.slot.has_value());
        std::string out{arena.stdout_data(*res.slot)};
        throw_assert(arena.release(*res.slot, res.correlation_id));
        return std::pair{res, out};
    };

    // A denied syscall the job survives does not change the outcome
    auto [res, out] = run_filtered("sync;echo:ok");
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(out, "EACCESok");
    EXPECT_EQ(res.denied_syscalls_count, 1U);
    EXPECT_EQ(res.denied_syscalls, std::vector<int>{SYS_sync});
    auto worker = res.worker;

    // Counted per job, not per worker
    std::tie(res, out) = run_filtered("echo:clean");
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(res.denied_syscalls_count, 0U);
    EXPECT_TRUE(res.denied_syscalls.empty());
    EXPECT_EQ(res.worker, worker);

    // A failing job with denials is reported as denied
    std::tie(res, out) = run_filtered("sync;sync;exit:2");
    EXPECT_EQ(res.status, ExecutionStatus::DENIED);
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_EQ(res.denied_syscalls_count, 2U);
    EXPECT_EQ(res.worker, worker);

    // A failing job without denials is not
    std::tie(res, out) = run_filtered("exit:3");
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_EQ(res.denied_syscalls_count, 0U);

    filtered_pool.shutdown();
    EXPECT_EQ(supervisor.registered_workers_num(), 0U);
    supervisor.stop();
    EXPECT_EQ(arena.free_slots_num(), arena.slots_num());
}
