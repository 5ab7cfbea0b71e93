// Runs the real worker under full isolation. Needs unprivileged user namespaces, Landlock and a
// delegated cgroup named by SANDPOOL_TEST_CGROUP_ROOT, the tests skip themselves otherwise.
#include "gtest_with_tester.hh"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <future>
#include <gmock/gmock.h>
#include <optional>
#include <sandpool/errors.hh>
#include <sandpool/isolation/cgroups.hh>
#include <sandpool/isolation/landlock.hh>
#include <sandpool/isolation/profile_builder.hh>
#include <sandpool/isolation/worker_filter.hh>
#include <sandpool/pool/pool_manager.hh>
#include <sandpool/supervisor/policy.hh>
#include <sandpool/supervisor/syscall_supervisor.hh>
#include <sandpool/transport/result_arena.hh>
#include <sched.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

using sandpool::ExecutionResult;
using sandpool::ExecutionStatus;
using sandpool::SandboxConfig;
using std::chrono::milliseconds;
using testing::HasSubstr;

namespace {

bool unprivileged_userns_available() {
    pid_t pid = fork();
    if (pid < 0) {
        return false;
    }
    if (pid == 0) {
        _exit(unshare(CLONE_NEWUSER) == 0 ? 0 : 1);
    }
    int status = 0;
    if (waitpid(pid, &status, 0) != pid) {
        return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

bool exists(const std::string& path) { return access(path.c_str(), F_OK) == 0; }

class IsolationTest : public testing::Test {
protected:
    std::string cgroup_root;
    std::optional<sandpool::cgroups::CgroupTree> cgroup_tree;
    std::unique_ptr<sandpool::supervisor::SyscallSupervisor> supervisor;
    std::unique_ptr<sandpool::arena::ResultArena> arena;
    std::unique_ptr<sandpool::IsolationProfileBuilder> builder;
    std::unique_ptr<sandpool::PoolManager> pool;

    void SetUp() override {
        const char* root = getenv("SANDPOOL_TEST_CGROUP_ROOT");
        if (!root || !*root) {
            GTEST_SKIP() << "SANDPOOL_TEST_CGROUP_ROOT is not set";
        }
        cgroup_root = root;
        if (!unprivileged_userns_available()) {
            GTEST_SKIP() << "unprivileged user namespaces are unavailable";
        }
        if (sandpool::landlock::abi_version() == 0) {
            GTEST_SKIP() << "Landlock is unavailable";
        }
        if (!exists("/bin/sh")) {
            GTEST_SKIP() << "/bin/sh is missing";
        }
        try {
            cgroup_tree.emplace(sandpool::cgroups::CgroupTree::prepare(cgroup_root));
        } catch (const sandpool::SetupFailure& e) {
            GTEST_SKIP() << "cgroup delegation is unavailable: " << e.what();
        }
    }

    static SandboxConfig sandbox_config() {
        SandboxConfig sandbox;
        sandbox.timeout = milliseconds{5000};
        sandbox.max_output_bytes = 4096;
        sandbox.max_code_bytes = 4096;
        auto& paths = sandbox.runtime_paths;
        paths.erase(
            std::remove_if(
                paths.begin(), paths.end(), [](const std::string& path) { return !exists(path); }
            ),
            paths.end()
        );
        return sandbox;
    }

    void start(const SandboxConfig& sandbox, uint32_t pool_size = 1) {
        supervisor = std::make_unique<sandpool::supervisor::SyscallSupervisor>(
            sandpool::supervisor::PolicyTable::from_config(sandbox)
        );
        arena = std::make_unique<sandpool::arena::ResultArena>(
            pool_size + 4,
            sandpool::arena::SlotLayout{
                .request_capacity = sandbox.max_code_bytes,
                .output_capacity = sandbox.max_output_bytes,
            }
        );
        builder = std::make_unique<sandpool::IsolationProfileBuilder>(
            *cgroup_tree,
            sandbox,
            sandpool::seccomp::build_worker_filter(sandbox),
            std::string{tester_executable_path},
            milliseconds{10'000}
        );
        pool = std::make_unique<sandpool::PoolManager>(
            sandpool::PoolConfig{
                .pool_size = pool_size,
                .recycle_after = 100,
                .queue_capacity = 4,
                .default_timeout = sandbox.timeout,
                .max_code_bytes = sandbox.max_code_bytes,
                .respawn_backoff_min = milliseconds{100},
                .respawn_backoff_max = milliseconds{1000},
            },
            *builder,
            *arena,
            supervisor.get()
        );
        auto* pool_ptr = pool.get();
        supervisor->set_violation_handler([pool_ptr](uint64_t key, const std::string& reason) {
            pool_ptr->report_violation(key, reason);
        });
        supervisor->start();

        auto report = pool->start();
        ASSERT_EQ(report.healthy, pool_size) << testing::PrintToString(report.errors);
    }

    ExecutionResult run(std::string code, std::optional<milliseconds> timeout = std::nullopt) {
        static sandpool::CorrelationId next_correlation_id = 1;
        auto future = pool->submit({
            .correlation_id = next_correlation_id++,
            .code = std::move(code),
            .timeout = timeout,
        });
        EXPECT_EQ(future.wait_for(std::chrono::seconds{30}), std::future_status::ready);
        return future.get();
    }

    // Returns stdout of the job and releases its slot
    std::string take_stdout(const ExecutionResult& res) {
        if (!res.slot) {
            return "";
        }
        std::string out{arena->stdout_data(*res.slot)};
        EXPECT_TRUE(arena->release(*res.slot, res.correlation_id));
        return out;
    }

    void TearDown() override {
        if (pool) {
            pool->shutdown();
        }
        if (supervisor) {
            supervisor->stop();
        }
    }
};

} // namespace

// NOLINTNEXTLINE
TEST_F(IsolationTest, runs_code_inside_the_sandbox) {
    start(sandbox_config());
    auto res = run("echo hello; echo oops >&2; exit 3");
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED) << res.message;
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_EQ(res.worker, "0.1");
    ASSERT_TRUE(res.slot);
    EXPECT_EQ(arena->stderr_data(*res.slot), "oops\n");
    EXPECT_EQ(take_stdout(res), "hello\n");
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, runs_as_root_of_own_user_namespace) {
    start(sandbox_config());
    auto res = run("id -u");
    ASSERT_EQ(res.status, ExecutionStatus::COMPLETED) << res.message;
    EXPECT_EQ(take_stdout(res), "0\n");
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, host_files_are_not_writable) {
    auto sandbox = sandbox_config();
    start(sandbox);
    auto res = run("echo x > /usr/sandpool-test-file");
    EXPECT_NE(res.status, ExecutionStatus::CRASHED) << res.message;
    EXPECT_NE(res.exit_code, 0);
    (void)take_stdout(res);
    EXPECT_FALSE(exists("/usr/sandpool-test-file"));

    // The work directory is writable
    res = run("echo data > /tmp/file && cat /tmp/file");
    EXPECT_EQ(res.status, ExecutionStatus::COMPLETED) << res.message;
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(take_stdout(res), "data\n");
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, host_files_outside_runtime_paths_are_not_readable) {
    start(sandbox_config());
    auto res = run("cat /etc/passwd");
    EXPECT_NE(res.status, ExecutionStatus::CRASHED) << res.message;
    EXPECT_NE(res.exit_code, 0);
    EXPECT_EQ(take_stdout(res), "");

    // The worker stays usable
    auto next = run("echo still here");
    EXPECT_EQ(next.status, ExecutionStatus::COMPLETED) << next.message;
    EXPECT_EQ(take_stdout(next), "still here\n");
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, network_attempt_is_denied_and_worker_survives) {
    if (!exists("/bin/bash")) {
        GTEST_SKIP() << "/bin/bash is missing";
    }
    auto sandbox = sandbox_config();
    sandbox.network = false;
    sandbox.supervisor_allow.clear();
    sandbox.interpreter = {"/bin/bash", "-s"};
    start(sandbox);

    auto res = run("exec 3<>/dev/tcp/127.0.0.1/9");
    EXPECT_THAT(res.status, testing::AnyOf(ExecutionStatus::DENIED, ExecutionStatus::COMPLETED));
    EXPECT_NE(res.exit_code, 0);
    EXPECT_GE(res.denied_syscalls_count, 1U);
    EXPECT_THAT(res.denied_syscalls, testing::Contains(SYS_socket));
    EXPECT_GE(supervisor->verdicts_num(), 1U);
    (void)take_stdout(res);

    // The same worker keeps serving
    auto next = run("echo alive");
    EXPECT_EQ(next.status, ExecutionStatus::COMPLETED) << next.message;
    EXPECT_EQ(next.worker, res.worker);
    EXPECT_EQ(next.denied_syscalls_count, 0U);
    EXPECT_EQ(take_stdout(next), "alive\n");
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, timeout_replaces_the_worker) {
    start(sandbox_config());
    auto res = run("sleep 30", milliseconds{300});
    EXPECT_EQ(res.status, ExecutionStatus::TIMED_OUT);
    EXPECT_THAT(res.message, HasSubstr("300 ms"));
    EXPECT_FALSE(res.slot.has_value());
    // Taken from the worker's cgroup as the worker never reported
    EXPECT_GT(res.peak_memory_bytes, 0U);

    auto next = run("echo again");
    EXPECT_EQ(next.status, ExecutionStatus::COMPLETED) << next.message;
    EXPECT_EQ(next.worker, "0.2");
    EXPECT_EQ(take_stdout(next), "again\n");
}
