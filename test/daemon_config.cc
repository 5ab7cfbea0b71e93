#include <cstdlib>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sandpool/daemon_config.hh>
#include <sandpool/errors.hh>
#include <sandpool/sandbox_config.hh>
#include <string_view>

using sandpool::ConfigError;
using sandpool::DaemonConfig;
using sandpool::FsAccess;
using sandpool::FsRule;
using sandpool::load_daemon_config_from_string;
using testing::HasSubstr;

namespace {

std::string config_error_of(std::string_view config) {
    try {
        (void)load_daemon_config_from_string(config);
    } catch (const ConfigError& e) {
        return e.what();
    }
    ADD_FAILURE() << "accepted: " << config;
    return "";
}

class DaemonConfigTest : public testing::Test {
protected:
    void SetUp() override { ASSERT_EQ(unsetenv(sandpool::socket_path_env_var), 0); }
};

} // namespace

// NOLINTNEXTLINE
TEST_F(DaemonConfigTest, empty_config_gives_defaults) {
    auto config = load_daemon_config_from_string("");
    EXPECT_EQ(config.socket_path, sandpool::default_socket_path);
    EXPECT_EQ(config.pool_size, 4U);
    EXPECT_EQ(config.recycle_after, 100U);
    EXPECT_EQ(config.sandbox.timeout, std::chrono::seconds{30});
    EXPECT_FALSE(config.sandbox.network);
    EXPECT_TRUE(config.sandbox.fs_allow.empty());
    EXPECT_TRUE(config.sandbox.supervisor_allow.empty());
    EXPECT_EQ(config.effective_max_frame_bytes(), config.sandbox.max_code_bytes + 4096);
    EXPECT_EQ(config.arena_slots, 0U);
    EXPECT_EQ(config.effective_arena_slots(), 2 * (4U + 64U));
}

// NOLINTNEXTLINE
TEST_F(DaemonConfigTest, values_are_loaded) {
    auto config = load_daemon_config_from_string("socket_path: /tmp/x.sock\n"
                                                 "pool_size: 8\n"
                                                 "arena_slots: 16\n"
                                                 "recycle_after: 5\n"
                                                 "queue_capacity: 3\n"
                                                 "require_full_pool: true\n"
                                                 "timeout_ms: 250\n"
                                                 "cpu_quota: 0.5\n"
                                                 "network: on\n"
                                                 "fs_allow: [/etc:ro, /var:rw]\n"
                                                 "supervisor_allow: [getppid]\n"
                                                 "env: ['A=b c']\n");
    EXPECT_EQ(config.socket_path, "/tmp/x.sock");
    EXPECT_EQ(config.pool_size, 8U);
    EXPECT_EQ(config.arena_slots, 16U);
    EXPECT_EQ(config.effective_arena_slots(), 16U);
    EXPECT_EQ(config.recycle_after, 5U);
    EXPECT_EQ(config.queue_capacity, 3U);
    EXPECT_TRUE(config.require_full_pool);
    EXPECT_EQ(config.sandbox.timeout, std::chrono::milliseconds{250});
    EXPECT_EQ(config.sandbox.cpu_quota, 0.5);
    EXPECT_TRUE(config.sandbox.network);
    EXPECT_EQ(
        config.sandbox.fs_allow,
        (std::vector<FsRule>{
            {.path = "/etc", .access = FsAccess::READ_ONLY},
            {.path = "/var", .access = FsAccess::READ_WRITE},
        })
    );
    EXPECT_EQ(config.sandbox.supervisor_allow, std::vector<std::string>{"getppid"});
    EXPECT_EQ(config.sandbox.env, std::vector<std::string>{"A=b c"});
}

// NOLINTNEXTLINE
TEST_F(DaemonConfigTest, environment_overrides_socket_path) {
    ASSERT_EQ(setenv(sandpool::socket_path_env_var, "/tmp/env.sock", 1), 0);
    auto config = load_daemon_config_from_string("socket_path: /tmp/file.sock\n");
    EXPECT_EQ(config.socket_path, "/tmp/env.sock");
}

// NOLINTNEXTLINE
TEST_F(DaemonConfigTest, nonexistent_runtime_paths_are_dropped) {
    auto config = load_daemon_config_from_string("runtime_paths: [/bin, /usr, /nonexistent-sandpool]\n"
    );
    EXPECT_THAT(config.sandbox.runtime_paths, testing::Not(testing::Contains("/nonexistent-sandpool")));
}

// NOLINTNEXTLINE
TEST_F(DaemonConfigTest, parse_errors_become_config_errors) {
    auto what = config_error_of("pool_size 4\n");
    EXPECT_THAT(what, HasSubstr("line 1:"));
    EXPECT_THAT(what, HasSubstr("invalid assignment operator"));
    EXPECT_THAT(config_error_of("unknown_var: 1\n"), HasSubstr("unknown variable"));
}

// NOLINTNEXTLINE
TEST_F(DaemonConfigTest, type_errors) {
    EXPECT_THAT(config_error_of("pool_size: four\n"), HasSubstr("pool_size: expected a number"));
    EXPECT_THAT(config_error_of("pool_size: -1\n"), HasSubstr("pool_size: expected a number"));
    EXPECT_THAT(config_error_of("network: maybe\n"), HasSubstr("network: expected a boolean"));
    EXPECT_THAT(config_error_of("pool_size: [1]\n"), HasSubstr("expected a single value"));
    EXPECT_THAT(config_error_of("fs_allow: /etc:ro\n"), HasSubstr("fs_allow: expected an array"));
}

// NOLINTNEXTLINE
TEST_F(DaemonConfigTest, validation) {
    EXPECT_THAT(config_error_of("pool_size: 0\n"), HasSubstr("pool_size has to be positive"));
    EXPECT_THAT(config_error_of("recycle_after: 0\n"), HasSubstr("recycle_after has to be positive"));
    EXPECT_THAT(
        config_error_of("pool_size: 10\narena_slots: 9\n"),
        HasSubstr("cannot be smaller than pool_size + queue_capacity (74)")
    );
    EXPECT_THAT(
        config_error_of("pool_size: 2\nqueue_capacity: 3\narena_slots: 4\n"),
        HasSubstr("arena_slots (4)")
    );
    EXPECT_NO_THROW(
        (void)load_daemon_config_from_string("pool_size: 2\nqueue_capacity: 3\narena_slots: 5\n")
    );
    EXPECT_THAT(config_error_of("timeout_ms: 0\n"), HasSubstr("timeout has to be positive"));
    EXPECT_THAT(config_error_of("memory_limit: 1000\n"), HasSubstr("memory_limit"));
    EXPECT_THAT(config_error_of("cpu_quota: 0\n"), HasSubstr("cpu_quota"));
    EXPECT_THAT(config_error_of("max_processes: 1\n"), HasSubstr("max_processes"));
    EXPECT_THAT(config_error_of("socket_path: ''\n"), HasSubstr("socket_path"));
    EXPECT_THAT(config_error_of("worker_executable: bin/w\n"), HasSubstr("absolute path"));
    EXPECT_THAT(config_error_of("interpreter: []\n"), HasSubstr("interpreter cannot be empty"));
    EXPECT_THAT(
        config_error_of("interpreter: [/opt/python3]\n"),
        HasSubstr("is not inside runtime_paths")
    );
    EXPECT_THAT(config_error_of("env: [NOVALUE]\n"), HasSubstr("NAME=value"));
    EXPECT_THAT(
        config_error_of("max_code_bytes: 100000\nmax_frame_bytes: 1000\n"),
        HasSubstr("max_frame_bytes is too small")
    );
    EXPECT_THAT(
        config_error_of("supervisor_allow: [no_such_syscall]\n"),
        HasSubstr("unknown syscall: no_such_syscall")
    );
}

// NOLINTNEXTLINE
TEST_F(DaemonConfigTest, fs_allow_validation) {
    EXPECT_THAT(config_error_of("fs_allow: [/etc]\n"), HasSubstr("<path>:<ro|rw|exec>"));
    EXPECT_THAT(config_error_of("fs_allow: [/etc:rwx]\n"), HasSubstr("unknown access mode: rwx"));
    EXPECT_THAT(config_error_of("fs_allow: [etc:ro]\n"), HasSubstr("not a normalized absolute path"));
    EXPECT_THAT(config_error_of("fs_allow: [/etc/../usr:ro]\n"), HasSubstr("not a normalized"));
    EXPECT_THAT(config_error_of("fs_allow: [/:ro]\n"), HasSubstr("root directory cannot be exposed"));
    EXPECT_THAT(config_error_of("fs_allow: [/proc/self:ro]\n"), HasSubstr("lies under /proc"));
    EXPECT_THAT(config_error_of("fs_allow: [/etc:ro, /etc:rw]\n"), HasSubstr("more than once"));
    EXPECT_THAT(
        config_error_of("fs_allow: [/nonexistent-sandpool-dir:ro]\n"), HasSubstr("cannot access")
    );
}

// NOLINTNEXTLINE
TEST(is_normalized_absolute_path, examples) {
    using sandpool::is_normalized_absolute_path;
    EXPECT_TRUE(is_normalized_absolute_path("/"));
    EXPECT_TRUE(is_normalized_absolute_path("/usr/lib"));
    EXPECT_TRUE(is_normalized_absolute_path("/a..b/.c"));
    EXPECT_FALSE(is_normalized_absolute_path(""));
    EXPECT_FALSE(is_normalized_absolute_path("usr"));
    EXPECT_FALSE(is_normalized_absolute_path("/usr/"));
    EXPECT_FALSE(is_normalized_absolute_path("/usr//lib"));
    EXPECT_FALSE(is_normalized_absolute_path("/usr/./lib"));
    EXPECT_FALSE(is_normalized_absolute_path("/usr/../lib"));
}
