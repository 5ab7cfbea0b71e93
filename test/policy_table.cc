#include <cerrno>
#include <gtest/gtest.h>
#include <sandpool/errors.hh>
#include <sandpool/sandbox_config.hh>
#include <sandpool/supervisor/policy.hh>
#include <sys/syscall.h>

using sandpool::supervisor::PolicyTable;
using sandpool::supervisor::Verdict;

// NOLINTNEXTLINE
TEST(PolicyTable, default_verdict_is_eacces) {
    PolicyTable policy;
    EXPECT_EQ(policy.decide(SYS_getppid), Verdict::deny(EACCES));
    EXPECT_EQ(policy.rules_num(), 0U);
}

// NOLINTNEXTLINE
TEST(PolicyTable, explicit_rules_override_the_default) {
    PolicyTable policy{Verdict::deny(EPERM)};
    policy.allow(SYS_getppid);
    policy.deny(SYS_sync, ENOSYS);
    EXPECT_EQ(policy.decide(SYS_getppid), Verdict::allow());
    EXPECT_EQ(policy.decide(SYS_sync), Verdict::deny(ENOSYS));
    EXPECT_EQ(policy.decide(SYS_getcpu), Verdict::deny(EPERM));

    policy.deny(SYS_getppid, EACCES);
    EXPECT_EQ(policy.decide(SYS_getppid), Verdict::deny(EACCES));
    EXPECT_EQ(policy.rules_num(), 2U);
}

// NOLINTNEXTLINE
TEST(PolicyTable, from_config) {
    sandpool::SandboxConfig config;
    config.supervisor_allow = {"getcpu", "sync"};
    auto policy = PolicyTable::from_config(config);
    EXPECT_EQ(policy.decide(SYS_getcpu), Verdict::allow());
    EXPECT_EQ(policy.decide(SYS_sync), Verdict::allow());
    EXPECT_EQ(policy.decide(SYS_socket), Verdict::deny(EACCES));

    config.supervisor_allow = {"getcpu", "not_a_syscall"};
    EXPECT_THROW((void)PolicyTable::from_config(config), sandpool::ConfigError);
}

// NOLINTNEXTLINE
TEST(PolicyTable, empty_allow_list_denies_everything) {
    auto policy = PolicyTable::from_config(sandpool::SandboxConfig{});
    EXPECT_EQ(policy.rules_num(), 0U);
    EXPECT_EQ(policy.decide(SYS_socket), Verdict::deny(EACCES));
}
