#include <gtest/gtest.h>
#include <sandpool/cli/exit_codes.hh>

using sandpool::ExecutionResult;
using sandpool::ExecutionStatus;
using namespace sandpool::cli; // NOLINT(google-build-using-namespace)

namespace {

ExecutionResult result(ExecutionStatus status, int exit_code = 0, int signal = 0) {
    ExecutionResult res{.correlation_id = 1, .status = status};
    res.exit_code = exit_code;
    res.signal = signal;
    return res;
}

} // namespace

// NOLINTNEXTLINE
TEST(exit_codes, completed) {
    EXPECT_EQ(exit_code_for(result(ExecutionStatus::COMPLETED, 0)), EXIT_OK);
    EXPECT_EQ(exit_code_for(result(ExecutionStatus::COMPLETED, 3)), EXIT_JOB_FAILED);
    EXPECT_EQ(exit_code_for(result(ExecutionStatus::COMPLETED, -1, 9)), EXIT_JOB_FAILED);
}

// NOLINTNEXTLINE
TEST(exit_codes, failures_are_distinguishable) {
    EXPECT_EQ(exit_code_for(result(ExecutionStatus::DENIED, 1)), 77);
    EXPECT_EQ(exit_code_for(result(ExecutionStatus::TIMED_OUT)), 124);
    EXPECT_EQ(exit_code_for(result(ExecutionStatus::CRASHED)), 70);
    EXPECT_EQ(exit_code_for(result(ExecutionStatus::REJECTED)), 70);
    EXPECT_EQ(EXIT_UNREACHABLE, 69);
}
