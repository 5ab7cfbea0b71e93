#pragma once

#include <sandpool/execution.hh>

namespace sandpool::cli {

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_JOB_FAILED = 1,
    EXIT_USAGE = 64,
    EXIT_UNREACHABLE = 69,
    EXIT_INTERNAL = 70,
    EXIT_DENIED = 77,
    EXIT_TIMED_OUT = 124,
};

// Maps the outcome of an execution onto the process exit code of the CLI
[[nodiscard]] ExitCode exit_code_for(const ExecutionResult& result) noexcept;

} // namespace sandpool::cli
