#include <sandpool/cli/exit_codes.hh>

namespace sandpool::cli {

ExitCode exit_code_for(const ExecutionResult& result) noexcept {
    switch (result.status) {
    case ExecutionStatus::COMPLETED:
        return result.exit_code == 0 && result.signal == 0 ? EXIT_OK : EXIT_JOB_FAILED;
    case ExecutionStatus::TIMED_OUT: return EXIT_TIMED_OUT;
    case ExecutionStatus::DENIED: return EXIT_DENIED;
    case ExecutionStatus::CRASHED:
    case ExecutionStatus::REJECTED: return EXIT_INTERNAL;
    }
    return EXIT_INTERNAL;
}

} // namespace sandpool::cli
