#include <sandpool/execution.hh>

namespace sandpool {

const char* to_str(ExecutionStatus status) noexcept {
    switch (status) {
    case ExecutionStatus::COMPLETED: return "completed";
    case ExecutionStatus::TIMED_OUT: return "timed out";
    case ExecutionStatus::DENIED: return "denied";
    case ExecutionStatus::CRASHED: return "crashed";
    case ExecutionStatus::REJECTED: return "rejected";
    }
    return "unknown";
}

} // namespace sandpool
