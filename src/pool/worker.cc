#include <sandpool/concat_tostr.hh>
#include <sandpool/pool/worker.hh>

namespace sandpool {

std::string to_string(WorkerId id) { return concat_tostr(id.position, '.', id.generation); }

const char* to_str(WorkerState state) noexcept {
    switch (state) {
    case WorkerState::SPAWNING: return "spawning";
    case WorkerState::ISOLATING: return "isolating";
    case WorkerState::IDLE: return "idle";
    case WorkerState::BUSY: return "busy";
    case WorkerState::RECYCLING: return "recycling";
    case WorkerState::CRASHED: return "crashed";
    case WorkerState::TERMINATED: return "terminated";
    }
    return "unknown";
}

} // namespace sandpool
