#pragma once

#include <chrono>
#include <cstdint>

namespace sandpool {

struct PoolStatus {
    uint32_t pool_size = 0;
    uint32_t healthy = 0;
    uint32_t idle = 0;
    uint32_t busy = 0;
    uint32_t pending = 0;
    uint32_t spawning = 0;
    uint64_t recycle_after = 0;
    std::chrono::seconds uptime{0};
    uint64_t executions = 0;
    uint64_t crashed = 0;
    uint64_t recycled = 0;
    uint64_t timed_out = 0;
    uint64_t rejected = 0;
    uint64_t failed_spawns = 0;
};

} // namespace sandpool
