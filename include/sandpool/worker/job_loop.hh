#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <sandpool/transport/result_arena.hh>
#include <string_view>

namespace sandpool::worker {

struct JobOutcome {
    bool exited = true;
    int exit_code = 0;
    int signal = 0;
    std::chrono::microseconds cpu_time{0};
    uint64_t peak_memory_bytes = 0;
};

// Runs @p code writing its output through @p writer. Must not return before every process it
// started is gone.
using JobExecutor = std::function<JobOutcome(std::string_view code, arena::SlotWriter& writer)>;

/**
 * @brief Serves Job messages arriving on @p control_fd one at a time until the manager closes
 *   the channel.
 * @details For every job the attached slot is mapped, the code is handed to @p executor, the
 *   slot is published as written and JobDone is sent back.
 *
 * @errors Throws upon a protocol or system error, the worker is expected to exit then
 */
void serve_jobs(int control_fd, const JobExecutor& executor);

} // namespace sandpool::worker
