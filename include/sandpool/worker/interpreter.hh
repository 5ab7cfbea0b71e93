#pragma once

#include <sandpool/worker/job_loop.hh>
#include <sandpool/worker/protocol.hh>

namespace sandpool::worker {

/**
 * @brief Runs the profile's interpreter with @p code on its standard input.
 * @details The interpreter starts in /tmp with the profile's environment, RLIMIT_NOFILE of
 *   max_open_files and no core dumps. Its stdout and stderr go to @p writer. Once it exits,
 *   every remaining process of the worker's PID namespace is killed and reaped. Must be called
 *   from the PID namespace's init process.
 *
 * @errors Throws upon a system error
 */
JobOutcome run_interpreter(
    const worker_protocol::Profile& profile, std::string_view code, arena::SlotWriter& writer
);

} // namespace sandpool::worker
