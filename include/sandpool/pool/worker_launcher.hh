#pragma once

#include <functional>
#include <sandpool/pool/worker.hh>
#include <sys/types.h>
#include <variant>

namespace sandpool {

// Creates workers for the pool manager
class WorkerLauncher {
public:
    WorkerLauncher() = default;
    WorkerLauncher(const WorkerLauncher&) = delete;
    WorkerLauncher(WorkerLauncher&&) = delete;
    WorkerLauncher& operator=(const WorkerLauncher&) = delete;
    WorkerLauncher& operator=(WorkerLauncher&&) = delete;
    virtual ~WorkerLauncher() = default;

    /**
     * @brief Creates the worker @p id and waits until it reports readiness.
     * @details Called from the pool's spawner thread, may block. A worker that failed to come
     *   up is killed and cleaned up before returning SetupError.
     *
     * @param on_process_created called once the process exists, before isolation completes
     */
    [[nodiscard]] virtual std::variant<LaunchedWorker, SetupError>
    launch(WorkerId id, const std::function<void(pid_t)>& on_process_created) = 0;
};

} // namespace sandpool
