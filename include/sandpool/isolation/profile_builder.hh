#pragma once

#include <chrono>
#include <sandpool/file_descriptor.hh>
#include <sandpool/isolation/cgroups.hh>
#include <sandpool/pool/worker_launcher.hh>
#include <sandpool/sandbox_config.hh>
#include <sandpool/worker/protocol.hh>
#include <string>

namespace sandpool {

/**
 * @brief Creates isolated workers. The daemon side of the isolation sequence.
 * @details For every worker: creates its cgroup, clone3()s the process directly into the
 *   cgroup and into fresh user, PID, mount, IPC, UTS, cgroup (and network unless enabled)
 *   namespaces, maps root inside the user namespace to our ids, executes the worker binary,
 *   hands it the profile with the seccomp program and waits for its readiness. The worker
 *   applies mounts, capability drop, Landlock and seccomp itself, in this order.
 */
class IsolationProfileBuilder : public WorkerLauncher {
    const cgroups::CgroupTree& cgroups_;
    cgroups::Limits limits_;
    bool network_;
    std::vector<std::byte> profile_msg_;
    FileDescriptor seccomp_program_;
    FileDescriptor worker_exe_;
    std::chrono::milliseconds setup_timeout_;

public:
    /**
     * @param seccomp_program memfd with the BPF program, see seccomp::build_worker_filter()
     * @param worker_executable absolute path of sandpool-worker
     *
     * @errors Throws if @p worker_executable cannot be opened
     */
    IsolationProfileBuilder(
        const cgroups::CgroupTree& cgroups, const SandboxConfig& sandbox,
        FileDescriptor seccomp_program, const std::string& worker_executable,
        std::chrono::milliseconds setup_timeout
    );

    [[nodiscard]] std::variant<LaunchedWorker, SetupError>
    launch(WorkerId id, const std::function<void(pid_t)>& on_process_created) override;
};

} // namespace sandpool
