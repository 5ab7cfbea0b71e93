#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <sandpool/file_descriptor.hh>
#include <string>
#include <string_view>
#include <utility>

namespace sandpool::cgroups {

struct Limits {
    uint64_t memory_max;
    double cpu_quota;
    uint32_t pids_max;
};

constexpr uint64_t CPU_PERIOD_USEC = 100'000;

// Value for cpu.max: "<quota> <period>" in microseconds
[[nodiscard]] std::string cpu_max_value(double cpu_quota);

// Value of @p key in a flat keyed file like memory.events or cpu.stat
[[nodiscard]] std::optional<uint64_t>
read_keyed_value(std::string_view contents, std::string_view key) noexcept;

// Path of the cgroup v2 entry ("0::<path>") of /proc/<pid>/cgroup contents
[[nodiscard]] std::optional<std::string> parse_proc_cgroup(std::string_view contents);

// Owns a per-worker cgroup, removes it upon destruction
class WorkerCgroup {
    int parent_fd_;
    std::string name_;
    FileDescriptor dir_fd_;
    FileDescriptor kill_fd_;

    void remove() noexcept;

public:
    // Creates the cgroup @p name inside @p parent_fd and applies @p limits. Throws upon error.
    WorkerCgroup(int parent_fd, std::string name, const Limits& limits);

    WorkerCgroup(const WorkerCgroup&) = delete;
    WorkerCgroup(WorkerCgroup&&) = delete;
    WorkerCgroup& operator=(const WorkerCgroup&) = delete;
    WorkerCgroup& operator=(WorkerCgroup&&) = delete;

    ~WorkerCgroup() { remove(); }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    // Usable as clone_args::cgroup
    [[nodiscard]] int dir_fd() const noexcept { return dir_fd_; }

    // Kills every process in the cgroup, returns false upon error (errno is set)
    bool kill() noexcept;

    // Number of processes killed by the OOM killer so far, std::nullopt if unavailable
    [[nodiscard]] std::optional<uint64_t> oom_kill_count() const;

    [[nodiscard]] std::optional<uint64_t> memory_peak() const;
};

// Delegated cgroup subtree of the daemon: the daemon lives in the "daemon" leaf, workers in
// "worker-<position>-<generation>" siblings
class CgroupTree {
    std::string path_;
    FileDescriptor dir_fd_;

    CgroupTree(std::string path, FileDescriptor dir_fd) noexcept
    : path_{std::move(path)}
    , dir_fd_{std::move(dir_fd)} {}

public:
    /**
     * @brief Prepares @p configured_root, or the cgroup of the current process if empty.
     * @details Moves all processes of the root into its "daemon" leaf, removes leftover worker
     *   cgroups and enables the pids, memory and cpu controllers for children.
     *
     * @errors Throws SetupFailure if the subtree is not delegated to us
     */
    static CgroupTree prepare(const std::string& configured_root);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Throws upon error
    [[nodiscard]] std::unique_ptr<WorkerCgroup>
    create_worker_cgroup(std::string name, const Limits& limits) const;
};

} // namespace sandpool::cgroups
