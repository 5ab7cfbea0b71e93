#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sandpool/file_descriptor.hh>
#include <sandpool/supervisor/denial_log.hh>
#include <sandpool/supervisor/policy.hh>
#include <string>
#include <thread>

struct seccomp_notif;

namespace sandpool::supervisor {

/**
 * Answers seccomp notifications of all workers from a single thread waiting on one epoll
 * instance. The intercepted process stays alive whatever the verdict: an allowed syscall
 * continues, a denied one fails with the policy's errno.
 */
class SyscallSupervisor {
public:
    // Called from the supervisor thread without any supervisor lock held
    using ViolationHandler = std::function<void(uint64_t worker_key, const std::string& reason)>;

private:
    struct Registration {
        std::string worker_name;
        FileDescriptor listener;
        std::shared_ptr<DenialLog> denials;
    };

    PolicyTable policy_;
    ViolationHandler on_violation_;
    FileDescriptor epoll_fd_;
    FileDescriptor stop_fd_;
    size_t notif_size_;
    size_t resp_size_;
    std::mutex mtx_;
    std::map<uint64_t, Registration> workers_;
    std::thread thread_;
    std::atomic<uint64_t> verdicts_{0};
    std::atomic<uint64_t> dropped_log_events_{0};

    void run();

    // Returns a violation reason or an empty string
    std::string handle_notification(
        uint64_t key, Registration& reg, seccomp_notif* notif, void* resp_buff
    );

public:
    explicit SyscallSupervisor(PolicyTable policy);

    SyscallSupervisor(const SyscallSupervisor&) = delete;
    SyscallSupervisor(SyscallSupervisor&&) = delete;
    SyscallSupervisor& operator=(const SyscallSupervisor&) = delete;
    SyscallSupervisor& operator=(SyscallSupervisor&&) = delete;

    ~SyscallSupervisor();

    // Must be set before start()
    void set_violation_handler(ViolationHandler handler) { on_violation_ = std::move(handler); }

    void start();

    // Stops and joins the supervisor thread, idempotent
    void stop() noexcept;

    // Starts answering notifications from @p listener, throws upon error
    std::shared_ptr<DenialLog>
    register_worker(uint64_t worker_key, std::string worker_name, FileDescriptor listener);

    // Closes the listener of the worker, no-op if not registered
    void unregister_worker(uint64_t worker_key) noexcept;

    [[nodiscard]] size_t registered_workers_num();

    [[nodiscard]] uint64_t verdicts_num() const noexcept {
        return verdicts_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t dropped_log_events_num() const noexcept {
        return dropped_log_events_.load(std::memory_order_relaxed);
    }
};

} // namespace sandpool::supervisor
