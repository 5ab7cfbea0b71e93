#include <algorithm>
#include <cerrno>
#include <cstring>
#include <linux/seccomp.h>
#include <sandpool/concat_tostr.hh>
#include <sandpool/errmsg.hh>
#include <sandpool/isolation/syscall_names.hh>
#include <sandpool/logger.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/supervisor/syscall_supervisor.hh>
#include <sandpool/syscalls.hh>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <vector>

namespace {

constexpr uint64_t STOP_KEY = ~uint64_t{0};

} // namespace

namespace sandpool::supervisor {

SyscallSupervisor::SyscallSupervisor(PolicyTable policy)
: policy_{std::move(policy)}
, epoll_fd_{epoll_create1(EPOLL_CLOEXEC)}
, stop_fd_{eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)} {
    if (!epoll_fd_.is_open()) {
        THROW("epoll_create1()", errmsg());
    }
    if (!stop_fd_.is_open()) {
        THROW("eventfd()", errmsg());
    }
    epoll_event ev = {.events = EPOLLIN, .data = {.u64 = STOP_KEY}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, stop_fd_, &ev)) {
        THROW("epoll_ctl()", errmsg());
    }

    // The kernel may use bigger structures than those we were compiled with
    seccomp_notif_sizes sizes = {};
    if (syscalls::seccomp(SECCOMP_GET_NOTIF_SIZES, 0, &sizes)) {
        THROW("seccomp(SECCOMP_GET_NOTIF_SIZES)", errmsg());
    }
    notif_size_ = std::max<size_t>(sizes.seccomp_notif, sizeof(seccomp_notif));
    resp_size_ = std::max<size_t>(sizes.seccomp_notif_resp, sizeof(seccomp_notif_resp));
}

SyscallSupervisor::~SyscallSupervisor() { stop(); }

void SyscallSupervisor::start() {
    if (thread_.joinable()) {
        THROW("supervisor is already running");
    }
    thread_ = std::thread{[this] { run(); }};
}

void SyscallSupervisor::stop() noexcept {
    if (!thread_.joinable()) {
        return;
    }
    uint64_t one = 1;
    if (write(stop_fd_, &one, sizeof(one)) != sizeof(one)) {
        errlog("supervisor: cannot signal the stop event", errmsg());
    }
    thread_.join();
}

std::shared_ptr<DenialLog> SyscallSupervisor::register_worker(
    uint64_t worker_key, std::string worker_name, FileDescriptor listener
) {
    auto denials = std::make_shared<DenialLog>();
    std::lock_guard lock{mtx_};
    if (workers_.count(worker_key)) {
        THROW("worker ", worker_name, " is already registered");
    }
    epoll_event ev = {.events = EPOLLIN, .data = {.u64 = worker_key}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, listener, &ev)) {
        THROW("epoll_ctl(EPOLL_CTL_ADD)", errmsg());
    }
    workers_.emplace(
        worker_key,
        Registration{
            .worker_name = std::move(worker_name),
            .listener = std::move(listener),
            .denials = denials,
        }
    );
    return denials;
}

void SyscallSupervisor::unregister_worker(uint64_t worker_key) noexcept {
    std::lock_guard lock{mtx_};
    auto it = workers_.find(worker_key);
    if (it == workers_.end()) {
        return;
    }
    // Closing the listener removes it from the epoll set
    workers_.erase(it);
}

size_t SyscallSupervisor::registered_workers_num() {
    std::lock_guard lock{mtx_};
    return workers_.size();
}

void SyscallSupervisor::run() {
    std::vector<std::byte> notif_buff(notif_size_);
    std::vector<std::byte> resp_buff(resp_size_);
    epoll_event events[64];
    for (;;) {
        int events_num = epoll_wait(epoll_fd_, events, static_cast<int>(std::size(events)), -1);
        if (events_num < 0) {
            if (errno == EINTR) {
                continue;
            }
            errlog("supervisor: epoll_wait()", errmsg());
            return;
        }
        for (int i = 0; i < events_num; ++i) {
            uint64_t key = events[i].data.u64;
            if (key == STOP_KEY) {
                return;
            }

            std::string violation;
            {
                std::lock_guard lock{mtx_};
                auto it = workers_.find(key);
                if (it == workers_.end()) {
                    continue; // unregistered in the meantime
                }
                if (events[i].events & EPOLLIN) {
                    violation = handle_notification(
                        key,
                        it->second,
                        reinterpret_cast<seccomp_notif*>(notif_buff.data()),
                        resp_buff.data()
                    );
                }
                if (violation.empty() && (events[i].events & (EPOLLHUP | EPOLLERR))) {
                    violation = "notification channel closed";
                }
                if (!violation.empty()) {
                    workers_.erase(it);
                }
            }
            if (!violation.empty() && on_violation_) {
                on_violation_(key, violation);
            }
        }
    }
}

std::string SyscallSupervisor::handle_notification(
    uint64_t key, Registration& reg, seccomp_notif* notif, void* resp_buff
) {
    (void)key;
    std::memset(notif, 0, notif_size_);
    if (ioctl(reg.listener, SECCOMP_IOCTL_NOTIF_RECV, notif)) {
        if (errno == ENOENT || errno == EINTR) {
            return {}; // the target died or was interrupted before we got to it
        }
        return concat_tostr("SECCOMP_IOCTL_NOTIF_RECV", errmsg());
    }

    int nr = notif->data.nr;
    std::string violation;
    Verdict verdict = policy_.decide(nr);
    if (notif->data.arch != seccomp::native_arch()) {
        verdict = Verdict::deny(EACCES);
        violation = concat_tostr("notification for a foreign architecture: ", notif->data.arch);
    }

    // Recorded before the reply so that the job's completion cannot overtake it
    if (verdict.kind == Verdict::Kind::DENY) {
        reg.denials->record(nr);
    }

    auto* resp = static_cast<seccomp_notif_resp*>(resp_buff);
    std::memset(resp, 0, resp_size_);
    resp->id = notif->id;
    if (verdict.kind == Verdict::Kind::ALLOW) {
        resp->flags = SECCOMP_USER_NOTIF_FLAG_CONTINUE;
    } else {
        resp->error = -verdict.errnum;
    }
    if (ioctl(reg.listener, SECCOMP_IOCTL_NOTIF_SEND, resp) && errno != ENOENT) {
        return concat_tostr("SECCOMP_IOCTL_NOTIF_SEND", errmsg());
    }
    verdicts_.fetch_add(1, std::memory_order_relaxed);

    try {
        stdlog(
            "event=syscall_verdict worker=",
            reg.worker_name,
            " pid=",
            notif->pid,
            " nr=",
            nr,
            " name=",
            seccomp::syscall_name(nr),
            " verdict=",
            verdict.kind == Verdict::Kind::ALLOW ? "allow" : "deny",
            " errno=",
            verdict.errnum
        );
    } catch (const std::exception&) {
        dropped_log_events_.fetch_add(1, std::memory_order_relaxed);
    }
    return violation;
}

} // namespace sandpool::supervisor
