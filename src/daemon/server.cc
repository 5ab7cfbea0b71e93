#include <cerrno>
#include <cstring>
#include <future>
#include <poll.h>
#include <sandpool/daemon/server.hh>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/logger.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/overloaded.hh>
#include <sandpool/transport/protocol.hh>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace cp = sandpool::client_protocol;

namespace {

constexpr auto RESULT_POLL_INTERVAL = std::chrono::milliseconds{10};

bool peer_hung_up(int sock_fd) noexcept {
    pollfd pfd = {.fd = sock_fd, .events = POLLRDHUP, .revents = 0};
    return poll(&pfd, 1, 0) == 1 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR));
}

} // namespace

namespace sandpool {

Server::Server(
    std::string socket_path, size_t max_frame_bytes, PoolManager& pool, arena::ResultArena& arena
)
: socket_path_{std::move(socket_path)}
, max_frame_bytes_{max_frame_bytes}
, pool_{pool}
, arena_{arena}
, listen_fd_{socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)} {
    if (!listen_fd_.is_open()) {
        THROW("socket()", errmsg());
    }
    sockaddr_un addr = {};
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        THROW("socket path is too long: ", socket_path_);
    }
    std::memcpy(addr.sun_path, socket_path_.c_str(), socket_path_.size() + 1);

    struct stat64 st;
    if (lstat64(socket_path_.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode)) {
            THROW(socket_path_, " exists and is not a socket");
        }
        if (unlink(socket_path_.c_str())) {
            THROW("unlink(", socket_path_, ")", errmsg());
        }
    }
    if (bind(listen_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr))) {
        THROW("bind(", socket_path_, ")", errmsg());
    }
    if (chmod(socket_path_.c_str(), 0660)) {
        THROW("chmod(", socket_path_, ")", errmsg());
    }
    if (listen(listen_fd_, SOMAXCONN)) {
        THROW("listen()", errmsg());
    }
}

Server::~Server() {
    close_connections();
    if (listen_fd_.is_open()) {
        (void)unlink(socket_path_.c_str());
    }
}

void Server::run(int stop_fd) {
    stdlog("listening on ", socket_path_);
    for (;;) {
        pollfd pfds[2] = {
            {.fd = listen_fd_, .events = POLLIN, .revents = 0},
            {.fd = stop_fd, .events = POLLIN, .revents = 0},
        };
        if (poll(pfds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }
        if (pfds[1].revents) {
            return;
        }
        if (!pfds[0].revents) {
            continue;
        }

        FileDescriptor sock{accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC)};
        if (!sock.is_open()) {
            if (errno == EINTR || errno == ECONNABORTED || errno == EAGAIN) {
                continue;
            }
            if (errno == EMFILE || errno == ENFILE) {
                errlog("accept4()", errmsg());
                reap_finished_connections();
                continue;
            }
            THROW("accept4()", errmsg());
        }

        reap_finished_connections();
        std::lock_guard lock{mtx_};
        auto id = next_connection_id_++;
        auto& conn = connections_[id];
        int sock_fd = sock;
        conn.sock = std::move(sock);
        conn.thread = std::thread{[this, id, sock_fd] { serve_connection(id, sock_fd); }};
    }
}

void Server::reap_finished_connections() {
    std::map<uint64_t, Connection> finished;
    {
        std::lock_guard lock{mtx_};
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->second.finished) {
                finished.insert(connections_.extract(it++));
            } else {
                ++it;
            }
        }
    }
    for (auto& [id, conn] : finished) {
        conn.thread.join();
    }
}

void Server::close_connections() noexcept {
    std::map<uint64_t, Connection> conns;
    {
        std::lock_guard lock{mtx_};
        for (auto& [id, conn] : connections_) {
            (void)shutdown(conn.sock, SHUT_RDWR);
        }
        conns.swap(connections_);
    }
    for (auto& [id, conn] : conns) {
        conn.thread.join();
    }
}

void Server::serve_connection(uint64_t connection_id, int sock_fd) {
    struct HeldSlot {
        CorrelationId pool_correlation_id;
        uint32_t slot;
    };
    std::map<CorrelationId, HeldSlot> held; // by client correlation id

    auto send_error = [&](const std::string& message) {
        cp::write_frame(sock_fd, cp::serialize(cp::Response{cp::ErrorResponse{.message = message}}));
    };

    auto execute = [&](cp::ExecuteRequest& req) -> bool {
        if (held.count(req.correlation_id)) {
            send_error("correlation id still holds an unreleased result");
            return true;
        }
        auto pool_correlation_id = next_correlation_id_.fetch_add(1);
        std::optional<std::chrono::milliseconds> timeout;
        if (req.timeout_ms) {
            timeout = std::chrono::milliseconds{*req.timeout_ms};
        }
        auto future = pool_.submit({
            .correlation_id = pool_correlation_id,
            .code = std::move(req.code),
            .timeout = timeout,
        });

        bool hung_up = false;
        while (future.wait_for(RESULT_POLL_INTERVAL) != std::future_status::ready) {
            if (!hung_up && peer_hung_up(sock_fd)) {
                hung_up = true;
                pool_.cancel(pool_correlation_id);
            }
        }
        auto res = future.get();
        if (hung_up) {
            if (res.slot) {
                (void)arena_.release(*res.slot, pool_correlation_id);
            }
            return false;
        }

        res.correlation_id = req.correlation_id;
        FileDescriptor slot_fd;
        if (res.slot) {
            held.emplace(req.correlation_id, HeldSlot{pool_correlation_id, *res.slot});
            slot_fd = arena_.sealed_copy_fd(*res.slot);
            (void)arena_.mark_consumed(*res.slot, pool_correlation_id);
        }
        cp::write_frame(sock_fd, cp::serialize(cp::Response{std::move(res)}), slot_fd);
        return true;
    };

    try {
        for (;;) {
            std::optional<cp::Frame> frame;
            std::optional<cp::Request> request;
            try {
                frame = cp::read_frame(sock_fd, max_frame_bytes_);
                if (!frame) {
                    break;
                }
                request = cp::deserialize_request(frame->body.data(), frame->body.size());
            } catch (const ProtocolError& e) {
                errlog("connection ", connection_id, ": ", e.what());
                send_error(e.what());
                break;
            }

            bool keep_going = std::visit(
                overloaded{
                    [&](cp::ExecuteRequest& req) { return execute(req); },
                    [&](cp::StatusRequest& /**/) {
                        cp::write_frame(sock_fd, cp::serialize(cp::Response{pool_.status()}));
                        return true;
                    },
                    [&](cp::PingRequest& /**/) {
                        cp::write_frame(sock_fd, cp::serialize(cp::Response{cp::PongResponse{}}));
                        return true;
                    },
                    [&](cp::ReleaseRequest& req) {
                        bool released = false;
                        auto it = held.find(req.correlation_id);
                        if (it != held.end()) {
                            released = arena_.release(it->second.slot, it->second.pool_correlation_id);
                            held.erase(it);
                        }
                        cp::write_frame(
                            sock_fd,
                            cp::serialize(cp::Response{cp::ReleasedResponse{
                                .correlation_id = req.correlation_id,
                                .released = released,
                            }})
                        );
                        return true;
                    },
                },
                *request
            );
            if (!keep_going) {
                break;
            }
        }
    } catch (const std::exception& e) {
        errlog("connection ", connection_id, ": ", e.what());
    }

    for (auto& [client_correlation_id, held_slot] : held) {
        (void)arena_.release(held_slot.slot, held_slot.pool_correlation_id);
    }
    (void)shutdown(sock_fd, SHUT_RDWR);
    std::lock_guard lock{mtx_};
    auto it = connections_.find(connection_id);
    if (it != connections_.end()) {
        it->second.finished = true;
    }
}

} // namespace sandpool
