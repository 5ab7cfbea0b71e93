#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <sandpool/file_descriptor.hh>
#include <sandpool/pool/pool_manager.hh>
#include <sandpool/transport/result_arena.hh>
#include <string>
#include <thread>

namespace sandpool {

/**
 * @brief Serves clients on a Unix stream socket, one thread per connection.
 * @details Client correlation ids are private to a connection and are mapped onto unique pool
 *   correlation ids. When a client disconnects its running jobs are cancelled and the slots it
 *   did not release are freed.
 */
class Server {
    struct Connection {
        FileDescriptor sock;
        std::thread thread;
        bool finished = false;
    };

    std::string socket_path_;
    size_t max_frame_bytes_;
    PoolManager& pool_;
    arena::ResultArena& arena_;
    FileDescriptor listen_fd_;
    std::atomic<CorrelationId> next_correlation_id_{1};

    std::mutex mtx_;
    std::map<uint64_t, Connection> connections_;
    uint64_t next_connection_id_ = 0;

    void serve_connection(uint64_t connection_id, int sock_fd);

    void reap_finished_connections();

public:
    // Binds and listens on @p socket_path, replacing a stale socket file. Throws upon error.
    Server(std::string socket_path, size_t max_frame_bytes, PoolManager& pool, arena::ResultArena& arena);

    Server(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(const Server&) = delete;
    Server& operator=(Server&&) = delete;

    ~Server();

    // Accepts connections until @p stop_fd becomes readable, then stops accepting
    void run(int stop_fd);

    // Disconnects all clients and joins their threads
    void close_connections() noexcept;
};

} // namespace sandpool
