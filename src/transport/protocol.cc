#include <algorithm>
#include <climits>
#include <cstring>
#include <endian.h>
#include <sandpool/deserialize.hh>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/overloaded.hh>
#include <sandpool/serialize.hh>
#include <sandpool/socket_fds.hh>
#include <sandpool/transport/protocol.hh>
#include <sandpool/write_exact.hh>

using deserialize::casted_from;
using deserialize::from;
using serialize::as;
using serialize::casted_as;

namespace sandpool::client_protocol {

namespace {

constexpr uint8_t EXECUTE_HAS_TIMEOUT = 1;

constexpr uint8_t RESULT_HAS_SLOT = 1;
constexpr uint8_t RESULT_STDOUT_TRUNCATED = 2;
constexpr uint8_t RESULT_STDERR_TRUNCATED = 4;
constexpr uint8_t RESULT_OOM_KILLED = 8;

constexpr size_t MAX_DENIED_SYSCALLS = 1024;
constexpr size_t MAX_TEXT_LEN = 1 << 16;

template <class Kind, class Func>
std::vector<std::byte> message(Kind kind, Func&& body_func) {
    return serialize::to_bytes([&](auto& writer) {
        writer.write_as_bytes(kind);
        body_func(writer);
    });
}

template <class Writer>
void write_result(Writer& writer, const ExecutionResult& res) {
    writer.write(res.correlation_id, as<uint64_t>);
    writer.write_as_bytes(res.status);
    writer.write_flags(
        {
            {res.slot.has_value(), RESULT_HAS_SLOT},
            {res.stdout_ref.truncated, RESULT_STDOUT_TRUNCATED},
            {res.stderr_ref.truncated, RESULT_STDERR_TRUNCATED},
            {res.oom_killed, RESULT_OOM_KILLED},
        },
        as<uint8_t>
    );
    if (res.slot) {
        writer.write(*res.slot, as<uint32_t>);
    }
    writer.write(res.exit_code, as<int32_t>);
    writer.write(res.signal, as<int32_t>);
    writer.write(res.stdout_ref.offset, as<uint32_t>);
    writer.write(res.stdout_ref.length, as<uint32_t>);
    writer.write(res.stderr_ref.offset, as<uint32_t>);
    writer.write(res.stderr_ref.length, as<uint32_t>);
    writer.write(res.duration.count(), casted_as<uint64_t>);
    writer.write(res.cpu_time.count(), casted_as<uint64_t>);
    writer.write(res.peak_memory_bytes, as<uint64_t>);
    writer.write(res.denied_syscalls_count, as<uint64_t>);
    writer.write(res.denied_syscalls.size(), casted_as<uint32_t>);
    for (int nr : res.denied_syscalls) {
        writer.write(nr, as<int32_t>);
    }
    writer.write_string(res.message, as<uint32_t>);
    writer.write_string(res.worker, as<uint16_t>);
}

ExecutionResult read_result(deserialize::Reader& reader) {
    ExecutionResult res{.correlation_id = 0, .status = ExecutionStatus::COMPLETED};
    reader.read(res.correlation_id, from<uint64_t>);
    auto status = reader.read_bytes_as<uint8_t>();
    if (status > static_cast<uint8_t>(ExecutionStatus::REJECTED)) {
        THROW_AS(ProtocolError, "invalid execution status: ", status);
    }
    res.status = static_cast<ExecutionStatus>(status);
    bool has_slot = false;
    reader.read_flags(
        {
            {has_slot, RESULT_HAS_SLOT},
            {res.stdout_ref.truncated, RESULT_STDOUT_TRUNCATED},
            {res.stderr_ref.truncated, RESULT_STDERR_TRUNCATED},
            {res.oom_killed, RESULT_OOM_KILLED},
        },
        from<uint8_t>
    );
    reader.read_optional_if(res.slot, from<uint32_t>, has_slot);
    reader.read(res.exit_code, from<int32_t>);
    reader.read(res.signal, from<int32_t>);
    reader.read(res.stdout_ref.offset, from<uint32_t>);
    reader.read(res.stdout_ref.length, from<uint32_t>);
    reader.read(res.stderr_ref.offset, from<uint32_t>);
    reader.read(res.stderr_ref.length, from<uint32_t>);
    res.duration = std::chrono::microseconds{reader.read<int64_t>(casted_from<uint64_t>)};
    res.cpu_time = std::chrono::microseconds{reader.read<int64_t>(casted_from<uint64_t>)};
    reader.read(res.peak_memory_bytes, from<uint64_t>);
    reader.read(res.denied_syscalls_count, from<uint64_t>);
    auto denied_num = reader.read<size_t>(casted_from<uint32_t>);
    if (denied_num > MAX_DENIED_SYSCALLS) {
        THROW_AS(ProtocolError, "too many denied syscalls: ", denied_num);
    }
    for (size_t i = 0; i < denied_num; ++i) {
        res.denied_syscalls.emplace_back(reader.read<int>(from<int32_t>));
    }
    res.message = reader.read_string(from<uint32_t>, MAX_TEXT_LEN);
    res.worker = reader.read_string(from<uint16_t>, MAX_TEXT_LEN);
    return res;
}

template <class Writer>
void write_status(Writer& writer, const PoolStatus& st) {
    writer.write(st.pool_size, as<uint32_t>);
    writer.write(st.healthy, as<uint32_t>);
    writer.write(st.idle, as<uint32_t>);
    writer.write(st.busy, as<uint32_t>);
    writer.write(st.pending, as<uint32_t>);
    writer.write(st.spawning, as<uint32_t>);
    writer.write(st.recycle_after, as<uint64_t>);
    writer.write(st.uptime.count(), casted_as<uint64_t>);
    writer.write(st.executions, as<uint64_t>);
    writer.write(st.crashed, as<uint64_t>);
    writer.write(st.recycled, as<uint64_t>);
    writer.write(st.timed_out, as<uint64_t>);
    writer.write(st.rejected, as<uint64_t>);
    writer.write(st.failed_spawns, as<uint64_t>);
}

PoolStatus read_status(deserialize::Reader& reader) {
    PoolStatus st;
    reader.read(st.pool_size, from<uint32_t>);
    reader.read(st.healthy, from<uint32_t>);
    reader.read(st.idle, from<uint32_t>);
    reader.read(st.busy, from<uint32_t>);
    reader.read(st.pending, from<uint32_t>);
    reader.read(st.spawning, from<uint32_t>);
    reader.read(st.recycle_after, from<uint64_t>);
    st.uptime = std::chrono::seconds{reader.read<int64_t>(casted_from<uint64_t>)};
    reader.read(st.executions, from<uint64_t>);
    reader.read(st.crashed, from<uint64_t>);
    reader.read(st.recycled, from<uint64_t>);
    reader.read(st.timed_out, from<uint64_t>);
    reader.read(st.rejected, from<uint64_t>);
    reader.read(st.failed_spawns, from<uint64_t>);
    return st;
}

template <class Func>
auto deserialize_body(const char* what, const std::byte* data, size_t len, Func&& func) {
    if (len == 0) {
        THROW_AS(ProtocolError, "empty ", what);
    }
    try {
        deserialize::Reader reader{data, len};
        auto kind = reader.read_bytes_as<uint8_t>();
        auto res = func(kind, reader);
        reader.expect_end();
        return res;
    } catch (const ProtocolError&) {
        throw;
    } catch (const std::runtime_error& e) {
        THROW_AS(ProtocolError, "malformed ", what, ": ", e.what());
    }
}

// Receives exactly @p len bytes unless EOF comes first, returns the number of bytes received
size_t recv_all(int sock_fd, std::byte* buf, size_t len, std::vector<FileDescriptor>& fds) {
    size_t pos = 0;
    while (pos < len) {
        auto rc = recv_fds<1>(sock_fd, buf + pos, len - pos, 0, fds);
        if (rc < 0) {
            THROW("recvmsg()", errmsg());
        }
        if (rc == 0) {
            break;
        }
        pos += static_cast<size_t>(rc);
    }
    return pos;
}

} // namespace

std::vector<std::byte> serialize(const Request& request) {
    return std::visit(
        overloaded{
            [](const ExecuteRequest& req) {
                return message(RequestKind::EXECUTE, [&](auto& writer) {
                    writer.write_flags(
                        {{req.timeout_ms.has_value(), EXECUTE_HAS_TIMEOUT}}, as<uint8_t>
                    );
                    writer.write(req.correlation_id, as<uint64_t>);
                    if (req.timeout_ms) {
                        writer.write(*req.timeout_ms, as<uint32_t>);
                    }
                    writer.write_string(req.code, as<uint32_t>);
                });
            },
            [](const StatusRequest& /**/) {
                return message(RequestKind::STATUS, [](auto& /**/) {});
            },
            [](const PingRequest& /**/) {
                return message(RequestKind::PING, [](auto& /**/) {});
            },
            [](const ReleaseRequest& req) {
                return message(RequestKind::RELEASE, [&](auto& writer) {
                    writer.write(req.correlation_id, as<uint64_t>);
                });
            },
        },
        request
    );
}

std::vector<std::byte> serialize(const Response& response) {
    return std::visit(
        overloaded{
            [](const ExecutionResult& res) {
                return message(ResponseKind::RESULT, [&](auto& writer) { write_result(writer, res); });
            },
            [](const PoolStatus& st) {
                return message(ResponseKind::STATUS, [&](auto& writer) { write_status(writer, st); });
            },
            [](const PongResponse& /**/) {
                return message(ResponseKind::PONG, [](auto& /**/) {});
            },
            [](const ReleasedResponse& res) {
                return message(ResponseKind::RELEASED, [&](auto& writer) {
                    writer.write(res.correlation_id, as<uint64_t>);
                    writer.write_as_bytes(static_cast<uint8_t>(res.released));
                });
            },
            [](const ErrorResponse& res) {
                return message(ResponseKind::ERROR, [&](auto& writer) {
                    writer.write_string(res.message, as<uint32_t>);
                });
            },
        },
        response
    );
}

Request deserialize_request(const std::byte* data, size_t len) {
    return deserialize_body("request", data, len, [&](uint8_t kind, deserialize::Reader& reader) {
        switch (static_cast<RequestKind>(kind)) {
        case RequestKind::EXECUTE: {
            ExecuteRequest req;
            bool has_timeout = false;
            reader.read_flags({{has_timeout, EXECUTE_HAS_TIMEOUT}}, from<uint8_t>);
            reader.read(req.correlation_id, from<uint64_t>);
            reader.read_optional_if(req.timeout_ms, from<uint32_t>, has_timeout);
            req.code = reader.read_string(from<uint32_t>, len);
            return Request{std::move(req)};
        }
        case RequestKind::STATUS: return Request{StatusRequest{}};
        case RequestKind::PING: return Request{PingRequest{}};
        case RequestKind::RELEASE: {
            ReleaseRequest req;
            reader.read(req.correlation_id, from<uint64_t>);
            return Request{req};
        }
        }
        THROW_AS(ProtocolError, "unknown request kind: ", kind);
    });
}

Response deserialize_response(const std::byte* data, size_t len) {
    return deserialize_body("response", data, len, [&](uint8_t kind, deserialize::Reader& reader) {
        switch (static_cast<ResponseKind>(kind)) {
        case ResponseKind::RESULT: return Response{read_result(reader)};
        case ResponseKind::STATUS: return Response{read_status(reader)};
        case ResponseKind::PONG: return Response{PongResponse{}};
        case ResponseKind::RELEASED: {
            ReleasedResponse res;
            reader.read(res.correlation_id, from<uint64_t>);
            auto released = reader.read_bytes_as<uint8_t>();
            if (released > 1) {
                THROW_AS(ProtocolError, "invalid released flag: ", released);
            }
            res.released = released == 1;
            return Response{res};
        }
        case ResponseKind::ERROR:
            return Response{ErrorResponse{
                .message = std::string{reader.read_string(from<uint32_t>, MAX_TEXT_LEN)}
            }};
        }
        THROW_AS(ProtocolError, "unknown response kind: ", kind);
    });
}

void write_frame(int sock_fd, const std::vector<std::byte>& body, int attached_fd) {
    if (body.size() > UINT32_MAX) {
        THROW("frame body is too big: ", body.size());
    }
    std::vector<std::byte> frame(FRAME_HEADER_SIZE + body.size());
    uint32_t len = htobe32(static_cast<uint32_t>(body.size()));
    std::memcpy(frame.data(), &len, sizeof(len));
    std::copy(body.begin(), body.end(), frame.begin() + FRAME_HEADER_SIZE);

    size_t sent = 0;
    if (attached_fd >= 0) {
        auto rc = send_fds<1>(sock_fd, frame.data(), frame.size(), 0, &attached_fd, 1);
        if (rc < 0) {
            THROW("sendmsg()", errmsg());
        }
        sent = static_cast<size_t>(rc);
    }
    write_exact(sock_fd, frame.data() + sent, frame.size() - sent);
}

std::optional<Frame> read_frame(int sock_fd, size_t max_body_len) {
    std::vector<FileDescriptor> fds;
    std::byte header[FRAME_HEADER_SIZE];
    auto got = recv_all(sock_fd, header, sizeof(header), fds);
    if (got == 0) {
        return std::nullopt;
    }
    if (got != sizeof(header)) {
        THROW("unexpected EOF inside a frame header");
    }
    uint32_t len;
    std::memcpy(&len, header, sizeof(len));
    len = be32toh(len);
    if (len == 0) {
        THROW_AS(ProtocolError, "empty frame");
    }
    if (len > max_body_len) {
        THROW_AS(ProtocolError, "frame of ", len, " bytes exceeds the limit of ", max_body_len);
    }

    Frame frame;
    frame.body.resize(len);
    if (recv_all(sock_fd, frame.body.data(), len, fds) != len) {
        THROW("unexpected EOF inside a frame");
    }
    if (fds.size() > 1) {
        THROW_AS(ProtocolError, "frame carries ", fds.size(), " descriptors");
    }
    if (!fds.empty()) {
        frame.fd = std::move(fds[0]);
    }
    return frame;
}

} // namespace sandpool::client_protocol
