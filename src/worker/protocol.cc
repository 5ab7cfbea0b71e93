#include <algorithm>
#include <cstring>
#include <sandpool/deserialize.hh>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/serialize.hh>
#include <sandpool/socket_fds.hh>
#include <sandpool/worker/protocol.hh>
#include <sys/socket.h>

using deserialize::casted_from;
using deserialize::from;
using serialize::as;
using serialize::casted_as;

namespace {

constexpr uint8_t PROFILE_NETWORK = 1;
constexpr uint8_t PROFILE_MOUNT_PROC = 2;

template <class Func>
std::vector<std::byte> message(sandpool::worker_protocol::MessageKind kind, Func&& body_func) {
    return serialize::to_bytes([&](auto& writer) {
        writer.write_as_bytes(kind);
        body_func(writer);
    });
}

template <class Writer>
void write_strings(Writer& writer, const std::vector<std::string>& strs) {
    writer.write(strs.size(), casted_as<uint32_t>);
    for (const auto& str : strs) {
        writer.write_string(str, as<uint32_t>);
    }
}

std::vector<std::string> read_strings(deserialize::Reader& reader) {
    auto num = reader.read<uint32_t>(from<uint32_t>);
    std::vector<std::string> res;
    for (uint32_t i = 0; i < num; ++i) {
        res.emplace_back(
            reader.read_string(from<uint32_t>, sandpool::worker_protocol::MAX_MESSAGE_SIZE)
        );
    }
    return res;
}

template <class Func>
auto deserialize_body(const char* what, const std::byte* data, size_t len, Func&& func) {
    try {
        deserialize::Reader reader{data, len};
        auto res = func(reader);
        reader.expect_end();
        return res;
    } catch (const sandpool::ProtocolError&) {
        throw;
    } catch (const std::runtime_error& e) {
        THROW_AS(sandpool::ProtocolError, "malformed ", what, " message: ", e.what());
    }
}

} // namespace

namespace sandpool::worker_protocol {

const char* to_str(MessageKind kind) noexcept {
    switch (kind) {
    case MessageKind::PROFILE: return "Profile";
    case MessageKind::JOB: return "Job";
    case MessageKind::READY: return "Ready";
    case MessageKind::SETUP_ERROR: return "SetupError";
    case MessageKind::JOB_DONE: return "JobDone";
    }
    return "unknown";
}

Profile Profile::from(const SandboxConfig& config) {
    return {
        .network = config.network,
        .mount_proc = config.mount_proc,
        .work_dir_size = config.work_dir_size,
        .max_open_files = config.max_open_files,
        .runtime_paths = config.runtime_paths,
        .fs_allow = config.fs_allow,
        .interpreter = config.interpreter,
        .env = config.env,
    };
}

std::vector<std::byte> serialize(const Profile& profile) {
    return message(MessageKind::PROFILE, [&](auto& writer) {
        writer.write_flags(
            {
                {profile.network, PROFILE_NETWORK},
                {profile.mount_proc, PROFILE_MOUNT_PROC},
            },
            as<uint8_t>
        );
        writer.write(profile.work_dir_size, as<uint64_t>);
        writer.write(profile.max_open_files, as<uint32_t>);
        write_strings(writer, profile.runtime_paths);
        writer.write(profile.fs_allow.size(), casted_as<uint32_t>);
        for (const auto& rule : profile.fs_allow) {
            writer.write_as_bytes(rule.access);
            writer.write_string(rule.path, as<uint32_t>);
        }
        write_strings(writer, profile.interpreter);
        write_strings(writer, profile.env);
    });
}

std::vector<std::byte> serialize(const Job& job) {
    return message(MessageKind::JOB, [&](auto& writer) {
        writer.write(job.correlation_id, as<uint64_t>);
        writer.write(job.slot, as<uint32_t>);
    });
}

std::vector<std::byte> serialize(const JobDone& job_done) {
    return message(MessageKind::JOB_DONE, [&](auto& writer) {
        writer.write(job_done.correlation_id, as<uint64_t>);
        writer.write_as_bytes(static_cast<uint8_t>(job_done.exited));
        writer.write(job_done.exit_code, as<int32_t>);
        writer.write(job_done.signal, as<int32_t>);
        writer.write(job_done.duration.count(), casted_as<uint64_t>);
        writer.write(job_done.cpu_time.count(), casted_as<uint64_t>);
        writer.write(job_done.peak_memory_bytes, as<uint64_t>);
    });
}

std::vector<std::byte> serialize_ready() {
    return message(MessageKind::READY, [](auto& /**/) {});
}

std::vector<std::byte> serialize_setup_error(std::string_view description) {
    return message(MessageKind::SETUP_ERROR, [&](auto& writer) {
        writer.write_bytes(description.data(), description.size());
    });
}

void send_setup_error_noexcept(int sock_fd, std::string_view description) noexcept {
    char buff[4096];
    buff[0] = static_cast<char>(MessageKind::SETUP_ERROR);
    size_t len = std::min(description.size(), sizeof(buff) - 1);
    std::memcpy(buff + 1, description.data(), len);
    (void)send(sock_fd, buff, len + 1, MSG_NOSIGNAL);
}

Profile deserialize_profile(const std::byte* data, size_t len) {
    return deserialize_body("Profile", data, len, [](deserialize::Reader& reader) {
        Profile profile;
        reader.read_flags(
            {
                {profile.network, PROFILE_NETWORK},
                {profile.mount_proc, PROFILE_MOUNT_PROC},
            },
            from<uint8_t>
        );
        reader.read(profile.work_dir_size, from<uint64_t>);
        reader.read(profile.max_open_files, from<uint32_t>);
        profile.runtime_paths = read_strings(reader);
        auto rules_num = reader.read<uint32_t>(from<uint32_t>);
        for (uint32_t i = 0; i < rules_num; ++i) {
            auto access = reader.read_bytes_as<uint8_t>();
            if (access > static_cast<uint8_t>(FsAccess::EXECUTE)) {
                THROW_AS(ProtocolError, "invalid access mode: ", access);
            }
            profile.fs_allow.push_back({
                .path = std::string{reader.read_string(from<uint32_t>, MAX_MESSAGE_SIZE)},
                .access = static_cast<FsAccess>(access),
            });
        }
        profile.interpreter = read_strings(reader);
        profile.env = read_strings(reader);
        return profile;
    });
}

Job deserialize_job(const std::byte* data, size_t len) {
    return deserialize_body("Job", data, len, [](deserialize::Reader& reader) {
        Job job;
        reader.read(job.correlation_id, from<uint64_t>);
        reader.read(job.slot, from<uint32_t>);
        return job;
    });
}

JobDone deserialize_job_done(const std::byte* data, size_t len) {
    return deserialize_body("JobDone", data, len, [](deserialize::Reader& reader) {
        JobDone res;
        reader.read(res.correlation_id, from<uint64_t>);
        auto exited = reader.read_bytes_as<uint8_t>();
        if (exited > 1) {
            THROW_AS(ProtocolError, "invalid exited flag: ", exited);
        }
        res.exited = exited == 1;
        reader.read(res.exit_code, from<int32_t>);
        reader.read(res.signal, from<int32_t>);
        res.duration =
            std::chrono::microseconds{reader.read<int64_t>(casted_from<uint64_t>)};
        res.cpu_time =
            std::chrono::microseconds{reader.read<int64_t>(casted_from<uint64_t>)};
        reader.read(res.peak_memory_bytes, from<uint64_t>);
        return res;
    });
}

void send_message(
    int sock_fd, const std::vector<std::byte>& msg, int flags, const int* fds, size_t fds_len
) {
    if (msg.size() > MAX_MESSAGE_SIZE) {
        THROW("message is too big: ", msg.size(), " bytes");
    }
    auto rc = send_fds<2>(sock_fd, msg.data(), msg.size(), flags, fds, fds_len);
    if (rc < 0) {
        THROW("sendmsg()", errmsg());
    }
    if (static_cast<size_t>(rc) != msg.size()) {
        THROW("sendmsg() sent only ", rc, " of ", msg.size(), " bytes");
    }
}

std::optional<Message> recv_message(int sock_fd, int flags) {
    std::vector<std::byte> buff(MAX_MESSAGE_SIZE);
    std::vector<FileDescriptor> fds;
    auto rc = recv_fds<4>(sock_fd, buff.data(), buff.size(), flags | MSG_TRUNC, fds);
    if (rc < 0) {
        THROW("recvmsg()", errmsg());
    }
    if (rc == 0) {
        return std::nullopt;
    }
    if (static_cast<size_t>(rc) > buff.size()) {
        THROW_AS(ProtocolError, "message is too big: ", rc, " bytes");
    }
    auto kind = static_cast<MessageKind>(buff[0]);
    switch (kind) {
    case MessageKind::PROFILE:
    case MessageKind::JOB:
    case MessageKind::READY:
    case MessageKind::SETUP_ERROR:
    case MessageKind::JOB_DONE: break;
    default: THROW_AS(ProtocolError, "unknown message kind: ", static_cast<int>(buff[0]));
    }
    buff.resize(static_cast<size_t>(rc));
    buff.erase(buff.begin());
    return Message{
        .kind = kind,
        .body = std::move(buff),
        .fds = std::move(fds),
    };
}

} // namespace sandpool::worker_protocol
