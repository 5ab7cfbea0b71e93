#pragma once

#include <chrono>
#include <cstdint>
#include <sandpool/config_file.hh>
#include <sandpool/sandbox_config.hh>
#include <string>

namespace sandpool {

constexpr const char* default_socket_path = "/run/sandpool/sandpool.sock";
// Overrides socket_path of the config file
constexpr const char* socket_path_env_var = "SANDPOOL_SOCKET";

struct DaemonConfig {
    std::string socket_path = default_socket_path;
    // Empty means "sandpool-worker" next to the daemon executable
    std::string worker_executable;
    // Empty means the cgroup of the daemon process
    std::string cgroup_root;
    uint32_t pool_size = 4;
    uint64_t recycle_after = 100;
    uint32_t queue_capacity = 64;
    // 0 means twice pool_size + queue_capacity, held results count against it as well
    uint32_t arena_slots = 0;
    std::chrono::milliseconds setup_timeout{5000};
    bool require_full_pool = false;
    // 0 means derived from sandbox.max_code_bytes
    uint32_t max_frame_bytes = 0;
    std::string log_file;
    std::string error_log_file;
    SandboxConfig sandbox;

    [[nodiscard]] uint32_t effective_max_frame_bytes() const noexcept {
        return max_frame_bytes != 0 ? max_frame_bytes : sandbox.max_code_bytes + 4096;
    }

    [[nodiscard]] uint32_t effective_arena_slots() const noexcept {
        return arena_slots != 0 ? arena_slots : (pool_size + queue_capacity) * 2;
    }
};

// Registers all recognized variables in @p cf
void add_daemon_config_vars(ConfigFile& cf);

/**
 * @brief Builds DaemonConfig out of loaded @p cf. Unset variables keep their defaults.
 * @details Runtime paths that do not exist on the host are dropped with a warning. The
 *   SANDPOOL_SOCKET environment variable overrides socket_path.
 *
 * @errors Throws ConfigError upon invalid values and invalid combinations of values
 */
[[nodiscard]] DaemonConfig daemon_config_from(const ConfigFile& cf);

// Loads and validates the config file @p path, ConfigFile::ParseError is converted to ConfigError
[[nodiscard]] DaemonConfig load_daemon_config(const char* path);

// Same as load_daemon_config() but from a string
[[nodiscard]] DaemonConfig load_daemon_config_from_string(std::string_view config);

// Throws ConfigError describing the first problem found
void validate(const DaemonConfig& config);

} // namespace sandpool
