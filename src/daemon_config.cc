#include <cstdlib>
#include <sandpool/daemon_config.hh>
#include <sandpool/errors.hh>
#include <sandpool/logger.hh>
#include <sandpool/macros/throw.hh>
#include <sys/stat.h>

using std::string;

namespace {

constexpr const char* sandbox_vars[] = {
    "timeout_ms",
    "memory_limit",
    "cpu_quota",
    "max_processes",
    "network",
    "fs_allow",
    "runtime_paths",
    "interpreter",
    "env",
    "mount_proc",
    "work_dir_size",
    "max_open_files",
    "max_output_bytes",
    "max_code_bytes",
    "supervisor_allow",
};

constexpr const char* daemon_vars[] = {
    "socket_path",
    "worker_executable",
    "cgroup_root",
    "pool_size",
    "recycle_after",
    "queue_capacity",
    "arena_slots",
    "setup_timeout_ms",
    "require_full_pool",
    "max_frame_bytes",
    "log_file",
    "error_log_file",
};

class Loader {
    const ConfigFile& cf_;

public:
    explicit Loader(const ConfigFile& cf) noexcept : cf_{cf} {}

    template <class T>
    void load(T& dest, const char* name) const {
        const auto& var = cf_[name];
        if (!var.is_set()) {
            return;
        }
        if (var.is_array()) {
            THROW_AS(sandpool::ConfigError, name, ": expected a single value, got an array");
        }
        if constexpr (std::is_same_v<T, bool>) {
            auto val = var.as_bool();
            if (!val) {
                THROW_AS(sandpool::ConfigError, name, ": expected a boolean, got: ", var.as_string());
            }
            dest = *val;
        } else if constexpr (std::is_arithmetic_v<T>) {
            auto val = var.as<T>();
            if (!val) {
                THROW_AS(sandpool::ConfigError, name, ": expected a number, got: ", var.as_string());
            }
            dest = *val;
        } else {
            dest = var.as_string();
        }
    }

    void load(std::chrono::milliseconds& dest, const char* name) const {
        auto ms = static_cast<uint64_t>(dest.count());
        load(ms, name);
        dest = std::chrono::milliseconds{ms};
    }

    void load_array(std::vector<string>& dest, const char* name) const {
        const auto& var = cf_[name];
        if (!var.is_set()) {
            return;
        }
        if (!var.is_array()) {
            THROW_AS(sandpool::ConfigError, name, ": expected an array");
        }
        dest = var.as_array();
    }
};

} // namespace

namespace sandpool {

void add_daemon_config_vars(ConfigFile& cf) {
    for (const char* name : daemon_vars) {
        cf.add_vars(name);
    }
    for (const char* name : sandbox_vars) {
        cf.add_vars(name);
    }
}

DaemonConfig daemon_config_from(const ConfigFile& cf) {
    DaemonConfig config;
    Loader loader{cf};
    loader.load(config.socket_path, "socket_path");
    loader.load(config.worker_executable, "worker_executable");
    loader.load(config.cgroup_root, "cgroup_root");
    loader.load(config.pool_size, "pool_size");
    loader.load(config.recycle_after, "recycle_after");
    loader.load(config.queue_capacity, "queue_capacity");
    loader.load(config.arena_slots, "arena_slots");
    loader.load(config.setup_timeout, "setup_timeout_ms");
    loader.load(config.require_full_pool, "require_full_pool");
    loader.load(config.max_frame_bytes, "max_frame_bytes");
    loader.load(config.log_file, "log_file");
    loader.load(config.error_log_file, "error_log_file");

    auto& sandbox = config.sandbox;
    loader.load(sandbox.timeout, "timeout_ms");
    loader.load(sandbox.memory_limit, "memory_limit");
    loader.load(sandbox.cpu_quota, "cpu_quota");
    loader.load(sandbox.max_processes, "max_processes");
    loader.load(sandbox.network, "network");
    loader.load(sandbox.mount_proc, "mount_proc");
    loader.load(sandbox.work_dir_size, "work_dir_size");
    loader.load(sandbox.max_open_files, "max_open_files");
    loader.load(sandbox.max_output_bytes, "max_output_bytes");
    loader.load(sandbox.max_code_bytes, "max_code_bytes");
    loader.load_array(sandbox.interpreter, "interpreter");
    loader.load_array(sandbox.env, "env");
    loader.load_array(sandbox.supervisor_allow, "supervisor_allow");

    std::vector<string> fs_allow;
    loader.load_array(fs_allow, "fs_allow");
    for (const auto& entry : fs_allow) {
        sandbox.fs_allow.emplace_back(parse_fs_rule(entry));
    }

    loader.load_array(sandbox.runtime_paths, "runtime_paths");
    std::erase_if(sandbox.runtime_paths, [](const string& path) {
        struct stat64 st;
        if (stat64(path.c_str(), &st) == 0) {
            return false;
        }
        stdlog("warning: runtime path ", path, " does not exist, skipping it");
        return true;
    });

    if (const char* socket_path = std::getenv(socket_path_env_var);
        socket_path != nullptr && *socket_path != '\0')
    {
        config.socket_path = socket_path;
    }
    return config;
}

DaemonConfig load_daemon_config(const char* path) {
    ConfigFile cf;
    add_daemon_config_vars(cf);
    try {
        cf.load_config_from_file(path);
    } catch (const ConfigFile::ParseError& e) {
        THROW_AS(ConfigError, path, ':', e.what(), '\n', e.diagnostics());
    }
    auto config = daemon_config_from(cf);
    validate(config);
    return config;
}

DaemonConfig load_daemon_config_from_string(std::string_view config_str) {
    ConfigFile cf;
    add_daemon_config_vars(cf);
    try {
        cf.load_config_from_string(config_str);
    } catch (const ConfigFile::ParseError& e) {
        THROW_AS(ConfigError, e.what(), '\n', e.diagnostics());
    }
    auto config = daemon_config_from(cf);
    validate(config);
    return config;
}

void validate(const DaemonConfig& config) {
    if (config.socket_path.empty() || config.socket_path.size() >= 108) {
        THROW_AS(ConfigError, "socket_path has to be non-empty and shorter than 108 bytes");
    }
    if (!config.worker_executable.empty() && config.worker_executable[0] != '/') {
        THROW_AS(ConfigError, "worker_executable has to be an absolute path");
    }
    if (!config.cgroup_root.empty() && !is_normalized_absolute_path(config.cgroup_root)) {
        THROW_AS(ConfigError, "cgroup_root has to be a normalized absolute path");
    }
    if (config.pool_size == 0) {
        THROW_AS(ConfigError, "pool_size has to be positive");
    }
    if (config.pool_size > 4096) {
        THROW_AS(ConfigError, "pool_size cannot exceed 4096");
    }
    if (config.recycle_after == 0) {
        THROW_AS(ConfigError, "recycle_after has to be positive");
    }
    if (config.queue_capacity > (uint32_t{1} << 20)) {
        THROW_AS(ConfigError, "queue_capacity cannot exceed ", uint32_t{1} << 20);
    }
    // Every accepted job holds a slot until its result is released
    auto in_flight_max = uint64_t{config.pool_size} + config.queue_capacity;
    if (config.arena_slots != 0 && config.arena_slots < in_flight_max) {
        THROW_AS(
            ConfigError,
            "arena_slots (",
            config.arena_slots,
            ") cannot be smaller than pool_size + queue_capacity (",
            in_flight_max,
            ")"
        );
    }
    if (config.setup_timeout.count() <= 0) {
        THROW_AS(ConfigError, "setup_timeout_ms has to be positive");
    }
    if (config.max_frame_bytes != 0 && config.max_frame_bytes < config.sandbox.max_code_bytes + 64) {
        THROW_AS(ConfigError, "max_frame_bytes is too small to carry max_code_bytes of code");
    }
    validate(config.sandbox);
}

} // namespace sandpool
