#include <csignal>
#include <fcntl.h>
#include <limits.h>
#include <sandpool/call_in_destructor.hh>
#include <sandpool/daemon/server.hh>
#include <sandpool/daemon_config.hh>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/isolation/cgroups.hh>
#include <sandpool/isolation/profile_builder.hh>
#include <sandpool/isolation/worker_filter.hh>
#include <sandpool/logger.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/pool/pool_manager.hh>
#include <sandpool/supervisor/policy.hh>
#include <sandpool/supervisor/syscall_supervisor.hh>
#include <sandpool/transport/result_arena.hh>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

constexpr int EXIT_CONFIG_ERROR = 2;

// "sandpool-worker" next to our executable
std::string default_worker_executable() {
    char buff[PATH_MAX];
    auto len = readlink("/proc/self/exe", buff, sizeof(buff));
    if (len < 0) {
        THROW("readlink(/proc/self/exe)", errmsg());
    }
    std::string path{buff, static_cast<size_t>(len)};
    path.resize(path.rfind('/') + 1);
    return path + "sandpool-worker";
}

int run_daemon(const sandpool::DaemonConfig& config, sigset_t signals) {
    using namespace sandpool; // NOLINT(google-build-using-namespace)

    auto sigfd = FileDescriptor{signalfd(-1, &signals, SFD_CLOEXEC)};
    if (!sigfd.is_open()) {
        THROW("signalfd()", errmsg());
    }

    auto cgroup_tree = cgroups::CgroupTree::prepare(config.cgroup_root);
    stdlog("cgroup tree: ", cgroup_tree.path());

    auto policy = supervisor::PolicyTable::from_config(config.sandbox);
    supervisor::SyscallSupervisor syscall_supervisor{std::move(policy)};

    arena::ResultArena arena{
        config.effective_arena_slots(),
        {
            .request_capacity = config.sandbox.max_code_bytes,
            .output_capacity = config.sandbox.max_output_bytes,
        },
    };

    IsolationProfileBuilder builder{
        cgroup_tree,
        config.sandbox,
        seccomp::build_worker_filter(config.sandbox),
        config.worker_executable.empty() ? default_worker_executable() : config.worker_executable,
        config.setup_timeout,
    };
    PoolManager pool{PoolConfig::from(config), builder, arena, &syscall_supervisor};
    syscall_supervisor.set_violation_handler([&pool](uint64_t worker_key, const std::string& reason) {
        pool.report_violation(worker_key, reason);
    });
    syscall_supervisor.start();
    // The supervisor thread calls into the pool, so it has to stop before the pool is destroyed
    // on every exit path
    CallInDtor supervisor_stopper{[&syscall_supervisor]() noexcept { syscall_supervisor.stop(); }};

    auto report = pool.start();
    for (const auto& error : report.errors) {
        errlog("startup: ", error);
    }
    if (report.healthy == 0) {
        errlog("no worker could be started, giving up");
        pool.shutdown();
        return 1;
    }
    if (report.failed > 0) {
        if (config.require_full_pool) {
            errlog(report.failed, " of ", config.pool_size, " workers failed to start and require_full_pool is set");
            pool.shutdown();
            return 1;
        }
        errlog("warning: running with ", report.healthy, " of ", config.pool_size, " workers");
    }

    Server server{config.socket_path, config.effective_max_frame_bytes(), pool, arena};
    stdlog("sandpoold ready: pid ", getpid(), ", ", report.healthy, " workers");
    server.run(sigfd);

    stdlog("shutting down");
    pool.shutdown();
    server.close_connections();
    stdlog("sandpoold has shut down");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        errlog("Usage: ", argv[0], " [config file]");
        return EXIT_CONFIG_ERROR;
    }

    sandpool::DaemonConfig config;
    try {
        config = argc == 2 ? sandpool::load_daemon_config(argv[1])
                           : sandpool::load_daemon_config_from_string("");
    } catch (const sandpool::ConfigError& e) {
        errlog("Invalid configuration: ", e.what());
        return EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        errlog("Failed to load the configuration: ", e.what());
        return EXIT_CONFIG_ERROR;
    }

    try {
        if (!config.log_file.empty()) {
            stdlog.open(config.log_file.c_str());
        }
        if (!config.error_log_file.empty()) {
            errlog.open(config.error_log_file.c_str());
        }
    } catch (const std::exception& e) {
        errlog("Failed to open the log file: ", e.what());
        return 1;
    }

    // Block the signals before any thread starts so that all threads inherit the mask
    sigset_t signals;
    sigemptyset(&signals);
    if (sigaddset(&signals, SIGINT) || sigaddset(&signals, SIGTERM) || sigaddset(&signals, SIGQUIT)) {
        errlog("sigaddset()", errmsg());
        return 1;
    }
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr)) {
        errlog("pthread_sigmask()", errmsg());
        return 1;
    }
    // Broken client connections are reported by send()
    if (signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        errlog("signal()", errmsg());
        return 1;
    }

    try {
        return run_daemon(config, signals);
    } catch (const sandpool::ConfigError& e) {
        errlog("Invalid configuration: ", e.what());
        return EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        errlog("Fatal error: ", e.what());
        return 1;
    }
}
