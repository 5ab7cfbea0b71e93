#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <optional>
#include <sandpool/cli/exit_codes.hh>
#include <sandpool/errors.hh>
#include <sandpool/file_contents.hh>
#include <sandpool/logger.hh>
#include <sandpool/transport/client.hh>
#include <sandpool/write_exact.hh>
#include <string>
#include <string_view>
#include <unistd.h>

using sandpool::cli::ExitCode;

namespace {

void print_usage(const char* program) {
    errlog(
        "Usage: ", program, " [--timeout <ms>] <command>\n",
        "Commands:\n",
        "  exec <code>   executes <code>\n",
        "  run <file|->  executes contents of <file> or of the standard input\n",
        "  status        prints the pool status\n",
        "  ping          checks whether the daemon responds"
    );
}

std::optional<uint32_t> parse_timeout(std::string_view str) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

ExitCode execute(
    sandpool::Client& client, std::string_view code, std::optional<std::chrono::milliseconds> timeout
) {
    auto res = client.execute(code, timeout);
    if (write_all(STDOUT_FILENO, res.stdout_data) != res.stdout_data.size() ||
        write_all(STDERR_FILENO, res.stderr_data) != res.stderr_data.size())
    {
        return sandpool::cli::EXIT_INTERNAL;
    }

    const auto& r = res.result;
    if (r.status != sandpool::ExecutionStatus::COMPLETED || r.exit_code != 0) {
        errlog(
            "sandpool: ", to_str(r.status), " exit_code=", r.exit_code, " signal=", r.signal,
            " duration_us=", r.duration.count(), " denied_syscalls=", r.denied_syscalls_count,
            r.stdout_ref.truncated ? " (stdout truncated)" : "",
            r.stderr_ref.truncated ? " (stderr truncated)" : "",
            r.message.empty() ? "" : ": ", r.message
        );
    }
    return sandpool::cli::exit_code_for(r);
}

void print_status(const sandpool::PoolStatus& s) {
    stdlog.use(stdout);
    stdlog.label(false);
    stdlog(
        "pool_size: ", s.pool_size, "\nhealthy: ", s.healthy, "\nidle: ", s.idle, "\nbusy: ", s.busy,
        "\npending: ", s.pending, "\nspawning: ", s.spawning, "\nrecycle_after: ", s.recycle_after,
        "\nuptime: ", s.uptime.count(), "s\nexecutions: ", s.executions, "\ncrashed: ", s.crashed,
        "\nrecycled: ", s.recycled, "\ntimed_out: ", s.timed_out, "\nrejected: ", s.rejected,
        "\nfailed_spawns: ", s.failed_spawns
    );
}

} // namespace

int main(int argc, char** argv) {
    errlog.label(false);

    int arg = 1;
    std::optional<std::chrono::milliseconds> timeout;
    if (arg + 1 < argc && strcmp(argv[arg], "--timeout") == 0) {
        auto ms = parse_timeout(argv[arg + 1]);
        if (!ms) {
            errlog("sandpool: invalid timeout: ", argv[arg + 1]);
            return sandpool::cli::EXIT_USAGE;
        }
        timeout = std::chrono::milliseconds{*ms};
        arg += 2;
    }
    if (arg >= argc) {
        print_usage(argv[0]);
        return sandpool::cli::EXIT_USAGE;
    }

    std::string_view command = argv[arg++];
    int args_left = argc - arg;
    bool valid = (command == "exec" && args_left == 1) || (command == "run" && args_left == 1) ||
        (command == "status" && args_left == 0) || (command == "ping" && args_left == 0);
    if (!valid) {
        print_usage(argv[0]);
        return sandpool::cli::EXIT_USAGE;
    }

    try {
        std::string code;
        if (command == "run") {
            code = std::string_view{argv[arg]} == "-" ? get_file_contents(STDIN_FILENO)
                                                       : get_file_contents(argv[arg]);
        }

        sandpool::Client client{sandpool::Client::socket_path_from_env()};
        if (command == "exec") {
            return execute(client, argv[arg], timeout);
        }
        if (command == "run") {
            return execute(client, code, timeout);
        }
        if (command == "status") {
            print_status(client.status());
            return sandpool::cli::EXIT_OK;
        }
        client.ping();
        return sandpool::cli::EXIT_OK;
    } catch (const sandpool::DaemonUnreachable& e) {
        errlog("sandpool: daemon unreachable: ", e.what());
        return sandpool::cli::EXIT_UNREACHABLE;
    } catch (const std::exception& e) {
        errlog("sandpool: ", e.what());
        return sandpool::cli::EXIT_INTERNAL;
    }
}
