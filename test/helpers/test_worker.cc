// Stand-in for sandpool-worker without isolation. Executes the job's code as a list of
// ';'-separated commands:
//   echo:<text>   appends <text> to stdout
//   stderr:<text> appends <text> to stderr
//   big:<n>       appends <n> bytes to stdout
//   sleep:<ms>    sleeps
//   exit:<n>      sets the reported exit code
//   crash         kills the worker with SIGKILL
//   stamp         appends "<pid>:<executions so far>" to stdout
//   sync          calls sync(2), appends "EACCES" to stdout if it failed with EACCES
// With --seccomp the worker installs the worker filter and sends its notification listener
// along with readiness.
#include <charconv>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <sandpool/errmsg.hh>
#include <sandpool/isolation/worker_filter.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/sandbox_config.hh>
#include <sandpool/worker/job_loop.hh>
#include <sandpool/worker/protocol.hh>
#include <string>
#include <string_view>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <thread>
#include <unistd.h>

namespace wp = sandpool::worker_protocol;

namespace {

uint64_t executions = 0;

int parse_int(std::string_view str) {
    int res = 0;
    std::from_chars(str.data(), str.data() + str.size(), res);
    return res;
}

sandpool::worker::JobOutcome
execute(std::string_view code, sandpool::arena::SlotWriter& writer) {
    sandpool::worker::JobOutcome outcome;
    while (!code.empty()) {
        auto end = code.find(';');
        auto command = code.substr(0, end);
        code.remove_prefix(end == std::string_view::npos ? code.size() : end + 1);

        auto colon = command.find(':');
        auto name = command.substr(0, colon);
        auto arg = colon == std::string_view::npos ? std::string_view{} : command.substr(colon + 1);
        if (name == "echo") {
            writer.append_stdout(arg);
        } else if (name == "stderr") {
            writer.append_stderr(arg);
        } else if (name == "big") {
            writer.append_stdout(std::string(static_cast<size_t>(parse_int(arg)), 'x'));
        } else if (name == "sleep") {
            std::this_thread::sleep_for(std::chrono::milliseconds{parse_int(arg)});
        } else if (name == "exit") {
            outcome.exit_code = parse_int(arg);
        } else if (name == "crash") {
            (void)kill(getpid(), SIGKILL);
            pause();
        } else if (name == "stamp") {
            auto stamp = std::to_string(getpid()) + ':' + std::to_string(executions);
            writer.append_stdout(stamp);
        } else if (name == "sync") {
            if (syscall(SYS_sync) == -1 && errno == EACCES) {
                writer.append_stdout("EACCES");
            }
        } else {
            writer.append_stderr("unknown command: ");
            writer.append_stderr(command);
            outcome.exit_code = 127;
        }
    }
    ++executions;
    return outcome;
}

void send_ready(bool with_seccomp) {
    if (!with_seccomp) {
        wp::send_message(wp::CONTROL_FD, wp::serialize_ready(), 0);
        return;
    }
    auto bpf = sandpool::seccomp::build_worker_filter(sandpool::SandboxConfig{});
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
        THROW("prctl(PR_SET_NO_NEW_PRIVS)", errmsg());
    }
    auto listener = sandpool::seccomp::install_filter_with_listener(bpf);
    int listener_fd = listener;
    wp::send_message(wp::CONTROL_FD, wp::serialize_ready(), 0, &listener_fd, 1);
}

} // namespace

int main(int argc, char** argv) {
    try {
        send_ready(argc > 1 && std::string_view{argv[1]} == "--seccomp");
        sandpool::worker::serve_jobs(wp::CONTROL_FD, execute);
    } catch (const std::exception& e) {
        (void)fprintf(stderr, "test_worker: %s\n", e.what());
        return 1;
    }
    return 0;
}
