#include <sandpool/errors.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/worker/job_loop.hh>
#include <sandpool/worker/protocol.hh>

namespace wp = sandpool::worker_protocol;

namespace sandpool::worker {

void serve_jobs(int control_fd, const JobExecutor& executor) {
    for (;;) {
        auto msg = wp::recv_message(control_fd, 0);
        if (!msg) {
            return; // the manager is gone
        }
        if (msg->kind != wp::MessageKind::JOB) {
            THROW_AS(ProtocolError, "unexpected message: ", wp::to_str(msg->kind));
        }
        if (msg->fds.size() != 1) {
            THROW_AS(ProtocolError, "Job carries ", msg->fds.size(), " descriptors instead of 1");
        }
        auto job = wp::deserialize_job(msg->body.data(), msg->body.size());

        auto start = std::chrono::steady_clock::now();
        JobOutcome outcome;
        {
            arena::MappedSlot slot{msg->fds[0], true};
            msg->fds.clear();
            arena::SlotWriter writer{slot, job.correlation_id};
            outcome = executor(writer.request(), writer);
            writer.finish();
        }
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start
        );

        wp::send_message(
            control_fd,
            wp::serialize(wp::JobDone{
                .correlation_id = job.correlation_id,
                .exited = outcome.exited,
                .exit_code = outcome.exit_code,
                .signal = outcome.signal,
                .duration = duration,
                .cpu_time = outcome.cpu_time,
                .peak_memory_bytes = outcome.peak_memory_bytes,
            }),
            0
        );
    }
}

} // namespace sandpool::worker
