#include "worker/worker_thread.hpp"
#include "metrics/metrics_parser.hpp"
#include "process/process_runner.hpp"
#include "utils/error_log.hpp"
#include "utils/logger.hpp"

namespace transcode_bench {

WorkerThread::WorkerThread(int worker_id,
                           const Command& command,
                           std::chrono::milliseconds timeout,
                           ErrorLog* error_log,
                           std::atomic<bool>& stop_flag,
                           CompletionCallback on_complete)
    : worker_id_(worker_id)
    , command_(command)
    , timeout_(timeout)
    , error_log_(error_log)
    , stop_flag_(stop_flag)
    , on_complete_(std::move(on_complete))
    , result_{worker_id, false, false, std::nullopt, std::nullopt}
    , thread_([this] { run(); }) {
}

WorkerThread::~WorkerThread() {
    // jthread automatically joins on destruction
}

WorkerThreadResult WorkerThread::getResult() const {
    return result_;
}

void WorkerThread::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void WorkerThread::run() {
    ProcessRunner runner(command_, timeout_, error_log_);
    ProcessRunResult process = runner.run(&stop_flag_);

    if (process.cancelled) {
        result_.cancelled = true;
        result_.failure = process.failure;
    } else if (!process.success) {
        result_.failure = process.failure;
    } else {
        std::string error;
        auto metrics = MetricsParser::parse(process.output, error);
        if (!metrics) {
            result_.failure = FailureReason::parseError(error);
            if (error_log_) {
                error_log_->appendFailure(command_.toString(), process.output);
            }
        } else {
            if (metrics->sampled_lines == 0) {
                Logger::warn("Worker " + std::to_string(worker_id_) +
                             ": no progress line past frame " +
                             std::to_string(MetricsParser::kMinSampledFrame) +
                             ", reporting speed 0");
            }
            result_.metrics = *metrics;
            result_.success = true;
        }
    }

    if (on_complete_) {
        on_complete_(result_);
    }
}

} // namespace transcode_bench
