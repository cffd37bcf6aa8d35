#include "utils/output_formatter.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>

namespace {

void printInfoLine(const std::string& line) {
    std::cout << line << "\n";
    transcode_bench::Logger::info(line);
}

} // namespace

namespace transcode_bench {

void OutputFormatter::printHeader(const HostDescription& host,
                                  const std::optional<GpuDevice>& gpu,
                                  const std::vector<std::string>& device_types) {
    printInfoLine("OS: " + host.os_name);

    std::ostringstream cpu_line;
    cpu_line << "CPU: " << host.cpu_name
             << " (" << host.cpu_threads << " threads)";
    printInfoLine(cpu_line.str());

    if (host.memory_mb > 0) {
        printInfoLine("Memory: " + std::to_string(host.memory_mb) + " MB");
    }

    if (gpu) {
        std::string gpu_line = "GPU: " + gpu->product;
        if (!gpu->driver_version.empty()) {
            gpu_line += " (driver " + gpu->driver_version + ")";
        }
        printInfoLine(gpu_line);
    }

    std::string types_line = "Devices under test:";
    for (const auto& type : device_types) {
        types_line += " " + type;
    }
    printInfoLine(types_line);

    std::cout << "\n";
}

void OutputFormatter::printFileStart(const TestFile& file, const std::optional<VideoInfo>& video) {
    std::string line = "File: " + file.name;
    if (video) {
        line += " (" + video->getDescription() + ")";
    } else {
        line += " (unreadable)";
    }
    printInfoLine(line);
}

void OutputFormatter::printCommandStart(const TestCase& test, const std::string& type) {
    std::ostringstream line;
    line << "Test " << test.getIdString();
    if (!test.from_resolution.empty() || !test.to_resolution.empty()) {
        line << " (" << test.from_resolution << " -> " << test.to_resolution << ")";
    }
    line << " on " << type;
    printInfoLine(line.str());
}

void OutputFormatter::printTrialResult(const TrialRecord& record) {
    // Format: "  N workers: speed  X.XXx  fps  NN rss NNNNkB [status]"
    std::string worker_word = record.workers == 1 ? "worker: " : "workers:";

    std::ostringstream line;
    line << std::setw(3) << record.workers << " " << worker_word;

    if (record.aggregate) {
        const RunAggregate& agg = *record.aggregate;
        line << " speed " << std::setw(5) << std::fixed << std::setprecision(2) << agg.speed << "x"
             << "  fps " << std::setw(3) << static_cast<int>(agg.avg_fps)
             << " rss " << static_cast<int64_t>(agg.rss_kb) << "kB";
    } else if (record.failure) {
        line << " " << record.failure->message;
    }

    line << " " << record.getStatusSymbol();
    printInfoLine(line.str());
}

void OutputFormatter::printDriverLimit(const DriverLimit& limit) {
    std::ostringstream line;
    line << "GPU session probe: " << limit.observed_streams << " of "
         << limit.requested_streams << " sessions opened";
    switch (limit.status) {
        case DriverLimitStatus::Unlimited:
            line << " (no limit)";
            break;
        case DriverLimitStatus::Limited:
            line << " (limited to " << limit.observed_streams << ")";
            break;
        case DriverLimitStatus::Incapable:
            line << " (encoding unavailable)";
            break;
    }
    printInfoLine(line.str());
}

void OutputFormatter::printCommandSummary(const TestRecord& record) {
    const BenchmarkResult& result = record.result;

    std::ostringstream line;
    line << "Result: ";
    if (result.max_streams > 0) {
        line << result.max_streams << " concurrent stream"
             << (result.max_streams == 1 ? "" : "s") << " in real-time";
    } else {
        line << "no real-time stream";
    }
    if (result.best) {
        line << " (speed " << std::fixed << std::setprecision(2) << result.best->speed
             << "x, rss " << std::setprecision(0) << result.best->rss_kb << " kB)";
    }
    line << " [" << searchOutcomeName(result.outcome) << "]";

    for (const auto& reason : result.failure_reasons) {
        if (reason.kind != FailureKind::PerformanceFailure) {
            line << " " << reason.message;
        }
    }

    printInfoLine(line.str());
    std::cout << "\n";
}

void OutputFormatter::printSummary(const SessionResult& session) {
    int completed = 0;
    int failed = 0;
    for (const auto& record : session.records) {
        if (record.result.outcome == SearchOutcome::Converged ||
            record.result.outcome == SearchOutcome::Limited) {
            completed++;
        } else {
            failed++;
        }
    }

    std::ostringstream line;
    line << "Summary: " << session.records.size() << " test"
         << (session.records.size() == 1 ? "" : "s") << ", "
         << completed << " completed, " << failed << " failed";
    printInfoLine(line.str());
}

void OutputFormatter::printError(const std::string& message) {
    const std::string line = "Error: " + message;
    std::cerr << line << "\n";
    Logger::error(line);
}

void OutputFormatter::printInfo(const std::string& message) {
    printInfoLine(message);
}

} // namespace transcode_bench
