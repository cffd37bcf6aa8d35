#include "utils/result_writer.hpp"
#include "monitor/system_info.hpp"
#include <filesystem>
#include <fstream>

namespace transcode_bench {

namespace {

constexpr int kJsonIndent = 4;

nlohmann::json optionalInt(const std::optional<int>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json trialToJson(const TrialRecord& trial) {
    nlohmann::json run = {
        {"workers", trial.workers},
        {"passed", trial.passed},
    };
    if (trial.aggregate) {
        run["frame"] = trial.aggregate->frame;
        run["speed"] = trial.aggregate->speed;
        run["time_s"] = trial.aggregate->time_s;
        run["rss_kb"] = trial.aggregate->rss_kb;
        run["avgFPS"] = trial.aggregate->avg_fps;
    }
    if (trial.failure) {
        run["failure"] = trial.failure->message;
        run["failure_kind"] = trial.failure->getKindName();
    }
    return run;
}

nlohmann::json gpuToJson(const GpuDevice& gpu) {
    return {
        {"vendor", gpu.vendor},
        {"product", gpu.product},
        {"businfo", gpu.bus_info},
        {"driver_version", gpu.driver_version},
    };
}

} // namespace

HostDescription HostDescription::collect(const std::optional<HardwareInfo>& hardware) {
    HostDescription host;
    host.os_name = SystemInfo::getOsName();
    host.cpu_name = SystemInfo::getCpuName();
    host.cpu_threads = SystemInfo::getThreadCount();
    host.memory_mb = SystemInfo::getTotalMemoryMB();
    if (hardware) {
        host.gpus = hardware->gpus;
    }
    return host;
}

nlohmann::json ResultWriter::recordToJson(const TestRecord& record) {
    const BenchmarkResult& result = record.result;

    nlohmann::json runs = nlohmann::json::array();
    for (const auto& trial : result.trial_history) {
        runs.push_back(trialToJson(trial));
    }

    nlohmann::json reasons = nlohmann::json::array();
    for (const auto& reason : result.failure_reasons) {
        reasons.push_back(reason.message);
    }

    nlohmann::json results = {
        {"max_streams", result.max_streams},
        {"outcome", searchOutcomeName(result.outcome)},
        {"failure_reasons", reasons},
        {"single_worker_speed", nullptr},
        {"single_worker_rss_kb", nullptr},
    };
    // The single_worker_* names are kept for the upload format; the values
    // come from the run at max_streams
    if (result.best) {
        results["single_worker_speed"] = result.best->speed;
        results["single_worker_rss_kb"] = result.best->rss_kb;
    }

    return {
        {"id", record.id},
        {"type", record.type},
        {"selected_gpu", optionalInt(record.selected_gpu)},
        {"selected_cpu", optionalInt(record.selected_cpu)},
        {"runs", runs},
        {"results", results},
    };
}

nlohmann::json ResultWriter::toJson(const TestSuite& suite,
                                    const HostDescription& host,
                                    const SessionResult& session) {
    nlohmann::json gpus = nlohmann::json::array();
    for (const auto& gpu : host.gpus) {
        gpus.push_back(gpuToJson(gpu));
    }

    nlohmann::json hwinfo = {
        {"ffmpeg", suite.ffmpeg_info},
        {"os", host.os_name},
        {"cpu", nlohmann::json::array({{{"product", host.cpu_name},
                                        {"cores", host.cpu_threads}}})},
        {"memory_mb", host.memory_mb},
        {"gpu", gpus},
    };

    nlohmann::json tests = nlohmann::json::array();
    for (const auto& record : session.records) {
        tests.push_back(recordToJson(record));
    }

    return {
        {"token", suite.token},
        {"hwinfo", hwinfo},
        {"tests", tests},
    };
}

bool ResultWriter::writeToFile(const nlohmann::json& document,
                               const std::string& path,
                               std::string& error) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Failed to create directory " + target.parent_path().string() +
                    ": " + ec.message();
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        error = "Failed to open result file: " + path;
        return false;
    }

    file << document.dump(kJsonIndent) << "\n";

    if (!file.good()) {
        error = "Failed to write result file: " + path;
        return false;
    }

    return true;
}

} // namespace transcode_bench
