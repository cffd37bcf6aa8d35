#include "utils/csv_exporter.hpp"
#include <fstream>

namespace transcode_bench {

std::string CsvExporter::escapeField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool CsvExporter::exportToFile(const std::vector<TestRecord>& records,
                               const std::string& path,
                               std::string& error) {
    std::ofstream file(path);
    if (!file.is_open()) {
        error = "Failed to open CSV file: " + path;
        return false;
    }

    file << "test_id,type,workers,passed,frame,speed,time_s,rss_kb,avg_fps,failure\n";

    for (const auto& record : records) {
        for (const auto& trial : record.result.trial_history) {
            file << escapeField(record.getIdString()) << ","
                 << escapeField(record.type) << ","
                 << trial.workers << ","
                 << (trial.passed ? "true" : "false") << ",";

            if (trial.aggregate) {
                const RunAggregate& agg = *trial.aggregate;
                file << agg.frame << ","
                     << agg.speed << ","
                     << agg.time_s << ","
                     << agg.rss_kb << ","
                     << agg.avg_fps << ",";
            } else {
                file << ",,,,,";
            }

            file << (trial.failure ? escapeField(trial.failure->message) : "") << "\n";
        }
    }

    if (!file.good()) {
        error = "Failed to write CSV file: " + path;
        return false;
    }

    return true;
}

} // namespace transcode_bench
