#ifndef CSV_EXPORTER_HPP
#define CSV_EXPORTER_HPP

#include "benchmark/benchmark_runner.hpp"
#include <string>
#include <vector>

namespace transcode_bench {

// One row per trial of every record
class CsvExporter {
public:
    static bool exportToFile(const std::vector<TestRecord>& records,
                             const std::string& path,
                             std::string& error);

    // Quote a field if it contains a delimiter, quote or newline
    static std::string escapeField(const std::string& field);
};

} // namespace transcode_bench

#endif // CSV_EXPORTER_HPP
