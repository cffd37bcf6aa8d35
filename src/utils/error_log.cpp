#include "utils/error_log.hpp"
#include "transcode_bench/version.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace transcode_bench {
namespace {

constexpr const char* kErrorLoggerName = "encoder_error_log";

std::string currentTimeString() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%a %b %d %H:%M:%S %Y");
    return oss.str();
}

} // namespace

std::unique_ptr<ErrorLog> ErrorLog::open(const std::string& path, std::string& error_message) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error_message = "Failed to create directory " + parent.string() + ": " + ec.message();
            return nullptr;
        }
    }

    try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
        file_sink->set_pattern("%v");

        auto logger = std::make_shared<spdlog::logger>(kErrorLoggerName, file_sink);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->info("{}: encoder error log from {}", PROGRAM_NAME, currentTimeString());

        return std::unique_ptr<ErrorLog>(new ErrorLog(path, std::move(logger)));
    } catch (const spdlog::spdlog_ex& ex) {
        error_message = ex.what();
        return nullptr;
    }
}

ErrorLog::ErrorLog(std::string path, std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(path)), logger_(std::move(logger)) {
}

ErrorLog::~ErrorLog() {
    logger_->flush();
}

void ErrorLog::setTestHeader(std::string_view header) {
    logger_->info("{}", header);
}

void ErrorLog::setTestArgs(std::string_view command) {
    logger_->info("    -> {}", command);
}

void ErrorLog::appendFailure(std::string_view command, std::string_view output) {
    // One message per block so concurrent workers never interleave lines
    std::string block = "    -> " + std::string(command);

    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\n', start);
        if (end == std::string_view::npos) {
            end = output.size();
        }
        std::string_view line = output.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        block += "\n        -| ";
        block += line;
        start = end + 1;
    }
    block += "\n        ----";

    logger_->info("{}", block);
}

} // namespace transcode_bench
