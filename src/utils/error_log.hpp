#ifndef ERROR_LOG_HPP
#define ERROR_LOG_HPP

#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace transcode_bench {

// Append-only log of raw encoder output from failed runs.
// Each block is framed by the command that produced it; blocks are grouped
// under the name of the test file being benchmarked.
// Safe to call from several worker threads at once.
class ErrorLog {
public:
    // Create (truncate) the log file, creating parent directories as needed
    static std::unique_ptr<ErrorLog> open(const std::string& path, std::string& error_message);

    ~ErrorLog();

    ErrorLog(const ErrorLog&) = delete;
    ErrorLog& operator=(const ErrorLog&) = delete;

    // Start a section for one test file
    void setTestHeader(std::string_view header);

    // Record the command about to be benchmarked
    void setTestArgs(std::string_view command);

    // Record the captured output of a failed run of command
    void appendFailure(std::string_view command, std::string_view output);

    const std::string& path() const { return path_; }

private:
    ErrorLog(std::string path, std::shared_ptr<spdlog::logger> logger);

    std::string path_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace transcode_bench

#endif // ERROR_LOG_HPP
