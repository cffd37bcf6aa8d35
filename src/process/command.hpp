#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <optional>
#include <string>
#include <vector>

namespace transcode_bench {

// Fully substituted argument vector for one encoder invocation
struct Command {
    std::vector<std::string> argv;

    bool empty() const { return argv.empty(); }

    // Arguments joined by spaces, for logs
    std::string toString() const;

    // Split a command line with POSIX shell quoting rules
    // Returns nullopt on unbalanced quotes or a trailing escape
    static std::optional<Command> parse(const std::string& command_line,
                                        std::string& error_message);
};

// Split a string into words the way a POSIX shell would (quotes, escapes),
// without any expansion
std::optional<std::vector<std::string>> splitArguments(const std::string& text,
                                                       std::string& error_message);

// Replace every occurrence of "{name}" with value
std::string substitutePlaceholder(std::string text, const std::string& name,
                                  const std::string& value);

} // namespace transcode_bench

#endif // COMMAND_HPP
