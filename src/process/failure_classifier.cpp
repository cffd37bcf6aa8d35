#include "process/failure_classifier.hpp"
#include <array>
#include <regex>
#include <sstream>
#include <vector>

namespace transcode_bench {
namespace {

struct ClassifierRule {
    const char* pattern;
    size_t group;   // Capture group holding the reason
};

// Order matters: the first rule matching any line wins
constexpr std::array<ClassifierRule, 4> kRules = {{
    {R"( failed: (.*)\([0-9]+\))", 1},
    {R"( failed -> (.*): (.*))", 2},
    {R"( failed!: (.*) \([0-9]+\))", 1},
    {R"(^Error (.*))", 1},
}};

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

const std::vector<std::regex>& compiledRules() {
    static const std::vector<std::regex> rules = [] {
        std::vector<std::regex> compiled;
        compiled.reserve(kRules.size());
        for (const auto& rule : kRules) {
            compiled.emplace_back(rule.pattern, std::regex::ECMAScript);
        }
        return compiled;
    }();
    return rules;
}

} // namespace

std::optional<std::string> FailureClassifier::extractReason(const std::string& output) {
    const auto& rules = compiledRules();

    // Every pattern is confined to one line, so matching line by line keeps
    // "^" anchored at line starts
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }

    for (size_t i = 0; i < kRules.size(); i++) {
        for (const auto& text : lines) {
            std::smatch match;
            if (std::regex_search(text, match, rules[i])) {
                return trim(match[kRules[i].group].str());
            }
        }
    }
    return std::nullopt;
}

FailureReason FailureClassifier::classify(const std::string& output) {
    auto reason = extractReason(output);
    if (reason && !reason->empty()) {
        return FailureReason::processError(*reason);
    }
    return FailureReason::processError(kUnclassifiedMessage, output);
}

} // namespace transcode_bench
