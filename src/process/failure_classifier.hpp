#ifndef FAILURE_CLASSIFIER_HPP
#define FAILURE_CLASSIFIER_HPP

#include "benchmark/benchmark_result.hpp"
#include <optional>
#include <string>

namespace transcode_bench {

// Turns the output of an encoder that exited with an error status into a
// short reason. Rules are tried in a fixed order; the first rule that matches
// anywhere in the output wins.
class FailureClassifier {
public:
    static FailureReason classify(const std::string& output);

    // Reason text of the first matching rule, or nullopt
    static std::optional<std::string> extractReason(const std::string& output);

    static constexpr const char* kUnclassifiedMessage = "unclassified process failure";
};

} // namespace transcode_bench

#endif // FAILURE_CLASSIFIER_HPP
