#include "process/command.hpp"
#include <cctype>

namespace transcode_bench {

std::string Command::toString() const {
    std::string line;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) line += ' ';
        line += argv[i];
    }
    return line;
}

std::optional<Command> Command::parse(const std::string& command_line,
                                      std::string& error_message) {
    auto words = splitArguments(command_line, error_message);
    if (!words) {
        return std::nullopt;
    }
    if (words->empty()) {
        error_message = "Empty command";
        return std::nullopt;
    }
    Command command;
    command.argv = std::move(*words);
    return command;
}

std::optional<std::vector<std::string>> splitArguments(const std::string& text,
                                                       std::string& error_message) {
    enum class State { Normal, SingleQuote, DoubleQuote };

    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    State state = State::Normal;

    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];

        switch (state) {
            case State::Normal:
                if (std::isspace(static_cast<unsigned char>(c))) {
                    if (in_word) {
                        words.push_back(std::move(current));
                        current.clear();
                        in_word = false;
                    }
                } else if (c == '\'') {
                    state = State::SingleQuote;
                    in_word = true;
                } else if (c == '"') {
                    state = State::DoubleQuote;
                    in_word = true;
                } else if (c == '\\') {
                    if (i + 1 >= text.size()) {
                        error_message = "Trailing escape character in command";
                        return std::nullopt;
                    }
                    current += text[++i];
                    in_word = true;
                } else {
                    current += c;
                    in_word = true;
                }
                break;

            case State::SingleQuote:
                if (c == '\'') {
                    state = State::Normal;
                } else {
                    current += c;
                }
                break;

            case State::DoubleQuote:
                if (c == '"') {
                    state = State::Normal;
                } else if (c == '\\' && i + 1 < text.size() &&
                           (text[i + 1] == '"' || text[i + 1] == '\\' ||
                            text[i + 1] == '$' || text[i + 1] == '`')) {
                    current += text[++i];
                } else {
                    current += c;
                }
                break;
        }
    }

    if (state != State::Normal) {
        error_message = "Unbalanced quotes in command";
        return std::nullopt;
    }

    if (in_word) {
        words.push_back(std::move(current));
    }

    return words;
}

std::string substitutePlaceholder(std::string text, const std::string& name,
                                  const std::string& value) {
    const std::string token = "{" + name + "}";
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
    return text;
}

} // namespace transcode_bench
