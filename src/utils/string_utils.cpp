/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers and shell-word tokenization
 *
 * @date 2025
 */

#include "bastion/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace bastion {
namespace utils {

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& parts,
                              const std::string& separator) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

std::string StringUtils::CollapseWhitespace(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    bool pending_space = false;

    for (unsigned char c : str) {
        if (std::isspace(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !result.empty()) {
            result += ' ';
        }
        pending_space = false;
        result += static_cast<char>(c);
    }

    return result;
}

// ============================================================================
// SHELL TOKENIZATION
// ============================================================================
// Subset of POSIX word splitting: quoting and escapes, no expansions

std::optional<std::vector<std::string>> StringUtils::ShellSplit(const std::string& command) {
    enum class State { NORMAL, SINGLE_QUOTED, DOUBLE_QUOTED };

    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    State state = State::NORMAL;

    for (std::size_t i = 0; i < command.size(); ++i) {
        char c = command[i];

        switch (state) {
            case State::NORMAL:
                if (std::isspace(static_cast<unsigned char>(c))) {
                    if (in_word) {
                        words.push_back(current);
                        current.clear();
                        in_word = false;
                    }
                } else if (c == '\'') {
                    state = State::SINGLE_QUOTED;
                    in_word = true;
                } else if (c == '"') {
                    state = State::DOUBLE_QUOTED;
                    in_word = true;
                } else if (c == '\\') {
                    if (i + 1 >= command.size()) {
                        return std::nullopt;
                    }
                    current += command[++i];
                    in_word = true;
                } else {
                    current += c;
                    in_word = true;
                }
                break;

            case State::SINGLE_QUOTED:
                if (c == '\'') {
                    state = State::NORMAL;
                } else {
                    current += c;
                }
                break;

            case State::DOUBLE_QUOTED:
                if (c == '"') {
                    state = State::NORMAL;
                } else if (c == '\\' && i + 1 < command.size()) {
                    char next = command[i + 1];
                    if (next == '"' || next == '\\' || next == '$' || next == '`') {
                        current += next;
                        ++i;
                    } else {
                        current += c;
                    }
                } else {
                    current += c;
                }
                break;
        }
    }

    if (state != State::NORMAL) {
        return std::nullopt;
    }
    if (in_word) {
        words.push_back(current);
    }

    return words;
}

std::size_t StringUtils::FindShellComment(const std::string& command) {
    bool single_quoted = false;
    bool double_quoted = false;

    for (std::size_t i = 0; i < command.size(); ++i) {
        char c = command[i];

        if (single_quoted) {
            if (c == '\'') single_quoted = false;
            continue;
        }
        if (double_quoted) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                double_quoted = false;
            }
            continue;
        }

        if (c == '\\') {
            ++i;
        } else if (c == '\'') {
            single_quoted = true;
        } else if (c == '"') {
            double_quoted = true;
        } else if (c == '#' &&
                   (i == 0 || std::isspace(static_cast<unsigned char>(command[i - 1])))) {
            return i;
        }
    }

    return std::string::npos;
}

bool StringUtils::IsExecutableName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

} // namespace utils
} // namespace bastion
