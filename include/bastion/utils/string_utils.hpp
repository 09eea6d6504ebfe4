/**
 * @file string_utils.hpp
 * @brief String manipulation helpers for command validation
 *
 * Provides trimming, splitting, case folding and POSIX shell-word
 * tokenization used by the command validator and the backends.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace bastion {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto words = StringUtils::ShellSplit("git commit -m 'first commit'");
 * if (!words) {
 *     // unbalanced quotes
 * }
 * // words -> {"git", "commit", "-m", "first commit"}
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     ***************************************************************************/

    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, skipping empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static std::string Join(const std::vector<std::string>& parts,
                            const std::string& separator);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Replace every run of whitespace with a single space
     *
     * Leading and trailing whitespace is removed as well.
     */
    static std::string CollapseWhitespace(const std::string& str);

    /***************************************************************************
     * Shell Tokenization
     ***************************************************************************/

    /**
     * @brief Split a command line into words using POSIX shell quoting rules
     *
     * Honors single quotes (literal), double quotes (backslash escapes only
     * `"`, `\`, `$` and backquote) and unquoted backslash escapes. Operators
     * such as `|` or `;` are not separated from adjacent text.
     *
     * @param command Command line to tokenize
     * @return Words, or std::nullopt on unbalanced quotes or a dangling escape
     */
    static std::optional<std::vector<std::string>> ShellSplit(const std::string& command);

    /**
     * @brief Find the first unquoted `#` that starts a shell word
     *
     * @return Offset of the comment marker, or std::string::npos
     */
    static std::size_t FindShellComment(const std::string& command);

    /**
     * @brief Check that every character is in [A-Za-z0-9_.-]
     */
    static bool IsExecutableName(const std::string& name);
};

} // namespace utils
} // namespace bastion
