/**
 * @file risk_patterns.hpp
 * @brief Catalog of dangerous command signatures and executable whitelists
 *
 * The catalog is immutable data built once at startup. Patterns are matched
 * case-insensitively against sanitized command lines, in catalog order.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace bastion {
namespace security {

/**
 * @enum SecurityLevel
 * @brief Validator strictness, fixed at construction
 */
enum class SecurityLevel {
    STRICT,       ///< Base whitelist, off-whitelist commands are blocked
    PERMISSIVE,   ///< Base whitelist, off-whitelist commands only warn
    DEVELOPMENT   ///< Extended whitelist, off-whitelist commands are blocked
};

/**
 * @enum RiskLevel
 * @brief Ordered risk rating (LOW < MEDIUM < HIGH < CRITICAL)
 */
enum class RiskLevel {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
    CRITICAL = 3
};

/**
 * @struct RiskPattern
 * @brief One dangerous-command signature
 */
struct RiskPattern {
    std::string pattern_id;   ///< Stable identifier ("R001")
    std::string expression;   ///< Source regex (ECMAScript)
    std::regex regex;         ///< Compiled, case-insensitive
    RiskLevel risk{RiskLevel::HIGH};
    std::string reason;       ///< Human-readable block reason
};

/**
 * @class RiskPatternCatalog
 * @brief Ordered, immutable set of risk patterns
 *
 * **Usage Example**:
 * @code
 * const auto& catalog = RiskPatternCatalog::Default();
 * for (const auto& pattern : catalog.Patterns()) {
 *     if (std::regex_search(command, pattern.regex)) { ... }
 * }
 * @endcode
 */
class RiskPatternCatalog {
public:
    /**
     * @brief Build a catalog from compiled patterns, keeping their order
     */
    explicit RiskPatternCatalog(std::vector<RiskPattern> patterns);

    /**
     * @brief Built-in catalog shared by all validators
     */
    static const RiskPatternCatalog& Default();

    /**
     * @brief Compile expression case-insensitively into a pattern
     * @throws std::regex_error if the expression does not compile
     */
    static RiskPattern MakePattern(std::string pattern_id, std::string expression,
                                   RiskLevel risk, std::string reason);

    const std::vector<RiskPattern>& Patterns() const { return patterns_; }
    std::size_t Size() const { return patterns_.size(); }

private:
    std::vector<RiskPattern> patterns_;
};

/**
 * @brief Default executable whitelist for a security level
 */
std::set<std::string> DefaultWhitelist(SecurityLevel level);

std::string SecurityLevelToString(SecurityLevel level);
std::string RiskLevelToString(RiskLevel level);

/**
 * @brief Parse "strict", "permissive" or "development" (case-insensitive)
 */
std::optional<SecurityLevel> ParseSecurityLevel(const std::string& name);

} // namespace security
} // namespace bastion
