/**
 * @file command_validator.hpp
 * @brief Multi-layer validation of untrusted shell commands
 *
 * Commands pass through sanitization, a danger-pattern scan, a whitelist
 * check and structural heuristics before they may reach a sandbox backend.
 * Validation never throws for malformed input; every outcome is data.
 *
 * @date 2025
 */

#pragma once

#include "bastion/security/risk_patterns.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bastion {
namespace security {

/**
 * @struct ValidationOutcome
 * @brief Verdict for one command, produced fresh per call
 */
struct ValidationOutcome {
    bool is_safe{false};                           ///< May be executed
    RiskLevel risk{RiskLevel::LOW};                ///< Overall risk rating
    std::optional<std::string> blocked_reason;     ///< Set when is_safe is false
    std::optional<std::string> sanitized_command;  ///< Command that will actually run
    std::vector<std::string> warnings;             ///< Non-blocking findings, in order
};

/**
 * @struct ValidatorStats
 * @brief Counters exposed to external observability collaborators
 */
struct ValidatorStats {
    std::uint64_t total_validations{0};
    std::uint64_t blocked_count{0};
    double block_rate_percent{0.0};   ///< Rounded to two decimals
    SecurityLevel security_level{SecurityLevel::STRICT};
    std::size_t whitelist_size{0};
};

/**
 * @class CommandValidator
 * @brief Sanitizes, classifies and blocks or approves command lines
 *
 * **Pipeline** (short-circuiting):
 * 1. Sanitize (control characters, whitespace, trailing comments)
 * 2. Danger-pattern scan (HIGH/CRITICAL blocks, lower ratings warn)
 * 3. Whitelist check on the first shell word
 * 4. Structural heuristics (chaining, pipes into destructive tools, ...)
 * 5. Risk scoring (MEDIUM above two warnings, else LOW)
 *
 * **Thread Safety**: Validate() may be called concurrently. The whitelist is
 * a mutex-guarded set owned by the validator; counters are atomic.
 *
 * **Usage Example**:
 * @code
 * CommandValidator validator(SecurityLevel::STRICT);
 * auto outcome = validator.Validate("pytest -q tests/");
 * if (!outcome.is_safe) {
 *     spdlog::warn("Blocked: {}", *outcome.blocked_reason);
 * }
 * @endcode
 */
class CommandValidator {
public:
    /**
     * @brief Create a validator with the default whitelist for level
     * @param level Security level, fixed for the validator's lifetime
     * @param catalog Danger patterns (must outlive the validator)
     */
    explicit CommandValidator(SecurityLevel level,
                              const RiskPatternCatalog& catalog = RiskPatternCatalog::Default());

    CommandValidator(const CommandValidator&) = delete;
    CommandValidator& operator=(const CommandValidator&) = delete;

    /**
     * @brief Run the full validation pipeline on an untrusted command
     */
    ValidationOutcome Validate(const std::string& command);

    /**
     * @brief Normalize a raw command line
     *
     * Removes control characters (except tab/newline, which are then
     * collapsed with other whitespace), collapses whitespace and strips a
     * trailing unquoted `#` comment. Idempotent.
     */
    static std::string Sanitize(const std::string& command);

    /***************************************************************************
     * Whitelist Management
     ***************************************************************************/

    /**
     * @brief Add an executable name to the whitelist
     * @return false if the name is not a bare executable name
     */
    bool AddWhitelistCommand(const std::string& name);

    /**
     * @brief Remove an executable name from the whitelist
     * @return true if it was present
     */
    bool RemoveWhitelistCommand(const std::string& name);

    bool IsWhitelisted(const std::string& name) const;

    ValidatorStats GetStats() const;
    SecurityLevel GetSecurityLevel() const { return level_; }

private:
    /**
     * @brief Resolve the executable name from the first shell word
     * @return Block reason, or std::nullopt with executable set
     */
    std::optional<std::string> ResolveExecutable(const std::string& sanitized,
                                                 std::string& executable) const;

    std::vector<std::string> CheckStructure(const std::string& sanitized) const;

    ValidationOutcome Block(ValidationOutcome outcome, RiskLevel risk,
                            const std::string& reason);

    const SecurityLevel level_;
    const RiskPatternCatalog& catalog_;

    mutable std::mutex whitelist_mutex_;
    std::set<std::string> whitelist_;

    std::atomic<std::uint64_t> total_validations_{0};
    std::atomic<std::uint64_t> blocked_count_{0};
};

} // namespace security
} // namespace bastion
