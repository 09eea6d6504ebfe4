/**
 * @file command_validator.cpp
 * @brief Implementation of the command validation pipeline
 *
 * The danger scan runs before the whitelist check: a whitelisted binary
 * (e.g. `rm`) is still blocked by a matching pattern (`rm -rf /`).
 *
 * **Block reasons vs. warnings**:
 * - Blocks: empty input, HIGH/CRITICAL danger patterns, unparseable quoting,
 *   path-qualified or malformed executables, off-whitelist commands
 *   (STRICT/DEVELOPMENT)
 * - Warnings: MEDIUM danger patterns, off-whitelist commands (PERMISSIVE),
 *   structural heuristics
 *
 * @date 2025
 */

#include "bastion/security/command_validator.hpp"
#include "bastion/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <regex>

namespace bastion {
namespace security {

using utils::StringUtils;

namespace {

struct StructuralCheck {
    std::regex trigger;
    std::optional<std::regex> companion;
    std::string warning;
};

const std::vector<StructuralCheck>& StructuralChecks() {
    static const std::vector<StructuralCheck> checks = [] {
        auto re = [](const char* expression) {
            return std::regex(expression, std::regex::ECMAScript | std::regex::icase);
        };

        std::vector<StructuralCheck> list;
        list.push_back({re(R"((^|[^|])\|([^|]|$))"),
                        re(R"(\b(rm|dd|mkfs)\b)"),
                        "Pipe combined with a destructive command (rm/dd/mkfs)"});
        list.push_back({re(R"(>>\s*['"]?/(etc|boot|usr|lib|lib64|sys|proc)/)"),
                        std::nullopt,
                        "Append redirection into a system configuration path"});
        list.push_back({re(R"((^|[^&>])&([^&>]|$))"),
                        re(R"(\b(nc|ncat|netcat|socat)\b)"),
                        "Background execution combined with a network listener tool"});
        list.push_back({re(R"(;|&&|\|\|)"),
                        std::nullopt,
                        "Command chaining operators (;, &&, ||)"});
        list.push_back({re(R"((^|\s)/\S*\*)"),
                        std::nullopt,
                        "Wildcard applied to an absolute path"});
        return list;
    }();
    return checks;
}

bool HasTraversal(const std::filesystem::path& path) {
    for (const auto& part : path) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

CommandValidator::CommandValidator(SecurityLevel level, const RiskPatternCatalog& catalog)
    : level_(level),
      catalog_(catalog),
      whitelist_(DefaultWhitelist(level)) {
    spdlog::info("Command validator initialized (level: {}, whitelist: {} commands, {} patterns)",
                 SecurityLevelToString(level_), whitelist_.size(), catalog_.Size());
}

// ============================================================================
// SANITIZATION
// ============================================================================

std::string CommandValidator::Sanitize(const std::string& command) {
    std::string cleaned;
    cleaned.reserve(command.size());

    for (unsigned char c : command) {
        if ((c < 0x20 && c != '\t' && c != '\n') || c == 0x7F) {
            continue;
        }
        cleaned += static_cast<char>(c);
    }

    cleaned = StringUtils::CollapseWhitespace(cleaned);

    auto comment = StringUtils::FindShellComment(cleaned);
    if (comment != std::string::npos) {
        cleaned = StringUtils::Trim(cleaned.substr(0, comment));
    }

    return cleaned;
}

// ============================================================================
// VALIDATION PIPELINE
// ============================================================================

ValidationOutcome CommandValidator::Validate(const std::string& command) {
    ++total_validations_;

    ValidationOutcome outcome;

    // Layer 1: sanitization
    std::string sanitized = Sanitize(command);
    if (sanitized.empty()) {
        return Block(std::move(outcome), RiskLevel::MEDIUM, "Command is empty after sanitization");
    }
    outcome.sanitized_command = sanitized;

    // Layer 2: danger patterns, before the whitelist so whitelisted binaries
    // are still caught
    RiskLevel pattern_risk = RiskLevel::LOW;
    for (const auto& pattern : catalog_.Patterns()) {
        if (!std::regex_search(sanitized, pattern.regex)) {
            continue;
        }
        if (pattern.risk >= RiskLevel::HIGH) {
            spdlog::debug("Pattern {} matched: {}", pattern.pattern_id, pattern.expression);
            return Block(std::move(outcome), pattern.risk, pattern.reason);
        }
        outcome.warnings.push_back("Potentially risky: " + pattern.reason);
        pattern_risk = std::max(pattern_risk, pattern.risk);
    }

    // Layer 3: whitelist
    std::string executable;
    if (auto reason = ResolveExecutable(sanitized, executable)) {
        return Block(std::move(outcome), RiskLevel::HIGH, *reason);
    }

    if (!IsWhitelisted(executable)) {
        if (level_ == SecurityLevel::PERMISSIVE) {
            outcome.warnings.push_back("Command '" + executable +
                                       "' not in whitelist (permissive mode)");
        } else {
            return Block(std::move(outcome), RiskLevel::HIGH,
                         "Command '" + executable + "' is not in the whitelist");
        }
    }

    // Layer 4: structural heuristics
    auto structural = CheckStructure(sanitized);
    outcome.warnings.insert(outcome.warnings.end(), structural.begin(), structural.end());

    // Layer 5: scoring
    RiskLevel count_risk = outcome.warnings.size() > 2 ? RiskLevel::MEDIUM : RiskLevel::LOW;
    outcome.risk = std::max(count_risk, pattern_risk);
    outcome.is_safe = true;

    spdlog::debug("Command approved ({} risk, {} warnings): {}",
                  RiskLevelToString(outcome.risk), outcome.warnings.size(), sanitized);
    return outcome;
}

std::optional<std::string> CommandValidator::ResolveExecutable(const std::string& sanitized,
                                                               std::string& executable) const {
    auto words = StringUtils::ShellSplit(sanitized);
    if (!words) {
        return std::string("Unparseable command (unbalanced quotes or dangling escape)");
    }
    if (words->empty()) {
        return std::string("Command is empty after sanitization");
    }

    const std::string& first = words->front();
    std::filesystem::path first_path(first);

    if (first_path.is_absolute() || HasTraversal(first_path)) {
        return "Path traversal in executable: " + first;
    }
    if (first.find('/') != std::string::npos) {
        return "Executable must be a bare command name: " + first;
    }

    std::string name = first_path.filename().string();
    if (!StringUtils::IsExecutableName(name)) {
        return "Invalid characters in executable name: " + name;
    }

    executable = name;
    return std::nullopt;
}

std::vector<std::string> CommandValidator::CheckStructure(const std::string& sanitized) const {
    std::vector<std::string> warnings;

    for (const auto& check : StructuralChecks()) {
        if (!std::regex_search(sanitized, check.trigger)) {
            continue;
        }
        if (check.companion && !std::regex_search(sanitized, *check.companion)) {
            continue;
        }
        warnings.push_back(check.warning);
    }

    return warnings;
}

ValidationOutcome CommandValidator::Block(ValidationOutcome outcome, RiskLevel risk,
                                          const std::string& reason) {
    ++blocked_count_;

    outcome.is_safe = false;
    outcome.risk = risk;
    outcome.blocked_reason = reason;

    spdlog::warn("⚠ Command blocked ({}): {}", RiskLevelToString(risk), reason);
    return outcome;
}

// ============================================================================
// WHITELIST MANAGEMENT
// ============================================================================

bool CommandValidator::AddWhitelistCommand(const std::string& name) {
    if (!StringUtils::IsExecutableName(name)) {
        spdlog::warn("⚠ Refusing to whitelist invalid command name: {}", name);
        return false;
    }

    std::lock_guard<std::mutex> lock(whitelist_mutex_);
    whitelist_.insert(name);
    spdlog::info("Added '{}' to whitelist", name);
    return true;
}

bool CommandValidator::RemoveWhitelistCommand(const std::string& name) {
    std::lock_guard<std::mutex> lock(whitelist_mutex_);
    bool removed = whitelist_.erase(name) > 0;
    if (removed) {
        spdlog::info("Removed '{}' from whitelist", name);
    }
    return removed;
}

bool CommandValidator::IsWhitelisted(const std::string& name) const {
    std::lock_guard<std::mutex> lock(whitelist_mutex_);
    return whitelist_.count(name) > 0;
}

ValidatorStats CommandValidator::GetStats() const {
    ValidatorStats stats;
    stats.total_validations = total_validations_.load();
    stats.blocked_count = blocked_count_.load();
    if (stats.total_validations > 0) {
        double rate = static_cast<double>(stats.blocked_count) * 100.0 /
                      static_cast<double>(stats.total_validations);
        stats.block_rate_percent = std::round(rate * 100.0) / 100.0;
    }
    stats.security_level = level_;
    {
        std::lock_guard<std::mutex> lock(whitelist_mutex_);
        stats.whitelist_size = whitelist_.size();
    }
    return stats;
}

} // namespace security
} // namespace bastion
