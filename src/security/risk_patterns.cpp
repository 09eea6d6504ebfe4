/**
 * @file risk_patterns.cpp
 * @brief Built-in danger-pattern table and whitelists
 *
 * **Pattern Categories**:
 * - Destructive filesystem operations (root deletion, mkfs, dd to devices)
 * - Privilege escalation (sudo, su, setuid bits)
 * - Remote code execution (download piped into an interpreter)
 * - Backdoors (netcat listeners, /dev/tcp redirection)
 * - Credential access (/etc/shadow, SSH keys, cloud credentials)
 * - Resource exhaustion (fork bombs)
 *
 * Patterns rated HIGH or CRITICAL block a command. Lower ratings only add a
 * warning. Order matters: the first blocking match supplies the reason.
 *
 * @date 2025
 */

#include "bastion/security/risk_patterns.hpp"
#include "bastion/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace bastion {
namespace security {

namespace {

std::vector<RiskPattern> BuildDefaultPatterns() {
    std::vector<RiskPattern> patterns;

    // ========================================================================
    // Destructive filesystem operations
    // ========================================================================
    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R001",
        R"(\brm\s+([^\s;&|]+\s+)*(-[a-z]*r[a-z]*|--recursive)\s+([^\s;&|]+\s+)*["']?(/|~(/|["'\s]|$)|\$\{?HOME\b))",
        RiskLevel::CRITICAL,
        "Recursive deletion of an absolute path or the home directory"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R002",
        R"(\b(sudo|doas|pkexec)\s|(^|[;&|]\s*)su(\s|$))",
        RiskLevel::CRITICAL,
        "Privilege escalation (sudo/su)"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R003",
        R"(\bchmod\s+.*\b0?777\b)",
        RiskLevel::HIGH,
        "World-writable permissions (chmod 777)"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R004",
        R"(\bchmod\s+(\S+\s+)*[ugoa]*\+[rwxt]*s)",
        RiskLevel::HIGH,
        "Setting setuid/setgid bits"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R005",
        R"(\bmkfs(\.[a-z0-9]+)?\b)",
        RiskLevel::CRITICAL,
        "Filesystem formatting (mkfs)"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R006",
        R"(/dev/(sd[a-z]|hd[a-z]|vd[a-z]|xvd[a-z]|nvme[0-9]|mmcblk[0-9]))",
        RiskLevel::CRITICAL,
        "Raw block device access"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R007",
        R"(\bdd\s+.*\bof=/dev/(?!null\b))",
        RiskLevel::CRITICAL,
        "Raw device write with dd"));

    // ========================================================================
    // Resource exhaustion
    // ========================================================================
    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R008",
        R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)",
        RiskLevel::CRITICAL,
        "Fork bomb"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R009",
        R"(\b(\w+)\s*\(\s*\)\s*\{\s*\1\s*\|\s*\1\s*&\s*\})",
        RiskLevel::CRITICAL,
        "Fork bomb"));

    // ========================================================================
    // Remote code execution
    // ========================================================================
    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R010",
        R"(\b(curl|wget)\b[^|]*\|\s*(sudo\s+)?((ba|z|da|k)?sh|python[0-9.]*|perl|ruby|node)\b)",
        RiskLevel::HIGH,
        "Remote script execution (download piped to an interpreter)"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R011",
        R"(\b(ba|z)?sh\s+<\(\s*(curl|wget)\b)",
        RiskLevel::HIGH,
        "Remote script execution (download piped to an interpreter)"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R012",
        R"(\beval\s+.*\$)",
        RiskLevel::HIGH,
        "Dynamic evaluation of expanded input (eval)"));

    // ========================================================================
    // Backdoors
    // ========================================================================
    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R013",
        R"(\b(nc|ncat|netcat)\s+.*-[a-z]*[el])",
        RiskLevel::HIGH,
        "Netcat listener or reverse shell"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R014",
        R"(/dev/(tcp|udp)/)",
        RiskLevel::HIGH,
        "Shell network redirection via /dev/tcp"));

    // ========================================================================
    // Credential access
    // ========================================================================
    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R015",
        R"(/etc/(passwd|shadow|gshadow|sudoers)\b)",
        RiskLevel::CRITICAL,
        "Access to system credential files"));

    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R016",
        R"(\.ssh/(id_[a-z0-9_]+|authorized_keys)|\.aws/credentials|\.docker/config\.json)",
        RiskLevel::CRITICAL,
        "Access to user credential files"));

    // ========================================================================
    // System state
    // ========================================================================
    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R017",
        R"((^|[;&|]\s*)(shutdown|reboot|halt|poweroff)(\s|$))",
        RiskLevel::HIGH,
        "System power state change"));

    // Non-blocking
    patterns.push_back(RiskPatternCatalog::MakePattern(
        "R018",
        R"(>>?\s*/dev/(null|zero|random|urandom)\b)",
        RiskLevel::MEDIUM,
        "Redirection to a special device"));

    return patterns;
}

} // anonymous namespace

RiskPatternCatalog::RiskPatternCatalog(std::vector<RiskPattern> patterns)
    : patterns_(std::move(patterns)) {
    spdlog::debug("Initialized risk catalog with {} patterns", patterns_.size());
}

const RiskPatternCatalog& RiskPatternCatalog::Default() {
    static const RiskPatternCatalog catalog(BuildDefaultPatterns());
    return catalog;
}

RiskPattern RiskPatternCatalog::MakePattern(std::string pattern_id, std::string expression,
                                            RiskLevel risk, std::string reason) {
    RiskPattern pattern;
    pattern.pattern_id = std::move(pattern_id);
    pattern.regex = std::regex(expression, std::regex::ECMAScript | std::regex::icase);
    pattern.expression = std::move(expression);
    pattern.risk = risk;
    pattern.reason = std::move(reason);
    return pattern;
}

// ============================================================================
// WHITELISTS
// ============================================================================

std::set<std::string> DefaultWhitelist(SecurityLevel level) {
    std::set<std::string> whitelist = {
        // Languages and package managers
        "python", "python3", "pip", "pip3", "node", "npm", "npx", "yarn",
        "java", "javac", "mvn", "gradle", "go", "cargo", "rustc",
        // Development tools
        "git", "docker", "docker-compose", "make", "cmake", "gcc",
        "flask", "django-admin",
        // System tools
        "ls", "cat", "head", "tail", "grep", "find", "which", "echo", "pwd",
        "mkdir", "touch", "cp", "mv", "rm", "rmdir", "chmod", "chown", "sleep", "diff",
        // Text processing
        "sed", "awk", "sort", "uniq", "wc", "curl", "wget",
        // Test runners
        "pytest", "unittest", "jest", "mocha", "phpunit",
    };

    if (level == SecurityLevel::DEVELOPMENT) {
        whitelist.insert({
            "vim", "nano", "code", "emacs",
            "ps", "top", "htop", "kill", "killall",
            "tar", "zip", "unzip", "gzip", "gunzip",
        });
    }

    return whitelist;
}

std::string SecurityLevelToString(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::STRICT:      return "strict";
        case SecurityLevel::PERMISSIVE:  return "permissive";
        case SecurityLevel::DEVELOPMENT: return "development";
    }
    return "unknown";
}

std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW:      return "low";
        case RiskLevel::MEDIUM:   return "medium";
        case RiskLevel::HIGH:     return "high";
        case RiskLevel::CRITICAL: return "critical";
    }
    return "unknown";
}

std::optional<SecurityLevel> ParseSecurityLevel(const std::string& name) {
    auto lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "strict") return SecurityLevel::STRICT;
    if (lower == "permissive") return SecurityLevel::PERMISSIVE;
    if (lower == "development") return SecurityLevel::DEVELOPMENT;
    return std::nullopt;
}

} // namespace security
} // namespace bastion
