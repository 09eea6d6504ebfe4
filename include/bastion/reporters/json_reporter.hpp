/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON rendering of executions, verdicts and stats
 *
 * Used by the CLI's `--json` output and by callers forwarding results to
 * an external collector.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace bastion {

// Forward declarations
namespace core {
    struct ExecutionResult;
    struct ExecutorStats;
}
namespace security {
    struct ValidationOutcome;
}

namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Formatting options
 */
struct JsonReporterConfig {
    bool pretty_print{true};          ///< Indent output
    int indent_size{2};               ///< Indentation spaces
    bool include_output{true};        ///< Include stdout/stderr of executions
    bool include_timestamp{true};     ///< Add a "generated_at" field
};

/**
 * @class JsonReporter
 * @brief Serializes executor data structures to JSON
 *
 * **Result Layout**:
 * ```json
 * {
 *   "execution_id": "...", "status": "COMPLETED", "backend": "local",
 *   "command": "ls -la", "exit_code": 0, "duration_ms": 12,
 *   "stdout": "...", "stderr": "",
 *   "resource_usage": { "execution_time_ms": 12.0 },
 *   "files": { "created": [], "modified": [], "deleted": [] },
 *   "warnings": []
 * }
 * ```
 */
class JsonReporter {
public:
    JsonReporter();
    explicit JsonReporter(const JsonReporterConfig& config);

    std::string GenerateResultJson(const core::ExecutionResult& result) const;
    std::string GenerateValidationJson(const std::string& command,
                                       const security::ValidationOutcome& outcome) const;
    std::string GenerateStatsJson(const core::ExecutorStats& stats) const;

    /**
     * @brief Write JSON text to a file
     * @return false (and logs) on I/O failure
     */
    bool SaveJson(const std::string& json_content, const std::filesystem::path& output_path) const;

    /**
     * @brief Check that text parses as JSON
     */
    static bool ValidateSyntax(const std::string& json_str);

private:
    static std::string FormatTimestamp();

    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace bastion
