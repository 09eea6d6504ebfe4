/**
 * @file json_reporter.cpp
 * @brief Implementation of JSON rendering with nlohmann::json
 *
 * @date 2025
 */

#include "bastion/reporters/json_reporter.hpp"
#include "bastion/core/sandbox_executor.hpp"
#include "bastion/security/command_validator.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace bastion {
namespace reporters {

namespace {

json PathList(const std::vector<std::filesystem::path>& paths) {
    json list = json::array();
    for (const auto& path : paths) {
        list.push_back(path.generic_string());
    }
    return list;
}

json LimitsJson(const core::ResourceLimits& limits) {
    return {
        {"max_memory_mb", limits.max_memory_mb},
        {"max_cpu_fraction", limits.max_cpu_fraction},
        {"max_execution_seconds", limits.max_execution_seconds},
        {"max_disk_mb", limits.max_disk_mb},
        {"allow_network", limits.allow_network}
    };
}

} // anonymous namespace

JsonReporter::JsonReporter()
    : JsonReporter(JsonReporterConfig{}) {
}

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

std::string JsonReporter::GenerateResultJson(const core::ExecutionResult& result) const {
    json j;

    j["execution_id"] = result.execution_id;
    j["status"] = core::ExecutionStatusToString(result.status);
    j["backend"] = result.backend;
    j["command"] = result.command_executed;
    j["exit_code"] = result.exit_code;
    j["duration_ms"] = result.duration.count();

    if (config_.include_output) {
        j["stdout"] = result.stdout_output;
        j["stderr"] = result.stderr_output;
    }

    j["resource_usage"] = json::object();
    for (const auto& [name, value] : result.resource_usage) {
        j["resource_usage"][name] = value;
    }

    if (result.backend_resource_id) {
        j["backend_resource_id"] = *result.backend_resource_id;
    } else {
        j["backend_resource_id"] = nullptr;
    }

    j["files"] = {
        {"created", PathList(result.files_created)},
        {"modified", PathList(result.files_modified)},
        {"deleted", PathList(result.files_deleted)}
    };
    j["warnings"] = result.warnings;

    if (config_.include_timestamp) {
        j["generated_at"] = FormatTimestamp();
    }

    return config_.pretty_print ? j.dump(config_.indent_size) : j.dump();
}

std::string JsonReporter::GenerateValidationJson(const std::string& command,
                                                 const security::ValidationOutcome& outcome) const {
    json j = {
        {"command", command},
        {"is_safe", outcome.is_safe},
        {"risk", security::RiskLevelToString(outcome.risk)},
        {"warnings", outcome.warnings}
    };

    j["blocked_reason"] = outcome.blocked_reason ? json(*outcome.blocked_reason) : json(nullptr);
    j["sanitized_command"] = outcome.sanitized_command ? json(*outcome.sanitized_command)
                                                       : json(nullptr);

    return config_.pretty_print ? j.dump(config_.indent_size) : j.dump();
}

std::string JsonReporter::GenerateStatsJson(const core::ExecutorStats& stats) const {
    const auto& validator = stats.validator_stats;

    json j = {
        {"total_executions", stats.total_executions},
        {"active_resource_count", stats.active_resource_count},
        {"container_runtime_available", stats.container_runtime_available},
        {"backend", stats.backend},
        {"default_limits", LimitsJson(stats.default_limits)},
        {"validator", {
            {"total_validations", validator.total_validations},
            {"blocked_count", validator.blocked_count},
            {"block_rate_percent", validator.block_rate_percent},
            {"security_level", security::SecurityLevelToString(validator.security_level)},
            {"whitelist_size", validator.whitelist_size}
        }}
    };

    return config_.pretty_print ? j.dump(config_.indent_size) : j.dump();
}

bool JsonReporter::SaveJson(const std::string& json_content,
                            const std::filesystem::path& output_path) const {
    try {
        std::ofstream file(output_path);
        if (!file) {
            spdlog::error("Failed to open file for writing: {}", output_path.string());
            return false;
        }

        file << json_content;
        file.close();

        spdlog::info("✓ JSON written to {}", output_path.string());
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to save JSON: {}", e.what());
        return false;
    }
}

bool JsonReporter::ValidateSyntax(const std::string& json_str) {
    try {
        (void)json::parse(json_str);
        return true;
    }
    catch (const json::parse_error& e) {
        spdlog::error("JSON validation failed: {}", e.what());
        return false;
    }
}

std::string JsonReporter::FormatTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace reporters
} // namespace bastion
