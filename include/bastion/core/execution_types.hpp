/**
 * @file execution_types.hpp
 * @brief Value types exchanged between callers, the executor and backends
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bastion {
namespace core {

/// Exit code reported for commands rejected by the validator
constexpr int kBlockedExitCode = 1;

/// Exit code reported for timed-out commands (POSIX timeout(1) convention)
constexpr int kTimeoutExitCode = 124;

/// Exit code reported when the backend itself failed
constexpr int kBackendFaultExitCode = 1;

/**
 * @enum ExecutionStatus
 * @brief Terminal state of one Execute() call
 */
enum class ExecutionStatus {
    COMPLETED,      ///< Backend ran the command to completion
    BLOCKED,        ///< Rejected by the validator, nothing was run
    TIMED_OUT,      ///< Killed after exceeding the timeout
    BACKEND_FAULT   ///< Backend could not run the command
};

/**
 * @struct ResourceLimits
 * @brief Resource budget for one sandboxed command
 */
struct ResourceLimits {
    std::size_t max_memory_mb{512};     ///< Memory limit (MB)
    double max_cpu_fraction{0.5};       ///< CPU share (1.0 = one core)
    int max_execution_seconds{300};     ///< Default timeout
    std::size_t max_disk_mb{100};       ///< Largest file the command may write (MB)
    bool allow_network{false};          ///< Network access inside the sandbox
};

/**
 * @struct ExecutionRequest
 * @brief One command to run against one workspace directory
 */
struct ExecutionRequest {
    std::string command;                          ///< Untrusted command line
    std::filesystem::path workspace_dir;          ///< Project directory
    std::optional<ResourceLimits> limits;         ///< Executor default when unset
    std::map<std::string, std::string> environment;
    std::optional<int> timeout_seconds;           ///< limits.max_execution_seconds when unset
};

/**
 * @struct ExecutionResult
 * @brief Auditable outcome of one Execute() call
 *
 * Blocked, timed-out and failed commands produce the same structure as
 * successful ones; callers only inspect fields.
 */
struct ExecutionResult {
    std::string execution_id;
    ExecutionStatus status{ExecutionStatus::COMPLETED};
    std::string backend;                          ///< "container", "local" or empty when blocked

    std::string command_executed;
    int exit_code{0};
    std::string stdout_output;
    std::string stderr_output;
    std::chrono::milliseconds duration{0};

    std::map<std::string, double> resource_usage;
    std::optional<std::string> backend_resource_id;  ///< Container name, if any

    // Relative to the workspace root
    std::vector<std::filesystem::path> files_created;
    std::vector<std::filesystem::path> files_modified;
    std::vector<std::filesystem::path> files_deleted;

    std::vector<std::string> warnings;
};

std::string ExecutionStatusToString(ExecutionStatus status);

} // namespace core
} // namespace bastion
