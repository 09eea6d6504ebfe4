/**
 * @file executor_config.hpp
 * @brief Typed configuration for the sandbox executor
 *
 * Configuration is supplied at construction time and never re-read. It
 * can be built in code, loaded from a JSON document, or adjusted by
 * `BASTION_*` environment variables.
 *
 * **JSON Layout** (every key optional):
 * ```json
 * {
 *   "security_level": "strict",
 *   "fast_test_mode": false,
 *   "enable_container_backend": true,
 *   "extra_whitelist": ["mytool"],
 *   "termination_grace_seconds": 2,
 *   "cleanup_grace_seconds": 10,
 *   "max_output_bytes": 8388608,
 *   "limits": { "max_memory_mb": 512, "max_cpu_fraction": 0.5,
 *               "max_execution_seconds": 300, "max_disk_mb": 100,
 *               "allow_network": false },
 *   "container": { "runtime": "docker", "image": "python:3.11-slim",
 *                  "shell": "bash", "user": "1000:1000",
 *                  "mount_point": "/workspace", "resource_prefix": "bastion",
 *                  "scratch_volume": true, "probe_timeout_seconds": 5 },
 *   "diff": { "hash_contents": false, "max_file_size_for_hash": 10485760,
 *             "excluded_directories": [".git"] }
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "bastion/backends/container_backend.hpp"
#include "bastion/core/execution_types.hpp"
#include "bastion/monitors/filesystem_diff_tracker.hpp"
#include "bastion/security/risk_patterns.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace bastion {
namespace core {

/**
 * @class ConfigError
 * @brief Unreadable or malformed configuration document
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct ExecutorConfig
 * @brief Everything SandboxExecutor needs at construction
 */
struct ExecutorConfig {
    // Security
    security::SecurityLevel security_level{security::SecurityLevel::STRICT};
    std::vector<std::string> extra_whitelist;       ///< Added on top of the level's whitelist

    // Execution
    ResourceLimits default_limits;
    bool fast_test_mode{false};                     ///< Skip dependency installs (local backend)
    bool enable_container_backend{true};            ///< false: always use the local backend
    std::chrono::seconds termination_grace{2};      ///< SIGTERM → SIGKILL window on timeout
    std::chrono::seconds cleanup_grace{10};         ///< Graceful container stop window
    std::size_t max_output_bytes{8 * 1024 * 1024};  ///< Capture cap per stream

    backends::ContainerBackendConfig container;
    monitors::FilesystemDiffTracker::Config diff;
};

/**
 * @brief Load a configuration document, starting from defaults
 * @throws ConfigError if the file cannot be read or parsed, or a value has the wrong type
 */
ExecutorConfig LoadExecutorConfig(const std::filesystem::path& path);

/**
 * @brief Parse a configuration from JSON text
 * @throws ConfigError on malformed input
 */
ExecutorConfig ParseExecutorConfig(const std::string& json_text);

/**
 * @brief Apply BASTION_SECURITY_LEVEL, BASTION_FAST_TEST_MODE,
 *        BASTION_CONTAINER_RUNTIME and BASTION_CONTAINER_IMAGE
 * @throws ConfigError on an unknown security level
 */
void ApplyEnvironmentOverrides(ExecutorConfig& config);

/**
 * @brief Reject non-positive limits
 * @throws std::invalid_argument describing the first bad value
 */
void ValidateLimits(const ResourceLimits& limits);

/**
 * @brief Validate limits, grace periods and container settings
 * @throws std::invalid_argument describing the first bad value
 */
void ValidateConfig(const ExecutorConfig& config);

/**
 * @class ExecutorConfigBuilder
 * @brief Fluent construction of an ExecutorConfig
 *
 * @code
 * auto config = ExecutorConfigBuilder()
 *     .WithSecurityLevel(SecurityLevel::PERMISSIVE)
 *     .WithTimeout(30)
 *     .WithNetwork(false)
 *     .LocalOnly()
 *     .Build();
 * @endcode
 */
class ExecutorConfigBuilder {
public:
    ExecutorConfigBuilder() = default;
    explicit ExecutorConfigBuilder(ExecutorConfig base) : config_(std::move(base)) {}

    ExecutorConfigBuilder& WithSecurityLevel(security::SecurityLevel level);
    ExecutorConfigBuilder& WithLimits(const ResourceLimits& limits);
    ExecutorConfigBuilder& WithMemoryLimit(std::size_t megabytes);
    ExecutorConfigBuilder& WithCpuLimit(double fraction);
    ExecutorConfigBuilder& WithTimeout(int seconds);
    ExecutorConfigBuilder& WithDiskLimit(std::size_t megabytes);
    ExecutorConfigBuilder& WithNetwork(bool allow);
    ExecutorConfigBuilder& WithFastTestMode(bool enabled);
    ExecutorConfigBuilder& WithWhitelistCommand(const std::string& name);
    ExecutorConfigBuilder& WithContainerRuntime(const std::string& runtime_binary);
    ExecutorConfigBuilder& WithContainerImage(const std::string& image);
    ExecutorConfigBuilder& WithTerminationGrace(std::chrono::seconds grace);
    ExecutorConfigBuilder& WithContentHashing(bool enabled);
    ExecutorConfigBuilder& LocalOnly();

    /**
     * @brief Validate and return the configuration
     * @throws std::invalid_argument on invalid values
     */
    ExecutorConfig Build() const;

private:
    ExecutorConfig config_;
};

} // namespace core
} // namespace bastion
