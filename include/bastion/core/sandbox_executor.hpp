/**
 * @file sandbox_executor.hpp
 * @brief Orchestrator for validated, time-bounded sandboxed command runs
 *
 * SandboxExecutor is the single entry point for running an untrusted
 * command against a workspace directory. It validates the command, picks
 * a backend once at construction (container if the runtime answers the
 * probe, local otherwise), races the run against its timeout, diffs the
 * workspace and returns a structured result. Backend resources that
 * outlive a run are tracked in an active-resources map until Cleanup().
 *
 * **Execution Flow**:
 * ```
 * Execute(request)
 *   ├─→ mint execution ID
 *   ├─→ CommandValidator::Validate ──blocked──→ exit 1, "Command blocked: ..."
 *   ├─→ resolve limits and timeout
 *   ├─→ snapshot workspace
 *   ├─→ backend->Launch ──fault──→ exit 1, "Sandbox backend error: ..."
 *   ├─→ WaitUntil(deadline) ──expired──→ Terminate → grace → Kill → exit 124
 *   ├─→ Finish (copy-back for containers)
 *   ├─→ diff workspace
 *   └─→ register resource ID for deferred teardown
 * ```
 *
 * @date 2025
 */

#pragma once

#include "bastion/backends/sandbox_backend.hpp"
#include "bastion/core/execution_types.hpp"
#include "bastion/core/executor_config.hpp"
#include "bastion/monitors/filesystem_diff_tracker.hpp"
#include "bastion/security/command_validator.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bastion {
namespace core {

/**
 * @struct ExecutorStats
 * @brief Snapshot of executor counters for external collectors
 */
struct ExecutorStats {
    std::uint64_t total_executions{0};
    std::size_t active_resource_count{0};
    bool container_runtime_available{false};
    std::string backend;                       ///< Backend selected at construction
    ResourceLimits default_limits;
    security::ValidatorStats validator_stats;
};

/**
 * @class SandboxExecutor
 * @brief Validates, runs, times out, diffs and tracks sandboxed commands
 *
 * **Thread Safety**: Execute() may be called concurrently. The
 * active-resources map is the only shared mutable state and is guarded by
 * a mutex. Cleanup() may run concurrently with Execute() and with itself.
 *
 * **Usage Example**:
 * @code
 * SandboxExecutor executor(ExecutorConfigBuilder().WithTimeout(60).Build());
 *
 * ExecutionRequest request;
 * request.command = "pytest -q";
 * request.workspace_dir = "/srv/projects/demo";
 *
 * auto result = executor.Execute(request);
 * spdlog::info("exit {} in {}ms", result.exit_code, result.duration.count());
 * executor.Cleanup(result.execution_id);
 * @endcode
 */
class SandboxExecutor {
public:
    /**
     * @brief Create the default backends and probe the container runtime once
     * @throws std::invalid_argument if config is invalid
     */
    explicit SandboxExecutor(ExecutorConfig config = ExecutorConfig{});

    /**
     * @brief Use caller-supplied backends
     * @param container_backend Preferred backend; may be null
     * @param local_backend Fallback backend; must not be null
     * @throws std::invalid_argument if config is invalid or local_backend is null
     */
    SandboxExecutor(ExecutorConfig config,
                    std::shared_ptr<backends::SandboxBackend> container_backend,
                    std::shared_ptr<backends::SandboxBackend> local_backend);

    /**
     * @brief Runs CleanupAll()
     */
    ~SandboxExecutor();

    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    /***************************************************************************
     * Execution
     ***************************************************************************/

    /**
     * @brief Validate and run one command
     *
     * Blocked commands, timeouts and backend faults are reported in the
     * result, never thrown.
     *
     * @throws std::invalid_argument on an empty workspace path, invalid
     *         limits or a non-positive timeout
     */
    ExecutionResult Execute(const ExecutionRequest& request);

    /**
     * @brief Execute() on its own thread
     */
    std::future<ExecutionResult> ExecuteAsync(ExecutionRequest request);

    /***************************************************************************
     * Deferred Teardown
     ***************************************************************************/

    /**
     * @brief Tear down the resource registered for execution_id
     *
     * Graceful stop, then forced removal, then removal of auxiliary
     * resources named after the execution. The bookkeeping entry is always
     * removed. Unknown IDs and repeated calls are no-ops. Never throws.
     */
    void Cleanup(const std::string& execution_id);

    /**
     * @brief Cleanup() every registered execution concurrently and wait
     */
    void CleanupAll();

    /***************************************************************************
     * Introspection
     ***************************************************************************/

    ExecutorStats Stats() const;

    std::vector<std::string> ActiveExecutionIds() const;

    bool ContainerRuntimeAvailable() const { return container_available_; }

    /// Validator used for every request (whitelist changes apply to later calls)
    security::CommandValidator& Validator() { return validator_; }

    const ExecutorConfig& GetConfig() const { return config_; }

private:
    struct ActiveResource {
        std::string resource_id;
        std::shared_ptr<backends::SandboxBackend> backend;
        bool cleanup_in_progress{false};
    };

    /**
     * @brief Escalate SIGTERM → grace → SIGKILL until the run has exited
     */
    void StopTimedOutRun(backends::SandboxRun& run, const std::string& execution_id);

    void RegisterResource(const std::string& execution_id,
                          const std::string& resource_id,
                          std::shared_ptr<backends::SandboxBackend> backend);

    static std::string GenerateExecutionId();

    ExecutorConfig config_;
    security::CommandValidator validator_;
    monitors::FilesystemDiffTracker diff_tracker_;

    std::shared_ptr<backends::SandboxBackend> container_backend_;
    std::shared_ptr<backends::SandboxBackend> local_backend_;
    bool container_available_{false};

    std::atomic<std::uint64_t> total_executions_{0};

    mutable std::mutex resources_mutex_;
    std::map<std::string, ActiveResource> active_resources_;
};

} // namespace core
} // namespace bastion
