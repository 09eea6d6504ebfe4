/**
 * @file sandbox_executor.cpp
 * @brief Implementation of the sandbox execution orchestrator
 *
 * **Timeout race**:
 * ```
 * WaitUntil(start + timeout) ── exited ──→ Finish → diff
 *        │
 *     expired
 *        ↓
 * Terminate → WaitUntil(+termination_grace) ── exited ──→ Finish (no diff), 124
 *                     │
 *                  expired
 *                     ↓
 *               Kill → wait until reaped → Finish (no diff), 124
 * ```
 *
 * **Cleanup escalation**: graceful stop → force remove → log and abandon.
 * The active-resources entry is erased on every path.
 *
 * @date 2025
 */

#include "bastion/core/sandbox_executor.hpp"
#include "bastion/backends/container_backend.hpp"
#include "bastion/backends/local_backend.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <random>
#include <sstream>
#include <stdexcept>

namespace bastion {
namespace core {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

constexpr const char* kTimeoutMessage = "Execution timed out";
constexpr const char* kBlockedPrefix = "Command blocked: ";
constexpr const char* kBackendErrorPrefix = "Sandbox backend error: ";

/**
 * @class ScopeExit
 * @brief Runs a callback when leaving scope
 */
class ScopeExit {
public:
    explicit ScopeExit(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    std::function<void()> fn_;
};

std::shared_ptr<backends::SandboxBackend> MakeContainerBackend(const ExecutorConfig& config) {
    if (!config.enable_container_backend) {
        return nullptr;
    }
    auto container_config = config.container;
    container_config.max_output_bytes = config.max_output_bytes;
    return std::make_shared<backends::ContainerBackend>(std::move(container_config));
}

std::shared_ptr<backends::SandboxBackend> MakeLocalBackend(const ExecutorConfig& config) {
    backends::LocalBackendConfig local_config;
    local_config.fast_test_mode = config.fast_test_mode;
    local_config.max_output_bytes = config.max_output_bytes;
    return std::make_shared<backends::LocalBackend>(std::move(local_config));
}

void AppendWarnings(std::vector<std::string>& target, const std::vector<std::string>& source) {
    target.insert(target.end(), source.begin(), source.end());
}

} // anonymous namespace

std::string ExecutionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::COMPLETED:     return "COMPLETED";
        case ExecutionStatus::BLOCKED:       return "BLOCKED";
        case ExecutionStatus::TIMED_OUT:     return "TIMED_OUT";
        case ExecutionStatus::BACKEND_FAULT: return "BACKEND_FAULT";
    }
    return "UNKNOWN";
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

SandboxExecutor::SandboxExecutor(ExecutorConfig config)
    : SandboxExecutor(config, MakeContainerBackend(config), MakeLocalBackend(config)) {
}

SandboxExecutor::SandboxExecutor(ExecutorConfig config,
                                 std::shared_ptr<backends::SandboxBackend> container_backend,
                                 std::shared_ptr<backends::SandboxBackend> local_backend)
    : config_(std::move(config)),
      validator_(config_.security_level),
      diff_tracker_(config_.diff),
      container_backend_(std::move(container_backend)),
      local_backend_(std::move(local_backend)) {

    ValidateConfig(config_);
    if (!local_backend_) {
        throw std::invalid_argument("A local backend is required");
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Bastion Sandbox Executor");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Security level: {}", security::SecurityLevelToString(config_.security_level));

    for (const auto& name : config_.extra_whitelist) {
        if (!validator_.AddWhitelistCommand(name)) {
            spdlog::warn("⚠ Ignoring invalid whitelist entry: {}", name);
        }
    }

    // One-time capability probe; never re-checked per call
    if (container_backend_ && config_.enable_container_backend) {
        container_available_ = container_backend_->Probe();
    }

    if (!container_available_) {
        spdlog::warn("⚠ Container runtime unavailable, commands run in the local sandbox");
        if (!local_backend_->Probe()) {
            spdlog::error("Local backend failed its probe; executions will fault");
        }
    }

    spdlog::info("✓ Executor ready (backend: {})",
                 container_available_ ? container_backend_->Name() : local_backend_->Name());
}

SandboxExecutor::~SandboxExecutor() {
    spdlog::debug("Shutting down sandbox executor...");
    CleanupAll();
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult SandboxExecutor::Execute(const ExecutionRequest& request) {
    if (request.workspace_dir.empty()) {
        throw std::invalid_argument("Workspace directory must not be empty");
    }

    const ResourceLimits limits = request.limits.value_or(config_.default_limits);
    ValidateLimits(limits);

    const int timeout_seconds = request.timeout_seconds.value_or(limits.max_execution_seconds);
    if (timeout_seconds <= 0) {
        throw std::invalid_argument("Timeout must be positive");
    }

    ExecutionResult result;
    result.execution_id = GenerateExecutionId();
    ++total_executions_;

    spdlog::info("Execution {}: {}", result.execution_id, request.command);

    // ========================================================================
    // VALIDATION
    // ========================================================================

    auto validation = validator_.Validate(request.command);
    result.command_executed = validation.sanitized_command.value_or(request.command);

    if (!validation.is_safe) {
        std::string reason = validation.blocked_reason.value_or("unspecified");
        spdlog::warn("⚠ Execution {} blocked: {}", result.execution_id, reason);

        result.status = ExecutionStatus::BLOCKED;
        result.exit_code = kBlockedExitCode;
        result.stderr_output = kBlockedPrefix + reason;
        return result;
    }
    AppendWarnings(result.warnings, validation.warnings);

    // ========================================================================
    // BACKEND RUN
    // ========================================================================

    auto backend = container_available_ ? container_backend_ : local_backend_;
    result.backend = backend->Name();

    backends::BackendRequest backend_request;
    backend_request.execution_id = result.execution_id;
    backend_request.command = result.command_executed;
    backend_request.workspace_dir = request.workspace_dir;
    backend_request.limits = limits;
    backend_request.environment = request.environment;
    backend_request.timeout = std::chrono::seconds(timeout_seconds);

    auto fault = [&result](const std::string& message) {
        spdlog::error("Execution {} backend fault: {}", result.execution_id, message);
        result.status = ExecutionStatus::BACKEND_FAULT;
        result.exit_code = kBackendFaultExitCode;
        result.stdout_output.clear();
        result.stderr_output = kBackendErrorPrefix + message;
    };

    auto start = Clock::now();
    std::unique_ptr<backends::SandboxRun> run;
    monitors::WorkspaceSnapshot before;
    backends::BackendOutput output;
    bool timed_out = false;

    try {
        std::error_code ec;
        fs::create_directories(request.workspace_dir, ec);
        if (ec) {
            throw backends::BackendError("Failed to create workspace directory " +
                                         request.workspace_dir.string() + ": " + ec.message());
        }

        before = diff_tracker_.Snapshot(request.workspace_dir);

        run = backend->Launch(backend_request);

        if (!run->WaitUntil(start + backend_request.timeout)) {
            timed_out = true;
            StopTimedOutRun(*run, result.execution_id);
        }

        output = run->Finish();
    }
    catch (const std::exception& e) {
        // BackendError, ProcessError and filesystem errors all end here
        if (!timed_out) {
            fault(e.what());
        } else {
            spdlog::warn("⚠ Execution {}: teardown after timeout failed: {}",
                         result.execution_id, e.what());
        }
    }

    if (timed_out) {
        result.status = ExecutionStatus::TIMED_OUT;
        result.exit_code = kTimeoutExitCode;
        result.stdout_output = std::move(output.stdout_output);
        result.stderr_output = kTimeoutMessage;
        result.duration = std::chrono::milliseconds(static_cast<long long>(timeout_seconds) * 1000);
        result.resource_usage["timeout"] = 1.0;
        spdlog::warn("⚠ Execution {} timed out after {}s", result.execution_id, timeout_seconds);
    }
    else if (result.status == ExecutionStatus::BACKEND_FAULT) {
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    }
    else {
        result.status = ExecutionStatus::COMPLETED;
        result.exit_code = output.exit_code;
        result.stdout_output = std::move(output.stdout_output);
        result.stderr_output = std::move(output.stderr_output);
        result.duration = output.duration;
        result.resource_usage = std::move(output.resource_usage);

        // ====================================================================
        // WORKSPACE DIFF
        // ====================================================================

        auto diff = diff_tracker_.Diff(before, diff_tracker_.Snapshot(request.workspace_dir));
        result.files_created = std::move(diff.created);
        result.files_modified = std::move(diff.modified);
        result.files_deleted = std::move(diff.deleted);

        spdlog::info("✓ Execution {} finished: exit {} in {}ms ({} created, {} modified, {} deleted)",
                     result.execution_id, result.exit_code, result.duration.count(),
                     result.files_created.size(), result.files_modified.size(),
                     result.files_deleted.size());
    }

    AppendWarnings(result.warnings, output.warnings);
    if (auto notice = backend->IsolationNotice()) {
        result.warnings.push_back(*notice);
    }

    // ========================================================================
    // REGISTRATION
    // ========================================================================

    if (run) {
        if (auto resource_id = run->ResourceId()) {
            result.backend_resource_id = *resource_id;
            RegisterResource(result.execution_id, *resource_id, backend);
        }
    }

    return result;
}

std::future<ExecutionResult> SandboxExecutor::ExecuteAsync(ExecutionRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return Execute(request);
    });
}

void SandboxExecutor::StopTimedOutRun(backends::SandboxRun& run, const std::string& execution_id) {
    spdlog::warn("⚠ Execution {} exceeded its timeout, terminating", execution_id);
    run.Terminate();

    if (run.WaitUntil(Clock::now() + config_.termination_grace)) {
        return;
    }

    spdlog::warn("⚠ Execution {} ignored termination for {}s, killing",
                 execution_id, config_.termination_grace.count());
    run.Kill();

    // A timed-out run is only reported once it is gone
    while (!run.WaitUntil(Clock::now() + std::chrono::seconds(1))) {
        spdlog::warn("⚠ Execution {} still running after kill, retrying", execution_id);
        run.Kill();
    }
}

// ============================================================================
// ACTIVE RESOURCES
// ============================================================================

void SandboxExecutor::RegisterResource(const std::string& execution_id,
                                       const std::string& resource_id,
                                       std::shared_ptr<backends::SandboxBackend> backend) {
    std::lock_guard<std::mutex> lock(resources_mutex_);
    active_resources_[execution_id] = ActiveResource{resource_id, std::move(backend), false};
    spdlog::debug("Registered {} for execution {}", resource_id, execution_id);
}

void SandboxExecutor::Cleanup(const std::string& execution_id) {
    std::string resource_id;
    std::shared_ptr<backends::SandboxBackend> backend;

    {
        std::lock_guard<std::mutex> lock(resources_mutex_);
        auto it = active_resources_.find(execution_id);
        if (it == active_resources_.end() || it->second.cleanup_in_progress) {
            spdlog::debug("Nothing to clean up for execution {}", execution_id);
            return;
        }
        it->second.cleanup_in_progress = true;
        resource_id = it->second.resource_id;
        backend = it->second.backend;
    }

    spdlog::info("Cleaning up execution {} ({})", execution_id, resource_id);

    {
        ScopeExit erase_entry([this, &execution_id]() {
            std::lock_guard<std::mutex> lock(resources_mutex_);
            active_resources_.erase(execution_id);
        });

        try {
            if (!backend->ReleaseResource(resource_id, config_.cleanup_grace)) {
                spdlog::warn("⚠ Resource {} could not be released", resource_id);
            }
        }
        catch (const std::exception& e) {
            spdlog::warn("⚠ Releasing {} failed: {}", resource_id, e.what());
        }
    }

    std::vector<std::string> auxiliary;
    try {
        auxiliary = backend->ListAuxiliaryResources(execution_id);
    }
    catch (const std::exception& e) {
        spdlog::warn("⚠ Listing auxiliary resources for {} failed: {}", execution_id, e.what());
    }

    for (const auto& name : auxiliary) {
        try {
            if (!backend->RemoveAuxiliaryResource(name)) {
                spdlog::warn("⚠ Auxiliary resource {} was not removed", name);
            }
        }
        catch (const std::exception& e) {
            spdlog::warn("⚠ Removing auxiliary resource {} failed: {}", name, e.what());
        }
    }

    spdlog::info("✓ Cleanup complete for execution {}", execution_id);
}

void SandboxExecutor::CleanupAll() {
    auto ids = ActiveExecutionIds();
    if (ids.empty()) {
        return;
    }

    spdlog::info("Cleaning up {} active executions...", ids.size());

    std::vector<std::future<void>> pending;
    pending.reserve(ids.size());
    for (const auto& id : ids) {
        try {
            pending.push_back(std::async(std::launch::async, [this, id]() { Cleanup(id); }));
        }
        catch (const std::system_error& e) {
            spdlog::warn("⚠ Could not start cleanup thread for {}: {}", id, e.what());
            Cleanup(id);
        }
    }

    std::size_t failures = 0;
    for (auto& task : pending) {
        try {
            task.get();
        }
        catch (const std::exception& e) {
            ++failures;
            spdlog::error("Cleanup task failed: {}", e.what());
        }
    }

    if (failures > 0) {
        spdlog::warn("⚠ {} of {} cleanup tasks failed", failures, ids.size());
    }
}

// ============================================================================
// INTROSPECTION
// ============================================================================

ExecutorStats SandboxExecutor::Stats() const {
    ExecutorStats stats;
    stats.total_executions = total_executions_.load();
    stats.container_runtime_available = container_available_;
    stats.backend = container_available_ ? container_backend_->Name() : local_backend_->Name();
    stats.default_limits = config_.default_limits;
    stats.validator_stats = validator_.GetStats();

    std::lock_guard<std::mutex> lock(resources_mutex_);
    stats.active_resource_count = active_resources_.size();
    return stats;
}

std::vector<std::string> SandboxExecutor::ActiveExecutionIds() const {
    std::lock_guard<std::mutex> lock(resources_mutex_);
    std::vector<std::string> ids;
    ids.reserve(active_resources_.size());
    for (const auto& [id, resource] : active_resources_) {
        ids.push_back(id);
    }
    return ids;
}

std::string SandboxExecutor::GenerateExecutionId() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::ostringstream oss;
    oss << std::hex;

    for (int i = 0; i < 8; i++) oss << dis(gen);
    oss << "-";
    for (int i = 0; i < 4; i++) oss << dis(gen);
    oss << "-4";
    for (int i = 0; i < 3; i++) oss << dis(gen);
    oss << "-";
    oss << dis2(gen);
    for (int i = 0; i < 3; i++) oss << dis(gen);
    oss << "-";
    for (int i = 0; i < 12; i++) oss << dis(gen);

    return oss.str();
}

} // namespace core
} // namespace bastion
