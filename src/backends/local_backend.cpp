/**
 * @file local_backend.cpp
 * @brief Child-process execution without container isolation
 *
 * @date 2025
 */

#include "bastion/backends/local_backend.hpp"
#include "bastion/utils/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <regex>

#include <unistd.h>

namespace bastion {
namespace backends {

namespace {

constexpr const char* kLocalIsolationNotice =
    "Executed in local sandbox (container runtime unavailable): isolation guarantees reduced";

constexpr const char* kInstallSkippedWarning =
    "Dependency installation skipped (fast test mode)";

/**
 * @class LocalRun
 * @brief ChildProcess-backed run handle
 */
class LocalRun : public SandboxRun {
public:
    explicit LocalRun(std::unique_ptr<utils::ChildProcess> child)
        : child_(std::move(child)) {}

    bool WaitUntil(Clock::time_point deadline) override {
        return child_->WaitUntil(deadline);
    }

    void Terminate() override { child_->SignalGroup(SIGTERM); }
    void Kill() override { child_->SignalGroup(SIGKILL); }

    BackendOutput Finish() override {
        auto outcome = child_->Collect();

        BackendOutput output;
        output.exit_code = outcome.exit_code;
        output.stdout_output = std::move(outcome.stdout_output);
        output.stderr_output = std::move(outcome.stderr_output);
        output.duration = outcome.duration;

        double wall_seconds = static_cast<double>(outcome.duration.count()) / 1000.0;
        double cpu_seconds = outcome.cpu_user_seconds + outcome.cpu_system_seconds;

        output.resource_usage["execution_time_ms"] = static_cast<double>(outcome.duration.count());
        output.resource_usage["peak_memory_mb"] = outcome.peak_memory_mb;
        output.resource_usage["cpu_user_seconds"] = outcome.cpu_user_seconds;
        output.resource_usage["cpu_system_seconds"] = outcome.cpu_system_seconds;
        output.resource_usage["cpu_percent"] =
            wall_seconds > 0.0 ? cpu_seconds / wall_seconds * 100.0 : 0.0;

        if (outcome.signaled) {
            output.warnings.push_back("Process terminated by signal " +
                                      std::to_string(outcome.term_signal));
        }
        if (outcome.output_truncated) {
            output.warnings.push_back("Output truncated to capture limit");
        }

        return output;
    }

    std::optional<std::string> ResourceId() const override { return std::nullopt; }

private:
    std::unique_ptr<utils::ChildProcess> child_;
};

} // anonymous namespace

LocalBackend::LocalBackend(LocalBackendConfig config)
    : config_(std::move(config)) {
    if (config_.fast_test_mode) {
        spdlog::info("Local backend: fast test mode enabled (dependency installs are skipped)");
    }
}

bool LocalBackend::Probe() {
    bool available = access(config_.shell.c_str(), X_OK) == 0;
    if (!available) {
        spdlog::error("Local backend shell {} is not executable", config_.shell);
    }
    return available;
}

std::optional<std::string> LocalBackend::IsolationNotice() const {
    return std::string(kLocalIsolationNotice);
}

std::unique_ptr<SandboxRun> LocalBackend::Launch(const BackendRequest& request) {
    if (config_.fast_test_mode && IsDependencyInstall(request.command)) {
        spdlog::info("Fast test mode: skipping '{}'", request.command);

        BackendOutput output;
        output.exit_code = 0;
        output.resource_usage["execution_time_ms"] = 0.0;
        output.warnings.push_back(kInstallSkippedWarning);
        return std::make_unique<CompletedRun>(std::move(output));
    }

    spdlog::warn("⚠ Running {} without container isolation", request.execution_id);

    utils::ProcessSpec spec;
    spec.argv = {config_.shell, "-c", request.command};
    spec.working_dir = request.workspace_dir;
    spec.environment = request.environment;
    spec.inherit_environment = true;
    spec.file_size_limit_bytes = static_cast<std::uintmax_t>(request.limits.max_disk_mb) * 1024 * 1024;
    spec.max_output_bytes = config_.max_output_bytes;

    try {
        return std::make_unique<LocalRun>(utils::ChildProcess::Spawn(spec));
    }
    catch (const utils::ProcessError& e) {
        throw BackendError(e.what());
    }
}

// ============================================================================
// FAST TEST MODE
// ============================================================================

bool LocalBackend::IsDependencyInstall(const std::string& command) {
    static const std::regex compound(R"([;&|<>`]|\$\()");
    static const std::vector<std::regex> installers = {
        std::regex(R"(^(pip3?|python3?\s+-m\s+pip)\s+install(\s|$))"),
        std::regex(R"(^npm\s+(install|ci|i)(\s|$))"),
        std::regex(R"(^yarn(\s+install|\s+add)(\s|$))"),
        std::regex(R"(^pnpm\s+(install|add|i)(\s|$))"),
        std::regex(R"(^poetry\s+install(\s|$))"),
        std::regex(R"(^bundle\s+install(\s|$))"),
        std::regex(R"(^composer\s+install(\s|$))"),
        std::regex(R"(^go\s+mod\s+download(\s|$))"),
        std::regex(R"(^cargo\s+fetch(\s|$))"),
    };

    if (std::regex_search(command, compound)) {
        return false;
    }
    for (const auto& installer : installers) {
        if (std::regex_search(command, installer)) {
            return true;
        }
    }
    return false;
}

} // namespace backends
} // namespace bastion
