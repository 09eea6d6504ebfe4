/**
 * @file container_backend.cpp
 * @brief Staged, hardened container execution
 *
 * **Run lifecycle**:
 * ```
 * stage workspace → run --rm (foreground CLI) → exit
 *        ↓                                        ↓
 *  ScopedTempDir                     sync changed files back → remove staging
 * ```
 *
 * On timeout the executor terminates the CLI (the runtime proxies the
 * signal into the container), then kills the container by name.
 *
 * @date 2025
 */

#include "bastion/backends/container_backend.hpp"
#include "bastion/utils/hash_utils.hpp"
#include "bastion/utils/process_runner.hpp"
#include "bastion/utils/scoped_temp_dir.hpp"
#include "bastion/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <csignal>

namespace bastion {
namespace backends {

namespace fs = std::filesystem;

namespace {

/// `run` exit status when the runtime itself failed
constexpr int kRuntimeErrorExitCode = 125;

/**
 * @class ContainerRun
 * @brief Foreground runtime CLI process plus its staging directory
 */
class ContainerRun : public SandboxRun {
public:
    ContainerRun(std::unique_ptr<utils::ChildProcess> client,
                 utils::ScopedTempDir staging,
                 fs::path staging_workspace,
                 fs::path workspace,
                 std::string container_name,
                 const utils::ContainerUtils& runtime,
                 const core::ResourceLimits& limits)
        : client_(std::move(client)),
          staging_(std::move(staging)),
          staging_workspace_(std::move(staging_workspace)),
          workspace_(std::move(workspace)),
          container_name_(std::move(container_name)),
          runtime_(runtime),
          limits_(limits) {}

    bool WaitUntil(Clock::time_point deadline) override {
        return client_->WaitUntil(deadline);
    }

    void Terminate() override {
        // The CLI proxies SIGTERM to the container's main process
        client_->SignalGroup(SIGTERM);
    }

    void Kill() override {
        runtime_.KillContainer(container_name_);
        client_->SignalGroup(SIGKILL);
    }

    BackendOutput Finish() override {
        auto outcome = client_->Collect();

        if (outcome.exit_code == kRuntimeErrorExitCode && outcome.stdout_output.empty()) {
            throw BackendError("Container runtime error: " +
                               utils::StringUtils::Trim(outcome.stderr_output));
        }

        BackendOutput output;
        output.exit_code = outcome.exit_code;
        output.stdout_output = std::move(outcome.stdout_output);
        output.stderr_output = std::move(outcome.stderr_output);
        output.duration = outcome.duration;

        output.resource_usage["execution_time_ms"] = static_cast<double>(outcome.duration.count());
        output.resource_usage["memory_limit_mb"] = static_cast<double>(limits_.max_memory_mb);
        output.resource_usage["cpu_limit"] = limits_.max_cpu_fraction;

        if (outcome.output_truncated) {
            output.warnings.push_back("Output truncated to capture limit");
        }

        try {
            auto written = ContainerBackend::SyncBack(staging_workspace_, workspace_);
            spdlog::debug("Synchronized {} files from {}", written, container_name_);
        }
        catch (const fs::filesystem_error& e) {
            throw BackendError(std::string("Failed to synchronize staging directory: ") + e.what());
        }

        staging_.Delete();
        return output;
    }

    std::optional<std::string> ResourceId() const override { return container_name_; }

private:
    std::unique_ptr<utils::ChildProcess> client_;
    utils::ScopedTempDir staging_;
    fs::path staging_workspace_;
    fs::path workspace_;
    std::string container_name_;
    const utils::ContainerUtils& runtime_;
    core::ResourceLimits limits_;
};

} // anonymous namespace

ContainerBackend::ContainerBackend(ContainerBackendConfig config)
    : config_(std::move(config)),
      runtime_(config_.runtime_binary) {
}

bool ContainerBackend::Probe() {
    spdlog::info("Checking {} availability...", config_.runtime_binary);

    if (!runtime_.IsRuntimeAvailable(config_.probe_timeout)) {
        spdlog::warn("⚠ Container runtime {} is not available", config_.runtime_binary);
        return false;
    }

    spdlog::info("✓ {} is available (version {})", config_.runtime_binary,
                 runtime_.GetRuntimeVersion());
    return true;
}

std::string ContainerBackend::ContainerName(const std::string& execution_id) const {
    return config_.resource_prefix + "-" + execution_id;
}

// ============================================================================
// LAUNCH
// ============================================================================

utils::ContainerRunSpec ContainerBackend::BuildRunSpec(const BackendRequest& request,
                                                       const fs::path& staging_workspace) const {
    utils::ContainerRunSpec spec;
    spec.name = ContainerName(request.execution_id);
    spec.image = config_.image;
    spec.shell = config_.shell;
    spec.command = request.command;

    spec.memory_limit_mb = request.limits.max_memory_mb;
    spec.cpu_limit = request.limits.max_cpu_fraction;
    spec.file_size_limit_bytes = static_cast<std::uintmax_t>(request.limits.max_disk_mb) * 1024 * 1024;

    spec.network_mode = request.limits.allow_network ? utils::NetworkMode::BRIDGE
                                                     : utils::NetworkMode::NONE;
    spec.user = config_.user;

    spec.staging_dir = staging_workspace;
    spec.mount_point = config_.mount_point;
    if (config_.scratch_volume) {
        spec.scratch_volume = spec.name + "-scratch";
    }

    spec.environment_vars = request.environment;
    spec.labels["bastion.execution-id"] = request.execution_id;
    return spec;
}

std::unique_ptr<SandboxRun> ContainerBackend::Launch(const BackendRequest& request) {
    utils::ScopedTempDir staging;
    fs::path staging_workspace;

    try {
        fs::path root = config_.staging_root.empty() ? fs::temp_directory_path()
                                                     : config_.staging_root;
        staging.CreateUnderPath(root, config_.resource_prefix + "-staging-");
        staging_workspace = staging.GetPath() / "workspace";
        StageWorkspace(request.workspace_dir, staging_workspace);
    }
    catch (const fs::filesystem_error& e) {
        throw BackendError(std::string("Failed to prepare staging directory: ") + e.what());
    }

    auto spec = BuildRunSpec(request, staging_workspace);

    utils::ProcessSpec process;
    process.argv = runtime_.WithRuntime(runtime_.BuildRunCommand(spec));
    process.max_output_bytes = config_.max_output_bytes;

    spdlog::info("Starting container {} ({})", spec.name, config_.image);
    spdlog::debug("Run command: {}", utils::StringUtils::Join(process.argv, " "));

    std::unique_ptr<utils::ChildProcess> client;
    try {
        client = utils::ChildProcess::Spawn(process);
    }
    catch (const utils::ProcessError& e) {
        throw BackendError(e.what());
    }

    return std::make_unique<ContainerRun>(std::move(client), std::move(staging),
                                          staging_workspace, request.workspace_dir,
                                          spec.name, runtime_, request.limits);
}

// ============================================================================
// STAGING
// ============================================================================

void ContainerBackend::StageWorkspace(const fs::path& workspace, const fs::path& staging_workspace) {
    fs::create_directories(staging_workspace);
    if (fs::exists(workspace)) {
        fs::copy(workspace, staging_workspace,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks);
    }

    // The sandbox user is not the host user; let it write the copy
    fs::permissions(staging_workspace, fs::perms::all, fs::perm_options::add);
    for (const auto& entry : fs::recursive_directory_iterator(staging_workspace)) {
        if (entry.is_symlink()) {
            continue;
        }
        if (entry.is_directory()) {
            fs::permissions(entry.path(), fs::perms::all, fs::perm_options::add);
        } else if (entry.is_regular_file()) {
            fs::permissions(entry.path(),
                            fs::perms::others_read | fs::perms::others_write |
                            fs::perms::group_read | fs::perms::group_write,
                            fs::perm_options::add);
        }
    }
}

std::size_t ContainerBackend::SyncBack(const fs::path& staging_workspace, const fs::path& workspace) {
    std::size_t written = 0;

    fs::create_directories(workspace);
    for (const auto& entry : fs::recursive_directory_iterator(staging_workspace)) {
        if (entry.is_symlink()) {
            spdlog::debug("Not synchronizing symlink {}", entry.path().string());
            continue;
        }

        fs::path target = workspace / entry.path().lexically_relative(staging_workspace);

        if (entry.is_directory()) {
            fs::create_directories(target);
            continue;
        }
        if (!entry.is_regular_file()) {
            continue;
        }

        if (fs::is_regular_file(target) &&
            utils::HashUtils::FilesHaveSameContent(entry.path(), target)) {
            continue;
        }

        fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
        ++written;
    }

    return written;
}

// ============================================================================
// DEFERRED TEARDOWN
// ============================================================================
// graceful stop → force remove; a container already gone counts as released

bool ContainerBackend::ReleaseResource(const std::string& resource_id, std::chrono::seconds grace) {
    if (!runtime_.ContainerExists(resource_id)) {
        spdlog::debug("Container {} already removed", resource_id);
        return true;
    }

    if (runtime_.StopContainer(resource_id, grace)) {
        // --rm removes it once stopped; force-remove covers the race
        runtime_.RemoveContainer(resource_id, true);
        return true;
    }

    if (runtime_.RemoveContainer(resource_id, true)) {
        return true;
    }

    spdlog::warn("⚠ Abandoning container {} after failed teardown", resource_id);
    return false;
}

std::vector<std::string> ContainerBackend::ListAuxiliaryResources(const std::string& execution_id) {
    return runtime_.ListVolumes(ContainerName(execution_id) + "-");
}

bool ContainerBackend::RemoveAuxiliaryResource(const std::string& name) {
    return runtime_.RemoveVolume(name);
}

} // namespace backends
} // namespace bastion
