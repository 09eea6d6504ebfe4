/**
 * @file container_utils.cpp
 * @brief Implementation of the container runtime CLI driver
 *
 * **Hardening applied to every run**:
 * 1. Capability dropping (--cap-drop=ALL)
 * 2. No new privileges (--security-opt=no-new-privileges)
 * 3. Fixed unprivileged user (--user=1000:1000)
 * 4. Resource limits (--memory, --cpus, --ulimit=fsize)
 * 5. Network isolation (--network=none unless explicitly allowed)
 *
 * **Container Lifecycle**:
 * ```
 * run --rm (foreground) → exit → auto-remove
 *                      └→ timeout → stop → kill → rm --force
 * ```
 *
 * @date 2025
 */

#include "bastion/utils/container_utils.hpp"
#include "bastion/utils/process_runner.hpp"
#include "bastion/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <regex>

namespace bastion {
namespace utils {

ContainerUtils::ContainerUtils(std::string runtime_binary)
    : runtime_binary_(std::move(runtime_binary)) {
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable(std::chrono::seconds timeout) const {
    auto result = ExecuteRuntimeCommand({"version"}, timeout);
    if (result.timed_out) {
        spdlog::warn("⚠ {} version probe timed out after {}s", runtime_binary_, timeout.count());
        return false;
    }
    if (!result.success) {
        spdlog::debug("{} version probe failed: {}", runtime_binary_,
                      StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

std::string ContainerUtils::GetRuntimeVersion() const {
    auto result = ExecuteRuntimeCommand({"version", "--format", "{{.Server.Version}}"},
                                        std::chrono::seconds(5));
    if (result.success) {
        // Extract version number using regex (matches x.y.z format)
        std::regex version_regex(R"((\d+\.\d+\.\d+))");
        std::smatch match;
        if (std::regex_search(result.stdout_output, match, version_regex)) {
            return match[1].str();
        }
        return StringUtils::Trim(result.stdout_output);
    }

    return "unknown";
}

// ============================================================================
// RUN COMMAND CONSTRUCTION
// ============================================================================
// Fixed template: run --rm <isolation> <limits> <mounts> <env> image shell -c cmd

std::vector<std::string> ContainerUtils::BuildRunCommand(const ContainerRunSpec& spec) const {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("--rm");

    if (!spec.name.empty()) {
        args.push_back("--name=" + spec.name);
    }

    switch (spec.network_mode) {
        case NetworkMode::NONE:
            args.push_back("--network=none");
            break;
        case NetworkMode::BRIDGE:
            args.push_back("--network=bridge");
            break;
    }

    // Resource limits
    args.push_back(fmt::format("--memory={}m", spec.memory_limit_mb));
    args.push_back(fmt::format("--cpus={}", spec.cpu_limit));
    args.push_back(fmt::format("--ulimit=fsize={}", spec.file_size_limit_bytes));

    // Security
    if (spec.no_new_privileges) {
        args.push_back("--security-opt=no-new-privileges");
    }
    for (const auto& cap : spec.capabilities_drop) {
        args.push_back("--cap-drop=" + cap);
    }
    if (!spec.user.empty()) {
        args.push_back("--user=" + spec.user);
    }

    // Volume mounts
    args.push_back("--volume=" + spec.staging_dir.string() + ":" + spec.mount_point + ":rw");
    if (!spec.scratch_volume.empty()) {
        args.push_back("--volume=" + spec.scratch_volume + ":/tmp:rw");
    }
    args.push_back("--workdir=" + spec.mount_point);

    for (const auto& [key, value] : spec.environment_vars) {
        args.push_back("--env=" + key + "=" + value);
    }
    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label=" + key + "=" + value);
    }

    args.push_back(spec.image);
    args.push_back(spec.shell);
    args.push_back("-c");
    args.push_back(spec.command);

    return args;
}

std::vector<std::string> ContainerUtils::WithRuntime(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(runtime_binary_);
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

bool ContainerUtils::ContainerExists(const std::string& container_name) const {
    auto result = ExecuteRuntimeCommand(
        {"container", "inspect", "--format", "{{.Id}}", container_name},
        std::chrono::seconds(15));
    return result.success;
}

bool ContainerUtils::StopContainer(const std::string& container_name,
                                   std::chrono::seconds grace) const {
    spdlog::info("Stopping container: {} (grace: {}s)", container_name, grace.count());

    auto result = ExecuteRuntimeCommand(
        {"stop", "--time=" + std::to_string(grace.count()), container_name},
        grace + std::chrono::seconds(10));

    if (result.success) {
        spdlog::info("✓ Container stopped: {}", container_name);
        return true;
    }

    spdlog::warn("⚠ Failed to stop container {}: {}", container_name,
                 StringUtils::Trim(result.stderr_output));
    return false;
}

bool ContainerUtils::KillContainer(const std::string& container_name) const {
    spdlog::info("Killing container: {}", container_name);

    auto result = ExecuteRuntimeCommand({"kill", container_name}, std::chrono::seconds(10));
    if (!result.success) {
        spdlog::debug("kill {} failed: {}", container_name,
                      StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

bool ContainerUtils::RemoveContainer(const std::string& container_name, bool force) const {
    spdlog::info("Removing container: {} (force: {})", container_name, force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_name);

    auto result = ExecuteRuntimeCommand(args, std::chrono::seconds(30));

    if (result.success) {
        spdlog::info("✓ Container removed: {}", container_name);
        return true;
    }

    spdlog::warn("⚠ Failed to remove container {}: {}", container_name,
                 StringUtils::Trim(result.stderr_output));
    return false;
}

// ============================================================================
// VOLUME MANAGEMENT
// ============================================================================

std::vector<std::string> ContainerUtils::ListVolumes(const std::string& prefix) const {
    auto result = ExecuteRuntimeCommand(
        {"volume", "ls", "--quiet", "--filter", "name=" + prefix},
        std::chrono::seconds(15));

    std::vector<std::string> volumes;
    if (!result.success) {
        spdlog::warn("⚠ Failed to list volumes for {}: {}", prefix,
                     StringUtils::Trim(result.stderr_output));
        return volumes;
    }

    // The name filter matches substrings; keep true prefix matches only
    for (const auto& line : StringUtils::Split(result.stdout_output, '\n')) {
        auto name = StringUtils::Trim(line);
        if (!name.empty() && StringUtils::StartsWith(name, prefix)) {
            volumes.push_back(name);
        }
    }
    return volumes;
}

bool ContainerUtils::RemoveVolume(const std::string& volume_name) const {
    auto result = ExecuteRuntimeCommand({"volume", "rm", volume_name}, std::chrono::seconds(30));
    if (result.success) {
        spdlog::info("✓ Volume removed: {}", volume_name);
        return true;
    }

    spdlog::warn("⚠ Failed to remove volume {}: {}", volume_name,
                 StringUtils::Trim(result.stderr_output));
    return false;
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteRuntimeCommand(const std::vector<std::string>& args,
                                                          std::chrono::seconds timeout) const {
    ContainerExecResult exec_result;

    ProcessSpec spec;
    spec.argv = WithRuntime(args);
    spec.max_output_bytes = 1024 * 1024;

    spdlog::debug("Executing: {}", StringUtils::Join(spec.argv, " "));

    try {
        auto outcome = RunProcess(spec, timeout);
        exec_result.exit_code = outcome.exit_code;
        exec_result.stdout_output = std::move(outcome.stdout_output);
        exec_result.stderr_output = std::move(outcome.stderr_output);
        exec_result.duration = outcome.duration;
        exec_result.timed_out = outcome.exit_code == 124 && outcome.signaled;
        exec_result.success = outcome.exit_code == 0;
    }
    catch (const ProcessError& e) {
        exec_result.exit_code = -1;
        exec_result.stderr_output = e.what();
        exec_result.success = false;
    }

    return exec_result;
}

} // namespace utils
} // namespace bastion
