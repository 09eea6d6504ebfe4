/**
 * @file container_utils.hpp
 * @brief Container runtime CLI wrapper for sandboxed command runs
 *
 * Builds hardened `run` argument vectors and drives the runtime CLI for
 * capability probing, stop/kill/remove and named-volume housekeeping.
 * Works with Docker and with Podman through its Docker-compatible CLI.
 * Arguments are always passed as argv, never through a shell.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace bastion {
namespace utils {

/**
 * @enum NetworkMode
 * @brief Container network isolation modes
 */
enum class NetworkMode {
    NONE,    ///< No network access (default)
    BRIDGE   ///< Default bridge network
};

/**
 * @struct ContainerRunSpec
 * @brief Complete description of one `run --rm` invocation
 */
struct ContainerRunSpec {
    // Basic Settings
    std::string name;                          ///< Container name
    std::string image{"python:3.11-slim"};     ///< Trusted base image
    std::string shell{"bash"};                 ///< Shell receiving `-c <command>`
    std::string command;                       ///< Sanitized command line

    // Resource Limits
    std::size_t memory_limit_mb{512};          ///< --memory
    double cpu_limit{0.5};                     ///< --cpus (fraction of one core)
    std::uintmax_t file_size_limit_bytes{100ULL * 1024 * 1024};  ///< --ulimit=fsize

    // Security Settings
    NetworkMode network_mode{NetworkMode::NONE};
    bool no_new_privileges{true};
    std::vector<std::string> capabilities_drop{"ALL"};
    std::string user{"1000:1000"};

    // Filesystem Settings
    std::filesystem::path staging_dir;         ///< Host directory bind-mounted read-write
    std::string mount_point{"/workspace"};     ///< Mount target and working directory
    std::string scratch_volume;                ///< Named volume for /tmp (empty: none)

    // Environment
    std::map<std::string, std::string> environment_vars;
    std::map<std::string, std::string> labels;
};

/**
 * @struct ContainerExecResult
 * @brief Result of one runtime CLI call
 */
struct ContainerExecResult {
    int exit_code{0};
    std::string stdout_output;
    std::string stderr_output;
    std::chrono::milliseconds duration{0};
    bool success{false};
    bool timed_out{false};
};

/**
 * @class ContainerUtils
 * @brief Thin, stateless driver for the container runtime CLI
 *
 * **Thread Safety**: All methods are const and safe to call concurrently.
 *
 * **Usage Example**:
 * @code
 * ContainerUtils runtime("docker");
 * if (runtime.IsRuntimeAvailable(std::chrono::seconds(5))) {
 *     ContainerRunSpec spec;
 *     spec.name = "bastion-1234";
 *     spec.staging_dir = "/tmp/bastion-staging-abc/workspace";
 *     spec.command = "pytest -q";
 *     auto argv = runtime.WithRuntime(runtime.BuildRunCommand(spec));
 * }
 * @endcode
 */
class ContainerUtils {
public:
    explicit ContainerUtils(std::string runtime_binary = "docker");

    /***************************************************************************
     * Runtime Detection
     ***************************************************************************/

    /**
     * @brief Probe the runtime with `<runtime> version`
     *
     * A missing binary, an unreachable daemon or a probe slower than
     * timeout all count as unavailable.
     */
    bool IsRuntimeAvailable(std::chrono::seconds timeout) const;

    /**
     * @brief Server version reported by the runtime, or "unknown"
     */
    std::string GetRuntimeVersion() const;

    /***************************************************************************
     * Command Construction
     ***************************************************************************/

    /**
     * @brief Build the `run` argument vector (without the runtime binary)
     */
    std::vector<std::string> BuildRunCommand(const ContainerRunSpec& spec) const;

    /**
     * @brief Prefix an argument vector with the runtime binary
     */
    std::vector<std::string> WithRuntime(const std::vector<std::string>& args) const;

    /***************************************************************************
     * Lifecycle
     ***************************************************************************/

    /**
     * @brief Check whether a container with this name or ID exists
     */
    bool ContainerExists(const std::string& container_name) const;

    bool StopContainer(const std::string& container_name, std::chrono::seconds grace) const;
    bool KillContainer(const std::string& container_name) const;
    bool RemoveContainer(const std::string& container_name, bool force) const;

    /***************************************************************************
     * Volumes
     ***************************************************************************/

    /**
     * @brief Names of volumes whose name starts with prefix
     */
    std::vector<std::string> ListVolumes(const std::string& prefix) const;
    bool RemoveVolume(const std::string& volume_name) const;

    /**
     * @brief Run `<runtime> <args...>` to completion with a timeout
     */
    ContainerExecResult ExecuteRuntimeCommand(const std::vector<std::string>& args,
                                              std::chrono::seconds timeout) const;

    const std::string& RuntimeBinary() const { return runtime_binary_; }

private:
    std::string runtime_binary_;
};

} // namespace utils
} // namespace bastion
