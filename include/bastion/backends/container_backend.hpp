/**
 * @file container_backend.hpp
 * @brief Container backend running commands in a hardened `run --rm`
 *
 * Each launch copies the workspace into a private staging directory,
 * bind-mounts it into a fresh container and copies changed files back
 * once the container exits. The staging directory is removed on every
 * exit path.
 *
 * @date 2025
 */

#pragma once

#include "bastion/backends/sandbox_backend.hpp"
#include "bastion/utils/container_utils.hpp"

namespace bastion {
namespace backends {

/**
 * @struct ContainerBackendConfig
 * @brief Container runtime and image settings
 */
struct ContainerBackendConfig {
    std::string runtime_binary{"docker"};          ///< docker or podman
    std::string image{"python:3.11-slim"};         ///< Trusted base image
    std::string shell{"bash"};                     ///< Shell inside the image
    std::string user{"1000:1000"};                 ///< Unprivileged uid:gid
    std::string mount_point{"/workspace"};         ///< In-container workspace path
    std::string resource_prefix{"bastion"};        ///< Container and volume name prefix
    bool scratch_volume{true};                     ///< Named volume for /tmp
    std::chrono::seconds probe_timeout{5};         ///< `version` probe timeout
    std::filesystem::path staging_root;            ///< Empty: system temp directory
    std::size_t max_output_bytes{8 * 1024 * 1024}; ///< Capture cap per stream
};

/**
 * @class ContainerBackend
 * @brief Isolated backend driving the container runtime CLI
 *
 * Containers are named `<prefix>-<execution id>`; the scratch volume is
 * `<prefix>-<execution id>-scratch`. Both names are what deferred cleanup
 * uses to find leftovers.
 */
class ContainerBackend : public SandboxBackend {
public:
    explicit ContainerBackend(ContainerBackendConfig config = ContainerBackendConfig{});

    std::string Name() const override { return "container"; }
    bool Probe() override;
    std::unique_ptr<SandboxRun> Launch(const BackendRequest& request) override;

    bool ReleaseResource(const std::string& resource_id, std::chrono::seconds grace) override;
    std::vector<std::string> ListAuxiliaryResources(const std::string& execution_id) override;
    bool RemoveAuxiliaryResource(const std::string& name) override;

    std::string ContainerName(const std::string& execution_id) const;

    /**
     * @brief Translate a request into the container run description
     */
    utils::ContainerRunSpec BuildRunSpec(const BackendRequest& request,
                                         const std::filesystem::path& staging_workspace) const;

    /**
     * @brief Copy the workspace into staging and open it up for the sandbox user
     * @throws std::filesystem::filesystem_error on I/O failure
     */
    static void StageWorkspace(const std::filesystem::path& workspace,
                               const std::filesystem::path& staging_workspace);

    /**
     * @brief Copy new and changed files from staging back to the workspace
     *
     * Unchanged files are left untouched so their timestamps survive.
     * Symlinks created inside the sandbox are not copied.
     *
     * @return Number of files written
     * @throws std::filesystem::filesystem_error on I/O failure
     */
    static std::size_t SyncBack(const std::filesystem::path& staging_workspace,
                                const std::filesystem::path& workspace);

    const ContainerBackendConfig& GetConfig() const { return config_; }

private:
    ContainerBackendConfig config_;
    utils::ContainerUtils runtime_;
};

} // namespace backends
} // namespace bastion
