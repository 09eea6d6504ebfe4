/**
 * @file local_backend.hpp
 * @brief Fallback backend running commands as plain child processes
 *
 * Used when no container runtime is available. Commands run through
 * `/bin/sh -c` in the workspace directory with the parent environment plus
 * request overrides. There is no OS-level isolation beyond a file-size
 * rlimit, and every result says so.
 *
 * @date 2025
 */

#pragma once

#include "bastion/backends/sandbox_backend.hpp"

namespace bastion {
namespace backends {

/**
 * @struct LocalBackendConfig
 * @brief Local backend settings
 */
struct LocalBackendConfig {
    std::string shell{"/bin/sh"};
    bool fast_test_mode{false};                      ///< Skip dependency installation commands
    std::size_t max_output_bytes{8 * 1024 * 1024};   ///< Capture cap per stream
};

/**
 * @class LocalBackend
 * @brief Unisolated child-process backend
 */
class LocalBackend : public SandboxBackend {
public:
    explicit LocalBackend(LocalBackendConfig config = LocalBackendConfig{});

    std::string Name() const override { return "local"; }
    bool Probe() override;
    std::optional<std::string> IsolationNotice() const override;
    std::unique_ptr<SandboxRun> Launch(const BackendRequest& request) override;

    /**
     * @brief Recognize a single, pure dependency-installation command
     *
     * Matches e.g. `pip install -r requirements.txt`, `npm ci`,
     * `yarn add`, `poetry install`. Anything chained, piped or redirected
     * never matches.
     */
    static bool IsDependencyInstall(const std::string& command);

private:
    LocalBackendConfig config_;
};

} // namespace backends
} // namespace bastion
