/**
 * @file sandbox_backend.hpp
 * @brief Abstract sandbox backend and in-flight run handle
 *
 * A backend launches an approved command and hands back a SandboxRun. The
 * executor owns the timeout: it waits on the run with a deadline, and on
 * expiry escalates Terminate() → Kill() before calling Finish().
 *
 * @date 2025
 */

#pragma once

#include "bastion/core/execution_types.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bastion {
namespace backends {

/**
 * @class BackendError
 * @brief Backend-level fault (runtime unreachable, staging I/O failure, ...)
 */
class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct BackendRequest
 * @brief Validated command plus its execution context
 */
struct BackendRequest {
    std::string execution_id;
    std::string command;                     ///< Sanitized command line
    std::filesystem::path workspace_dir;
    core::ResourceLimits limits;
    std::map<std::string, std::string> environment;
    std::chrono::seconds timeout{0};
};

/**
 * @struct BackendOutput
 * @brief Raw telemetry of a finished run
 */
struct BackendOutput {
    int exit_code{0};
    std::string stdout_output;
    std::string stderr_output;
    std::chrono::milliseconds duration{0};
    std::map<std::string, double> resource_usage;
    std::vector<std::string> warnings;
};

/**
 * @class SandboxRun
 * @brief Handle to one launched command
 *
 * Methods are called from the launching thread only.
 */
class SandboxRun {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~SandboxRun() = default;

    /**
     * @brief Wait for the command to exit, at most until deadline
     * @return true if it has exited
     */
    virtual bool WaitUntil(Clock::time_point deadline) = 0;

    /// Ask the command to stop (SIGTERM or equivalent)
    virtual void Terminate() = 0;

    /// Force the command to stop (SIGKILL or equivalent)
    virtual void Kill() = 0;

    /**
     * @brief Collect output and materialize workspace changes
     *
     * Called exactly once, after WaitUntil() returned true.
     *
     * @throws BackendError on runtime or staging failures
     */
    virtual BackendOutput Finish() = 0;

    /// Backend resource needing deferred teardown, if any
    virtual std::optional<std::string> ResourceId() const = 0;
};

/**
 * @class CompletedRun
 * @brief Run that finished before it was launched (synthetic results)
 */
class CompletedRun : public SandboxRun {
public:
    explicit CompletedRun(BackendOutput output) : output_(std::move(output)) {}

    bool WaitUntil(Clock::time_point) override { return true; }
    void Terminate() override {}
    void Kill() override {}
    BackendOutput Finish() override { return output_; }
    std::optional<std::string> ResourceId() const override { return std::nullopt; }

private:
    BackendOutput output_;
};

/**
 * @class SandboxBackend
 * @brief Strategy interface for container and local execution
 *
 * Launch() must be safe to call concurrently; each call owns its own
 * process, staging directory and output buffers.
 */
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;

    /// Short identifier ("container", "local")
    virtual std::string Name() const = 0;

    /**
     * @brief One-time capability probe
     * @return true if the backend can run commands on this host
     */
    virtual bool Probe() = 0;

    /// Warning attached to every result when the backend weakens isolation
    virtual std::optional<std::string> IsolationNotice() const { return std::nullopt; }

    /**
     * @brief Start running a validated command
     * @throws BackendError if the command cannot be started
     */
    virtual std::unique_ptr<SandboxRun> Launch(const BackendRequest& request) = 0;

    /**
     * @brief Tear down a resource returned by SandboxRun::ResourceId()
     *
     * Graceful stop within grace, then forced removal.
     *
     * @return true if the resource is gone
     */
    virtual bool ReleaseResource(const std::string& resource_id, std::chrono::seconds grace) {
        (void)resource_id;
        (void)grace;
        return true;
    }

    /// Auxiliary resources (e.g. named volumes) created for execution_id
    virtual std::vector<std::string> ListAuxiliaryResources(const std::string& execution_id) {
        (void)execution_id;
        return {};
    }

    virtual bool RemoveAuxiliaryResource(const std::string& name) {
        (void)name;
        return true;
    }
};

} // namespace backends
} // namespace bastion
