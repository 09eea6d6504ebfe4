/**
 * @file process_runner.hpp
 * @brief Child process spawning with captured output and deadline waits
 *
 * Spawns a child in its own process group with stdout/stderr redirected to
 * pipes. Waiting is a single poll loop that drains both pipes and reaps the
 * child, bounded by a deadline, so a caller can race process exit against a
 * timeout without a second thread.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>

namespace bastion {
namespace utils {

/**
 * @class ProcessError
 * @brief Raised when a child process cannot be created or executed
 */
class ProcessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct ProcessSpec
 * @brief Everything needed to launch one child process
 */
struct ProcessSpec {
    std::vector<std::string> argv;                     ///< argv[0] is resolved via PATH
    std::optional<std::filesystem::path> working_dir;  ///< chdir target in the child
    std::map<std::string, std::string> environment;    ///< Overrides applied on top of the parent env
    bool inherit_environment{true};                    ///< Start from the parent environment
    std::optional<std::uintmax_t> file_size_limit_bytes;  ///< RLIMIT_FSIZE for the child
    std::size_t max_output_bytes{8 * 1024 * 1024};     ///< Capture cap per stream
};

/**
 * @struct ProcessOutcome
 * @brief Exit status, output and accounting of a reaped child
 */
struct ProcessOutcome {
    int exit_code{-1};            ///< Exit status, or 128 + signal when signaled
    bool signaled{false};         ///< Terminated by a signal
    int term_signal{0};           ///< Signal number when signaled
    std::string stdout_output;
    std::string stderr_output;
    bool output_truncated{false}; ///< Either stream hit max_output_bytes
    std::chrono::milliseconds duration{0};

    // From wait4() rusage
    double peak_memory_mb{0.0};
    double cpu_user_seconds{0.0};
    double cpu_system_seconds{0.0};
};

/**
 * @class ChildProcess
 * @brief Owns one running child process and its output pipes
 *
 * The destructor kills the whole process group and reaps the child if it
 * is still running, so a ChildProcess never leaves an orphan behind.
 *
 * **Usage Example**:
 * @code
 * ProcessSpec spec;
 * spec.argv = {"/bin/sh", "-c", "make test"};
 * auto child = ChildProcess::Spawn(spec);
 * if (!child->WaitUntil(std::chrono::steady_clock::now() + std::chrono::seconds(30))) {
 *     child->SignalGroup(SIGKILL);
 *     child->Wait();
 * }
 * auto outcome = child->Collect();
 * @endcode
 */
class ChildProcess {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Fork and exec the child described by spec
     * @throws ProcessError if pipes, fork or exec fail
     */
    static std::unique_ptr<ChildProcess> Spawn(const ProcessSpec& spec);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Drain output and wait for exit until the deadline
     * @return true if the child has exited
     */
    bool WaitUntil(Clock::time_point deadline);

    /**
     * @brief Block until the child exits
     */
    void Wait();

    /**
     * @brief Send a signal to the child's process group
     *
     * A group with no remaining members is ignored.
     */
    void SignalGroup(int signal_number);

    /**
     * @brief Drain remaining output and return the outcome of an exited child
     *
     * Background descendants still holding the pipes open are given a short
     * window and then killed with the rest of the process group.
     *
     * @throws ProcessError if the child has not exited yet
     */
    ProcessOutcome Collect();

    pid_t Pid() const { return pid_; }
    bool HasExited() const { return exited_; }

private:
    ChildProcess(pid_t pid, int stdout_fd, int stderr_fd, std::size_t max_output_bytes);

    void PumpOutput(int timeout_ms);
    bool ReadAvailable(int& fd, std::string& sink);
    bool TryReap(bool block);
    void CloseStreams();

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    std::size_t max_output_bytes_;
    bool exited_{false};
    bool truncated_{false};
    Clock::time_point start_time_;
    Clock::time_point end_time_;
    ProcessOutcome outcome_;
};

/**
 * @brief Run a short helper command to completion with a timeout
 *
 * Used for container runtime CLI calls. The child is killed when the
 * timeout expires and the outcome then carries exit code 124.
 *
 * @throws ProcessError if the command cannot be spawned
 */
ProcessOutcome RunProcess(const ProcessSpec& spec, std::chrono::milliseconds timeout);

} // namespace utils
} // namespace bastion
