/**
 * @file process_runner.cpp
 * @brief fork/exec implementation of ChildProcess
 *
 * **Launch sequence**:
 * 1. Create stdout, stderr and exec-status pipes (close-on-exec)
 * 2. Fork; the child moves into its own process group, redirects stdio,
 *    changes directory, applies rlimits and execs
 * 3. A failed chdir or exec is reported back through the exec-status pipe;
 *    a successful exec closes it, which the parent observes as EOF
 *
 * **Waiting**:
 * poll() on the output pipes with a short slice, interleaved with
 * wait4(WNOHANG), until the child is reaped or the deadline passes.
 *
 * @date 2025
 */

#include "bastion/utils/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace bastion {
namespace utils {

namespace {

constexpr int kPollSliceMs = 50;
constexpr auto kDrainWindow = std::chrono::milliseconds(500);

enum class LaunchStage : int { CHDIR = 1, EXEC = 2 };

struct LaunchFailure {
    int stage;
    int error_number;
};

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

[[noreturn]] void ReportLaunchFailure(int status_fd, LaunchStage stage) {
    LaunchFailure failure{static_cast<int>(stage), errno};
    ssize_t written = write(status_fd, &failure, sizeof(failure));
    (void)written;
    _exit(127);
}

std::vector<std::string> BuildEnvironment(const ProcessSpec& spec) {
    std::map<std::string, std::string> merged;

    if (spec.inherit_environment && environ != nullptr) {
        for (char** entry = environ; *entry != nullptr; ++entry) {
            std::string pair(*entry);
            auto eq = pair.find('=');
            if (eq == std::string::npos) continue;
            merged[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : spec.environment) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

} // anonymous namespace

// ============================================================================
// PROCESS CREATION
// ============================================================================

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        throw std::invalid_argument("Process argv must not be empty");
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> argv;
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    auto env_strings = BuildEnvironment(spec);
    std::vector<char*> envp;
    for (auto& entry : env_strings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::string working_dir = spec.working_dir ? spec.working_dir->string() : std::string();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        for (int* fds : {out_pipe, err_pipe, status_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        throw ProcessError(std::string("Failed to create pipes: ") + std::strerror(saved));
    }

    pid_t pid = fork();

    if (pid < 0) {
        int saved = errno;
        for (int* fds : {out_pipe, err_pipe, status_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        throw ProcessError(std::string("Failed to fork: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        sigset_t all_signals;
        sigemptyset(&all_signals);
        sigprocmask(SIG_SETMASK, &all_signals, nullptr);
        signal(SIGPIPE, SIG_DFL);

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            ReportLaunchFailure(status_pipe[1], LaunchStage::CHDIR);
        }

        if (spec.file_size_limit_bytes) {
            struct rlimit limit;
            limit.rlim_cur = static_cast<rlim_t>(*spec.file_size_limit_bytes);
            limit.rlim_max = static_cast<rlim_t>(*spec.file_size_limit_bytes);
            setrlimit(RLIMIT_FSIZE, &limit);
        }

        execvpe(argv[0], argv.data(), envp.data());
        ReportLaunchFailure(status_pipe[1], LaunchStage::EXEC);
    }

    // Parent process
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    LaunchFailure failure{0, 0};
    ssize_t n;
    do {
        n = read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close(out_pipe[0]);
        close(err_pipe[0]);

        std::string what = failure.stage == static_cast<int>(LaunchStage::CHDIR)
            ? "Failed to enter working directory " + working_dir
            : "Failed to execute " + spec.argv.front();
        throw ProcessError(what + ": " + std::strerror(failure.error_number));
    }

    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    spdlog::debug("Spawned pid {} ({})", pid, spec.argv.front());

    return std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, out_pipe[0], err_pipe[0], spec.max_output_bytes));
}

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd,
                           std::size_t max_output_bytes)
    : pid_(pid),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      max_output_bytes_(max_output_bytes),
      start_time_(Clock::now()),
      end_time_(start_time_) {
}

ChildProcess::~ChildProcess() {
    if (!exited_) {
        spdlog::debug("Killing unreaped process group {}", pid_);
        killpg(pid_, SIGKILL);
        TryReap(true);
    }
    CloseStreams();
}

// ============================================================================
// WAITING
// ============================================================================
// One loop serves both output draining and exit detection

bool ChildProcess::WaitUntil(Clock::time_point deadline) {
    while (true) {
        if (!exited_) {
            TryReap(false);
        }
        if (exited_) {
            return true;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int slice = static_cast<int>(std::min<long long>(remaining.count() + 1, kPollSliceMs));
        PumpOutput(slice);
    }
}

void ChildProcess::Wait() {
    while (!WaitUntil(Clock::now() + std::chrono::seconds(1))) {
    }
}

void ChildProcess::SignalGroup(int signal_number) {
    if (killpg(pid_, signal_number) != 0 && errno != ESRCH) {
        spdlog::warn("Failed to signal process group {}: {}", pid_, std::strerror(errno));
    }
}

ProcessOutcome ChildProcess::Collect() {
    if (!exited_) {
        throw ProcessError("Cannot collect output of a running process");
    }

    auto drain_deadline = Clock::now() + kDrainWindow;
    while ((stdout_fd_ >= 0 || stderr_fd_ >= 0) && Clock::now() < drain_deadline) {
        PumpOutput(kPollSliceMs);
    }

    if (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        // Descendants still hold the pipes open
        spdlog::debug("Killing leftover members of process group {}", pid_);
        SignalGroup(SIGKILL);
        auto kill_deadline = Clock::now() + std::chrono::milliseconds(200);
        while ((stdout_fd_ >= 0 || stderr_fd_ >= 0) && Clock::now() < kill_deadline) {
            PumpOutput(kPollSliceMs);
        }
        CloseStreams();
    }

    outcome_.output_truncated = truncated_;
    outcome_.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time_ - start_time_);
    return outcome_;
}

// ============================================================================
// INTERNALS
// ============================================================================

void ChildProcess::PumpOutput(int timeout_ms) {
    pollfd fds[2];
    nfds_t count = 0;
    if (stdout_fd_ >= 0) fds[count++] = {stdout_fd_, POLLIN, 0};
    if (stderr_fd_ >= 0) fds[count++] = {stderr_fd_, POLLIN, 0};

    int ready = poll(count > 0 ? fds : nullptr, count, timeout_ms);
    if (ready <= 0) {
        return;
    }

    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents == 0) continue;
        if (fds[i].fd == stdout_fd_) {
            ReadAvailable(stdout_fd_, outcome_.stdout_output);
        } else if (fds[i].fd == stderr_fd_) {
            ReadAvailable(stderr_fd_, outcome_.stderr_output);
        }
    }
}

bool ChildProcess::ReadAvailable(int& fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::size_t room = sink.size() < max_output_bytes_ ? max_output_bytes_ - sink.size() : 0;
            std::size_t take = std::min(room, static_cast<std::size_t>(n));
            sink.append(buffer, take);
            if (take < static_cast<std::size_t>(n)) {
                truncated_ = true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        // EOF or read error
        CloseFd(fd);
        return false;
    }
}

bool ChildProcess::TryReap(bool block) {
    int status = 0;
    struct rusage usage {};
    pid_t result;
    do {
        result = wait4(pid_, &status, block ? 0 : WNOHANG, &usage);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return false;
    }

    exited_ = true;
    end_time_ = Clock::now();

    if (result < 0) {
        spdlog::warn("wait4({}) failed: {}", pid_, std::strerror(errno));
        outcome_.exit_code = -1;
        return true;
    }

    if (WIFEXITED(status)) {
        outcome_.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome_.signaled = true;
        outcome_.term_signal = WTERMSIG(status);
        outcome_.exit_code = 128 + outcome_.term_signal;
    }

    outcome_.peak_memory_mb = static_cast<double>(usage.ru_maxrss) / 1024.0;
    outcome_.cpu_user_seconds = static_cast<double>(usage.ru_utime.tv_sec) +
                                static_cast<double>(usage.ru_utime.tv_usec) / 1e6;
    outcome_.cpu_system_seconds = static_cast<double>(usage.ru_stime.tv_sec) +
                                  static_cast<double>(usage.ru_stime.tv_usec) / 1e6;

    spdlog::debug("Reaped pid {} with exit code {}", pid_, outcome_.exit_code);
    return true;
}

void ChildProcess::CloseStreams() {
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

// ============================================================================
// ONE-SHOT HELPER
// ============================================================================

ProcessOutcome RunProcess(const ProcessSpec& spec, std::chrono::milliseconds timeout) {
    auto child = ChildProcess::Spawn(spec);

    if (!child->WaitUntil(ChildProcess::Clock::now() + timeout)) {
        spdlog::debug("{} exceeded {} ms, killing", spec.argv.front(), timeout.count());
        child->SignalGroup(SIGKILL);
        child->Wait();
        auto outcome = child->Collect();
        outcome.exit_code = 124;
        return outcome;
    }

    return child->Collect();
}

} // namespace utils
} // namespace bastion
