/**
 * @file main.cpp
 * @brief Bastion sandboxed command runner - Command-line interface
 *
 * Entry point for the bastion CLI. Validates shell commands, runs them in
 * a container (or the local fallback sandbox) against a workspace
 * directory, and reports the outcome as a console summary or JSON.
 *
 * Logs go to stderr; results go to stdout.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "bastion/core/executor_config.hpp"
#include "bastion/core/sandbox_executor.hpp"
#include "bastion/reporters/json_reporter.hpp"
#include "bastion/security/command_validator.hpp"
#include "bastion/utils/string_utils.hpp"

#include <iostream>

using bastion::utils::StringUtils;

/*******************************************************************************
 * Display Functions
 ******************************************************************************/

void PrintResultSummary(const bastion::core::ExecutionResult& result) {
    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                     EXECUTION SUMMARY                         ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
    std::cout << "  Execution: " << result.execution_id << "\n";
    std::cout << "  Command:   " << result.command_executed << "\n";
    std::cout << "  Status:    [" << bastion::core::ExecutionStatusToString(result.status) << "]\n";
    if (!result.backend.empty()) {
        std::cout << "  Backend:   " << result.backend << "\n";
    }
    std::cout << "  Exit code: " << result.exit_code << "\n";
    std::cout << "  Duration:  " << result.duration.count() << " ms\n";

    for (const auto& path : result.files_created) {
        std::cout << "  [+] " << path.generic_string() << "\n";
    }
    for (const auto& path : result.files_modified) {
        std::cout << "  [~] " << path.generic_string() << "\n";
    }
    for (const auto& path : result.files_deleted) {
        std::cout << "  [-] " << path.generic_string() << "\n";
    }
    for (const auto& warning : result.warnings) {
        std::cout << "  [!] " << warning << "\n";
    }

    if (!result.stdout_output.empty()) {
        std::cout << "━━━━━━━━━━━━━━━━━━━━━━━━━━━━ stdout ━━━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
        std::cout << result.stdout_output;
        if (result.stdout_output.back() != '\n') {
            std::cout << "\n";
        }
    }
    if (!result.stderr_output.empty()) {
        std::cout << "━━━━━━━━━━━━━━━━━━━━━━━━━━━━ stderr ━━━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
        std::cout << result.stderr_output;
        if (result.stderr_output.back() != '\n') {
            std::cout << "\n";
        }
    }
}

void PrintValidationSummary(const std::string& command,
                            const bastion::security::ValidationOutcome& outcome) {
    std::cout << "Command:  " << command << "\n";
    std::cout << "Verdict:  " << (outcome.is_safe ? "[SAFE]" : "[BLOCKED]") << "\n";
    std::cout << "Risk:     " << bastion::security::RiskLevelToString(outcome.risk) << "\n";
    if (outcome.blocked_reason) {
        std::cout << "Reason:   " << *outcome.blocked_reason << "\n";
    }
    if (outcome.sanitized_command) {
        std::cout << "Runs as:  " << *outcome.sanitized_command << "\n";
    }
    for (const auto& warning : outcome.warnings) {
        std::cout << "  [!] " << warning << "\n";
    }
}

/*******************************************************************************
 * Configuration Assembly
 ******************************************************************************/

bastion::core::ExecutorConfig BuildConfig(const std::string& config_file,
                                          const std::string& security_level) {
    auto config = config_file.empty() ? bastion::core::ExecutorConfig{}
                                      : bastion::core::LoadExecutorConfig(config_file);
    bastion::core::ApplyEnvironmentOverrides(config);

    if (!security_level.empty()) {
        auto level = bastion::security::ParseSecurityLevel(security_level);
        if (!level) {
            throw bastion::core::ConfigError("Unknown security level: " + security_level);
        }
        config.security_level = *level;
    }
    return config;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Bastion - validated, sandboxed command execution"};
    app.require_subcommand(1);
    app.fallthrough();

    bool verbose = false;
    std::string config_file;
    std::string security_level;

    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("-c,--config", config_file, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-s,--security-level", security_level,
                   "Security level: strict, permissive or development");

    // run
    auto* run_cmd = app.add_subcommand("run", "Validate and execute a command in the sandbox");
    std::string workspace = ".";
    int timeout_seconds = 0;
    bool allow_network = false;
    bool fast_test_mode = false;
    bool local_only = false;
    bool json_output = false;
    std::vector<std::string> env_pairs;
    std::vector<std::string> run_words;

    run_cmd->add_option("-w,--workspace", workspace, "Workspace directory")
        ->default_val(".");
    run_cmd->add_option("-t,--timeout", timeout_seconds, "Timeout in seconds (default: configured limit)")
        ->check(CLI::PositiveNumber);
    run_cmd->add_flag("--allow-network", allow_network, "Allow network access in the sandbox");
    run_cmd->add_option("-e,--env", env_pairs, "Environment variable KEY=VALUE (repeatable)");
    run_cmd->add_flag("--fast-test-mode", fast_test_mode, "Skip dependency installation commands");
    run_cmd->add_flag("--local-only", local_only, "Never use the container backend");
    run_cmd->add_flag("--json", json_output, "Print the result as JSON");
    run_cmd->add_option("command", run_words, "Command to execute (after --)")->required();

    // validate
    auto* validate_cmd = app.add_subcommand("validate", "Validate a command without running it");
    std::vector<std::string> validate_words;
    bool validate_json = false;
    validate_cmd->add_flag("--json", validate_json, "Print the verdict as JSON");
    validate_cmd->add_option("command", validate_words, "Command to validate")->required();

    // stats
    auto* stats_cmd = app.add_subcommand("stats", "Probe backends and print executor statistics");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format; logs stay off stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("bastion"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        auto config = BuildConfig(config_file, security_level);
        bastion::reporters::JsonReporter reporter;

        if (*validate_cmd) {
            auto command = StringUtils::Join(validate_words, " ");
            bastion::security::CommandValidator validator(config.security_level);
            for (const auto& name : config.extra_whitelist) {
                if (!validator.AddWhitelistCommand(name)) {
                    spdlog::warn("⚠ Ignoring invalid whitelist entry: {}", name);
                }
            }

            auto outcome = validator.Validate(command);
            if (validate_json) {
                std::cout << reporter.GenerateValidationJson(command, outcome) << std::endl;
            } else {
                PrintValidationSummary(command, outcome);
            }
            return outcome.is_safe ? 0 : 1;
        }

        if (*stats_cmd) {
            bastion::core::SandboxExecutor executor(config);
            std::cout << reporter.GenerateStatsJson(executor.Stats()) << std::endl;
            return 0;
        }

        if (*run_cmd) {
            if (fast_test_mode) {
                config.fast_test_mode = true;
            }
            if (local_only) {
                config.enable_container_backend = false;
            }
            if (allow_network) {
                config.default_limits.allow_network = true;
            }

            bastion::core::ExecutionRequest request;
            request.command = StringUtils::Join(run_words, " ");
            request.workspace_dir = std::filesystem::absolute(workspace);
            if (timeout_seconds > 0) {
                request.timeout_seconds = timeout_seconds;
            }

            for (const auto& pair : env_pairs) {
                auto eq = pair.find('=');
                if (eq == std::string::npos || eq == 0) {
                    spdlog::error("Invalid --env value (expected KEY=VALUE): {}", pair);
                    return 2;
                }
                request.environment[pair.substr(0, eq)] = pair.substr(eq + 1);
            }

            bastion::core::SandboxExecutor executor(config);

            spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
            spdlog::info("Workspace: {}", request.workspace_dir.string());

            auto result = executor.Execute(request);

            if (json_output) {
                std::cout << reporter.GenerateResultJson(result) << std::endl;
            } else {
                PrintResultSummary(result);
            }

            executor.Cleanup(result.execution_id);
            return result.exit_code;
        }

        return 0;

    } catch (const bastion::core::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid argument: {}", e.what());
        return 2;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
