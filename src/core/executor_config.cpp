/**
 * @file executor_config.cpp
 * @brief JSON loading, environment overrides and validation of ExecutorConfig
 *
 * @date 2025
 */

#include "bastion/core/executor_config.hpp"
#include "bastion/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace bastion {
namespace core {

namespace {

security::SecurityLevel RequireSecurityLevel(const std::string& name) {
    auto level = security::ParseSecurityLevel(name);
    if (!level) {
        throw ConfigError("Unknown security level: " + name);
    }
    return *level;
}

bool ParseBoolFlag(const std::string& value) {
    auto lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(value));
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

void ReadLimits(const json& j, ResourceLimits& limits) {
    limits.max_memory_mb = j.value("max_memory_mb", limits.max_memory_mb);
    limits.max_cpu_fraction = j.value("max_cpu_fraction", limits.max_cpu_fraction);
    limits.max_execution_seconds = j.value("max_execution_seconds", limits.max_execution_seconds);
    limits.max_disk_mb = j.value("max_disk_mb", limits.max_disk_mb);
    limits.allow_network = j.value("allow_network", limits.allow_network);
}

void ReadContainer(const json& j, backends::ContainerBackendConfig& container) {
    container.runtime_binary = j.value("runtime", container.runtime_binary);
    container.image = j.value("image", container.image);
    container.shell = j.value("shell", container.shell);
    container.user = j.value("user", container.user);
    container.mount_point = j.value("mount_point", container.mount_point);
    container.resource_prefix = j.value("resource_prefix", container.resource_prefix);
    container.scratch_volume = j.value("scratch_volume", container.scratch_volume);
    container.probe_timeout = std::chrono::seconds(
        j.value("probe_timeout_seconds", static_cast<int>(container.probe_timeout.count())));
    if (j.contains("staging_root")) {
        container.staging_root = j.at("staging_root").get<std::string>();
    }
}

void ReadDiff(const json& j, monitors::FilesystemDiffTracker::Config& diff) {
    diff.hash_contents = j.value("hash_contents", diff.hash_contents);
    diff.max_file_size_for_hash = j.value("max_file_size_for_hash", diff.max_file_size_for_hash);
    if (j.contains("excluded_directories")) {
        for (const auto& name : j.at("excluded_directories")) {
            diff.excluded_directories.insert(name.get<std::string>());
        }
    }
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

ExecutorConfig ParseExecutorConfig(const std::string& json_text) {
    ExecutorConfig config;

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            throw ConfigError("Configuration root must be a JSON object");
        }

        if (j.contains("security_level")) {
            config.security_level = RequireSecurityLevel(j.at("security_level").get<std::string>());
        }
        config.fast_test_mode = j.value("fast_test_mode", config.fast_test_mode);
        config.enable_container_backend = j.value("enable_container_backend",
                                                  config.enable_container_backend);
        if (j.contains("extra_whitelist")) {
            config.extra_whitelist = j.at("extra_whitelist").get<std::vector<std::string>>();
        }

        config.termination_grace = std::chrono::seconds(
            j.value("termination_grace_seconds", static_cast<int>(config.termination_grace.count())));
        config.cleanup_grace = std::chrono::seconds(
            j.value("cleanup_grace_seconds", static_cast<int>(config.cleanup_grace.count())));
        config.max_output_bytes = j.value("max_output_bytes", config.max_output_bytes);

        if (j.contains("limits")) {
            ReadLimits(j.at("limits"), config.default_limits);
        }
        if (j.contains("container")) {
            ReadContainer(j.at("container"), config.container);
        }
        if (j.contains("diff")) {
            ReadDiff(j.at("diff"), config.diff);
        }
    }
    catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

ExecutorConfig LoadExecutorConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = ParseExecutorConfig(buffer.str());
    spdlog::info("✓ Loaded configuration from {}", path.string());
    return config;
}

void ApplyEnvironmentOverrides(ExecutorConfig& config) {
    if (const char* level = std::getenv("BASTION_SECURITY_LEVEL")) {
        config.security_level = RequireSecurityLevel(level);
        spdlog::debug("Security level from environment: {}", level);
    }
    if (const char* fast = std::getenv("BASTION_FAST_TEST_MODE")) {
        config.fast_test_mode = ParseBoolFlag(fast);
    }
    if (const char* runtime = std::getenv("BASTION_CONTAINER_RUNTIME")) {
        if (*runtime != '\0') {
            config.container.runtime_binary = runtime;
        }
    }
    if (const char* image = std::getenv("BASTION_CONTAINER_IMAGE")) {
        if (*image != '\0') {
            config.container.image = image;
        }
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

void ValidateLimits(const ResourceLimits& limits) {
    if (limits.max_memory_mb == 0) {
        throw std::invalid_argument("max_memory_mb must be positive");
    }
    if (!(limits.max_cpu_fraction > 0.0)) {
        throw std::invalid_argument("max_cpu_fraction must be positive");
    }
    if (limits.max_execution_seconds <= 0) {
        throw std::invalid_argument("max_execution_seconds must be positive");
    }
    if (limits.max_disk_mb == 0) {
        throw std::invalid_argument("max_disk_mb must be positive");
    }
}

void ValidateConfig(const ExecutorConfig& config) {
    ValidateLimits(config.default_limits);

    if (config.termination_grace.count() < 0 || config.cleanup_grace.count() < 0) {
        throw std::invalid_argument("Grace periods must not be negative");
    }
    if (config.max_output_bytes == 0) {
        throw std::invalid_argument("max_output_bytes must be positive");
    }
    if (config.enable_container_backend) {
        if (config.container.runtime_binary.empty()) {
            throw std::invalid_argument("Container runtime binary must not be empty");
        }
        if (config.container.image.empty()) {
            throw std::invalid_argument("Container image must not be empty");
        }
        if (config.container.mount_point.empty() || config.container.mount_point.front() != '/') {
            throw std::invalid_argument("Container mount point must be an absolute path");
        }
    }
    for (const auto& name : config.extra_whitelist) {
        if (!utils::StringUtils::IsExecutableName(name)) {
            throw std::invalid_argument("Invalid whitelist entry: " + name);
        }
    }
}

// ============================================================================
// BUILDER
// ============================================================================

ExecutorConfigBuilder& ExecutorConfigBuilder::WithSecurityLevel(security::SecurityLevel level) {
    config_.security_level = level;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithLimits(const ResourceLimits& limits) {
    config_.default_limits = limits;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithMemoryLimit(std::size_t megabytes) {
    config_.default_limits.max_memory_mb = megabytes;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithCpuLimit(double fraction) {
    config_.default_limits.max_cpu_fraction = fraction;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithTimeout(int seconds) {
    config_.default_limits.max_execution_seconds = seconds;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithDiskLimit(std::size_t megabytes) {
    config_.default_limits.max_disk_mb = megabytes;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithNetwork(bool allow) {
    config_.default_limits.allow_network = allow;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithFastTestMode(bool enabled) {
    config_.fast_test_mode = enabled;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithWhitelistCommand(const std::string& name) {
    config_.extra_whitelist.push_back(name);
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithContainerRuntime(const std::string& runtime_binary) {
    config_.container.runtime_binary = runtime_binary;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithContainerImage(const std::string& image) {
    config_.container.image = image;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithTerminationGrace(std::chrono::seconds grace) {
    config_.termination_grace = grace;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::WithContentHashing(bool enabled) {
    config_.diff.hash_contents = enabled;
    return *this;
}

ExecutorConfigBuilder& ExecutorConfigBuilder::LocalOnly() {
    config_.enable_container_backend = false;
    return *this;
}

ExecutorConfig ExecutorConfigBuilder::Build() const {
    ValidateConfig(config_);
    return config_;
}

} // namespace core
} // namespace bastion
