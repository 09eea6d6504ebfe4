/**
 * @file scoped_temp_dir.cpp
 * @brief mkdtemp-backed ScopedTempDir
 *
 * @date 2025
 */

#include "bastion/utils/scoped_temp_dir.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

namespace bastion {
namespace utils {

ScopedTempDir::~ScopedTempDir() {
    Delete();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this != &other) {
        Delete();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScopedTempDir::CreateUnderPath(const std::filesystem::path& base_path,
                                    const std::string& prefix) {
    Delete();

    std::filesystem::create_directories(base_path);

    std::string pattern = (base_path / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::filesystem::filesystem_error(
            "Failed to create temporary directory", base_path,
            std::error_code(errno, std::generic_category()));
    }

    path_ = buffer.data();
    spdlog::debug("Created temporary directory {}", path_.string());
}

bool ScopedTempDir::Delete() {
    if (path_.empty()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("⚠ Failed to remove temporary directory {}: {}",
                     path_.string(), ec.message());
        return false;
    }

    spdlog::debug("Removed temporary directory {}", path_.string());
    path_.clear();
    return true;
}

} // namespace utils
} // namespace bastion
