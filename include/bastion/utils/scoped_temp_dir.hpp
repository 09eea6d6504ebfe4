/**
 * @file scoped_temp_dir.hpp
 * @brief Temporary directory removed on destruction
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace bastion {
namespace utils {

/**
 * @class ScopedTempDir
 * @brief Owns a uniquely named directory created with mkdtemp()
 *
 * The directory and everything below it is removed when the object is
 * destroyed, on every exit path. Removal errors are logged, never thrown.
 */
class ScopedTempDir {
public:
    ScopedTempDir() = default;
    ~ScopedTempDir();

    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    /**
     * @brief Create <base_path>/<prefix>XXXXXX
     * @throws std::filesystem::filesystem_error on failure
     */
    void CreateUnderPath(const std::filesystem::path& base_path, const std::string& prefix);

    bool IsValid() const { return !path_.empty(); }
    const std::filesystem::path& GetPath() const { return path_; }

    /**
     * @brief Remove the directory now
     * @return true if nothing remains
     */
    bool Delete();

private:
    std::filesystem::path path_;
};

} // namespace utils
} // namespace bastion
