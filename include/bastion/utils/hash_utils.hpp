/**
 * @file hash_utils.hpp
 * @brief SHA-256 content hashing backed by OpenSSL
 *
 * Used to compare workspace files by content: the container backend only
 * copies changed files back from staging, and the diff tracker can confirm
 * timestamp-only changes against content.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>

namespace bastion {
namespace utils {

/**
 * @class HashUtils
 * @brief Stateless hashing helpers
 *
 * **Thread Safety**: All methods are reentrant.
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a file in 8KB chunks
     *
     * @param file_path Path to file to hash
     * @return Lowercase hex digest
     * @throws std::runtime_error if the file cannot be read or OpenSSL fails
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief Compare two files by size first, then by SHA-256
     */
    static bool FilesHaveSameContent(const std::filesystem::path& lhs,
                                     const std::filesystem::path& rhs);
};

} // namespace utils
} // namespace bastion
