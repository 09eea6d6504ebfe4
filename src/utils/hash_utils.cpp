/**
 * @file hash_utils.cpp
 * @brief OpenSSL EVP implementation of SHA-256 hashing
 *
 * Files are streamed through an EVP digest context in 8KB chunks so large
 * workspace artifacts are never loaded into memory.
 *
 * **Error Handling**:
 * - File not found or unreadable: throws std::runtime_error
 * - OpenSSL context failures: throws std::runtime_error
 *
 * @date 2025
 */

#include "bastion/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace bastion {
namespace utils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

DigestContext NewSHA256Context() {
    DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
    return context;
}

std::string FinalizeDigest(EVP_MD_CTX* context) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context, hash, &length) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    return BinaryToHex(hash, length);
}

} // anonymous namespace

std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    auto context = NewSHA256Context();

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(context.get(), buffer,
                             static_cast<std::size_t>(file.gcount())) != 1) {
            throw std::runtime_error("Failed to hash file: " + file_path.string());
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path.string());
    }

    return FinalizeDigest(context.get());
}

bool HashUtils::FilesHaveSameContent(const std::filesystem::path& lhs,
                                     const std::filesystem::path& rhs) {
    if (std::filesystem::file_size(lhs) != std::filesystem::file_size(rhs)) {
        return false;
    }
    return ComputeSHA256(lhs) == ComputeSHA256(rhs);
}

} // namespace utils
} // namespace bastion
