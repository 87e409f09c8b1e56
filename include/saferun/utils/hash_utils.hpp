/**
 * @file hash_utils.hpp
 * @brief SHA-256 hashing used to identify analyzed samples
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>

namespace saferun {
namespace utils {

/**
 * @class HashUtils
 * @brief Streaming SHA-256 over files and buffers (OpenSSL EVP)
 *
 * **Usage**:
 * @code
 * std::string sha256 = HashUtils::ComputeSHA256(std::filesystem::path("sample.bin"));
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Hash a file in 8 KB chunks
     * @return Lowercase hexadecimal digest (64 characters)
     * @throws std::runtime_error if the file cannot be read or OpenSSL fails
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /// Hash an in-memory string
    static std::string ComputeSHA256(const std::string& data);

    /// Lowercase hex encoding
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace saferun
