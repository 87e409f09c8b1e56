/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 hashing via the OpenSSL EVP interface
 *
 * Files are streamed through a fixed buffer, so arbitrarily large samples
 * hash in constant memory.
 *
 * @date 2025
 */

#include "saferun/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <stdexcept>

namespace saferun {
namespace utils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
    return ctx;
}

std::string FinishDigest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &length) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    return HashUtils::BinaryToHex(hash, length);
}

} // anonymous namespace

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// Compute SHA256 hash (file)
std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    auto ctx = NewSha256Context();

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(file.gcount())) != 1) {
            throw std::runtime_error("SHA-256 update failed for: " + file_path.string());
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path.string());
    }

    auto digest = FinishDigest(ctx.get());
    spdlog::debug("SHA-256 of {}: {}", file_path.string(), digest);
    return digest;
}

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto ctx = NewSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
    return FinishDigest(ctx.get());
}

} // namespace utils
} // namespace saferun
