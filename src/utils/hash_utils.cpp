/**
 * @file hash_utils.cpp
 * @brief OpenSSL-backed SHA-256 helpers
 *
 * Uses the EVP digest interface, which is the non-deprecated path on
 * OpenSSL 3.
 *
 * @date 2025
 */

#include "timebox/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace timebox {
namespace utils {

namespace {

// ============================================================================
// INTERNAL HELPER FUNCTIONS
// ============================================================================

std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
    DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        spdlog::error("SHA-256 context initialisation failed");
        throw std::runtime_error("OpenSSL: cannot initialise SHA-256 context");
    }
    return context;
}

std::string FinishDigest(EVP_MD_CTX* context) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context, hash, &length) != 1) {
        throw std::runtime_error("OpenSSL: SHA-256 finalisation failed");
    }
    return BinaryToHex(hash, length);
}

} // anonymous namespace

// ============================================================================
// SHA-256
// ============================================================================

std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto context = NewSha256Context();
    if (EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1) {
        spdlog::error("SHA-256 update failed after {} bytes", data.size());
        throw std::runtime_error("OpenSSL: SHA-256 update failed");
    }
    return FinishDigest(context.get());
}

std::string HashUtils::ShortDigest(const std::string& digest, std::size_t length) {
    return digest.substr(0, length);
}

} // namespace utils
} // namespace timebox
