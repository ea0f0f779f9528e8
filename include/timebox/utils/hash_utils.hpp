/**
 * @file hash_utils.hpp
 * @brief SHA-256 fingerprints of submitted payloads
 *
 * Every execution result carries the SHA-256 of the code that ran so logs and
 * results can be correlated without storing the source itself.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace timebox {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers backed by OpenSSL EVP
 *
 * **Usage**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256(request.code);
 * @endcode
 */
class HashUtils {
public:
    /// SHA-256 of an in-memory buffer, lowercase hex (64 characters)
    static std::string ComputeSHA256(const std::string& data);

    /// First @p length hex characters of a digest, for log lines
    static std::string ShortDigest(const std::string& digest, std::size_t length = 12);
};

} // namespace utils
} // namespace timebox
