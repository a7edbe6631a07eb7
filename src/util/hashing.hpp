#ifndef PHISCRUB_UTIL_HASHING_HPP
#define PHISCRUB_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 digests used to fingerprint redacted output in the audit trail.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * USAGE:
 *   @code
 *   using namespace phiscrub::util::hashing;
 *   std::string digest = sha256Hex("[REDACTED_SSN] on file");
 *   // 64 lowercase hex characters
 *   @endcode
 */

namespace phiscrub {
namespace util {
namespace hashing {

/**
 * @brief Compute a SHA-256 hash of the input string, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::string &input)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash)) {
        throw std::runtime_error("hashing::sha256Hex: SHA256 computation failed.");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

} // namespace hashing
} // namespace util
} // namespace phiscrub

#endif // PHISCRUB_UTIL_HASHING_HPP
