#ifndef DDSLEDGER_UTIL_HASHING_HPP
#define DDSLEDGER_UTIL_HASHING_HPP

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 and hex helpers shared by content addressing, identity and the ledger.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - sha256Raw() returns the 32-byte digest, sha256() its lowercase hex form.
 *   - Every ContentID, address and block/transaction hash in ddsledger is sha256() output.
 *
 * USAGE:
 *   @code
 *   #include "util/hashing.hpp"
 *   using namespace ddsledger::util::hashing;
 *
 *   std::string cid = sha256(std::string("Hello World"));
 *   // cid is a 64-hex-character string.
 *   @endcode
 */

namespace ddsledger {
namespace util {
namespace hashing {

/**
 * @brief Compute the raw SHA-256 digest of a byte range.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::vector<uint8_t> sha256Raw(const uint8_t *data, size_t len)
{
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    unsigned int outLen = 0;
    if (EVP_Digest(data, len, digest.data(), &outLen, EVP_sha256(), nullptr) != 1
        || outLen != SHA256_DIGEST_LENGTH)
    {
        throw std::runtime_error("hashing::sha256Raw: EVP_Digest failed.");
    }
    return digest;
}

inline std::vector<uint8_t> sha256Raw(const std::vector<uint8_t> &input)
{
    return sha256Raw(input.data(), input.size());
}

inline std::vector<uint8_t> sha256Raw(const std::string &input)
{
    return sha256Raw(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/**
 * @brief Encode bytes as lowercase hex.
 */
inline std::string toHex(const uint8_t *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

inline std::string toHex(const std::vector<uint8_t> &bytes)
{
    return toHex(bytes.data(), bytes.size());
}

/**
 * @brief Decode a hex string (either case) into bytes.
 * @throw std::invalid_argument on odd length or a non-hex character.
 */
inline std::vector<uint8_t> fromHex(const std::string &hex)
{
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hashing::fromHex: odd-length input.");
    }
    auto nibble = [](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument(std::string("hashing::fromHex: invalid character '") + c + "'.");
    };
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return out;
}

/**
 * @brief Compute a SHA-256 hash of the input, return as lowercase hex.
 * @param input The data to be hashed.
 * @return A 64-character hex string representing the SHA-256 digest.
 */
inline std::string sha256(const std::vector<uint8_t> &input)
{
    return toHex(sha256Raw(input));
}

inline std::string sha256(const std::string &input)
{
    return toHex(sha256Raw(input));
}

/**
 * @brief True if s looks like a sha256() result (64 lowercase hex characters).
 */
inline bool isSha256Hex(const std::string &s)
{
    if (s.size() != SHA256_DIGEST_LENGTH * 2) {
        return false;
    }
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

} // namespace hashing
} // namespace util
} // namespace ddsledger

#endif // DDSLEDGER_UTIL_HASHING_HPP
