#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hashing {

constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief SHA-256 of a byte range
 *
 * Pure and stateless; an empty range is valid input.
 */
Digest sha256(const uint8_t* data, size_t size);

inline Digest sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

std::string toHex(const uint8_t* data, size_t size);

inline std::string toHex(const Digest& digest) {
    return toHex(digest.data(), digest.size());
}

// Throws glifzip::FormatError on odd length or non-hex characters
std::vector<uint8_t> fromHex(const std::string& hex);

Digest digestFromHex(const std::string& hex);

/**
 * @brief Recompute the digest of data and compare with expected
 *
 * @param what Label used in the error message ("Archive", "Payload", ...)
 * @throws glifzip::HashMismatchError carrying both hex digests
 */
void verifyDigest(const uint8_t* data, size_t size, const Digest& expected, const std::string& what);

} // namespace hashing
