#include "hashing.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <new>
#include <stdexcept>

namespace hashing {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Digest sha256(const uint8_t* data, size_t size) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::bad_alloc();
    }

    Digest digest{};
    unsigned int digestLength = 0;
    // EVP_DigestUpdate with a zero length is a no-op, so empty input needs no special case
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLength) != 1 ||
        digestLength != DIGEST_SIZE) {
        throw std::runtime_error("OpenSSL SHA-256 digest failed");
    }
    return digest;
}

std::string toHex(const uint8_t* data, size_t size) {
    static const char* DIGITS = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; i++) {
        out.push_back(DIGITS[data[i] >> 4]);
        out.push_back(DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw glifzip::FormatError("Hex string has odd length: " + std::to_string(hex.size()));
    }
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); i++) {
        int hi = hexValue(hex[2 * i]);
        int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw glifzip::FormatError("Invalid hex character at position " + std::to_string(2 * i));
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

Digest digestFromHex(const std::string& hex) {
    std::vector<uint8_t> bytes = fromHex(hex);
    if (bytes.size() != DIGEST_SIZE) {
        throw glifzip::FormatError("Digest must be " + std::to_string(DIGEST_SIZE) +
                                   " bytes, got " + std::to_string(bytes.size()));
    }
    Digest digest{};
    std::copy(bytes.begin(), bytes.end(), digest.begin());
    return digest;
}

void verifyDigest(const uint8_t* data, size_t size, const Digest& expected, const std::string& what) {
    Digest actual = sha256(data, size);
    if (actual != expected) {
        std::string expectedHex = toHex(expected);
        std::string actualHex = toHex(actual);
        logging::err("{} SHA256 mismatch: expected {}, got {}", what, expectedHex, actualHex);
        throw glifzip::HashMismatchError(what, expectedHex, actualHex);
    }
}

} // namespace hashing
