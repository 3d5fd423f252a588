#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "container.hpp"

namespace sidecar {

constexpr const char* FORMAT_ID = "glif/1.0";
constexpr const char* HASH_ALGORITHM = "sha256";
constexpr const char* BLOCK_ALGORITHM = "zstd";

struct PayloadInfo {
    uint64_t size = 0;
    std::string hash;              // "sha256:<hex>"
    double compressionRatio = 0.0; // archive size / payload size
    std::optional<uint64_t> files;
    std::optional<uint64_t> directories;
};

struct ArchiveInfo {
    uint64_t size = 0;
    std::string hash;
    std::string compressedWith;
    std::string decompressedWith;
    uint32_t compressionLevel = 0;
    uint32_t threads = 0;
    uint64_t chunkSize = 0;
};

struct CryptographyInfo {
    std::string algorithm;
    std::string payloadDigest;
    std::string archiveDigest;
    std::optional<std::string> signature;
};

struct MetadataInfo {
    std::string created;           // RFC3339, UTC
    std::string creator;
    std::string sourcePlatform;
    std::string sourceArchitecture;
    bool deterministic = true;
};

/**
 * @brief Human-readable JSON metadata stored between header and payload
 *
 * Purely descriptive: every value can be rebuilt from the header, and the
 * header wins whenever they disagree.
 */
struct Sidecar {
    std::string format;
    PayloadInfo payload;
    ArchiveInfo archive;
    CryptographyInfo cryptography;
    MetadataInfo metadata;

    std::string toJson() const;

    // Throws glifzip::FormatError on malformed JSON or missing fields
    static Sidecar fromJson(const std::string& json);

    // UTF-8 JSON bytes; FormatError if they would not fit the 16-bit size field
    std::vector<uint8_t> encode() const;

    static Sidecar decode(const uint8_t* data, size_t size);

    /**
     * @brief Throw glifzip::FormatError naming the first field that
     *        disagrees with the header
     */
    void checkConsistency(const container::Header& header) const;
};

struct BuildOptions {
    uint64_t chunkSize = 0;
    bool deterministic = true;
    std::optional<uint64_t> files;
    std::optional<uint64_t> directories;
};

/**
 * @brief Describe an archive whose header is already complete apart from
 *        sidecarSize
 */
Sidecar build(const container::Header& header, const BuildOptions& options);

// RFC3339 UTC rendering of seconds since the epoch
std::string rfc3339(uint64_t secondsSinceEpoch);

double compressionRatio(uint64_t payloadSize, uint64_t archiveSize);

std::string sourcePlatform();
std::string sourceArchitecture();

} // namespace sidecar
