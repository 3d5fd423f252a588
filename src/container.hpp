#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "hashing.hpp"

namespace container {

constexpr std::array<uint8_t, 6> MAGIC = {'G', 'L', 'I', 'F', '0', '1'};
constexpr uint32_t VERSION = 0x00000100; // v1.0
constexpr size_t HEADER_SIZE = 116;
// Checksum covers bytes [0, CHECKSUM_OFFSET)
constexpr size_t CHECKSUM_OFFSET = 112;

/**
 * @brief How the payload region must be unpacked
 *
 * FastWrap: LZ4 frames around the ZSTD frame stream.
 * BlockOnly: the ZSTD frame stream itself.
 */
enum class DecompressionMode : uint32_t {
    FastWrap = 0,
    BlockOnly = 1
};

// Throws glifzip::FormatError for anything but the two known values
DecompressionMode parseDecompressionMode(uint32_t raw);

const char* decompressionModeName(DecompressionMode mode);

/**
 * @brief Fixed 116-byte archive header
 *
 * offset  size  field
 * 0       6     magic "GLIF01"
 * 6       4     version
 * 10      8     payload_size
 * 18      8     archive_size
 * 26      32    payload_hash
 * 58      32    archive_hash
 * 90      4     compression_level
 * 94      4     decompression_mode
 * 98      4     workers_used
 * 102     8     timestamp
 * 110     2     sidecar_size
 * 112     4     header_checksum (Adler-32 of bytes 0..111)
 *
 * All integers big-endian.
 */
struct Header {
    uint64_t payloadSize = 0;
    uint64_t archiveSize = 0;
    hashing::Digest payloadHash{};
    hashing::Digest archiveHash{};
    uint32_t compressionLevel = 0;
    DecompressionMode decompressionMode = DecompressionMode::FastWrap;
    uint32_t workersUsed = 0;
    uint64_t timestamp = 0;
    uint16_t sidecarSize = 0;
};

bool operator==(const Header& a, const Header& b);
inline bool operator!=(const Header& a, const Header& b) { return !(a == b); }

// Adler-32 over the first CHECKSUM_OFFSET bytes of an encoded header
uint32_t headerChecksum(const uint8_t* headerBytes);

std::vector<uint8_t> encodeHeader(const Header& header);

/**
 * @brief Parse and validate the header at the start of an archive
 *
 * Checks run in order: length, magic, version (FormatError), checksum
 * (HeaderChecksumError), then the decompression mode (FormatError). No field
 * is returned unless the checksum matched.
 */
Header readHeader(const uint8_t* archive, size_t size);

inline Header readHeader(const std::vector<uint8_t>& archive) {
    return readHeader(archive.data(), archive.size());
}

/**
 * @brief Header || sidecar || payload
 *
 * @throws glifzip::FormatError if header.sidecarSize or header.archiveSize
 *         disagree with the supplied buffers
 */
std::vector<uint8_t> write(const Header& header, const std::vector<uint8_t>& sidecar,
                           const uint8_t* payload, size_t payloadSize);

inline std::vector<uint8_t> write(const Header& header, const std::vector<uint8_t>& sidecar,
                                  const std::vector<uint8_t>& payload) {
    return write(header, sidecar, payload.data(), payload.size());
}

/**
 * @brief Non-owning view of one archive region
 */
struct Region {
    const uint8_t* data;
    size_t size;
};

// Sidecar bytes; FormatError if the archive is too short to hold them
Region readSidecar(const uint8_t* archive, size_t size, const Header& header);

// Payload bytes; SizeMismatchError if their length is not header.archiveSize
Region readPayload(const uint8_t* archive, size_t size, const Header& header);

} // namespace container
