#include "container.hpp"
#include "byte_io.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <zlib.h>

#include <algorithm>

namespace container {

DecompressionMode parseDecompressionMode(uint32_t raw) {
    switch (raw) {
        case 0: return DecompressionMode::FastWrap;
        case 1: return DecompressionMode::BlockOnly;
        default:
            throw glifzip::FormatError("Unknown decompression mode: " + std::to_string(raw));
    }
}

const char* decompressionModeName(DecompressionMode mode) {
    switch (mode) {
        case DecompressionMode::FastWrap:  return "lz4";
        case DecompressionMode::BlockOnly: return "zstd";
    }
    return "unknown";
}

bool operator==(const Header& a, const Header& b) {
    return a.payloadSize == b.payloadSize &&
           a.archiveSize == b.archiveSize &&
           a.payloadHash == b.payloadHash &&
           a.archiveHash == b.archiveHash &&
           a.compressionLevel == b.compressionLevel &&
           a.decompressionMode == b.decompressionMode &&
           a.workersUsed == b.workersUsed &&
           a.timestamp == b.timestamp &&
           a.sidecarSize == b.sidecarSize;
}

uint32_t headerChecksum(const uint8_t* headerBytes) {
    uLong adler = adler32(0L, Z_NULL, 0);
    adler = adler32(adler, headerBytes, static_cast<uInt>(CHECKSUM_OFFSET));
    return static_cast<uint32_t>(adler);
}

std::vector<uint8_t> encodeHeader(const Header& header) {
    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE);
    byteio::ByteWriter writer(out);

    writer.bytes(MAGIC.data(), MAGIC.size());
    writer.u32(VERSION);
    writer.u64(header.payloadSize);
    writer.u64(header.archiveSize);
    writer.bytes(header.payloadHash.data(), header.payloadHash.size());
    writer.bytes(header.archiveHash.data(), header.archiveHash.size());
    writer.u32(header.compressionLevel);
    writer.u32(static_cast<uint32_t>(header.decompressionMode));
    writer.u32(header.workersUsed);
    writer.u64(header.timestamp);
    writer.u16(header.sidecarSize);
    writer.u32(headerChecksum(out.data()));

    return out;
}

Header readHeader(const uint8_t* archive, size_t size) {
    if (size < HEADER_SIZE) {
        logging::err("Archive too small for header: {} bytes", size);
        throw glifzip::FormatError("Archive too small for header: " + std::to_string(size) +
                                   " bytes, need " + std::to_string(HEADER_SIZE));
    }

    if (!std::equal(MAGIC.begin(), MAGIC.end(), archive)) {
        logging::err("Invalid GLIF magic number");
        throw glifzip::FormatError("Invalid GLIF magic number");
    }

    byteio::ByteReader reader(archive, HEADER_SIZE);
    reader.skip(MAGIC.size());

    uint32_t version = reader.u32();
    if (version != VERSION) {
        logging::err("Unsupported GLIF version: {:#010x}", version);
        throw glifzip::FormatError("Unsupported GLIF version: " + std::to_string(version));
    }

    byteio::ByteReader checksumReader(archive + CHECKSUM_OFFSET, HEADER_SIZE - CHECKSUM_OFFSET);
    uint32_t stored = checksumReader.u32();
    uint32_t computed = headerChecksum(archive);
    if (stored != computed) {
        logging::err("Header checksum mismatch: stored {:#010x}, computed {:#010x}", stored, computed);
        throw glifzip::HeaderChecksumError(stored, computed);
    }

    Header header;
    header.payloadSize = reader.u64();
    header.archiveSize = reader.u64();
    reader.bytes(header.payloadHash.data(), header.payloadHash.size());
    reader.bytes(header.archiveHash.data(), header.archiveHash.size());
    header.compressionLevel = reader.u32();
    header.decompressionMode = parseDecompressionMode(reader.u32());
    header.workersUsed = reader.u32();
    header.timestamp = reader.u64();
    header.sidecarSize = reader.u16();
    return header;
}

std::vector<uint8_t> write(const Header& header, const std::vector<uint8_t>& sidecar,
                           const uint8_t* payload, size_t payloadSize) {
    if (sidecar.size() != header.sidecarSize) {
        throw glifzip::FormatError("Header declares a " + std::to_string(header.sidecarSize) +
                                   " byte sidecar, got " + std::to_string(sidecar.size()));
    }
    if (payloadSize != header.archiveSize) {
        throw glifzip::FormatError("Header declares a " + std::to_string(header.archiveSize) +
                                   " byte payload, got " + std::to_string(payloadSize));
    }

    std::vector<uint8_t> archive = encodeHeader(header);
    archive.reserve(HEADER_SIZE + sidecar.size() + payloadSize);
    archive.insert(archive.end(), sidecar.begin(), sidecar.end());
    archive.insert(archive.end(), payload, payload + payloadSize);
    return archive;
}

Region readSidecar(const uint8_t* archive, size_t size, const Header& header) {
    size_t end = HEADER_SIZE + header.sidecarSize;
    if (size < end) {
        throw glifzip::FormatError("Archive truncated inside sidecar: " + std::to_string(size) +
                                   " bytes, sidecar ends at " + std::to_string(end));
    }
    return {archive + HEADER_SIZE, header.sidecarSize};
}

Region readPayload(const uint8_t* archive, size_t size, const Header& header) {
    size_t start = HEADER_SIZE + header.sidecarSize;
    if (size < start) {
        throw glifzip::FormatError("Archive truncated before payload: " + std::to_string(size) + " bytes");
    }
    size_t actual = size - start;
    if (actual != header.archiveSize) {
        logging::err("Payload region is {} bytes, header declares {}", actual, header.archiveSize);
        throw glifzip::SizeMismatchError("Archive payload", header.archiveSize, actual);
    }
    return {archive + start, actual};
}

} // namespace container
