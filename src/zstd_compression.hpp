#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "chunk_scheduler.hpp"

namespace glifzip_zstd {

constexpr int MIN_LEVEL = 1;
constexpr int MAX_LEVEL = 22;
constexpr int DEFAULT_LEVEL = 8;

/**
 * @brief Reject compression levels outside [MIN_LEVEL, MAX_LEVEL]
 *
 * @throws glifzip::ConfigurationError
 */
void validateLevel(int compressionLevel);

/**
 * @brief Compress one chunk into a single ZSTD frame
 *
 * The frame records its content size and a content checksum. Output depends
 * only on the input bytes and the level.
 *
 * @param data Chunk bytes
 * @param size Chunk length
 * @param compressionLevel ZSTD compression level (1-22)
 * @return Compressed frame
 */
std::vector<uint8_t> compressChunk(const uint8_t* data, size_t size, int compressionLevel);

/**
 * @brief Decompress one ZSTD frame that must decode to exactly expectedSize bytes
 *
 * @throws glifzip::CorruptionError on a malformed frame or a length mismatch
 */
std::vector<uint8_t> decompressChunk(const uint8_t* data, size_t size, size_t expectedSize);

/**
 * @brief Location of one frame inside a concatenated frame stream
 */
struct FrameInfo {
    size_t offset;
    size_t compressedSize;
    uint64_t contentSize;
};

/**
 * @brief Walk a stream of concatenated ZSTD frames and record each frame
 *
 * Only frame headers are read.
 *
 * @throws glifzip::CorruptionError when the stream is not a whole number of
 *         frames or a frame omits its content size
 */
std::vector<FrameInfo> indexFrames(const uint8_t* data, size_t size);

/**
 * @brief Compress payload chunk by chunk in parallel
 *
 * @return One ZSTD frame per chunk, concatenated in chunk order
 */
std::vector<uint8_t> compressChunks(
    chunking::WorkerPool& pool,
    const uint8_t* payload,
    size_t payloadSize,
    size_t chunkSize,
    int compressionLevel
);

/**
 * @brief Decompress a frame stream produced by compressChunks
 *
 * The chunk size is read from the first frame and every frame's expected size
 * is recomputed from payloadSize, so the stored frames must reproduce the
 * original partition exactly.
 *
 * @throws glifzip::CorruptionError
 */
std::vector<uint8_t> decompressChunks(
    chunking::WorkerPool& pool,
    const uint8_t* stream,
    size_t streamSize,
    uint64_t payloadSize
);

/**
 * @brief Check if a buffer starts with the ZSTD frame magic number
 */
bool isZstdFrame(const uint8_t* data, size_t size);

} // namespace glifzip_zstd
