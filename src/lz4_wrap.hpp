#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "chunk_scheduler.hpp"

namespace glifzip_lz4 {

// [u32 frame_count][u64 total_raw]
constexpr size_t PREAMBLE_SIZE = 12;
// [u64 raw_len][u64 comp_len]
constexpr size_t FRAME_HEADER_SIZE = 16;

/**
 * @brief Wrap bytes in a sequence of self-delimiting LZ4 frames
 *
 * A frame is cut every frameSize input bytes. Boundaries depend on the input
 * length and frameSize only, so any worker count produces the same output and
 * any worker count can unwrap it.
 *
 * Layout (big-endian): [u32 frame_count][u64 total_raw] then per frame
 * [u64 raw_len][u64 comp_len][LZ4 block].
 *
 * @throws glifzip::ConfigurationError if frameSize is 0 or exceeds the LZ4 block limit
 */
std::vector<uint8_t> wrap(chunking::WorkerPool& pool, const uint8_t* data, size_t size, size_t frameSize);

/**
 * @brief Undo wrap(), decompressing frames in parallel
 *
 * @throws glifzip::CorruptionError on truncated or malformed framing, LZ4
 *         errors, or any length disagreement
 */
std::vector<uint8_t> unwrap(chunking::WorkerPool& pool, const uint8_t* data, size_t size);

/**
 * @brief unwrap() that additionally requires the result to be expectedSize bytes
 */
std::vector<uint8_t> unwrap(chunking::WorkerPool& pool, const uint8_t* data, size_t size, uint64_t expectedSize);

// Total unwrapped size declared by the preamble
uint64_t declaredSize(const uint8_t* data, size_t size);

// Single LZ4 block helpers
std::vector<uint8_t> compressBlock(const uint8_t* data, size_t size);
std::vector<uint8_t> decompressBlock(const uint8_t* data, size_t size, size_t expectedSize);

} // namespace glifzip_lz4
