#include "lz4_wrap.hpp"
#include "byte_io.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <lz4.h>

#include <chrono>
#include <limits>
#include <string>

namespace glifzip_lz4 {

namespace {

struct FrameEntry {
    size_t payloadOffset;   // position of the LZ4 block in the wrapped stream
    uint64_t rawLength;
    uint64_t compLength;
    size_t outputOffset;
};

void decompressInto(const uint8_t* data, size_t size, uint8_t* out, size_t expectedSize) {
    if (size > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        expectedSize > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw glifzip::CorruptionError("LZ4 frame exceeds block limits");
    }

    int result = LZ4_decompress_safe(
        reinterpret_cast<const char*>(data),
        reinterpret_cast<char*>(out),
        static_cast<int>(size),
        static_cast<int>(expectedSize));

    if (result < 0) {
        throw glifzip::CorruptionError("LZ4 decompression failed with code " + std::to_string(result));
    }
    if (static_cast<size_t>(result) != expectedSize) {
        throw glifzip::CorruptionError("LZ4 decompressed size mismatch: expected " +
                                       std::to_string(expectedSize) + ", got " + std::to_string(result));
    }
}

std::vector<FrameEntry> indexFrames(const uint8_t* data, size_t size, uint64_t& totalRaw) {
    byteio::ByteReader reader(data, size);
    if (reader.remaining() < PREAMBLE_SIZE) {
        throw glifzip::CorruptionError("LZ4 wrap layer truncated: " + std::to_string(size) + " bytes");
    }

    uint32_t frameCount = reader.u32();
    totalRaw = reader.u64();

    if (frameCount > reader.remaining() / FRAME_HEADER_SIZE) {
        throw glifzip::CorruptionError("LZ4 wrap layer declares " + std::to_string(frameCount) +
                                       " frames but holds only " + std::to_string(reader.remaining()) + " bytes");
    }

    std::vector<FrameEntry> frames;
    frames.reserve(frameCount);
    uint64_t outputOffset = 0;
    for (uint32_t i = 0; i < frameCount; i++) {
        if (reader.remaining() < FRAME_HEADER_SIZE) {
            throw glifzip::CorruptionError("LZ4 frame " + std::to_string(i) + " header truncated");
        }
        uint64_t rawLength = reader.u64();
        uint64_t compLength = reader.u64();
        if (compLength > reader.remaining()) {
            throw glifzip::CorruptionError("LZ4 frame " + std::to_string(i) + " declares " +
                                           std::to_string(compLength) + " bytes but only " +
                                           std::to_string(reader.remaining()) + " remain");
        }
        // LZ4 cannot expand a block by more than a factor of 255
        if (rawLength > static_cast<uint64_t>(LZ4_MAX_INPUT_SIZE) || rawLength > compLength * 255 + 16) {
            throw glifzip::CorruptionError("LZ4 frame " + std::to_string(i) + " declares an impossible size of " +
                                           std::to_string(rawLength) + " bytes");
        }
        if (rawLength > totalRaw - outputOffset) {
            throw glifzip::CorruptionError("LZ4 frame " + std::to_string(i) + " overruns declared total of " +
                                           std::to_string(totalRaw) + " bytes");
        }

        frames.push_back({reader.position(), rawLength, compLength, static_cast<size_t>(outputOffset)});
        outputOffset += rawLength;
        reader.skip(static_cast<size_t>(compLength));
    }

    if (reader.remaining() != 0) {
        throw glifzip::CorruptionError(std::to_string(reader.remaining()) + " trailing bytes after LZ4 frames");
    }
    if (outputOffset != totalRaw) {
        throw glifzip::CorruptionError("LZ4 frames hold " + std::to_string(outputOffset) +
                                       " bytes, preamble declares " + std::to_string(totalRaw));
    }
    return frames;
}

} // namespace

std::vector<uint8_t> compressBlock(const uint8_t* data, size_t size) {
    if (size > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw glifzip::ConfigurationError("LZ4 block input too large: " + std::to_string(size) + " bytes");
    }

    int bound = LZ4_compressBound(static_cast<int>(size));
    std::vector<uint8_t> out(static_cast<size_t>(bound));
    int written = LZ4_compress_default(
        reinterpret_cast<const char*>(data),
        reinterpret_cast<char*>(out.data()),
        static_cast<int>(size),
        bound);

    if (written <= 0) {
        throw glifzip::CorruptionError("LZ4 compression failed for a " + std::to_string(size) + " byte block");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> decompressBlock(const uint8_t* data, size_t size, size_t expectedSize) {
    std::vector<uint8_t> out(expectedSize);
    decompressInto(data, size, out.data(), expectedSize);
    return out;
}

std::vector<uint8_t> wrap(chunking::WorkerPool& pool, const uint8_t* data, size_t size, size_t frameSize) {
    if (frameSize == 0 || frameSize > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw glifzip::ConfigurationError("LZ4 frame size must be in [1, " +
                                          std::to_string(LZ4_MAX_INPUT_SIZE) + "], got " +
                                          std::to_string(frameSize));
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    std::vector<std::vector<uint8_t>> blocks = chunking::mapChunks(
        pool, data, size, frameSize,
        [](const chunking::ChunkView& chunk) {
            return compressBlock(chunk.data, chunk.size);
        });

    if (blocks.size() > std::numeric_limits<uint32_t>::max()) {
        throw glifzip::ConfigurationError("Too many LZ4 frames: " + std::to_string(blocks.size()));
    }

    size_t wrappedSize = PREAMBLE_SIZE;
    for (const auto& block : blocks) {
        wrappedSize += FRAME_HEADER_SIZE + block.size();
    }

    std::vector<uint8_t> wrapped;
    wrapped.reserve(wrappedSize);
    byteio::ByteWriter writer(wrapped);
    writer.u32(static_cast<uint32_t>(blocks.size()));
    writer.u64(size);
    for (size_t i = 0; i < blocks.size(); i++) {
        writer.u64(chunking::chunkLength(size, frameSize, i));
        writer.u64(blocks[i].size());
        writer.bytes(blocks[i].data(), blocks[i].size());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - startTime);
    logging::debug("LZ4 layer: {} frames, {} -> {} bytes in {}ms",
                   blocks.size(), size, wrapped.size(), duration.count());
    return wrapped;
}

uint64_t declaredSize(const uint8_t* data, size_t size) {
    if (size < PREAMBLE_SIZE) {
        throw glifzip::CorruptionError("LZ4 wrap layer truncated: " + std::to_string(size) + " bytes");
    }
    byteio::ByteReader reader(data, size);
    reader.skip(4);
    return reader.u64();
}

std::vector<uint8_t> unwrap(chunking::WorkerPool& pool, const uint8_t* data, size_t size) {
    uint64_t totalRaw = 0;
    std::vector<FrameEntry> frames = indexFrames(data, size, totalRaw);

    logging::debug("Unwrapping {} LZ4 frames ({} bytes) with {} workers",
                   frames.size(), totalRaw, pool.workers());

    std::vector<uint8_t> outputData(static_cast<size_t>(totalRaw));
    chunking::mapIndexed(pool, frames.size(), [&](size_t i) {
        const FrameEntry& frame = frames[i];
        decompressInto(data + frame.payloadOffset, static_cast<size_t>(frame.compLength),
                       outputData.data() + frame.outputOffset, static_cast<size_t>(frame.rawLength));
        return frame.rawLength;
    });

    return outputData;
}

std::vector<uint8_t> unwrap(chunking::WorkerPool& pool, const uint8_t* data, size_t size, uint64_t expectedSize) {
    uint64_t declared = declaredSize(data, size);
    if (declared != expectedSize) {
        throw glifzip::CorruptionError("LZ4 wrap layer declares " + std::to_string(declared) +
                                       " bytes, expected " + std::to_string(expectedSize));
    }
    return unwrap(pool, data, size);
}

} // namespace glifzip_lz4
