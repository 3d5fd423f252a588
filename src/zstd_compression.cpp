#include "zstd_compression.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <zstd.h>
#include <tbb/enumerable_thread_specific.h>

#include <chrono>
#include <cstring>
#include <new>
#include <string>

namespace glifzip_zstd {

// ZSTD magic number: 0xFD2FB528 (little-endian)
static const uint32_t ZSTD_MAGIC = 0xFD2FB528;

// A block decodes to at most 128 KiB and costs at least 4 bytes (RLE)
static const uint64_t MAX_FRAME_EXPANSION = (128 * 1024) / 4;

namespace {

// One context per worker thread; copies get a fresh context
struct CompressContext {
    ZSTD_CCtx* cctx;

    CompressContext() : cctx(ZSTD_createCCtx()) {
        if (!cctx) throw std::bad_alloc();
    }
    CompressContext(const CompressContext&) : CompressContext() {}
    CompressContext& operator=(const CompressContext&) = delete;
    ~CompressContext() { ZSTD_freeCCtx(cctx); }
};

struct DecompressContext {
    ZSTD_DCtx* dctx;

    DecompressContext() : dctx(ZSTD_createDCtx()) {
        if (!dctx) throw std::bad_alloc();
    }
    DecompressContext(const DecompressContext&) : DecompressContext() {}
    DecompressContext& operator=(const DecompressContext&) = delete;
    ~DecompressContext() { ZSTD_freeDCtx(dctx); }
};

void checkZstd(size_t result, const char* what) {
    if (ZSTD_isError(result)) {
        throw glifzip::CorruptionError(std::string(what) + ": " + ZSTD_getErrorName(result));
    }
}

std::vector<uint8_t> compressWith(ZSTD_CCtx* cctx, const uint8_t* data, size_t size, int compressionLevel) {
    checkZstd(ZSTD_CCtx_reset(cctx, ZSTD_reset_session_and_parameters), "ZSTD context reset");
    checkZstd(ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel, compressionLevel),
              "ZSTD set compression level");
    checkZstd(ZSTD_CCtx_setParameter(cctx, ZSTD_c_checksumFlag, 1), "ZSTD enable checksum");
    checkZstd(ZSTD_CCtx_setParameter(cctx, ZSTD_c_contentSizeFlag, 1), "ZSTD enable content size");

    size_t maxCompressedSize = ZSTD_compressBound(size);
    std::vector<uint8_t> compressed(maxCompressedSize);

    size_t compressedSize = ZSTD_compress2(
        cctx,
        compressed.data(), maxCompressedSize,
        data, size
    );
    checkZstd(compressedSize, "ZSTD compression failed");

    compressed.resize(compressedSize);
    return compressed;
}

size_t decompressInto(ZSTD_DCtx* dctx, const uint8_t* data, size_t size, uint8_t* out, size_t expectedSize) {
    size_t actualSize = ZSTD_decompressDCtx(dctx, out, expectedSize, data, size);

    if (ZSTD_isError(actualSize)) {
        throw glifzip::CorruptionError(std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(actualSize));
    }
    if (actualSize != expectedSize) {
        throw glifzip::CorruptionError("ZSTD decompressed size mismatch: expected " +
                                       std::to_string(expectedSize) + ", got " + std::to_string(actualSize));
    }
    return actualSize;
}

} // namespace

void validateLevel(int compressionLevel) {
    if (compressionLevel < MIN_LEVEL || compressionLevel > MAX_LEVEL) {
        throw glifzip::ConfigurationError("Compression level must be in [" + std::to_string(MIN_LEVEL) +
                                          ", " + std::to_string(MAX_LEVEL) + "], got " +
                                          std::to_string(compressionLevel));
    }
}

bool isZstdFrame(const uint8_t* data, size_t size) {
    if (size < sizeof(uint32_t)) return false;
    uint32_t magic = static_cast<uint32_t>(data[0]) |
                     (static_cast<uint32_t>(data[1]) << 8) |
                     (static_cast<uint32_t>(data[2]) << 16) |
                     (static_cast<uint32_t>(data[3]) << 24);
    return magic == ZSTD_MAGIC;
}

std::vector<uint8_t> compressChunk(const uint8_t* data, size_t size, int compressionLevel) {
    validateLevel(compressionLevel);
    CompressContext context;
    return compressWith(context.cctx, data, size, compressionLevel);
}

std::vector<uint8_t> decompressChunk(const uint8_t* data, size_t size, size_t expectedSize) {
    std::vector<uint8_t> out(expectedSize);
    DecompressContext context;
    decompressInto(context.dctx, data, size, out.data(), expectedSize);
    return out;
}

std::vector<FrameInfo> indexFrames(const uint8_t* data, size_t size) {
    std::vector<FrameInfo> frames;
    size_t pos = 0;
    while (pos < size) {
        if (!isZstdFrame(data + pos, size - pos)) {
            throw glifzip::CorruptionError("No ZSTD frame magic at offset " + std::to_string(pos));
        }
        size_t frameSize = ZSTD_findFrameCompressedSize(data + pos, size - pos);
        if (ZSTD_isError(frameSize)) {
            throw glifzip::CorruptionError("Invalid ZSTD frame at offset " + std::to_string(pos) +
                                           ": " + ZSTD_getErrorName(frameSize));
        }

        unsigned long long contentSize = ZSTD_getFrameContentSize(data + pos, frameSize);
        if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
            throw glifzip::CorruptionError("Not a valid ZSTD frame at offset " + std::to_string(pos));
        }
        if (contentSize == ZSTD_CONTENTSIZE_UNKNOWN) {
            throw glifzip::CorruptionError("ZSTD frame at offset " + std::to_string(pos) +
                                           " does not declare its content size");
        }
        if (contentSize > static_cast<uint64_t>(frameSize) * MAX_FRAME_EXPANSION) {
            throw glifzip::CorruptionError("ZSTD frame at offset " + std::to_string(pos) +
                                           " declares an impossible size of " + std::to_string(contentSize) +
                                           " bytes");
        }

        frames.push_back({pos, frameSize, contentSize});
        pos += frameSize;
    }
    return frames;
}

std::vector<uint8_t> compressChunks(
    chunking::WorkerPool& pool,
    const uint8_t* payload,
    size_t payloadSize,
    size_t chunkSize,
    int compressionLevel
) {
    validateLevel(compressionLevel);

    logging::debug("Compressing {} bytes with ZSTD level {} ({} byte chunks, {} workers)",
                   payloadSize, compressionLevel, chunkSize, pool.workers());

    auto startTime = std::chrono::high_resolution_clock::now();

    tbb::enumerable_thread_specific<CompressContext> threadContexts;

    std::vector<std::vector<uint8_t>> compressedChunks = chunking::mapChunks(
        pool, payload, payloadSize, chunkSize,
        [&](const chunking::ChunkView& chunk) {
            return compressWith(threadContexts.local().cctx, chunk.data, chunk.size, compressionLevel);
        });

    std::vector<uint8_t> stream = chunking::concat(compressedChunks);

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

    logging::debug("ZSTD layer: {} chunks, {} -> {} bytes in {}ms",
                   compressedChunks.size(), payloadSize, stream.size(), duration.count());
    return stream;
}

std::vector<uint8_t> decompressChunks(
    chunking::WorkerPool& pool,
    const uint8_t* stream,
    size_t streamSize,
    uint64_t payloadSize
) {
    std::vector<FrameInfo> frames = indexFrames(stream, streamSize);

    if (payloadSize == 0) {
        if (!frames.empty()) {
            throw glifzip::CorruptionError("Empty payload declared but " + std::to_string(frames.size()) +
                                           " ZSTD frames present");
        }
        return {};
    }
    if (frames.empty()) {
        throw glifzip::CorruptionError("No ZSTD frames for a payload of " + std::to_string(payloadSize) + " bytes");
    }

    const uint64_t chunkSize = frames.front().contentSize;
    if (chunkSize == 0 || chunkSize > chunking::MAX_CHUNK_SIZE) {
        throw glifzip::CorruptionError("First ZSTD frame declares a chunk of " + std::to_string(chunkSize) +
                                       " bytes");
    }

    const uint64_t expectedFrames = (payloadSize + chunkSize - 1) / chunkSize;
    if (frames.size() != expectedFrames) {
        throw glifzip::CorruptionError("Expected " + std::to_string(expectedFrames) + " ZSTD frames for " +
                                       std::to_string(payloadSize) + " bytes, found " +
                                       std::to_string(frames.size()));
    }
    for (size_t i = 0; i < frames.size(); i++) {
        uint64_t expected = chunking::chunkLength(payloadSize, chunkSize, i);
        if (frames[i].contentSize != expected) {
            throw glifzip::CorruptionError("ZSTD frame " + std::to_string(i) + " declares " +
                                           std::to_string(frames[i].contentSize) + " bytes, expected " +
                                           std::to_string(expected));
        }
    }

    logging::debug("Decompressing {} ZSTD frames ({} bytes) with {} workers",
                   frames.size(), payloadSize, pool.workers());

    std::vector<uint8_t> outputData;
    try {
        outputData.resize(payloadSize);
    } catch (const std::bad_alloc&) {
        throw glifzip::CorruptionError("Cannot allocate " + std::to_string(payloadSize) +
                                       " bytes declared by the ZSTD frames");
    }
    tbb::enumerable_thread_specific<DecompressContext> threadContexts;

    // Each frame writes its own disjoint slice of outputData
    chunking::mapIndexed(pool, frames.size(), [&](size_t i) {
        return decompressInto(
            threadContexts.local().dctx,
            stream + frames[i].offset, frames[i].compressedSize,
            outputData.data() + i * chunkSize, frames[i].contentSize);
    });

    return outputData;
}

} // namespace glifzip_zstd
