#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "chunk_scheduler.hpp"
#include "container.hpp"
#include "sidecar.hpp"
#include "zstd_compression.hpp"

namespace glifzip {

enum class Stage {
    Idle,
    // compress
    Hashing,
    Chunking,
    Compressing,
    Wrapping,
    Framing,
    // decompress / verify
    ParsingHeader,
    VerifyingArchiveHash,
    Unwrapping,
    Decompressing,
    VerifyingPayloadHash,
    Done
};

const char* stageName(Stage stage);

// Called once for every stage an operation enters, on the calling thread
using StageObserver = std::function<void(Stage)>;

struct CompressionConfig {
    int level = glifzip_zstd::DEFAULT_LEVEL;
    int workers = chunking::defaultWorkerCount();
    bool useFastUnwrap = true;
    // Zero timestamp and worker count so equal inputs give equal archives
    bool deterministic = true;
    size_t chunkSize = chunking::MAX_CHUNK_SIZE;

    // Directory statistics copied into the sidecar
    std::optional<uint64_t> fileCount;
    std::optional<uint64_t> directoryCount;

    static CompressionConfig fast();
    static CompressionConfig balanced();
    static CompressionConfig highCompression();

    // Throws ConfigurationError
    void validate() const;
};

struct ArchiveInfo {
    container::Header header;
    sidecar::Sidecar sidecar;
};

struct RoundTripReport {
    uint64_t payloadSize = 0;
    uint64_t archiveSize = 0;   // whole archive, header and sidecar included
    double ratio = 0.0;         // archiveSize / payloadSize, 0 for empty input
    bool identical = false;
};

/**
 * @brief Compress, decompress and verify GLIF archives on a caller-owned pool
 *
 * Holds no mutable state; one instance may be used from several threads.
 */
class Pipeline {
public:
    explicit Pipeline(chunking::WorkerPool& pool, StageObserver observer = {});

    /**
     * @brief Build a complete archive from payload bytes
     *
     * @throws ConfigurationError for an invalid config
     */
    std::vector<uint8_t> compress(const uint8_t* payload, size_t size, const CompressionConfig& config) const;
    std::vector<uint8_t> compress(const std::vector<uint8_t>& payload, const CompressionConfig& config) const;

    /**
     * @brief Recover the payload of an archive
     *
     * The archive hash is checked before any decompression starts.
     *
     * @throws FormatError, HeaderChecksumError, HashMismatchError,
     *         SizeMismatchError, CorruptionError
     */
    std::vector<uint8_t> decompress(const uint8_t* archive, size_t size) const;
    std::vector<uint8_t> decompress(const std::vector<uint8_t>& archive) const;

    /**
     * @brief Header, archive hash and sidecar checks only
     *
     * Never decompresses; cost is proportional to the archive size.
     */
    ArchiveInfo verify(const uint8_t* archive, size_t size) const;
    ArchiveInfo verify(const std::vector<uint8_t>& archive) const;

    RoundTripReport roundTrip(const std::vector<uint8_t>& payload, const CompressionConfig& config) const;

    chunking::WorkerPool& pool() const { return pool_; }

private:
    void enter(Stage stage) const;
    container::Header parseAndVerify(const uint8_t* archive, size_t size, container::Region& payload) const;

    chunking::WorkerPool& pool_;
    StageObserver observer_;
};

// Convenience wrappers that build a pool for the duration of the call
std::vector<uint8_t> compress(const std::vector<uint8_t>& payload, const CompressionConfig& config);
std::vector<uint8_t> decompress(const std::vector<uint8_t>& archive, int threads);
ArchiveInfo verifyArchive(const std::vector<uint8_t>& archive);

// Whole-file helpers; filesystem failures raise IOError
std::vector<uint8_t> readFile(const std::string& path);
void writeFile(const std::string& path, const std::vector<uint8_t>& data);

container::Header compressFile(const std::string& inputPath, const std::string& outputPath,
                               const CompressionConfig& config);
uint64_t decompressFile(const std::string& archivePath, const std::string& outputPath, int threads);

} // namespace glifzip
