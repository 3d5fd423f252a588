#include "pipeline.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "logging.hpp"
#include "lz4_wrap.hpp"

#include <boost/filesystem.hpp>
#include <boost/iostreams/device/mapped_file.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>

namespace fs = boost::filesystem;

namespace glifzip {

namespace {

double throughputMBps(uint64_t bytes, std::chrono::milliseconds elapsed) {
    double seconds = std::max<double>(elapsed.count(), 1.0) / 1000.0;
    return static_cast<double>(bytes) / (1024.0 * 1024.0) / seconds;
}

uint64_t wallClockSeconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

const char* stageName(Stage stage) {
    switch (stage) {
        case Stage::Idle:                 return "idle";
        case Stage::Hashing:              return "hashing";
        case Stage::Chunking:             return "chunking";
        case Stage::Compressing:          return "compressing";
        case Stage::Wrapping:             return "wrapping";
        case Stage::Framing:              return "framing";
        case Stage::ParsingHeader:        return "parsing-header";
        case Stage::VerifyingArchiveHash: return "verifying-archive-hash";
        case Stage::Unwrapping:           return "unwrapping";
        case Stage::Decompressing:        return "decompressing";
        case Stage::VerifyingPayloadHash: return "verifying-payload-hash";
        case Stage::Done:                 return "done";
    }
    return "unknown";
}

CompressionConfig CompressionConfig::fast() {
    CompressionConfig config;
    config.level = 3;
    return config;
}

CompressionConfig CompressionConfig::balanced() {
    return CompressionConfig();
}

CompressionConfig CompressionConfig::highCompression() {
    CompressionConfig config;
    config.level = 16;
    config.useFastUnwrap = false;
    return config;
}

void CompressionConfig::validate() const {
    glifzip_zstd::validateLevel(level);
    if (workers < 1) {
        throw ConfigurationError("Worker count must be at least 1, got " + std::to_string(workers));
    }
    if (chunkSize == 0 || chunkSize > chunking::MAX_CHUNK_SIZE) {
        throw ConfigurationError("Chunk size must be in [1, " + std::to_string(chunking::MAX_CHUNK_SIZE) +
                                 "] bytes, got " + std::to_string(chunkSize));
    }
}

Pipeline::Pipeline(chunking::WorkerPool& pool, StageObserver observer)
    : pool_(pool), observer_(std::move(observer)) {}

void Pipeline::enter(Stage stage) const {
    logging::debug("Stage: {}", stageName(stage));
    if (observer_) observer_(stage);
}

std::vector<uint8_t> Pipeline::compress(const uint8_t* payload, size_t size,
                                        const CompressionConfig& config) const {
    config.validate();
    enter(Stage::Idle);
    auto startTime = std::chrono::high_resolution_clock::now();

    container::Header header;
    header.payloadSize = size;
    header.compressionLevel = static_cast<uint32_t>(config.level);
    header.decompressionMode = config.useFastUnwrap ? container::DecompressionMode::FastWrap
                                                    : container::DecompressionMode::BlockOnly;
    header.workersUsed = config.deterministic ? 0 : static_cast<uint32_t>(pool_.workers());
    header.timestamp = config.deterministic ? 0 : wallClockSeconds();

    enter(Stage::Hashing);
    header.payloadHash = hashing::sha256(payload, size);

    enter(Stage::Chunking);
    logging::debug("{} bytes -> {} chunks of up to {} bytes",
                   size, chunking::partition(size, config.chunkSize).size(), config.chunkSize);

    enter(Stage::Compressing);
    std::vector<uint8_t> stream = glifzip_zstd::compressChunks(
        pool_, payload, size, config.chunkSize, config.level);

    if (config.useFastUnwrap) {
        enter(Stage::Wrapping);
        size_t frameSize = std::min(config.chunkSize, chunking::MAX_CHUNK_SIZE);
        stream = glifzip_lz4::wrap(pool_, stream.data(), stream.size(), frameSize);
    }

    enter(Stage::Framing);
    header.archiveSize = stream.size();
    header.archiveHash = hashing::sha256(stream);

    sidecar::BuildOptions options;
    options.chunkSize = config.chunkSize;
    options.deterministic = config.deterministic;
    options.files = config.fileCount;
    options.directories = config.directoryCount;
    std::vector<uint8_t> sidecarBytes = sidecar::build(header, options).encode();
    header.sidecarSize = static_cast<uint16_t>(sidecarBytes.size());

    std::vector<uint8_t> archive = container::write(header, sidecarBytes, stream);
    enter(Stage::Done);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - startTime);
    logging::info("Compressed {} -> {} bytes ({:.2f}%) in {}ms ({:.1f} MB/s), mode {}",
                  size, archive.size(), sidecar::compressionRatio(size, archive.size()) * 100.0,
                  duration.count(), throughputMBps(size, duration),
                  container::decompressionModeName(header.decompressionMode));
    return archive;
}

std::vector<uint8_t> Pipeline::compress(const std::vector<uint8_t>& payload,
                                        const CompressionConfig& config) const {
    return compress(payload.data(), payload.size(), config);
}

container::Header Pipeline::parseAndVerify(const uint8_t* archive, size_t size,
                                           container::Region& payload) const {
    enter(Stage::ParsingHeader);
    container::Header header = container::readHeader(archive, size);
    container::readSidecar(archive, size, header);
    payload = container::readPayload(archive, size, header);

    enter(Stage::VerifyingArchiveHash);
    hashing::verifyDigest(payload.data, payload.size, header.archiveHash, "Archive");
    return header;
}

std::vector<uint8_t> Pipeline::decompress(const uint8_t* archive, size_t size) const {
    enter(Stage::Idle);
    auto startTime = std::chrono::high_resolution_clock::now();

    container::Region region{nullptr, 0};
    container::Header header = parseAndVerify(archive, size, region);

    std::vector<uint8_t> unwrapped;
    const uint8_t* stream = region.data;
    size_t streamSize = region.size;
    if (header.decompressionMode == container::DecompressionMode::FastWrap) {
        enter(Stage::Unwrapping);
        unwrapped = glifzip_lz4::unwrap(pool_, region.data, region.size);
        stream = unwrapped.data();
        streamSize = unwrapped.size();
    }

    enter(Stage::Decompressing);
    std::vector<uint8_t> payload = glifzip_zstd::decompressChunks(pool_, stream, streamSize, header.payloadSize);
    unwrapped.clear();
    unwrapped.shrink_to_fit();

    enter(Stage::VerifyingPayloadHash);
    hashing::verifyDigest(payload.data(), payload.size(), header.payloadHash, "Payload");
    if (payload.size() != header.payloadSize) {
        logging::err("Decompressed {} bytes, header declares {}", payload.size(), header.payloadSize);
        throw SizeMismatchError("Payload", header.payloadSize, payload.size());
    }
    enter(Stage::Done);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - startTime);
    logging::info("Decompressed {} -> {} bytes in {}ms ({:.1f} MB/s)",
                  size, payload.size(), duration.count(), throughputMBps(payload.size(), duration));
    return payload;
}

std::vector<uint8_t> Pipeline::decompress(const std::vector<uint8_t>& archive) const {
    return decompress(archive.data(), archive.size());
}

ArchiveInfo Pipeline::verify(const uint8_t* archive, size_t size) const {
    enter(Stage::Idle);
    container::Region region{nullptr, 0};
    container::Header header = parseAndVerify(archive, size, region);

    container::Region sidecarRegion = container::readSidecar(archive, size, header);
    sidecar::Sidecar meta = sidecar::Sidecar::decode(sidecarRegion.data, sidecarRegion.size);
    meta.checkConsistency(header);
    enter(Stage::Done);

    logging::info("Archive verified: {} byte payload, level {}, mode {}",
                  header.payloadSize, header.compressionLevel,
                  container::decompressionModeName(header.decompressionMode));
    return {header, meta};
}

ArchiveInfo Pipeline::verify(const std::vector<uint8_t>& archive) const {
    return verify(archive.data(), archive.size());
}

RoundTripReport Pipeline::roundTrip(const std::vector<uint8_t>& payload, const CompressionConfig& config) const {
    std::vector<uint8_t> archive = compress(payload, config);
    std::vector<uint8_t> restored = decompress(archive);

    RoundTripReport report;
    report.payloadSize = payload.size();
    report.archiveSize = archive.size();
    report.ratio = sidecar::compressionRatio(payload.size(), archive.size());
    report.identical = restored == payload;
    if (!report.identical) {
        logging::err("Round trip of {} bytes did not reproduce the input", payload.size());
    }
    return report;
}

std::vector<uint8_t> compress(const std::vector<uint8_t>& payload, const CompressionConfig& config) {
    config.validate();
    chunking::WorkerPool pool(config.workers);
    return Pipeline(pool).compress(payload, config);
}

std::vector<uint8_t> decompress(const std::vector<uint8_t>& archive, int threads) {
    chunking::WorkerPool pool(threads);
    return Pipeline(pool).decompress(archive);
}

ArchiveInfo verifyArchive(const std::vector<uint8_t>& archive) {
    chunking::WorkerPool pool(1);
    return Pipeline(pool).verify(archive);
}

std::vector<uint8_t> readFile(const std::string& path) {
    boost::system::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IOError("Not a readable file: " + path);
    }
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw IOError("Cannot stat " + path + ": " + ec.message());
    }
    // mapped_file_source refuses zero-length files
    if (size == 0) {
        return {};
    }

    try {
        boost::iostreams::mapped_file_source mapped(path);
        const uint8_t* begin = reinterpret_cast<const uint8_t*>(mapped.data());
        return std::vector<uint8_t>(begin, begin + mapped.size());
    } catch (const std::ios_base::failure& e) {
        throw IOError("Cannot map " + path + ": " + e.what());
    }
}

void writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    // Written beside the target and renamed so a failure leaves no partial file
    fs::path target(path);
    fs::path temp = target;
    temp += ".partial";
    {
        std::ofstream out(temp.string(), std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("Cannot open " + temp.string() + " for writing");
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out) {
            boost::system::error_code ignored;
            fs::remove(temp, ignored);
            throw IOError("Failed writing " + path);
        }
    }

    boost::system::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        boost::system::error_code ignored;
        fs::remove(temp, ignored);
        throw IOError("Cannot move " + temp.string() + " to " + path + ": " + ec.message());
    }
}

container::Header compressFile(const std::string& inputPath, const std::string& outputPath,
                               const CompressionConfig& config) {
    std::vector<uint8_t> payload = readFile(inputPath);
    std::vector<uint8_t> archive = compress(payload, config);
    writeFile(outputPath, archive);
    logging::info("Wrote {} ({} bytes)", outputPath, archive.size());
    return container::readHeader(archive);
}

uint64_t decompressFile(const std::string& archivePath, const std::string& outputPath, int threads) {
    std::vector<uint8_t> archive = readFile(archivePath);
    std::vector<uint8_t> payload = decompress(archive, threads);
    writeFile(outputPath, payload);
    logging::info("Wrote {} ({} bytes)", outputPath, payload.size());
    return payload.size();
}

} // namespace glifzip
