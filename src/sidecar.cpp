#include "sidecar.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "version.hpp"

#include <nlohmann/json.hpp>
#include <boost/predef.h>
#include <spdlog/fmt/chrono.h>

#include <cmath>
#include <ctime>
#include <limits>

namespace sidecar {

using json = nlohmann::ordered_json;

namespace {

std::string prefixedHash(const hashing::Digest& digest) {
    return std::string(HASH_ALGORITHM) + ":" + hashing::toHex(digest);
}

template <typename T>
T required(const json& node, const char* section, const char* key) {
    if (!node.contains(key)) {
        throw glifzip::FormatError(std::string("Sidecar is missing ") + section + "." + key);
    }
    try {
        return node.at(key).get<T>();
    } catch (const json::exception& e) {
        throw glifzip::FormatError(std::string("Sidecar field ") + section + "." + key + " has the wrong type: " + e.what());
    }
}

template <typename T>
std::optional<T> optionalField(const json& node, const char* section, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return required<T>(node, section, key);
}

const json& section(const json& root, const char* name) {
    if (!root.contains(name) || !root.at(name).is_object()) {
        throw glifzip::FormatError(std::string("Sidecar is missing section ") + name);
    }
    return root.at(name);
}

void mismatch(const std::string& field, const std::string& sidecarValue, const std::string& headerValue) {
    logging::err("Sidecar field {} ({}) disagrees with header ({})", field, sidecarValue, headerValue);
    throw glifzip::FormatError("Sidecar field " + field + " (" + sidecarValue +
                               ") disagrees with header (" + headerValue + ")");
}

template <typename T>
void expectEqual(const std::string& field, const T& sidecarValue, const T& headerValue) {
    if (!(sidecarValue == headerValue)) {
        mismatch(field, fmt::format("{}", sidecarValue), fmt::format("{}", headerValue));
    }
}

} // namespace

std::string rfc3339(uint64_t secondsSinceEpoch) {
    std::time_t t = static_cast<std::time_t>(secondsSinceEpoch);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(t));
}

double compressionRatio(uint64_t payloadSize, uint64_t archiveSize) {
    if (payloadSize == 0) return 0.0;
    return static_cast<double>(archiveSize) / static_cast<double>(payloadSize);
}

std::string sourcePlatform() {
#if BOOST_OS_LINUX
    return "linux";
#elif BOOST_OS_MACOS
    return "macos";
#elif BOOST_OS_WINDOWS
    return "windows";
#elif BOOST_OS_BSD
    return "bsd";
#else
    return "unknown";
#endif
}

std::string sourceArchitecture() {
#if BOOST_ARCH_X86_64
    return "x86_64";
#elif BOOST_ARCH_X86_32
    return "x86";
#elif BOOST_ARCH_ARM && (BOOST_ARCH_WORD_BITS == 64)
    return "aarch64";
#elif BOOST_ARCH_ARM
    return "arm";
#elif BOOST_ARCH_PPC
    return "powerpc";
#elif BOOST_ARCH_RISCV
    return "riscv";
#else
    return "unknown";
#endif
}

Sidecar build(const container::Header& header, const BuildOptions& options) {
    Sidecar s;
    s.format = FORMAT_ID;

    s.payload.size = header.payloadSize;
    s.payload.hash = prefixedHash(header.payloadHash);
    s.payload.compressionRatio = compressionRatio(header.payloadSize, header.archiveSize);
    s.payload.files = options.files;
    s.payload.directories = options.directories;

    s.archive.size = header.archiveSize;
    s.archive.hash = prefixedHash(header.archiveHash);
    s.archive.compressedWith = BLOCK_ALGORITHM;
    s.archive.decompressedWith = container::decompressionModeName(header.decompressionMode);
    s.archive.compressionLevel = header.compressionLevel;
    s.archive.threads = header.workersUsed;
    s.archive.chunkSize = options.chunkSize;

    s.cryptography.algorithm = HASH_ALGORITHM;
    s.cryptography.payloadDigest = hashing::toHex(header.payloadHash);
    s.cryptography.archiveDigest = hashing::toHex(header.archiveHash);

    s.metadata.created = rfc3339(header.timestamp);
    s.metadata.creator = std::string(GLIFZIP_PROGRAM_NAME) + " " + GLIFZIP_VERSION;
    s.metadata.sourcePlatform = sourcePlatform();
    s.metadata.sourceArchitecture = sourceArchitecture();
    s.metadata.deterministic = options.deterministic;
    return s;
}

std::string Sidecar::toJson() const {
    json root;
    root["format"] = format;

    json p;
    p["size"] = payload.size;
    p["hash"] = payload.hash;
    p["compression_ratio"] = payload.compressionRatio;
    if (payload.files) p["files"] = *payload.files;
    if (payload.directories) p["directories"] = *payload.directories;
    root["payload"] = p;

    json a;
    a["size"] = archive.size;
    a["hash"] = archive.hash;
    a["compressed_with"] = archive.compressedWith;
    a["decompressed_with"] = archive.decompressedWith;
    a["compression_level"] = archive.compressionLevel;
    a["threads"] = archive.threads;
    a["chunk_size"] = archive.chunkSize;
    root["archive"] = a;

    json c;
    c["algorithm"] = cryptography.algorithm;
    c["payload_digest"] = cryptography.payloadDigest;
    c["archive_digest"] = cryptography.archiveDigest;
    if (cryptography.signature) c["signature"] = *cryptography.signature;
    root["cryptography"] = c;

    json m;
    m["created"] = metadata.created;
    m["creator"] = metadata.creator;
    m["source_platform"] = metadata.sourcePlatform;
    m["source_architecture"] = metadata.sourceArchitecture;
    m["deterministic"] = metadata.deterministic;
    root["metadata"] = m;

    return root.dump(2);
}

Sidecar Sidecar::fromJson(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw glifzip::FormatError(std::string("Malformed sidecar JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw glifzip::FormatError("Sidecar JSON is not an object");
    }

    Sidecar s;
    s.format = required<std::string>(root, "root", "format");

    const json& p = section(root, "payload");
    s.payload.size = required<uint64_t>(p, "payload", "size");
    s.payload.hash = required<std::string>(p, "payload", "hash");
    s.payload.compressionRatio = required<double>(p, "payload", "compression_ratio");
    s.payload.files = optionalField<uint64_t>(p, "payload", "files");
    s.payload.directories = optionalField<uint64_t>(p, "payload", "directories");

    const json& a = section(root, "archive");
    s.archive.size = required<uint64_t>(a, "archive", "size");
    s.archive.hash = required<std::string>(a, "archive", "hash");
    s.archive.compressedWith = required<std::string>(a, "archive", "compressed_with");
    s.archive.decompressedWith = required<std::string>(a, "archive", "decompressed_with");
    s.archive.compressionLevel = required<uint32_t>(a, "archive", "compression_level");
    s.archive.threads = required<uint32_t>(a, "archive", "threads");
    s.archive.chunkSize = required<uint64_t>(a, "archive", "chunk_size");

    const json& c = section(root, "cryptography");
    s.cryptography.algorithm = required<std::string>(c, "cryptography", "algorithm");
    s.cryptography.payloadDigest = required<std::string>(c, "cryptography", "payload_digest");
    s.cryptography.archiveDigest = required<std::string>(c, "cryptography", "archive_digest");
    s.cryptography.signature = optionalField<std::string>(c, "cryptography", "signature");

    const json& m = section(root, "metadata");
    s.metadata.created = required<std::string>(m, "metadata", "created");
    s.metadata.creator = required<std::string>(m, "metadata", "creator");
    s.metadata.sourcePlatform = required<std::string>(m, "metadata", "source_platform");
    s.metadata.sourceArchitecture = required<std::string>(m, "metadata", "source_architecture");
    s.metadata.deterministic = required<bool>(m, "metadata", "deterministic");
    return s;
}

std::vector<uint8_t> Sidecar::encode() const {
    std::string text = toJson();
    if (text.size() > std::numeric_limits<uint16_t>::max()) {
        throw glifzip::FormatError("Sidecar too large: " + std::to_string(text.size()) + " bytes");
    }
    return std::vector<uint8_t>(text.begin(), text.end());
}

Sidecar Sidecar::decode(const uint8_t* data, size_t size) {
    return fromJson(std::string(reinterpret_cast<const char*>(data), size));
}

void Sidecar::checkConsistency(const container::Header& header) const {
    expectEqual<std::string>("format", format, FORMAT_ID);

    expectEqual("payload.size", payload.size, header.payloadSize);
    expectEqual("payload.hash", payload.hash, prefixedHash(header.payloadHash));
    double ratio = compressionRatio(header.payloadSize, header.archiveSize);
    if (std::fabs(payload.compressionRatio - ratio) > 1e-9 * std::max(1.0, ratio)) {
        mismatch("payload.compression_ratio", fmt::format("{}", payload.compressionRatio), fmt::format("{}", ratio));
    }

    expectEqual("archive.size", archive.size, header.archiveSize);
    expectEqual("archive.hash", archive.hash, prefixedHash(header.archiveHash));
    expectEqual<std::string>("archive.compressed_with", archive.compressedWith, BLOCK_ALGORITHM);
    expectEqual<std::string>("archive.decompressed_with", archive.decompressedWith,
                             container::decompressionModeName(header.decompressionMode));
    expectEqual("archive.compression_level", archive.compressionLevel, header.compressionLevel);
    expectEqual("archive.threads", archive.threads, header.workersUsed);

    expectEqual<std::string>("cryptography.algorithm", cryptography.algorithm, HASH_ALGORITHM);
    expectEqual("cryptography.payload_digest", cryptography.payloadDigest, hashing::toHex(header.payloadHash));
    expectEqual("cryptography.archive_digest", cryptography.archiveDigest, hashing::toHex(header.archiveHash));

    expectEqual("metadata.created", metadata.created, rfc3339(header.timestamp));
}

} // namespace sidecar
