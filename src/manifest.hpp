#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace manifest {

constexpr uint32_t MANIFEST_VERSION = 1;
// Length prefix of a directory payload
constexpr size_t LENGTH_PREFIX_SIZE = 8;
constexpr uint64_t MAX_MANIFEST_SIZE = 100ULL * 1024 * 1024;

enum class FileType {
    Regular,
    Directory,
    Symlink
};

const char* fileTypeName(FileType type);

// Throws glifzip::FormatError on an unknown name
FileType parseFileType(const std::string& name);

/**
 * @brief One filesystem object stored in a directory archive
 *
 * Only regular files own bytes in the blob, at [dataOffset, dataOffset + size).
 */
struct FileEntry {
    std::string path;                       // relative, '/' separated
    FileType type = FileType::Regular;
    uint64_t size = 0;
    uint32_t mode = 0;
    uint32_t uid = 0;
    uint32_t gid = 0;
    int64_t mtime = 0;                      // seconds since epoch
    int64_t atime = 0;
    std::optional<std::string> symlinkTarget;
    uint64_t dataOffset = 0;
    std::string sha256;                     // hex, empty unless Regular

    /**
     * @brief Compare the content hash against the stored one
     *
     * @throws glifzip::HashMismatchError
     */
    void verifyIntegrity(const uint8_t* data, size_t size) const;
};

struct Manifest {
    uint32_t version = MANIFEST_VERSION;
    std::vector<FileEntry> entries;
    std::string createdAt;
    std::string creator;
    std::string baseDirectory;

    void addEntry(FileEntry entry);

    uint64_t fileCount() const;
    uint64_t directoryCount() const;
    // Sum of regular file sizes
    uint64_t totalSize() const;

    const FileEntry* find(const std::string& path) const;

    // One "<type> <size> <path>" line per entry
    std::vector<std::string> listing() const;

    std::string toJson() const;
    static Manifest fromJson(const std::string& json);
};

/**
 * @brief [u64 BE manifest length][manifest JSON][blob]
 */
std::vector<uint8_t> buildPayload(const Manifest& manifest, const std::vector<uint8_t>& blob);

struct ParsedPayload {
    Manifest manifest;
    const uint8_t* blob;     // points into the parsed buffer
    size_t blobSize;
};

/**
 * @brief Split a directory payload into its manifest and content blob
 *
 * @throws glifzip::FormatError on truncation, a manifest above
 *         MAX_MANIFEST_SIZE, malformed JSON, or entries whose byte ranges
 *         overlap, go backwards, or leave the blob
 */
ParsedPayload parsePayload(const uint8_t* data, size_t size);

inline ParsedPayload parsePayload(const std::vector<uint8_t>& data) {
    return parsePayload(data.data(), data.size());
}

} // namespace manifest
