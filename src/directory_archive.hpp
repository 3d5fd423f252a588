#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "manifest.hpp"

// Filesystem side of directory archives: turns a tree into a manifest plus
// content blob and back. The archive core only ever sees the payload bytes.
namespace dirarchive {

struct CollectedTree {
    manifest::Manifest manifest;
    std::vector<uint8_t> blob;
};

/**
 * @brief Walk root in sorted order without following symlinks
 *
 * Regular file contents are appended to the blob in walk order. Entry paths
 * are relative to root and use '/' separators.
 *
 * @param createdAt Value stored as the manifest creation time
 * @throws glifzip::IOError when root is not a directory or an entry cannot be read
 */
CollectedTree collect(const std::string& root, const std::string& createdAt);

// collect() followed by manifest::buildPayload()
std::vector<uint8_t> buildPayload(const std::string& root, const std::string& createdAt);

/**
 * @brief Recreate every entry of a parsed payload below outputDir
 *
 * File contents are checked against their recorded SHA-256 before being
 * written. Permissions and modification times are restored; ownership is not.
 *
 * @throws glifzip::FormatError for entry paths that would leave outputDir,
 * including paths that pass through a symlink
 * @throws glifzip::HashMismatchError, glifzip::IOError
 * @return Number of entries written
 */
size_t extract(const manifest::ParsedPayload& payload, const std::string& outputDir);

/**
 * @brief Whether an archive's sidecar marks its payload as a directory tree
 *
 * The sidecar is advisory. An unreadable sidecar is logged and the payload
 * is treated as a single file.
 */
bool isDirectoryArchive(const std::vector<uint8_t>& archive);

// True for a non-empty relative path without "." or ".." components
bool isSafeRelativePath(const std::string& path);

} // namespace dirarchive
