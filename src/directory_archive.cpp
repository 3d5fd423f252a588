#include "directory_archive.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "logging.hpp"
#include "pipeline.hpp"
#include "sidecar.hpp"
#include "version.hpp"

#include <boost/filesystem.hpp>

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>

namespace fs = boost::filesystem;

namespace dirarchive {

namespace {

struct stat lstatOrThrow(const fs::path& path) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        throw glifzip::IOError("Cannot stat " + path.string() + ": " + std::strerror(errno));
    }
    return st;
}

manifest::FileEntry describe(const fs::path& path, const std::string& relative) {
    struct stat st = lstatOrThrow(path);

    manifest::FileEntry entry;
    entry.path = relative;
    entry.mode = static_cast<uint32_t>(st.st_mode & 07777);
    entry.uid = static_cast<uint32_t>(st.st_uid);
    entry.gid = static_cast<uint32_t>(st.st_gid);
    entry.mtime = static_cast<int64_t>(st.st_mtime);
    entry.atime = static_cast<int64_t>(st.st_atime);

    if (S_ISLNK(st.st_mode)) {
        entry.type = manifest::FileType::Symlink;
        boost::system::error_code ec;
        fs::path target = fs::read_symlink(path, ec);
        if (ec) {
            throw glifzip::IOError("Cannot read symlink " + path.string() + ": " + ec.message());
        }
        entry.symlinkTarget = target.generic_string();
    } else if (S_ISDIR(st.st_mode)) {
        entry.type = manifest::FileType::Directory;
    } else if (S_ISREG(st.st_mode)) {
        entry.type = manifest::FileType::Regular;
        entry.size = static_cast<uint64_t>(st.st_size);
    } else {
        throw glifzip::IOError("Unsupported file type: " + path.string());
    }
    return entry;
}

void walk(const fs::path& dir, const std::string& prefix, CollectedTree& tree) {
    std::vector<fs::path> children;
    boost::system::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; it != end; it.increment(ec)) {
        if (ec) break;
        children.push_back(it->path());
    }
    if (ec) {
        throw glifzip::IOError("Cannot list " + dir.string() + ": " + ec.message());
    }
    std::sort(children.begin(), children.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename().string() < b.filename().string(); });

    for (const fs::path& child : children) {
        std::string relative = prefix.empty() ? child.filename().string()
                                              : prefix + "/" + child.filename().string();
        manifest::FileEntry entry = describe(child, relative);

        if (entry.type == manifest::FileType::Regular) {
            std::vector<uint8_t> content = glifzip::readFile(child.string());
            if (content.size() != entry.size) {
                throw glifzip::IOError(child.string() + " changed size while being read");
            }
            entry.dataOffset = tree.blob.size();
            entry.sha256 = hashing::toHex(hashing::sha256(content));
            tree.blob.insert(tree.blob.end(), content.begin(), content.end());
        }

        bool recurse = entry.type == manifest::FileType::Directory;
        tree.manifest.addEntry(std::move(entry));
        if (recurse) {
            walk(child, relative, tree);
        }
    }
}

void restoreMetadata(const fs::path& path, const manifest::FileEntry& entry) {
    boost::system::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(entry.mode & 07777), ec);
    if (ec) {
        throw glifzip::IOError("Cannot set permissions on " + path.string() + ": " + ec.message());
    }
    fs::last_write_time(path, static_cast<std::time_t>(entry.mtime), ec);
    if (ec) {
        throw glifzip::IOError("Cannot set mtime on " + path.string() + ": " + ec.message());
    }
}

// Entries are never written through a symlink, whether extracted earlier or already on disk
void checkNoSymlinkInPath(const fs::path& base, const manifest::FileEntry& entry) {
    fs::path current = base;
    const fs::path relative(entry.path);
    for (auto it = relative.begin(); it != relative.end(); ++it) {
        current /= *it;
        bool last = std::next(it) == relative.end();
        boost::system::error_code ec;
        fs::file_status status = fs::symlink_status(current, ec);
        if (ec || !fs::exists(status)) return;
        if (fs::is_symlink(status) && !(last && entry.type == manifest::FileType::Symlink)) {
            logging::err("Refusing to extract {} through symlink {}", entry.path, current.string());
            throw glifzip::FormatError("Entry " + entry.path + " passes through symlink " + current.string());
        }
        if (last && entry.type == manifest::FileType::Symlink && fs::is_directory(status)) {
            throw glifzip::FormatError("Symlink entry " + entry.path + " would replace a directory");
        }
    }
}

} // namespace

bool isDirectoryArchive(const std::vector<uint8_t>& archive) {
    try {
        container::Header header = container::readHeader(archive);
        container::Region region = container::readSidecar(archive.data(), archive.size(), header);
        return sidecar::Sidecar::decode(region.data, region.size).payload.files.has_value();
    } catch (const glifzip::FormatError& e) {
        logging::warn("Ignoring unreadable sidecar, extracting as a single file: {}", e.what());
        return false;
    }
}

bool isSafeRelativePath(const std::string& path) {
    if (path.empty() || path.front() == '/') return false;
    fs::path p(path);
    for (const fs::path& part : p) {
        if (part == ".." || part == "." || part.empty()) return false;
    }
    return true;
}

CollectedTree collect(const std::string& root, const std::string& createdAt) {
    boost::system::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw glifzip::IOError("Not a directory: " + root);
    }

    CollectedTree tree;
    tree.manifest.createdAt = createdAt;
    tree.manifest.creator = std::string(GLIFZIP_PROGRAM_NAME) + " " + GLIFZIP_VERSION;
    tree.manifest.baseDirectory = fs::path(root).filename().string();
    walk(fs::path(root), "", tree);

    logging::info("Collected {} files, {} directories, {} bytes from {}",
                  tree.manifest.fileCount(), tree.manifest.directoryCount(),
                  tree.manifest.totalSize(), root);
    return tree;
}

std::vector<uint8_t> buildPayload(const std::string& root, const std::string& createdAt) {
    CollectedTree tree = collect(root, createdAt);
    return manifest::buildPayload(tree.manifest, tree.blob);
}

size_t extract(const manifest::ParsedPayload& payload, const std::string& outputDir) {
    const fs::path base(outputDir);
    boost::system::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        throw glifzip::IOError("Cannot create " + outputDir + ": " + ec.message());
    }

    for (const auto& entry : payload.manifest.entries) {
        if (!isSafeRelativePath(entry.path)) {
            logging::err("Refusing to extract entry with unsafe path: {}", entry.path);
            throw glifzip::FormatError("Unsafe entry path: " + entry.path);
        }
    }

    std::vector<const manifest::FileEntry*> directories;
    for (const auto& entry : payload.manifest.entries) {
        fs::path target = base / entry.path;
        checkNoSymlinkInPath(base, entry);
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw glifzip::IOError("Cannot create " + target.parent_path().string() + ": " + ec.message());
        }

        switch (entry.type) {
            case manifest::FileType::Directory:
                fs::create_directories(target, ec);
                if (ec) {
                    throw glifzip::IOError("Cannot create " + target.string() + ": " + ec.message());
                }
                directories.push_back(&entry);
                break;

            case manifest::FileType::Regular: {
                const uint8_t* data = payload.blob + entry.dataOffset;
                entry.verifyIntegrity(data, static_cast<size_t>(entry.size));
                glifzip::writeFile(target.string(), std::vector<uint8_t>(data, data + entry.size));
                restoreMetadata(target, entry);
                break;
            }

            case manifest::FileType::Symlink:
                if (!entry.symlinkTarget) {
                    throw glifzip::FormatError("Symlink entry without target: " + entry.path);
                }
                fs::remove(target, ec);
                fs::create_symlink(fs::path(*entry.symlinkTarget), target, ec);
                if (ec) {
                    throw glifzip::IOError("Cannot create symlink " + target.string() + ": " + ec.message());
                }
                break;
        }
        logging::debug("Extracted {} {}", manifest::fileTypeName(entry.type), entry.path);
    }

    // Deepest directories first so restoring a child does not touch a parent's mtime
    std::reverse(directories.begin(), directories.end());
    for (const auto* entry : directories) {
        checkNoSymlinkInPath(base, *entry);
        restoreMetadata(base / entry->path, *entry);
    }

    logging::info("Extracted {} entries to {}", payload.manifest.entries.size(), outputDir);
    return payload.manifest.entries.size();
}

} // namespace dirarchive
