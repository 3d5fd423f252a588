#include "manifest.hpp"
#include "byte_io.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace manifest {

using json = nlohmann::ordered_json;

const char* fileTypeName(FileType type) {
    switch (type) {
        case FileType::Regular:   return "regular";
        case FileType::Directory: return "directory";
        case FileType::Symlink:   return "symlink";
    }
    return "unknown";
}

FileType parseFileType(const std::string& name) {
    if (name == "regular") return FileType::Regular;
    if (name == "directory") return FileType::Directory;
    if (name == "symlink") return FileType::Symlink;
    throw glifzip::FormatError("Unknown manifest entry type: " + name);
}

void FileEntry::verifyIntegrity(const uint8_t* data, size_t length) const {
    if (type != FileType::Regular) return;
    if (length != size) {
        throw glifzip::SizeMismatchError(path, size, length);
    }
    hashing::verifyDigest(data, length, hashing::digestFromHex(sha256), path);
}

void Manifest::addEntry(FileEntry entry) {
    entries.push_back(std::move(entry));
}

uint64_t Manifest::fileCount() const {
    return std::count_if(entries.begin(), entries.end(),
                         [](const FileEntry& e) { return e.type == FileType::Regular; });
}

uint64_t Manifest::directoryCount() const {
    return std::count_if(entries.begin(), entries.end(),
                         [](const FileEntry& e) { return e.type == FileType::Directory; });
}

uint64_t Manifest::totalSize() const {
    uint64_t total = 0;
    for (const auto& e : entries) {
        if (e.type == FileType::Regular) total += e.size;
    }
    return total;
}

const FileEntry* Manifest::find(const std::string& path) const {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const FileEntry& e) { return e.path == path; });
    return it == entries.end() ? nullptr : &*it;
}

std::vector<std::string> Manifest::listing() const {
    std::vector<std::string> lines;
    lines.reserve(entries.size());
    for (const auto& e : entries) {
        char tag = e.type == FileType::Directory ? 'd' : (e.type == FileType::Symlink ? 'l' : 'f');
        std::string line = fmt::format("{} {:>10} {}", tag, e.size, e.path);
        if (e.symlinkTarget) line += " -> " + *e.symlinkTarget;
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string Manifest::toJson() const {
    json root;
    root["version"] = version;
    root["file_count"] = fileCount();
    root["total_size"] = totalSize();

    json list = json::array();
    for (const auto& e : entries) {
        json item;
        item["path"] = e.path;
        item["file_type"] = fileTypeName(e.type);
        item["size"] = e.size;
        item["mode"] = e.mode;
        item["uid"] = e.uid;
        item["gid"] = e.gid;
        item["mtime"] = e.mtime;
        item["atime"] = e.atime;
        item["symlink_target"] = e.symlinkTarget ? json(*e.symlinkTarget) : json(nullptr);
        item["data_offset"] = e.dataOffset;
        item["sha256"] = e.sha256;
        list.push_back(std::move(item));
    }
    root["entries"] = std::move(list);
    root["created_at"] = createdAt;
    root["creator"] = creator;
    root["base_directory"] = baseDirectory;
    return root.dump(2);
}

Manifest Manifest::fromJson(const std::string& text) {
    Manifest m;
    try {
        json root = json::parse(text);
        m.version = root.at("version").get<uint32_t>();
        if (m.version != MANIFEST_VERSION) {
            throw glifzip::FormatError("Unsupported manifest version: " + std::to_string(m.version));
        }
        for (const auto& item : root.at("entries")) {
            FileEntry e;
            e.path = item.at("path").get<std::string>();
            e.type = parseFileType(item.at("file_type").get<std::string>());
            e.size = item.at("size").get<uint64_t>();
            e.mode = item.at("mode").get<uint32_t>();
            e.uid = item.at("uid").get<uint32_t>();
            e.gid = item.at("gid").get<uint32_t>();
            e.mtime = item.at("mtime").get<int64_t>();
            e.atime = item.at("atime").get<int64_t>();
            if (item.contains("symlink_target") && !item.at("symlink_target").is_null()) {
                e.symlinkTarget = item.at("symlink_target").get<std::string>();
            }
            e.dataOffset = item.at("data_offset").get<uint64_t>();
            e.sha256 = item.at("sha256").get<std::string>();
            m.entries.push_back(std::move(e));
        }
        m.createdAt = root.at("created_at").get<std::string>();
        m.creator = root.at("creator").get<std::string>();
        m.baseDirectory = root.at("base_directory").get<std::string>();
    } catch (const json::exception& e) {
        throw glifzip::FormatError(std::string("Malformed manifest: ") + e.what());
    }
    return m;
}

std::vector<uint8_t> buildPayload(const Manifest& manifest, const std::vector<uint8_t>& blob) {
    std::string text = manifest.toJson();
    std::vector<uint8_t> out;
    out.reserve(LENGTH_PREFIX_SIZE + text.size() + blob.size());
    byteio::ByteWriter writer(out);
    writer.u64(text.size());
    writer.bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    writer.bytes(blob.data(), blob.size());
    return out;
}

namespace {

void checkOffsets(const Manifest& manifest, size_t blobSize) {
    uint64_t previousEnd = 0;
    for (const auto& e : manifest.entries) {
        if (e.type != FileType::Regular) continue;
        if (e.dataOffset < previousEnd) {
            logging::err("Manifest entry {} starts at {}, before the previous entry ends at {}",
                         e.path, e.dataOffset, previousEnd);
            throw glifzip::FormatError("Manifest entry " + e.path + " overlaps the previous entry");
        }
        if (e.dataOffset > blobSize || e.size > blobSize - e.dataOffset) {
            logging::err("Manifest entry {} ([{}, +{})) exceeds the {} byte blob",
                         e.path, e.dataOffset, e.size, blobSize);
            throw glifzip::FormatError("Manifest entry " + e.path + " extends past the content blob");
        }
        previousEnd = e.dataOffset + e.size;
    }
}

} // namespace

ParsedPayload parsePayload(const uint8_t* data, size_t size) {
    if (size < LENGTH_PREFIX_SIZE) {
        throw glifzip::FormatError("Directory payload too small: " + std::to_string(size) + " bytes");
    }
    byteio::ByteReader reader(data, size);
    uint64_t manifestSize = reader.u64();
    if (manifestSize > MAX_MANIFEST_SIZE) {
        throw glifzip::FormatError("Manifest too large: " + std::to_string(manifestSize) + " bytes");
    }
    if (manifestSize > reader.remaining()) {
        throw glifzip::FormatError("Directory payload truncated inside manifest");
    }

    std::string text(reinterpret_cast<const char*>(reader.current()), manifestSize);
    reader.skip(manifestSize);

    ParsedPayload parsed{Manifest::fromJson(text), reader.current(), reader.remaining()};
    checkOffsets(parsed.manifest, parsed.blobSize);
    return parsed;
}

} // namespace manifest
