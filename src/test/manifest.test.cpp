#include <boost/test/unit_test.hpp>

#include "../byte_io.hpp"
#include "../errors.hpp"
#include "../hashing.hpp"
#include "../manifest.hpp"
#include "test_helpers.hpp"

namespace {

manifest::FileEntry regular(const std::string& path, const std::vector<uint8_t>& blob,
                            uint64_t offset, uint64_t size) {
    manifest::FileEntry e;
    e.path = path;
    e.type = manifest::FileType::Regular;
    e.size = size;
    e.mode = 0644;
    e.uid = 1000;
    e.gid = 1000;
    e.mtime = 1700000000;
    e.atime = 1700000001;
    e.dataOffset = offset;
    e.sha256 = hashing::toHex(hashing::sha256(blob.data() + offset, size));
    return e;
}

struct TreeFixture {
    std::vector<uint8_t> blob = testutil::bytesOf("hello worldsecond file");
    manifest::Manifest m;

    TreeFixture() {
        m.createdAt = "1970-01-01T00:00:00Z";
        m.creator = "glifzip test";
        m.baseDirectory = "project";

        manifest::FileEntry dir;
        dir.path = "docs";
        dir.type = manifest::FileType::Directory;
        dir.mode = 0755;
        m.addEntry(dir);
        m.addEntry(regular("docs/a.txt", blob, 0, 11));
        m.addEntry(regular("b.txt", blob, 11, 11));

        manifest::FileEntry link;
        link.path = "latest";
        link.type = manifest::FileType::Symlink;
        link.symlinkTarget = "docs/a.txt";
        m.addEntry(link);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(ManifestTests, TreeFixture)

BOOST_AUTO_TEST_CASE(test_counts) {
    BOOST_TEST(m.fileCount() == 2u);
    BOOST_TEST(m.directoryCount() == 1u);
    BOOST_TEST(m.totalSize() == 22u);
    BOOST_REQUIRE(m.find("b.txt") != nullptr);
    BOOST_TEST(m.find("b.txt")->dataOffset == 11u);
    BOOST_TEST(!m.find("missing"));

    auto lines = m.listing();
    BOOST_REQUIRE(lines.size() == 4u);
    BOOST_TEST(lines[0].front() == 'd');
    BOOST_TEST(lines[3] == "l          0 latest -> docs/a.txt");
}

BOOST_AUTO_TEST_CASE(test_payload_layout) {
    auto payload = manifest::buildPayload(m, blob);
    byteio::ByteReader reader(payload.data(), payload.size());
    uint64_t jsonSize = reader.u64();
    BOOST_TEST(payload.size() == manifest::LENGTH_PREFIX_SIZE + jsonSize + blob.size());

    manifest::ParsedPayload parsed = manifest::parsePayload(payload);
    BOOST_TEST(parsed.blobSize == blob.size());
    BOOST_TEST(std::vector<uint8_t>(parsed.blob, parsed.blob + parsed.blobSize) == blob);
    BOOST_REQUIRE(parsed.manifest.entries.size() == 4u);
    BOOST_TEST(parsed.manifest.baseDirectory == "project");

    const manifest::FileEntry* a = parsed.manifest.find("docs/a.txt");
    BOOST_REQUIRE(a != nullptr);
    BOOST_TEST(a->mode == 0644u);
    BOOST_TEST(a->mtime == 1700000000);
    BOOST_TEST(*parsed.manifest.find("latest")->symlinkTarget == "docs/a.txt");
    BOOST_CHECK_NO_THROW(a->verifyIntegrity(parsed.blob + a->dataOffset, a->size));
}

BOOST_AUTO_TEST_CASE(test_integrity_mismatch) {
    const manifest::FileEntry* a = m.find("docs/a.txt");
    auto tampered = blob;
    tampered[0] = 'H';
    BOOST_CHECK_THROW(a->verifyIntegrity(tampered.data(), a->size), glifzip::HashMismatchError);
    BOOST_CHECK_THROW(a->verifyIntegrity(blob.data(), a->size - 1), glifzip::SizeMismatchError);
}

BOOST_AUTO_TEST_CASE(test_rejects_bad_offsets) {
    manifest::Manifest overlapping = m;
    overlapping.entries[2].dataOffset = 5;
    BOOST_CHECK_THROW(manifest::parsePayload(manifest::buildPayload(overlapping, blob)), glifzip::FormatError);

    manifest::Manifest beyond = m;
    beyond.entries[2].size = 12;
    BOOST_CHECK_THROW(manifest::parsePayload(manifest::buildPayload(beyond, blob)), glifzip::FormatError);
}

BOOST_AUTO_TEST_CASE(test_rejects_truncation_and_oversize) {
    auto payload = manifest::buildPayload(m, blob);
    BOOST_CHECK_THROW(manifest::parsePayload(payload.data(), 4), glifzip::FormatError);
    BOOST_CHECK_THROW(manifest::parsePayload(payload.data(), 40), glifzip::FormatError);

    std::vector<uint8_t> huge;
    byteio::ByteWriter writer(huge);
    writer.u64(manifest::MAX_MANIFEST_SIZE + 1);
    BOOST_CHECK_THROW(manifest::parsePayload(huge), glifzip::FormatError);

    std::vector<uint8_t> notJson;
    byteio::ByteWriter w2(notJson);
    w2.u64(3);
    w2.bytes(reinterpret_cast<const uint8_t*>("abc"), 3);
    BOOST_CHECK_THROW(manifest::parsePayload(notJson), glifzip::FormatError);
}

BOOST_AUTO_TEST_CASE(test_file_type_names) {
    BOOST_TEST((manifest::parseFileType("symlink") == manifest::FileType::Symlink));
    BOOST_CHECK_THROW(manifest::parseFileType("fifo"), glifzip::FormatError);
}

BOOST_AUTO_TEST_SUITE_END()
