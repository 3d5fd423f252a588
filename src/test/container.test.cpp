#include <boost/test/unit_test.hpp>

#include "../byte_io.hpp"
#include "../container.hpp"
#include "../errors.hpp"
#include "test_helpers.hpp"

namespace {

container::Header sampleHeader(uint64_t archiveSize, uint16_t sidecarSize) {
    container::Header header;
    header.payloadSize = 123456;
    header.archiveSize = archiveSize;
    header.payloadHash = hashing::sha256(testutil::bytesOf("payload"));
    header.archiveHash = hashing::sha256(testutil::bytesOf("archive"));
    header.compressionLevel = 8;
    header.decompressionMode = container::DecompressionMode::BlockOnly;
    header.workersUsed = 4;
    header.timestamp = 1700000000;
    header.sidecarSize = sidecarSize;
    return header;
}

} // namespace

BOOST_AUTO_TEST_SUITE(ContainerTests)

BOOST_AUTO_TEST_CASE(test_header_layout) {
    container::Header header = sampleHeader(10, 0);
    auto bytes = container::encodeHeader(header);
    BOOST_REQUIRE(bytes.size() == container::HEADER_SIZE);

    BOOST_TEST(std::string(bytes.begin(), bytes.begin() + 6) == "GLIF01");
    byteio::ByteReader reader(bytes.data(), bytes.size());
    reader.skip(6);
    BOOST_TEST(reader.u32() == container::VERSION);
    BOOST_TEST(reader.u64() == 123456u);
    BOOST_TEST(reader.u64() == 10u);
    reader.skip(64);
    BOOST_TEST(reader.u32() == 8u);
    BOOST_TEST(reader.u32() == 1u);
    BOOST_TEST(reader.u32() == 4u);
    BOOST_TEST(reader.u64() == 1700000000u);
    BOOST_TEST(reader.u16() == 0u);
    BOOST_TEST(reader.position() == container::CHECKSUM_OFFSET);
    BOOST_TEST(reader.u32() == container::headerChecksum(bytes.data()));

    // Big-endian on every platform
    BOOST_TEST(bytes[10 + 7] == 0x40);
    BOOST_TEST(bytes[10 + 6] == 0xE2);
    BOOST_TEST(bytes[10 + 5] == 0x01);
}

BOOST_AUTO_TEST_CASE(test_write_and_read_regions) {
    auto sidecar = testutil::bytesOf("{\"k\":1}");
    auto payload = testutil::randomBytes(64);
    container::Header header = sampleHeader(payload.size(), static_cast<uint16_t>(sidecar.size()));

    auto archive = container::write(header, sidecar, payload);
    BOOST_TEST(archive.size() == container::HEADER_SIZE + sidecar.size() + payload.size());
    BOOST_TEST((container::readHeader(archive) == header));

    auto sidecarRegion = container::readSidecar(archive.data(), archive.size(), header);
    BOOST_TEST(std::vector<uint8_t>(sidecarRegion.data, sidecarRegion.data + sidecarRegion.size) == sidecar);
    auto payloadRegion = container::readPayload(archive.data(), archive.size(), header);
    BOOST_TEST(std::vector<uint8_t>(payloadRegion.data, payloadRegion.data + payloadRegion.size) == payload);
}

BOOST_AUTO_TEST_CASE(test_write_checks_declared_sizes) {
    auto payload = testutil::randomBytes(64);
    BOOST_CHECK_THROW(container::write(sampleHeader(63, 0), {}, payload), glifzip::FormatError);
    BOOST_CHECK_THROW(container::write(sampleHeader(64, 3), {}, payload), glifzip::FormatError);
}

BOOST_AUTO_TEST_CASE(test_header_rejection_order) {
    auto payload = testutil::randomBytes(16);
    auto archive = container::write(sampleHeader(payload.size(), 0), {}, payload);

    BOOST_CHECK_THROW(container::readHeader(archive.data(), 115), glifzip::FormatError);

    auto badMagic = archive;
    badMagic[0] = 'X';
    BOOST_CHECK_THROW(container::readHeader(badMagic), glifzip::FormatError);

    auto badVersion = archive;
    badVersion[9] = 0x02;
    BOOST_CHECK_THROW(container::readHeader(badVersion), glifzip::FormatError);

    for (size_t offset : {10u, 30u, 89u, 90u, 100u, 111u, 113u}) {
        auto damaged = archive;
        damaged[offset] ^= 0x10;
        BOOST_CHECK_THROW(container::readHeader(damaged), glifzip::HeaderChecksumError);
    }
}

BOOST_AUTO_TEST_CASE(test_unknown_mode_is_format_error) {
    auto payload = testutil::randomBytes(16);
    auto archive = container::write(sampleHeader(payload.size(), 0), {}, payload);

    // Valid checksum around an invalid mode
    archive[97] = 7;
    std::vector<uint8_t> checksum;
    byteio::ByteWriter writer(checksum);
    writer.u32(container::headerChecksum(archive.data()));
    std::copy(checksum.begin(), checksum.end(), archive.begin() + container::CHECKSUM_OFFSET);

    BOOST_CHECK_THROW(container::readHeader(archive), glifzip::FormatError);
    BOOST_CHECK_THROW(container::parseDecompressionMode(2), glifzip::FormatError);
    BOOST_TEST((container::parseDecompressionMode(0) == container::DecompressionMode::FastWrap));
}

BOOST_AUTO_TEST_CASE(test_region_bounds) {
    auto sidecar = testutil::bytesOf("sidecar");
    auto payload = testutil::randomBytes(40);
    container::Header header = sampleHeader(payload.size(), static_cast<uint16_t>(sidecar.size()));
    auto archive = container::write(header, sidecar, payload);

    BOOST_CHECK_THROW(container::readPayload(archive.data(), archive.size() - 1, header),
                      glifzip::SizeMismatchError);
    archive.push_back(0);
    BOOST_CHECK_THROW(container::readPayload(archive.data(), archive.size(), header),
                      glifzip::SizeMismatchError);
    BOOST_CHECK_THROW(container::readSidecar(archive.data(), container::HEADER_SIZE + 2, header),
                      glifzip::FormatError);
}

BOOST_AUTO_TEST_SUITE_END()
