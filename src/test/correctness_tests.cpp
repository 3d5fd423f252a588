/**
 * @file correctness_tests.cpp
 * @brief End-to-end properties of the GLIF compress / decompress / verify pipeline
 *
 * Tests cover:
 * 1. Round trips, including the empty payload and both decompression modes
 * 2. Determinism across runs and worker counts
 * 3. Tamper detection and header rejection
 * 4. Verification that never decompresses
 * 5. Compressibility scenarios (tiny, zero-filled, random input)
 */

#define BOOST_TEST_MODULE GlifzipCorrectnessTests
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <set>

#include "../errors.hpp"
#include "../logging.hpp"
#include "../pipeline.hpp"
#include "test_helpers.hpp"

namespace {

struct QuietLogging {
    QuietLogging() {
        logging::initSpdlog();
        logging::setLoggingLevel(logging::LogLevel::QUIET);
    }
};

glifzip::CompressionConfig testConfig(int workers, bool fastUnwrap = true, size_t chunkSize = 64 * 1024) {
    glifzip::CompressionConfig config;
    config.workers = workers;
    config.useFastUnwrap = fastUnwrap;
    config.chunkSize = chunkSize;
    return config;
}

size_t payloadOffset(const std::vector<uint8_t>& archive) {
    container::Header header = container::readHeader(archive);
    return container::HEADER_SIZE + header.sidecarSize;
}

} // namespace

BOOST_GLOBAL_FIXTURE(QuietLogging);

// ============================================================================
// TEST SUITE 1: Round trips
// ============================================================================

BOOST_AUTO_TEST_SUITE(RoundTripTests)

BOOST_AUTO_TEST_CASE(test_scenario_hello) {
    auto payload = testutil::bytesOf("Hello, GLifzip!");
    BOOST_REQUIRE(payload.size() == 15u);

    auto archive = glifzip::compress(payload, testConfig(4));
    BOOST_TEST(glifzip::decompress(archive, 4) == payload);

    container::Header header = container::readHeader(archive);
    BOOST_TEST(header.payloadSize == 15u);
    BOOST_TEST(header.compressionLevel == 8u);
    // Tiny inputs grow; that is not an error
    BOOST_TEST(archive.size() > payload.size());
}

BOOST_AUTO_TEST_CASE(test_empty_payload) {
    std::vector<uint8_t> empty;
    for (bool fastUnwrap : {true, false}) {
        auto archive = glifzip::compress(empty, testConfig(2, fastUnwrap));
        container::Header header = container::readHeader(archive);
        BOOST_TEST(header.payloadSize == 0u);
        BOOST_TEST(header.archiveSize == (fastUnwrap ? 12u : 0u));
        BOOST_TEST(glifzip::decompress(archive, 3).empty());
        BOOST_TEST(glifzip::verifyArchive(archive).sidecar.payload.compressionRatio == 0.0);
    }
}

BOOST_AUTO_TEST_CASE(test_both_modes_many_chunks) {
    auto payload = testutil::textBytes(1000003);
    for (bool fastUnwrap : {true, false}) {
        auto archive = glifzip::compress(payload, testConfig(8, fastUnwrap, 100000));
        container::Header header = container::readHeader(archive);
        BOOST_TEST((header.decompressionMode == (fastUnwrap ? container::DecompressionMode::FastWrap
                                                              : container::DecompressionMode::BlockOnly)));
        BOOST_TEST(glifzip::decompress(archive, 5) == payload);
    }
}

BOOST_AUTO_TEST_CASE(test_chunk_count_invariance) {
    auto payload = testutil::randomBytes(700000, 7);
    auto archive = glifzip::compress(payload, testConfig(3, true, 50000));
    auto one = glifzip::decompress(archive, 1);
    auto sixteen = glifzip::decompress(archive, 16);
    BOOST_TEST(one == sixteen);
    BOOST_TEST(one == payload);
}

BOOST_AUTO_TEST_CASE(test_round_trip_report) {
    chunking::WorkerPool pool(4);
    glifzip::Pipeline pipeline(pool);
    auto payload = testutil::textBytes(200000);
    glifzip::RoundTripReport report = pipeline.roundTrip(payload, testConfig(4));
    BOOST_TEST(report.identical);
    BOOST_TEST(report.payloadSize == payload.size());
    BOOST_TEST(report.ratio < 1.0);
    BOOST_TEST(report.ratio == static_cast<double>(report.archiveSize) / payload.size());
}

BOOST_AUTO_TEST_CASE(test_presets) {
    BOOST_TEST(glifzip::CompressionConfig::fast().level == 3);
    BOOST_TEST(glifzip::CompressionConfig::balanced().level == 8);
    BOOST_TEST(glifzip::CompressionConfig::highCompression().level == 16);
    BOOST_TEST(!glifzip::CompressionConfig::highCompression().useFastUnwrap);

    auto payload = testutil::textBytes(100000);
    glifzip::CompressionConfig config = glifzip::CompressionConfig::highCompression();
    config.workers = 2;
    auto archive = glifzip::compress(payload, config);
    BOOST_TEST((container::readHeader(archive).decompressionMode == container::DecompressionMode::BlockOnly));
    BOOST_TEST(glifzip::decompress(archive, 2) == payload);
}

BOOST_AUTO_TEST_CASE(test_invalid_configuration) {
    auto payload = testutil::bytesOf("x");
    glifzip::CompressionConfig config = testConfig(1);
    config.level = 0;
    BOOST_CHECK_THROW(glifzip::compress(payload, config), glifzip::ConfigurationError);
    config.level = 23;
    BOOST_CHECK_THROW(glifzip::compress(payload, config), glifzip::ConfigurationError);
    config = testConfig(0);
    BOOST_CHECK_THROW(glifzip::compress(payload, config), glifzip::ConfigurationError);
    config = testConfig(1, true, 0);
    BOOST_CHECK_THROW(glifzip::compress(payload, config), glifzip::ConfigurationError);
    config = testConfig(1, true, chunking::MAX_CHUNK_SIZE + 1);
    BOOST_CHECK_THROW(config.validate(), glifzip::ConfigurationError);
    BOOST_CHECK_THROW(glifzip::compress(payload, config), glifzip::ConfigurationError);
    config = testConfig(1, true, chunking::MAX_CHUNK_SIZE);
    BOOST_CHECK_NO_THROW(config.validate());

    auto archive = glifzip::compress(payload, testConfig(1));
    BOOST_CHECK_THROW(glifzip::decompress(archive, 0), glifzip::ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TEST SUITE 2: Determinism
// ============================================================================

BOOST_AUTO_TEST_SUITE(DeterminismTests)

BOOST_AUTO_TEST_CASE(test_identical_across_worker_counts) {
    auto payload = testutil::textBytes(600000);
    std::set<std::vector<uint8_t>> archives;
    for (int workers : {1, 2, 7, 16}) {
        archives.insert(glifzip::compress(payload, testConfig(workers, true, 32768)));
        archives.insert(glifzip::compress(payload, testConfig(workers, true, 32768)));
    }
    BOOST_TEST(archives.size() == 1u);

    container::Header header = container::readHeader(*archives.begin());
    BOOST_TEST(header.timestamp == 0u);
    BOOST_TEST(header.workersUsed == 0u);
}

BOOST_AUTO_TEST_CASE(test_non_deterministic_records_workers) {
    glifzip::CompressionConfig config = testConfig(3);
    config.deterministic = false;
    auto archive = glifzip::compress(testutil::textBytes(1000), config);

    glifzip::ArchiveInfo info = glifzip::verifyArchive(archive);
    BOOST_TEST(info.header.workersUsed == 3u);
    BOOST_TEST(info.header.timestamp > 1600000000u);
    BOOST_TEST(info.sidecar.archive.threads == 3u);
    BOOST_TEST(!info.sidecar.metadata.deterministic);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TEST SUITE 3: Integrity
// ============================================================================

BOOST_AUTO_TEST_SUITE(IntegrityTests)

BOOST_AUTO_TEST_CASE(test_payload_tamper_detected) {
    auto payload = testutil::textBytes(300000);
    for (bool fastUnwrap : {true, false}) {
        auto archive = glifzip::compress(payload, testConfig(4, fastUnwrap, 65536));
        size_t start = payloadOffset(archive);
        for (size_t offset : {start, start + 1, (start + archive.size()) / 2, archive.size() - 1}) {
            auto damaged = archive;
            damaged[offset] ^= 0x01;
            BOOST_CHECK_THROW(glifzip::decompress(damaged, 4), glifzip::HashMismatchError);
            BOOST_CHECK_THROW(glifzip::verifyArchive(damaged), glifzip::HashMismatchError);
        }
    }
}

BOOST_AUTO_TEST_CASE(test_scenario_level_byte_corrupted) {
    auto archive = glifzip::compress(testutil::textBytes(10000), testConfig(2));
    auto damaged = archive;
    damaged[89] ^= 0x01;
    BOOST_CHECK_THROW(glifzip::decompress(damaged, 2), glifzip::HeaderChecksumError);
    damaged = archive;
    damaged[90] ^= 0x01;
    BOOST_CHECK_THROW(glifzip::decompress(damaged, 2), glifzip::HeaderChecksumError);
}

BOOST_AUTO_TEST_CASE(test_header_rejection) {
    auto archive = glifzip::compress(testutil::textBytes(10000), testConfig(2));

    auto badMagic = archive;
    badMagic[3] = 'X';
    BOOST_CHECK_THROW(glifzip::decompress(badMagic, 2), glifzip::FormatError);
    BOOST_CHECK_THROW(glifzip::verifyArchive(badMagic), glifzip::FormatError);

    auto badVersion = archive;
    badVersion[6] = 0x09;
    BOOST_CHECK_THROW(glifzip::decompress(badVersion, 2), glifzip::FormatError);

    std::vector<uint8_t> stub(archive.begin(), archive.begin() + 50);
    BOOST_CHECK_THROW(glifzip::verifyArchive(stub), glifzip::FormatError);
}

BOOST_AUTO_TEST_CASE(test_truncated_and_extended_archive) {
    auto archive = glifzip::compress(testutil::textBytes(10000), testConfig(2));
    auto truncated = archive;
    truncated.pop_back();
    BOOST_CHECK_THROW(glifzip::decompress(truncated, 2), glifzip::SizeMismatchError);

    auto extended = archive;
    extended.push_back(0);
    BOOST_CHECK_THROW(glifzip::verifyArchive(extended), glifzip::SizeMismatchError);
}

BOOST_AUTO_TEST_CASE(test_errors_share_a_root) {
    auto archive = glifzip::compress(testutil::textBytes(1000), testConfig(1));
    archive.back() ^= 0xff;
    try {
        glifzip::decompress(archive, 1);
        BOOST_FAIL("expected a GlifError");
    } catch (const glifzip::GlifError& e) {
        BOOST_TEST((e.kind() == glifzip::ErrorKind::HashMismatch));
        BOOST_TEST(std::string(glifzip::errorKindName(e.kind())) == "HashMismatchError");
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TEST SUITE 4: Verification
// ============================================================================

BOOST_AUTO_TEST_SUITE(VerificationTests)

BOOST_AUTO_TEST_CASE(test_verify_reports_metadata) {
    auto payload = testutil::textBytes(50000);
    glifzip::CompressionConfig config = testConfig(2);
    config.level = 11;
    auto archive = glifzip::compress(payload, config);

    glifzip::ArchiveInfo info = glifzip::verifyArchive(archive);
    BOOST_TEST(info.header.payloadSize == payload.size());
    BOOST_TEST(info.header.compressionLevel == 11u);
    BOOST_TEST(info.sidecar.archive.compressionLevel == 11u);
    BOOST_TEST(info.sidecar.archive.chunkSize == 64u * 1024u);
    BOOST_TEST(info.sidecar.payload.hash == "sha256:" + hashing::toHex(hashing::sha256(payload)));
    BOOST_TEST(info.sidecar.metadata.created == "1970-01-01T00:00:00Z");
}

BOOST_AUTO_TEST_CASE(test_verify_never_decompresses) {
    // A payload region that is not a valid stream but carries a correct archive hash
    auto bogus = testutil::randomBytes(4096, 99);
    container::Header header;
    header.payloadSize = 1 << 30;
    header.archiveSize = bogus.size();
    header.payloadHash = hashing::sha256(testutil::bytesOf("never produced"));
    header.archiveHash = hashing::sha256(bogus);
    header.compressionLevel = 8;
    header.decompressionMode = container::DecompressionMode::BlockOnly;
    auto sidecarBytes = sidecar::build(header, {}).encode();
    header.sidecarSize = static_cast<uint16_t>(sidecarBytes.size());
    auto archive = container::write(header, sidecarBytes, bogus);

    std::vector<glifzip::Stage> stages;
    chunking::WorkerPool pool(2);
    glifzip::Pipeline pipeline(pool, [&](glifzip::Stage s) { stages.push_back(s); });

    glifzip::ArchiveInfo info = pipeline.verify(archive);
    BOOST_TEST(info.header.payloadSize == (1u << 30));
    std::vector<glifzip::Stage> expected = {
        glifzip::Stage::Idle, glifzip::Stage::ParsingHeader,
        glifzip::Stage::VerifyingArchiveHash, glifzip::Stage::Done};
    BOOST_TEST((stages == expected));

    BOOST_CHECK_THROW(pipeline.decompress(archive), glifzip::CorruptionError);
}

BOOST_AUTO_TEST_CASE(test_stage_sequences) {
    std::vector<glifzip::Stage> stages;
    chunking::WorkerPool pool(2);
    glifzip::Pipeline pipeline(pool, [&](glifzip::Stage s) { stages.push_back(s); });

    auto archive = pipeline.compress(testutil::textBytes(5000), testConfig(2, true));
    std::vector<glifzip::Stage> compressStages = {
        glifzip::Stage::Idle, glifzip::Stage::Hashing, glifzip::Stage::Chunking,
        glifzip::Stage::Compressing, glifzip::Stage::Wrapping, glifzip::Stage::Framing,
        glifzip::Stage::Done};
    BOOST_TEST((stages == compressStages));

    stages.clear();
    pipeline.decompress(archive);
    std::vector<glifzip::Stage> decompressStages = {
        glifzip::Stage::Idle, glifzip::Stage::ParsingHeader, glifzip::Stage::VerifyingArchiveHash,
        glifzip::Stage::Unwrapping, glifzip::Stage::Decompressing,
        glifzip::Stage::VerifyingPayloadHash, glifzip::Stage::Done};
    BOOST_TEST((stages == decompressStages));

    stages.clear();
    archive = pipeline.compress(testutil::textBytes(5000), testConfig(2, false));
    BOOST_TEST((std::find(stages.begin(), stages.end(), glifzip::Stage::Wrapping) == stages.end()));
    stages.clear();
    pipeline.decompress(archive);
    BOOST_TEST((std::find(stages.begin(), stages.end(), glifzip::Stage::Unwrapping) == stages.end()));
    BOOST_TEST(std::string(glifzip::stageName(glifzip::Stage::VerifyingArchiveHash)) == "verifying-archive-hash");
}

BOOST_AUTO_TEST_CASE(test_sidecar_disagreement_fails_verify) {
    auto payload = testutil::textBytes(2000);
    glifzip::CompressionConfig config = testConfig(1);
    auto archive = glifzip::compress(payload, config);
    container::Header header = container::readHeader(archive);
    container::Region region = container::readPayload(archive.data(), archive.size(), header);
    std::vector<uint8_t> stream(region.data, region.data + region.size);

    sidecar::Sidecar meta = sidecar::build(header, {});
    meta.archive.compressionLevel = 3;
    auto sidecarBytes = meta.encode();
    header.sidecarSize = static_cast<uint16_t>(sidecarBytes.size());
    auto forged = container::write(header, sidecarBytes, stream);

    BOOST_CHECK_THROW(glifzip::verifyArchive(forged), glifzip::FormatError);
    // The header stays authoritative for decompression
    BOOST_TEST(glifzip::decompress(forged, 1) == payload);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TEST SUITE 5: Compressibility scenarios
// ============================================================================

BOOST_AUTO_TEST_SUITE(ScenarioTests)

BOOST_AUTO_TEST_CASE(test_zero_filled_10mib) {
    std::vector<uint8_t> payload(10 * 1024 * 1024, 0x00);
    glifzip::CompressionConfig config;
    config.workers = 4;
    auto archive = glifzip::compress(payload, config);
    BOOST_TEST(archive.size() < payload.size() / 100);
    BOOST_TEST(glifzip::decompress(archive, 4) == payload);
}

BOOST_AUTO_TEST_CASE(test_random_10mib) {
    auto payload = testutil::randomBytes(10 * 1024 * 1024, 1234);
    glifzip::CompressionConfig config;
    config.workers = 4;
    config.chunkSize = 1024 * 1024;
    auto archive = glifzip::compress(payload, config);
    double ratio = static_cast<double>(archive.size()) / payload.size();
    BOOST_TEST(ratio > 0.99);
    BOOST_TEST(ratio < 1.01);
    BOOST_TEST(glifzip::decompress(archive, 4) == payload);
}

BOOST_AUTO_TEST_SUITE_END()
