/**
 * @file main.cpp
 * @brief glifzip - deterministic, multithreaded GLIF archiver
 *
 * Commands:
 * - create   compress a file or directory into a .glif archive
 * - extract  restore the original bytes or directory tree
 * - verify   check header, archive hash and sidecar without decompressing
 * - list     show archive metadata and, for directories, the file listing
 */

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <fstream>
#include <ctime>
#include <iostream>
#include <optional>

#include "directory_archive.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "manifest.hpp"
#include "pipeline.hpp"
#include "sidecar.hpp"
#include "version.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

constexpr const char* ARCHIVE_EXTENSION = ".glif";

// ANSI color codes for terminal output
namespace color {
    constexpr const char* reset = "\033[0m";
    constexpr const char* bold = "\033[1m";
    constexpr const char* dim = "\033[2m";
    constexpr const char* red = "\033[31m";
    constexpr const char* green = "\033[32m";
    constexpr const char* cyan = "\033[36m";
}

// ============================================================================
// Commands
// ============================================================================

enum class Command {
    Create,
    Extract,
    Verify,
    List
};

std::optional<Command> parseCommand(const std::string& name) {
    if (name == "create") return Command::Create;
    if (name == "extract") return Command::Extract;
    if (name == "verify") return Command::Verify;
    if (name == "list") return Command::List;
    return std::nullopt;
}

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::string command;
    std::string input;
    std::string output;
    std::string configFile;

    int level = glifzip_zstd::DEFAULT_LEVEL;
    bool levelSet = false;
    int threads = chunking::defaultWorkerCount();
    bool recursive = false;
    bool fastUnwrap = true;
    bool deterministic = true;
    size_t chunkMb = chunking::MAX_CHUNK_SIZE / (1024 * 1024);
    std::string preset;

    int verbosity = 1;            // 0=quiet, 1=normal, 2=verbose
};

glifzip::CompressionConfig toCompressionConfig(const Config& cfg) {
    glifzip::CompressionConfig config;
    if (cfg.preset == "fast") config = glifzip::CompressionConfig::fast();
    else if (cfg.preset == "high") config = glifzip::CompressionConfig::highCompression();
    else if (!cfg.preset.empty() && cfg.preset != "balanced") {
        throw glifzip::ConfigurationError("Unknown preset '" + cfg.preset + "' (fast|balanced|high)");
    }

    if (cfg.preset.empty() || cfg.levelSet) config.level = cfg.level;
    if (!cfg.fastUnwrap) config.useFastUnwrap = false;
    config.workers = cfg.threads;
    config.deterministic = cfg.deterministic;
    if (cfg.chunkMb == 0 || cfg.chunkMb > chunking::MAX_CHUNK_SIZE / (1024 * 1024)) {
        throw glifzip::ConfigurationError("--chunk-mb must be in [1, " +
                                          std::to_string(chunking::MAX_CHUNK_SIZE / (1024 * 1024)) +
                                          "], got " + std::to_string(cfg.chunkMb));
    }
    config.chunkSize = cfg.chunkMb * 1024 * 1024;
    config.validate();
    return config;
}

// Values from --config fill in whatever the command line left unset
void applyConfigFile(Config& cfg, const po::variables_map& cli) {
    std::ifstream in(cfg.configFile);
    if (!in) {
        throw glifzip::IOError("Cannot open config file: " + cfg.configFile);
    }

    po::options_description fileOptions;
    fileOptions.add_options()
        ("level", po::value<int>())
        ("threads", po::value<int>())
        ("fast-unwrap", po::value<bool>())
        ("deterministic", po::value<bool>())
        ("chunk-mb", po::value<size_t>())
        ("verbose", po::value<bool>());

    po::variables_map file;
    po::store(po::parse_config_file(in, fileOptions), file);
    po::notify(file);

    if (file.count("level") && !cli.count("level")) {
        cfg.level = file["level"].as<int>();
        cfg.levelSet = true;
    }
    if (file.count("threads") && !cli.count("threads")) cfg.threads = file["threads"].as<int>();
    if (file.count("fast-unwrap") && !cli["block-only"].as<bool>()) cfg.fastUnwrap = file["fast-unwrap"].as<bool>();
    if (file.count("deterministic") && !cli["no-deterministic"].as<bool>()) {
        cfg.deterministic = file["deterministic"].as<bool>();
    }
    if (file.count("chunk-mb") && !cli.count("chunk-mb")) cfg.chunkMb = file["chunk-mb"].as<size_t>();
    if (file.count("verbose") && file["verbose"].as<bool>() && cfg.verbosity == 1) cfg.verbosity = 2;
}

std::string defaultExtractPath(const std::string& archive) {
    fs::path p(archive);
    if (p.extension() == ARCHIVE_EXTENSION) {
        return (p.parent_path() / p.stem()).string();
    }
    return archive + ".out";
}

std::string humanSize(uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    return unit == 0 ? fmt::format("{} B", bytes) : fmt::format("{:.2f} {}", value, units[unit]);
}

// ============================================================================
// Command implementations
// ============================================================================

int runCreate(const Config& cfg) {
    glifzip::CompressionConfig config = toCompressionConfig(cfg);
    std::string output = cfg.output.empty() ? cfg.input + ARCHIVE_EXTENSION : cfg.output;

    std::vector<uint8_t> payload;
    boost::system::error_code ec;
    if (fs::is_directory(cfg.input, ec)) {
        if (!cfg.recursive) {
            throw glifzip::ConfigurationError(cfg.input + " is a directory; pass -r to archive it");
        }
        std::string createdAt = sidecar::rfc3339(
            config.deterministic ? 0 : static_cast<uint64_t>(std::time(nullptr)));
        dirarchive::CollectedTree tree = dirarchive::collect(cfg.input, createdAt);
        config.fileCount = tree.manifest.fileCount();
        config.directoryCount = tree.manifest.directoryCount();
        payload = manifest::buildPayload(tree.manifest, tree.blob);
    } else {
        payload = glifzip::readFile(cfg.input);
    }

    chunking::WorkerPool pool(config.workers);
    glifzip::Pipeline pipeline(pool);
    std::vector<uint8_t> archive = pipeline.compress(payload, config);
    glifzip::writeFile(output, archive);

    logging::msg("{}Created{} {} ({} -> {}, {:.2f}%)", color::green, color::reset, output,
                 humanSize(payload.size()), humanSize(archive.size()),
                 sidecar::compressionRatio(payload.size(), archive.size()) * 100.0);
    return 0;
}

int runExtract(const Config& cfg) {
    std::string output = cfg.output.empty() ? defaultExtractPath(cfg.input) : cfg.output;
    std::vector<uint8_t> archive = glifzip::readFile(cfg.input);

    chunking::WorkerPool pool(cfg.threads);
    glifzip::Pipeline pipeline(pool);
    std::vector<uint8_t> payload = pipeline.decompress(archive);

    if (dirarchive::isDirectoryArchive(archive)) {
        manifest::ParsedPayload parsed = manifest::parsePayload(payload);
        size_t count = dirarchive::extract(parsed, output);
        logging::msg("{}Extracted{} {} entries to {}", color::green, color::reset, count, output);
    } else {
        glifzip::writeFile(output, payload);
        logging::msg("{}Extracted{} {} ({})", color::green, color::reset, output, humanSize(payload.size()));
    }
    return 0;
}

void printArchiveInfo(const glifzip::ArchiveInfo& info) {
    const auto& h = info.header;
    const auto& s = info.sidecar;
    std::cout << color::bold << "Format:        " << color::reset << s.format << "\n";
    std::cout << color::bold << "Payload:       " << color::reset << humanSize(h.payloadSize)
              << color::dim << " (" << h.payloadSize << " bytes)" << color::reset << "\n";
    std::cout << color::bold << "Archive:       " << color::reset << humanSize(h.archiveSize)
              << color::dim << " (" << h.archiveSize << " bytes)" << color::reset << "\n";
    std::cout << color::bold << "Ratio:         " << color::reset
              << fmt::format("{:.2f}%", s.payload.compressionRatio * 100.0) << "\n";
    std::cout << color::bold << "Compression:   " << color::reset << s.archive.compressedWith
              << " level " << h.compressionLevel << ", decompress with "
              << s.archive.decompressedWith << "\n";
    std::cout << color::bold << "Workers:       " << color::reset
              << (h.workersUsed == 0 ? std::string("not recorded") : std::to_string(h.workersUsed)) << "\n";
    std::cout << color::bold << "Created:       " << color::reset << s.metadata.created
              << " by " << s.metadata.creator << " on " << s.metadata.sourcePlatform
              << "/" << s.metadata.sourceArchitecture << "\n";
    std::cout << color::bold << "Payload hash:  " << color::reset << s.payload.hash << "\n";
    std::cout << color::bold << "Archive hash:  " << color::reset << s.archive.hash << "\n";
    if (s.payload.files) {
        std::cout << color::bold << "Contents:      " << color::reset << *s.payload.files << " files, "
                  << s.payload.directories.value_or(0) << " directories\n";
    }
}

int runVerify(const Config& cfg) {
    std::vector<uint8_t> archive = glifzip::readFile(cfg.input);
    glifzip::ArchiveInfo info = glifzip::verifyArchive(archive);
    printArchiveInfo(info);
    std::cout << color::green << "OK" << color::reset << " " << cfg.input << "\n";
    return 0;
}

int runList(const Config& cfg) {
    std::vector<uint8_t> archive = glifzip::readFile(cfg.input);

    chunking::WorkerPool pool(cfg.threads);
    glifzip::Pipeline pipeline(pool);
    glifzip::ArchiveInfo info = pipeline.verify(archive);
    printArchiveInfo(info);

    if (info.sidecar.payload.files) {
        std::vector<uint8_t> payload = pipeline.decompress(archive);
        manifest::ParsedPayload parsed = manifest::parsePayload(payload);
        std::cout << "\n" << color::bold << color::cyan << "Entries:" << color::reset << "\n";
        for (const auto& line : parsed.manifest.listing()) {
            std::cout << "  " << line << "\n";
        }
    }
    return 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

void printUsage() {
    std::cout << color::bold << GLIFZIP_PROGRAM_NAME << color::reset << " v" << GLIFZIP_VERSION << "\n";
    std::cout << "Deterministic multithreaded compression with fast extraction\n\n";

    std::cout << color::bold << "USAGE:" << color::reset << "\n";
    std::cout << "  glifzip <command> [OPTIONS] <input>\n\n";

    std::cout << color::bold << "COMMANDS:" << color::reset << "\n";
    std::cout << "  create    Compress a file (or a directory with -r)\n";
    std::cout << "  extract   Decompress an archive\n";
    std::cout << "  verify    Check archive integrity without decompressing\n";
    std::cout << "  list      Show archive metadata and contents\n\n";

    std::cout << color::bold << "EXAMPLES:" << color::reset << "\n";
    std::cout << "  glifzip create data.bin -o data.glif -l 12 -t 8\n";
    std::cout << "  glifzip create -r project/ -o project.glif --block-only\n";
    std::cout << "  glifzip extract project.glif -o restored/\n";
    std::cout << "  glifzip verify data.glif\n\n";

    std::cout << color::bold << "OPTIONS:" << color::reset << "\n";
}

int main(int argc, char** argv) {
    Config cfg;

    po::options_description general("General");
    general.add_options()
        ("help,h", "Show this help message")
        ("version,V", "Show version")
        ("output,o", po::value<std::string>(&cfg.output), "Output archive, file or directory")
        ("threads,t", po::value<int>(), "Worker threads (default: all cores)")
        ("config", po::value<std::string>(&cfg.configFile), "INI file with default option values")
        ("verbose,v", po::bool_switch(), "Verbose output")
        ("quiet,q", po::bool_switch(), "Errors only");

    po::options_description create("Create Options");
    create.add_options()
        ("level,l", po::value<int>(), "ZSTD compression level 1-22 (default 8)")
        ("recursive,r", po::bool_switch(&cfg.recursive), "Archive a directory tree")
        ("block-only", po::bool_switch(), "Skip the LZ4 wrap layer (smaller, slower to extract)")
        ("no-deterministic", po::bool_switch(), "Record creation time and worker count")
        ("chunk-mb", po::value<size_t>(), "Chunk size in MiB (default 128)")
        ("preset", po::value<std::string>(&cfg.preset), "fast | balanced | high");

    po::options_description hidden("Hidden");
    hidden.add_options()
        ("command", po::value<std::string>(&cfg.command), "")
        ("input", po::value<std::string>(&cfg.input), "");

    po::positional_options_description pos;
    pos.add("command", 1).add("input", 1);

    po::options_description all;
    all.add(general).add(create).add(hidden);

    po::options_description visible;
    visible.add(general).add(create);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
            .options(all).positional(pos).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << color::red << "Error: " << e.what() << color::reset << "\n\n";
        printUsage();
        std::cout << visible << "\n";
        return 2;
    }

    if (vm.count("help") || argc == 1) {
        printUsage();
        std::cout << visible << "\n";
        return 0;
    }

    if (vm.count("version")) {
        std::cout << GLIFZIP_PROGRAM_NAME << " " << GLIFZIP_VERSION << "\n";
        return 0;
    }

    std::optional<Command> command = parseCommand(cfg.command);
    if (!command) {
        std::cerr << color::red << "Error: unknown command '" << cfg.command << "'" << color::reset << "\n";
        return 2;
    }
    if (cfg.input.empty()) {
        std::cerr << color::red << "Error: " << cfg.command << " needs an input path" << color::reset << "\n";
        return 2;
    }

    if (vm["verbose"].as<bool>()) cfg.verbosity = 2;
    if (vm["quiet"].as<bool>()) cfg.verbosity = 0;

    if (vm.count("level")) {
        cfg.level = vm["level"].as<int>();
        cfg.levelSet = true;
    }
    if (vm.count("threads")) cfg.threads = vm["threads"].as<int>();
    if (vm.count("chunk-mb")) cfg.chunkMb = vm["chunk-mb"].as<size_t>();
    if (vm["block-only"].as<bool>()) cfg.fastUnwrap = false;
    if (vm["no-deterministic"].as<bool>()) cfg.deterministic = false;

    logging::initSpdlog();

    try {
        if (!cfg.configFile.empty()) {
            applyConfigFile(cfg, vm);
        }

        if (cfg.verbosity == 0) logging::setLoggingLevel(logging::LogLevel::QUIET);
        else if (cfg.verbosity == 2) logging::setLoggingLevel(logging::LogLevel::VERBOSE);
        else logging::setLoggingLevel(logging::LogLevel::NORMAL);

        switch (*command) {
            case Command::Create:  return runCreate(cfg);
            case Command::Extract: return runExtract(cfg);
            case Command::Verify:  return runVerify(cfg);
            case Command::List:    return runList(cfg);
        }
    } catch (const glifzip::GlifError& e) {
        logging::err("{}: {}", glifzip::errorKindName(e.kind()), e.what());
        return 1;
    } catch (const po::error& e) {
        logging::err("Config file: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        logging::err("Fatal error: {}", e.what());
        return 1;
    }
    return 1;
}
