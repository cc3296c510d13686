// =============================================================================
// pzkit - Parallel-Aware Compression and Checksum Toolkit
// =============================================================================
// Main entry point for the pzk command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: compress, decompress, checksum, info
// - Global options: verbose, quiet, log-file, log-level
// - Console logging is switched off when a command writes data to stdout
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "pzk/chksum/digest_registry.h"
#include "pzk/common/error.h"
#include "pzk/common/logger.h"
#include "pzk/common/types.h"

// Command implementations
#include "commands/checksum_command.h"
#include "commands/compress_command.h"
#include "commands/decompress_command.h"
#include "commands/info_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "pzk: compress, decompress and checksum files using the fastest codec tools\n"
    "installed on this host. Parallel tools (pbzip2, lbzip2, pigz, pixz, pzstd) are\n"
    "preferred when more than one core is available.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
    std::string logLevel;  // Overrides -v / -q when set
};

GlobalOptions gOptions;

// =============================================================================
// Compress Command Options
// =============================================================================

struct CliCompressOptions {
    std::string input;
    std::string output;
    std::string codec;
    int level = 0;     // 0 = tool default
    int workers = 0;   // 0 = physical cores
    bool serial = false;
    bool force = false;
};

CliCompressOptions gCompressOpts;

// =============================================================================
// Decompress Command Options
// =============================================================================

struct CliDecompressOptions {
    std::string input;
    std::string output;
    std::string codec;  // Empty = detect
    int workers = 0;
    bool serial = false;
    bool force = false;
};

CliDecompressOptions gDecompressOpts;

// =============================================================================
// Checksum Command Options
// =============================================================================

struct CliChecksumOptions {
    std::vector<std::string> inputs;
    std::string digests = "sha256";
    bool noParallel = false;
};

CliChecksumOptions gChecksumOpts;

// =============================================================================
// Info Command Options
// =============================================================================

struct CliInfoOptions {
    bool json = false;
};

CliInfoOptions gInfoOpts;

// =============================================================================
// Option Conversion
// =============================================================================

/// @brief Parse a codec name given on the command line.
/// @throws UsageError for an unknown name.
[[nodiscard]] pzk::CodecKind codecFromCli(const std::string& name) {
    auto codec = pzk::parseCodecKind(name);
    if (!codec.has_value()) {
        throw pzk::UsageError("Unknown codec: " + name);
    }
    return *codec;
}

[[nodiscard]] pzk::ParallelismPreference parallelismFromCli(bool serial, int workers) {
    if (serial) {
        return pzk::ParallelismPreference::serial();
    }
    if (workers > 0) {
        return pzk::ParallelismPreference::withWorkers(static_cast<std::size_t>(workers));
    }
    return pzk::ParallelismPreference::automatic();
}

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupCompressCommand(CLI::App& app) {
    auto* compress = app.add_subcommand("compress", "Compress a file with an external codec");
    compress->alias("c");

    compress->add_option("-i,--input", gCompressOpts.input, "Input file (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    compress->add_option("-o,--output", gCompressOpts.output,
                         "Output file (default: input plus codec extension, '-' for stdout)");

    compress->add_option("-c,--codec", gCompressOpts.codec, "Codec: bzip2, gzip, xz, zstd")
        ->required();

    compress->add_option("-l,--level", gCompressOpts.level,
                         "Compression level (0 = tool default, 1-9, up to 19 for zstd)")
        ->default_val(0)
        ->check(CLI::Range(0, 19));

    compress->add_option("-j,--workers", gCompressOpts.workers,
                         "Worker count (0 = physical cores)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    compress->add_flag("--serial", gCompressOpts.serial, "Use a single-threaded tool");

    compress->add_flag("-f,--force", gCompressOpts.force, "Overwrite existing output file");
}

void setupDecompressCommand(CLI::App& app) {
    auto* decompress =
        app.add_subcommand("decompress", "Decompress a file with an external codec");
    decompress->alias("d");
    decompress->alias("x");

    decompress->add_option("-i,--input", gDecompressOpts.input, "Compressed input file")
        ->required()
        ->check(CLI::ExistingFile);

    decompress->add_option("-o,--output", gDecompressOpts.output,
                           "Output file (default: input without extension, '-' for stdout)");

    decompress->add_option("-c,--codec", gDecompressOpts.codec,
                           "Codec override (default: detect from magic bytes)");

    decompress->add_option("-j,--workers", gDecompressOpts.workers,
                           "Worker count (0 = physical cores)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    decompress->add_flag("--serial", gDecompressOpts.serial, "Use a single-threaded tool");

    decompress->add_flag("-f,--force", gDecompressOpts.force, "Overwrite existing output file");
}

void setupChecksumCommand(CLI::App& app) {
    auto* checksum = app.add_subcommand("checksum", "Compute digests of files");
    checksum->alias("sum");

    checksum->add_option("files", gChecksumOpts.inputs, "Input files")
        ->required()
        ->check(CLI::ExistingFile);

    checksum->add_option("-d,--digests", gChecksumOpts.digests,
                         "Comma-separated digest kinds (e.g., 'sha256,md5,crc32')")
        ->default_val("sha256");

    checksum->add_flag("--no-parallel", gChecksumOpts.noParallel,
                       "Compute all digests on the calling thread");
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display host codec and digest capabilities");
    info->alias("i");

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");
}

/// @brief Whether the chosen subcommand writes its data to stdout.
[[nodiscard]] bool writesDataToStdout(const CLI::App& app) {
    if (app.got_subcommand("checksum") || app.got_subcommand("info")) {
        return true;
    }
    if (app.got_subcommand("compress")) {
        return gCompressOpts.output == "-";
    }
    if (app.got_subcommand("decompress")) {
        return gDecompressOpts.output == "-";
    }
    return false;
}

}  // namespace

// =============================================================================
// Command Dispatch
// =============================================================================

namespace pzk::commands {

int runCompress() {
    CompressOptions opts;
    opts.inputPath = gCompressOpts.input;
    opts.outputPath = gCompressOpts.output;
    opts.codec = codecFromCli(gCompressOpts.codec);
    opts.compressionLevel = gCompressOpts.level;
    opts.parallelism = parallelismFromCli(gCompressOpts.serial, gCompressOpts.workers);
    opts.forceOverwrite = gCompressOpts.force;

    CompressCommand cmd(std::move(opts));
    return cmd.execute();
}

int runDecompress() {
    DecompressOptions opts;
    opts.inputPath = gDecompressOpts.input;
    opts.outputPath = gDecompressOpts.output;
    if (!gDecompressOpts.codec.empty()) {
        opts.codec = codecFromCli(gDecompressOpts.codec);
    }
    opts.parallelism = parallelismFromCli(gDecompressOpts.serial, gDecompressOpts.workers);
    opts.forceOverwrite = gDecompressOpts.force;

    DecompressCommand cmd(std::move(opts));
    return cmd.execute();
}

int runChecksum() {
    ChecksumOptions opts;
    opts.inputPaths.assign(gChecksumOpts.inputs.begin(), gChecksumOpts.inputs.end());
    opts.kinds = chksum::parseDigestList(gChecksumOpts.digests);
    opts.parallel = !gChecksumOpts.noParallel;

    ChecksumCommand cmd(std::move(opts), std::cout);
    return cmd.execute();
}

int runInfo() {
    InfoOptions opts;
    opts.jsonOutput = gInfoOpts.json;

    InfoCommand cmd(opts, std::cout);
    return cmd.execute();
}

}  // namespace pzk::commands

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Append log records to this file");

    app.add_option("--log-level", gOptions.logLevel,
                   "Log level: trace, debug, info, warning, error, critical")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "warn", "error", "critical",
                               "fatal"},
                              CLI::ignore_case));

    // Setup subcommands
    setupCompressCommand(app);
    setupDecompressCommand(app);
    setupChecksumCommand(app);
    setupInfoCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? EXIT_SUCCESS : pzk::toExitCode(pzk::ErrorCode::kUsageError);
    }

    // Initialize logger
    try {
        pzk::log::Config config;
        config.logFile = gOptions.logFile;
        config.enableConsole = !writesDataToStdout(app);
        if (gOptions.quiet) {
            config.level = pzk::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            config.level = pzk::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            config.level = pzk::log::Level::kDebug;
        }
        if (!gOptions.logLevel.empty()) {
            config.level = pzk::log::levelFromString(gOptions.logLevel);
        }
        pzk::log::init(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("compress")) {
            exitCode = pzk::commands::runCompress();
        } else if (app.got_subcommand("decompress")) {
            exitCode = pzk::commands::runDecompress();
        } else if (app.got_subcommand("checksum")) {
            exitCode = pzk::commands::runChecksum();
        } else if (app.got_subcommand("info")) {
            exitCode = pzk::commands::runInfo();
        }
    } catch (const pzk::PZKException& ex) {
        // Option conversion errors raised before a command runs
        PZK_LOG_ERROR("Error: {}", ex.what());
        if (!pzk::log::consoleEnabled()) {
            std::cerr << "pzk: " << ex.what() << std::endl;
        }
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        PZK_LOG_ERROR("Unexpected error: {}", ex.what());
        if (!pzk::log::consoleEnabled()) {
            std::cerr << "pzk: unexpected error: " << ex.what() << std::endl;
        }
        exitCode = EXIT_FAILURE;
    }

    pzk::log::shutdown();
    return exitCode;
}
