// =============================================================================
// pzkit - Compress Command Implementation
// =============================================================================

#include "compress_command.h"

#include <chrono>

#include "command_support.h"
#include "pzk/common/logger.h"

namespace pzk::commands {

void checkOutputWritable(const std::filesystem::path& outputPath, bool force) {
    if (outputPath == "-") {
        return;
    }
    if (!force && std::filesystem::exists(outputPath)) {
        throw IOError("Output file already exists: " + outputPath.string() +
                      " (use -f to overwrite)");
    }
}

void logTransformSummary(Direction direction, const std::filesystem::path& inputPath,
                         const std::filesystem::path& outputPath,
                         const io::TransformSummary& summary) {
    if (outputPath == "-") {
        PZK_LOG_DEBUG("{} {} to stdout with {} ({} worker(s))", directionName(direction),
                      inputPath.string(), summary.toolName, summary.workers);
        return;
    }
    PZK_LOG_INFO("{} {} -> {} with {} ({} worker(s), {} bytes)", directionName(direction),
                 inputPath.string(), outputPath.string(), summary.toolName, summary.workers,
                 summary.outputBytes);
}

// =============================================================================
// CompressCommand Implementation
// =============================================================================

CompressCommand::CompressCommand(CompressOptions options) : options_(std::move(options)) {}

CompressCommand::~CompressCommand() = default;

CompressCommand::CompressCommand(CompressCommand&&) noexcept = default;
CompressCommand& CompressCommand::operator=(CompressCommand&&) noexcept = default;

int CompressCommand::execute() {
    auto startTime = std::chrono::steady_clock::now();

    try {
        validateOptions();

        io::StreamOptions streamOptions;
        streamOptions.parallelism = options_.parallelism;
        streamOptions.level = options_.compressionLevel;

        const auto summary = io::compressFile(options_.codec, options_.inputPath,
                                              options_.outputPath, streamOptions);
        logTransformSummary(Direction::kCompress, options_.inputPath, options_.outputPath,
                            summary);

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime);
        PZK_LOG_DEBUG("Compression finished in {:.3f}s", elapsed.count());
        return 0;

    } catch (const PZKException& e) {
        return reportFailure("Compression", e);
    }
}

void CompressCommand::validateOptions() {
    if (options_.inputPath != "-" && !std::filesystem::is_regular_file(options_.inputPath)) {
        throw IOError("Input file not found: " + options_.inputPath.string());
    }

    if (options_.outputPath.empty()) {
        if (options_.inputPath == "-") {
            throw UsageError("An output path is required when reading stdin");
        }
        options_.outputPath = options_.inputPath;
        options_.outputPath += io::codecExtension(options_.codec);
    }
    checkOutputWritable(options_.outputPath, options_.forceOverwrite);

    const int maxLevel = maxCompressionLevel(options_.codec);
    if (options_.compressionLevel < 0 || options_.compressionLevel > maxLevel) {
        throw InvalidArgumentError(fmt::format("Compression level for {} must be 0-{}",
                                               codecName(options_.codec), maxLevel));
    }
}

}  // namespace pzk::commands
