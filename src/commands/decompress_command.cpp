// =============================================================================
// pzkit - Decompress Command Implementation
// =============================================================================

#include "decompress_command.h"

#include "command_support.h"
#include "compress_command.h"
#include "pzk/common/logger.h"
#include "pzk/io/compressed_stream.h"

namespace pzk::commands {

std::filesystem::path defaultDecompressedPath(const std::filesystem::path& input) {
    if (!io::detectCodecFromExtension(input).has_value()) {
        throw UsageError("Cannot derive an output name from " + input.string() +
                         " (use -o)");
    }

    auto ext = input.extension().string();
    std::filesystem::path output = input;
    output.replace_extension();
    // Tarball shorthands map back to .tar
    if (ext == ".tgz" || ext == ".tbz2" || ext == ".txz") {
        output += ".tar";
    }
    return output;
}

// =============================================================================
// DecompressCommand Implementation
// =============================================================================

DecompressCommand::DecompressCommand(DecompressOptions options) : options_(std::move(options)) {}

DecompressCommand::~DecompressCommand() = default;

DecompressCommand::DecompressCommand(DecompressCommand&&) noexcept = default;
DecompressCommand& DecompressCommand::operator=(DecompressCommand&&) noexcept = default;

int DecompressCommand::execute() {
    try {
        validateOptions();
        const CodecKind codec = resolveCodec();

        io::StreamOptions streamOptions;
        streamOptions.parallelism = options_.parallelism;

        const auto summary =
            io::decompressFile(codec, options_.inputPath, options_.outputPath, streamOptions);
        logTransformSummary(Direction::kDecompress, options_.inputPath, options_.outputPath,
                            summary);
        return 0;

    } catch (const PZKException& e) {
        return reportFailure("Decompression", e);
    }
}

void DecompressCommand::validateOptions() {
    if (!std::filesystem::is_regular_file(options_.inputPath)) {
        throw IOError("Input file not found: " + options_.inputPath.string());
    }
    if (options_.outputPath.empty()) {
        options_.outputPath = defaultDecompressedPath(options_.inputPath);
    }
    checkOutputWritable(options_.outputPath, options_.forceOverwrite);
}

CodecKind DecompressCommand::resolveCodec() const {
    if (options_.codec.has_value()) {
        return *options_.codec;
    }
    if (auto detected = io::detectCodecFromFile(options_.inputPath)) {
        PZK_LOG_DEBUG("Detected {} from magic bytes", codecName(*detected));
        return *detected;
    }
    if (auto fromExtension = io::detectCodecFromExtension(options_.inputPath)) {
        PZK_LOG_DEBUG("Assuming {} from file extension", codecName(*fromExtension));
        return *fromExtension;
    }
    throw UsageError("Cannot detect the codec of " + options_.inputPath.string() +
                     " (use -c)");
}

}  // namespace pzk::commands
