// =============================================================================
// pzkit - Compress Command
// =============================================================================
// Command handler for compressing a file with an external codec tool.
//
// This module provides:
// - CompressCommand: runs the selected codec over one input
// - CompressOptions: configuration mapped from the command line
// =============================================================================

#ifndef PZK_COMMANDS_COMPRESS_COMMAND_H
#define PZK_COMMANDS_COMPRESS_COMMAND_H

#include <filesystem>
#include <memory>

#include "pzk/common/error.h"
#include "pzk/common/types.h"
#include "pzk/io/compressed_stream.h"

namespace pzk::commands {

// =============================================================================
// Compression Options
// =============================================================================

/// @brief Configuration options for compression.
struct CompressOptions {
    /// @brief Input file path ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Output file path (empty = input path plus codec extension).
    std::filesystem::path outputPath;

    /// @brief Codec to compress with.
    CodecKind codec = CodecKind::kBzip2;

    /// @brief Compression level (0 = tool default).
    int compressionLevel = 0;

    /// @brief Parallel tool preference.
    ParallelismPreference parallelism = ParallelismPreference::automatic();

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;
};

// =============================================================================
// CompressCommand Class
// =============================================================================

/// @brief Command handler for compression.
class CompressCommand {
public:
    explicit CompressCommand(CompressOptions options);

    ~CompressCommand();

    // Non-copyable, movable
    CompressCommand(const CompressCommand&) = delete;
    CompressCommand& operator=(const CompressCommand&) = delete;
    CompressCommand(CompressCommand&&) noexcept;
    CompressCommand& operator=(CompressCommand&&) noexcept;

    /// @brief Execute the compression command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const CompressOptions& options() const noexcept { return options_; }

private:
    /// @brief Validate paths and fill in the default output.
    void validateOptions();

    CompressOptions options_;
};

/// @brief Refuse to replace an existing output unless forced.
/// @throws IOError if the output exists and force is not set.
void checkOutputWritable(const std::filesystem::path& outputPath, bool force);

/// @brief Log what a one-shot transform did.
void logTransformSummary(Direction direction, const std::filesystem::path& inputPath,
                         const std::filesystem::path& outputPath,
                         const io::TransformSummary& summary);

}  // namespace pzk::commands

#endif  // PZK_COMMANDS_COMPRESS_COMMAND_H
