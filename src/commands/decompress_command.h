// =============================================================================
// pzkit - Decompress Command
// =============================================================================
// Command handler for decompressing a file with an external codec tool.
// The codec is taken from the command line, else detected from the input's
// magic bytes, else from its extension.
// =============================================================================

#ifndef PZK_COMMANDS_DECOMPRESS_COMMAND_H
#define PZK_COMMANDS_DECOMPRESS_COMMAND_H

#include <filesystem>
#include <optional>

#include "pzk/common/error.h"
#include "pzk/common/types.h"

namespace pzk::commands {

/// @brief Configuration options for decompression.
struct DecompressOptions {
    /// @brief Input file path.
    std::filesystem::path inputPath;

    /// @brief Output file path ("-" for stdout, empty = input without extension).
    std::filesystem::path outputPath;

    /// @brief Codec override (std::nullopt = detect).
    std::optional<CodecKind> codec;

    /// @brief Parallel tool preference.
    ParallelismPreference parallelism = ParallelismPreference::automatic();

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;
};

/// @brief Command handler for decompression.
class DecompressCommand {
public:
    explicit DecompressCommand(DecompressOptions options);

    ~DecompressCommand();

    // Non-copyable, movable
    DecompressCommand(const DecompressCommand&) = delete;
    DecompressCommand& operator=(const DecompressCommand&) = delete;
    DecompressCommand(DecompressCommand&&) noexcept;
    DecompressCommand& operator=(DecompressCommand&&) noexcept;

    /// @brief Execute the decompression command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const DecompressOptions& options() const noexcept { return options_; }

private:
    void validateOptions();

    /// @brief Pick the codec: override, then magic bytes, then extension.
    /// @throws UsageError if none applies.
    [[nodiscard]] CodecKind resolveCodec() const;

    DecompressOptions options_;
};

/// @brief Default output path: the input with its codec extension removed.
/// @throws UsageError if the input has no recognized extension.
[[nodiscard]] std::filesystem::path defaultDecompressedPath(const std::filesystem::path& input);

}  // namespace pzk::commands

#endif  // PZK_COMMANDS_DECOMPRESS_COMMAND_H
