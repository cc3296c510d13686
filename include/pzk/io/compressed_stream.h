// =============================================================================
// pzkit - Compressed Stream Support
// =============================================================================
// Streams data through an external compression tool.
//
// This module provides:
// - Codec detection from magic bytes and file extensions
// - CompressionStream: a writer (caller writes, tool output lands atomically
//   in a file) or a reader (tool reads a file, caller reads tool output)
// - One-shot file and in-memory helpers built on the same orchestration
//
// Usage:
//   auto writer = CompressionStream::openWriter(CodecKind::kBzip2,
//                                               Direction::kCompress,
//                                               "/tmp/data.bz2");
//   writer.write(payload);
//   writer.close();  // commits /tmp/data.bz2 only if the tool exited 0
//
// Pipes provide back-pressure: write() and read() block on the OS pipe and
// nothing is buffered beyond it.
// =============================================================================

#ifndef PZK_IO_COMPRESSED_STREAM_H
#define PZK_IO_COMPRESSED_STREAM_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pzk/codec/backend_registry.h"
#include "pzk/common/error.h"
#include "pzk/common/types.h"
#include "pzk/io/atomic_file.h"
#include "pzk/io/subprocess.h"

namespace pzk::io {

// =============================================================================
// Codec Detection
// =============================================================================

/// @brief Detect the codec of compressed data from its magic bytes.
/// @param data First bytes of the data.
/// @return Detected codec, or std::nullopt if none matches.
[[nodiscard]] std::optional<CodecKind> detectCodec(std::span<const std::uint8_t> data);

/// @brief Detect the codec of a file from its magic bytes.
/// @throws IOError if the file cannot be read.
[[nodiscard]] std::optional<CodecKind> detectCodecFromFile(const std::filesystem::path& path);

/// @brief Detect the codec from a file extension (.bz2, .gz, .xz, .zst, ...).
[[nodiscard]] std::optional<CodecKind> detectCodecFromExtension(
    const std::filesystem::path& path);

/// @brief Canonical file extension for a codec (e.g., ".bz2").
[[nodiscard]] std::string_view codecExtension(CodecKind codec) noexcept;

// =============================================================================
// Stream Options
// =============================================================================

/// @brief Lifecycle state of a compression stream.
enum class StreamState : std::uint8_t {
    kOpen = 0,
    kClosed = 1,
    /// @brief A read or write failed; only close() is meaningful.
    kFailed = 2
};

/// @brief Get a name for a stream state.
[[nodiscard]] std::string_view streamStateName(StreamState state) noexcept;

/// @brief Options shared by streams and one-shot helpers.
struct StreamOptions {
    /// @brief Whether (and how widely) to use parallel tools.
    ParallelismPreference parallelism = ParallelismPreference::automatic();

    /// @brief Compression level passed as "-<level>" (0 = tool default).
    ///        Compressing above maxCompressionLevel(codec) throws InvalidArgumentError.
    int level = 0;

    /// @brief Registry to resolve backends from (nullptr = process-wide).
    const codec::BackendRegistry* registry = nullptr;

    /// @brief Core count used to size workers (0 = detected).
    std::size_t availableCores = 0;
};

/// @brief What a one-shot transform ran and produced.
struct TransformSummary {
    std::string toolName;
    std::size_t workers = 1;
    std::uint64_t outputBytes = 0;
};

// =============================================================================
// CompressionStream
// =============================================================================

/// @brief A running external tool fed or drained by the caller.
/// @note Not thread-safe; one stream is driven by one thread at a time.
class CompressionStream {
public:
    /// @brief Open a stream whose output is written atomically to a file.
    /// @param codec Codec to run.
    /// @param direction Compress or decompress.
    /// @param outputPath File receiving the tool's output on successful close().
    /// @param options Backend selection options.
    /// @throws BackendUnavailableError if no tool is installed (no file is created).
    /// @throws IOError if the temporary output or the process cannot be created.
    [[nodiscard]] static CompressionStream openWriter(CodecKind codec, Direction direction,
                                                      const std::filesystem::path& outputPath,
                                                      const StreamOptions& options = {});

    /// @brief Open a stream whose input is a file and whose output is read().
    /// @throws BackendUnavailableError if no tool is installed.
    /// @throws IOError if the input cannot be opened or the process cannot start.
    [[nodiscard]] static CompressionStream openReader(CodecKind codec, Direction direction,
                                                      const std::filesystem::path& inputPath,
                                                      const StreamOptions& options = {});

    /// @brief Destructor; discards uncommitted output and reaps the tool.
    ~CompressionStream();

    // Non-copyable
    CompressionStream(const CompressionStream&) = delete;
    CompressionStream& operator=(const CompressionStream&) = delete;

    // Movable
    CompressionStream(CompressionStream&& other) noexcept;
    CompressionStream& operator=(CompressionStream&& other) noexcept;

    /// @brief Feed bytes to the tool (writer streams only).
    /// @throws InvalidStateError on a reader stream or after close/failure.
    /// @throws BackendProcessFailedError if the tool died while being fed.
    void write(std::span<const std::uint8_t> data);

    /// @brief Feed text to the tool (writer streams only).
    void write(std::string_view text);

    /// @brief Read up to maxBytes of tool output (reader streams only).
    /// @return Bytes read; empty once the tool's output is exhausted.
    /// @throws InvalidStateError on a writer stream or after close/failure.
    [[nodiscard]] std::vector<std::uint8_t> read(std::size_t maxBytes);

    /// @brief Finish the stream and wait for the tool.
    /// @throws BackendProcessFailedError if the tool failed (writer output is discarded).
    /// @throws InvalidStateError if already closed.
    void close();

    [[nodiscard]] CodecKind codec() const noexcept { return codec_; }

    [[nodiscard]] Direction direction() const noexcept { return direction_; }

    [[nodiscard]] bool isWriter() const noexcept { return output_.has_value(); }

    [[nodiscard]] StreamState state() const noexcept { return state_; }

    /// @brief Name of the tool running the stream.
    [[nodiscard]] const std::string& toolName() const noexcept { return toolName_; }

    /// @brief Worker count requested from the tool.
    [[nodiscard]] std::size_t workers() const noexcept { return workers_; }

    /// @brief State of the atomic output (writer streams only).
    [[nodiscard]] std::optional<AtomicWriteState> outputState() const noexcept;

    /// @brief Whether a reader stream has reached the end of tool output.
    [[nodiscard]] bool eof() const noexcept { return eof_; }

private:
    CompressionStream(CodecKind codec, Direction direction, std::string toolName,
                      std::size_t workers, Subprocess process,
                      std::optional<AtomicFile> output) noexcept;

    void requireOpen(std::string_view operation) const;
    [[noreturn]] void failWithProcessStatus(const std::exception_ptr& cause);
    void closeWriter(const ExitStatus& status, bool failed);
    void closeReader(const ExitStatus& status, bool failed);
    void abandon() noexcept;

    CodecKind codec_ = CodecKind::kGzip;
    Direction direction_ = Direction::kCompress;
    std::string toolName_;
    std::size_t workers_ = 1;
    std::optional<Subprocess> process_;
    std::optional<AtomicFile> output_;
    StreamState state_ = StreamState::kClosed;
    bool eof_ = false;
};

// =============================================================================
// One-shot Helpers
// =============================================================================

/// @brief Run a codec over a whole file.
/// @param input Input file, or "-" for stdin.
/// @param output Output file written atomically, or "-" for stdout.
/// @throws BackendUnavailableError, BackendProcessFailedError, IOError.
TransformSummary transformFile(CodecKind codec, Direction direction,
                               const std::filesystem::path& input,
                               const std::filesystem::path& output,
                               const StreamOptions& options = {});

/// @brief Compress a file into another file.
inline TransformSummary compressFile(CodecKind codec, const std::filesystem::path& input,
                                     const std::filesystem::path& output,
                                     const StreamOptions& options = {}) {
    return transformFile(codec, Direction::kCompress, input, output, options);
}

/// @brief Decompress a file into another file.
inline TransformSummary decompressFile(CodecKind codec, const std::filesystem::path& input,
                                       const std::filesystem::path& output,
                                       const StreamOptions& options = {}) {
    return transformFile(codec, Direction::kDecompress, input, output, options);
}

/// @brief Run a codec over an in-memory buffer.
/// @throws BackendUnavailableError, BackendProcessFailedError, IOError.
[[nodiscard]] std::vector<std::uint8_t> transformData(CodecKind codec, Direction direction,
                                                      std::span<const std::uint8_t> data,
                                                      const StreamOptions& options = {});

/// @brief Compress an in-memory buffer.
[[nodiscard]] inline std::vector<std::uint8_t> compressData(CodecKind codec,
                                                            std::span<const std::uint8_t> data,
                                                            const StreamOptions& options = {}) {
    return transformData(codec, Direction::kCompress, data, options);
}

/// @brief Decompress an in-memory buffer.
[[nodiscard]] inline std::vector<std::uint8_t> decompressData(CodecKind codec,
                                                              std::span<const std::uint8_t> data,
                                                              const StreamOptions& options = {}) {
    return transformData(codec, Direction::kDecompress, data, options);
}

}  // namespace pzk::io

#endif  // PZK_IO_COMPRESSED_STREAM_H
