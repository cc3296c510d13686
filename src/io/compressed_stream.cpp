// =============================================================================
// pzkit - Compressed Stream Implementation
// =============================================================================
// Tool selection, process wiring and the stream lifecycle.
// =============================================================================

#include "pzk/io/compressed_stream.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <csignal>
#include <cstring>
#include <fstream>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "pzk/common/cpu_topology.h"
#include "pzk/common/logger.h"

namespace pzk::io {

// =============================================================================
// Magic Bytes for Codec Detection
// =============================================================================

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Bzip2 magic: 'B' 'Z' 'h'
constexpr std::uint8_t kBzip2Magic[] = {0x42, 0x5a, 0x68};

// XZ magic: 0xfd '7' 'z' 'X' 'Z' 0x00
constexpr std::uint8_t kXzMagic[] = {0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00};

// Zstd magic: 0x28 0xb5 0x2f 0xfd
constexpr std::uint8_t kZstdMagic[] = {0x28, 0xb5, 0x2f, 0xfd};

/// @brief Longest magic sequence above.
constexpr std::size_t kMaxMagicSize = sizeof(kXzMagic);

/// @brief Read size used when draining tool output in one-shot helpers.
constexpr std::size_t kPipeChunkSize = 64 * 1024;

template <std::size_t N>
bool hasMagic(std::span<const std::uint8_t> data, const std::uint8_t (&magic)[N]) {
    return data.size() >= N && std::memcmp(data.data(), magic, N) == 0;
}

/// @brief Owned file descriptor closed on scope exit.
class FileHandle {
public:
    explicit FileHandle(int fd = -1) noexcept : fd_(fd) {}
    ~FileHandle() { reset(); }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

int openInputFile(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw IOError::fromErrno("Failed to open input file", ErrorContext(path.string()));
    }
    return fd;
}

std::uint64_t descriptorSize(int fd) noexcept {
    struct stat info {};
    if (::fstat(fd, &info) != 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(info.st_size);
}

/// @brief Backend and worker count chosen for one stream.
struct BackendChoice {
    const codec::CodecDescriptor* descriptor = nullptr;
    std::size_t workers = 1;

    [[nodiscard]] std::vector<std::string> argv(Direction direction, int level) const {
        return descriptor->buildArgv(direction, workers, level);
    }
};

BackendChoice chooseBackend(CodecKind codec, Direction direction, const StreamOptions& options) {
    if (direction == Direction::kCompress &&
        (options.level < 0 || options.level > maxCompressionLevel(codec))) {
        throw InvalidArgumentError(fmt::format("{} compression level must be 0-{}, got {}",
                                               codecName(codec), maxCompressionLevel(codec),
                                               options.level));
    }

    const codec::BackendRegistry& registry =
        options.registry != nullptr ? *options.registry : codec::BackendRegistry::instance();
    const std::size_t cores =
        options.availableCores != 0 ? options.availableCores : availableParallelism();
    const std::size_t workers = options.parallelism.effectiveWorkers(cores);

    BackendChoice choice;
    choice.descriptor = &registry.resolve(codec, workers > 1);
    choice.workers = choice.descriptor->supportsParallel(direction) ? workers : 1;

    PZK_LOG_DEBUG("{} {}: using {} with {} worker(s)", codecName(codec), directionName(direction),
                  choice.descriptor->toolName, choice.workers);
    return choice;
}

BackendProcessFailedError processFailure(const std::string& tool, const ExitStatus& status) {
    return BackendProcessFailedError(tool, status.exitCode, status.signal);
}

}  // namespace

// =============================================================================
// Codec Detection
// =============================================================================

std::optional<CodecKind> detectCodec(std::span<const std::uint8_t> data) {
    if (hasMagic(data, kGzipMagic)) {
        return CodecKind::kGzip;
    }
    if (hasMagic(data, kBzip2Magic)) {
        return CodecKind::kBzip2;
    }
    if (hasMagic(data, kXzMagic)) {
        return CodecKind::kXz;
    }
    if (hasMagic(data, kZstdMagic)) {
        return CodecKind::kZstd;
    }
    return std::nullopt;
}

std::optional<CodecKind> detectCodecFromFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Failed to open file for codec detection", ErrorContext(path.string()));
    }

    std::array<char, kMaxMagicSize> header{};
    file.read(header.data(), static_cast<std::streamsize>(header.size()));
    const auto count = static_cast<std::size_t>(file.gcount());
    return detectCodec(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(header.data()), count));
}

std::optional<CodecKind> detectCodecFromExtension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".gz" || ext == ".gzip" || ext == ".tgz") {
        return CodecKind::kGzip;
    }
    if (ext == ".bz2" || ext == ".bzip2" || ext == ".tbz2") {
        return CodecKind::kBzip2;
    }
    if (ext == ".xz" || ext == ".txz") {
        return CodecKind::kXz;
    }
    if (ext == ".zst" || ext == ".zstd") {
        return CodecKind::kZstd;
    }
    return std::nullopt;
}

std::string_view codecExtension(CodecKind codec) noexcept {
    switch (codec) {
        case CodecKind::kBzip2:
            return ".bz2";
        case CodecKind::kGzip:
            return ".gz";
        case CodecKind::kXz:
            return ".xz";
        case CodecKind::kZstd:
            return ".zst";
    }
    return "";
}

std::string_view streamStateName(StreamState state) noexcept {
    switch (state) {
        case StreamState::kOpen:
            return "open";
        case StreamState::kClosed:
            return "closed";
        case StreamState::kFailed:
            return "failed";
    }
    return "unknown";
}

// =============================================================================
// CompressionStream Implementation
// =============================================================================

CompressionStream CompressionStream::openWriter(CodecKind codec, Direction direction,
                                                const std::filesystem::path& outputPath,
                                                const StreamOptions& options) {
    // Resolve first so an unavailable codec leaves no file behind
    const BackendChoice choice = chooseBackend(codec, direction, options);
    ignoreSigpipeOnce();

    AtomicFile output(outputPath);
    Subprocess process = unwrapOrThrow(Subprocess::spawn(
        choice.argv(direction, options.level), StdioSpec::pipe(), StdioSpec::fromFd(output.fd())));

    return CompressionStream(codec, direction, choice.descriptor->toolName, choice.workers,
                             std::move(process), std::move(output));
}

CompressionStream CompressionStream::openReader(CodecKind codec, Direction direction,
                                                const std::filesystem::path& inputPath,
                                                const StreamOptions& options) {
    const BackendChoice choice = chooseBackend(codec, direction, options);
    ignoreSigpipeOnce();

    // The child keeps its own copy of the input descriptor
    FileHandle input(openInputFile(inputPath));
    Subprocess process = unwrapOrThrow(Subprocess::spawn(choice.argv(direction, options.level),
                                                         StdioSpec::fromFd(input.get()),
                                                         StdioSpec::pipe()));

    return CompressionStream(codec, direction, choice.descriptor->toolName, choice.workers,
                             std::move(process), std::nullopt);
}

CompressionStream::CompressionStream(CodecKind codec, Direction direction, std::string toolName,
                                     std::size_t workers, Subprocess process,
                                     std::optional<AtomicFile> output) noexcept
    : codec_(codec),
      direction_(direction),
      toolName_(std::move(toolName)),
      workers_(workers),
      process_(std::move(process)),
      output_(std::move(output)),
      state_(StreamState::kOpen) {}

CompressionStream::~CompressionStream() { abandon(); }

CompressionStream::CompressionStream(CompressionStream&& other) noexcept
    : codec_(other.codec_),
      direction_(other.direction_),
      toolName_(std::move(other.toolName_)),
      workers_(other.workers_),
      process_(std::exchange(other.process_, std::nullopt)),
      output_(std::exchange(other.output_, std::nullopt)),
      state_(std::exchange(other.state_, StreamState::kClosed)),
      eof_(other.eof_) {}

CompressionStream& CompressionStream::operator=(CompressionStream&& other) noexcept {
    if (this != &other) {
        abandon();
        codec_ = other.codec_;
        direction_ = other.direction_;
        toolName_ = std::move(other.toolName_);
        workers_ = other.workers_;
        process_ = std::exchange(other.process_, std::nullopt);
        output_ = std::exchange(other.output_, std::nullopt);
        state_ = std::exchange(other.state_, StreamState::kClosed);
        eof_ = other.eof_;
    }
    return *this;
}

void CompressionStream::abandon() noexcept {
    if (!process_.has_value() || state_ == StreamState::kClosed) {
        return;
    }
    if (state_ == StreamState::kOpen) {
        PZK_LOG_WARNING("{} stream released without close, {}", toolName_,
                        output_.has_value() ? "discarding output" : "stopping tool");
    }

    // Reader: closing stdout stops the tool with SIGPIPE
    process_->closeStdin();
    process_->closeStdout();
    process_.reset();

    // An active AtomicFile discards itself on destruction
    output_.reset();
    state_ = StreamState::kClosed;
}

void CompressionStream::requireOpen(std::string_view operation) const {
    if (state_ != StreamState::kOpen) {
        throw InvalidStateError(fmt::format("{} on {} {} stream", operation,
                                            streamStateName(state_), toolName_),
                                ErrorContext{}.withTool(toolName_));
    }
}

void CompressionStream::failWithProcessStatus(const std::exception_ptr& cause) {
    state_ = StreamState::kFailed;
    process_->closeStdin();
    process_->closeStdout();

    const ExitStatus status = process_->wait();
    if (!status.success()) {
        throw processFailure(toolName_, status);
    }
    std::rethrow_exception(cause);
}

void CompressionStream::write(std::span<const std::uint8_t> data) {
    requireOpen("write");
    if (!output_.has_value()) {
        throw InvalidStateError("write on a reader stream", ErrorContext{}.withTool(toolName_));
    }

    try {
        process_->writeAll(data);
    } catch (const IOError&) {
        failWithProcessStatus(std::current_exception());
    }
}

void CompressionStream::write(std::string_view text) {
    write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                        text.size()));
}

std::vector<std::uint8_t> CompressionStream::read(std::size_t maxBytes) {
    requireOpen("read");
    if (output_.has_value()) {
        throw InvalidStateError("read on a writer stream", ErrorContext{}.withTool(toolName_));
    }
    if (eof_ || maxBytes == 0) {
        return {};
    }

    std::vector<std::uint8_t> buffer(maxBytes);
    std::size_t count = 0;
    try {
        count = process_->readSome(buffer);
    } catch (const IOError&) {
        failWithProcessStatus(std::current_exception());
    }

    if (count == 0) {
        eof_ = true;
    }
    buffer.resize(count);
    return buffer;
}

void CompressionStream::close() {
    if (state_ == StreamState::kClosed) {
        throw InvalidStateError("close on closed " + toolName_ + " stream",
                                ErrorContext{}.withTool(toolName_));
    }
    const bool failed = state_ == StreamState::kFailed;

    if (output_.has_value()) {
        process_->closeStdin();
    } else {
        process_->closeStdout();
    }
    const ExitStatus status = process_->wait();
    state_ = StreamState::kClosed;

    if (output_.has_value()) {
        closeWriter(status, failed);
    } else {
        closeReader(status, failed);
    }
}

void CompressionStream::closeWriter(const ExitStatus& status, bool failed) {
    if (failed || !status.success()) {
        output_->discard();
        throw processFailure(toolName_, status);
    }

    output_->noteExternalWrite(descriptorSize(output_->fd()));
    output_->commit();
}

void CompressionStream::closeReader(const ExitStatus& status, bool failed) {
    if (failed) {
        throw processFailure(toolName_, status);
    }
    if (status.success()) {
        return;
    }
    // Output abandoned before EOF: the tool dying on the closed pipe is expected
    if (!eof_ && status.signal == SIGPIPE) {
        PZK_LOG_DEBUG("{} stopped by SIGPIPE after early close", toolName_);
        return;
    }
    throw processFailure(toolName_, status);
}

std::optional<AtomicWriteState> CompressionStream::outputState() const noexcept {
    if (!output_.has_value()) {
        return std::nullopt;
    }
    return output_->state();
}

// =============================================================================
// One-shot Helpers
// =============================================================================

TransformSummary transformFile(CodecKind codec, Direction direction,
                               const std::filesystem::path& input,
                               const std::filesystem::path& output,
                               const StreamOptions& options) {
    const BackendChoice choice = chooseBackend(codec, direction, options);
    const bool fromStdin = input == "-";
    const bool toStdout = output == "-";

    FileHandle inputFile(fromStdin ? -1 : openInputFile(input));
    std::optional<AtomicFile> outputFile;
    if (!toStdout) {
        outputFile.emplace(output);
    }

    const StdioSpec in = fromStdin ? StdioSpec::inherit() : StdioSpec::fromFd(inputFile.get());
    const StdioSpec out = toStdout ? StdioSpec::inherit() : StdioSpec::fromFd(outputFile->fd());
    Subprocess process =
        unwrapOrThrow(Subprocess::spawn(choice.argv(direction, options.level), in, out));
    inputFile.reset();

    const ExitStatus status = process.wait();
    if (!status.success()) {
        if (outputFile.has_value()) {
            outputFile->discard();
        }
        throw processFailure(choice.descriptor->toolName, status);
    }

    TransformSummary summary;
    summary.toolName = choice.descriptor->toolName;
    summary.workers = choice.workers;
    if (outputFile.has_value()) {
        summary.outputBytes = descriptorSize(outputFile->fd());
        outputFile->noteExternalWrite(summary.outputBytes);
        outputFile->commit();
    }

    PZK_LOG_DEBUG("{} {} -> {}: {} bytes via {}", directionName(direction), input.string(),
                  output.string(), summary.outputBytes, summary.toolName);
    return summary;
}

std::vector<std::uint8_t> transformData(CodecKind codec, Direction direction,
                                        std::span<const std::uint8_t> data,
                                        const StreamOptions& options) {
    const BackendChoice choice = chooseBackend(codec, direction, options);
    ignoreSigpipeOnce();

    Subprocess process = unwrapOrThrow(Subprocess::spawn(
        choice.argv(direction, options.level), StdioSpec::pipe(), StdioSpec::pipe()));

    // Feed stdin from a second thread so a full stdout pipe cannot deadlock us
    std::exception_ptr feedError;
    std::thread feeder([&process, data, &feedError]() {
        try {
            process.writeAll(data);
        } catch (const PZKException&) {
            feedError = std::current_exception();
        }
        process.closeStdin();
    });

    std::vector<std::uint8_t> result;
    std::vector<std::uint8_t> buffer(kPipeChunkSize);
    try {
        for (;;) {
            const std::size_t count = process.readSome(buffer);
            if (count == 0) {
                break;
            }
            result.insert(result.end(), buffer.begin(),
                          buffer.begin() + static_cast<std::ptrdiff_t>(count));
        }
    } catch (...) {
        // Unblock the feeder before propagating
        process.closeStdout();
        feeder.join();
        throw;
    }
    feeder.join();

    const ExitStatus status = process.wait();
    if (!status.success()) {
        throw processFailure(choice.descriptor->toolName, status);
    }
    if (feedError) {
        std::rethrow_exception(feedError);
    }
    return result;
}

}  // namespace pzk::io
