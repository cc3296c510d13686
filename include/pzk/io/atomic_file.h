// =============================================================================
// pzkit - Atomic File Writer
// =============================================================================
// Scoped writer that buffers output in a temporary file next to the target
// and either commits it with a single rename or discards it.
//
// Key features:
// - Temporary file created with mkstemp in the target's directory, so the
//   final rename stays on one filesystem
// - commit(): fsync, chmod, rename over the target, fsync the directory
// - discard(): unlink the temporary file, target untouched
// - Destruction while still active discards
//
// The target path never exposes partially written content. Concurrent
// writers to the same target race at rename time and the last rename wins.
//
// Usage:
//   pzk::io::AtomicFile out("/path/to/archive.tar.bz2");
//   out.write(data);
//   out.commit();
// =============================================================================

#ifndef PZK_IO_ATOMIC_FILE_H
#define PZK_IO_ATOMIC_FILE_H

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

#include "pzk/common/error.h"

namespace pzk::io {

/// @brief Default creation mode of committed files, before the umask.
inline constexpr mode_t kDefaultFileMode = 0666;

/// @brief Lifecycle state of an AtomicFile.
enum class AtomicWriteState : std::uint8_t {
    kActive = 0,
    kCommitted = 1,
    kDiscarded = 2
};

/// @brief Get a name for an atomic write state.
[[nodiscard]] std::string_view atomicWriteStateName(AtomicWriteState state) noexcept;

// =============================================================================
// AtomicFile
// =============================================================================

/// @brief Write-to-temp-then-rename file handle.
class AtomicFile {
public:
    /// @brief Create the temporary file for a target.
    /// @param targetPath Final location of the file.
    /// @param mode Creation mode of a new target, masked by the umask like
    ///        open(2). An existing target keeps its permission bits.
    /// @throws IOError if the temporary file cannot be created.
    explicit AtomicFile(std::filesystem::path targetPath, mode_t mode = kDefaultFileMode);

    /// @brief Destructor; discards the temporary file if still active.
    ~AtomicFile();

    // Non-copyable
    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    // Movable
    AtomicFile(AtomicFile&& other) noexcept;
    AtomicFile& operator=(AtomicFile&& other) noexcept;

    /// @brief Append bytes to the temporary file.
    /// @throws InvalidStateError if the file is no longer active.
    /// @throws IOError on write failure.
    void write(std::span<const std::uint8_t> data);

    /// @brief Append text to the temporary file.
    void write(std::string_view text);

    /// @brief Publish the written content at the target path.
    /// @throws InvalidStateError if the file is no longer active.
    /// @throws IOError if syncing or renaming fails (the file is discarded).
    void commit();

    /// @brief Drop the written content, leaving the target untouched.
    /// @note No-op when already discarded.
    /// @throws InvalidStateError if the file was already committed.
    void discard();

    /// @brief Record that bytes were written to fd() by another party.
    /// @note Used when a child process writes directly into the descriptor.
    void noteExternalWrite(std::uint64_t bytes) noexcept { bytesWritten_ += bytes; }

    /// @brief Descriptor of the temporary file (-1 once released).
    [[nodiscard]] int fd() const noexcept { return fd_; }

    /// @brief Current lifecycle state.
    [[nodiscard]] AtomicWriteState state() const noexcept { return state_; }

    /// @brief Whether the handle still accepts writes.
    [[nodiscard]] bool isActive() const noexcept { return state_ == AtomicWriteState::kActive; }

    [[nodiscard]] const std::filesystem::path& targetPath() const noexcept { return targetPath_; }

    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

    /// @brief Bytes written through write() (and noted external writes).
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytesWritten_; }

private:
    void requireActive(std::string_view operation) const;

    /// @brief Close the descriptor and unlink the temporary file.
    void removeTemp() noexcept;

    std::filesystem::path targetPath_;
    std::filesystem::path tempPath_;
    mode_t mode_ = kDefaultFileMode;
    int fd_ = -1;
    AtomicWriteState state_ = AtomicWriteState::kActive;
    std::uint64_t bytesWritten_ = 0;
};

}  // namespace pzk::io

#endif  // PZK_IO_ATOMIC_FILE_H
