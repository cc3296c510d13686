// =============================================================================
// pzkit - Atomic File Writer Implementation
// =============================================================================

#include "pzk/io/atomic_file.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "pzk/common/logger.h"

namespace pzk::io {

namespace {

/// @brief Build the mkstemp template "<dir>/.<name>.XXXXXX".
std::string tempTemplateFor(const std::filesystem::path& target) {
    std::filesystem::path dir = target.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    return (dir / ("." + target.filename().string() + ".XXXXXX")).string();
}

/// @brief fsync a directory so a rename inside it is durable.
void syncDirectory(const std::filesystem::path& dir) noexcept {
    const std::filesystem::path target = dir.empty() ? std::filesystem::path(".") : dir;
    const int dirFd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd < 0) {
        return;
    }
    if (::fsync(dirFd) != 0) {
        PZK_LOG_DEBUG("fsync of directory {} failed", target.string());
    }
    ::close(dirFd);
}

/// @brief The process umask, read without modifying it where procfs allows.
mode_t processUmask() {
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (!line.starts_with("Umask:")) {
            continue;
        }
        const auto begin = line.find_first_not_of(" \t", 6);
        if (begin == std::string::npos) {
            break;
        }
        unsigned int value = 0;
        const char* first = line.data() + begin;
        const char* last = line.data() + line.size();
        if (std::from_chars(first, last, value, 8).ec == std::errc{}) {
            return static_cast<mode_t>(value & 0777);
        }
        break;
    }
    const mode_t mask = ::umask(0);
    ::umask(mask);
    return mask;
}

/// @brief Permission bits for the published file: an existing target keeps its
///        own, a new one gets the requested mode minus the umask.
mode_t publishedMode(const std::filesystem::path& target, mode_t requested) {
    struct stat st{};
    if (::stat(target.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
        return st.st_mode & 07777;
    }
    return requested & ~processUmask() & 07777;
}

}  // namespace

std::string_view atomicWriteStateName(AtomicWriteState state) noexcept {
    switch (state) {
        case AtomicWriteState::kActive:
            return "active";
        case AtomicWriteState::kCommitted:
            return "committed";
        case AtomicWriteState::kDiscarded:
            return "discarded";
    }
    return "unknown";
}

// =============================================================================
// AtomicFile Implementation
// =============================================================================

AtomicFile::AtomicFile(std::filesystem::path targetPath, mode_t mode)
    : targetPath_(std::move(targetPath)), mode_(mode) {
    if (targetPath_.empty() || !targetPath_.has_filename()) {
        throw InvalidArgumentError("atomic file target must name a file: " +
                                   targetPath_.string());
    }

    std::string pattern = tempTemplateFor(targetPath_);
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    fd_ = ::mkostemp(buffer.data(), O_CLOEXEC);
    if (fd_ < 0) {
        state_ = AtomicWriteState::kDiscarded;
        throw IOError::fromErrno("Failed to create temporary file",
                                 ErrorContext(targetPath_.string()));
    }
    tempPath_ = buffer.data();

    PZK_LOG_DEBUG("AtomicFile created: target={}, temp={}", targetPath_.string(),
                  tempPath_.string());
}

AtomicFile::~AtomicFile() {
    if (state_ == AtomicWriteState::kActive) {
        PZK_LOG_DEBUG("AtomicFile released without commit, discarding: {}",
                      targetPath_.string());
        removeTemp();
        state_ = AtomicWriteState::kDiscarded;
    }
}

AtomicFile::AtomicFile(AtomicFile&& other) noexcept
    : targetPath_(std::move(other.targetPath_)),
      tempPath_(std::move(other.tempPath_)),
      mode_(other.mode_),
      fd_(std::exchange(other.fd_, -1)),
      state_(std::exchange(other.state_, AtomicWriteState::kDiscarded)),
      bytesWritten_(other.bytesWritten_) {}

AtomicFile& AtomicFile::operator=(AtomicFile&& other) noexcept {
    if (this != &other) {
        if (state_ == AtomicWriteState::kActive) {
            removeTemp();
        }
        targetPath_ = std::move(other.targetPath_);
        tempPath_ = std::move(other.tempPath_);
        mode_ = other.mode_;
        fd_ = std::exchange(other.fd_, -1);
        state_ = std::exchange(other.state_, AtomicWriteState::kDiscarded);
        bytesWritten_ = other.bytesWritten_;
    }
    return *this;
}

void AtomicFile::requireActive(std::string_view operation) const {
    if (state_ != AtomicWriteState::kActive) {
        throw InvalidStateError(std::string(operation) + " on " +
                                    std::string(atomicWriteStateName(state_)) + " atomic file",
                                ErrorContext(targetPath_.string()));
    }
}

void AtomicFile::write(std::span<const std::uint8_t> data) {
    requireActive("write");

    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::write(fd_, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IOError::fromErrno("Failed to write temporary file",
                                     ErrorContext(tempPath_.string()).withOffset(bytesWritten_));
        }
        offset += static_cast<std::size_t>(written);
        bytesWritten_ += static_cast<std::uint64_t>(written);
    }
}

void AtomicFile::write(std::string_view text) {
    write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                        text.size()));
}

void AtomicFile::commit() {
    requireActive("commit");

    auto fail = [this](const char* what) {
        IOError error = IOError::fromErrno(what, ErrorContext(targetPath_.string()));
        removeTemp();
        state_ = AtomicWriteState::kDiscarded;
        return error;
    };

    if (::fsync(fd_) != 0) {
        throw fail("Failed to sync temporary file");
    }
    if (::fchmod(fd_, publishedMode(targetPath_, mode_)) != 0) {
        throw fail("Failed to set permissions on temporary file");
    }
    if (::close(fd_) != 0) {
        fd_ = -1;
        throw fail("Failed to close temporary file");
    }
    fd_ = -1;

    // Atomic rename: temp -> final
    if (::rename(tempPath_.c_str(), targetPath_.c_str()) != 0) {
        throw fail("Failed to rename temporary file to target");
    }
    state_ = AtomicWriteState::kCommitted;
    syncDirectory(targetPath_.parent_path());

    PZK_LOG_DEBUG("AtomicFile committed: {} ({} bytes)", targetPath_.string(), bytesWritten_);
}

void AtomicFile::discard() {
    if (state_ == AtomicWriteState::kDiscarded) {
        return;
    }
    requireActive("discard");

    removeTemp();
    state_ = AtomicWriteState::kDiscarded;
    PZK_LOG_DEBUG("AtomicFile discarded: {}", targetPath_.string());
}

void AtomicFile::removeTemp() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!tempPath_.empty() && ::unlink(tempPath_.c_str()) != 0 && errno != ENOENT) {
        PZK_LOG_WARNING("Failed to remove temporary file: {}", tempPath_.string());
    }
}

}  // namespace pzk::io
