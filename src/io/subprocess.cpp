// =============================================================================
// pzkit - Subprocess Launcher Implementation
// =============================================================================

#include "pzk/io/subprocess.h"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <utility>

#include <fmt/format.h>

#include "pzk/common/logger.h"

extern char** environ;

namespace pzk::io {

namespace {

/// @brief Pipe pair closed on scope exit unless released.
struct PipePair {
    std::array<int, 2> fds{-1, -1};

    ~PipePair() {
        for (int& fd : fds) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    int releaseRead() noexcept { return std::exchange(fds[0], -1); }
    int releaseWrite() noexcept { return std::exchange(fds[1], -1); }
};

/// @brief Owns posix_spawn file actions and attributes.
class SpawnConfig {
public:
    SpawnConfig() {
        posix_spawn_file_actions_init(&actions_);
        posix_spawnattr_init(&attr_);

        // Children get default SIGPIPE handling even if this process ignores it
        sigset_t defaults;
        sigemptyset(&defaults);
        sigaddset(&defaults, SIGPIPE);
        posix_spawnattr_setsigdefault(&attr_, &defaults);
        posix_spawnattr_setflags(&attr_, POSIX_SPAWN_SETSIGDEF);
    }

    ~SpawnConfig() {
        posix_spawn_file_actions_destroy(&actions_);
        posix_spawnattr_destroy(&attr_);
    }

    SpawnConfig(const SpawnConfig&) = delete;
    SpawnConfig& operator=(const SpawnConfig&) = delete;

    posix_spawn_file_actions_t* actions() noexcept { return &actions_; }
    posix_spawnattr_t* attr() noexcept { return &attr_; }

private:
    posix_spawn_file_actions_t actions_;
    posix_spawnattr_t attr_;
};

/// @brief Wire one standard stream of the child.
/// @param childFd 0, 1 or 2.
/// @param childReads Whether the child reads from this stream.
/// @param pipe Pipe to use for kPipe mode.
/// @return 0 on success, an errno value otherwise.
int wireStdio(SpawnConfig& config, const StdioSpec& spec, int childFd, bool childReads,
              PipePair& pipe) {
    switch (spec.mode) {
        case StdioSpec::Mode::kInherit:
            return 0;
        case StdioSpec::Mode::kPipe: {
            if (::pipe2(pipe.fds.data(), O_CLOEXEC) != 0) {
                return errno;
            }
            const int childEnd = childReads ? pipe.fds[0] : pipe.fds[1];
            return posix_spawn_file_actions_adddup2(config.actions(), childEnd, childFd);
        }
        case StdioSpec::Mode::kFd:
            if (spec.fd < 0) {
                return EBADF;
            }
            return posix_spawn_file_actions_adddup2(config.actions(), spec.fd, childFd);
        case StdioSpec::Mode::kNull:
            return posix_spawn_file_actions_addopen(config.actions(), childFd, "/dev/null",
                                                    childReads ? O_RDONLY : O_WRONLY, 0);
    }
    return EINVAL;
}

}  // namespace

// =============================================================================
// ExitStatus Implementation
// =============================================================================

std::string ExitStatus::describe() const {
    if (signal != 0) {
        return fmt::format("signal {}", signal);
    }
    return fmt::format("exit {}", exitCode);
}

ExitStatus ExitStatus::fromWaitStatus(int status) noexcept {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction current {};
        if (::sigaction(SIGPIPE, nullptr, &current) != 0) {
            return;
        }
        // Respect a handler installed by the embedding application
        if (current.sa_handler != SIG_DFL) {
            return;
        }
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        if (::sigaction(SIGPIPE, &ignore, nullptr) == 0) {
            PZK_LOG_DEBUG("SIGPIPE ignored for pipe-driven backends");
        }
    });
}

// =============================================================================
// Subprocess Implementation
// =============================================================================

Result<Subprocess> Subprocess::spawn(const std::vector<std::string>& argv, StdioSpec in,
                                     StdioSpec out, StdioSpec err) {
    if (argv.empty()) {
        return makeError<Subprocess>(ErrorCode::kInvalidArgument, "empty command line");
    }

    SpawnConfig config;
    PipePair inPipe;
    PipePair outPipe;
    PipePair errPipe;

    int rc = wireStdio(config, in, STDIN_FILENO, true, inPipe);
    if (rc == 0) {
        rc = wireStdio(config, out, STDOUT_FILENO, false, outPipe);
    }
    if (rc == 0) {
        if (err.mode == StdioSpec::Mode::kPipe) {
            // stderr is never drained by the parent; a pipe could stall the child
            err = StdioSpec::devNull();
        }
        rc = wireStdio(config, err, STDERR_FILENO, false, errPipe);
    }
    if (rc != 0) {
        return makeError<Subprocess>(
            ErrorCode::kIOError,
            fmt::format("Failed to prepare stdio for {}: {}", argv.front(), std::strerror(rc)));
    }

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    pid_t pid = -1;
    rc = posix_spawnp(&pid, argv.front().c_str(), config.actions(), config.attr(), cargs.data(),
                      environ);
    if (rc != 0) {
        return makeError<Subprocess>(
            ErrorCode::kIOError,
            fmt::format("Failed to spawn {}: {}", argv.front(), std::strerror(rc)));
    }

    // The child's pipe ends are closed by the PipePair destructors
    const int stdinFd = in.mode == StdioSpec::Mode::kPipe ? inPipe.releaseWrite() : -1;
    const int stdoutFd = out.mode == StdioSpec::Mode::kPipe ? outPipe.releaseRead() : -1;

    PZK_LOG_DEBUG("Spawned {} (pid {})", argv.front(), static_cast<int>(pid));
    return Subprocess(pid, argv.front(), stdinFd, stdoutFd);
}

Subprocess::~Subprocess() { release(); }

Subprocess::Subprocess(Subprocess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      program_(std::move(other.program_)),
      stdinFd_(std::exchange(other.stdinFd_, -1)),
      stdoutFd_(std::exchange(other.stdoutFd_, -1)),
      status_(std::exchange(other.status_, std::nullopt)) {}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = std::exchange(other.pid_, -1);
        program_ = std::move(other.program_);
        stdinFd_ = std::exchange(other.stdinFd_, -1);
        stdoutFd_ = std::exchange(other.stdoutFd_, -1);
        status_ = std::exchange(other.status_, std::nullopt);
    }
    return *this;
}

void Subprocess::writeAll(std::span<const std::uint8_t> data) {
    if (stdinFd_ < 0) {
        throw InvalidStateError("stdin of " + program_ + " is not an open pipe");
    }

    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::write(stdinFd_, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IOError::fromErrno("Failed to write to " + program_,
                                     ErrorContext{}.withTool(program_));
        }
        offset += static_cast<std::size_t>(written);
    }
}

std::size_t Subprocess::readSome(std::span<std::uint8_t> buffer) {
    if (stdoutFd_ < 0) {
        throw InvalidStateError("stdout of " + program_ + " is not an open pipe");
    }

    for (;;) {
        const ssize_t count = ::read(stdoutFd_, buffer.data(), buffer.size());
        if (count >= 0) {
            return static_cast<std::size_t>(count);
        }
        if (errno != EINTR) {
            throw IOError::fromErrno("Failed to read from " + program_,
                                     ErrorContext{}.withTool(program_));
        }
    }
}

void Subprocess::closeStdin() noexcept {
    if (stdinFd_ >= 0) {
        ::close(stdinFd_);
        stdinFd_ = -1;
    }
}

void Subprocess::closeStdout() noexcept {
    if (stdoutFd_ >= 0) {
        ::close(stdoutFd_);
        stdoutFd_ = -1;
    }
}

ExitStatus Subprocess::wait() {
    if (status_.has_value()) {
        return *status_;
    }
    if (pid_ < 0) {
        throw InvalidStateError("wait on a subprocess that was never started");
    }

    int rawStatus = 0;
    pid_t result = -1;
    do {
        result = ::waitpid(pid_, &rawStatus, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        PZK_LOG_WARNING("waitpid failed for {} (pid {}): {}", program_, static_cast<int>(pid_),
                        std::strerror(errno));
        status_ = ExitStatus{-1, 0};
    } else {
        status_ = ExitStatus::fromWaitStatus(rawStatus);
    }

    PZK_LOG_DEBUG("{} (pid {}) finished: {}", program_, static_cast<int>(pid_),
                  status_->describe());
    return *status_;
}

void Subprocess::release() noexcept {
    closeStdin();
    closeStdout();
    if (pid_ >= 0 && !status_.has_value()) {
        int rawStatus = 0;
        while (::waitpid(pid_, &rawStatus, 0) < 0 && errno == EINTR) {
        }
        status_ = ExitStatus::fromWaitStatus(rawStatus);
    }
}

}  // namespace pzk::io
