// =============================================================================
// pzkit - Subprocess Launcher
// =============================================================================
// posix_spawn based child process with stdin/stdout wired to pipes or
// caller-provided descriptors.
//
// This module provides:
// - StdioSpec: how a child's stdin/stdout/stderr is connected
// - ExitStatus: decoded wait status
// - Subprocess: RAII owner of a child and its pipe ends; the destructor
//   closes the pipes and reaps the child so no zombie outlives the handle
// =============================================================================

#ifndef PZK_IO_SUBPROCESS_H
#define PZK_IO_SUBPROCESS_H

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "pzk/common/error.h"

namespace pzk::io {

// =============================================================================
// Stdio Wiring
// =============================================================================

/// @brief Connection of one standard stream of a child process.
struct StdioSpec {
    enum class Mode : std::uint8_t {
        kInherit = 0,  ///< Share the parent's descriptor
        kPipe = 1,     ///< New pipe, parent keeps the other end
        kFd = 2,       ///< Caller-provided descriptor (not owned)
        kNull = 3      ///< /dev/null
    };

    Mode mode = Mode::kInherit;
    int fd = -1;

    [[nodiscard]] static constexpr StdioSpec inherit() noexcept { return {Mode::kInherit, -1}; }
    [[nodiscard]] static constexpr StdioSpec pipe() noexcept { return {Mode::kPipe, -1}; }
    [[nodiscard]] static constexpr StdioSpec fromFd(int descriptor) noexcept {
        return {Mode::kFd, descriptor};
    }
    [[nodiscard]] static constexpr StdioSpec devNull() noexcept { return {Mode::kNull, -1}; }
};

// =============================================================================
// Exit Status
// =============================================================================

/// @brief Decoded child wait status.
struct ExitStatus {
    /// @brief Exit code (-1 if killed by a signal).
    int exitCode = -1;

    /// @brief Terminating signal (0 if exited normally).
    int signal = 0;

    [[nodiscard]] bool success() const noexcept { return signal == 0 && exitCode == 0; }

    /// @brief Human-readable description ("exit 1", "signal 13").
    [[nodiscard]] std::string describe() const;

    /// @brief Decode a raw waitpid() status.
    [[nodiscard]] static ExitStatus fromWaitStatus(int status) noexcept;
};

// =============================================================================
// Subprocess
// =============================================================================

/// @brief A spawned child process.
class Subprocess {
public:
    /// @brief Spawn a child.
    /// @param argv Program path (argv[0]) and arguments.
    /// @param in Child's stdin.
    /// @param out Child's stdout.
    /// @param err Child's stderr.
    /// @return The running child, or an I/O error if it could not be started.
    [[nodiscard]] static Result<Subprocess> spawn(const std::vector<std::string>& argv,
                                                  StdioSpec in, StdioSpec out,
                                                  StdioSpec err = StdioSpec::inherit());

    /// @brief Destructor; closes pipes and reaps the child.
    ~Subprocess();

    // Non-copyable
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Movable
    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& other) noexcept;

    /// @brief Write all bytes to the child's stdin pipe.
    /// @throws IOError on failure (EPIPE if the child stopped reading).
    void writeAll(std::span<const std::uint8_t> data);

    /// @brief Read up to buffer.size() bytes from the child's stdout pipe.
    /// @return Bytes read; 0 at end of stream.
    /// @throws IOError on failure.
    [[nodiscard]] std::size_t readSome(std::span<std::uint8_t> buffer);

    /// @brief Close the parent's end of the stdin pipe (signals EOF).
    void closeStdin() noexcept;

    /// @brief Close the parent's end of the stdout pipe.
    void closeStdout() noexcept;

    /// @brief Wait for the child to exit (idempotent).
    /// @return The decoded exit status.
    ExitStatus wait();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    [[nodiscard]] int stdinFd() const noexcept { return stdinFd_; }

    [[nodiscard]] int stdoutFd() const noexcept { return stdoutFd_; }

    [[nodiscard]] bool hasExited() const noexcept { return status_.has_value(); }

    [[nodiscard]] const std::string& program() const noexcept { return program_; }

private:
    Subprocess(pid_t pid, std::string program, int stdinFd, int stdoutFd) noexcept
        : pid_(pid), program_(std::move(program)), stdinFd_(stdinFd), stdoutFd_(stdoutFd) {}

    void release() noexcept;

    pid_t pid_ = -1;
    std::string program_;
    int stdinFd_ = -1;
    int stdoutFd_ = -1;
    std::optional<ExitStatus> status_;
};

/// @brief Make writes to closed pipes fail with EPIPE instead of SIGPIPE.
/// @note Installed once per process; spawned children get the default back.
void ignoreSigpipeOnce();

}  // namespace pzk::io

#endif  // PZK_IO_SUBPROCESS_H
