// =============================================================================
// pzkit - Subprocess Tests
// =============================================================================
// Unit tests for spawning children with piped or redirected stdio.
// =============================================================================

#include "pzk/io/subprocess.h"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <csignal>
#include <cstdint>
#include <string>
#include <vector>

#include "support/scratch_dir.h"

namespace pzk::io {
namespace {

using test::readFile;
using test::ScratchDir;

std::span<const std::uint8_t> asBytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

std::string readAll(Subprocess& process) {
    std::string out;
    std::vector<std::uint8_t> buffer(4096);
    for (;;) {
        const auto count = process.readSome(buffer);
        if (count == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buffer.data()), count);
    }
    return out;
}

// =============================================================================
// ExitStatus Tests
// =============================================================================

TEST(ExitStatusTest, DecodesExit) {
    // Encoded as by waitpid: exit code in bits 8-15
    auto status = ExitStatus::fromWaitStatus(3 << 8);
    EXPECT_EQ(status.exitCode, 3);
    EXPECT_EQ(status.signal, 0);
    EXPECT_FALSE(status.success());
    EXPECT_EQ(status.describe(), "exit 3");

    EXPECT_TRUE(ExitStatus::fromWaitStatus(0).success());
}

TEST(ExitStatusTest, DescribesSignal) {
    ExitStatus status{-1, SIGPIPE};
    EXPECT_FALSE(status.success());
    EXPECT_EQ(status.describe(), "signal " + std::to_string(SIGPIPE));
}

// =============================================================================
// Spawn Tests
// =============================================================================

TEST(SubprocessTest, PipesRoundTrip) {
    auto process = unwrapOrThrow(
        Subprocess::spawn({"cat"}, StdioSpec::pipe(), StdioSpec::pipe()));
    EXPECT_GT(process.pid(), 0);
    EXPECT_EQ(process.program(), "cat");

    process.writeAll(asBytes("hello subprocess\n"));
    process.closeStdin();
    EXPECT_EQ(readAll(process), "hello subprocess\n");

    auto status = process.wait();
    EXPECT_TRUE(status.success());
    EXPECT_TRUE(process.hasExited());
}

TEST(SubprocessTest, ReportsExitCode) {
    auto process = unwrapOrThrow(Subprocess::spawn({"sh", "-c", "exit 3"},
                                                   StdioSpec::devNull(), StdioSpec::devNull()));
    auto status = process.wait();
    EXPECT_EQ(status.exitCode, 3);
    EXPECT_EQ(status.signal, 0);
}

TEST(SubprocessTest, ReportsTerminatingSignal) {
    auto process = unwrapOrThrow(Subprocess::spawn({"sh", "-c", "kill -TERM $$"},
                                                   StdioSpec::devNull(), StdioSpec::devNull()));
    auto status = process.wait();
    EXPECT_EQ(status.signal, SIGTERM);
    EXPECT_FALSE(status.success());
}

TEST(SubprocessTest, WaitIsIdempotent) {
    auto process = unwrapOrThrow(Subprocess::spawn({"sh", "-c", "exit 5"},
                                                   StdioSpec::devNull(), StdioSpec::devNull()));
    EXPECT_EQ(process.wait().exitCode, 5);
    EXPECT_EQ(process.wait().exitCode, 5);
}

TEST(SubprocessTest, StdoutToDescriptor) {
    ScratchDir dir("pzk_subprocess");
    const auto path = dir / "out.txt";
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    ASSERT_GE(fd, 0);

    {
        auto process = unwrapOrThrow(Subprocess::spawn({"sh", "-c", "printf redirected"},
                                                       StdioSpec::devNull(),
                                                       StdioSpec::fromFd(fd)));
        EXPECT_EQ(process.stdoutFd(), -1);
        EXPECT_TRUE(process.wait().success());
    }
    ::close(fd);

    EXPECT_EQ(readFile(path), "redirected");
}

TEST(SubprocessTest, DevNullStdinReadsNothing) {
    auto process = unwrapOrThrow(
        Subprocess::spawn({"cat"}, StdioSpec::devNull(), StdioSpec::pipe()));
    EXPECT_EQ(process.stdinFd(), -1);
    EXPECT_EQ(readAll(process), "");
    EXPECT_TRUE(process.wait().success());
}

TEST(SubprocessTest, EmptyCommandLineIsRejected) {
    auto result = Subprocess::spawn({}, StdioSpec::devNull(), StdioSpec::devNull());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(SubprocessTest, MissingProgramFails) {
    auto result = Subprocess::spawn({"pzk-no-such-program-xyz"}, StdioSpec::devNull(),
                                    StdioSpec::devNull(), StdioSpec::devNull());
    if (result.has_value()) {
        // Some C libraries report exec failure through the child's exit status
        EXPECT_EQ(result->wait().exitCode, 127);
    } else {
        EXPECT_EQ(result.error().code(), ErrorCode::kIOError);
    }
}

// =============================================================================
// Pipe Error Tests
// =============================================================================

TEST(SubprocessTest, WriteToExitedChildFailsWithIOError) {
    ignoreSigpipeOnce();
    auto process = unwrapOrThrow(
        Subprocess::spawn({"true"}, StdioSpec::pipe(), StdioSpec::devNull()));
    ASSERT_TRUE(process.wait().success());

    const std::string payload(1 << 20, 'x');
    EXPECT_THROW(process.writeAll(asBytes(payload)), IOError);
}

TEST(SubprocessTest, UnpipedStreamsRejectIo) {
    auto process = unwrapOrThrow(
        Subprocess::spawn({"true"}, StdioSpec::devNull(), StdioSpec::devNull()));
    std::vector<std::uint8_t> buffer(16);
    EXPECT_THROW(process.writeAll(asBytes("x")), InvalidStateError);
    EXPECT_THROW((void)process.readSome(buffer), InvalidStateError);
    EXPECT_TRUE(process.wait().success());
}

TEST(SubprocessTest, MovedHandleOwnsChild) {
    auto process = unwrapOrThrow(
        Subprocess::spawn({"cat"}, StdioSpec::pipe(), StdioSpec::pipe()));
    const pid_t pid = process.pid();

    Subprocess moved(std::move(process));
    EXPECT_EQ(process.pid(), -1);
    EXPECT_EQ(moved.pid(), pid);

    moved.closeStdin();
    EXPECT_EQ(readAll(moved), "");
    EXPECT_TRUE(moved.wait().success());
}

}  // namespace
}  // namespace pzk::io
