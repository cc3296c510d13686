// =============================================================================
// pzkit - Error Handling Tests
// =============================================================================
// Unit tests for exception types, exit codes and Result helpers.
// =============================================================================

#include "pzk/common/error.h"

#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <string>

namespace pzk {
namespace {

// =============================================================================
// Exit Code Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodesAreDistinct) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kBackendUnavailable), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kBackendProcessFailed), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kUnsupportedDigest), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kChecksumComputationFailed), 6);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidState), 7);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidArgument), 8);
}

TEST(ErrorCodeTest, Names) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kBackendUnavailable), "backend unavailable");
    EXPECT_EQ(errorCodeToString(ErrorCode::kInvalidState), "invalid state");
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(ExceptionTest, WhatCarriesCategoryAndMessage) {
    UsageError error("missing input");
    EXPECT_EQ(error.code(), ErrorCode::kUsageError);
    EXPECT_EQ(error.exitCode(), 1);
    EXPECT_EQ(error.message(), "missing input");
    EXPECT_EQ(std::string(error.what()), "[usage error] missing input");
    EXPECT_FALSE(error.hasContext());
}

TEST(ExceptionTest, ContextIsAppended) {
    IOError error("write failed", ErrorContext("/tmp/out.gz").withOffset(42));
    const std::string what = error.what();
    EXPECT_NE(what.find("write failed"), std::string::npos);
    EXPECT_NE(what.find("file: /tmp/out.gz"), std::string::npos);
    EXPECT_NE(what.find("offset: 42"), std::string::npos);
    EXPECT_TRUE(error.hasContext());
}

TEST(ExceptionTest, IOErrorFromErrno) {
    errno = ENOENT;
    auto error = IOError::fromErrno("open failed");
    ASSERT_TRUE(error.systemError().has_value());
    EXPECT_EQ(error.systemError()->value(), ENOENT);
    EXPECT_EQ(error.code(), ErrorCode::kIOError);
}

TEST(ExceptionTest, BackendUnavailableNamesCodec) {
    BackendUnavailableError error(CodecKind::kZstd);
    EXPECT_EQ(error.codec(), CodecKind::kZstd);
    EXPECT_NE(std::string(error.what()).find("zstd"), std::string::npos);
    EXPECT_EQ(error.exitCode(), 3);
}

TEST(ExceptionTest, BackendProcessFailedCarriesStatus) {
    BackendProcessFailedError exited("lbzip2", 2, 0);
    EXPECT_EQ(exited.tool(), "lbzip2");
    EXPECT_EQ(exited.exitStatus(), 2);
    EXPECT_EQ(exited.signal(), 0);
    EXPECT_NE(std::string(exited.what()).find("exited with status 2"), std::string::npos);

    BackendProcessFailedError killed("pigz", -1, SIGKILL);
    EXPECT_EQ(killed.signal(), SIGKILL);
    EXPECT_NE(std::string(killed.what()).find("killed by signal"), std::string::npos);
}

TEST(ExceptionTest, UnsupportedDigestNames) {
    UnsupportedDigestError known(DigestKind::kWhirlpool);
    EXPECT_EQ(known.digestName(), "whirlpool");

    UnsupportedDigestError unknown(std::string("sha384"));
    EXPECT_EQ(unknown.digestName(), "sha384");
    EXPECT_NE(std::string(unknown.what()).find("unknown digest: sha384"), std::string::npos);
}

TEST(ExceptionTest, ChecksumFailureNamesKind) {
    ChecksumComputationFailedError error(DigestKind::kSha256, "read error");
    EXPECT_EQ(error.digestKind(), DigestKind::kSha256);
    EXPECT_NE(std::string(error.what()).find("sha256: read error"), std::string::npos);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, UnwrapValue) {
    Result<int> result = 7;
    EXPECT_EQ(unwrapOrThrow(std::move(result)), 7);
}

TEST(ResultTest, UnwrapErrorThrowsMatchingType) {
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kIOError, "boom")), IOError);
    EXPECT_THROW((void)unwrapOrThrow(makeError<int>(ErrorCode::kInvalidState, "closed")),
                 InvalidStateError);
}

}  // namespace
}  // namespace pzk
