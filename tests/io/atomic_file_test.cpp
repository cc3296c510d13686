// =============================================================================
// pzkit - Atomic File Tests
// =============================================================================
// Unit tests for write-to-temp-then-rename semantics.
// =============================================================================

#include "pzk/io/atomic_file.h"

#include <sys/stat.h>

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "support/scratch_dir.h"

namespace pzk::io {
namespace {

using test::readFile;
using test::ScratchDir;
using test::writeFile;

/// @brief Sets the process umask for one test and restores it afterwards.
class ScopedUmask {
public:
    explicit ScopedUmask(mode_t mask) : previous_(::umask(mask)) {}
    ~ScopedUmask() { ::umask(previous_); }

    ScopedUmask(const ScopedUmask&) = delete;
    ScopedUmask& operator=(const ScopedUmask&) = delete;

private:
    mode_t previous_;
};

mode_t permissionsOf(const std::filesystem::path& path) {
    struct stat st{};
    EXPECT_EQ(::stat(path.c_str(), &st), 0) << path;
    return st.st_mode & 07777;
}

// =============================================================================
// Commit Tests
// =============================================================================

TEST(AtomicFileTest, CommitPublishesContent) {
    ScratchDir dir("pzk_atomic");
    const auto target = dir / "out.txt";

    AtomicFile file(target);
    EXPECT_TRUE(file.isActive());
    EXPECT_EQ(file.tempPath().parent_path(), target.parent_path());
    EXPECT_FALSE(std::filesystem::exists(target));

    file.write(std::string_view("hello "));
    file.write(std::string_view("world"));
    EXPECT_EQ(file.bytesWritten(), 11u);
    EXPECT_FALSE(std::filesystem::exists(target));

    file.commit();
    EXPECT_EQ(file.state(), AtomicWriteState::kCommitted);
    EXPECT_EQ(readFile(target), "hello world");
    EXPECT_FALSE(std::filesystem::exists(file.tempPath()));
    EXPECT_EQ(dir.entryCount(), 1u);
}

TEST(AtomicFileTest, CommitReplacesExistingTarget) {
    ScratchDir dir("pzk_atomic");
    const auto target = dir / "out.txt";
    writeFile(target, "old content that is longer");

    AtomicFile file(target);
    file.write(std::string_view("new"));
    // Target keeps old content until commit
    EXPECT_EQ(readFile(target), "old content that is longer");
    file.commit();
    EXPECT_EQ(readFile(target), "new");
}

TEST(AtomicFileTest, CommitAppliesMode) {
    ScratchDir dir("pzk_atomic");
    const ScopedUmask mask(022);
    const auto target = dir / "mode.txt";

    AtomicFile file(target, 0640);
    file.write(std::string_view("x"));
    file.commit();

    EXPECT_EQ(permissionsOf(target), 0640u);
}

TEST(AtomicFileTest, DefaultModeHonoursUmask) {
    ScratchDir dir("pzk_atomic");
    {
        const ScopedUmask mask(022);
        AtomicFile file(dir / "shared.txt");
        file.commit();
    }
    {
        const ScopedUmask mask(077);
        AtomicFile file(dir / "private.txt");
        file.commit();
    }
    EXPECT_EQ(permissionsOf(dir / "shared.txt"), 0644u);
    EXPECT_EQ(permissionsOf(dir / "private.txt"), 0600u);
}

TEST(AtomicFileTest, ReplacedTargetKeepsItsPermissions) {
    ScratchDir dir("pzk_atomic");
    const ScopedUmask mask(022);
    const auto target = dir / "secret.txt";
    writeFile(target, "old");
    ASSERT_EQ(::chmod(target.c_str(), 0600), 0);

    AtomicFile file(target);
    file.write(std::string_view("new"));
    file.commit();

    EXPECT_EQ(readFile(target), "new");
    EXPECT_EQ(permissionsOf(target), 0600u);
}

TEST(AtomicFileTest, EmptyCommitCreatesEmptyFile) {
    ScratchDir dir("pzk_atomic");
    const auto target = dir / "empty.bin";

    AtomicFile file(target);
    file.commit();
    EXPECT_TRUE(std::filesystem::exists(target));
    EXPECT_EQ(std::filesystem::file_size(target), 0u);
}

// =============================================================================
// Discard Tests
// =============================================================================

TEST(AtomicFileTest, DiscardLeavesTargetUntouched) {
    ScratchDir dir("pzk_atomic");
    const auto target = dir / "out.txt";
    writeFile(target, "original");

    AtomicFile file(target);
    file.write(std::string_view("partial"));
    file.discard();

    EXPECT_EQ(file.state(), AtomicWriteState::kDiscarded);
    EXPECT_EQ(readFile(target), "original");
    EXPECT_EQ(dir.entryCount(), 1u);
}

TEST(AtomicFileTest, DiscardIsIdempotent) {
    ScratchDir dir("pzk_atomic");
    AtomicFile file(dir / "out.txt");
    file.discard();
    EXPECT_NO_THROW(file.discard());
}

TEST(AtomicFileTest, DestructorDiscards) {
    ScratchDir dir("pzk_atomic");
    const auto target = dir / "out.txt";
    {
        AtomicFile file(target);
        file.write(std::string_view("abandoned"));
    }
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_EQ(dir.entryCount(), 0u);
}

// =============================================================================
// Released Handle Tests
// =============================================================================

TEST(AtomicFileTest, OperationsAfterCommitThrow) {
    ScratchDir dir("pzk_atomic");
    AtomicFile file(dir / "out.txt");
    file.commit();

    EXPECT_THROW(file.write(std::string_view("late")), InvalidStateError);
    EXPECT_THROW(file.commit(), InvalidStateError);
    EXPECT_THROW(file.discard(), InvalidStateError);
}

TEST(AtomicFileTest, OperationsAfterDiscardThrow) {
    ScratchDir dir("pzk_atomic");
    AtomicFile file(dir / "out.txt");
    file.discard();

    EXPECT_THROW(file.write(std::string_view("late")), InvalidStateError);
    EXPECT_THROW(file.commit(), InvalidStateError);
}

TEST(AtomicFileTest, MovedFromHandleIsReleased) {
    ScratchDir dir("pzk_atomic");
    const auto target = dir / "out.txt";

    AtomicFile first(target);
    first.write(std::string_view("moved"));
    AtomicFile second(std::move(first));

    EXPECT_FALSE(first.isActive());
    EXPECT_EQ(first.fd(), -1);
    second.commit();
    EXPECT_EQ(readFile(target), "moved");
}

// =============================================================================
// Error Tests
// =============================================================================

TEST(AtomicFileTest, MissingDirectoryFailsWithIOError) {
    ScratchDir dir("pzk_atomic");
    EXPECT_THROW((void)AtomicFile(dir / "missing" / "out.txt"), IOError);
}

TEST(AtomicFileTest, TargetWithoutFilenameIsRejected) {
    EXPECT_THROW((void)AtomicFile(std::filesystem::path{}), InvalidArgumentError);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(AtomicFileProperty, UncommittedWriteNeverTouchesTarget,
              (const std::vector<std::uint8_t>& payload, bool targetExists)) {
    ScratchDir dir("pzk_atomic_prop");
    const auto target = dir / "out.bin";
    if (targetExists) {
        writeFile(target, "original");
    }

    {
        AtomicFile file(target);
        file.write(std::span<const std::uint8_t>(payload));
        RC_ASSERT(file.bytesWritten() == payload.size());
    }

    if (targetExists) {
        RC_ASSERT(readFile(target) == "original");
        RC_ASSERT(dir.entryCount() == 1u);
    } else {
        RC_ASSERT(!std::filesystem::exists(target));
        RC_ASSERT(dir.entryCount() == 0u);
    }
}

RC_GTEST_PROP(AtomicFileProperty, CommitPublishesExactBytes,
              (const std::vector<std::uint8_t>& payload)) {
    ScratchDir dir("pzk_atomic_prop");
    const auto target = dir / "out.bin";

    AtomicFile file(target);
    file.write(std::span<const std::uint8_t>(payload));
    file.commit();

    const std::string published = readFile(target);
    RC_ASSERT(published == std::string(payload.begin(), payload.end()));
}

}  // namespace
}  // namespace pzk::io
