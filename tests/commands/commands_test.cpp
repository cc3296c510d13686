// =============================================================================
// pzkit - Command Handler Tests
// =============================================================================
// Output formats and argument validation of the CLI command handlers.
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "commands/checksum_command.h"
#include "commands/compress_command.h"
#include "commands/decompress_command.h"
#include "commands/info_command.h"
#include "support/scratch_dir.h"

namespace pzk::commands {
namespace {

using test::ScratchDir;
using test::writeFile;
using test::writeScript;

// =============================================================================
// ChecksumCommand Tests
// =============================================================================

TEST(ChecksumCommandTest, PrintsOneLinePerFileAndKind) {
    ScratchDir dir("pzk_cmd");
    const auto first = dir / "first.txt";
    const auto second = dir / "second.txt";
    writeFile(first, "123456789");
    writeFile(second, "");

    ChecksumOptions options;
    options.inputPaths = {first, second};
    options.kinds = {DigestKind::kCrc32, DigestKind::kSize};

    std::ostringstream out;
    ChecksumCommand command(options, out);
    ASSERT_EQ(command.execute(), 0);

    const std::string expected = "cbf43926  crc32  " + first.string() + "\n" +
                                 "9  size  " + first.string() + "\n" +
                                 "00000000  crc32  " + second.string() + "\n" +
                                 "0  size  " + second.string() + "\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(ChecksumCommandTest, SerialAndParallelPrintTheSame) {
    ScratchDir dir("pzk_cmd");
    const auto path = dir / "data.txt";
    writeFile(path, std::string(200000, 'q'));

    ChecksumOptions options;
    options.inputPaths = {path};
    options.kinds = {DigestKind::kSha256, DigestKind::kMd5, DigestKind::kXxh64};

    std::ostringstream parallelOut;
    ASSERT_EQ(ChecksumCommand(options, parallelOut).execute(), 0);

    options.parallel = false;
    std::ostringstream serialOut;
    ASSERT_EQ(ChecksumCommand(options, serialOut).execute(), 0);

    EXPECT_EQ(parallelOut.str(), serialOut.str());
}

TEST(ChecksumCommandTest, MissingFileFailsWithChecksumCode) {
    ScratchDir dir("pzk_cmd");
    ChecksumOptions options;
    options.inputPaths = {dir / "absent.txt"};

    std::ostringstream out;
    EXPECT_EQ(ChecksumCommand(options, out).execute(),
              toExitCode(ErrorCode::kChecksumComputationFailed));
    EXPECT_TRUE(out.str().empty());
}

TEST(ChecksumCommandTest, EmptyRequestIsUsageError) {
    std::ostringstream out;
    EXPECT_EQ(ChecksumCommand(ChecksumOptions{}, out).execute(),
              toExitCode(ErrorCode::kUsageError));

    ChecksumOptions noKinds;
    noKinds.inputPaths = {"whatever"};
    noKinds.kinds.clear();
    EXPECT_EQ(ChecksumCommand(noKinds, out).execute(), toExitCode(ErrorCode::kUsageError));
}

// =============================================================================
// InfoCommand Tests
// =============================================================================

class InfoCommandTest : public ::testing::Test {
protected:
    InfoCommandTest() : tools_("pzk_info") {
        writeScript(tools_ / "gzip", "exec cat");
        writeScript(tools_ / "pigz", "exec cat");
    }

    [[nodiscard]] codec::BackendRegistry registry() const {
        return codec::BackendRegistry(std::vector<std::filesystem::path>{tools_.path()});
    }

    ScratchDir tools_;
};

TEST_F(InfoCommandTest, TextListsInstalledTools) {
    const auto backends = registry();
    std::ostringstream out;
    InfoCommand command(InfoOptions{}, out, backends, chksum::DigestRegistry::instance());
    ASSERT_EQ(command.execute(), 0);

    const std::string text = out.str();
    EXPECT_NE(text.find("Physical cores:"), std::string::npos);
    EXPECT_NE(text.find("pigz"), std::string::npos);
    EXPECT_NE(text.find("bzip2   (none installed)"), std::string::npos);
    EXPECT_NE(text.find("sha256"), std::string::npos);
    // Higher priority tools are listed first
    const auto pigzLine = text.find("pigz     priority");
    const auto gzipLine = text.find("gzip     priority");
    ASSERT_NE(pigzLine, std::string::npos);
    ASSERT_NE(gzipLine, std::string::npos);
    EXPECT_LT(pigzLine, gzipLine);
}

TEST_F(InfoCommandTest, JsonOutput) {
    const auto backends = registry();
    const chksum::DigestRegistry fallbackOnly(chksum::DigestRegistry::Options{false, false, true});
    std::ostringstream out;
    InfoCommand command(InfoOptions{true}, out, backends, fallbackOnly);
    ASSERT_EQ(command.execute(), 0);

    const std::string json = out.str();
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.substr(json.size() - 2), "}\n");
    EXPECT_NE(json.find("\"bzip2\": []"), std::string::npos);
    EXPECT_NE(json.find("{\"tool\": \"pigz\""), std::string::npos);
    EXPECT_NE(json.find("\"whirlpool\": {\"backend\": \"builtin\""), std::string::npos);
    EXPECT_EQ(json.find("\"sha256\""), std::string::npos);
}

TEST(JsonEscapeTest, EscapesSpecialCharacters) {
    EXPECT_EQ(jsonEscape("plain/path"), "plain/path");
    EXPECT_EQ(jsonEscape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(jsonEscape("line\nnext\t"), "line\\nnext\\t");
    EXPECT_EQ(jsonEscape(std::string_view("\x01", 1)), "\\u0001");
}

// =============================================================================
// Compress / Decompress Validation Tests
// =============================================================================

TEST(CompressCommandTest, MissingInputIsIOError) {
    ScratchDir dir("pzk_cmd");
    CompressOptions options;
    options.inputPath = dir / "absent.txt";
    options.codec = CodecKind::kGzip;
    EXPECT_EQ(CompressCommand(options).execute(), toExitCode(ErrorCode::kIOError));
    EXPECT_EQ(dir.entryCount(), 0u);
}

TEST(CompressCommandTest, ExistingOutputNeedsForce) {
    ScratchDir dir("pzk_cmd");
    writeFile(dir / "data.txt", "payload");
    writeFile(dir / "data.txt.gz", "keep me");

    CompressOptions options;
    options.inputPath = dir / "data.txt";
    options.codec = CodecKind::kGzip;
    EXPECT_EQ(CompressCommand(options).execute(), toExitCode(ErrorCode::kIOError));
    EXPECT_EQ(test::readFile(dir / "data.txt.gz"), "keep me");
}

TEST(CompressCommandTest, StdinRequiresOutputPath) {
    CompressOptions options;
    options.inputPath = "-";
    options.codec = CodecKind::kXz;
    EXPECT_EQ(CompressCommand(options).execute(), toExitCode(ErrorCode::kUsageError));
}

TEST(CompressCommandTest, LevelOutOfRangeIsInvalidArgument) {
    ScratchDir dir("pzk_cmd");
    writeFile(dir / "data.txt", "payload");

    CompressOptions options;
    options.inputPath = dir / "data.txt";
    options.codec = CodecKind::kZstd;
    options.compressionLevel = 42;
    EXPECT_EQ(CompressCommand(options).execute(), toExitCode(ErrorCode::kInvalidArgument));
}

TEST(CompressCommandTest, LevelRangeFollowsCodec) {
    ScratchDir dir("pzk_cmd");
    writeFile(dir / "data.txt", "payload");

    CompressOptions options;
    options.inputPath = dir / "data.txt";
    options.compressionLevel = 15;
    for (CodecKind codec : {CodecKind::kGzip, CodecKind::kBzip2, CodecKind::kXz}) {
        options.codec = codec;
        options.outputPath.clear();
        EXPECT_EQ(CompressCommand(options).execute(), toExitCode(ErrorCode::kInvalidArgument))
            << codecName(codec);
    }
    EXPECT_FALSE(std::filesystem::exists(dir / "data.txt.gz"));
}

TEST(CheckOutputWritableTest, Rules) {
    ScratchDir dir("pzk_cmd");
    writeFile(dir / "exists", "x");
    EXPECT_NO_THROW(checkOutputWritable("-", false));
    EXPECT_NO_THROW(checkOutputWritable(dir / "fresh", false));
    EXPECT_NO_THROW(checkOutputWritable(dir / "exists", true));
    EXPECT_THROW(checkOutputWritable(dir / "exists", false), IOError);
}

TEST(DecompressCommandTest, DefaultOutputPaths) {
    EXPECT_EQ(defaultDecompressedPath("/data/reads.fq.gz"), "/data/reads.fq");
    EXPECT_EQ(defaultDecompressedPath("archive.tgz"), "archive.tar");
    EXPECT_EQ(defaultDecompressedPath("archive.tbz2"), "archive.tar");
    EXPECT_EQ(defaultDecompressedPath("log.zst"), "log");
    EXPECT_THROW((void)defaultDecompressedPath("notes.txt"), UsageError);
}

TEST(DecompressCommandTest, UndetectableCodecIsUsageError) {
    ScratchDir dir("pzk_cmd");
    writeFile(dir / "plain.txt", "not compressed");

    DecompressOptions options;
    options.inputPath = dir / "plain.txt";
    options.outputPath = dir / "out.txt";
    EXPECT_EQ(DecompressCommand(options).execute(), toExitCode(ErrorCode::kUsageError));
    EXPECT_FALSE(std::filesystem::exists(dir / "out.txt"));
}

TEST(DecompressCommandTest, MissingInputIsIOError) {
    ScratchDir dir("pzk_cmd");
    DecompressOptions options;
    options.inputPath = dir / "absent.gz";
    EXPECT_EQ(DecompressCommand(options).execute(), toExitCode(ErrorCode::kIOError));
}

}  // namespace
}  // namespace pzk::commands
