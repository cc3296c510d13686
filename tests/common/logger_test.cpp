// =============================================================================
// pzkit - Logger Tests
// =============================================================================

#include "pzk/common/logger.h"

#include <gtest/gtest.h>

namespace pzk::log {
namespace {

TEST(LoggerLevelTest, NamesRoundTrip) {
    for (Level level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning,
                        Level::kError, Level::kCritical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level);
    }
}

TEST(LoggerLevelTest, ParsingIgnoresCaseAndAcceptsAliases) {
    EXPECT_EQ(levelFromString("DEBUG"), Level::kDebug);
    EXPECT_EQ(levelFromString("Warn"), Level::kWarning);
    EXPECT_EQ(levelFromString("fatal"), Level::kCritical);
    EXPECT_EQ(levelFromString("verbose"), Level::kInfo);
    EXPECT_EQ(levelFromString(""), Level::kInfo);
}

TEST(LoggerLevelTest, QuillLevels) {
    EXPECT_EQ(toQuillLevel(Level::kTrace), quill::LogLevel::TraceL1);
    EXPECT_EQ(toQuillLevel(Level::kWarning), quill::LogLevel::Warning);
    EXPECT_EQ(toQuillLevel(Level::kCritical), quill::LogLevel::Critical);
}

TEST(LoggerTest, MacrosAreNoOpsBeforeInit) {
    ASSERT_FALSE(isInitialized());
    EXPECT_EQ(logger(), nullptr);
    EXPECT_FALSE(consoleEnabled());
    PZK_LOG_INFO("dropped {}", 1);
    PZK_LOG_ERROR("dropped too");
    flush();
}

TEST(LoggerTest, InitWithoutSinksStaysDisabled) {
    Config config;
    config.enableConsole = false;
    init(config);
    EXPECT_FALSE(isInitialized());
    EXPECT_EQ(logger(), nullptr);
    shutdown();
}

}  // namespace
}  // namespace pzk::log
