// =============================================================================
// pzkit - Logger Module Implementation
// =============================================================================
// Implementation of the asynchronous logging module using Quill.
// =============================================================================

#include "pzk/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace pzk::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

std::atomic<quill::Logger*> gLogger{nullptr};

std::atomic<bool> gInitialized{false};

/// @brief Whether log records reach the console.
std::atomic<bool> gConsoleEnabled{false};

/// @brief Serializes init() and shutdown().
std::mutex gInitMutex;

struct LevelName {
    Level level;
    std::string_view name;
    quill::LogLevel quillLevel;
};

/// @brief Canonical names first; aliases follow their canonical entry.
constexpr LevelName kLevelNames[] = {
    {Level::kTrace, "trace", quill::LogLevel::TraceL1},
    {Level::kDebug, "debug", quill::LogLevel::Debug},
    {Level::kInfo, "info", quill::LogLevel::Info},
    {Level::kWarning, "warning", quill::LogLevel::Warning},
    {Level::kWarning, "warn", quill::LogLevel::Warning},
    {Level::kError, "error", quill::LogLevel::Error},
    {Level::kCritical, "critical", quill::LogLevel::Critical},
    {Level::kCritical, "fatal", quill::LogLevel::Critical},
};

const LevelName& entryFor(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry;
        }
    }
    return kLevelNames[2];
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

}  // namespace

// =============================================================================
// Level Conversion
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    return entryFor(level).quillLevel;
}

Level levelFromString(std::string_view levelStr) noexcept {
    for (const auto& entry : kLevelNames) {
        if (equalsIgnoreCase(entry.name, levelStr)) {
            return entry.level;
        }
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    return entryFor(level).name;
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (gInitialized.load(std::memory_order_acquire)) {
        return;
    }

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    if (!config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('a');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{}));
    }

    // No sink: leave logging disabled, the macros stay no-ops
    if (sinks.empty()) {
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gConsoleEnabled.store(config.enableConsole, std::memory_order_release);
    gLogger.store(loggerPtr, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
}

// =============================================================================
// Logger Access Implementation
// =============================================================================

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

bool consoleEnabled() noexcept {
    return gConsoleEnabled.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* loggerPtr = logger(); loggerPtr != nullptr) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (!isInitialized()) {
        return;
    }

    flush();
    gLogger.store(nullptr, std::memory_order_release);
    gConsoleEnabled.store(false, std::memory_order_release);
    quill::Backend::stop();
    gInitialized.store(false, std::memory_order_release);
}

}  // namespace pzk::log
