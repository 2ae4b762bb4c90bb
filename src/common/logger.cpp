// =============================================================================
// refcache - Logger Module Implementation
// =============================================================================

#include "refcache/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace refcache::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gInitMutex;

constexpr std::string_view kConsoleSinkName = "refcache-stderr";

/// @brief Accepted level names, aliases included.
constexpr std::array<std::pair<std::string_view, Level>, 8> kLevelNames{{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

/// @brief Console output goes to stderr; stdout carries command results.
std::shared_ptr<quill::Sink> makeConsoleSink() {
    quill::ConsoleSinkConfig consoleConfig;
    consoleConfig.set_stream("stderr");
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>(std::string(kConsoleSinkName),
                                                                   consoleConfig);
}

std::shared_ptr<quill::Sink> makeFileSink(const Config& config) {
    quill::FileSinkConfig fileConfig;
    fileConfig.set_open_mode(config.appendToFile ? 'a' : 'w');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(config.logFile, fileConfig,
                                                                quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Level Conversion Implementation
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

Level levelFromString(std::string_view levelStr) noexcept {
    auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(), [levelStr](const auto& entry) {
        return equalsIgnoreCase(entry.first, levelStr);
    });
    return it != kLevelNames.end() ? it->second : Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    // The first name listed for a level is its canonical spelling
    auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                           [level](const auto& entry) { return entry.second == level; });
    return it != kLevelNames.end() ? it->first : std::string_view("info");
}

Config configFromVerbosity(int verbosity, bool quiet, std::string_view logFile) {
    Config config;
    config.logFile = std::string(logFile);
    if (quiet) {
        config.level = Level::kError;
    } else if (verbosity >= 2) {
        config.level = Level::kTrace;
    } else if (verbosity == 1) {
        config.level = Level::kDebug;
    }
    return config;
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(makeConsoleSink());
    }
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(config.loggerName,
                                                                   std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

// =============================================================================
// Logger Access Implementation
// =============================================================================

quill::Logger* logger() {
    quill::Logger* current = gLogger.load(std::memory_order_acquire);
    if (current == nullptr) {
        init(Config{});
        current = gLogger.load(std::memory_order_acquire);
    }
    return current;
}

bool isInitialized() noexcept { return gLogger.load(std::memory_order_acquire) != nullptr; }

void flush() {
    if (quill::Logger* current = gLogger.load(std::memory_order_acquire)) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace refcache::log
