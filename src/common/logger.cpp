// =============================================================================
// naf-codec - Logger Module Implementation
// =============================================================================

#include "naf/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <vector>

namespace naf::log {

namespace {

struct LevelEntry {
    Level level;
    std::string_view name;
    quill::LogLevel quillLevel;
};

/// @brief Indexed by Level.
constexpr std::array<LevelEntry, 6> kLevels = {{
    {Level::kTrace, "trace", quill::LogLevel::TraceL1},
    {Level::kDebug, "debug", quill::LogLevel::Debug},
    {Level::kInfo, "info", quill::LogLevel::Info},
    {Level::kWarning, "warning", quill::LogLevel::Warning},
    {Level::kError, "error", quill::LogLevel::Error},
    {Level::kCritical, "critical", quill::LogLevel::Critical},
}};

constexpr std::string_view kConsoleSinkName = "naf_console";

/// @brief Non-null between init() and shutdown().
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Serializes init() and shutdown().
std::mutex gStateMutex;

const LevelEntry& entryFor(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index >= kLevels.size()) {
        return kLevels[static_cast<std::size_t>(Level::kWarning)];
    }
    return kLevels[index];
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('a');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }

    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(
            quill::Frontend::create_or_get_sink<quill::ConsoleSink>(std::string(kConsoleSinkName)));
    }

    return sinks;
}

}  // namespace

// =============================================================================
// Levels
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    return entryFor(level).quillLevel;
}

std::string_view levelToString(Level level) noexcept {
    return entryFor(level).name;
}

Level levelFromString(std::string_view levelStr) noexcept {
    if (equalsIgnoreCase(levelStr, "fatal")) {
        return Level::kCritical;
    }
    if (equalsIgnoreCase(levelStr, "warn")) {
        return Level::kWarning;
    }

    const auto it = std::ranges::find_if(kLevels, [levelStr](const LevelEntry& entry) {
        return equalsIgnoreCase(levelStr, entry.name);
    });
    return it != kLevels.end() ? it->level : Level::kWarning;
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gStateMutex);

    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    created->set_log_level(toQuillLevel(config.level));

    gLogger.store(created, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = logFile;
    config.level = level;
    init(config);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gStateMutex);

    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }

    current->flush_log();
    quill::Backend::stop();
}

}  // namespace naf::log
