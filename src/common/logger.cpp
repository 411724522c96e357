// =============================================================================
// alnstore - Logger Module Implementation
// =============================================================================

#include "aln/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include <fmt/format.h>

namespace aln::log {

namespace {

struct LevelInfo {
    Level level;
    std::string_view name;
    quill::LogLevel quillLevel;
};

constexpr std::array<LevelInfo, 6> kLevels = {{
    {Level::kTrace, "trace", quill::LogLevel::TraceL1},
    {Level::kDebug, "debug", quill::LogLevel::Debug},
    {Level::kInfo, "info", quill::LogLevel::Info},
    {Level::kWarning, "warning", quill::LogLevel::Warning},
    {Level::kError, "error", quill::LogLevel::Error},
    {Level::kCritical, "critical", quill::LogLevel::Critical},
}};

const LevelInfo& infoOf(Level level) noexcept {
    return kLevels[static_cast<std::size_t>(level)];
}

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gLifecycleMutex;

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
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
            quill::Frontend::create_or_get_sink<quill::ConsoleSink>(config.loggerName + "_stderr"));
    }
    return sinks;
}

}  // namespace

VoidResult Config::validate() const {
    if (loggerName.empty()) {
        return makeVoidError(ErrorCode::kInvalidArgument, "logger name is empty");
    }
    if (!logFile.empty()) {
        const auto directory = std::filesystem::path(logFile).parent_path();
        std::error_code ec;
        if (!directory.empty() && !std::filesystem::is_directory(directory, ec)) {
            return makeVoidError(ErrorCode::kInvalidArgument,
                                 fmt::format("log directory {} does not exist",
                                             directory.string()));
        }
    }
    return makeVoidSuccess();
}

void init(const Config& config) {
    unwrapOrThrow(config.validate());

    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start();
    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    created->set_log_level(infoOf(config.level).quillLevel);
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void setLevel(Level level) {
    if (quill::Logger* current = logger()) {
        current->set_log_level(infoOf(level).quillLevel);
    }
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Frontend::remove_logger(current);
    quill::Backend::stop();
}

Result<Level> parseLevel(std::string_view name) {
    if (equalsIgnoreCase(name, "warn")) {
        return Level::kWarning;
    }
    if (equalsIgnoreCase(name, "fatal")) {
        return Level::kCritical;
    }
    for (const auto& info : kLevels) {
        if (equalsIgnoreCase(name, info.name)) {
            return info.level;
        }
    }
    return makeError<Level>(ErrorCode::kInvalidArgument,
                            fmt::format("unknown log level '{}'", name));
}

std::string_view levelName(Level level) noexcept {
    return infoOf(level).name;
}

}  // namespace aln::log
