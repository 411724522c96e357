// =============================================================================
// alnstore - Logger Module
// =============================================================================
// Asynchronous logging on top of the Quill library.
//
// The library never initializes logging on its own. Until init() is called
// every ALN_LOG_* macro is a no-op, so embedding applications and tests pay
// nothing for the diagnostics emitted by the store (block flushes, index
// builds, skipped corrupt blocks, discarded temporary files).
//
// Usage:
//   aln::log::init({.logFile = "store.log", .level = aln::log::Level::kDebug});
//   ALN_LOG_INFO("opened {} with {} blocks", path, blockCount);
// =============================================================================

#ifndef ALN_COMMON_LOGGER_H
#define ALN_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include "aln/common/error.h"

namespace aln::log {

enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Options for init().
struct Config {
    /// @brief Log file path. Empty disables the file sink.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Also write to stderr. Forced on when no file is configured.
    bool enableConsole = true;

    std::string loggerName = "alnstore";

    /// @brief Logger name must be set; a log file's directory must exist.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Start the Quill backend and create the global logger.
/// @throws InvalidArgumentError if @p config does not validate.
/// @note Ignored while a logger is already running; call shutdown() first.
void init(const Config& config = {});

/// @brief Global logger, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

void setLevel(Level level);

/// @brief Block until every queued message has been written.
void flush();

/// @brief Flush and stop the backend thread. init() may be called again.
void shutdown();

/// @brief Level by name, case-insensitive ("warn" and "fatal" accepted).
[[nodiscard]] Result<Level> parseLevel(std::string_view name);

[[nodiscard]] std::string_view levelName(Level level) noexcept;

}  // namespace aln::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define ALN_LOG_IMPL_(quillMacro, fmt, ...)                                  \
    do {                                                                     \
        if (quill::Logger* alnLogger_ = ::aln::log::logger()) {              \
            quillMacro(alnLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                    \
    } while (0)

#define ALN_LOG_TRACE(fmt, ...) ALN_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ALN_LOG_DEBUG(fmt, ...) ALN_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ALN_LOG_INFO(fmt, ...) ALN_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ALN_LOG_WARNING(fmt, ...) ALN_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ALN_LOG_ERROR(fmt, ...) ALN_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define ALN_LOG_CRITICAL(fmt, ...) ALN_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // ALN_COMMON_LOGGER_H
