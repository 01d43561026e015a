// =============================================================================
// genome-cleaner - Logger Module
// =============================================================================
// Process-wide diagnostics for the genome-cleaner CLI, backed by Quill.
//
// Diagnostics never share a stream with results: the console sink writes to
// stderr so that stdout stays free for summaries, cleaned FASTA and reports.
// An optional file sink (--log-file) receives the same messages, appended.
//
// The level comes from the global flags: -q keeps errors only, default is
// info, -v adds debug and -vv adds trace.
//
// Usage:
//   gcl::log::init(gcl::log::Config::fromFlags(verbosity, quiet, logFile));
//   GCL_LOG_INFO("Parsed {} records", count);
//
// The GCL_LOG_* macros are no-ops until init() has been called, so library
// code can log unconditionally and still run inside unit tests.
// =============================================================================

#ifndef GCL_COMMON_LOGGER_H
#define GCL_COMMON_LOGGER_H

#include <filesystem>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace gcl::log {

/// @brief Name of the single logger the tool registers with Quill.
inline constexpr const char* kLoggerName = "genome-cleaner";

/// @brief Name of the stderr console sink.
inline constexpr const char* kConsoleSinkName = "genome-cleaner.stderr";

/// @brief Severity threshold, least severe first.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError
};

/// @brief Map the -v count and -q flag to a level; -q wins over -v.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

/// @brief Sink and level selection for init().
struct Config {
    Level level = Level::kInfo;

    /// @brief Append diagnostics to this file as well; empty disables it.
    std::filesystem::path logFile;

    /// @brief Build the configuration for the global -v/-q/--log-file flags.
    [[nodiscard]] static Config fromFlags(int verbosity, bool quiet,
                                          std::filesystem::path logFile = {});
};

/// @brief Start the Quill backend and register the tool's logger.
/// @note Only the first call has an effect.
/// @throws std::exception from Quill when the log file cannot be opened.
void init(const Config& config);

/// @brief The tool's logger, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Block until every queued message has reached its sinks.
void flush();

}  // namespace gcl::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define GCL_LOG_IMPL_(quillMacro, fmt, ...)                                  \
    do {                                                                     \
        if (quill::Logger* gclLogger_ = gcl::log::logger()) {                \
            quillMacro(gclLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                    \
    } while (false)

#define GCL_LOG_TRACE(fmt, ...) GCL_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define GCL_LOG_DEBUG(fmt, ...) GCL_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define GCL_LOG_INFO(fmt, ...) GCL_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define GCL_LOG_WARNING(fmt, ...) GCL_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define GCL_LOG_ERROR(fmt, ...) GCL_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // GCL_COMMON_LOGGER_H
