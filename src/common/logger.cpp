// =============================================================================
// genome-cleaner - Logger Module Implementation
// =============================================================================

#include "gcl/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace gcl::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};

std::once_flag gInitOnce;

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
    }
    return quill::LogLevel::Info;
}

std::shared_ptr<quill::Sink> makeStderrSink() {
    quill::ConsoleSinkConfig consoleConfig;
    consoleConfig.set_stream("stderr");
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>(kConsoleSinkName,
                                                                   consoleConfig);
}

/// @brief Quill keys file sinks by path, so repeated runs share one sink per file.
std::shared_ptr<quill::Sink> makeAppendingFileSink(const std::filesystem::path& path) {
    quill::FileSinkConfig fileConfig;
    fileConfig.set_open_mode('a');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path.string(), fileConfig,
                                                                quill::FileEventNotifier{});
}

void registerLogger(const Config& config) {
    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(makeStderrSink());
    if (!config.logFile.empty()) {
        sinks.push_back(makeAppendingFileSink(config.logFile));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

}  // namespace

Level levelForVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    return verbosity == 1 ? Level::kDebug : Level::kInfo;
}

Config Config::fromFlags(int verbosity, bool quiet, std::filesystem::path logFile) {
    Config config;
    config.level = levelForVerbosity(verbosity, quiet);
    config.logFile = std::move(logFile);
    return config;
}

void init(const Config& config) {
    std::call_once(gInitOnce, registerLogger, config);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* active = logger()) {
        active->flush_log();
    }
}

}  // namespace gcl::log
