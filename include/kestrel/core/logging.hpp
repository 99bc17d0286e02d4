#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <mutex>

namespace kestrel {

// Log levels
enum class LogLevel {
    Trace,      // Very verbose debugging
    Debug,      // Debug information
    Info,       // Informational messages
    Warning,    // Potential problems
    Error,      // Errors that allow recovery
    Fatal       // Unrecoverable errors
};

// Log categories
enum class LogCategory {
    Core,       // Pools, signals, file system
    Graphics,   // AG backends and GPU resources
    Resource,   // Bitmap and resource loading
    Render,     // Render context and batching
    Scene,      // Views and KTree serialization
    Font        // Font registry and glyph loading
};

/**
 * @brief Process-wide logger
 *
 * Writes formatted lines to stdout/stderr unless a sink is installed.
 * A sink receives the raw level, category and message and replaces the
 * default output entirely (used by tests and by embedders that route
 * messages to their own console).
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, LogCategory, std::string_view)>;

    static Logger& global();

    void setMinLevel(LogLevel level) { minLevel_ = level; }
    LogLevel minLevel() const { return minLevel_; }

    /// Install a sink; pass nullptr to restore console output
    void setSink(Sink sink);

    void log(LogLevel level, LogCategory category, std::string_view message,
             const char* file = nullptr, int line = 0);

    // Convenience methods
    void trace(LogCategory category, std::string_view message);
    void debug(LogCategory category, std::string_view message);
    void info(LogCategory category, std::string_view message);
    void warning(LogCategory category, std::string_view message);
    void error(LogCategory category, std::string_view message);
    void fatal(LogCategory category, std::string_view message);

    static const char* levelToString(LogLevel level);
    static const char* categoryToString(LogCategory category);

private:
    Logger() = default;
    LogLevel minLevel_ = LogLevel::Info;

    std::mutex sinkMutex_;
    Sink sink_;
};

// Logging macros with file/line info
#define KESTREL_LOG(level, category, msg) \
    kestrel::Logger::global().log(level, category, msg, __FILE__, __LINE__)

#define KESTREL_TRACE(category, msg)   KESTREL_LOG(kestrel::LogLevel::Trace, category, msg)
#define KESTREL_DEBUG(category, msg)   KESTREL_LOG(kestrel::LogLevel::Debug, category, msg)
#define KESTREL_INFO(category, msg)    KESTREL_LOG(kestrel::LogLevel::Info, category, msg)
#define KESTREL_WARN(category, msg)    KESTREL_LOG(kestrel::LogLevel::Warning, category, msg)
#define KESTREL_ERROR(category, msg)   KESTREL_LOG(kestrel::LogLevel::Error, category, msg)
#define KESTREL_FATAL(category, msg)   KESTREL_LOG(kestrel::LogLevel::Fatal, category, msg)

} // namespace kestrel
