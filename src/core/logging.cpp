#include "kestrel/core/logging.hpp"

#include <cstdio>
#include <ctime>
#include <chrono>

namespace kestrel {

Logger& Logger::global() {
    static Logger instance;
    return instance;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sink_ = std::move(sink);
}

void Logger::log(LogLevel level, LogCategory category, std::string_view message,
                 const char* file, int line) {
    if (level < minLevel_) {
        return;
    }

    Sink sink;
    {
        std::lock_guard<std::mutex> lock(sinkMutex_);
        sink = sink_;
    }
    if (sink) {
        sink(level, category, message);
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char timeStr[32];
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif
    std::strftime(timeStr, sizeof(timeStr), "%H:%M:%S", &local);

    FILE* out = (level >= LogLevel::Warning) ? stderr : stdout;

    // Format: [TIME.ms] [LEVEL] [CATEGORY] message
    if (file && line > 0) {
        std::fprintf(out, "[%s.%03d] [%-7s] [%-8s] %.*s (%s:%d)\n",
                     timeStr, static_cast<int>(ms.count()),
                     levelToString(level), categoryToString(category),
                     static_cast<int>(message.size()), message.data(),
                     file, line);
    } else {
        std::fprintf(out, "[%s.%03d] [%-7s] [%-8s] %.*s\n",
                     timeStr, static_cast<int>(ms.count()),
                     levelToString(level), categoryToString(category),
                     static_cast<int>(message.size()), message.data());
    }

    std::fflush(out);
}

void Logger::trace(LogCategory category, std::string_view message) {
    log(LogLevel::Trace, category, message);
}

void Logger::debug(LogCategory category, std::string_view message) {
    log(LogLevel::Debug, category, message);
}

void Logger::info(LogCategory category, std::string_view message) {
    log(LogLevel::Info, category, message);
}

void Logger::warning(LogCategory category, std::string_view message) {
    log(LogLevel::Warning, category, message);
}

void Logger::error(LogCategory category, std::string_view message) {
    log(LogLevel::Error, category, message);
}

void Logger::fatal(LogCategory category, std::string_view message) {
    log(LogLevel::Fatal, category, message);
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

const char* Logger::categoryToString(LogCategory category) {
    switch (category) {
        case LogCategory::Core:     return "Core";
        case LogCategory::Graphics: return "Graphics";
        case LogCategory::Resource: return "Resource";
        case LogCategory::Render:   return "Render";
        case LogCategory::Scene:    return "Scene";
        case LogCategory::Font:     return "Font";
    }
    return "Unknown";
}

} // namespace kestrel
