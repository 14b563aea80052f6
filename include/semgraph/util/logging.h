/**
 * Tag-based logging for semgraph
 *
 * Usage:
 *   SEMGRAPH_LOG_TAG(Loader);
 *   SEMGRAPH_LOG_WARN(Loader) << "Skipping " << key << ": " << status.ToString();
 *   SEMGRAPH_LOG_DEBUG(Planner) << "Join order: " << plan;
 *
 * Control:
 *   Compile-time: cmake -DSEMGRAPH_ENABLE_DEBUG_LOGGING=ON  (compiles DEBUG/TRACE in)
 *                 -DSEMGRAPH_MIN_LOG_LEVEL=3               (drop everything below WARN)
 *   Runtime:      export SEMGRAPH_DEBUG=1                  (turns DEBUG/TRACE output on)
 *                 LogOutput::Instance().SetMinLevel(...)   (tests and tools)
 */

#pragma once

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace semgraph {
namespace logging {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    OFF   = 5
};

struct LogTag {
    const char* name;
    LogLevel min_level;

    constexpr LogTag(const char* n, LogLevel level = LogLevel::TRACE)
        : name(n), min_level(level) {}
};

#ifndef SEMGRAPH_MIN_LOG_LEVEL
#define SEMGRAPH_MIN_LOG_LEVEL 0
#endif

constexpr LogLevel kGlobalMinLevel = static_cast<LogLevel>(SEMGRAPH_MIN_LOG_LEVEL);

#ifdef SEMGRAPH_ENABLE_DEBUG_LOGGING
constexpr bool kDebugCompiledIn = true;
#else
constexpr bool kDebugCompiledIn = false;
#endif

// Runtime switch for DEBUG/TRACE output
inline bool IsDebugLoggingEnabled() {
    static const bool enabled = [] {
        const char* env = std::getenv("SEMGRAPH_DEBUG");
        return env != nullptr && std::string(env) == "1";
    }();
    return enabled;
}

// Single output point; every message goes to stderr under one mutex
class LogOutput {
public:
    static LogOutput& Instance() {
        static LogOutput instance;
        return instance;
    }

    void Write(const LogTag& tag, LogLevel level, const std::string& message) {
        if (!ShouldLog(tag, level)) return;

        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[" << LevelToString(level) << "] "
                  << "[" << tag.name << "] "
                  << message << "\n";
    }

    bool ShouldLog(const LogTag& tag, LogLevel level) const {
        if (level < kGlobalMinLevel) return false;
        if (level < tag.min_level) return false;
        if (level < min_level_.load(std::memory_order_relaxed)) return false;
        if (level <= LogLevel::DEBUG && !IsDebugLoggingEnabled()) return false;
        return true;
    }

    void SetMinLevel(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }

    LogLevel GetMinLevel() const { return min_level_.load(std::memory_order_relaxed); }

private:
    LogOutput() = default;

    static const char* LevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            default: return "?????";
        }
    }

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{IsDebugLoggingEnabled() ? LogLevel::TRACE : LogLevel::INFO};
};

// Collects one message and hands it to LogOutput on destruction.
// DEBUG and TRACE streams compile to nothing unless SEMGRAPH_ENABLE_DEBUG_LOGGING is set.
template <LogLevel Level>
class LogStream {
public:
    explicit LogStream(const LogTag& tag) : tag_(tag) {
        if constexpr (Level >= kGlobalMinLevel && (Level > LogLevel::DEBUG || kDebugCompiledIn)) {
            enabled_ = LogOutput::Instance().ShouldLog(tag, Level);
        }
    }

    ~LogStream() {
        if (enabled_) {
            LogOutput::Instance().Write(tag_, Level, oss_.str());
        }
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            oss_ << value;
        }
        return *this;
    }

private:
    const LogTag& tag_;
    bool enabled_ = false;
    std::ostringstream oss_;
};

} // namespace logging
} // namespace semgraph

// Define a log component tag
#define SEMGRAPH_LOG_TAG(name) \
    static constexpr ::semgraph::logging::LogTag name##Tag(#name)

#define SEMGRAPH_LOG_TRACE(component) \
    ::semgraph::logging::LogStream<::semgraph::logging::LogLevel::TRACE>(component##Tag)

#define SEMGRAPH_LOG_DEBUG(component) \
    ::semgraph::logging::LogStream<::semgraph::logging::LogLevel::DEBUG>(component##Tag)

#define SEMGRAPH_LOG_INFO(component) \
    ::semgraph::logging::LogStream<::semgraph::logging::LogLevel::INFO>(component##Tag)

#define SEMGRAPH_LOG_WARN(component) \
    ::semgraph::logging::LogStream<::semgraph::logging::LogLevel::WARN>(component##Tag)

#define SEMGRAPH_LOG_ERROR(component) \
    ::semgraph::logging::LogStream<::semgraph::logging::LogLevel::ERROR>(component##Tag)
