#pragma once
/// @file Log.hpp
/// @brief Process-wide diagnostic logger with a replaceable sink

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace JSave {
namespace log {

/// @brief Message severity, ordered from least to most severe
enum class Level { Debug = 0, Info = 1, Warning = 2, Error = 3 };

/// @brief Receives every message at or above the current level
using Sink = std::function<void(Level, const std::string&)>;

namespace detail {

struct LoggerState {
    std::mutex mtx;
    std::atomic<Level> level{Level::Warning};
    Sink sink;
};

inline LoggerState& state() {
    static LoggerState s;
    return s;
}

} // namespace detail

inline const char* levelName(Level level) noexcept {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

/// @brief Sets the minimum level that reaches the sink
inline void setLevel(Level level) noexcept { detail::state().level.store(level); }

inline Level level() noexcept { return detail::state().level.load(); }

inline bool enabled(Level lvl) noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(level());
}

/// @brief Replaces the output sink
/// @note The sink runs under the logger mutex and must not log itself.
inline void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(detail::state().mtx);
    detail::state().sink = std::move(sink);
}

/// @brief Restores the default std::cerr sink
inline void resetSink() { setSink(Sink()); }

/// @brief Delivers one formatted message
inline void write(Level lvl, const std::string& message) {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.sink) {
        s.sink(lvl, message);
        return;
    }

    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    std::cerr << "[" << now << "] jsave " << levelName(lvl) << ": " << message << std::endl;
}

} // namespace log
} // namespace JSave

#define JSAVE_SSTR(message)                                                                        \
    static_cast<std::ostringstream&>(std::ostringstream().flush() << message).str()

// Message text is only built when the level is enabled.
#define JSAVE_LOG(lvl, message)                                                                    \
    do {                                                                                           \
        if (::JSave::log::enabled(lvl))                                                            \
            ::JSave::log::write(lvl, JSAVE_SSTR(message));                                         \
    } while (0)

#define JSAVE_DEBUG(message) JSAVE_LOG(::JSave::log::Level::Debug, message)
#define JSAVE_INFO(message) JSAVE_LOG(::JSave::log::Level::Info, message)
#define JSAVE_WARN(message) JSAVE_LOG(::JSave::log::Level::Warning, message)
#define JSAVE_ERROR(message) JSAVE_LOG(::JSave::log::Level::Error, message)
