#pragma once

#include <fmt/core.h>
#include <string>
#include <utility>

namespace gslgen {
namespace log {

/**
 * @brief Logging verbosity levels, lowest first.
 */
enum class Level : int {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF
};

/// Current global level (messages below it are dropped)
Level level() noexcept;
void setLevel(Level lvl) noexcept;

/**
 * @brief Parse a level name ("debug", "INFO", ...).
 *
 * @param name Level name, case-insensitive
 * @param fallback Level returned when the name is not recognised
 */
Level parseLevel(const std::string& name, Level fallback = Level::INFO);

/// Set the global level from the GSLGEN_LOG_LEVEL environment variable
void initFromEnvironment();

/// Write one formatted line to stderr (timestamp - LEVEL - message)
void write(Level lvl, const std::string& message);

inline bool enabled(Level lvl) noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(level());
}

template<typename... Args>
void trace(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::TRACE)) {
        write(Level::TRACE, fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::DEBUG)) {
        write(Level::DEBUG, fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::INFO)) {
        write(Level::INFO, fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::WARN)) {
        write(Level::WARN, fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::ERROR)) {
        write(Level::ERROR, fmt::format(format, std::forward<Args>(args)...));
    }
}

} // namespace log
} // namespace gslgen
