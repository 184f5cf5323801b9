#include "gslgen/log.hpp"
#include <fmt/chrono.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace gslgen {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::INFO)};

const char* levelName(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARN: return "WARNING";
        case Level::ERROR: return "ERROR";
        default: return "OFF";
    }
}

} // namespace

Level level() noexcept {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

void setLevel(Level lvl) noexcept {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Level parseLevel(const std::string& name, Level fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return Level::TRACE;
    if (upper == "DEBUG") return Level::DEBUG;
    if (upper == "INFO") return Level::INFO;
    if (upper == "WARN" || upper == "WARNING") return Level::WARN;
    if (upper == "ERROR" || upper == "CRITICAL") return Level::ERROR;
    if (upper == "OFF" || upper == "NONE") return Level::OFF;
    return fallback;
}

void initFromEnvironment() {
    const char* env = std::getenv("GSLGEN_LOG_LEVEL");
    if (env != nullptr) {
        setLevel(parseLevel(env, level()));
    }
}

void write(Level lvl, const std::string& message) {
    const std::tm local = fmt::localtime(std::time(nullptr));
    fmt::print(stderr, "{:%Y-%m-%d %H:%M:%S} - {} - {}\n",
               local, levelName(lvl), message);
}

} // namespace log
} // namespace gslgen
