#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/console.h — Levelled console logging with colors
// ═══════════════════════════════════════════════════════════════════
//
//  console::debug("multipart: part", name, "complete");
//  console::warn("could not remove", path);
//
//  The active level is process-wide. It starts from FORMPP_LOG_LEVEL
//  (debug | info | warn | error | silent) and defaults to info.
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <mutex>
#include <nlohmann/json.hpp>

namespace formpp::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

// ── Parse a level name (case-insensitive) ──
inline Level levelFromString(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "debug")                      return Level::Debug;
    if (lower == "info" || lower == "log")     return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error")                      return Level::Error;
    if (lower == "silent" || lower == "off")   return Level::Silent;
    throw std::invalid_argument("Unknown log level '" + std::string(name) + "'");
}

namespace detail {

// ANSI color codes
struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

inline Level initialLevel() {
    const char* raw = std::getenv("FORMPP_LOG_LEVEL");
    if (raw == nullptr || *raw == '\0') return Level::Info;
    try {
        return levelFromString(raw);
    } catch (const std::invalid_argument&) {
        std::cerr << "formpp: ignoring FORMPP_LOG_LEVEL='" << raw << "'" << std::endl;
        return Level::Info;
    }
}

inline std::atomic<Level>& activeLevel() {
    static std::atomic<Level> level{initialLevel()};
    return level;
}

// Stringify a single argument
template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
        return std::to_string(arg);
    } else if constexpr (requires { nlohmann::json(arg).dump(); }) {
        return nlohmann::json(arg).dump();
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, std::ostream& os, const char* color, const char* prefix,
           const Args&... args) {
    if (level < activeLevel().load(std::memory_order_relaxed)) return;

    std::ostringstream line;
    line << Colors::Gray << "[" << timestamp() << "] "
         << color << prefix << Colors::Reset;

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);
    os << line.str() << std::endl;
}

} // namespace detail

inline void setLevel(Level level) {
    detail::activeLevel().store(level, std::memory_order_relaxed);
}

inline Level level() {
    return detail::activeLevel().load(std::memory_order_relaxed);
}

// ── console::log ──
template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Reset, "", args...);
}

// ── console::info ──
template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Blue, "ℹ ", args...);
}

// ── console::warn ──
template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

// ── console::error ──
template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "✖ ", args...);
}

// ── console::success ──
template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Green, "✔ ", args...);
}

// ── console::debug ──
template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cout, detail::Colors::Cyan, "● ", args...);
}

// ── console::time / console::timeEnd ──
namespace detail {
    struct Timers {
        std::mutex mutex;
        std::unordered_map<std::string, std::chrono::steady_clock::time_point> started;
    };
    inline Timers& timers() {
        static Timers t;
        return t;
    }
}

inline void time(const std::string& label) {
    auto& t = detail::timers();
    std::lock_guard<std::mutex> lock(t.mutex);
    t.started[label] = std::chrono::steady_clock::now();
}

inline void timeEnd(const std::string& label) {
    std::chrono::steady_clock::time_point start;
    {
        auto& t = detail::timers();
        std::lock_guard<std::mutex> lock(t.mutex);
        auto it = t.started.find(label);
        if (it == t.started.end()) {
            warn("Timer '" + label + "' does not exist");
            return;
        }
        start = it->second;
        t.started.erase(it);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
    log(label + ":", std::to_string(ms) + "ms");
}

} // namespace formpp::console
