#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <format>
#include <iostream>
#include <atomic>
#include <mutex>
#include <optional>
#include <type_traits>

namespace joinscout::utils {

// ============================================================================
// Numeric Parsing (std::from_chars: no exceptions or locale)
// ============================================================================

// Parse integer from string_view, returns default_val on failure
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline T parse_int(std::string_view sv, T default_val = T{}) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    return (ec == std::errc{}) ? result : default_val;
}

// Parse integer, returns std::nullopt on failure (for cases where 0 is ambiguous)
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

[[nodiscard]] inline bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

/**
 * @brief Replace the first occurrence of `from` with `to`.
 * @return Copy of `str`, unchanged when `from` does not occur.
 */
[[nodiscard]] inline std::string replace_first(const std::string& str,
                                               std::string_view from,
                                               std::string_view to) {
    const auto pos = str.find(from);
    if (pos == std::string::npos || from.empty()) {
        return str;
    }
    std::string result;
    result.reserve(str.size() + to.size());
    result.append(str, 0, pos);
    result.append(to);
    result.append(str, pos + from.size());
    return result;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

/**
 * @brief Parse a level name ("debug", "info", "warn", "error")
 * @return Level, or nullopt for unknown names
 */
[[nodiscard]] inline std::optional<Level> parse_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() {
    return detail::min_level().load(std::memory_order_relaxed);
}

// Guard for messages that are costly to format
[[nodiscard]] inline bool enabled(Level at) {
    return at >= level();
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace joinscout::utils
