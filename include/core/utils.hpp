#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace logictest::utils {

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief RFC 3339 timestamp with nanosecond precision, UTC ("Z" suffix)
 */
inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        tp.time_since_epoch()) % 1000000000;

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:09d}Z", time_buf, static_cast<long long>(ns.count()));
}

// ============================================================================
// Numeric Parsing (std::from_chars)
// ============================================================================

// Parse integer, returns std::nullopt on failure or trailing garbage
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

[[nodiscard]] inline bool is_blank(std::string_view str) {
    return str.find_first_not_of(" \t\n\r\f\v") == std::string_view::npos;
}

/**
 * @brief Split on runs of whitespace, dropping empty fields.
 */
inline std::vector<std::string> split_whitespace(std::string_view str) {
    std::vector<std::string> fields;
    size_t i = 0;
    while (i < str.size()) {
        while (i < str.size() && std::isspace(static_cast<unsigned char>(str[i]))) ++i;
        const size_t start = i;
        while (i < str.size() && !std::isspace(static_cast<unsigned char>(str[i]))) ++i;
        if (i > start) {
            fields.emplace_back(str.substr(start, i - start));
        }
    }
    return fields;
}

/**
 * @brief Replace every newline (and carriage return) with a single space.
 */
[[nodiscard]] inline std::string flatten_newlines(std::string s) {
    for (char& c : s) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return s;
}

/**
 * @brief Find the first '#' not preceded by a backslash.
 * @return Position of the marker, or npos if not found.
 */
[[nodiscard]] inline size_t find_unescaped_hash(std::string_view s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '#' && (i == 0 || s[i - 1] != '\\')) {
            return i;
        }
    }
    return std::string_view::npos;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

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

enum class Level { INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline Level& min_level() {
        static Level level = Level::INFO;
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < static_cast<int>(min_level())) {
            return;
        }

        const char* tag = "";
        switch (level) {
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
 * @brief Parse "info" / "warn" / "error" (case-insensitive)
 */
[[nodiscard]] inline std::optional<Level> parse_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void set_level(Level level) {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    detail::min_level() = level;
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

} // namespace logictest::utils
