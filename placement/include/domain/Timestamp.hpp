#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>

namespace placement::domain {

/**
 * @brief Момент времени UTC
 *
 * Строковое представление: ISO 8601 с миллисекундами,
 * "2026-10-19T10:30:00.123Z". Миллисекунды при разборе необязательны.
 */
struct Timestamp {
    using Clock = std::chrono::system_clock;

    Clock::time_point value;

    Timestamp() : value(Clock::now()) {}

    explicit Timestamp(Clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(Clock::now());
    }

    /**
     * @throws std::invalid_argument если строка не в формате ISO 8601 UTC
     */
    static Timestamp fromString(const std::string& iso) {
        std::tm tm = {};
        int millis = 0;
        int consumed = 0;

        int fields = std::sscanf(iso.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                                 &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                                 &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
        if (fields != 6) {
            throw std::invalid_argument("Invalid timestamp: " + iso);
        }

        const char* rest = iso.c_str() + consumed;
        if (*rest == '.') {
            int digits = 0;
            if (std::sscanf(rest, ".%3d%n", &millis, &digits) != 1) {
                throw std::invalid_argument("Invalid timestamp fraction: " + iso);
            }
            rest += digits;
        }
        if (*rest != 'Z' || *(rest + 1) != '\0') {
            throw std::invalid_argument("Timestamp must be UTC (trailing Z): " + iso);
        }

        tm.tm_year -= 1900;
        tm.tm_mon -= 1;
        return Timestamp(Clock::from_time_t(timegm(&tm)) + std::chrono::milliseconds(millis));
    }

    std::string toString() const {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()).count();
        std::time_t seconds = static_cast<std::time_t>(millis / 1000);

        std::tm tm = {};
        gmtime_r(&seconds, &tm);

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec,
                      static_cast<int>(millis % 1000));
        return buffer;
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace placement::domain
