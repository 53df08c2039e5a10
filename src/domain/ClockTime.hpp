/**
 * @file ClockTime.hpp
 * @brief Value Object for a wall-clock time of day in 24h "HH:MM" notation.
 */

#pragma once

#include <cctype>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

namespace paytrack::domain {

/**
 * @struct ClockTime
 * @brief Hour and minute of a shift boundary. No date, no seconds.
 */
struct ClockTime {
    int hour = 0;   ///< 0..23
    int minute = 0; ///< 0..59

    ClockTime() = default;
    ClockTime(int h, int m) : hour(h), minute(m) {}

    /** @brief Minutes elapsed since 00:00. */
    int minutesOfDay() const { return hour * 60 + minute; }

    /**
     * @brief Parses "H:MM" or "HH:MM" (military time).
     * @return nullopt when the text is not a valid time.
     */
    static std::optional<ClockTime> TryParse(const std::string& text) {
        const auto colon = text.find(':');
        if (colon == std::string::npos || colon == 0 || colon > 2 || text.size() != colon + 3) {
            return std::nullopt;
        }
        int h = 0;
        for (size_t i = 0; i < colon; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
            h = h * 10 + (text[i] - '0');
        }
        if (!std::isdigit(static_cast<unsigned char>(text[colon + 1])) ||
            !std::isdigit(static_cast<unsigned char>(text[colon + 2]))) {
            return std::nullopt;
        }
        const int m = (text[colon + 1] - '0') * 10 + (text[colon + 2] - '0');
        if (h > 23 || m > 59) return std::nullopt;
        return ClockTime(h, m);
    }

    /**
     * @brief Throwing variant used at the ingestion boundary.
     * @throws std::invalid_argument on malformed input.
     */
    static ClockTime Parse(const std::string& text) {
        auto parsed = TryParse(text);
        if (!parsed) {
            throw std::invalid_argument("Malformed time (expected HH:MM): '" + text + "'");
        }
        return *parsed;
    }

    std::string toString() const {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
        return buf;
    }

    bool operator==(const ClockTime& other) const { return minutesOfDay() == other.minutesOfDay(); }
    bool operator!=(const ClockTime& other) const { return !(*this == other); }
};

} // namespace paytrack::domain
