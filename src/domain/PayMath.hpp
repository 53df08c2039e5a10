/**
 * @file PayMath.hpp
 * @brief Legacy payroll numeric conventions: truncation and hours.minutes leave notation.
 */

#pragma once

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace paytrack::domain::paymath {

/**
 * @brief Truncates toward zero at the given scale (100 = cents, 10000 = 4 decimals).
 *
 * The epsilon absorbs binary representation error (0.29 * 100 == 28.999...)
 * so that values that are exact in decimal are never pushed down a unit.
 */
inline double TruncateTo(double value, double scale) {
    constexpr double kEps = 1e-6;
    const double scaled = value * scale;
    const double whole = scaled >= 0.0 ? std::floor(scaled + kEps) : std::ceil(scaled - kEps);
    return whole / scale;
}

/** @brief Hours are carried with 4 decimals, never rounded. */
inline double TruncateHours(double hours) { return TruncateTo(hours, 10000.0); }

/** @brief Currency is carried in whole cents, never rounded. */
inline double TruncateCents(double amount) { return TruncateTo(amount, 100.0); }

/** @brief Strips floating noise from a value that is already a sum of cents. */
inline double NormalizeCents(double amount) { return std::round(amount * 100.0) / 100.0; }

/**
 * @brief Converts a leave balance written as hours.minutes (6.45 == 6h45m) to minutes.
 */
inline int LeaveToMinutes(double hoursDotMinutes) {
    const int sign = hoursDotMinutes < 0.0 ? -1 : 1;
    const double magnitude = std::fabs(hoursDotMinutes);
    const int hours = static_cast<int>(magnitude);
    const int minutes = static_cast<int>(std::lround((magnitude - hours) * 100.0));
    return sign * (hours * 60 + minutes);
}

/** @brief Inverse of LeaveToMinutes(). */
inline double MinutesToLeave(int minutes) {
    const int sign = minutes < 0 ? -1 : 1;
    const int magnitude = std::abs(minutes);
    return sign * ((magnitude / 60) + (magnitude % 60) / 100.0);
}

/** @brief "8.15" style rendering of a minute count. */
inline std::string FormatLeave(int minutes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", MinutesToLeave(minutes));
    return buf;
}

} // namespace paytrack::domain::paymath
