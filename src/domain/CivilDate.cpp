/**
 * @file CivilDate.cpp
 * @brief Implementation of CivilDate.
 */

#include "domain/CivilDate.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace paytrack::domain {

namespace {

// Howard Hinnant's days_from_civil / civil_from_days, shifted so the
// computation year starts on March 1st and Feb 29 is the last day.
long DaysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = static_cast<long>(y) - era * 400;
    const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void CivilFromDays(long z, int& y, int& m, int& d) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const long doe = z - era * 146097;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

bool ParseFixedDigits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

CivilDate::CivilDate(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
        throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    m_year = year;
    m_month = month;
    m_day = day;
    m_dayNumber = DaysFromCivil(year, month, day);
}

CivilDate CivilDate::FromDayNumber(long dayNumber) {
    CivilDate date;
    CivilFromDays(dayNumber, date.m_year, date.m_month, date.m_day);
    date.m_dayNumber = dayNumber;
    return date;
}

std::optional<CivilDate> CivilDate::TryParse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    int y = 0, m = 0, d = 0;
    if (!ParseFixedDigits(text, 0, 4, y) || !ParseFixedDigits(text, 5, 2, m) || !ParseFixedDigits(text, 8, 2, d)) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > DaysInMonth(y, m)) return std::nullopt;
    return CivilDate(y, m, d);
}

CivilDate CivilDate::Parse(const std::string& text) {
    auto parsed = TryParse(text);
    if (!parsed) {
        throw std::invalid_argument("Malformed date (expected YYYY-MM-DD): '" + text + "'");
    }
    return *parsed;
}

Weekday CivilDate::weekday() const {
    // 1970-01-01 was a Thursday.
    long idx = (m_dayNumber + 3) % 7;
    if (idx < 0) idx += 7;
    return static_cast<Weekday>(idx);
}

std::string CivilDate::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", m_year, m_month, m_day);
    return buf;
}

bool CivilDate::IsLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return year % 4 == 0;
}

int CivilDate::DaysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && IsLeapYear(year)) return 29;
    return kDays[month - 1];
}

} // namespace paytrack::domain
