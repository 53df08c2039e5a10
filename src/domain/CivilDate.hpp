/**
 * @file CivilDate.hpp
 * @brief Value Object for a proleptic Gregorian calendar date (no time zone).
 */

#pragma once

#include <optional>
#include <string>

namespace paytrack::domain {

/**
 * @enum Weekday
 * @brief Day of the week, Monday first (matches the schedule table layout).
 */
enum class Weekday {
    Monday = 0,
    Tuesday = 1,
    Wednesday = 2,
    Thursday = 3,
    Friday = 4,
    Saturday = 5,
    Sunday = 6
};

/**
 * @brief Short English name for display/logging.
 */
inline std::string WeekdayToString(Weekday day) {
    switch (day) {
        case Weekday::Monday: return "Mon";
        case Weekday::Tuesday: return "Tue";
        case Weekday::Wednesday: return "Wed";
        case Weekday::Thursday: return "Thu";
        case Weekday::Friday: return "Fri";
        case Weekday::Saturday: return "Sat";
        case Weekday::Sunday: return "Sun";
        default: return "???";
    }
}

/**
 * @class CivilDate
 * @brief Calendar date backed by a serial day number (days since 1970-01-01).
 *
 * All arithmetic goes through the day number, so stepping across month and
 * year boundaries (holiday slides, overnight shifts) needs no special cases.
 */
class CivilDate {
public:
    /** @brief 1970-01-01. */
    CivilDate() = default;

    /**
     * @brief Builds a date from its fields.
     * @throws std::invalid_argument if the fields do not name a real day.
     */
    CivilDate(int year, int month, int day);

    /** @brief Builds a date from a serial day number. */
    static CivilDate FromDayNumber(long dayNumber);

    /**
     * @brief Parses an ISO "YYYY-MM-DD" string.
     * @throws std::invalid_argument on malformed input.
     */
    static CivilDate Parse(const std::string& text);

    /** @brief Non-throwing variant of Parse(). */
    static std::optional<CivilDate> TryParse(const std::string& text);

    int year() const { return m_year; }
    int month() const { return m_month; }
    int day() const { return m_day; }

    /** @brief Days since 1970-01-01 (negative before). */
    long dayNumber() const { return m_dayNumber; }

    Weekday weekday() const;

    CivilDate addDays(long days) const { return FromDayNumber(m_dayNumber + days); }

    /** @brief ISO "YYYY-MM-DD". */
    std::string toString() const;

    static bool IsLeapYear(int year);
    static int DaysInMonth(int year, int month);

    bool operator==(const CivilDate& other) const { return m_dayNumber == other.m_dayNumber; }
    bool operator!=(const CivilDate& other) const { return m_dayNumber != other.m_dayNumber; }
    bool operator<(const CivilDate& other) const { return m_dayNumber < other.m_dayNumber; }
    bool operator<=(const CivilDate& other) const { return m_dayNumber <= other.m_dayNumber; }
    bool operator>(const CivilDate& other) const { return m_dayNumber > other.m_dayNumber; }
    bool operator>=(const CivilDate& other) const { return m_dayNumber >= other.m_dayNumber; }

private:
    int m_year = 1970;
    int m_month = 1;
    int m_day = 1;
    long m_dayNumber = 0;
};

} // namespace paytrack::domain
