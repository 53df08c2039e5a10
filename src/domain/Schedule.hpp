/**
 * @file Schedule.hpp
 * @brief Standard weekly work schedule (one entry per weekday, per year).
 */

#pragma once

#include <optional>
#include <vector>

#include "domain/CivilDate.hpp"
#include "domain/ClockTime.hpp"

namespace paytrack::domain {

/**
 * @struct ScheduleEntry
 * @brief Expected shift for one weekday of one year.
 *
 * When isWorkday is set, start and end are present. An end at or before the
 * start means the standard shift crosses midnight.
 */
struct ScheduleEntry {
    int year = 0;
    Weekday weekday = Weekday::Monday;
    bool isWorkday = false;
    std::optional<ClockTime> start;
    std::optional<ClockTime> end;

    /** @brief Expected duration in hours; 0 for days off or incomplete entries. */
    double standardHours() const;
};

/**
 * @class WeeklySchedule
 * @brief Read-only view over the schedule entries of a single year.
 *
 * Weekdays without an entry behave as days off with zero expected hours.
 */
class WeeklySchedule {
public:
    WeeklySchedule() = default;
    explicit WeeklySchedule(std::vector<ScheduleEntry> entries);

    /** @brief Entry for the weekday, or nullptr when the schedule has none. */
    const ScheduleEntry* find(Weekday day) const;

    bool isWorkday(Weekday day) const;
    double standardHours(Weekday day) const;
    bool empty() const { return m_entries.empty(); }
    const std::vector<ScheduleEntry>& entries() const { return m_entries; }

private:
    std::vector<ScheduleEntry> m_entries;
};

} // namespace paytrack::domain
