/**
 * @file Schedule.cpp
 * @brief Implementation of ScheduleEntry / WeeklySchedule.
 */

#include "domain/Schedule.hpp"

#include <utility>

namespace paytrack::domain {

double ScheduleEntry::standardHours() const {
    if (!isWorkday || !start || !end) return 0.0;
    int minutes = end->minutesOfDay() - start->minutesOfDay();
    if (minutes <= 0) minutes += 24 * 60;
    return minutes / 60.0;
}

WeeklySchedule::WeeklySchedule(std::vector<ScheduleEntry> entries)
    : m_entries(std::move(entries)) {}

const ScheduleEntry* WeeklySchedule::find(Weekday day) const {
    for (const auto& entry : m_entries) {
        if (entry.weekday == day) return &entry;
    }
    return nullptr;
}

bool WeeklySchedule::isWorkday(Weekday day) const {
    const ScheduleEntry* entry = find(day);
    return entry != nullptr && entry->isWorkday;
}

double WeeklySchedule::standardHours(Weekday day) const {
    const ScheduleEntry* entry = find(day);
    return entry ? entry->standardHours() : 0.0;
}

} // namespace paytrack::domain
