/**
 * @file HolidayResolver.cpp
 * @brief Implementation of the holiday slide rule.
 */

#include "domain/services/HolidayResolver.hpp"

namespace paytrack::domain {

CivilDate HolidayResolver::resolve(const CivilDate& holidayDate,
                                   const WeeklySchedule& schedule,
                                   int maxSteps) {
    if (schedule.isWorkday(holidayDate.weekday())) {
        return holidayDate;
    }

    const long direction = holidayDate.weekday() == Weekday::Sunday ? 1 : -1;
    for (int step = 1; step <= maxSteps; ++step) {
        const CivilDate candidate = holidayDate.addDays(direction * step);
        if (schedule.isWorkday(candidate.weekday())) {
            return candidate;
        }
    }

    // All-RDO schedule: nothing to slide to.
    return holidayDate;
}

bool HolidayResolver::isObservedHoliday(const CivilDate& date,
                                        const std::vector<Holiday>& holidays,
                                        const WeeklySchedule& schedule,
                                        int maxSteps) {
    for (const auto& holiday : holidays) {
        if (resolve(holiday.date, schedule, maxSteps) == date) return true;
    }
    return false;
}

} // namespace paytrack::domain
