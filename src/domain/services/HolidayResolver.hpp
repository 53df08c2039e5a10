/**
 * @file HolidayResolver.hpp
 * @brief Domain service applying the holiday slide rule to a work schedule.
 */

#pragma once

#include <vector>

#include "domain/CivilDate.hpp"
#include "domain/Holiday.hpp"
#include "domain/Schedule.hpp"

namespace paytrack::domain {

/**
 * @class HolidayResolver
 * @brief Computes the day a holiday is actually credited on ("in lieu of" date).
 *
 * A holiday on a scheduled workday is observed on that day. A holiday on a day
 * off slides to the nearest workday: forward when it falls on a Sunday,
 * backward otherwise (typically Saturday).
 */
class HolidayResolver {
public:
    static constexpr int kDefaultMaxSteps = 14;

    /**
     * @brief Observed date for one holiday.
     * @param holidayDate Calendar date of the holiday.
     * @param schedule Schedule of the holiday's year.
     * @param maxSteps Search cap; when no workday is found the original date is returned.
     */
    static CivilDate resolve(const CivilDate& holidayDate,
                             const WeeklySchedule& schedule,
                             int maxSteps = kDefaultMaxSteps);

    /** @brief True if date is the observed date of any of the holidays. */
    static bool isObservedHoliday(const CivilDate& date,
                                  const std::vector<Holiday>& holidays,
                                  const WeeklySchedule& schedule,
                                  int maxSteps = kDefaultMaxSteps);
};

} // namespace paytrack::domain
