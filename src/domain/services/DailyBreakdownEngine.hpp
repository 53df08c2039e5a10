/**
 * @file DailyBreakdownEngine.hpp
 * @brief Domain service turning one day's schedule and actual shift into pay-category hours.
 */

#pragma once

#include <vector>

#include "domain/DailyBucket.hpp"
#include "domain/Holiday.hpp"
#include "domain/PayrollSettings.hpp"
#include "domain/Schedule.hpp"
#include "domain/ShiftEntry.hpp"

namespace paytrack::domain {

/**
 * @class DailyBreakdownEngine
 * @brief Computes the DailyBucket of a single calendar day.
 *
 * Rules applied, in order:
 *  - schedule lookup (missing weekday = day off, zero expected hours)
 *  - observed-holiday test through HolidayResolver
 *  - worked duration, with the midnight-crossing heuristic when end <= start
 *  - night hours and Sunday hours on a quarter-hour grid
 *  - gap analysis (holiday leave, charged leave, or unresolved)
 *  - regular/overtime split and holiday-worked premium
 *
 * Pure: the result depends only on the arguments.
 */
class DailyBreakdownEngine {
public:
    /**
     * @param entry Actual-worked row for the day (times already validated).
     * @param schedule Schedule of entry.date's year.
     * @param holidays Holidays whose observed date may land on entry.date.
     * @param settings Caps, night window and heuristics.
     */
    static DailyBucket breakdown(const ShiftEntry& entry,
                                 const WeeklySchedule& schedule,
                                 const std::vector<Holiday>& holidays,
                                 const PayrollSettings& settings = PayrollSettings{});

    /** @brief Convenience: breakdown() over each row, same schedule and holidays. */
    static std::vector<DailyBucket> breakdownAll(const std::vector<ShiftEntry>& entries,
                                                 const WeeklySchedule& schedule,
                                                 const std::vector<Holiday>& holidays,
                                                 const PayrollSettings& settings = PayrollSettings{});
};

} // namespace paytrack::domain
