/**
 * @file DailyBucket.hpp
 * @brief Categorized hours for one calendar day, as computed by the breakdown engine.
 */

#pragma once

#include <optional>

#include "domain/CivilDate.hpp"
#include "domain/Diagnostics.hpp"
#include "domain/ShiftEntry.hpp"

namespace paytrack::domain {

/**
 * @struct DailyBucket
 * @brief Ephemeral result, recomputed on every invocation and never persisted by the core.
 */
struct DailyBucket {
    CivilDate date;
    double workedHours = 0.0;
    double regularHours = 0.0;
    double overtimeHours = 0.0;
    double nightHours = 0.0;
    double sundayHours = 0.0;
    double holidayWorkedHours = 0.0;  ///< Premium stacked on base/overtime pay.
    double holidayLeaveHours = 0.0;   ///< Paid, uncharged gap on an observed holiday.
    double chargedLeaveHours = 0.0;   ///< Gap charged against leaveDesignation.
    double unresolvedGapHours = 0.0;  ///< Gap with no designation; caller should surface it.
    bool observedHoliday = false;
    std::optional<LeaveDesignation> leaveDesignation;
    SupplementalHours supplemental;
    Diagnostics diagnostics;
};

} // namespace paytrack::domain
