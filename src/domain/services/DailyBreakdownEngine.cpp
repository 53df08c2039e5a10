/**
 * @file DailyBreakdownEngine.cpp
 * @brief Implementation of DailyBreakdownEngine.
 */

#include "domain/services/DailyBreakdownEngine.hpp"

#include <algorithm>
#include <cstdio>
#include <functional>
#include <string>

#include "domain/services/HolidayResolver.hpp"

namespace paytrack::domain {

namespace {

constexpr long long kMinutesPerDay = 24 * 60;
constexpr long long kIncrementMinutes = 15;
constexpr double kIncrementHours = 0.25;

long long FloorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

// Instants are minutes since 1970-01-01 00:00 (no time zone).
CivilDate DateOf(long long instant) {
    return CivilDate::FromDayNumber(static_cast<long>(FloorDiv(instant, kMinutesPerDay)));
}

int HourOf(long long instant) {
    const long long minuteOfDay = instant - FloorDiv(instant, kMinutesPerDay) * kMinutesPerDay;
    return static_cast<int>(minuteOfDay / 60);
}

// Sums 0.25h for each quarter-hour increment starting inside [start, end) that matches.
double CountQuarterHours(long long start, long long end, const std::function<bool(long long)>& matches) {
    double hours = 0.0;
    for (long long cursor = start; cursor < end; cursor += kIncrementMinutes) {
        if (matches(cursor)) hours += kIncrementHours;
    }
    return hours;
}

} // namespace

DailyBucket DailyBreakdownEngine::breakdown(const ShiftEntry& entry,
                                            const WeeklySchedule& schedule,
                                            const std::vector<Holiday>& holidays,
                                            const PayrollSettings& settings) {
    DailyBucket bucket;
    bucket.date = entry.date;
    bucket.leaveDesignation = entry.leave;
    bucket.supplemental = entry.supplemental;

    // 1. Expectation
    const ScheduleEntry* expected = schedule.find(entry.date.weekday());
    if (expected == nullptr) {
        bucket.diagnostics.push_back({DiagnosticCode::MissingScheduleData,
            "No schedule entry for " + WeekdayToString(entry.date.weekday()) + " " +
            std::to_string(entry.date.year()) + "; treated as a day off."});
    }
    const bool isWorkday = expected != nullptr && expected->isWorkday;
    const double stdHours = expected != nullptr ? expected->standardHours() : 0.0;

    // 2. Holiday
    bucket.observedHoliday = HolidayResolver::isObservedHoliday(
        entry.date, holidays, schedule, settings.holidaySlideMaxSteps);

    // 3. Actual worked
    double worked = 0.0;
    if (entry.start && entry.end && *entry.start != *entry.end) {
        const long long midnight = static_cast<long long>(entry.date.dayNumber()) * kMinutesPerDay;
        long long start = midnight + entry.start->minutesOfDay();
        long long end = midnight + entry.end->minutesOfDay();

        if (end <= start) {
            if (entry.start->hour >= settings.lateStartHour) {
                start -= kMinutesPerDay;
                bucket.diagnostics.push_back({DiagnosticCode::AmbiguousShiftBoundary,
                    entry.start->toString() + "-" + entry.end->toString() + " treated as starting the previous day."});
            } else {
                end += kMinutesPerDay;
                bucket.diagnostics.push_back({DiagnosticCode::AmbiguousShiftBoundary,
                    entry.start->toString() + "-" + entry.end->toString() + " treated as ending the next day."});
            }
        }

        worked = (end - start) / 60.0;

        const int nightStart = settings.nightStartHour;
        const int nightEnd = settings.nightEndHour;
        bucket.nightHours = CountQuarterHours(start, end, [nightStart, nightEnd](long long t) {
            const int hour = HourOf(t);
            return hour >= nightStart || hour < nightEnd;
        });

        if (isWorkday) {
            // Touch rule: a scheduled shift overlapping Sunday earns the premium for the whole shift.
            if (DateOf(start).weekday() == Weekday::Sunday || DateOf(end).weekday() == Weekday::Sunday) {
                bucket.sundayHours = std::min(settings.dailyRegularCapHours, worked);
            }
        } else {
            // Calendar rule: only clock time that is literally on a Sunday.
            bucket.sundayHours = CountQuarterHours(start, end, [](long long t) {
                return DateOf(t).weekday() == Weekday::Sunday;
            });
        }
    }
    bucket.workedHours = worked;

    // 4. Gap analysis
    if (isWorkday) {
        const double gap = std::max(0.0, stdHours - worked);
        if (gap > 0.0) {
            const bool holidayLeave = bucket.observedHoliday ||
                (entry.leave && *entry.leave == LeaveDesignation::Holiday);
            if (holidayLeave) {
                bucket.holidayLeaveHours = gap;
            } else if (entry.leave && *entry.leave != LeaveDesignation::None) {
                bucket.chargedLeaveHours = gap;
            } else {
                bucket.unresolvedGapHours = gap;
                char hours[32];
                std::snprintf(hours, sizeof(hours), "%.2f", gap);
                bucket.diagnostics.push_back({DiagnosticCode::UnresolvedGap,
                    entry.date.toString() + ": " + hours + "h scheduled but not worked and no leave designated."});
            }
        }
    }

    // 5. Core buckets
    if (isWorkday) {
        bucket.regularHours = std::min(settings.dailyRegularCapHours, worked);
        bucket.overtimeHours = std::max(0.0, worked - settings.dailyRegularCapHours);
    } else {
        bucket.regularHours = 0.0;
        bucket.overtimeHours = worked;
    }

    // 6. Holiday worked premium
    if (bucket.observedHoliday && worked > 0.0) {
        bucket.holidayWorkedHours = std::min(settings.dailyRegularCapHours, worked);
    }

    return bucket;
}

std::vector<DailyBucket> DailyBreakdownEngine::breakdownAll(const std::vector<ShiftEntry>& entries,
                                                            const WeeklySchedule& schedule,
                                                            const std::vector<Holiday>& holidays,
                                                            const PayrollSettings& settings) {
    std::vector<DailyBucket> buckets;
    buckets.reserve(entries.size());
    for (const auto& entry : entries) {
        buckets.push_back(breakdown(entry, schedule, holidays, settings));
    }
    return buckets;
}

} // namespace paytrack::domain
