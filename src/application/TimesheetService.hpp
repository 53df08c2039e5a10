/**
 * @file TimesheetService.hpp
 * @brief Service assembling biweekly timesheets and their daily buckets.
 */

#pragma once

#include <memory>
#include <vector>

#include "domain/CivilDate.hpp"
#include "domain/DailyBucket.hpp"
#include "domain/PayrollSettings.hpp"
#include "domain/Schedule.hpp"
#include "domain/ShiftEntry.hpp"
#include "domain/repositories/IHolidayRepository.hpp"
#include "domain/repositories/IScheduleRepository.hpp"
#include "domain/repositories/IShiftEntryRepository.hpp"

namespace paytrack::application {

/**
 * @class TimesheetService
 * @brief Pay-period calendar plus the glue between stored rows and the breakdown engine.
 */
class TimesheetService {
public:
    TimesheetService(std::shared_ptr<domain::IScheduleRepository> schedules,
                     std::shared_ptr<domain::IHolidayRepository> holidays,
                     std::shared_ptr<domain::IShiftEntryRepository> shifts,
                     domain::PayrollSettings settings);

    /** @brief The dates of the period ending on periodEnding, oldest first. */
    static std::vector<domain::CivilDate> PeriodDates(const domain::CivilDate& periodEnding, int periodDays = 14);

    /**
     * @brief Period end of the biweekly cycle containing date.
     * @param anchor Any known period-end date.
     */
    static domain::CivilDate PeriodEndingFor(const domain::CivilDate& date,
                                             const domain::CivilDate& anchor,
                                             int periodDays = 14);

    /** @brief PeriodEndingFor() with the configured anchor. */
    domain::CivilDate PeriodEndingFor(const domain::CivilDate& date) const;

    /**
     * @brief One row per day of the period.
     *
     * Saved rows win. Unsaved workdays get their scheduled start and end,
     * unsaved days off stay empty.
     */
    std::vector<domain::ShiftEntry> LoadTimesheet(const domain::CivilDate& periodEnding);

    /** @brief Only what the user saved, sorted by date. */
    std::vector<domain::ShiftEntry> SavedEntries(const domain::CivilDate& periodEnding);

    bool HasSavedEntries(const domain::CivilDate& periodEnding);

    /** @brief Buckets of each row, each against its own year's schedule. */
    std::vector<domain::DailyBucket> ComputeBuckets(const std::vector<domain::ShiftEntry>& entries);

    domain::WeeklySchedule ScheduleFor(int year);

    /**
     * @brief Holidays of year-1 through year+1.
     * A holiday can slide across New Year, so neighbours are included.
     */
    std::vector<domain::Holiday> HolidaysAround(int year);

    const domain::PayrollSettings& GetSettings() const { return m_settings; }

private:
    std::shared_ptr<domain::IScheduleRepository> m_schedules;
    std::shared_ptr<domain::IHolidayRepository> m_holidays;
    std::shared_ptr<domain::IShiftEntryRepository> m_shifts;
    domain::PayrollSettings m_settings;
};

} // namespace paytrack::application
