/**
 * @file TimesheetService.cpp
 * @brief Implementation of the TimesheetService class.
 */

#include "application/TimesheetService.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <utility>

#include "domain/services/DailyBreakdownEngine.hpp"

namespace paytrack::application {

TimesheetService::TimesheetService(std::shared_ptr<domain::IScheduleRepository> schedules,
                                   std::shared_ptr<domain::IHolidayRepository> holidays,
                                   std::shared_ptr<domain::IShiftEntryRepository> shifts,
                                   domain::PayrollSettings settings)
    : m_schedules(std::move(schedules)),
      m_holidays(std::move(holidays)),
      m_shifts(std::move(shifts)),
      m_settings(std::move(settings)) {}

std::vector<domain::CivilDate> TimesheetService::PeriodDates(const domain::CivilDate& periodEnding, int periodDays) {
    std::vector<domain::CivilDate> dates;
    dates.reserve(periodDays);
    for (int i = periodDays - 1; i >= 0; --i) {
        dates.push_back(periodEnding.addDays(-i));
    }
    return dates;
}

domain::CivilDate TimesheetService::PeriodEndingFor(const domain::CivilDate& date,
                                                    const domain::CivilDate& anchor,
                                                    int periodDays) {
    const long diff = date.dayNumber() - anchor.dayNumber();
    long remainder = diff % periodDays;
    if (remainder < 0) remainder += periodDays;
    if (remainder == 0) return date;
    return date.addDays(static_cast<int>(periodDays - remainder));
}

domain::CivilDate TimesheetService::PeriodEndingFor(const domain::CivilDate& date) const {
    return PeriodEndingFor(date, m_settings.payPeriodAnchor, m_settings.payPeriodDays);
}

std::vector<domain::ShiftEntry> TimesheetService::SavedEntries(const domain::CivilDate& periodEnding) {
    auto entries = m_shifts->findByPeriod(periodEnding);
    std::sort(entries.begin(), entries.end(), [](const domain::ShiftEntry& a, const domain::ShiftEntry& b) {
        return a.date < b.date;
    });
    return entries;
}

bool TimesheetService::HasSavedEntries(const domain::CivilDate& periodEnding) {
    return m_shifts->hasSavedEntries(periodEnding);
}

std::vector<domain::ShiftEntry> TimesheetService::LoadTimesheet(const domain::CivilDate& periodEnding) {
    std::map<long, domain::ShiftEntry> saved;
    for (auto& entry : m_shifts->findByPeriod(periodEnding)) {
        saved[entry.date.dayNumber()] = entry;
    }

    std::map<int, domain::WeeklySchedule> schedules;
    std::vector<domain::ShiftEntry> rows;
    for (const auto& date : PeriodDates(periodEnding, m_settings.payPeriodDays)) {
        auto it = saved.find(date.dayNumber());
        if (it != saved.end()) {
            rows.push_back(it->second);
            continue;
        }

        auto sched = schedules.find(date.year());
        if (sched == schedules.end()) {
            sched = schedules.emplace(date.year(), ScheduleFor(date.year())).first;
        }

        domain::ShiftEntry row;
        row.date = date;
        const domain::ScheduleEntry* standard = sched->second.find(date.weekday());
        if (standard != nullptr && standard->isWorkday) {
            row.start = standard->start;
            row.end = standard->end;
        }
        rows.push_back(row);
    }
    return rows;
}

domain::WeeklySchedule TimesheetService::ScheduleFor(int year) {
    auto entries = m_schedules->findSchedule(year);
    if (entries.empty()) {
        std::cerr << "[TimesheetService] No schedule defined for " << year << std::endl;
    }
    return domain::WeeklySchedule(std::move(entries));
}

std::vector<domain::Holiday> TimesheetService::HolidaysAround(int year) {
    std::vector<domain::Holiday> all;
    for (int y = year - 1; y <= year + 1; ++y) {
        auto holidays = m_holidays->findHolidays(y);
        all.insert(all.end(), holidays.begin(), holidays.end());
    }
    return all;
}

std::vector<domain::DailyBucket> TimesheetService::ComputeBuckets(const std::vector<domain::ShiftEntry>& entries) {
    std::map<int, domain::WeeklySchedule> schedules;
    std::map<int, std::vector<domain::Holiday>> holidays;

    std::vector<domain::DailyBucket> buckets;
    buckets.reserve(entries.size());
    for (const auto& entry : entries) {
        const int year = entry.date.year();
        if (schedules.find(year) == schedules.end()) {
            schedules.emplace(year, ScheduleFor(year));
            holidays.emplace(year, HolidaysAround(year));
        }
        buckets.push_back(domain::DailyBreakdownEngine::breakdown(entry, schedules[year], holidays[year], m_settings));
    }
    return buckets;
}

} // namespace paytrack::application
