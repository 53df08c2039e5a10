#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>

#include "application/TimesheetService.hpp"
#include "test/TestFixtures.hpp"

using namespace paytrack::domain;
using namespace paytrack::application;
using namespace paytrack::test;

namespace {

void TestPeriodCalendar() {
    auto dates = TimesheetService::PeriodDates(CivilDate(2025, 1, 11));
    assert(dates.size() == 14);
    assert(dates.front() == CivilDate(2024, 12, 29));
    assert(dates.back() == CivilDate(2025, 1, 11));

    const CivilDate anchor(2024, 12, 14);
    assert(TimesheetService::PeriodEndingFor(CivilDate(2024, 12, 14), anchor) == CivilDate(2024, 12, 14));
    assert(TimesheetService::PeriodEndingFor(CivilDate(2024, 12, 15), anchor) == CivilDate(2024, 12, 28));
    assert(TimesheetService::PeriodEndingFor(CivilDate(2025, 1, 6), anchor) == CivilDate(2025, 1, 11));
    // Before the anchor.
    assert(TimesheetService::PeriodEndingFor(CivilDate(2024, 12, 1), anchor) == CivilDate(2024, 12, 14));
    assert(TimesheetService::PeriodEndingFor(CivilDate(2024, 11, 30), anchor) == CivilDate(2024, 11, 30));
    std::cout << "[PASS] Pay-period calendar." << std::endl;
}

void TestLoadTimesheetDefaults() {
    auto schedules = std::make_shared<InMemoryScheduleRepository>();
    auto holidays = std::make_shared<InMemoryHolidayRepository>();
    auto shifts = std::make_shared<InMemoryShiftEntryRepository>();
    schedules->byYear[2024] = DayShiftSchedule(2024);
    schedules->byYear[2025] = DayShiftSchedule(2025);
    shifts->byPeriod[CivilDate(2025, 1, 11).dayNumber()] = {Leave("2025-01-06", LeaveDesignation::Annual)};

    TimesheetService service(schedules, holidays, shifts, PayrollSettings{});
    auto rows = service.LoadTimesheet(CivilDate(2025, 1, 11));
    assert(rows.size() == 14);

    for (const auto& row : rows) {
        if (row.date == CivilDate(2025, 1, 6)) {
            // Saved row wins over the schedule.
            assert(!row.start && !row.end);
            assert(row.leave && *row.leave == LeaveDesignation::Annual);
        } else if (row.date == CivilDate(2025, 1, 7)) {
            assert(row.start && row.start->hour == 7);
            assert(row.end && row.end->hour == 15);
            assert(!row.leave);
        } else if (row.date == CivilDate(2025, 1, 4)) {
            assert(!row.start && !row.end);
        }
    }

    assert(service.HasSavedEntries(CivilDate(2025, 1, 11)));
    assert(!service.HasSavedEntries(CivilDate(2025, 1, 25)));
    assert(service.SavedEntries(CivilDate(2025, 1, 11)).size() == 1);

    auto buckets = service.ComputeBuckets(rows);
    double regular = 0.0, charged = 0.0;
    for (const auto& b : buckets) {
        regular += b.regularHours;
        charged += b.chargedLeaveHours;
    }
    assert(Near(regular, 72.0));
    assert(Near(charged, 8.0));
    std::cout << "[PASS] Timesheet defaults and saved rows." << std::endl;
}

void TestHolidayAcrossNewYear() {
    auto schedules = std::make_shared<InMemoryScheduleRepository>();
    auto holidays = std::make_shared<InMemoryHolidayRepository>();
    auto shifts = std::make_shared<InMemoryShiftEntryRepository>();
    schedules->byYear[2021] = DayShiftSchedule(2021);
    // New Year's Day 2022 is a Saturday, observed Friday 2021-12-31.
    holidays->byYear[2022] = {{2022, "New Year's Day", CivilDate(2022, 1, 1)}};

    TimesheetService service(schedules, holidays, shifts, PayrollSettings{});
    ShiftEntry off;
    off.date = CivilDate(2021, 12, 31);
    auto buckets = service.ComputeBuckets({off});
    assert(buckets.size() == 1);
    assert(buckets[0].observedHoliday);
    assert(Near(buckets[0].holidayLeaveHours, 8.0));
    std::cout << "[PASS] Holiday observed in the previous year." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TimesheetService Test..." << std::endl;

    TestPeriodCalendar();
    TestLoadTimesheetDefaults();
    TestHolidayAcrossNewYear();

    std::cout << "[PASS] TimesheetService Test." << std::endl;
    return 0;
}
