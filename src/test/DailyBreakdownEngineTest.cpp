#undef NDEBUG
#include <cassert>
#include <iostream>

#include "domain/services/DailyBreakdownEngine.hpp"
#include "test/TestFixtures.hpp"

using namespace paytrack::domain;
using namespace paytrack::test;

namespace {

void TestRegularAndOvertime(const WeeklySchedule& schedule) {
    // Monday, scheduled 8h, worked 10h.
    auto b = DailyBreakdownEngine::breakdown(Shift("2025-01-06", "07:00", "17:00"), schedule, {});
    assert(Near(b.workedHours, 10.0));
    assert(Near(b.regularHours, 8.0));
    assert(Near(b.overtimeHours, 2.0));
    assert(Near(b.nightHours, 0.0));
    assert(Near(b.unresolvedGapHours, 0.0));
    assert(b.diagnostics.empty());
    std::cout << "[PASS] 10h on a workday splits 8 + 2." << std::endl;
}

void TestOvernightShifts(const WeeklySchedule& schedule) {
    // Late start: assumed to have begun the previous evening (Sunday 22:00 -> Monday 06:00).
    auto late = DailyBreakdownEngine::breakdown(Shift("2025-01-06", "22:00", "06:00"), schedule, {});
    assert(Near(late.workedHours, 8.0));
    assert(Near(late.nightHours, 8.0));
    assert(Near(late.regularHours, 8.0));
    assert(Near(late.sundayHours, 8.0)); // touch rule: started on Sunday
    assert(HasDiagnostic(late.diagnostics, DiagnosticCode::AmbiguousShiftBoundary));

    // Early start: runs forward past midnight (Monday 18:00 -> Tuesday 02:00).
    auto early = DailyBreakdownEngine::breakdown(Shift("2025-01-06", "18:00", "02:00"), schedule, {});
    assert(Near(early.workedHours, 8.0));
    assert(Near(early.nightHours, 8.0));
    assert(Near(early.sundayHours, 0.0));
    assert(HasDiagnostic(early.diagnostics, DiagnosticCode::AmbiguousShiftBoundary));

    // Partial night window: 15:00 -> 23:00 has 5h at or after 18:00.
    auto swing = DailyBreakdownEngine::breakdown(Shift("2025-01-07", "15:00", "23:00"), schedule, {});
    assert(Near(swing.nightHours, 5.0));
    std::cout << "[PASS] Overnight shifts and night hours." << std::endl;
}

void TestDayOffIsOvertime(const WeeklySchedule& schedule) {
    // Saturday 18:00 -> Sunday 02:00 on a day off: all overtime, calendar rule for Sunday.
    auto b = DailyBreakdownEngine::breakdown(Shift("2025-01-11", "18:00", "02:00"), schedule, {});
    assert(Near(b.regularHours, 0.0));
    assert(Near(b.overtimeHours, 8.0));
    assert(Near(b.sundayHours, 2.0));
    assert(Near(b.nightHours, 8.0));

    // Sunday day off 06:00 -> 10:00: every quarter-hour is on Sunday.
    auto sunday = DailyBreakdownEngine::breakdown(Shift("2025-01-12", "06:00", "10:00"), schedule, {});
    assert(Near(sunday.overtimeHours, 4.0));
    assert(Near(sunday.sundayHours, 4.0));
    assert(Near(sunday.unresolvedGapHours, 0.0));
    std::cout << "[PASS] Day-off work is overtime with calendar Sunday rule." << std::endl;
}

void TestGapAnalysis(const WeeklySchedule& schedule) {
    ShiftEntry annual = Shift("2025-01-08", "07:00", "11:00");
    annual.leave = LeaveDesignation::Annual;
    auto charged = DailyBreakdownEngine::breakdown(annual, schedule, {});
    assert(Near(charged.regularHours, 4.0));
    assert(Near(charged.chargedLeaveHours, 4.0));
    assert(Near(charged.holidayLeaveHours, 0.0));
    assert(charged.leaveDesignation && *charged.leaveDesignation == LeaveDesignation::Annual);

    auto unresolved = DailyBreakdownEngine::breakdown(Shift("2025-01-08", "07:00", "11:00"), schedule, {});
    assert(Near(unresolved.unresolvedGapHours, 4.0));
    assert(Near(unresolved.chargedLeaveHours, 0.0));
    assert(HasDiagnostic(unresolved.diagnostics, DiagnosticCode::UnresolvedGap));

    auto holidayLeave = DailyBreakdownEngine::breakdown(Leave("2025-01-08", LeaveDesignation::Holiday), schedule, {});
    assert(Near(holidayLeave.holidayLeaveHours, 8.0));
    assert(Near(holidayLeave.regularHours, 0.0));

    // Gaps on a day off are not analysed.
    auto dayOff = DailyBreakdownEngine::breakdown(Leave("2025-01-11", LeaveDesignation::Sick), schedule, {});
    assert(Near(dayOff.chargedLeaveHours, 0.0));
    std::cout << "[PASS] Gap analysis." << std::endl;
}

void TestObservedHoliday() {
    const WeeklySchedule schedule(DayShiftSchedule(2026));
    const std::vector<Holiday> holidays = {{2026, "Independence Day", CivilDate(2026, 7, 4)}};

    // Not worked: the slid Friday is paid holiday leave without any designation.
    ShiftEntry off;
    off.date = CivilDate(2026, 7, 3);
    auto leave = DailyBreakdownEngine::breakdown(off, schedule, holidays);
    assert(leave.observedHoliday);
    assert(Near(leave.holidayLeaveHours, 8.0));
    assert(!HasDiagnostic(leave.diagnostics, DiagnosticCode::UnresolvedGap));

    // Worked: premium stacks on the regular hours.
    auto worked = DailyBreakdownEngine::breakdown(Shift("2026-07-03", "07:00", "17:00"), schedule, holidays);
    assert(Near(worked.regularHours, 8.0));
    assert(Near(worked.overtimeHours, 2.0));
    assert(Near(worked.holidayWorkedHours, 8.0));
    assert(Near(worked.holidayLeaveHours, 0.0));
    std::cout << "[PASS] Observed holiday." << std::endl;
}

void TestMissingScheduleDegrades() {
    const WeeklySchedule empty;
    ShiftEntry entry = Shift("2025-01-06", "07:00", "15:00");
    entry.supplemental[SupplementalCategory::Ojti] = 2.0;
    auto b = DailyBreakdownEngine::breakdown(entry, empty, {});
    assert(HasDiagnostic(b.diagnostics, DiagnosticCode::MissingScheduleData));
    assert(Near(b.regularHours, 0.0));
    assert(Near(b.overtimeHours, 8.0));
    assert(Near(b.supplemental.at(SupplementalCategory::Ojti), 2.0));
    std::cout << "[PASS] Missing schedule degrades to a day off." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DailyBreakdownEngine Test..." << std::endl;

    const WeeklySchedule schedule(DayShiftSchedule(2025));
    TestRegularAndOvertime(schedule);
    TestOvernightShifts(schedule);
    TestDayOffIsOvertime(schedule);
    TestGapAnalysis(schedule);
    TestObservedHoliday();
    TestMissingScheduleDegrades();

    auto all = DailyBreakdownEngine::breakdownAll(
        {Shift("2025-01-06", "07:00", "15:00"), Shift("2025-01-07", "07:00", "15:00")}, schedule, {});
    assert(all.size() == 2);

    std::cout << "[PASS] DailyBreakdownEngine Test." << std::endl;
    return 0;
}
