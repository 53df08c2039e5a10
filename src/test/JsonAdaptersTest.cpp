#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "application/LedgerService.hpp"
#include "application/ReconciliationService.hpp"
#include "application/ReferenceContextResolver.hpp"
#include "application/TimesheetService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonSnapshotStore.hpp"
#include "infrastructure/ReportSerializer.hpp"
#include "test/TestFixtures.hpp"

using namespace paytrack::domain;
using namespace paytrack::application;
using namespace paytrack::infrastructure;
using namespace paytrack::test;
using json = nlohmann::json;

namespace {

const char* kSnapshot = R"({
  "schedules": [
    {"year": 2024, "weekday": 0, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2024, "weekday": 1, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2024, "weekday": 2, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2024, "weekday": 3, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2024, "weekday": 4, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2024, "weekday": 5, "is_workday": false},
    {"year": 2024, "weekday": 6, "is_workday": false},
    {"year": 2025, "weekday": 0, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2025, "weekday": 1, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2025, "weekday": 2, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2025, "weekday": 3, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2025, "weekday": 4, "is_workday": true, "start_time": "07:00", "end_time": "15:00"},
    {"year": 2025, "weekday": 5, "is_workday": false, "start_time": null, "end_time": null},
    {"year": 2025, "weekday": 6, "is_workday": false}
  ],
  "holidays": [
    {"year": 2025, "name": "New Year's Day", "date": "2025-01-01"}
  ],
  "timesheets": [
    {"period_ending": "2025-01-11", "entries": [
      {"day_date": "2025-01-06", "start_time": "07:00", "end_time": "17:00", "leave_type": null, "ojti_hours": 0, "cic_hours": 0},
      {"day_date": "2025-01-07", "start_time": "", "end_time": "", "leave_type": "Annual"}
    ]}
  ],
  "paychecks": [
    {"id": 1, "pay_date": "2025-01-03", "period_ending": "2024-12-28", "agency": "FAA",
     "gross_pay": 4000.0, "total_deductions": 500.0, "net_pay": 3500.0, "remarks": "",
     "earnings": [{"type": "Regular", "rate": 50.0, "hours_current": 80.0, "amount_current": 4000.0, "amount_ytd": 4000.0}],
     "deductions": [{"type": "Federal Tax", "amount_current": 400.0, "amount_ytd": 400.0},
                    {"type": "FEHB", "amount_current": 100.0}],
     "leave": [{"type": "Annual", "balance_start": 6.45, "earned_current": 4.00, "used_current": 2.30, "balance_end": 8.15}]},
    {"id": "2", "pay_date": "2025-01-17", "period_ending": "2025-01-11", "agency": "FAA",
     "gross_pay": 4000.0, "total_deductions": 530.0, "net_pay": 3470.0,
     "earnings": [{"type": "Regular", "rate": 50.0, "hours_current": 80.0, "amount_current": 4000.0, "amount_ytd": 8000.0}],
     "deductions": [{"type": "Federal Tax", "amount_current": 400.0, "amount_ytd": 800.0},
                    {"type": "FEHB", "amount_current": 100.0},
                    {"type": "Dental", "amount_current": 30.0}]}
  ]
})";

void TestSettings() {
    auto defaults = ConfigLoader::LoadSettings("does/not/exist/settings.json");
    assert(Near(defaults.nightDifferentialFactor, 0.10));
    assert(defaults.maxLedgerPeriods == 520);

    auto custom = ConfigLoader::ParseSettings(R"({"ledger_threshold": 5.0, "pay_period_anchor": "2025-01-11",
                                                  "projected_leave_types": ["Annual"]})");
    assert(Near(custom.ledgerThreshold, 5.0));
    assert(custom.payPeriodAnchor == CivilDate(2025, 1, 11));
    assert(custom.projectedLeaveTypes.size() == 1);
    assert(Near(custom.sundayPremiumFactor, 0.25));

    auto outOfRange = ConfigLoader::ParseSettings(R"({"pay_period_days": -3, "max_ledger_periods": 0,
                                                      "night_start_hour": 30, "night_end_hour": -1,
                                                      "sunday_premium_factor": -0.5, "ledger_threshold": 2.5})");
    assert(outOfRange.payPeriodDays == 14);
    assert(outOfRange.maxLedgerPeriods == 520);
    assert(outOfRange.nightStartHour == 18);
    assert(outOfRange.nightEndHour == 6);
    assert(Near(outOfRange.sundayPremiumFactor, 0.25));
    assert(Near(outOfRange.ledgerThreshold, 2.5));
    assert(ConfigLoader::ParseSettings(R"({"pay_period_days": 0})").payPeriodDays == 14);
    assert(ConfigLoader::ParseSettings(R"({"pay_period_days": 7})").payPeriodDays == 7);

    auto malformed = ConfigLoader::ParseSettings("{ not json");
    assert(Near(malformed.ledgerThreshold, 1.0));

    const std::string path = "paytrack_test_settings.json";
    {
        std::ofstream f(path);
        f << R"({"max_ledger_periods": 12})";
    }
    assert(ConfigLoader::LoadSettings(path).maxLedgerPeriods == 12);
    std::filesystem::remove(path);
    std::cout << "[PASS] Settings loading." << std::endl;

    // A rejected period length must leave the calendar usable.
    auto shifts = std::make_shared<InMemoryShiftEntryRepository>();
    auto schedules = std::make_shared<InMemoryScheduleRepository>();
    schedules->byYear[2025] = DayShiftSchedule(2025);
    TimesheetService timesheets(schedules, std::make_shared<InMemoryHolidayRepository>(), shifts,
                                ConfigLoader::ParseSettings(R"({"pay_period_days": -3})"));
    assert(timesheets.LoadTimesheet(CivilDate(2025, 1, 11)).size() == 14);
    std::cout << "[PASS] Out-of-range settings keep their defaults." << std::endl;
}

void TestSnapshotParsing() {
    JsonSnapshotStore empty;
    assert(empty.findAll().empty());
    assert(!empty.findById("1"));
    assert(empty.findSchedule(2025).empty());

    auto store = JsonSnapshotStore::FromString(kSnapshot);
    assert(store->findSchedule(2025).size() == 7);
    assert(store->findSchedule(2030).empty());
    assert(store->findHolidays(2025).size() == 1);

    auto rows = store->findByPeriod(CivilDate(2025, 1, 11));
    assert(rows.size() == 2);
    assert(rows[0].start && rows[0].start->hour == 7);
    assert(!rows[0].leave);
    assert(!rows[1].start);
    assert(rows[1].leave && *rows[1].leave == LeaveDesignation::Annual);
    assert(store->hasSavedEntries(CivilDate(2025, 1, 11)));
    assert(!store->hasSavedEntries(CivilDate(2024, 12, 28)));

    auto first = store->findById("1");
    assert(first);
    assert(first->earnings.size() == 1);
    assert(Near(first->leave[0].start, 6.45));
    assert(!store->findById("99"));
    assert(store->findAll().size() == 2);

    bool malformed = false;
    try {
        JsonSnapshotStore::FromString("{\"paychecks\": [ {");
    } catch (const std::runtime_error&) {
        malformed = true;
    }
    assert(malformed);

    bool badDate = false;
    try {
        JsonSnapshotStore::FromString(R"({"holidays": [{"year": 2025, "name": "x", "date": "2025-02-30"}]})");
    } catch (const std::invalid_argument&) {
        badDate = true;
    }
    assert(badDate);
    std::cout << "[PASS] Snapshot parsing." << std::endl;
}

void TestEndToEnd() {
    auto store = JsonSnapshotStore::FromString(kSnapshot);
    PayrollSettings settings;
    auto timesheets = std::make_shared<TimesheetService>(store, store, store, settings);
    auto references = std::make_shared<ReferenceContextResolver>(store);
    auto ledger = std::make_shared<LedgerService>(timesheets, settings);
    ReconciliationService service(store, timesheets, references, ledger, settings);

    // Defaults fill the unsaved workdays: 72 regular, 2 overtime, 8 holiday worked (Jan 1).
    auto result = service.Reconcile("2");
    assert(result.auditFlags.empty());
    assert(result.buckets.size() == 14);
    assert(result.unresolvedGapDates.empty());
    assert(Near(result.expected.grossPay, 4155.40));
    assert(Near(result.grossDifference, -155.40));
    assert(result.codeDrift.size() == 1);
    assert(result.codeDrift[0] == "CRITICAL: New Deduction appearing: Dental");

    bool notFound = false;
    try {
        service.Reconcile("404");
    } catch (const std::runtime_error&) {
        notFound = true;
    }
    assert(notFound);

    auto history = service.AuditHistory();
    assert(history.size() == 2);
    assert(history[0].paycheckId == "1");
    assert(history[0].codeDrift.empty());
    assert(Near(history[0].effectiveTaxRate, 10.0));
    assert(history[1].codeDrift.size() == 1);

    // Ledger re-derives only from saved rows: 8 regular + 2 overtime = 550.00.
    auto rows = service.BuildLedger();
    assert(rows.size() == 2);
    assert(rows[0].status == LedgerStatus::Unaudited);
    assert(Near(rows[1].expectedGross, 550.0));
    assert(rows[1].status == LedgerStatus::Backpay);
    assert(Near(rows[1].runningBalance, 3450.0));
    std::cout << "[PASS] Reconciliation, audit history and ledger from a snapshot." << std::endl;

    auto ledgerJson = json::parse(ReportSerializer::LedgerToJson(rows));
    assert(ledgerJson.size() == 2);
    assert(ledgerJson[1]["status"] == "Backpay");
    assert(ledgerJson[0]["period_ending"] == "2024-12-28");
    assert(ledgerJson[1]["reliable"] == true);
    assert(ledgerJson[1]["diagnostics"].empty());

    auto breakdownJson = json::parse(ReportSerializer::BreakdownToJson(result.expected));
    assert(breakdownJson["paycheck_id"] == "2");
    assert(breakdownJson["deductions"][1]["ytd"].is_null());
    assert(breakdownJson["deductions"][0]["kind"] == "percentage");

    auto reconcileJson = json::parse(ReportSerializer::ReconciliationToJson(result));
    assert(reconcileJson["buckets"].size() == 14);
    assert(reconcileJson["code_drift"].size() == 1);

    auto historyJson = json::parse(ReportSerializer::AuditHistoryToJson(history));
    assert(historyJson[0]["audit_flags"].empty());

    AuditFlags flags = {{"net_pay", "Math Error: Gross - Ded != Net"}};
    auto flagsJson = json::parse(ReportSerializer::AuditFlagsToJson(flags));
    assert(flagsJson["net_pay"] == "Math Error: Gross - Ded != Net");
    std::cout << "[PASS] JSON reports." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting JSON adapters Test..." << std::endl;

    TestSettings();
    TestSnapshotParsing();
    TestEndToEnd();

    std::cout << "[PASS] JSON adapters Test." << std::endl;
    return 0;
}
