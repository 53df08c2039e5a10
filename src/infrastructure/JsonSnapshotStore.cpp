/**
 * @file JsonSnapshotStore.cpp
 * @brief Implementation of JsonSnapshotStore.
 */

#include "infrastructure/JsonSnapshotStore.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace paytrack::infrastructure {

using json = nlohmann::json;

namespace {

// Absent, null and "" all mean "not recorded".
std::optional<domain::ClockTime> OptionalTime(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const std::string text = j.at(key).get<std::string>();
    if (text.empty()) return std::nullopt;
    return domain::ClockTime::Parse(text);
}

std::string OptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    return j.at(key).get<std::string>();
}

double OptionalNumber(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return 0.0;
    return j.at(key).get<double>();
}

// Statement ids come from an autoincrement column, so accept numbers too.
std::string IdOf(const json& j) {
    const json& id = j.at("id");
    if (id.is_number_integer()) return std::to_string(id.get<long long>());
    return id.get<std::string>();
}

domain::ScheduleEntry ParseScheduleEntry(const json& j) {
    domain::ScheduleEntry entry;
    entry.year = j.at("year").get<int>();
    const int weekday = j.at("weekday").get<int>();
    if (weekday < 0 || weekday > 6) {
        throw std::invalid_argument("Weekday out of range: " + std::to_string(weekday));
    }
    entry.weekday = static_cast<domain::Weekday>(weekday);
    entry.isWorkday = j.value("is_workday", false);
    entry.start = OptionalTime(j, "start_time");
    entry.end = OptionalTime(j, "end_time");
    return entry;
}

domain::Holiday ParseHoliday(const json& j) {
    domain::Holiday holiday;
    holiday.date = domain::CivilDate::Parse(j.at("date").get<std::string>());
    holiday.year = j.value("year", holiday.date.year());
    holiday.name = OptionalString(j, "name");
    return holiday;
}

domain::ShiftEntry ParseShiftEntry(const json& j) {
    domain::ShiftEntry entry;
    entry.date = domain::CivilDate::Parse(j.at("day_date").get<std::string>());
    entry.start = OptionalTime(j, "start_time");
    entry.end = OptionalTime(j, "end_time");

    const std::string leave = OptionalString(j, "leave_type");
    if (!leave.empty()) {
        entry.leave = domain::LeaveDesignationFromString(leave);
    }

    const double ojti = OptionalNumber(j, "ojti_hours");
    const double cic = OptionalNumber(j, "cic_hours");
    if (ojti > 0.0) entry.supplemental[domain::SupplementalCategory::Ojti] = ojti;
    if (cic > 0.0) entry.supplemental[domain::SupplementalCategory::Cic] = cic;
    return entry;
}

domain::DeclaredPaycheck ParsePaycheck(const json& j) {
    domain::DeclaredPaycheck p;
    p.id = IdOf(j);
    p.payDate = domain::CivilDate::Parse(j.at("pay_date").get<std::string>());
    p.periodEnding = domain::CivilDate::Parse(j.at("period_ending").get<std::string>());
    p.agency = OptionalString(j, "agency");
    p.grossPay = OptionalNumber(j, "gross_pay");
    p.totalDeductions = OptionalNumber(j, "total_deductions");
    p.netPay = OptionalNumber(j, "net_pay");
    p.remarks = OptionalString(j, "remarks");

    for (const auto& row : j.value("earnings", json::array())) {
        domain::DeclaredEarningsLine line;
        line.type = row.at("type").get<std::string>();
        line.rate = OptionalNumber(row, "rate");
        line.hoursCurrent = OptionalNumber(row, "hours_current");
        line.hoursAdjusted = OptionalNumber(row, "hours_adjusted");
        line.amountCurrent = OptionalNumber(row, "amount_current");
        line.amountAdjusted = OptionalNumber(row, "amount_adjusted");
        line.amountYtd = OptionalNumber(row, "amount_ytd");
        p.earnings.push_back(line);
    }
    for (const auto& row : j.value("deductions", json::array())) {
        domain::DeclaredDeductionLine line;
        line.type = row.at("type").get<std::string>();
        line.amountCurrent = OptionalNumber(row, "amount_current");
        line.amountAdjusted = OptionalNumber(row, "amount_adjusted");
        line.amountYtd = OptionalNumber(row, "amount_ytd");
        p.deductions.push_back(line);
    }
    for (const auto& row : j.value("leave", json::array())) {
        domain::LeaveLine line;
        line.type = row.at("type").get<std::string>();
        line.start = OptionalNumber(row, "balance_start");
        line.earned = OptionalNumber(row, "earned_current");
        line.used = OptionalNumber(row, "used_current");
        line.end = OptionalNumber(row, "balance_end");
        p.leave.push_back(line);
    }
    return p;
}

} // namespace

std::shared_ptr<JsonSnapshotStore> JsonSnapshotStore::FromString(const std::string& jsonText) {
    auto store = std::make_shared<JsonSnapshotStore>();

    try {
        const json root = json::parse(jsonText);

        for (const auto& row : root.value("schedules", json::array())) {
            auto entry = ParseScheduleEntry(row);
            store->m_schedules[entry.year].push_back(entry);
        }
        for (const auto& row : root.value("holidays", json::array())) {
            auto holiday = ParseHoliday(row);
            store->m_holidays[holiday.year].push_back(holiday);
        }
        for (const auto& sheet : root.value("timesheets", json::array())) {
            const auto periodEnding = domain::CivilDate::Parse(sheet.at("period_ending").get<std::string>());
            auto& rows = store->m_timesheets[periodEnding.dayNumber()];
            for (const auto& row : sheet.value("entries", json::array())) {
                rows.push_back(ParseShiftEntry(row));
            }
        }
        for (const auto& row : root.value("paychecks", json::array())) {
            store->m_paychecks.push_back(ParsePaycheck(row));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed snapshot: ") + e.what());
    }

    return store;
}

std::shared_ptr<JsonSnapshotStore> JsonSnapshotStore::LoadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("Cannot open snapshot: " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return FromString(buffer.str());
}

std::vector<domain::ScheduleEntry> JsonSnapshotStore::findSchedule(int year) {
    auto it = m_schedules.find(year);
    if (it == m_schedules.end()) return {};
    return it->second;
}

std::vector<domain::Holiday> JsonSnapshotStore::findHolidays(int year) {
    auto it = m_holidays.find(year);
    if (it == m_holidays.end()) return {};
    return it->second;
}

std::vector<domain::ShiftEntry> JsonSnapshotStore::findByPeriod(const domain::CivilDate& periodEnding) {
    auto it = m_timesheets.find(periodEnding.dayNumber());
    if (it == m_timesheets.end()) return {};
    return it->second;
}

bool JsonSnapshotStore::hasSavedEntries(const domain::CivilDate& periodEnding) {
    auto it = m_timesheets.find(periodEnding.dayNumber());
    return it != m_timesheets.end() && !it->second.empty();
}

std::optional<domain::DeclaredPaycheck> JsonSnapshotStore::findById(const std::string& id) {
    for (const auto& p : m_paychecks) {
        if (p.id == id) return p;
    }
    return std::nullopt;
}

std::vector<domain::DeclaredPaycheck> JsonSnapshotStore::findAll() {
    return m_paychecks;
}

} // namespace paytrack::infrastructure
