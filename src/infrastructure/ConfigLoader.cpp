/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace paytrack::infrastructure {

using json = nlohmann::json;

namespace {

void ReadStringList(const json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key)) return;
    out = j.at(key).get<std::vector<std::string>>();
}

// Reads a numeric key; a value outside [lo, hi] is logged and the current value kept.
template <typename T>
void ReadInRange(const json& j, const char* key, T lo, T hi, T& out) {
    if (!j.contains(key)) return;
    const T value = j.at(key).get<T>();
    if (value < lo || value > hi) {
        std::cerr << "[ConfigLoader] " << key << " = " << value << " is outside [" << lo << ", " << hi
                  << "], keeping " << out << std::endl;
        return;
    }
    out = value;
}

domain::PayrollSettings FromJson(const json& j) {
    domain::PayrollSettings s;

    ReadInRange(j, "night_differential_factor", 0.0, 10.0, s.nightDifferentialFactor);
    ReadInRange(j, "sunday_premium_factor", 0.0, 10.0, s.sundayPremiumFactor);
    ReadInRange(j, "ojti_factor", 0.0, 10.0, s.ojtiFactor);
    ReadInRange(j, "cic_factor", 0.0, 10.0, s.cicFactor);
    ReadInRange(j, "flsa_premium_factor", 0.0, 10.0, s.flsaPremiumFactor);

    ReadInRange(j, "daily_regular_cap_hours", 0.25, 24.0, s.dailyRegularCapHours);
    ReadInRange(j, "night_start_hour", 0, 24, s.nightStartHour);
    ReadInRange(j, "night_end_hour", 0, 24, s.nightEndHour);
    ReadInRange(j, "late_start_hour", 0, 23, s.lateStartHour);
    ReadInRange(j, "holiday_slide_max_steps", 1, 366, s.holidaySlideMaxSteps);

    ReadInRange(j, "leave_tolerance_minutes", 0, 24 * 60, s.leaveToleranceMinutes);
    ReadInRange(j, "currency_tolerance", 0.0, 1000.0, s.currencyTolerance);

    ReadInRange(j, "ledger_threshold", 0.0, 1.0e6, s.ledgerThreshold);
    ReadInRange(j, "max_ledger_periods", 1, 100000, s.maxLedgerPeriods);

    if (j.contains("pay_period_anchor")) {
        s.payPeriodAnchor = domain::CivilDate::Parse(j.at("pay_period_anchor").get<std::string>());
    }
    ReadInRange(j, "pay_period_days", 1, 366, s.payPeriodDays);

    ReadStringList(j, "exempt_leave_types", s.exemptLeaveTypes);
    ReadStringList(j, "projected_leave_types", s.projectedLeaveTypes);
    ReadStringList(j, "percentage_deduction_keywords", s.percentageDeductionKeywords);
    ReadStringList(j, "tax_deduction_keywords", s.taxDeductionKeywords);

    return s;
}

} // namespace

domain::PayrollSettings ConfigLoader::ParseSettings(const std::string& jsonText) {
    try {
        return FromJson(json::parse(jsonText));
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Invalid settings, using defaults: " << e.what() << std::endl;
    }
    return domain::PayrollSettings::Defaults();
}

domain::PayrollSettings ConfigLoader::LoadSettings(const std::string& path) {
    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        return domain::PayrollSettings::Defaults();
    }

    std::ifstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << ", using defaults" << std::endl;
        return domain::PayrollSettings::Defaults();
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return ParseSettings(buffer.str());
}

} // namespace paytrack::infrastructure
