/**
 * @file PayrollSettings.hpp
 * @brief Every constant the pay engines depend on, passed explicitly to each call.
 *
 * Defaults reproduce the legacy payroll system; settings.json may override them.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/CivilDate.hpp"

namespace paytrack::domain {

struct PayrollSettings {
    // Differential and premium factors, as fractions of the base hourly rate.
    double nightDifferentialFactor = 0.10;
    double sundayPremiumFactor = 0.25;
    double ojtiFactor = 0.25;
    double cicFactor = 0.10;
    double flsaPremiumFactor = 0.5;

    // Daily breakdown.
    double dailyRegularCapHours = 8.0;  ///< Also caps Sunday touch-rule and holiday premium hours.
    int nightStartHour = 18;            ///< Night window is [nightStartHour, 24) U [0, nightEndHour).
    int nightEndHour = 6;
    int lateStartHour = 19;             ///< Overnight shifts starting at/after this hour began the day before.
    int holidaySlideMaxSteps = 14;

    // Audit tolerances.
    int leaveToleranceMinutes = 1;
    double currencyTolerance = 0.01;

    // Ledger.
    double ledgerThreshold = 1.0;
    int maxLedgerPeriods = 520;

    // Pay calendar.
    CivilDate payPeriodAnchor = CivilDate(2024, 12, 14); ///< Any known period-ending date.
    int payPeriodDays = 14;

    std::vector<std::string> exemptLeaveTypes = {
        "Admin", "Change of Station Leave", "Time Off Award", "Gov Shutdown-Excepted"
    };
    std::vector<std::string> projectedLeaveTypes = {"Annual", "Sick", "Credit"};
    std::vector<std::string> percentageDeductionKeywords = {
        "Tax", "OASDI", "Medicare", "FERS", "Retirement"
    };
    std::vector<std::string> taxDeductionKeywords = {"Tax", "OASDI", "Medicare"};

    static PayrollSettings Defaults() { return PayrollSettings{}; }
};

} // namespace paytrack::domain
