/**
 * @file Paycheck.hpp
 * @brief Pay statement structures: declared (official) statements, reference context, and synthesized breakdowns.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/CivilDate.hpp"
#include "domain/Diagnostics.hpp"
#include "domain/PayCategory.hpp"

namespace paytrack::domain {

/**
 * @struct DeclaredEarningsLine
 * @brief Earnings row exactly as printed on an official statement.
 */
struct DeclaredEarningsLine {
    std::string type;
    double rate = 0.0;
    double hoursCurrent = 0.0;
    double hoursAdjusted = 0.0;
    double amountCurrent = 0.0;
    double amountAdjusted = 0.0;
    double amountYtd = 0.0;

    EarningsCategory category() const { return ClassifyEarnings(type); }
};

/**
 * @struct DeclaredDeductionLine
 * @brief Deduction row exactly as printed on an official statement.
 */
struct DeclaredDeductionLine {
    std::string type;
    double amountCurrent = 0.0;
    double amountAdjusted = 0.0;
    double amountYtd = 0.0;
};

/**
 * @struct LeaveLine
 * @brief Leave balance row. All four values use hours.minutes notation (6.45 == 6h45m).
 */
struct LeaveLine {
    std::string type;
    double start = 0.0;
    double earned = 0.0;
    double used = 0.0;
    double end = 0.0;
};

/**
 * @struct DeclaredPaycheck
 * @brief An official earnings and leave statement as ingested.
 */
struct DeclaredPaycheck {
    std::string id;
    CivilDate payDate;
    CivilDate periodEnding;
    std::string agency;
    double grossPay = 0.0;
    double totalDeductions = 0.0;
    double netPay = 0.0;
    std::string remarks;
    std::vector<DeclaredEarningsLine> earnings;
    std::vector<DeclaredDeductionLine> deductions;
    std::vector<LeaveLine> leave;
};

/**
 * @struct ReferenceContext
 * @brief Snapshot of a real statement used as the source of rates and deduction ratios.
 *
 * Immutable for the duration of one computation.
 */
struct ReferenceContext {
    double baseHourlyRate = 0.0;
    double referenceGross = 0.0; ///< Declared gross of the source statement.
    std::vector<DeclaredEarningsLine> earnings;
    std::vector<DeclaredDeductionLine> deductions;
    std::string sourcePaycheckId;
    bool fallbackUsed = false; ///< Rate borrowed from another statement (e.g. during a pay lapse).
};

/**
 * @struct PeriodMeta
 * @brief Identifies the pay period a breakdown is generated for.
 */
struct PeriodMeta {
    std::string paycheckId;
    CivilDate payDate;
    CivilDate periodEnding;
    std::string agency;
};

struct EarningsLine {
    EarningsCategory category = EarningsCategory::Other;
    std::string type;
    double rate = 0.0;
    double hours = 0.0;
    double currentAmount = 0.0;
    std::optional<double> ytdAmount; ///< nullopt when no positive reference YTD exists.
};

struct DeductionLine {
    std::string type;
    DeductionKind kind = DeductionKind::Fixed;
    double currentAmount = 0.0;
    std::optional<double> ytdAmount;
};

/**
 * @struct PaycheckBreakdown
 * @brief Synthesized expected statement.
 */
struct PaycheckBreakdown {
    PeriodMeta meta;
    std::vector<EarningsLine> earnings;
    std::vector<DeductionLine> deductions;
    std::vector<LeaveLine> leave;
    double grossPay = 0.0;
    double totalDeductions = 0.0;
    double netPay = 0.0;
    std::string remarks;
    bool reliable = true; ///< False when no positive reference rate was available.
    Diagnostics diagnostics;

    /** @brief Line for a category, or nullptr when the category produced no line. */
    const EarningsLine* findEarnings(EarningsCategory category) const {
        for (const auto& line : earnings) {
            if (line.category == category) return &line;
        }
        return nullptr;
    }
};

/**
 * @brief Field identifier -> diagnostic message. Empty means internally consistent.
 */
using AuditFlags = std::map<std::string, std::string>;

} // namespace paytrack::domain
