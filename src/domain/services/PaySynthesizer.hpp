/**
 * @file PaySynthesizer.hpp
 * @brief Domain service building the expected pay statement for a period.
 */

#pragma once

#include <vector>

#include "domain/DailyBucket.hpp"
#include "domain/Paycheck.hpp"
#include "domain/PayrollSettings.hpp"

namespace paytrack::domain {

/**
 * @struct PeriodHours
 * @brief Per-category hour totals of a period, each truncated to 4 decimals.
 */
struct PeriodHours {
    double regular = 0.0;
    double overtime = 0.0;
    double night = 0.0;
    double sunday = 0.0;
    double holidayWorked = 0.0;
    double holidayLeave = 0.0;
    double chargedLeave = 0.0;
    SupplementalHours supplemental;
};

/**
 * @class PaySynthesizer
 * @brief Rates a period's buckets into a full statement (earnings, deductions, leave, gross/net).
 *
 * Every intermediate hour total is truncated to 4 decimals and every currency
 * amount to whole cents before it feeds the next step. This reproduces the
 * legacy payroll system and must not be changed to rounding.
 *
 * Overtime carries the FLSA weighted-average premium: half of the regular rate
 * of pay, where the regular rate is total straight-time remuneration
 * (differentials and incentive pay included) divided by total hours.
 */
class PaySynthesizer {
public:
    /** @brief Category totals across the buckets. */
    static PeriodHours sumBuckets(const std::vector<DailyBucket>& buckets);

    /**
     * @param buckets Daily buckets of the period.
     * @param reference Rate, reference earnings (for the incentive factor) and deductions.
     * @param meta Period identification copied onto the result.
     * @param referenceLeave Leave rows the projection starts from.
     * @param settings Differential factors and deduction classification.
     */
    static PaycheckBreakdown synthesize(const std::vector<DailyBucket>& buckets,
                                        const ReferenceContext& reference,
                                        const PeriodMeta& meta,
                                        const std::vector<LeaveLine>& referenceLeave,
                                        const PayrollSettings& settings = PayrollSettings{});

    /** @brief Fraction of base rate paid for a supplemental category. */
    static double supplementalFactor(SupplementalCategory category, const PayrollSettings& settings);
};

} // namespace paytrack::domain
