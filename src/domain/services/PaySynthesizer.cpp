/**
 * @file PaySynthesizer.cpp
 * @brief Implementation of PaySynthesizer.
 */

#include "domain/services/PaySynthesizer.hpp"

#include "domain/PayMath.hpp"

namespace paytrack::domain {

using paymath::TruncateCents;
using paymath::TruncateHours;

namespace {

const DeclaredEarningsLine* FindReferenceEarnings(const std::vector<DeclaredEarningsLine>& lines,
                                                  EarningsCategory category) {
    for (const auto& line : lines) {
        if (line.category() == category) return &line;
    }
    return nullptr;
}

const DeclaredDeductionLine* FindReferenceDeduction(const std::vector<DeclaredDeductionLine>& lines,
                                                    const std::string& type) {
    for (const auto& line : lines) {
        if (line.type == type) return &line;
    }
    return nullptr;
}

// refYtd - refCurrent + newCurrent, unknown when the reference has no positive YTD.
std::optional<double> CarryYtd(double referenceYtd, double referenceCurrent, double newCurrent) {
    if (referenceYtd <= 0.0) return std::nullopt;
    return TruncateCents(referenceYtd - referenceCurrent + newCurrent);
}

EarningsCategory CategoryFor(SupplementalCategory category) {
    switch (category) {
        case SupplementalCategory::Ojti: return EarningsCategory::Ojti;
        case SupplementalCategory::Cic: return EarningsCategory::Cic;
        default: return EarningsCategory::Other;
    }
}

double ReferenceGross(const ReferenceContext& reference) {
    if (reference.referenceGross > 0.0) return reference.referenceGross;
    double sum = 0.0;
    for (const auto& line : reference.earnings) {
        sum += line.amountCurrent + line.amountAdjusted;
    }
    return TruncateCents(sum);
}

} // namespace

double PaySynthesizer::supplementalFactor(SupplementalCategory category, const PayrollSettings& settings) {
    switch (category) {
        case SupplementalCategory::Ojti: return settings.ojtiFactor;
        case SupplementalCategory::Cic: return settings.cicFactor;
        default: return 0.0;
    }
}

PeriodHours PaySynthesizer::sumBuckets(const std::vector<DailyBucket>& buckets) {
    PeriodHours totals;
    for (const auto& b : buckets) {
        totals.regular += b.regularHours;
        totals.overtime += b.overtimeHours;
        totals.night += b.nightHours;
        totals.sunday += b.sundayHours;
        totals.holidayWorked += b.holidayWorkedHours;
        totals.holidayLeave += b.holidayLeaveHours;
        totals.chargedLeave += b.chargedLeaveHours;
        for (const auto& [category, hours] : b.supplemental) {
            totals.supplemental[category] += hours;
        }
    }

    totals.regular = TruncateHours(totals.regular);
    totals.overtime = TruncateHours(totals.overtime);
    totals.night = TruncateHours(totals.night);
    totals.sunday = TruncateHours(totals.sunday);
    totals.holidayWorked = TruncateHours(totals.holidayWorked);
    totals.holidayLeave = TruncateHours(totals.holidayLeave);
    totals.chargedLeave = TruncateHours(totals.chargedLeave);
    for (auto& [category, hours] : totals.supplemental) {
        hours = TruncateHours(hours);
    }
    return totals;
}

PaycheckBreakdown PaySynthesizer::synthesize(const std::vector<DailyBucket>& buckets,
                                             const ReferenceContext& reference,
                                             const PeriodMeta& meta,
                                             const std::vector<LeaveLine>& referenceLeave,
                                             const PayrollSettings& settings) {
    PaycheckBreakdown result;
    result.meta = meta;

    const PeriodHours hours = sumBuckets(buckets);

    double rate = reference.baseHourlyRate;
    if (rate <= 0.0) {
        rate = 0.0;
        result.reliable = false;
        result.diagnostics.push_back({DiagnosticCode::MissingReferenceRate,
            "No statement with a positive base rate; expected amounts are zero and not reliable."});
    }

    // 1. Base pay: regular and holiday leave both pay at the base rate.
    const double basicHours = TruncateHours(hours.regular + hours.holidayLeave);
    const double basePay = TruncateCents(basicHours * rate);

    // 2. Straight-time portion of overtime.
    const double trueOvertimePay = hours.overtime > 0.0 ? TruncateCents(hours.overtime * rate) : 0.0;

    // 3. Differentials.
    const double nightRate = TruncateCents(rate * settings.nightDifferentialFactor);
    const double nightPay = TruncateCents(hours.night * nightRate);
    const double sundayRate = TruncateCents(rate * settings.sundayPremiumFactor);
    const double sundayPay = TruncateCents(hours.sunday * sundayRate);
    const double holidayPay = TruncateCents(hours.holidayWorked * rate);

    struct SupplementalPay {
        SupplementalCategory category;
        double hours;
        double rate;
        double amount;
    };
    std::vector<SupplementalPay> supplementalPay;
    double supplementalTotal = 0.0;
    for (const auto& [category, supHours] : hours.supplemental) {
        const double supRate = TruncateCents(rate * supplementalFactor(category, settings));
        const double amount = TruncateCents(supHours * supRate);
        supplementalPay.push_back({category, supHours, supRate, amount});
        supplementalTotal += amount;
    }

    // 4. Incentive pay, scaled by the ratio observed on a real statement.
    double incentivePay = 0.0;
    double incentiveRate = 0.0;
    const DeclaredEarningsLine* refIncentive = FindReferenceEarnings(reference.earnings, EarningsCategory::IncentivePay);
    const DeclaredEarningsLine* refRegular = FindReferenceEarnings(reference.earnings, EarningsCategory::Regular);
    if (refIncentive != nullptr && refRegular != nullptr) {
        if (refRegular->amountCurrent > 0.0) {
            const double factor = refIncentive->amountCurrent / refRegular->amountCurrent;
            incentivePay = TruncateCents(basePay * factor);
            incentiveRate = TruncateCents(rate * factor);
        } else {
            result.diagnostics.push_back({DiagnosticCode::DivideByZeroGuard,
                "Reference regular pay is zero; incentive pay skipped."});
        }
    }

    // 5. FLSA premium (weighted average regular rate of pay).
    double flsaRate = 0.0;
    double flsaPay = 0.0;
    if (hours.overtime > 0.0) {
        const double remuneration = basePay + trueOvertimePay + nightPay + sundayPay + holidayPay +
                                    incentivePay + supplementalTotal;
        const double hoursWorked = basicHours + hours.overtime;
        if (hoursWorked > 0.0) {
            const double regularRateOfPay = remuneration / hoursWorked;
            flsaRate = TruncateCents(regularRateOfPay * settings.flsaPremiumFactor);
            flsaPay = TruncateCents(hours.overtime * flsaRate);
        }
    }

    result.grossPay = TruncateCents(basePay + trueOvertimePay + flsaPay + nightPay + sundayPay + holidayPay +
                                    incentivePay + supplementalTotal);

    // 6. Earnings lines (non-zero only), statement order.
    auto addLine = [&](EarningsCategory category, double lineRate, double lineHours, double amount) {
        EarningsLine line;
        line.category = category;
        line.type = EarningsCategoryToString(category);
        line.rate = lineRate;
        line.hours = lineHours;
        line.currentAmount = amount;
        if (const DeclaredEarningsLine* ref = FindReferenceEarnings(reference.earnings, category)) {
            line.ytdAmount = CarryYtd(ref->amountYtd, ref->amountCurrent, amount);
        }
        result.earnings.push_back(line);
    };

    if (basicHours > 0.0) addLine(EarningsCategory::Regular, rate, basicHours, basePay);
    if (incentivePay != 0.0) addLine(EarningsCategory::IncentivePay, incentiveRate, basicHours, incentivePay);
    if (hours.overtime > 0.0) {
        addLine(EarningsCategory::FlsaPremium, flsaRate, hours.overtime, flsaPay);
        addLine(EarningsCategory::TrueOvertime, rate, hours.overtime, trueOvertimePay);
    }
    if (hours.night > 0.0) addLine(EarningsCategory::NightDifferential, nightRate, hours.night, nightPay);
    if (hours.sunday > 0.0) addLine(EarningsCategory::SundayPremium, sundayRate, hours.sunday, sundayPay);
    if (hours.holidayWorked > 0.0) addLine(EarningsCategory::HolidayWorked, rate, hours.holidayWorked, holidayPay);
    for (const auto& sup : supplementalPay) {
        if (sup.hours > 0.0) addLine(CategoryFor(sup.category), sup.rate, sup.hours, sup.amount);
    }

    // 7. Deductions: percentage lines follow gross, fixed lines repeat.
    const double referenceGross = ReferenceGross(reference);
    double deductionTotal = 0.0;
    for (const auto& ref : reference.deductions) {
        DeductionLine line;
        line.type = ref.type;
        line.kind = ClassifyDeduction(ref.type, settings.percentageDeductionKeywords);
        if (line.kind == DeductionKind::Percentage) {
            if (referenceGross > 0.0) {
                line.currentAmount = TruncateCents(result.grossPay * (ref.amountCurrent / referenceGross));
            } else {
                line.currentAmount = 0.0;
                result.diagnostics.push_back({DiagnosticCode::DivideByZeroGuard,
                    "Reference gross is zero; percentage deduction '" + ref.type + "' set to 0."});
            }
        } else {
            line.currentAmount = ref.amountCurrent;
        }
        if (const DeclaredDeductionLine* match = FindReferenceDeduction(reference.deductions, ref.type)) {
            line.ytdAmount = CarryYtd(match->amountYtd, match->amountCurrent, line.currentAmount);
        }
        deductionTotal += line.currentAmount;
        result.deductions.push_back(line);
    }
    result.totalDeductions = TruncateCents(deductionTotal);
    result.netPay = TruncateCents(result.grossPay - result.totalDeductions);

    // 8. Leave projection; usage is reconciled by the auditor, not projected.
    for (const auto& ref : referenceLeave) {
        if (!ContainsAnyIgnoreCase(ref.type, settings.projectedLeaveTypes)) continue;
        LeaveLine line;
        line.type = ref.type;
        line.start = ref.start;
        line.earned = ref.earned;
        line.used = 0.0;
        line.end = paymath::MinutesToLeave(paymath::LeaveToMinutes(ref.start) + paymath::LeaveToMinutes(ref.earned));
        result.leave.push_back(line);
    }

    result.remarks = "GENERATED\nWeighted Avg FLSA";
    if (reference.fallbackUsed) {
        result.remarks += "\nRates from statement " + reference.sourcePaycheckId;
    }
    if (!result.reliable) {
        result.remarks += "\nUNRELIABLE: no reference rate";
    }
    return result;
}

} // namespace paytrack::domain
