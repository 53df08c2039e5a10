/**
 * @file PaycheckAuditor.cpp
 * @brief Implementation of PaycheckAuditor.
 */

#include "domain/services/PaycheckAuditor.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <set>

#include "domain/PayMath.hpp"

namespace paytrack::domain {

namespace {

std::string FormatMoney(double amount) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", amount);
    return buf;
}

template <typename Line>
std::set<std::string> CodesOf(const std::vector<Line>& lines) {
    std::set<std::string> codes;
    for (const auto& line : lines) codes.insert(line.type);
    return codes;
}

// Elements of a not present in b, joined for display.
std::string Difference(const std::set<std::string>& a, const std::set<std::string>& b) {
    std::string joined;
    for (const auto& code : a) {
        if (b.count(code) != 0) continue;
        if (!joined.empty()) joined += ", ";
        joined += code;
    }
    return joined;
}

} // namespace

bool PaycheckAuditor::isExempt(const std::string& leaveType, const PayrollSettings& settings) {
    for (const auto& exempt : settings.exemptLeaveTypes) {
        if (exempt == leaveType) return true;
    }
    return false;
}

AuditFlags PaycheckAuditor::audit(const DeclaredPaycheck& paycheck, const PayrollSettings& settings) {
    AuditFlags flags;

    for (const auto& row : paycheck.leave) {
        if (isExempt(row.type, settings)) continue;

        const int start = paymath::LeaveToMinutes(row.start);
        const int earned = paymath::LeaveToMinutes(row.earned);
        const int used = paymath::LeaveToMinutes(row.used);
        const int declaredEnd = paymath::LeaveToMinutes(row.end);
        const int computedEnd = start + earned - used;
        const int discrepancy = std::abs(computedEnd - declaredEnd);

        if (discrepancy > settings.leaveToleranceMinutes) {
            flags["leave_" + row.type + "_end"] =
                "Math Error: " + paymath::FormatLeave(start) + " + " + paymath::FormatLeave(earned) +
                " - " + paymath::FormatLeave(used) + " should be " + paymath::FormatLeave(computedEnd) +
                ", stub says " + paymath::FormatLeave(declaredEnd) +
                " (off by " + std::to_string(discrepancy) + " min)";
        }
    }

    double earningsSum = 0.0;
    for (const auto& line : paycheck.earnings) {
        earningsSum += line.amountCurrent + line.amountAdjusted;
    }
    if (std::fabs(earningsSum - paycheck.grossPay) > settings.currencyTolerance) {
        flags["gross_pay"] = "Sum (" + FormatMoney(earningsSum) + ") != Gross (" + FormatMoney(paycheck.grossPay) + ")";
    }

    if (std::fabs((paycheck.grossPay - paycheck.totalDeductions) - paycheck.netPay) > settings.currencyTolerance) {
        flags["net_pay"] = "Math Error: Gross - Ded != Net (" + FormatMoney(paycheck.grossPay) + " - " +
                           FormatMoney(paycheck.totalDeductions) + " != " + FormatMoney(paycheck.netPay) + ")";
    }

    return flags;
}

std::vector<std::string> PaycheckAuditor::compareLineCodes(const DeclaredPaycheck& previous,
                                                           const DeclaredPaycheck& current) {
    std::vector<std::string> alerts;

    const auto oldEarnings = CodesOf(previous.earnings);
    const auto newEarnings = CodesOf(current.earnings);
    const auto oldDeductions = CodesOf(previous.deductions);
    const auto newDeductions = CodesOf(current.deductions);

    const std::string addedEarnings = Difference(newEarnings, oldEarnings);
    if (!addedEarnings.empty()) {
        alerts.push_back("ALERT: New Earning Code detected: " + addedEarnings);
    }
    const std::string addedDeductions = Difference(newDeductions, oldDeductions);
    if (!addedDeductions.empty()) {
        alerts.push_back("CRITICAL: New Deduction appearing: " + addedDeductions);
    }
    const std::string droppedDeductions = Difference(oldDeductions, newDeductions);
    if (!droppedDeductions.empty()) {
        alerts.push_back("WARNING: Deduction disappeared: " + droppedDeductions);
    }
    return alerts;
}

double PaycheckAuditor::effectiveTaxRate(const DeclaredPaycheck& paycheck, const PayrollSettings& settings) {
    if (paycheck.grossPay <= 0.0) return 0.0;
    double taxes = 0.0;
    for (const auto& line : paycheck.deductions) {
        if (ContainsAnyIgnoreCase(line.type, settings.taxDeductionKeywords)) {
            taxes += line.amountCurrent;
        }
    }
    return taxes / paycheck.grossPay * 100.0;
}

} // namespace paytrack::domain
