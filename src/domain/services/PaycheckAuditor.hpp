/**
 * @file PaycheckAuditor.hpp
 * @brief Domain service checking the internal arithmetic of a declared pay statement.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Paycheck.hpp"
#include "domain/PayrollSettings.hpp"

namespace paytrack::domain {

/**
 * @class PaycheckAuditor
 * @brief Consistency checks on a statement as printed, independent of any recomputation.
 *
 * An empty result means the statement agrees with itself. It says nothing about
 * whether the hours or rates on it are right.
 */
class PaycheckAuditor {
public:
    /**
     * @brief Leave continuity, gross sum and net sum.
     *
     * Keys: "leave_<type>_end", "gross_pay", "net_pay".
     */
    static AuditFlags audit(const DeclaredPaycheck& paycheck,
                            const PayrollSettings& settings = PayrollSettings{});

    /**
     * @brief Line codes that appeared or disappeared between two consecutive statements.
     *
     * New earnings codes raise an ALERT, new deductions are CRITICAL and a
     * deduction that dropped off is a WARNING.
     */
    static std::vector<std::string> compareLineCodes(const DeclaredPaycheck& previous,
                                                     const DeclaredPaycheck& current);

    /** @brief Tax-like deductions as a percentage of gross; 0 when gross is 0. */
    static double effectiveTaxRate(const DeclaredPaycheck& paycheck,
                                   const PayrollSettings& settings = PayrollSettings{});

private:
    static bool isExempt(const std::string& leaveType, const PayrollSettings& settings);
};

} // namespace paytrack::domain
