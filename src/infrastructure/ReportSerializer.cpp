/**
 * @file ReportSerializer.cpp
 * @brief Implementation of ReportSerializer.
 */

#include "infrastructure/ReportSerializer.hpp"
#include <nlohmann/json.hpp>

namespace paytrack::infrastructure {

using json = nlohmann::json;

namespace {

json OptionalAmount(const std::optional<double>& value) {
    if (!value) return nullptr;
    return *value;
}

json DiagnosticsJson(const domain::Diagnostics& diagnostics) {
    json arr = json::array();
    for (const auto& d : diagnostics) {
        arr.push_back({{"code", domain::DiagnosticCodeToString(d.code)}, {"message", d.message}});
    }
    return arr;
}

json FlagsJson(const domain::AuditFlags& flags) {
    json obj = json::object();
    for (const auto& [key, message] : flags) {
        obj[key] = message;
    }
    return obj;
}

json BreakdownJson(const domain::PaycheckBreakdown& b) {
    json earnings = json::array();
    for (const auto& line : b.earnings) {
        earnings.push_back({
            {"type", line.type},
            {"rate", line.rate},
            {"hours", line.hours},
            {"current", line.currentAmount},
            {"ytd", OptionalAmount(line.ytdAmount)}
        });
    }
    json deductions = json::array();
    for (const auto& line : b.deductions) {
        deductions.push_back({
            {"type", line.type},
            {"kind", domain::DeductionKindToString(line.kind)},
            {"current", line.currentAmount},
            {"ytd", OptionalAmount(line.ytdAmount)}
        });
    }
    json leave = json::array();
    for (const auto& line : b.leave) {
        leave.push_back({
            {"type", line.type},
            {"start", line.start},
            {"earned", line.earned},
            {"used", line.used},
            {"end", line.end}
        });
    }

    return {
        {"paycheck_id", b.meta.paycheckId},
        {"pay_date", b.meta.payDate.toString()},
        {"period_ending", b.meta.periodEnding.toString()},
        {"agency", b.meta.agency},
        {"earnings", earnings},
        {"deductions", deductions},
        {"leave", leave},
        {"gross_pay", b.grossPay},
        {"total_deductions", b.totalDeductions},
        {"net_pay", b.netPay},
        {"remarks", b.remarks},
        {"reliable", b.reliable},
        {"diagnostics", DiagnosticsJson(b.diagnostics)}
    };
}

json BucketJson(const domain::DailyBucket& b) {
    json supplemental = json::object();
    for (const auto& [category, hours] : b.supplemental) {
        supplemental[domain::SupplementalCategoryToString(category)] = hours;
    }
    json j = {
        {"date", b.date.toString()},
        {"worked", b.workedHours},
        {"regular", b.regularHours},
        {"overtime", b.overtimeHours},
        {"night", b.nightHours},
        {"sunday", b.sundayHours},
        {"holiday_worked", b.holidayWorkedHours},
        {"holiday_leave", b.holidayLeaveHours},
        {"charged_leave", b.chargedLeaveHours},
        {"unresolved_gap", b.unresolvedGapHours},
        {"observed_holiday", b.observedHoliday},
        {"supplemental", supplemental},
        {"diagnostics", DiagnosticsJson(b.diagnostics)}
    };
    j["leave_type"] = b.leaveDesignation ? json(domain::LeaveDesignationToString(*b.leaveDesignation)) : json(nullptr);
    return j;
}

} // namespace

std::string ReportSerializer::BreakdownToJson(const domain::PaycheckBreakdown& breakdown) {
    return BreakdownJson(breakdown).dump(2);
}

std::string ReportSerializer::AuditFlagsToJson(const domain::AuditFlags& flags) {
    return FlagsJson(flags).dump(2);
}

std::string ReportSerializer::ReconciliationToJson(const application::ReconciliationResult& result) {
    json buckets = json::array();
    for (const auto& b : result.buckets) buckets.push_back(BucketJson(b));

    json gaps = json::array();
    for (const auto& d : result.unresolvedGapDates) gaps.push_back(d.toString());

    json j = {
        {"paycheck_id", result.declared.id},
        {"period_ending", result.declared.periodEnding.toString()},
        {"declared_gross", result.declared.grossPay},
        {"expected_gross", result.expected.grossPay},
        {"gross_difference", result.grossDifference},
        {"reference_paycheck_id", result.reference.sourcePaycheckId},
        {"reference_rate", result.reference.baseHourlyRate},
        {"reference_fallback", result.reference.fallbackUsed},
        {"audit_flags", FlagsJson(result.auditFlags)},
        {"code_drift", result.codeDrift},
        {"unresolved_gaps", gaps},
        {"buckets", buckets},
        {"expected", BreakdownJson(result.expected)}
    };
    return j.dump(2);
}

std::string ReportSerializer::LedgerToJson(const std::vector<domain::LedgerRow>& rows) {
    json arr = json::array();
    for (const auto& row : rows) {
        arr.push_back({
            {"paycheck_id", row.paycheckId},
            {"period_ending", row.periodEnding.toString()},
            {"expected_gross", row.expectedGross},
            {"actual_gross", row.actualGross},
            {"diff", row.diff},
            {"running_balance", row.runningBalance},
            {"status", domain::LedgerStatusToString(row.status)},
            {"reliable", row.reliable},
            {"diagnostics", DiagnosticsJson(row.diagnostics)}
        });
    }
    return arr.dump(2);
}

std::string ReportSerializer::AuditHistoryToJson(const std::vector<application::HistoricalAuditEntry>& entries) {
    json arr = json::array();
    for (const auto& e : entries) {
        arr.push_back({
            {"paycheck_id", e.paycheckId},
            {"pay_date", e.payDate.toString()},
            {"audit_flags", FlagsJson(e.auditFlags)},
            {"code_drift", e.codeDrift},
            {"effective_tax_rate", e.effectiveTaxRate}
        });
    }
    return arr.dump(2);
}

} // namespace paytrack::infrastructure
