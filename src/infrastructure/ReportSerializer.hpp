/**
 * @file ReportSerializer.hpp
 * @brief Renders computation results as JSON documents.
 */

#pragma once

#include <string>
#include <vector>

#include "application/ReconciliationService.hpp"
#include "domain/Ledger.hpp"
#include "domain/Paycheck.hpp"

namespace paytrack::infrastructure {

/**
 * @class ReportSerializer
 * @brief Stateless JSON rendering of breakdowns, audits and ledgers.
 *
 * Unknown YTD figures are written as null. Output is indented with 2 spaces.
 */
class ReportSerializer {
public:
    static std::string BreakdownToJson(const domain::PaycheckBreakdown& breakdown);
    static std::string AuditFlagsToJson(const domain::AuditFlags& flags);
    static std::string ReconciliationToJson(const application::ReconciliationResult& result);
    static std::string LedgerToJson(const std::vector<domain::LedgerRow>& rows);
    static std::string AuditHistoryToJson(const std::vector<application::HistoricalAuditEntry>& entries);
};

} // namespace paytrack::infrastructure
