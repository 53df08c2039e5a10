/**
 * @file ReconciliationService.hpp
 * @brief Use cases over declared statements: single-period reconciliation, audit sweep, ledger.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/LedgerService.hpp"
#include "application/ReferenceContextResolver.hpp"
#include "application/TimesheetService.hpp"
#include "domain/DailyBucket.hpp"
#include "domain/Ledger.hpp"
#include "domain/Paycheck.hpp"
#include "domain/PayrollSettings.hpp"
#include "domain/repositories/IPaycheckRepository.hpp"

namespace paytrack::application {

/**
 * @struct ReconciliationResult
 * @brief Everything known about one statement after checking it.
 */
struct ReconciliationResult {
    domain::DeclaredPaycheck declared;
    domain::AuditFlags auditFlags;
    domain::ReferenceContext reference;
    std::vector<domain::DailyBucket> buckets;
    domain::PaycheckBreakdown expected;
    std::vector<domain::CivilDate> unresolvedGapDates; ///< Workdays short of schedule with no designation.
    std::vector<std::string> codeDrift;                ///< Versus the previous statement.
    double grossDifference = 0.0;                      ///< declared - expected
};

struct HistoricalAuditEntry {
    std::string paycheckId;
    domain::CivilDate payDate;
    domain::AuditFlags auditFlags;
    std::vector<std::string> codeDrift;
    double effectiveTaxRate = 0.0;
};

class ReconciliationService {
public:
    ReconciliationService(std::shared_ptr<domain::IPaycheckRepository> paychecks,
                          std::shared_ptr<TimesheetService> timesheets,
                          std::shared_ptr<ReferenceContextResolver> references,
                          std::shared_ptr<LedgerService> ledger,
                          domain::PayrollSettings settings);

    /**
     * @brief Audits a statement and rebuilds its expected counterpart from the timesheet.
     * @throws std::runtime_error if the statement does not exist.
     */
    ReconciliationResult Reconcile(const std::string& paycheckId);

    /** @brief Audit flags and code drift of every statement, oldest pay date first. */
    std::vector<HistoricalAuditEntry> AuditHistory();

    /**
     * @brief Ledger over every stored statement.
     *
     * Each period uses its own statement as reference; the most recent
     * statement is the fallback.
     */
    std::vector<domain::LedgerRow> BuildLedger();

private:
    std::vector<domain::DeclaredPaycheck> statementsByPayDate();

    std::shared_ptr<domain::IPaycheckRepository> m_paychecks;
    std::shared_ptr<TimesheetService> m_timesheets;
    std::shared_ptr<ReferenceContextResolver> m_references;
    std::shared_ptr<LedgerService> m_ledger;
    domain::PayrollSettings m_settings;
};

} // namespace paytrack::application
