/**
 * @file ReconciliationService.cpp
 * @brief Implementation of the ReconciliationService class.
 */

#include "application/ReconciliationService.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "domain/PayMath.hpp"
#include "domain/services/PaySynthesizer.hpp"
#include "domain/services/PaycheckAuditor.hpp"

namespace paytrack::application {

ReconciliationService::ReconciliationService(std::shared_ptr<domain::IPaycheckRepository> paychecks,
                                             std::shared_ptr<TimesheetService> timesheets,
                                             std::shared_ptr<ReferenceContextResolver> references,
                                             std::shared_ptr<LedgerService> ledger,
                                             domain::PayrollSettings settings)
    : m_paychecks(std::move(paychecks)),
      m_timesheets(std::move(timesheets)),
      m_references(std::move(references)),
      m_ledger(std::move(ledger)),
      m_settings(std::move(settings)) {}

std::vector<domain::DeclaredPaycheck> ReconciliationService::statementsByPayDate() {
    auto all = m_paychecks->findAll();
    std::stable_sort(all.begin(), all.end(), [](const domain::DeclaredPaycheck& a, const domain::DeclaredPaycheck& b) {
        if (a.payDate != b.payDate) return a.payDate < b.payDate;
        return a.id < b.id;
    });
    return all;
}

ReconciliationResult ReconciliationService::Reconcile(const std::string& paycheckId) {
    auto declared = m_paychecks->findById(paycheckId);
    if (!declared) {
        throw std::runtime_error("Paycheck not found: " + paycheckId);
    }

    ReconciliationResult result;
    result.declared = *declared;
    result.auditFlags = domain::PaycheckAuditor::audit(result.declared, m_settings);
    result.reference = m_references->Resolve(paycheckId);

    const auto timesheet = m_timesheets->LoadTimesheet(result.declared.periodEnding);
    result.buckets = m_timesheets->ComputeBuckets(timesheet);
    for (const auto& bucket : result.buckets) {
        if (domain::HasDiagnostic(bucket.diagnostics, domain::DiagnosticCode::UnresolvedGap)) {
            result.unresolvedGapDates.push_back(bucket.date);
        }
    }

    domain::PeriodMeta meta{result.declared.id, result.declared.payDate, result.declared.periodEnding,
                            result.declared.agency};
    result.expected = domain::PaySynthesizer::synthesize(result.buckets, result.reference, meta,
                                                         result.declared.leave, m_settings);
    result.grossDifference = domain::paymath::NormalizeCents(result.declared.grossPay - result.expected.grossPay);

    const auto ordered = statementsByPayDate();
    const domain::DeclaredPaycheck* previous = nullptr;
    for (const auto& stmt : ordered) {
        if (stmt.payDate < result.declared.payDate) previous = &stmt;
    }
    if (previous != nullptr) {
        result.codeDrift = domain::PaycheckAuditor::compareLineCodes(*previous, result.declared);
    }

    if (!result.auditFlags.empty()) {
        std::cerr << "[ReconciliationService] " << paycheckId << ": " << result.auditFlags.size()
                  << " arithmetic flag(s)" << std::endl;
    }
    return result;
}

std::vector<HistoricalAuditEntry> ReconciliationService::AuditHistory() {
    const auto ordered = statementsByPayDate();
    std::vector<HistoricalAuditEntry> entries;
    entries.reserve(ordered.size());

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        HistoricalAuditEntry entry;
        entry.paycheckId = ordered[i].id;
        entry.payDate = ordered[i].payDate;
        entry.auditFlags = domain::PaycheckAuditor::audit(ordered[i], m_settings);
        if (i > 0) {
            entry.codeDrift = domain::PaycheckAuditor::compareLineCodes(ordered[i - 1], ordered[i]);
        }
        entry.effectiveTaxRate = domain::PaycheckAuditor::effectiveTaxRate(ordered[i], m_settings);
        entries.push_back(entry);
    }
    return entries;
}

std::vector<domain::LedgerRow> ReconciliationService::BuildLedger() {
    const auto ordered = statementsByPayDate();
    if (ordered.empty()) return {};

    std::vector<domain::PeriodSummary> periods;
    periods.reserve(ordered.size());
    for (const auto& stmt : ordered) {
        periods.push_back(LedgerService::SummaryOf(stmt));
    }

    const domain::ReferenceContext current = m_references->Resolve(ordered.back().id);
    auto lookup = [this](const domain::PeriodSummary& period) {
        return m_references->TryResolve(period.paycheckId);
    };
    return m_ledger->BuildLedger(std::move(periods), current, lookup);
}

} // namespace paytrack::application
