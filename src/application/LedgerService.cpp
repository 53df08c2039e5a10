/**
 * @file LedgerService.cpp
 * @brief Implementation of the LedgerService class.
 */

#include "application/LedgerService.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <utility>

#include "domain/PayMath.hpp"
#include "domain/services/PaySynthesizer.hpp"

namespace paytrack::application {

LedgerService::LedgerService(std::shared_ptr<TimesheetService> timesheets, domain::PayrollSettings settings)
    : m_timesheets(std::move(timesheets)), m_settings(std::move(settings)) {}

domain::PeriodSummary LedgerService::SummaryOf(const domain::DeclaredPaycheck& paycheck) {
    domain::PeriodSummary summary;
    summary.paycheckId = paycheck.id;
    summary.payDate = paycheck.payDate;
    summary.periodEnding = paycheck.periodEnding;
    summary.agency = paycheck.agency;
    summary.declaredGross = paycheck.grossPay;
    return summary;
}

domain::LedgerStatus LedgerService::Classify(double diff, double threshold) {
    if (diff < -threshold) return domain::LedgerStatus::GovOwesYou;
    if (diff > threshold) return domain::LedgerStatus::Backpay;
    return domain::LedgerStatus::Balanced;
}

std::vector<domain::LedgerRow> LedgerService::BuildLedger(std::vector<domain::PeriodSummary> periods,
                                                          const domain::ReferenceContext& currentReference,
                                                          const HistoricalContextLookup& lookup) {
    // Stable so that equal period ends keep a deterministic order.
    std::stable_sort(periods.begin(), periods.end(), [](const domain::PeriodSummary& a, const domain::PeriodSummary& b) {
        if (a.periodEnding != b.periodEnding) return a.periodEnding < b.periodEnding;
        return a.paycheckId < b.paycheckId;
    });

    const auto cap = static_cast<std::size_t>(std::max(0, m_settings.maxLedgerPeriods));
    if (periods.size() > cap) {
        std::cerr << "[LedgerService] " << periods.size() << " periods exceed the limit of " << cap
                  << ", later periods ignored" << std::endl;
        periods.resize(cap);
    }

    std::vector<domain::LedgerRow> rows;
    rows.reserve(periods.size());
    double balance = 0.0;

    for (const auto& period : periods) {
        domain::LedgerRow row;
        row.paycheckId = period.paycheckId;
        row.periodEnding = period.periodEnding;
        row.actualGross = period.declaredGross;

        if (!m_timesheets->HasSavedEntries(period.periodEnding)) {
            row.expectedGross = period.declaredGross;
            row.diff = 0.0;
            row.status = domain::LedgerStatus::Unaudited;
        } else {
            std::optional<domain::ReferenceContext> historical;
            if (lookup) historical = lookup(period);
            const domain::ReferenceContext& reference = historical ? *historical : currentReference;

            const auto buckets = m_timesheets->ComputeBuckets(m_timesheets->SavedEntries(period.periodEnding));
            domain::PeriodMeta meta{period.paycheckId, period.payDate, period.periodEnding, period.agency};
            const auto expected = domain::PaySynthesizer::synthesize(buckets, reference, meta, {}, m_settings);

            if (!expected.reliable) {
                // A zero-rate expectation is not a variance; keep it out of the balance.
                std::cerr << "[LedgerService] No usable rate for paycheck " << period.paycheckId
                          << ", period left unaudited" << std::endl;
                row.expectedGross = period.declaredGross;
                row.diff = 0.0;
                row.status = domain::LedgerStatus::Unaudited;
                row.reliable = false;
                row.diagnostics = expected.diagnostics;
            } else {
                row.expectedGross = expected.grossPay;
                row.diff = domain::paymath::NormalizeCents(period.declaredGross - expected.grossPay);
                row.status = Classify(row.diff, m_settings.ledgerThreshold);
            }
        }

        balance = domain::paymath::NormalizeCents(balance + row.diff);
        row.runningBalance = balance;
        rows.push_back(row);
    }

    return rows;
}

} // namespace paytrack::application
