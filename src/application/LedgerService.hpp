/**
 * @file LedgerService.hpp
 * @brief Service folding per-period pay variances into a running balance.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "application/TimesheetService.hpp"
#include "domain/Ledger.hpp"
#include "domain/Paycheck.hpp"
#include "domain/PayrollSettings.hpp"

namespace paytrack::application {

/** @brief Historical reference context of a period; nullopt falls back to the current one. */
using HistoricalContextLookup = std::function<std::optional<domain::ReferenceContext>(const domain::PeriodSummary&)>;

/**
 * @class LedgerService
 * @brief Re-derives every period with saved shifts and compares it with what was paid.
 *
 * Each period is rated with its own historical reference, so a raise does not
 * rewrite older periods. The running balance is a left fold in period-end
 * order and is the only state carried between periods.
 */
class LedgerService {
public:
    LedgerService(std::shared_ptr<TimesheetService> timesheets, domain::PayrollSettings settings);

    /**
     * @param periods Declared periods, any order.
     * @param currentReference Used when the lookup yields nothing for a period.
     * @param lookup Historical context of a period.
     */
    std::vector<domain::LedgerRow> BuildLedger(std::vector<domain::PeriodSummary> periods,
                                               const domain::ReferenceContext& currentReference,
                                               const HistoricalContextLookup& lookup);

    static domain::PeriodSummary SummaryOf(const domain::DeclaredPaycheck& paycheck);

    /** @brief Status of a variance under the given threshold. */
    static domain::LedgerStatus Classify(double diff, double threshold);

private:
    std::shared_ptr<TimesheetService> m_timesheets;
    domain::PayrollSettings m_settings;
};

} // namespace paytrack::application
