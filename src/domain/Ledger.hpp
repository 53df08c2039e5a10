/**
 * @file Ledger.hpp
 * @brief Cross-period variance ledger rows.
 */

#pragma once

#include <string>

#include "domain/CivilDate.hpp"
#include "domain/Diagnostics.hpp"

namespace paytrack::domain {

enum class LedgerStatus {
    Unaudited,  ///< No shift data saved, or no usable rate; declared gross taken as is.
    Balanced,
    GovOwesYou, ///< Paid less than expected.
    Backpay     ///< Paid more than expected.
};

inline std::string LedgerStatusToString(LedgerStatus status) {
    switch (status) {
        case LedgerStatus::Unaudited: return "Unaudited";
        case LedgerStatus::Balanced: return "Balanced";
        case LedgerStatus::GovOwesYou: return "GovOwesYou";
        case LedgerStatus::Backpay: return "Backpay";
        default: return "Unaudited";
    }
}

/**
 * @struct PeriodSummary
 * @brief What the ledger needs to know about one declared statement.
 */
struct PeriodSummary {
    std::string paycheckId;
    CivilDate payDate;
    CivilDate periodEnding;
    std::string agency;
    double declaredGross = 0.0;
};

struct LedgerRow {
    std::string paycheckId;
    CivilDate periodEnding;
    double expectedGross = 0.0;
    double actualGross = 0.0;
    double diff = 0.0; ///< actual - expected
    double runningBalance = 0.0;
    LedgerStatus status = LedgerStatus::Unaudited;
    bool reliable = true; ///< False when the expected gross could not be priced.
    Diagnostics diagnostics;
};

} // namespace paytrack::domain
