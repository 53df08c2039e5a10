/**
 * @file Diagnostics.hpp
 * @brief Non-fatal conditions reported as data by the computation services.
 */

#pragma once

#include <string>
#include <vector>

namespace paytrack::domain {

enum class DiagnosticCode {
    MissingScheduleData,    ///< No schedule entry for the weekday/year; treated as a day off.
    AmbiguousShiftBoundary, ///< End at or before start; midnight-crossing heuristic applied.
    UnresolvedGap,          ///< Scheduled hours not worked and no leave designation given.
    MissingReferenceRate,   ///< No positive base rate available; amounts are not reliable.
    DivideByZeroGuard       ///< A ratio had a zero denominator and was skipped.
};

inline std::string DiagnosticCodeToString(DiagnosticCode code) {
    switch (code) {
        case DiagnosticCode::MissingScheduleData: return "MissingScheduleData";
        case DiagnosticCode::AmbiguousShiftBoundary: return "AmbiguousShiftBoundary";
        case DiagnosticCode::UnresolvedGap: return "UnresolvedGap";
        case DiagnosticCode::MissingReferenceRate: return "MissingReferenceRate";
        case DiagnosticCode::DivideByZeroGuard: return "DivideByZeroGuard";
        default: return "Unknown";
    }
}

struct Diagnostic {
    DiagnosticCode code;
    std::string message;
};

using Diagnostics = std::vector<Diagnostic>;

/** @brief True if any entry carries the given code. */
inline bool HasDiagnostic(const Diagnostics& diagnostics, DiagnosticCode code) {
    for (const auto& d : diagnostics) {
        if (d.code == code) return true;
    }
    return false;
}

} // namespace paytrack::domain
