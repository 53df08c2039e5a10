/**
 * @file ShiftEntry.hpp
 * @brief Self-reported actual-worked record for one calendar day.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include "domain/CivilDate.hpp"
#include "domain/ClockTime.hpp"

namespace paytrack::domain {

/**
 * @enum LeaveDesignation
 * @brief How the gap between scheduled and worked hours is accounted for.
 */
enum class LeaveDesignation {
    None,
    Annual,
    Sick,
    Holiday,
    Credit,
    Comp,
    Lwop ///< Leave without pay.
};

inline std::string LeaveDesignationToString(LeaveDesignation leave) {
    switch (leave) {
        case LeaveDesignation::None: return "None";
        case LeaveDesignation::Annual: return "Annual";
        case LeaveDesignation::Sick: return "Sick";
        case LeaveDesignation::Holiday: return "Holiday";
        case LeaveDesignation::Credit: return "Credit";
        case LeaveDesignation::Comp: return "Comp";
        case LeaveDesignation::Lwop: return "LWOP";
        default: return "None";
    }
}

/**
 * @brief Parses the designation names used by the timesheet editor.
 * Empty or unknown text maps to None.
 */
inline LeaveDesignation LeaveDesignationFromString(const std::string& text) {
    if (text == "Annual") return LeaveDesignation::Annual;
    if (text == "Sick") return LeaveDesignation::Sick;
    if (text == "Holiday") return LeaveDesignation::Holiday;
    if (text == "Credit") return LeaveDesignation::Credit;
    if (text == "Comp") return LeaveDesignation::Comp;
    if (text == "LWOP" || text == "Lwop") return LeaveDesignation::Lwop;
    return LeaveDesignation::None;
}

/**
 * @enum SupplementalCategory
 * @brief Premium-bearing hours logged on top of the shift itself.
 */
enum class SupplementalCategory {
    Ojti, ///< On-the-job-training instruction.
    Cic   ///< Controller-in-charge.
};

inline std::string SupplementalCategoryToString(SupplementalCategory category) {
    switch (category) {
        case SupplementalCategory::Ojti: return "OJTI";
        case SupplementalCategory::Cic: return "CIC";
        default: return "Unknown";
    }
}

inline std::optional<SupplementalCategory> SupplementalCategoryFromString(const std::string& text) {
    if (text == "OJTI" || text == "ojti") return SupplementalCategory::Ojti;
    if (text == "CIC" || text == "cic") return SupplementalCategory::Cic;
    return std::nullopt;
}

using SupplementalHours = std::map<SupplementalCategory, double>;

/**
 * @struct ShiftEntry
 * @brief One row of the biweekly timesheet.
 */
struct ShiftEntry {
    CivilDate date;
    std::optional<ClockTime> start;
    std::optional<ClockTime> end;
    std::optional<LeaveDesignation> leave;
    SupplementalHours supplemental;
};

} // namespace paytrack::domain
