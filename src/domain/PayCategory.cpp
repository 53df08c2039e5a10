/**
 * @file PayCategory.cpp
 * @brief Implementation of category classification.
 */

#include "domain/PayCategory.hpp"

#include <cctype>

namespace paytrack::domain {

namespace {

std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

} // namespace

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return Normalize(haystack).find(Normalize(needle)) != std::string::npos;
}

bool ContainsAnyIgnoreCase(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (ContainsIgnoreCase(haystack, needle)) return true;
    }
    return false;
}

std::string EarningsCategoryToString(EarningsCategory category) {
    switch (category) {
        case EarningsCategory::Regular: return "Regular / Holiday Leave";
        case EarningsCategory::IncentivePay: return "Controller Incentive Pay";
        case EarningsCategory::FlsaPremium: return "FLSA Premium";
        case EarningsCategory::TrueOvertime: return "True Overtime";
        case EarningsCategory::NightDifferential: return "Night Differential";
        case EarningsCategory::SundayPremium: return "Sunday Premium";
        case EarningsCategory::HolidayWorked: return "Holiday Worked";
        case EarningsCategory::Ojti: return "OJTI";
        case EarningsCategory::Cic: return "CIC";
        case EarningsCategory::Other: return "Other";
        default: return "Other";
    }
}

EarningsCategory ClassifyEarnings(const std::string& typeName) {
    // Precedence matters: "Regular / Holiday Leave" must not read as holiday premium.
    if (ContainsIgnoreCase(typeName, "Incentive")) return EarningsCategory::IncentivePay;
    if (ContainsIgnoreCase(typeName, "FLSA")) return EarningsCategory::FlsaPremium;
    if (ContainsIgnoreCase(typeName, "Overtime")) return EarningsCategory::TrueOvertime;
    if (ContainsIgnoreCase(typeName, "Night")) return EarningsCategory::NightDifferential;
    if (ContainsIgnoreCase(typeName, "Sunday")) return EarningsCategory::SundayPremium;
    if (ContainsIgnoreCase(typeName, "Regular")) return EarningsCategory::Regular;
    if (ContainsIgnoreCase(typeName, "Holiday")) {
        return ContainsIgnoreCase(typeName, "Leave") ? EarningsCategory::Regular : EarningsCategory::HolidayWorked;
    }
    if (ContainsIgnoreCase(typeName, "OJTI")) return EarningsCategory::Ojti;
    if (ContainsIgnoreCase(typeName, "CIC")) return EarningsCategory::Cic;
    return EarningsCategory::Other;
}

DeductionKind ClassifyDeduction(const std::string& typeName, const std::vector<std::string>& percentageKeywords) {
    return ContainsAnyIgnoreCase(typeName, percentageKeywords) ? DeductionKind::Percentage : DeductionKind::Fixed;
}

} // namespace paytrack::domain
