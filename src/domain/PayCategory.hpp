/**
 * @file PayCategory.hpp
 * @brief Closed set of earnings/deduction categories and name-based classification.
 */

#pragma once

#include <string>
#include <vector>

namespace paytrack::domain {

/**
 * @enum EarningsCategory
 * @brief Discriminant for earnings lines. Other is a passthrough for codes the engine does not rate.
 */
enum class EarningsCategory {
    Regular,
    IncentivePay,
    FlsaPremium,
    TrueOvertime,
    NightDifferential,
    SundayPremium,
    HolidayWorked,
    Ojti,
    Cic,
    Other
};

/** @brief Display name used on generated statements. */
std::string EarningsCategoryToString(EarningsCategory category);

/**
 * @brief Maps a statement's free-text earnings type to a category.
 *
 * Case-insensitive substring match, in a fixed precedence order. Source
 * statements are not consistent about naming, so this is a fallback and a
 * renamed code will silently land in Other.
 */
EarningsCategory ClassifyEarnings(const std::string& typeName);

/**
 * @enum DeductionKind
 * @brief Percentage lines scale with gross; fixed lines repeat the reference amount.
 */
enum class DeductionKind {
    Percentage,
    Fixed
};

inline std::string DeductionKindToString(DeductionKind kind) {
    return kind == DeductionKind::Percentage ? "percentage" : "fixed";
}

/**
 * @brief Percentage-based when the name contains any of the keywords (tax/retirement-like).
 */
DeductionKind ClassifyDeduction(const std::string& typeName, const std::vector<std::string>& percentageKeywords);

/** @brief Case-insensitive substring test. */
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

/** @brief True if the name contains any of the needles, case-insensitively. */
bool ContainsAnyIgnoreCase(const std::string& haystack, const std::vector<std::string>& needles);

} // namespace paytrack::domain
