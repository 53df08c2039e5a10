/**
 * @file IShiftEntryRepository.hpp
 * @brief Interface for the user's saved timesheet rows.
 */

#pragma once

#include <vector>
#include "../CivilDate.hpp"
#include "../ShiftEntry.hpp"

namespace paytrack::domain {

/**
 * @class IShiftEntryRepository
 * @brief Timesheet rows are keyed by the pay period they were saved under.
 */
class IShiftEntryRepository {
public:
    virtual ~IShiftEntryRepository() = default;

    /** @brief Saved rows of the period, in no particular order. */
    virtual std::vector<ShiftEntry> findByPeriod(const CivilDate& periodEnding) = 0;

    /** @brief True once the user has explicitly saved anything for the period. */
    virtual bool hasSavedEntries(const CivilDate& periodEnding) = 0;
};

} // namespace paytrack::domain
