/**
 * @file IScheduleRepository.hpp
 * @brief Interface for the standard weekly schedule store.
 */

#pragma once

#include <vector>
#include "../Schedule.hpp"

namespace paytrack::domain {

class IScheduleRepository {
public:
    virtual ~IScheduleRepository() = default;

    /** @brief All entries defined for the year (may be empty or partial). */
    virtual std::vector<ScheduleEntry> findSchedule(int year) = 0;
};

} // namespace paytrack::domain
