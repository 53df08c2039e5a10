/**
 * @file IHolidayRepository.hpp
 * @brief Interface for the holiday calendar.
 */

#pragma once

#include <vector>
#include "../Holiday.hpp"

namespace paytrack::domain {

class IHolidayRepository {
public:
    virtual ~IHolidayRepository() = default;

    // Calendar dates as published; the observed-date slide is applied by the engine.
    virtual std::vector<Holiday> findHolidays(int year) = 0;
};

} // namespace paytrack::domain
