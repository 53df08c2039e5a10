/**
 * @file Holiday.hpp
 * @brief Federal holiday reference data.
 */

#pragma once

#include <string>

#include "domain/CivilDate.hpp"

namespace paytrack::domain {

/**
 * @struct Holiday
 * @brief A calendar holiday as published for a given year (before any slide).
 */
struct Holiday {
    int year = 0;
    std::string name;
    CivilDate date;
};

} // namespace paytrack::domain
