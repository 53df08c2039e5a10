/**
 * @file IPaycheckRepository.hpp
 * @brief Interface for ingested official pay statements.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../Paycheck.hpp"

namespace paytrack::domain {

class IPaycheckRepository {
public:
    virtual ~IPaycheckRepository() = default;

    /** @brief Load by ID. */
    virtual std::optional<DeclaredPaycheck> findById(const std::string& id) = 0;

    /** @brief Every statement, in no particular order. */
    virtual std::vector<DeclaredPaycheck> findAll() = 0;
};

} // namespace paytrack::domain
