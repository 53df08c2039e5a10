/**
 * @file ReferenceContextResolver.hpp
 * @brief Picks the real statement whose rates and deductions drive a computation.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "domain/Paycheck.hpp"
#include "domain/repositories/IPaycheckRepository.hpp"

namespace paytrack::application {

/**
 * @class ReferenceContextResolver
 * @brief Builds ReferenceContext snapshots from declared statements.
 *
 * A statement without a positive Regular rate (a pay lapse, a correction-only
 * statement) cannot supply rates. In that case the most recent earlier
 * statement with a positive rate is used, then any statement with one.
 */
class ReferenceContextResolver {
public:
    explicit ReferenceContextResolver(std::shared_ptr<domain::IPaycheckRepository> paychecks);

    /**
     * @brief Context for a statement, with the lapse fallback applied.
     * @throws std::runtime_error if the statement does not exist.
     */
    domain::ReferenceContext Resolve(const std::string& paycheckId);

    /** @brief Same as Resolve(), nullopt when the statement does not exist. */
    std::optional<domain::ReferenceContext> TryResolve(const std::string& paycheckId);

    /** @brief Rate of the first Regular line with a positive rate, else 0. */
    static double BaseRateOf(const domain::DeclaredPaycheck& paycheck);

    /** @brief Snapshot of a statement as is. */
    static domain::ReferenceContext FromPaycheck(const domain::DeclaredPaycheck& paycheck);

private:
    domain::ReferenceContext resolveFrom(const domain::DeclaredPaycheck& target);

    std::shared_ptr<domain::IPaycheckRepository> m_paychecks;
};

} // namespace paytrack::application
