/**
 * @file ReferenceContextResolver.cpp
 * @brief Implementation of the ReferenceContextResolver class.
 */

#include "application/ReferenceContextResolver.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace paytrack::application {

ReferenceContextResolver::ReferenceContextResolver(std::shared_ptr<domain::IPaycheckRepository> paychecks)
    : m_paychecks(std::move(paychecks)) {}

double ReferenceContextResolver::BaseRateOf(const domain::DeclaredPaycheck& paycheck) {
    for (const auto& line : paycheck.earnings) {
        if (line.category() == domain::EarningsCategory::Regular && line.rate > 0.0) {
            return line.rate;
        }
    }
    return 0.0;
}

domain::ReferenceContext ReferenceContextResolver::FromPaycheck(const domain::DeclaredPaycheck& paycheck) {
    domain::ReferenceContext ctx;
    ctx.baseHourlyRate = BaseRateOf(paycheck);
    ctx.referenceGross = paycheck.grossPay;
    ctx.earnings = paycheck.earnings;
    ctx.deductions = paycheck.deductions;
    ctx.sourcePaycheckId = paycheck.id;
    return ctx;
}

domain::ReferenceContext ReferenceContextResolver::Resolve(const std::string& paycheckId) {
    auto target = m_paychecks->findById(paycheckId);
    if (!target) {
        throw std::runtime_error("Paycheck not found: " + paycheckId);
    }
    return resolveFrom(*target);
}

std::optional<domain::ReferenceContext> ReferenceContextResolver::TryResolve(const std::string& paycheckId) {
    auto target = m_paychecks->findById(paycheckId);
    if (!target) return std::nullopt;
    return resolveFrom(*target);
}

domain::ReferenceContext ReferenceContextResolver::resolveFrom(const domain::DeclaredPaycheck& target) {
    if (BaseRateOf(target) > 0.0) {
        return FromPaycheck(target);
    }

    const domain::DeclaredPaycheck* priorBest = nullptr;
    const domain::DeclaredPaycheck* anyBest = nullptr;
    const auto all = m_paychecks->findAll();
    for (const auto& candidate : all) {
        if (candidate.id == target.id || BaseRateOf(candidate) <= 0.0) continue;
        if (anyBest == nullptr || candidate.payDate > anyBest->payDate) {
            anyBest = &candidate;
        }
        if (candidate.payDate < target.payDate &&
            (priorBest == nullptr || candidate.payDate > priorBest->payDate)) {
            priorBest = &candidate;
        }
    }

    const domain::DeclaredPaycheck* source = priorBest != nullptr ? priorBest : anyBest;
    if (source == nullptr) {
        std::cerr << "[ReferenceContextResolver] No statement has a positive base rate (requested "
                  << target.id << ")" << std::endl;
        return FromPaycheck(target);
    }

    std::cerr << "[ReferenceContextResolver] Statement " << target.id << " has no base rate, using "
              << source->id << std::endl;
    domain::ReferenceContext ctx = FromPaycheck(*source);
    ctx.fallbackUsed = true;
    return ctx;
}

} // namespace paytrack::application
