/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/TimesheetService.hpp"
#include "application/ReferenceContextResolver.hpp"
#include "application/LedgerService.hpp"
#include "application/ReconciliationService.hpp"
#include "domain/PayrollSettings.hpp"

namespace paytrack::application {

struct AppServices {
    domain::PayrollSettings settings;
    std::shared_ptr<TimesheetService> timesheetService;
    std::shared_ptr<ReferenceContextResolver> referenceResolver;
    std::shared_ptr<LedgerService> ledgerService;
    std::unique_ptr<ReconciliationService> reconciliationService;
};

} // namespace paytrack::application
