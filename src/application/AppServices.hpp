/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/CatalogMatchService.hpp"
#include "application/ReferenceParsingService.hpp"
#include "application/ResultExportService.hpp"
#include "application/VerificationService.hpp"

namespace refsifter::application {

struct AppServices {
    std::shared_ptr<ReferenceParsingService> parsingService;
    std::shared_ptr<CatalogMatchService> catalogService; ///< Null when no catalog is configured.
    std::unique_ptr<ResultExportService> exportService;
    std::unique_ptr<VerificationService> verificationService; ///< Null unless verification is enabled.
};

} // namespace refsifter::application
