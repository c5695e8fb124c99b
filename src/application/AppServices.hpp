/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/BulkFindReplaceService.hpp"
#include "application/LinkExtractionService.hpp"
#include "application/LinkFindReplaceService.hpp"
#include "application/TextFindReplaceService.hpp"
#include "domain/WordDocument.hpp"

namespace linkwalker::application {

struct AppServices {
    std::shared_ptr<domain::DocumentLoader> documentLoader;
    std::unique_ptr<LinkExtractionService> linkExtractionService;
    std::shared_ptr<TextFindReplaceService> textFindReplaceService;
    std::shared_ptr<LinkFindReplaceService> linkFindReplaceService;
    std::unique_ptr<BulkFindReplaceService> bulkFindReplaceService;
};

} // namespace linkwalker::application
