/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/DocumentProcessingService.hpp"
#include "domain/DocumentRepository.hpp"
#include "domain/StorageBackend.hpp"
#include "infrastructure/OllamaSummarizer.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace docudigest::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::StorageBackend> storage;
    std::shared_ptr<domain::DocumentRepository> repository;
    std::shared_ptr<infrastructure::OllamaSummarizer> summarizer;
    std::unique_ptr<DocumentProcessingService> processingService;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

} // namespace docudigest::application
