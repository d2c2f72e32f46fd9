/**
 * @file DocumentRepository.hpp
 * @brief Interface for persistence of Document records.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Document.hpp"

namespace docudigest::domain {

/**
 * @class DocumentRepository
 * @brief Abstract persistent store of documents.
 *
 * Any failure of the underlying medium surfaces as RepositoryUnavailable.
 */
class DocumentRepository {
public:
    virtual ~DocumentRepository() = default;

    /**
     * @brief Loads a document by id, including soft-deleted ones.
     * @throws DocumentNotFoundError if the id is unknown.
     */
    virtual Document load(const std::string& documentId) = 0;

    /** @brief Inserts or replaces the record; returns once it is durable. */
    virtual void save(const Document& document) = 0;

    /** @brief All documents not soft-deleted, oldest first. */
    virtual std::vector<Document> listActive() = 0;
};

} // namespace docudigest::domain
