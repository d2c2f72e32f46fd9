/**
 * @file InMemoryDocumentRepository.hpp
 * @brief Process-local DocumentRepository for ephemeral runs.
 */

#pragma once
#include "domain/DocumentRepository.hpp"
#include <map>
#include <mutex>
#include <string>

namespace docudigest::infrastructure {

class InMemoryDocumentRepository : public domain::DocumentRepository {
public:
    domain::Document load(const std::string& documentId) override;
    void save(const domain::Document& document) override;
    std::vector<domain::Document> listActive() override;

private:
    std::mutex m_mutex;
    std::map<std::string, domain::DocumentState> m_records;
};

} // namespace docudigest::infrastructure
