#include "infrastructure/InMemoryDocumentRepository.hpp"
#include "domain/Errors.hpp"
#include <algorithm>

namespace docudigest::infrastructure {

domain::Document InMemoryDocumentRepository::load(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(documentId);
    if (it == m_records.end()) {
        throw domain::DocumentNotFoundError(documentId);
    }
    return domain::Document::Restore(it->second);
}

void InMemoryDocumentRepository::save(const domain::Document& document) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records[document.getId()] = document.getState();
}

std::vector<domain::Document> InMemoryDocumentRepository::listActive() {
    std::vector<domain::Document> documents;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_records) {
            if (!entry.second.isDeleted) {
                documents.push_back(domain::Document::Restore(entry.second));
            }
        }
    }
    std::stable_sort(documents.begin(), documents.end(), [](const domain::Document& a, const domain::Document& b) {
        return a.getCreatedAt() < b.getCreatedAt();
    });
    return documents;
}

} // namespace docudigest::infrastructure
