/**
 * @file JsonDocumentRepository.hpp
 * @brief Filesystem-based implementation of the DocumentRepository.
 */

#pragma once
#include "domain/DocumentRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace docudigest::infrastructure {

/**
 * @class JsonDocumentRepository
 * @brief Keeps one JSON file per document under a root directory.
 */
class JsonDocumentRepository : public domain::DocumentRepository {
public:
    /**
     * @param rootPath Directory for <id>.json records. Created if missing.
     * @param persistence Serialized atomic writer.
     */
    JsonDocumentRepository(const std::string& rootPath, std::shared_ptr<PersistenceService> persistence);

    /** @see domain::DocumentRepository::load */
    domain::Document load(const std::string& documentId) override;

    /** @see domain::DocumentRepository::save */
    void save(const domain::Document& document) override;

    /** @see domain::DocumentRepository::listActive */
    std::vector<domain::Document> listActive() override;

    static nlohmann::json ToJson(const domain::DocumentState& state);

    /** @throws nlohmann::json::exception or std::invalid_argument on malformed input. */
    static domain::DocumentState FromJson(const nlohmann::json& j);

private:
    std::filesystem::path recordPath(const std::string& documentId) const;
    void ensureRootReachable() const;

    std::filesystem::path m_root; ///< Records directory.
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace docudigest::infrastructure
