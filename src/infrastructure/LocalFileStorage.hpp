/**
 * @file LocalFileStorage.hpp
 * @brief Filesystem-based implementation of the StorageBackend.
 */

#pragma once
#include "domain/StorageBackend.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace docudigest::infrastructure {

/**
 * @class LocalFileStorage
 * @brief Stores each document as <root>/<id>.blob with a <root>/<id>.meta.json sidecar.
 *
 * Locators have the form "local:<id>".
 */
class LocalFileStorage : public domain::StorageBackend {
public:
    /**
     * @param rootPath Directory holding the blobs. Created if missing.
     * @param persistence Serialized writer used for atomic writes.
     */
    LocalFileStorage(const std::string& rootPath, std::shared_ptr<PersistenceService> persistence);

    std::string name() const override { return "local"; }

    /** @see domain::StorageBackend::put */
    std::string put(const std::vector<char>& bytes, const domain::BlobMetadata& metadata) override;

    /** @see domain::StorageBackend::get */
    std::vector<char> get(const std::string& locator) override;

    /** @see domain::StorageBackend::exists */
    bool exists(const std::string& locator) override;

    /** @see domain::StorageBackend::locatorFor */
    std::string locatorFor(const std::string& documentId) const override;

    static constexpr const char* kLocatorScheme = "local:";

private:
    std::filesystem::path m_root; ///< Blob directory.
    std::shared_ptr<PersistenceService> m_persistence;

    std::filesystem::path blobPath(const std::string& documentId) const;
    std::filesystem::path metaPath(const std::string& documentId) const;
    void ensureRootReachable() const;
    std::string idFromLocator(const std::string& locator) const;
};

} // namespace docudigest::infrastructure
