/**
 * @file StorageBackend.hpp
 * @brief Interface for the byte-blob store holding uploaded documents.
 */

#pragma once

#include <string>
#include <vector>

namespace docudigest::domain {

/**
 * @struct BlobMetadata
 * @brief Describes the bytes being stored. documentId determines the locator.
 */
struct BlobMetadata {
    std::string documentId;
    std::string fileName;
    std::string contentType;
};

/**
 * @class StorageBackend
 * @brief Abstract blob store, selected once at startup.
 *
 * Implementations throw StorageError{NotFound} for unknown locators and
 * StorageError{BackendUnavailable} when the medium cannot be reached.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /** @brief Short identifier of the variant ("local", "s3"). */
    virtual std::string name() const = 0;

    /**
     * @brief Stores bytes keyed by metadata.documentId.
     * Repeating the call for the same document rewrites only that document's bytes.
     * @return Opaque locator for get()/exists().
     */
    virtual std::string put(const std::vector<char>& bytes, const BlobMetadata& metadata) = 0;

    /** @brief Reads back the bytes stored under a locator. */
    virtual std::vector<char> get(const std::string& locator) = 0;

    /** @brief Locator put() returns for a document id, without touching the medium. */
    virtual std::string locatorFor(const std::string& documentId) const = 0;

    /** @brief Checks whether a locator refers to stored bytes. */
    virtual bool exists(const std::string& locator) = 0;
};

} // namespace docudigest::domain
