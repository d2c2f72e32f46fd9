/**
 * @file LocalFileStorage.cpp
 * @brief Implementation of the LocalFileStorage class.
 */
#include "infrastructure/LocalFileStorage.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace docudigest::infrastructure {

using domain::StorageError;

namespace {

bool IsSafeId(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

} // namespace

LocalFileStorage::LocalFileStorage(const std::string& rootPath, std::shared_ptr<PersistenceService> persistence)
    : m_root(rootPath), m_persistence(std::move(persistence)) {
    std::error_code ec;
    if (!fs::exists(m_root, ec)) {
        fs::create_directories(m_root, ec);
        if (ec) {
            std::cerr << "[LocalFileStorage] Could not create " << m_root << ": " << ec.message() << std::endl;
        }
    }
}

fs::path LocalFileStorage::blobPath(const std::string& documentId) const {
    return m_root / (documentId + ".blob");
}

fs::path LocalFileStorage::metaPath(const std::string& documentId) const {
    return m_root / (documentId + ".meta.json");
}

void LocalFileStorage::ensureRootReachable() const {
    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        throw StorageError(StorageError::Kind::BackendUnavailable,
                           "storage root " + m_root.string() + " is not reachable" +
                               (ec ? " (" + ec.message() + ")" : ""));
    }
}

std::string LocalFileStorage::idFromLocator(const std::string& locator) const {
    const std::string scheme = kLocatorScheme;
    if (locator.rfind(scheme, 0) != 0) {
        throw StorageError(StorageError::Kind::NotFound, "not a local locator: " + locator);
    }
    std::string id = locator.substr(scheme.size());
    if (!IsSafeId(id)) {
        throw StorageError(StorageError::Kind::NotFound, "malformed locator: " + locator);
    }
    return id;
}

std::string LocalFileStorage::locatorFor(const std::string& documentId) const {
    return kLocatorScheme + documentId;
}

std::string LocalFileStorage::put(const std::vector<char>& bytes, const domain::BlobMetadata& metadata) {
    if (!IsSafeId(metadata.documentId)) {
        throw std::invalid_argument("LocalFileStorage: invalid document id '" + metadata.documentId + "'");
    }
    ensureRootReachable();

    nlohmann::json meta = {
        {"document_id", metadata.documentId},
        {"file_name", metadata.fileName},
        {"content_type", metadata.contentType},
        {"size_bytes", bytes.size()}
    };

    try {
        m_persistence->save(blobPath(metadata.documentId).string(), std::string(bytes.begin(), bytes.end()));
        m_persistence->save(metaPath(metadata.documentId).string(), meta.dump(4));
    } catch (const std::exception& e) {
        throw StorageError(StorageError::Kind::BackendUnavailable,
                           "write of " + metadata.documentId + " failed: " + e.what());
    }

    return locatorFor(metadata.documentId);
}

std::vector<char> LocalFileStorage::get(const std::string& locator) {
    std::string id = idFromLocator(locator);
    ensureRootReachable();

    fs::path path = blobPath(id);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw StorageError(StorageError::Kind::NotFound, "no blob for " + locator);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageError(StorageError::Kind::BackendUnavailable, "cannot open " + path.string());
    }
    std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw StorageError(StorageError::Kind::BackendUnavailable, "read error on " + path.string());
    }
    return bytes;
}

bool LocalFileStorage::exists(const std::string& locator) {
    std::string id;
    try {
        id = idFromLocator(locator);
    } catch (const StorageError&) {
        return false;
    }
    ensureRootReachable();
    std::error_code ec;
    return fs::is_regular_file(blobPath(id), ec);
}

} // namespace docudigest::infrastructure
