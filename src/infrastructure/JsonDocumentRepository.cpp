/**
 * @file JsonDocumentRepository.cpp
 * @brief Implementation of the JsonDocumentRepository class.
 */
#include "infrastructure/JsonDocumentRepository.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace docudigest::infrastructure {

using json = nlohmann::json;
using domain::DocumentState;

namespace {

long long ToMillis(domain::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

domain::Clock::time_point FromMillis(long long ms) {
    return domain::Clock::time_point(std::chrono::duration_cast<domain::Clock::duration>(std::chrono::milliseconds(ms)));
}

bool IsSafeId(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> ReadOptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

} // namespace

JsonDocumentRepository::JsonDocumentRepository(const std::string& rootPath, std::shared_ptr<PersistenceService> persistence)
    : m_root(rootPath), m_persistence(std::move(persistence)) {
    std::error_code ec;
    if (!fs::exists(m_root, ec)) {
        fs::create_directories(m_root, ec);
        if (ec) {
            std::cerr << "[JsonDocumentRepository] Could not create " << m_root << ": " << ec.message() << std::endl;
        }
    }
}

json JsonDocumentRepository::ToJson(const DocumentState& state) {
    json summary = nullptr;
    if (state.summary) {
        summary = {
            {"text", state.summary->text},
            {"model_id", state.summary->modelId},
            {"truncated", state.summary->truncated},
            {"input_characters", state.summary->inputCharacters},
            {"original_characters", state.summary->originalCharacters},
            {"generated_at", ToMillis(state.summary->generatedAt)}
        };
    }

    return {
        {"id", state.id},
        {"file_name", state.fileName},
        {"content_type", state.contentType},
        {"size_bytes", state.sizeBytes},
        {"storage_locator", state.storageLocator},
        {"status", domain::StatusToString(state.status)},
        {"extracted_text", OptionalString(state.extractedText)},
        {"summary", summary},
        {"error_message", OptionalString(state.errorMessage)},
        {"created_at", ToMillis(state.createdAt)},
        {"updated_at", ToMillis(state.updatedAt)},
        {"is_deleted", state.isDeleted},
        {"attempts", state.attempts}
    };
}

DocumentState JsonDocumentRepository::FromJson(const json& j) {
    DocumentState state;
    state.id = j.at("id").get<std::string>();
    state.fileName = j.value("file_name", "");
    state.contentType = j.value("content_type", "");
    state.sizeBytes = j.value("size_bytes", static_cast<std::uint64_t>(0));
    state.storageLocator = j.at("storage_locator").get<std::string>();

    std::string statusName = j.at("status").get<std::string>();
    auto status = domain::StatusFromString(statusName);
    if (!status) {
        throw std::invalid_argument("unknown status '" + statusName + "'");
    }
    state.status = *status;

    state.extractedText = ReadOptionalString(j, "extracted_text");
    state.errorMessage = ReadOptionalString(j, "error_message");
    if (j.contains("summary") && !j["summary"].is_null()) {
        const auto& s = j["summary"];
        domain::Summary summary;
        summary.text = s.at("text").get<std::string>();
        summary.modelId = s.value("model_id", "");
        summary.truncated = s.value("truncated", false);
        summary.inputCharacters = s.value("input_characters", static_cast<std::size_t>(0));
        summary.originalCharacters = s.value("original_characters", static_cast<std::size_t>(0));
        summary.generatedAt = FromMillis(s.value("generated_at", 0LL));
        state.summary = std::move(summary);
    }

    state.createdAt = FromMillis(j.value("created_at", 0LL));
    state.updatedAt = FromMillis(j.value("updated_at", 0LL));
    state.isDeleted = j.value("is_deleted", false);
    state.attempts = j.value("attempts", 0);
    return state;
}

fs::path JsonDocumentRepository::recordPath(const std::string& documentId) const {
    return m_root / (documentId + ".json");
}

void JsonDocumentRepository::ensureRootReachable() const {
    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        throw domain::RepositoryUnavailable("record directory " + m_root.string() + " is not reachable");
    }
}

domain::Document JsonDocumentRepository::load(const std::string& documentId) {
    if (!IsSafeId(documentId)) {
        throw domain::DocumentNotFoundError(documentId);
    }
    ensureRootReachable();

    fs::path path = recordPath(documentId);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw domain::DocumentNotFoundError(documentId);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw domain::RepositoryUnavailable("cannot open record " + path.string());
    }
    try {
        json j;
        file >> j;
        return domain::Document::Restore(FromJson(j));
    } catch (const std::exception& e) {
        std::cerr << "[JsonDocumentRepository] Corrupt record " << path << ": " << e.what() << std::endl;
        throw domain::RepositoryUnavailable("corrupt record " + documentId + ": " + e.what());
    }
}

void JsonDocumentRepository::save(const domain::Document& document) {
    if (!IsSafeId(document.getId())) {
        throw std::invalid_argument("JsonDocumentRepository: invalid document id '" + document.getId() + "'");
    }
    ensureRootReachable();
    try {
        m_persistence->save(recordPath(document.getId()).string(), ToJson(document.getState()).dump(2));
    } catch (const std::exception& e) {
        throw domain::RepositoryUnavailable("write of " + document.getId() + " failed: " + e.what());
    }
}

std::vector<domain::Document> JsonDocumentRepository::listActive() {
    ensureRootReachable();
    std::vector<domain::Document> documents;

    std::error_code ec;
    fs::directory_iterator it(m_root, ec);
    if (ec) {
        throw domain::RepositoryUnavailable("cannot list " + m_root.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        try {
            std::ifstream file(entry.path());
            json j;
            file >> j;
            auto document = domain::Document::Restore(FromJson(j));
            if (!document.isDeleted()) {
                documents.push_back(std::move(document));
            }
        } catch (const std::exception& e) {
            std::cerr << "[JsonDocumentRepository] Skipping unreadable record " << entry.path() << ": " << e.what() << std::endl;
        }
    }

    std::sort(documents.begin(), documents.end(), [](const domain::Document& a, const domain::Document& b) {
        if (a.getCreatedAt() != b.getCreatedAt()) return a.getCreatedAt() < b.getCreatedAt();
        return a.getId() < b.getId();
    });
    return documents;
}

} // namespace docudigest::infrastructure
