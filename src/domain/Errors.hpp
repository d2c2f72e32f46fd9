/**
 * @file Errors.hpp
 * @brief Exception taxonomy of the processing pipeline.
 *
 * Storage, extraction and summarization errors are converted into a Failed
 * status by the orchestrator. RepositoryUnavailable is the only one that
 * reaches the caller of a processing trigger.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace docudigest::domain {

class StorageError : public std::runtime_error {
public:
    enum class Kind { NotFound, BackendUnavailable };

    StorageError(Kind kind, const std::string& detail)
        : std::runtime_error(KindToString(kind) + ": " + detail), m_kind(kind), m_detail(detail) {}

    Kind kind() const { return m_kind; }
    const std::string& detail() const { return m_detail; }

    /** @brief Message persisted on the failed document. */
    std::string describe() const { return "storage/" + std::string(what()); }

    static std::string KindToString(Kind kind) {
        switch (kind) {
            case Kind::NotFound: return "not-found";
            case Kind::BackendUnavailable: return "backend-unavailable";
        }
        return "unknown";
    }

private:
    Kind m_kind;
    std::string m_detail;
};

class ExtractorError : public std::runtime_error {
public:
    enum class Kind { UnsupportedFormat, CorruptInput, EmptyResult };

    ExtractorError(Kind kind, const std::string& detail)
        : std::runtime_error(KindToString(kind) + ": " + detail), m_kind(kind), m_detail(detail) {}

    Kind kind() const { return m_kind; }
    const std::string& detail() const { return m_detail; }
    std::string describe() const { return "extraction/" + std::string(what()); }

    static std::string KindToString(Kind kind) {
        switch (kind) {
            case Kind::UnsupportedFormat: return "unsupported-format";
            case Kind::CorruptInput: return "corrupt-input";
            case Kind::EmptyResult: return "empty-result";
        }
        return "unknown";
    }

private:
    Kind m_kind;
    std::string m_detail;
};

class SummarizerError : public std::runtime_error {
public:
    enum class Kind { RemoteUnavailable, RateLimited, InvalidResponse, AuthError };

    SummarizerError(Kind kind, const std::string& detail)
        : std::runtime_error(KindToString(kind) + ": " + detail), m_kind(kind), m_detail(detail) {}

    Kind kind() const { return m_kind; }
    const std::string& detail() const { return m_detail; }
    std::string describe() const { return "summarization/" + std::string(what()); }

    /** @brief True for causes an operator can clear by simply retrying later. */
    bool isTransient() const {
        return m_kind == Kind::RemoteUnavailable || m_kind == Kind::RateLimited;
    }

    static std::string KindToString(Kind kind) {
        switch (kind) {
            case Kind::RemoteUnavailable: return "remote-unavailable";
            case Kind::RateLimited: return "rate-limited";
            case Kind::InvalidResponse: return "invalid-response";
            case Kind::AuthError: return "auth-error";
        }
        return "unknown";
    }

private:
    Kind m_kind;
    std::string m_detail;
};

class RepositoryUnavailable : public std::runtime_error {
public:
    explicit RepositoryUnavailable(const std::string& detail)
        : std::runtime_error("repository unavailable: " + detail) {}
};

class DocumentNotFoundError : public std::runtime_error {
public:
    explicit DocumentNotFoundError(const std::string& documentId)
        : std::runtime_error("Document not found: " + documentId), m_documentId(documentId) {}

    const std::string& documentId() const { return m_documentId; }

private:
    std::string m_documentId;
};

class InvalidTransitionError : public std::logic_error {
public:
    explicit InvalidTransitionError(const std::string& message) : std::logic_error(message) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace docudigest::domain
