/**
 * @file Document.hpp
 * @brief Aggregate Root for one uploaded document and its processing outcome.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "domain/DocumentStatus.hpp"
#include "domain/Summary.hpp"

namespace docudigest::domain {

using Clock = std::chrono::system_clock;

/**
 * @struct DocumentState
 * @brief Plain persisted layout of a document, used for storage and rehydration.
 */
struct DocumentState {
    std::string id;
    std::string fileName;
    std::string contentType;
    std::uint64_t sizeBytes = 0;
    std::string storageLocator;
    DocumentStatus status = DocumentStatus::Pending;
    std::optional<std::string> extractedText;
    std::optional<Summary> summary;
    std::optional<std::string> errorMessage;
    Clock::time_point createdAt;
    Clock::time_point updatedAt;
    bool isDeleted = false;
    int attempts = 0;
};

/**
 * @class Document
 * @brief Enforces the lifecycle: every status change goes through NextStatus().
 *
 * summary is present iff status is Processed; errorMessage is present iff
 * status is Failed.
 */
class Document {
public:
    /**
     * @brief Creates a new Pending document.
     * @throws std::invalid_argument if id or storageLocator is empty.
     */
    static Document Create(const std::string& id,
                           const std::string& fileName,
                           const std::string& contentType,
                           std::uint64_t sizeBytes,
                           const std::string& storageLocator,
                           Clock::time_point now = Clock::now());

    /**
     * @brief Rehydrates a document from persisted state.
     * @throws std::invalid_argument if the state violates the aggregate invariants.
     */
    static Document Restore(DocumentState state);

    // --- Accessors ---
    const std::string& getId() const { return m_state.id; }
    const std::string& getFileName() const { return m_state.fileName; }
    const std::string& getContentType() const { return m_state.contentType; }
    std::uint64_t getSizeBytes() const { return m_state.sizeBytes; }
    const std::string& getStorageLocator() const { return m_state.storageLocator; }
    DocumentStatus getStatus() const { return m_state.status; }
    const std::optional<std::string>& getExtractedText() const { return m_state.extractedText; }
    const std::optional<Summary>& getSummary() const { return m_state.summary; }
    const std::optional<std::string>& getErrorMessage() const { return m_state.errorMessage; }
    Clock::time_point getCreatedAt() const { return m_state.createdAt; }
    Clock::time_point getUpdatedAt() const { return m_state.updatedAt; }
    bool isDeleted() const { return m_state.isDeleted; }
    int getAttempts() const { return m_state.attempts; }
    const DocumentState& getState() const { return m_state; }

    // --- Commands ---

    /**
     * @brief Enters Processing, via PickUp (from Pending) or Retry (from Failed/Processed).
     * Clears the outputs of any previous attempt.
     */
    void beginProcessing(StatusTrigger trigger, Clock::time_point now = Clock::now());

    /** @brief Records extracted text; status stays Processing. */
    void recordExtraction(std::string text, Clock::time_point now = Clock::now());

    /** @brief Stores the summary and moves to Processed. */
    void complete(Summary summary, Clock::time_point now = Clock::now());

    /**
     * @brief Moves to Failed with a reason.
     * @throws std::invalid_argument if reason is empty.
     */
    void fail(StatusTrigger trigger, const std::string& reason, Clock::time_point now = Clock::now());

    /** @brief Soft-deletes the document. Status is left untouched. */
    void markDeleted(Clock::time_point now = Clock::now());

    /** @brief True if the summary/error invariants hold. */
    bool invariantsHold() const { return InvariantsHold(m_state); }

    static bool InvariantsHold(const DocumentState& state);

private:
    explicit Document(DocumentState state) : m_state(std::move(state)) {}

    DocumentState m_state;
};

} // namespace docudigest::domain
