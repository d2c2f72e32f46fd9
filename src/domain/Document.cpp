/**
 * @file Document.cpp
 * @brief Implementation of the Document aggregate.
 */

#include "domain/Document.hpp"

#include <stdexcept>

namespace docudigest::domain {

Document Document::Create(const std::string& id,
                          const std::string& fileName,
                          const std::string& contentType,
                          std::uint64_t sizeBytes,
                          const std::string& storageLocator,
                          Clock::time_point now) {
    if (id.empty()) {
        throw std::invalid_argument("Document: id cannot be empty.");
    }
    if (storageLocator.empty()) {
        throw std::invalid_argument("Document: storage locator must be set before creation.");
    }

    DocumentState state;
    state.id = id;
    state.fileName = fileName;
    state.contentType = contentType;
    state.sizeBytes = sizeBytes;
    state.storageLocator = storageLocator;
    state.status = DocumentStatus::Pending;
    state.createdAt = now;
    state.updatedAt = now;
    return Document(std::move(state));
}

Document Document::Restore(DocumentState state) {
    if (state.id.empty()) {
        throw std::invalid_argument("Document: persisted record has no id.");
    }
    if (state.storageLocator.empty()) {
        throw std::invalid_argument("Document " + state.id + ": persisted record has no storage locator.");
    }
    if (!InvariantsHold(state)) {
        throw std::invalid_argument("Document " + state.id + ": summary/error fields inconsistent with status " +
                                    StatusToString(state.status) + ".");
    }
    return Document(std::move(state));
}

bool Document::InvariantsHold(const DocumentState& state) {
    bool processed = state.status == DocumentStatus::Processed;
    bool failed = state.status == DocumentStatus::Failed;
    if (processed != state.summary.has_value()) return false;
    if (failed != state.errorMessage.has_value()) return false;
    if (failed && state.errorMessage->empty()) return false;
    return true;
}

void Document::beginProcessing(StatusTrigger trigger, Clock::time_point now) {
    if (trigger != StatusTrigger::PickUp && trigger != StatusTrigger::Retry) {
        throw InvalidTransitionError("beginProcessing requires pick-up or retry, got " + TriggerToString(trigger));
    }
    m_state.status = NextStatus(m_state.status, trigger);
    m_state.extractedText.reset();
    m_state.summary.reset();
    m_state.errorMessage.reset();
    m_state.attempts += 1;
    m_state.updatedAt = now;
}

void Document::recordExtraction(std::string text, Clock::time_point now) {
    m_state.status = NextStatus(m_state.status, StatusTrigger::ExtractionSucceeded);
    m_state.extractedText = std::move(text);
    m_state.updatedAt = now;
}

void Document::complete(Summary summary, Clock::time_point now) {
    if (!m_state.extractedText) {
        throw InvalidTransitionError("Document " + m_state.id + ": cannot complete before extraction.");
    }
    m_state.status = NextStatus(m_state.status, StatusTrigger::SummarizationSucceeded);
    m_state.summary = std::move(summary);
    m_state.updatedAt = now;
}

void Document::fail(StatusTrigger trigger, const std::string& reason, Clock::time_point now) {
    if (reason.empty()) {
        throw std::invalid_argument("Document: failure reason cannot be empty.");
    }
    m_state.status = NextStatus(m_state.status, trigger);
    m_state.summary.reset();
    m_state.errorMessage = reason;
    m_state.updatedAt = now;
}

void Document::markDeleted(Clock::time_point now) {
    m_state.isDeleted = true;
    m_state.updatedAt = now;
}

} // namespace docudigest::domain
