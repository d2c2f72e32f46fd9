/**
 * @file DocumentStatus.hpp
 * @brief Value Object defining the processing lifecycle of a document.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/Errors.hpp"

namespace docudigest::domain {

/**
 * @enum DocumentStatus
 * @brief Current position of a document in the processing pipeline.
 */
enum class DocumentStatus {
    Pending,     ///< Stored and recorded, not yet picked up.
    Processing,  ///< An attempt is in flight.
    Processed,   ///< Summary available. Terminal.
    Failed       ///< Error message available. Terminal until retried.
};

/**
 * @enum StatusTrigger
 * @brief Events that move a document between states.
 */
enum class StatusTrigger {
    PickUp,
    ExtractionSucceeded,
    ExtractionFailed,
    StorageFailed,
    SummarizationSucceeded,
    SummarizationFailed,
    Retry,
    Cancelled,
    Interrupted
};

inline std::string StatusToString(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending: return "Pending";
        case DocumentStatus::Processing: return "Processing";
        case DocumentStatus::Processed: return "Processed";
        case DocumentStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

inline std::optional<DocumentStatus> StatusFromString(const std::string& value) {
    if (value == "Pending") return DocumentStatus::Pending;
    if (value == "Processing") return DocumentStatus::Processing;
    if (value == "Processed") return DocumentStatus::Processed;
    if (value == "Failed") return DocumentStatus::Failed;
    return std::nullopt;
}

inline std::string TriggerToString(StatusTrigger trigger) {
    switch (trigger) {
        case StatusTrigger::PickUp: return "pick-up";
        case StatusTrigger::ExtractionSucceeded: return "extraction-succeeded";
        case StatusTrigger::ExtractionFailed: return "extraction-failed";
        case StatusTrigger::StorageFailed: return "storage-failed";
        case StatusTrigger::SummarizationSucceeded: return "summarization-succeeded";
        case StatusTrigger::SummarizationFailed: return "summarization-failed";
        case StatusTrigger::Retry: return "retry";
        case StatusTrigger::Cancelled: return "cancelled";
        case StatusTrigger::Interrupted: return "interrupted";
        default: return "unknown";
    }
}

/**
 * @brief Looks up the transition table.
 * @return The target state, or nullopt if the pair is not a legal transition.
 */
inline std::optional<DocumentStatus> TryNextStatus(DocumentStatus from, StatusTrigger trigger) {
    switch (from) {
        case DocumentStatus::Pending:
            if (trigger == StatusTrigger::PickUp) return DocumentStatus::Processing;
            break;
        case DocumentStatus::Processing:
            switch (trigger) {
                case StatusTrigger::ExtractionSucceeded: return DocumentStatus::Processing;
                case StatusTrigger::SummarizationSucceeded: return DocumentStatus::Processed;
                case StatusTrigger::ExtractionFailed:
                case StatusTrigger::StorageFailed:
                case StatusTrigger::SummarizationFailed:
                case StatusTrigger::Cancelled:
                case StatusTrigger::Interrupted:
                    return DocumentStatus::Failed;
                default:
                    break;
            }
            break;
        case DocumentStatus::Processed:
        case DocumentStatus::Failed:
            if (trigger == StatusTrigger::Retry) return DocumentStatus::Processing;
            break;
    }
    return std::nullopt;
}

/**
 * @brief Single transition function of the lifecycle.
 * @throws InvalidTransitionError if the pair is not in the table.
 */
inline DocumentStatus NextStatus(DocumentStatus from, StatusTrigger trigger) {
    auto next = TryNextStatus(from, trigger);
    if (!next) {
        throw InvalidTransitionError("Invalid transition: " + StatusToString(from) +
                                     " --" + TriggerToString(trigger) + "-->");
    }
    return *next;
}

inline bool IsTerminal(DocumentStatus status) {
    return status == DocumentStatus::Processed || status == DocumentStatus::Failed;
}

} // namespace docudigest::domain
