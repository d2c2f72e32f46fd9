/**
 * @file DocumentProcessingService.hpp
 * @brief Orchestrates storage, extraction, summarization and persistence of documents.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/DocumentLockTable.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/Document.hpp"
#include "domain/DocumentRepository.hpp"
#include "domain/StorageBackend.hpp"
#include "domain/SummarizationService.hpp"
#include "domain/TextExtractor.hpp"
#include "infrastructure/PipelineConfig.hpp"

namespace docudigest::application {

/**
 * @class DocumentProcessingService
 * @brief Drives a document through Pending -> Processing -> Processed/Failed.
 *
 * One attempt per invocation, no internal retry loop. Storage, extraction and
 * summarization errors become a Failed status; RepositoryUnavailable is thrown
 * to the caller. At most one attempt per document id runs at a time.
 */
class DocumentProcessingService {
public:
    /** @brief Produces candidate document ids; submit() skips ids already in use. */
    using IdGenerator = std::function<std::string()>;

    /** @param idGenerator Defaults to 128 random bits as 32 hex characters. */
    DocumentProcessingService(const infrastructure::PipelineConfig& config,
                              std::shared_ptr<domain::StorageBackend> storage,
                              std::shared_ptr<domain::TextExtractor> extractor,
                              std::shared_ptr<domain::SummarizationService> summarizer,
                              std::shared_ptr<domain::DocumentRepository> repository,
                              IdGenerator idGenerator = IdGenerator());

    /** @brief Maximum number of candidate ids submit() draws before giving up. */
    static constexpr int kMaxIdDraws = 8;

    /**
     * @enum Outcome
     * @brief What a processing trigger did.
     */
    enum class Outcome {
        Processed,  ///< Attempt ran and produced a summary.
        Failed,     ///< Attempt ran and ended in Failed.
        Skipped,    ///< Document was not eligible (already handled, deleted).
        Cancelled   ///< Cancelled before any state change.
    };

    struct ProcessingResult {
        std::string documentId;
        Outcome outcome = Outcome::Skipped;
        domain::DocumentStatus status = domain::DocumentStatus::Pending;
        std::optional<std::string> errorMessage;
        std::string note; ///< Reason for Skipped/Cancelled.
    };

    struct StatusView {
        std::string documentId;
        std::string fileName;
        domain::DocumentStatus status = domain::DocumentStatus::Pending;
        std::optional<domain::Summary> summary;
        std::optional<std::string> errorMessage;
        bool hasExtractedText = false;
        bool isDeleted = false;
        int attempts = 0;
    };

    /**
     * @brief Stores the bytes and records a Pending document.
     * @return The new document id.
     * An id whose record or bytes already exist is never reused.
     * @throws domain::StorageError if the bytes cannot be stored (no record is created).
     * @throws domain::RepositoryUnavailable if the record cannot be written.
     * @throws std::runtime_error if no unused id was found in kMaxIdDraws draws.
     */
    std::string submit(const std::vector<char>& bytes, const std::string& fileName, const std::string& contentType);

    /**
     * @brief Processes a Pending document. Other states are reported as Skipped.
     * @throws domain::DocumentNotFoundError, domain::RepositoryUnavailable.
     */
    ProcessingResult processDocument(const std::string& documentId,
                                     const domain::CancellationToken& cancellation = domain::CancellationToken());

    /**
     * @brief Re-enters the state machine for a Failed or Processed document.
     * A document left in Processing by an interrupted attempt is failed first, then retried.
     * @throws domain::DocumentNotFoundError, domain::RepositoryUnavailable.
     */
    ProcessingResult retry(const std::string& documentId,
                           const domain::CancellationToken& cancellation = domain::CancellationToken());

    /** @brief Current status, summary and error of a document. */
    StatusView getStatus(const std::string& documentId);

    /** @brief Documents that are not soft-deleted. */
    std::vector<domain::Document> listActive();

    /** @brief Soft-deletes a document. Its bytes and record are kept. */
    void softDelete(const std::string& documentId);

    /** @brief Runs processDocument() for every active Pending document, oldest first. */
    std::vector<ProcessingResult> processPending(const domain::CancellationToken& cancellation = domain::CancellationToken());

    /**
     * @brief Fails documents stuck in Processing with no attempt in flight.
     * @return Number of documents recovered.
     */
    int recoverInterrupted();

    static std::string OutcomeToString(Outcome outcome);

private:
    ProcessingResult runAttempt(domain::Document& document,
                                domain::StatusTrigger entry,
                                const domain::CancellationToken& cancellation);
    ProcessingResult finishFailed(domain::Document& document, domain::StatusTrigger trigger, const std::string& reason);
    ProcessingResult skipped(const domain::Document& document, const std::string& note) const;
    std::string allocateId();

    const infrastructure::PipelineConfig m_config;
    std::shared_ptr<domain::StorageBackend> m_storage;
    std::shared_ptr<domain::TextExtractor> m_extractor;
    std::shared_ptr<domain::SummarizationService> m_summarizer;
    std::shared_ptr<domain::DocumentRepository> m_repository;
    IdGenerator m_idGenerator;
    DocumentLockTable m_locks;
};

} // namespace docudigest::application
