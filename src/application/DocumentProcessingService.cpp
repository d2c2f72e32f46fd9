/**
 * @file DocumentProcessingService.cpp
 * @brief Implementation of DocumentProcessingService.
 */

#include "application/DocumentProcessingService.hpp"
#include "domain/Errors.hpp"
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace docudigest::application {

using domain::Document;
using domain::DocumentStatus;
using domain::StatusTrigger;

namespace {

std::mt19937_64 SeededGenerator() {
    // 256 bits of device entropy per process.
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device(), device(), device(), device(), device()};
    return std::mt19937_64(seed);
}

std::string GenerateDocumentId() {
    static std::mutex generatorMutex;
    static std::mt19937_64 generator = SeededGenerator();

    std::lock_guard<std::mutex> lock(generatorMutex);
    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(16) << generator()
       << std::setw(16) << generator();
    return ss.str();
}

} // namespace

DocumentProcessingService::DocumentProcessingService(const infrastructure::PipelineConfig& config,
                                                     std::shared_ptr<domain::StorageBackend> storage,
                                                     std::shared_ptr<domain::TextExtractor> extractor,
                                                     std::shared_ptr<domain::SummarizationService> summarizer,
                                                     std::shared_ptr<domain::DocumentRepository> repository,
                                                     IdGenerator idGenerator)
    : m_config(config),
      m_storage(std::move(storage)),
      m_extractor(std::move(extractor)),
      m_summarizer(std::move(summarizer)),
      m_repository(std::move(repository)),
      m_idGenerator(idGenerator ? std::move(idGenerator) : IdGenerator(&GenerateDocumentId)) {}

std::string DocumentProcessingService::OutcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Processed: return "processed";
        case Outcome::Failed: return "failed";
        case Outcome::Skipped: return "skipped";
        case Outcome::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

std::string DocumentProcessingService::submit(const std::vector<char>& bytes,
                                              const std::string& fileName,
                                              const std::string& contentType) {
    const std::string type = contentType.empty() ? "application/octet-stream" : contentType;
    if (!m_extractor->supports(type)) {
        std::cerr << "[DocumentProcessingService] No extractor for '" << type
                  << "'; processing " << fileName << " will fail." << std::endl;
    }
    const std::string id = allocateId();

    domain::BlobMetadata metadata{id, fileName, type};
    std::string locator = m_storage->put(bytes, metadata);

    Document document = Document::Create(id, fileName, type, bytes.size(), locator);
    m_repository->save(document);

    std::cout << "[DocumentProcessingService] Submitted " << id << " (" << fileName << ", "
              << type << ", " << bytes.size() << " bytes) -> " << locator << std::endl;
    return id;
}

std::string DocumentProcessingService::allocateId() {
    for (int draw = 0; draw < kMaxIdDraws; ++draw) {
        std::string id = m_idGenerator();
        bool recorded = true;
        try {
            m_repository->load(id);
        } catch (const domain::DocumentNotFoundError&) {
            recorded = false;
        }
        // Bytes without a record are left behind by a submit whose record write failed.
        if (!recorded && !m_storage->exists(m_storage->locatorFor(id))) {
            return id;
        }
        std::cerr << "[DocumentProcessingService] Id " << id << " is already in use, drawing another." << std::endl;
    }
    throw std::runtime_error("no unused document id after " + std::to_string(kMaxIdDraws) + " draws");
}

DocumentProcessingService::ProcessingResult DocumentProcessingService::processDocument(
    const std::string& documentId, const domain::CancellationToken& cancellation) {
    auto guard = m_locks.acquire(documentId);

    // Re-read under the lock: a concurrent caller may have finished the attempt meanwhile.
    Document document = m_repository->load(documentId);
    if (document.isDeleted()) {
        return skipped(document, "document is deleted");
    }
    if (document.getStatus() != DocumentStatus::Pending) {
        return skipped(document, "status is " + domain::StatusToString(document.getStatus()) + ", not Pending");
    }
    return runAttempt(document, StatusTrigger::PickUp, cancellation);
}

DocumentProcessingService::ProcessingResult DocumentProcessingService::retry(
    const std::string& documentId, const domain::CancellationToken& cancellation) {
    auto guard = m_locks.acquire(documentId);

    Document document = m_repository->load(documentId);
    if (document.isDeleted()) {
        return skipped(document, "document is deleted");
    }

    switch (document.getStatus()) {
        case DocumentStatus::Pending:
            return runAttempt(document, StatusTrigger::PickUp, cancellation);
        case DocumentStatus::Processing:
            // Holding the lock means no attempt is in flight: this one was interrupted.
            std::cerr << "[DocumentProcessingService] " << documentId
                      << " was left in Processing; failing it before retry." << std::endl;
            document.fail(StatusTrigger::Interrupted, "internal/interrupted: previous attempt did not finish");
            m_repository->save(document);
            return runAttempt(document, StatusTrigger::Retry, cancellation);
        case DocumentStatus::Processed:
        case DocumentStatus::Failed:
            return runAttempt(document, StatusTrigger::Retry, cancellation);
    }
    return skipped(document, "unknown status");
}

DocumentProcessingService::ProcessingResult DocumentProcessingService::runAttempt(
    Document& document, StatusTrigger entry, const domain::CancellationToken& cancellation) {
    const std::string& id = document.getId();

    if (cancellation.isCancelled()) {
        ProcessingResult result;
        result.documentId = id;
        result.outcome = Outcome::Cancelled;
        result.status = document.getStatus();
        result.errorMessage = document.getErrorMessage();
        result.note = cancellation.reason();
        std::cout << "[DocumentProcessingService] " << id << " cancelled before start: "
                  << result.note << std::endl;
        return result;
    }

    // RepositoryUnavailable from here on aborts the attempt and reaches the caller.
    document.beginProcessing(entry);
    m_repository->save(document);
    std::cout << "[DocumentProcessingService] " << id << " -> Processing (attempt "
              << document.getAttempts() << ", " << domain::TriggerToString(entry) << ")" << std::endl;

    const std::string cancelledPrefix = "cancelled: ";
    try {
        std::vector<char> bytes;
        try {
            bytes = m_storage->get(document.getStorageLocator());
        } catch (const domain::StorageError& e) {
            return finishFailed(document, StatusTrigger::StorageFailed, e.describe());
        }
        if (cancellation.isCancelled()) {
            return finishFailed(document, StatusTrigger::Cancelled, cancelledPrefix + cancellation.reason());
        }

        std::string text;
        try {
            text = m_extractor->extract(bytes, document.getContentType());
        } catch (const domain::ExtractorError& e) {
            return finishFailed(document, StatusTrigger::ExtractionFailed, e.describe());
        }
        std::cout << "[DocumentProcessingService] " << id << " extracted " << text.size() << " bytes of text." << std::endl;
        document.recordExtraction(std::move(text));
        m_repository->save(document);

        if (cancellation.isCancelled()) {
            return finishFailed(document, StatusTrigger::Cancelled, cancelledPrefix + cancellation.reason());
        }

        domain::Summary summary;
        try {
            summary = m_summarizer->summarize(*document.getExtractedText(), m_config.summaryOptions());
        } catch (const domain::SummarizerError& e) {
            if (e.isTransient()) {
                std::cerr << "[DocumentProcessingService] " << id << " transient summarizer failure; retry later." << std::endl;
            }
            return finishFailed(document, StatusTrigger::SummarizationFailed, e.describe());
        }
        // A result that arrives after cancellation is discarded.
        if (cancellation.isCancelled()) {
            return finishFailed(document, StatusTrigger::Cancelled, cancelledPrefix + cancellation.reason());
        }

        document.complete(std::move(summary));
        m_repository->save(document);
    } catch (const domain::RepositoryUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        return finishFailed(document, StatusTrigger::Interrupted, std::string("internal/unexpected-error: ") + e.what());
    }

    std::cout << "[DocumentProcessingService] " << id << " -> Processed" << std::endl;
    ProcessingResult result;
    result.documentId = id;
    result.outcome = Outcome::Processed;
    result.status = document.getStatus();
    return result;
}

DocumentProcessingService::ProcessingResult DocumentProcessingService::finishFailed(
    Document& document, StatusTrigger trigger, const std::string& reason) {
    document.fail(trigger, reason);
    m_repository->save(document);

    std::cerr << "[DocumentProcessingService] " << document.getId() << " -> Failed: " << reason << std::endl;
    ProcessingResult result;
    result.documentId = document.getId();
    result.outcome = Outcome::Failed;
    result.status = document.getStatus();
    result.errorMessage = reason;
    return result;
}

DocumentProcessingService::ProcessingResult DocumentProcessingService::skipped(
    const Document& document, const std::string& note) const {
    std::cout << "[DocumentProcessingService] Skipping " << document.getId() << ": " << note << std::endl;
    ProcessingResult result;
    result.documentId = document.getId();
    result.outcome = Outcome::Skipped;
    result.status = document.getStatus();
    result.errorMessage = document.getErrorMessage();
    result.note = note;
    return result;
}

DocumentProcessingService::StatusView DocumentProcessingService::getStatus(const std::string& documentId) {
    Document document = m_repository->load(documentId);
    StatusView view;
    view.documentId = document.getId();
    view.fileName = document.getFileName();
    view.status = document.getStatus();
    view.summary = document.getSummary();
    view.errorMessage = document.getErrorMessage();
    view.hasExtractedText = document.getExtractedText().has_value();
    view.isDeleted = document.isDeleted();
    view.attempts = document.getAttempts();
    return view;
}

std::vector<Document> DocumentProcessingService::listActive() {
    return m_repository->listActive();
}

void DocumentProcessingService::softDelete(const std::string& documentId) {
    auto guard = m_locks.acquire(documentId);
    Document document = m_repository->load(documentId);
    if (document.isDeleted()) {
        return;
    }
    document.markDeleted();
    m_repository->save(document);
    std::cout << "[DocumentProcessingService] Deleted " << documentId << std::endl;
}

std::vector<DocumentProcessingService::ProcessingResult> DocumentProcessingService::processPending(
    const domain::CancellationToken& cancellation) {
    std::vector<ProcessingResult> results;
    for (const auto& document : m_repository->listActive()) {
        if (document.getStatus() != DocumentStatus::Pending) continue;
        if (cancellation.isCancelled()) break;
        results.push_back(processDocument(document.getId(), cancellation));
    }
    return results;
}

int DocumentProcessingService::recoverInterrupted() {
    int recovered = 0;
    for (const auto& listed : m_repository->listActive()) {
        if (listed.getStatus() != DocumentStatus::Processing) continue;

        auto guard = m_locks.tryAcquire(listed.getId());
        if (!guard) continue; // attempt in flight

        Document document = m_repository->load(listed.getId());
        if (document.getStatus() != DocumentStatus::Processing) continue;

        document.fail(StatusTrigger::Interrupted, "internal/interrupted: processing did not finish");
        m_repository->save(document);
        std::cerr << "[DocumentProcessingService] Recovered interrupted document " << document.getId() << std::endl;
        ++recovered;
    }
    return recovered;
}

} // namespace docudigest::application
