#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/DocumentProcessingService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/InMemoryDocumentRepository.hpp"

using namespace docudigest;
using namespace docudigest::domain;
using application::DocumentProcessingService;
using Outcome = DocumentProcessingService::Outcome;

namespace {

class FakeStorage : public StorageBackend {
public:
    std::string name() const override { return "fake"; }

    std::string put(const std::vector<char>& bytes, const BlobMetadata& metadata) override {
        if (failPut) throw StorageError(StorageError::Kind::BackendUnavailable, "bucket offline");
        std::lock_guard<std::mutex> lock(m_mutex);
        m_blobs[metadata.documentId] = bytes;
        return locatorFor(metadata.documentId);
    }

    std::string locatorFor(const std::string& documentId) const override { return "fake:" + documentId; }

    std::vector<char> get(const std::string& locator) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_blobs.find(locator.substr(5));
        if (it == m_blobs.end()) throw StorageError(StorageError::Kind::NotFound, "no blob for " + locator);
        return it->second;
    }

    bool exists(const std::string& locator) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_blobs.count(locator.substr(5)) > 0;
    }

    void drop(const std::string& id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_blobs.erase(id);
    }

    std::atomic<bool> failPut{false};

private:
    std::mutex m_mutex;
    std::map<std::string, std::vector<char>> m_blobs;
};

// Records every saved status and checks the aggregate invariants on each write.
class RecordingRepository : public DocumentRepository {
public:
    Document load(const std::string& documentId) override {
        if (unavailable) throw RepositoryUnavailable("connection lost");
        return m_inner.load(documentId);
    }

    void save(const Document& document) override {
        if (unavailable) throw RepositoryUnavailable("connection lost");
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (failWhen && failWhen(document)) {
                throw RepositoryUnavailable("write rejected");
            }
            assert(document.invariantsHold());
            m_history[document.getId()].push_back(document.getStatus());
        }
        m_inner.save(document);
    }

    std::vector<Document> listActive() override {
        if (unavailable) throw RepositoryUnavailable("connection lost");
        return m_inner.listActive();
    }

    std::vector<DocumentStatus> history(const std::string& id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history[id];
    }

    int terminalWrites(const std::string& id) {
        int count = 0;
        for (auto status : history(id)) {
            if (IsTerminal(status)) ++count;
        }
        return count;
    }

    void setFailWhen(std::function<bool(const Document&)> predicate) {
        std::lock_guard<std::mutex> lock(m_mutex);
        failWhen = std::move(predicate);
    }

    std::atomic<bool> unavailable{false};

private:
    infrastructure::InMemoryDocumentRepository m_inner;
    std::mutex m_mutex;
    std::map<std::string, std::vector<DocumentStatus>> m_history;
    std::function<bool(const Document&)> failWhen;
};

class ScriptedSummarizer : public SummarizationService {
public:
    using Behavior = std::function<Summary(const std::string& text)>;

    Summary summarize(const std::string& text, const SummaryOptions& options) override {
        ++calls;
        lastOptions = options;
        Behavior behavior;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            behavior = m_behavior;
        }
        return behavior(text);
    }

    std::string getDefaultModel() const override { return "fake-model"; }

    void set(Behavior behavior) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_behavior = std::move(behavior);
    }

    std::atomic<int> calls{0};
    SummaryOptions lastOptions;

private:
    std::mutex m_mutex;
    Behavior m_behavior;
};

class ThrowingExtractor : public TextExtractor {
public:
    std::string extract(const std::vector<char>&, const std::string&) override {
        throw std::runtime_error("parser crashed");
    }
    bool supports(const std::string&) const override { return true; }
};

Summary ThreeSentences(const std::string&) {
    Summary summary;
    summary.text = "The report covers storage. It then covers summaries. It ends with a plan.";
    summary.modelId = "fake-model";
    summary.generatedAt = Clock::now();
    return summary;
}

ScriptedSummarizer::Behavior Failing(SummarizerError::Kind kind, const std::string& detail) {
    return [kind, detail](const std::string&) -> Summary { throw SummarizerError(kind, detail); };
}

std::vector<char> Bytes(const std::string& s) {
    return std::vector<char>(s.begin(), s.end());
}

const std::string kTwoPages =
    "Page one describes how uploaded documents are stored.\f"
    "Page two describes how the stored text is summarized.\n";

struct Fixture {
    std::shared_ptr<FakeStorage> storage = std::make_shared<FakeStorage>();
    std::shared_ptr<RecordingRepository> repository = std::make_shared<RecordingRepository>();
    std::shared_ptr<ScriptedSummarizer> summarizer = std::make_shared<ScriptedSummarizer>();
    std::unique_ptr<DocumentProcessingService> service;

    explicit Fixture(std::shared_ptr<TextExtractor> extractor = std::make_shared<infrastructure::ContentExtractor>(),
                     DocumentProcessingService::IdGenerator ids = DocumentProcessingService::IdGenerator()) {
        infrastructure::PipelineConfig config;
        config.summarizer.maxTokens = 200;
        config.summarizer.client.model = "fake-model";
        summarizer->set(ThreeSentences);
        service = std::make_unique<DocumentProcessingService>(config, storage, extractor, summarizer, repository,
                                                              std::move(ids));
    }
};

int CountSentences(const std::string& text) {
    int count = 0;
    for (char c : text) if (c == '.') ++count;
    return count;
}

void testTwoPageDocument() {
    std::cout << "[Test] Two-page document is summarized..." << std::endl;
    Fixture f;
    std::string id = f.service->submit(Bytes(kTwoPages), "two-pages.txt", "text/plain");
    assert(id.size() == 32);
    assert(f.service->getStatus(id).status == DocumentStatus::Pending);

    auto result = f.service->processDocument(id);
    assert(result.outcome == Outcome::Processed);
    assert(result.status == DocumentStatus::Processed);

    auto view = f.service->getStatus(id);
    assert(view.status == DocumentStatus::Processed);
    assert(view.summary && !view.summary->text.empty());
    assert(CountSentences(view.summary->text) == 3);
    assert(!view.errorMessage);
    assert(view.hasExtractedText);
    assert(view.attempts == 1);

    Document stored = f.repository->load(id);
    assert(*stored.getExtractedText() == kTwoPages);
    assert(f.summarizer->lastOptions.maxTokens == 200);
    assert(f.summarizer->lastOptions.modelId == "fake-model");

    auto history = f.repository->history(id);
    std::vector<DocumentStatus> expected = {
        DocumentStatus::Pending, DocumentStatus::Processing, DocumentStatus::Processing, DocumentStatus::Processed
    };
    assert(history == expected);
    std::cout << "[PASS] Two-page document is summarized." << std::endl;
}

void testUnsupportedFormat() {
    std::cout << "[Test] Unsupported format fails..." << std::endl;
    Fixture f;
    std::string id = f.service->submit(Bytes("\x7f" "ELF binary"), "tool.bin", "application/octet-stream");
    auto result = f.service->processDocument(id);
    assert(result.outcome == Outcome::Failed);

    auto view = f.service->getStatus(id);
    assert(view.status == DocumentStatus::Failed);
    assert(view.errorMessage);
    assert(view.errorMessage->find("unsupported format") != std::string::npos);
    assert(view.errorMessage->rfind("extraction/unsupported-format", 0) == 0);
    assert(!view.summary);
    assert(f.summarizer->calls == 0);

    // Missing content type is stored as octet-stream.
    std::string untyped = f.service->submit(Bytes("plain words"), "notes", "");
    assert(f.repository->load(untyped).getContentType() == "application/octet-stream");
    std::cout << "[PASS] Unsupported format fails." << std::endl;
}

void testSummarizerTimeoutThenRetry() {
    std::cout << "[Test] Summarizer timeout, then retry..." << std::endl;
    Fixture f;
    std::string id = f.service->submit(Bytes(kTwoPages), "report.txt", "text/plain");

    f.summarizer->set(Failing(SummarizerError::Kind::RemoteUnavailable, "request to host:11434 timed out after 30s"));
    auto failed = f.service->processDocument(id);
    assert(failed.outcome == Outcome::Failed);

    auto view = f.service->getStatus(id);
    assert(view.status == DocumentStatus::Failed);
    assert(view.errorMessage->find("remote-unavailable") != std::string::npos);
    assert(view.errorMessage->find("timed out") != std::string::npos);
    assert(view.hasExtractedText && "Extraction output is kept after a summarizer failure.");

    // Not Pending any more: a plain processing trigger leaves it alone.
    assert(f.service->processDocument(id).outcome == Outcome::Skipped);

    f.summarizer->set(ThreeSentences);
    auto retried = f.service->retry(id);
    assert(retried.outcome == Outcome::Processed);

    view = f.service->getStatus(id);
    assert(view.status == DocumentStatus::Processed);
    assert(!view.errorMessage);
    assert(view.attempts == 2);

    auto history = f.repository->history(id);
    std::vector<DocumentStatus> tail(history.end() - 4, history.end());
    std::vector<DocumentStatus> expected = {
        DocumentStatus::Failed, DocumentStatus::Processing, DocumentStatus::Processing, DocumentStatus::Processed
    };
    assert(tail == expected);
    std::cout << "[PASS] Summarizer timeout, then retry." << std::endl;
}

void testDistinguishableSummarizerFailures() {
    std::cout << "[Test] Summarizer failures are distinguishable..." << std::endl;
    Fixture f;
    const std::vector<std::pair<SummarizerError::Kind, std::string>> cases = {
        {SummarizerError::Kind::RateLimited, "summarization/rate-limited"},
        {SummarizerError::Kind::InvalidResponse, "summarization/invalid-response"},
        {SummarizerError::Kind::AuthError, "summarization/auth-error"},
    };
    for (const auto& c : cases) {
        std::string id = f.service->submit(Bytes(kTwoPages), "doc.txt", "text/plain");
        f.summarizer->set(Failing(c.first, "detail"));
        f.service->processDocument(id);
        auto view = f.service->getStatus(id);
        assert(view.status == DocumentStatus::Failed);
        assert(view.errorMessage->rfind(c.second, 0) == 0);
    }
    std::cout << "[PASS] Summarizer failures are distinguishable." << std::endl;
}

void testRetryFromProcessedStartsOver() {
    std::cout << "[Test] Retry of a Processed document..." << std::endl;
    Fixture f;
    std::string id = f.service->submit(Bytes(kTwoPages), "doc.txt", "text/plain");
    f.service->processDocument(id);

    f.summarizer->set([](const std::string& text) {
        Summary summary = ThreeSentences(text);
        summary.text = "Regenerated.";
        return summary;
    });
    assert(f.service->retry(id).outcome == Outcome::Processed);
    assert(f.service->getStatus(id).summary->text == "Regenerated.");
    assert(f.summarizer->calls == 2);

    // Retry of a Pending document is a first pick-up.
    std::string fresh = f.service->submit(Bytes(kTwoPages), "fresh.txt", "text/plain");
    assert(f.service->retry(fresh).outcome == Outcome::Processed);
    std::cout << "[PASS] Retry of a Processed document." << std::endl;
}

void testStorageFailures() {
    std::cout << "[Test] Storage failures..." << std::endl;
    Fixture f;
    std::string id = f.service->submit(Bytes(kTwoPages), "doc.txt", "text/plain");
    f.storage->drop(id);

    assert(f.service->processDocument(id).outcome == Outcome::Failed);
    auto view = f.service->getStatus(id);
    assert(view.errorMessage->rfind("storage/not-found", 0) == 0);
    assert(!view.hasExtractedText);

    f.storage->failPut = true;
    auto before = f.service->listActive().size();
    bool threw = false;
    try {
        f.service->submit(Bytes(kTwoPages), "doc.txt", "text/plain");
    } catch (const StorageError& e) {
        threw = e.kind() == StorageError::Kind::BackendUnavailable;
    }
    assert(threw);
    assert(f.service->listActive().size() == before && "No record without stored bytes.");
    std::cout << "[PASS] Storage failures." << std::endl;
}

// Hands out the scripted ids in order, then repeats the last one.
DocumentProcessingService::IdGenerator ScriptedIds(std::vector<std::string> ids) {
    auto next = std::make_shared<std::size_t>(0);
    return [ids, next]() {
        const std::string& id = ids[std::min(*next, ids.size() - 1)];
        ++*next;
        return id;
    };
}

void testSubmitNeverReusesAnId() {
    std::cout << "[Test] Submit never reuses an id..." << std::endl;
    Fixture f(std::make_shared<infrastructure::ContentExtractor>(),
              ScriptedIds({"id-one", "id-one", "id-two", "id-three", "id-three", "id-four", "id-one"}));

    std::string first = f.service->submit(Bytes("first document"), "first.txt", "text/plain");
    assert(first == "id-one");

    // Same candidate again: the second upload must not land on the first document.
    std::string second = f.service->submit(Bytes("second document"), "second.txt", "text/plain");
    assert(second == "id-two");
    assert(f.storage->get("fake:id-one") == Bytes("first document"));
    assert(f.repository->load("id-one").getFileName() == "first.txt");

    // Bytes left without a record also keep their id.
    f.storage->put(Bytes("orphaned bytes"), BlobMetadata{"id-three", "orphan.txt", "text/plain"});
    std::string third = f.service->submit(Bytes("third document"), "third.txt", "text/plain");
    assert(third == "id-four");
    assert(f.storage->get("fake:id-three") == Bytes("orphaned bytes"));

    // Only used ids left: submit gives up without writing anything.
    auto before = f.service->listActive().size();
    bool threw = false;
    try {
        f.service->submit(Bytes("fourth document"), "fourth.txt", "text/plain");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(f.service->listActive().size() == before);
    assert(f.storage->get("fake:id-one") == Bytes("first document"));

    // Default generator: 32 hex characters, distinct.
    Fixture g;
    std::string a = g.service->submit(Bytes("a"), "a.txt", "text/plain");
    std::string b = g.service->submit(Bytes("b"), "b.txt", "text/plain");
    assert(a.size() == 32 && b.size() == 32 && a != b);
    assert(a.find_first_not_of("0123456789abcdef") == std::string::npos);
    std::cout << "[PASS] Submit never reuses an id." << std::endl;
}

void testUnexpectedExtractorException() {
    std::cout << "[Test] Unexpected extractor exception..." << std::endl;
    Fixture f(std::make_shared<ThrowingExtractor>());
    std::string id = f.service->submit(Bytes(kTwoPages), "doc.txt", "text/plain");
    auto result = f.service->processDocument(id);
    assert(result.outcome == Outcome::Failed);
    assert(result.errorMessage->find("parser crashed") != std::string::npos);
    assert(f.service->getStatus(id).status == DocumentStatus::Failed);
    std::cout << "[PASS] Unexpected extractor exception." << std::endl;
}

void testRepositoryOutage() {
    std::cout << "[Test] Repository outage..." << std::endl;
    Fixture f;
    std::string id = f.service->submit(Bytes(kTwoPages), "doc.txt", "text/plain");

    f.repository->unavailable = true;
    bool threw = false;
    try { f.service->processDocument(id); } catch (const RepositoryUnavailable&) { threw = true; }
    assert(threw);
    f.repository->unavailable = false;
    assert(f.service->getStatus(id).status == DocumentStatus::Pending);
    assert(f.summarizer->calls == 0);

    // The outage hits the final write: the attempt aborts and nothing claims Processed.
    f.repository->setFailWhen([](const Document& d) { return d.getStatus() == DocumentStatus::Processed; });
    threw = false;
    try { f.service->processDocument(id); } catch (const RepositoryUnavailable&) { threw = true; }
    assert(threw);
    f.repository->setFailWhen(nullptr);

    auto view = f.service->getStatus(id);
    assert(view.status == DocumentStatus::Processing);
    assert(f.repository->terminalWrites(id) == 0);

    // Recovery gives the stuck record a path forward.
    assert(f.service->recoverInterrupted() == 1);
    view = f.service->getStatus(id);
    assert(view.status == DocumentStatus::Failed);
    assert(view.errorMessage->find("interrupted") != std::string::npos);
    assert(f.service->recoverInterrupted() == 0);

    assert(f.service->retry(id).outcome == Outcome::Processed);
    std::cout << "[PASS] Repository outage." << std::endl;
}

void testRetryOfStuckDocument() {
    std::cout << "[Test] Retry of a document stuck in Processing..." << std::endl;
    Fixture f;
    std::string id = f.service->submit(Bytes(kTwoPages), "doc.txt", "text/plain");
    f.repository->setFailWhen([](const Document& d) { return d.getStatus() == DocumentStatus::Processed; });
    try { f.service->processDocument(id); } catch (const RepositoryUnavailable&) {}
    f.repository->setFailWhen(nullptr);
    assert(f.service->getStatus(id).status == DocumentStatus::Processing);

    assert(f.service->retry(id).outcome == Outcome::Processed);
    auto history = f.repository->history(id);
    std::vector<DocumentStatus> tail(history.end() - 4, history.end());
    std::vector<DocumentStatus> expected = {
        DocumentStatus::Failed, DocumentStatus::Processing, DocumentStatus::Processing, DocumentStatus::Processed
    };
    assert(tail == expected);
    std::cout << "[PASS] Retry of a document stuck in Processing." << std::endl;
}

void testConcurrentTriggersSameDocument() {
    std::cout << "[Test] Concurrent triggers for one document..." << std::endl;
    Fixture f;
    std::string id = f.service->submit(Bytes(kTwoPages), "doc.txt", "text/plain");

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    f.summarizer->set([gate](const std::string& text) {
        gate.wait();
        return ThreeSentences(text);
    });

    const int kThreads = 8;
    std::vector<std::thread> threads;
    std::mutex outcomesMutex;
    std::vector<Outcome> outcomes;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            auto result = f.service->processDocument(id);
            std::lock_guard<std::mutex> lock(outcomesMutex);
            outcomes.push_back(result.outcome);
        });
    }

    // Let every thread reach the lock before the single attempt finishes.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    release.set_value();
    for (auto& t : threads) t.join();

    int processed = 0;
    int skipped = 0;
    for (auto outcome : outcomes) {
        if (outcome == Outcome::Processed) ++processed;
        if (outcome == Outcome::Skipped) ++skipped;
    }
    assert(processed == 1);
    assert(skipped == kThreads - 1);
    assert(f.summarizer->calls == 1);
    assert(f.repository->terminalWrites(id) == 1);
    std::cout << "[PASS] Concurrent triggers for one document." << std::endl;
}

void testCancellation() {
    std::cout << "[Test] Cancellation..." << std::endl;
    Fixture f;

    // Cancelled before the attempt starts: nothing changes.
    std::string early = f.service->submit(Bytes(kTwoPages), "early.txt", "text/plain");
    CancellationToken cancelled;
    cancelled.cancel("shutdown");
    auto result = f.service->processDocument(early, cancelled);
    assert(result.outcome == Outcome::Cancelled);
    assert(result.note == "shutdown");
    assert(f.service->getStatus(early).status == DocumentStatus::Pending);

    // Cancelled while the summarizer is working: the result is discarded and the document fails.
    std::string late = f.service->submit(Bytes(kTwoPages), "late.txt", "text/plain");
    CancellationToken token;
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    f.summarizer->set([&entered, gate](const std::string& text) {
        entered.set_value();
        gate.wait();
        return ThreeSentences(text);
    });

    auto pending = std::async(std::launch::async, [&] { return f.service->processDocument(late, token); });
    entered.get_future().wait();
    token.cancel("caller went away");
    release.set_value();
    result = pending.get();

    assert(result.outcome == Outcome::Failed);
    auto view = f.service->getStatus(late);
    assert(view.status == DocumentStatus::Failed);
    assert(view.errorMessage->find("caller went away") != std::string::npos);
    assert(view.hasExtractedText);
    assert(!view.summary);
    std::cout << "[PASS] Cancellation." << std::endl;
}

void testRecoverySkipsInFlightAttempts() {
    std::cout << "[Test] Recovery leaves in-flight attempts alone..." << std::endl;
    Fixture f;
    std::string id = f.service->submit(Bytes(kTwoPages), "doc.txt", "text/plain");

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    f.summarizer->set([&entered, gate](const std::string& text) {
        entered.set_value();
        gate.wait();
        return ThreeSentences(text);
    });

    auto pending = std::async(std::launch::async, [&] { return f.service->processDocument(id); });
    entered.get_future().wait();
    assert(f.service->getStatus(id).status == DocumentStatus::Processing);
    assert(f.service->recoverInterrupted() == 0);

    release.set_value();
    assert(pending.get().outcome == Outcome::Processed);
    assert(f.repository->terminalWrites(id) == 1);
    std::cout << "[PASS] Recovery leaves in-flight attempts alone." << std::endl;
}

void testSoftDeleteAndProcessPending() {
    std::cout << "[Test] Soft delete and batch processing..." << std::endl;
    Fixture f;
    std::string a = f.service->submit(Bytes(kTwoPages), "a.txt", "text/plain");
    std::string b = f.service->submit(Bytes(kTwoPages), "b.txt", "text/plain");
    std::string c = f.service->submit(Bytes("binary"), "c.bin", "application/octet-stream");
    std::string gone = f.service->submit(Bytes(kTwoPages), "gone.txt", "text/plain");

    f.service->softDelete(gone);
    f.service->softDelete(gone);
    auto active = f.service->listActive();
    assert(active.size() == 3);
    for (const auto& doc : active) assert(doc.getId() != gone);

    assert(f.service->processDocument(gone).outcome == Outcome::Skipped);
    assert(f.service->getStatus(gone).isDeleted);
    assert(f.service->getStatus(gone).status == DocumentStatus::Pending);

    f.service->processDocument(a);
    auto results = f.service->processPending();
    assert(results.size() == 2); // b and c
    assert(f.service->getStatus(b).status == DocumentStatus::Processed);
    assert(f.service->getStatus(c).status == DocumentStatus::Failed);
    assert(f.service->getStatus(gone).status == DocumentStatus::Pending);

    bool threw = false;
    try { f.service->getStatus("0123456789abcdef0123456789abcdef"); } catch (const DocumentNotFoundError&) { threw = true; }
    assert(threw);
    threw = false;
    try { f.service->processDocument("missing"); } catch (const DocumentNotFoundError&) { threw = true; }
    assert(threw);
    std::cout << "[PASS] Soft delete and batch processing." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DocumentProcessingService Test..." << std::endl;
    testTwoPageDocument();
    testUnsupportedFormat();
    testSummarizerTimeoutThenRetry();
    testDistinguishableSummarizerFailures();
    testRetryFromProcessedStartsOver();
    testStorageFailures();
    testSubmitNeverReusesAnId();
    testUnexpectedExtractorException();
    testRepositoryOutage();
    testRetryOfStuckDocument();
    testConcurrentTriggersSameDocument();
    testCancellation();
    testRecoverySkipsInFlightAttempts();
    testSoftDeleteAndProcessPending();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
