/**
 * @file DocuDigestApp.cpp
 * @brief Implementation of the DocuDigestApp class.
 */

#include "app/DocuDigestApp.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/InMemoryDocumentRepository.hpp"
#include "infrastructure/JsonDocumentRepository.hpp"
#include "infrastructure/LocalFileStorage.hpp"
#include "infrastructure/OllamaSummarizer.hpp"
#include "infrastructure/S3ObjectStorage.hpp"

namespace docudigest::app {

using application::DocumentProcessingService;
using Outcome = DocumentProcessingService::Outcome;

namespace {

std::string FormatTime(domain::Clock::time_point tp) {
    std::time_t t = domain::Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace

application::AppServices DocuDigestApp::BuildServices(const infrastructure::PipelineConfig& config) {
    application::AppServices services;
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    services.taskManager = std::make_shared<application::AsyncTaskManager>();

    auto backend = infrastructure::ConfigLoader::ResolveBackend(config);
    if (backend == infrastructure::StorageBackendKind::S3) {
        services.storage = std::make_shared<infrastructure::S3ObjectStorage>(config.storage.s3);
    } else {
        services.storage = std::make_shared<infrastructure::LocalFileStorage>(config.storage.localRoot,
                                                                             services.persistenceService);
    }
    std::cout << "[DocuDigestApp] Storage backend: " << services.storage->name() << std::endl;

    if (config.repository.kind == infrastructure::RepositoryKind::Memory) {
        services.repository = std::make_shared<infrastructure::InMemoryDocumentRepository>();
        std::cout << "[DocuDigestApp] Repository: in-memory (records are lost on exit)" << std::endl;
    } else {
        services.repository = std::make_shared<infrastructure::JsonDocumentRepository>(config.repository.root,
                                                                                      services.persistenceService);
        std::cout << "[DocuDigestApp] Repository: " << config.repository.root << std::endl;
    }

    auto extractor = std::make_shared<infrastructure::ContentExtractor>();
    services.summarizer = std::make_shared<infrastructure::OllamaSummarizer>(config.summarizer.client);

    services.processingService = std::make_unique<DocumentProcessingService>(
        config, services.storage, extractor, services.summarizer, services.repository);
    return services;
}

int DocuDigestApp::Run(const CommandLine& commandLine) {
    if (commandLine.command == Command::Help) {
        std::cout << CommandLine::Usage();
        return kExitOk;
    }

    try {
        auto config = infrastructure::ConfigLoader::Load(commandLine.configPath);
        m_services = BuildServices(config);

        bool processes = commandLine.command == Command::Process ||
                         commandLine.command == Command::ProcessPending ||
                         commandLine.command == Command::Retry ||
                         (commandLine.command == Command::Submit && commandLine.processAfterSubmit);
        if (processes && !m_services.summarizer->checkModelAvailable()) {
            // Attempts still run; they will fail with a specific summarizer error.
            std::cerr << "[DocuDigestApp] Summarization model is not ready." << std::endl;
        }

        switch (commandLine.command) {
            case Command::Submit: return submit(commandLine);
            case Command::Process: return process(commandLine.argument);
            case Command::ProcessPending: return processPending(commandLine.parallel);
            case Command::Retry: return retry(commandLine.argument);
            case Command::Status: return status(commandLine.argument);
            case Command::List: return list();
            case Command::Delete: return remove(commandLine.argument);
            case Command::Recover: return recover();
            case Command::Help: break;
        }
        return kExitOk;
    } catch (const domain::ConfigError& e) {
        std::cerr << "[DocuDigestApp] Configuration error: " << e.what() << std::endl;
        return kExitUnavailable;
    } catch (const domain::RepositoryUnavailable& e) {
        std::cerr << "[DocuDigestApp] " << e.what() << std::endl;
        return kExitUnavailable;
    } catch (const domain::DocumentNotFoundError& e) {
        std::cerr << "[DocuDigestApp] " << e.what() << std::endl;
        return kExitFailed;
    } catch (const domain::StorageError& e) {
        std::cerr << "[DocuDigestApp] " << e.describe() << std::endl;
        return kExitFailed;
    } catch (const std::exception& e) {
        std::cerr << "[DocuDigestApp] Unexpected error: " << e.what() << std::endl;
        return kExitFailed;
    }
}

int DocuDigestApp::submit(const CommandLine& commandLine) {
    const std::string& path = commandLine.argument;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[DocuDigestApp] Cannot open " << path << std::endl;
        return kExitFailed;
    }
    std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::string contentType = commandLine.contentType ? *commandLine.contentType
                                                      : CommandLine::GuessContentType(path);
    std::string fileName = std::filesystem::path(path).filename().string();

    std::string id = m_services.processingService->submit(bytes, fileName, contentType);
    std::cout << id << std::endl;

    if (commandLine.processAfterSubmit) {
        return process(id);
    }
    return kExitOk;
}

int DocuDigestApp::process(const std::string& documentId) {
    return report(m_services.processingService->processDocument(documentId));
}

int DocuDigestApp::processPending(bool parallel) {
    auto& service = *m_services.processingService;
    if (!parallel) {
        int exitCode = kExitOk;
        for (const auto& result : service.processPending()) {
            if (report(result) != kExitOk) exitCode = kExitFailed;
        }
        return exitCode;
    }

    std::mutex resultsMutex;
    std::vector<DocumentProcessingService::ProcessingResult> results;
    std::vector<std::shared_ptr<application::TaskStatus>> tasks;

    for (const auto& document : service.listActive()) {
        if (document.getStatus() != domain::DocumentStatus::Pending) continue;
        tasks.push_back(m_services.taskManager->SubmitTask(
            "process " + document.getId(),
            [&service, &resultsMutex, &results](std::shared_ptr<application::TaskStatus>, std::string id) {
                auto result = service.processDocument(id);
                std::lock_guard<std::mutex> lock(resultsMutex);
                results.push_back(std::move(result));
            },
            document.getId()));
    }
    m_services.taskManager->WaitAll();

    int exitCode = kExitOk;
    for (const auto& task : tasks) {
        if (task->failed) {
            std::cerr << "[DocuDigestApp] " << task->description << ": " << task->errorMessage << std::endl;
            exitCode = kExitUnavailable;
        }
    }
    for (const auto& result : results) {
        if (report(result) != kExitOk && exitCode == kExitOk) exitCode = kExitFailed;
    }
    return exitCode;
}

int DocuDigestApp::retry(const std::string& documentId) {
    return report(m_services.processingService->retry(documentId));
}

int DocuDigestApp::status(const std::string& documentId) {
    auto view = m_services.processingService->getStatus(documentId);

    nlohmann::json j;
    j["id"] = view.documentId;
    j["file_name"] = view.fileName;
    j["status"] = domain::StatusToString(view.status);
    j["attempts"] = view.attempts;
    j["deleted"] = view.isDeleted;
    j["has_extracted_text"] = view.hasExtractedText;
    if (view.summary) {
        j["summary"] = {
            {"text", view.summary->text},
            {"model", view.summary->modelId},
            {"truncated", view.summary->truncated},
            {"input_characters", view.summary->inputCharacters},
            {"original_characters", view.summary->originalCharacters},
            {"generated_at", FormatTime(view.summary->generatedAt)}
        };
    }
    if (view.errorMessage) {
        j["error"] = *view.errorMessage;
    }
    std::cout << j.dump(2) << std::endl;
    return view.status == domain::DocumentStatus::Failed ? kExitFailed : kExitOk;
}

int DocuDigestApp::list() {
    for (const auto& document : m_services.processingService->listActive()) {
        std::cout << document.getId() << "  "
                  << std::left << std::setw(10) << domain::StatusToString(document.getStatus()) << "  "
                  << FormatTime(document.getUpdatedAt()) << "  "
                  << document.getFileName() << std::endl;
    }
    return kExitOk;
}

int DocuDigestApp::remove(const std::string& documentId) {
    m_services.processingService->softDelete(documentId);
    return kExitOk;
}

int DocuDigestApp::recover() {
    int recovered = m_services.processingService->recoverInterrupted();
    std::cout << "[DocuDigestApp] Recovered " << recovered << " interrupted document(s)." << std::endl;
    return kExitOk;
}

int DocuDigestApp::report(const DocumentProcessingService::ProcessingResult& result) const {
    std::cout << result.documentId << ": " << DocumentProcessingService::OutcomeToString(result.outcome)
              << " (" << domain::StatusToString(result.status) << ")";
    if (!result.note.empty()) std::cout << " - " << result.note;
    std::cout << std::endl;
    if (result.outcome == Outcome::Failed && result.errorMessage) {
        std::cerr << "  " << *result.errorMessage << std::endl;
    }
    return result.outcome == Outcome::Failed ? kExitFailed : kExitOk;
}

} // namespace docudigest::app
