/**
 * @file DocuDigestApp.hpp
 * @brief Main application class for DocuDigest.
 */

#pragma once

#include "app/CommandLine.hpp"
#include "application/AppServices.hpp"
#include "infrastructure/PipelineConfig.hpp"

namespace docudigest::app {

/**
 * @class DocuDigestApp
 * @brief Wires configuration into services and executes one command.
 */
class DocuDigestApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailed = 1;
    static constexpr int kExitUnavailable = 2;

    /**
     * @brief Runs one parsed command.
     * @return Process exit code.
     */
    int Run(const CommandLine& commandLine);

    /**
     * @brief Builds storage, extractor, summarizer, repository and orchestrator from config.
     * @throws domain::ConfigError, domain::RepositoryUnavailable.
     */
    static application::AppServices BuildServices(const infrastructure::PipelineConfig& config);

private:
    int submit(const CommandLine& commandLine);
    int process(const std::string& documentId);
    int processPending(bool parallel);
    int retry(const std::string& documentId);
    int status(const std::string& documentId);
    int list();
    int remove(const std::string& documentId);
    int recover();

    int report(const application::DocumentProcessingService::ProcessingResult& result) const;

    application::AppServices m_services;
};

} // namespace docudigest::app
