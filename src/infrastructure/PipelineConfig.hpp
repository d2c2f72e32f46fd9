/**
 * @file PipelineConfig.hpp
 * @brief Immutable process-wide configuration, built once at startup.
 */

#pragma once

#include <chrono>
#include <string>

#include "domain/Summary.hpp"
#include "infrastructure/OllamaSummarizer.hpp"
#include "infrastructure/S3ObjectStorage.hpp"

namespace docudigest::infrastructure {

enum class StorageBackendKind { Auto, Local, S3 };
enum class RepositoryKind { Json, Memory };

struct StorageSettings {
    StorageBackendKind backend = StorageBackendKind::Auto;
    std::string localRoot;               ///< Blob directory of the local backend.
    S3ObjectStorage::Config s3;          ///< Credentials already resolved from the environment.
};

struct SummarizerSettings {
    OllamaSummarizer::Config client;
    int maxTokens = 512;
    int timeoutSeconds = 30;
};

struct RepositorySettings {
    RepositoryKind kind = RepositoryKind::Json;
    std::string root;                    ///< Record directory of the JSON repository.
};

struct PipelineConfig {
    StorageSettings storage;
    SummarizerSettings summarizer;
    RepositorySettings repository;

    /** @brief Options passed to every summarize() call. */
    domain::SummaryOptions summaryOptions() const {
        domain::SummaryOptions options;
        options.maxTokens = summarizer.maxTokens;
        options.modelId = summarizer.client.model;
        options.timeout = std::chrono::seconds(summarizer.timeoutSeconds);
        return options;
    }
};

inline std::string StorageBackendKindToString(StorageBackendKind kind) {
    switch (kind) {
        case StorageBackendKind::Auto: return "auto";
        case StorageBackendKind::Local: return "local";
        case StorageBackendKind::S3: return "s3";
        default: return "unknown";
    }
}

} // namespace docudigest::infrastructure
