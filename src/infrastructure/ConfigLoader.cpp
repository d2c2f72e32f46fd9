/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace docudigest::infrastructure {

using json = nlohmann::json;
using domain::ConfigError;

namespace {

const json& Section(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.contains(key)) return empty;
    if (!j[key].is_object()) {
        throw ConfigError(std::string("'") + key + "' must be an object");
    }
    return j[key];
}

std::string ResolveEnv(const ConfigLoader::EnvLookup& env, const std::string& name) {
    if (name.empty()) return "";
    auto value = env(name);
    return value ? *value : "";
}

void RequirePositive(long long value, const std::string& key) {
    if (value <= 0) {
        throw ConfigError("'" + key + "' must be positive, got " + std::to_string(value));
    }
}

} // namespace

std::optional<std::string> ConfigLoader::SystemEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value && *value) return std::string(value);
    return std::nullopt;
}

PipelineConfig ConfigLoader::FromJson(const json& j, const EnvLookup& env) {
    if (!j.is_object()) {
        throw ConfigError("settings root must be a JSON object");
    }

    PipelineConfig config;
    try {
        // storage
        const json& storage = Section(j, "storage");
        std::string backend = storage.value("backend", "auto");
        if (backend == "auto") config.storage.backend = StorageBackendKind::Auto;
        else if (backend == "local") config.storage.backend = StorageBackendKind::Local;
        else if (backend == "s3") config.storage.backend = StorageBackendKind::S3;
        else throw ConfigError("storage.backend must be auto, local or s3, got '" + backend + "'");

        config.storage.localRoot = storage.value("local_root", "");
        if (config.storage.localRoot.empty()) {
            config.storage.localRoot = (PathUtils::GetAppDataDir() / "blobs").string();
        }

        const json& s3 = Section(storage, "s3");
        auto& s3Config = config.storage.s3;
        s3Config.bucket = s3.value("bucket", "");
        s3Config.region = s3.value("region", "us-east-1");
        s3Config.endpoint = s3.value("endpoint", "");
        try {
            S3ObjectStorage::ParseEndpoint(s3Config.endpoint, s3Config.region);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("storage.s3.endpoint: ") + e.what());
        }
        s3Config.prefix = s3.value("prefix", "");
        s3Config.pathStyle = s3.value("path_style", false);
        s3Config.timeoutSeconds = s3.value("timeout_seconds", 30);
        RequirePositive(s3Config.timeoutSeconds, "storage.s3.timeout_seconds");
        s3Config.accessKey = ResolveEnv(env, s3.value("access_key_env", "AWS_ACCESS_KEY_ID"));
        s3Config.secretKey = ResolveEnv(env, s3.value("secret_key_env", "AWS_SECRET_ACCESS_KEY"));
        s3Config.sessionToken = ResolveEnv(env, s3.value("session_token_env", "AWS_SESSION_TOKEN"));

        // summarizer
        const json& summarizer = Section(j, "summarizer");
        auto& client = config.summarizer.client;
        client.host = summarizer.value("host", "localhost");
        client.port = summarizer.value("port", 11434);
        if (client.port <= 0 || client.port > 65535) {
            throw ConfigError("summarizer.port out of range: " + std::to_string(client.port));
        }
        client.model = summarizer.value("model", "qwen2.5:7b");
        if (client.model.empty()) {
            throw ConfigError("summarizer.model cannot be empty");
        }
        long long maxInput = summarizer.value("max_input_chars", 12000LL);
        RequirePositive(maxInput, "summarizer.max_input_chars");
        client.maxInputChars = static_cast<std::size_t>(maxInput);
        client.bearerToken = ResolveEnv(env, summarizer.value("api_key_env", ""));

        config.summarizer.maxTokens = summarizer.value("max_tokens", 512);
        RequirePositive(config.summarizer.maxTokens, "summarizer.max_tokens");
        config.summarizer.timeoutSeconds = summarizer.value("timeout_seconds", 30);
        RequirePositive(config.summarizer.timeoutSeconds, "summarizer.timeout_seconds");

        // repository
        const json& repository = Section(j, "repository");
        std::string kind = repository.value("kind", "json");
        if (kind == "json") config.repository.kind = RepositoryKind::Json;
        else if (kind == "memory") config.repository.kind = RepositoryKind::Memory;
        else throw ConfigError("repository.kind must be json or memory, got '" + kind + "'");
        config.repository.root = repository.value("root", "");
        if (config.repository.root.empty() && config.repository.kind == RepositoryKind::Json) {
            config.repository.root = (PathUtils::GetAppDataDir() / "documents").string();
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid settings value: ") + e.what());
    }

    if (config.storage.backend == StorageBackendKind::S3) {
        if (config.storage.s3.bucket.empty()) {
            throw ConfigError("storage.backend is s3 but storage.s3.bucket is not set");
        }
        if (config.storage.s3.accessKey.empty() || config.storage.s3.secretKey.empty()) {
            throw ConfigError("storage.backend is s3 but object-store credentials are not available in the environment");
        }
    }
    return config;
}

PipelineConfig ConfigLoader::Load(const std::optional<std::string>& explicitPath) {
    std::filesystem::path configPath = explicitPath ? std::filesystem::path(*explicitPath)
                                                    : PathUtils::GetDefaultConfigPath();
    json j = json::object();

    if (std::filesystem::exists(configPath)) {
        std::ifstream f(configPath);
        if (!f.is_open()) {
            throw ConfigError("cannot open " + configPath.string());
        }
        try {
            f >> j;
        } catch (const json::exception& e) {
            throw ConfigError("error reading " + configPath.string() + ": " + e.what());
        }
        std::cout << "[ConfigLoader] Loaded " << configPath.string() << std::endl;
    } else if (explicitPath) {
        throw ConfigError("configuration file not found: " + configPath.string());
    } else {
        std::cout << "[ConfigLoader] No settings.json at " << configPath.string() << ", using defaults." << std::endl;
    }

    return FromJson(j, &ConfigLoader::SystemEnv);
}

StorageBackendKind ConfigLoader::ResolveBackend(const PipelineConfig& config) {
    if (config.storage.backend != StorageBackendKind::Auto) {
        return config.storage.backend;
    }
    const auto& s3 = config.storage.s3;
    if (!s3.bucket.empty() && !s3.accessKey.empty() && !s3.secretKey.empty()) {
        return StorageBackendKind::S3;
    }
    return StorageBackendKind::Local;
}

} // namespace docudigest::infrastructure
