/**
 * @file S3ObjectStorage.cpp
 * @brief Implementation of the S3ObjectStorage class.
 */
#include "infrastructure/S3ObjectStorage.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <iostream>
#include <stdexcept>

namespace docudigest::infrastructure {

using domain::StorageError;

namespace {

std::string ErrorDetail(const httplib::Result& res) {
    if (!res) {
        return "connection failed (httplib error " + std::to_string(static_cast<int>(res.error())) + ")";
    }
    std::string detail = "HTTP " + std::to_string(res->status);
    if (!res->body.empty()) {
        detail += ": " + res->body.substr(0, 200);
    }
    return detail;
}

} // namespace

S3ObjectStorage::Endpoint S3ObjectStorage::ParseEndpoint(const std::string& endpoint, const std::string& region) {
    Endpoint parsed;
    std::string rest = endpoint.empty() ? "https://s3." + region + ".amazonaws.com" : endpoint;

    auto schemeEnd = rest.find("://");
    parsed.scheme = schemeEnd == std::string::npos ? "https" : rest.substr(0, schemeEnd);
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("unsupported scheme '" + parsed.scheme + "' in endpoint " + endpoint);
    }
    if (schemeEnd != std::string::npos) rest = rest.substr(schemeEnd + 3);
    while (!rest.empty() && rest.back() == '/') rest.pop_back();
    if (rest.find('/') != std::string::npos) {
        throw std::invalid_argument("endpoint cannot carry a path: " + endpoint);
    }

    auto colon = rest.rfind(':');
    parsed.host = colon == std::string::npos ? rest : rest.substr(0, colon);
    if (parsed.host.empty()) {
        throw std::invalid_argument("endpoint has no host: " + endpoint);
    }
    if (colon == std::string::npos) {
        parsed.port = parsed.scheme == "http" ? 80 : 443;
        return parsed;
    }

    const std::string port = rest.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos ||
        std::stoi(port) < 1 || std::stoi(port) > 65535) {
        throw std::invalid_argument("invalid port '" + port + "' in endpoint " + endpoint);
    }
    parsed.port = std::stoi(port);
    parsed.explicitPort = true;
    return parsed;
}

S3ObjectStorage::S3ObjectStorage(Config config)
    : m_config(std::move(config)),
      m_signer(m_config.accessKey, m_config.secretKey, m_config.region, "s3", m_config.sessionToken),
      m_endpoint(ParseEndpoint(m_config.endpoint, m_config.region)) {
    if (m_config.bucket.empty()) {
        throw std::invalid_argument("S3ObjectStorage: bucket cannot be empty.");
    }

    std::cout << "[S3ObjectStorage] Bucket " << m_config.bucket << " at " << m_endpoint.scheme << "://" << m_endpoint.host
              << (m_endpoint.explicitPort ? ":" + std::to_string(m_endpoint.port) : "")
              << (m_config.pathStyle ? " (path-style)" : "") << std::endl;
}

std::string S3ObjectStorage::keyFor(const std::string& documentId) const {
    return m_config.prefix + "documents/" + documentId;
}

std::string S3ObjectStorage::locatorFor(const std::string& documentId) const {
    return kLocatorScheme + keyFor(documentId);
}

S3ObjectStorage::Target S3ObjectStorage::targetFor(const std::string& key) const {
    Target target;
    std::string host = m_config.pathStyle ? m_endpoint.host : m_config.bucket + "." + m_endpoint.host;
    std::string port = m_endpoint.explicitPort ? ":" + std::to_string(m_endpoint.port) : "";

    target.baseUrl = m_endpoint.scheme + "://" + host + port;
    target.hostHeader = host + port;
    target.path = m_config.pathStyle
        ? "/" + AwsSigV4Signer::UriEncode(m_config.bucket, true) + "/" + AwsSigV4Signer::UriEncode(key, false)
        : "/" + AwsSigV4Signer::UriEncode(key, false);
    return target;
}

std::string S3ObjectStorage::keyFromLocator(const std::string& locator) const {
    const std::string scheme = kLocatorScheme;
    if (locator.rfind(scheme, 0) != 0 || locator.size() == scheme.size()) {
        throw StorageError(StorageError::Kind::NotFound, "not an object-store locator: " + locator);
    }
    return locator.substr(scheme.size());
}

std::string S3ObjectStorage::put(const std::vector<char>& bytes, const domain::BlobMetadata& metadata) {
    if (metadata.documentId.empty()) {
        throw std::invalid_argument("S3ObjectStorage: document id cannot be empty.");
    }

    const std::string key = keyFor(metadata.documentId);
    const std::string body(bytes.begin(), bytes.end());
    Target target = targetFor(key);

    const AwsSigV4Signer::HeaderList userMetadata = {
        {"x-amz-meta-document-id", metadata.documentId},
        {"x-amz-meta-file-name", AwsSigV4Signer::UriEncode(metadata.fileName, true)}
    };
    httplib::Headers headers;
    for (const auto& header : m_signer.sign("PUT", target.hostHeader, target.path, body, userMetadata)) {
        headers.emplace(header.first, header.second);
    }

    httplib::Client cli(target.baseUrl);
    cli.set_connection_timeout(m_config.timeoutSeconds, 0);
    cli.set_read_timeout(m_config.timeoutSeconds, 0);
    cli.set_write_timeout(m_config.timeoutSeconds, 0);

    const std::string contentType = metadata.contentType.empty() ? "application/octet-stream" : metadata.contentType;
    auto res = cli.Put(target.path, headers, body, contentType);
    if (!res || res->status < 200 || res->status >= 300) {
        std::string detail = ErrorDetail(res);
        std::cerr << "[S3ObjectStorage] PUT " << key << " failed: " << detail << std::endl;
        throw StorageError(StorageError::Kind::BackendUnavailable, "PUT " + key + " failed: " + detail);
    }
    return locatorFor(metadata.documentId);
}

std::vector<char> S3ObjectStorage::get(const std::string& locator) {
    const std::string key = keyFromLocator(locator);
    Target target = targetFor(key);

    httplib::Headers headers;
    for (const auto& header : m_signer.sign("GET", target.hostHeader, target.path, "")) {
        headers.emplace(header.first, header.second);
    }

    httplib::Client cli(target.baseUrl);
    cli.set_connection_timeout(m_config.timeoutSeconds, 0);
    cli.set_read_timeout(m_config.timeoutSeconds, 0);

    auto res = cli.Get(target.path, headers);
    if (res && res->status == 404) {
        throw StorageError(StorageError::Kind::NotFound, "no object " + key);
    }
    if (!res || res->status != 200) {
        std::string detail = ErrorDetail(res);
        std::cerr << "[S3ObjectStorage] GET " << key << " failed: " << detail << std::endl;
        throw StorageError(StorageError::Kind::BackendUnavailable, "GET " + key + " failed: " + detail);
    }
    return std::vector<char>(res->body.begin(), res->body.end());
}

bool S3ObjectStorage::exists(const std::string& locator) {
    std::string key;
    try {
        key = keyFromLocator(locator);
    } catch (const StorageError&) {
        return false;
    }
    Target target = targetFor(key);

    httplib::Headers headers;
    for (const auto& header : m_signer.sign("HEAD", target.hostHeader, target.path, "")) {
        headers.emplace(header.first, header.second);
    }

    httplib::Client cli(target.baseUrl);
    cli.set_connection_timeout(m_config.timeoutSeconds, 0);
    cli.set_read_timeout(m_config.timeoutSeconds, 0);

    auto res = cli.Head(target.path, headers);
    if (res && res->status == 200) return true;
    if (res && res->status == 404) return false;

    std::string detail = ErrorDetail(res);
    std::cerr << "[S3ObjectStorage] HEAD " << key << " failed: " << detail << std::endl;
    throw StorageError(StorageError::Kind::BackendUnavailable, "HEAD " + key + " failed: " + detail);
}

} // namespace docudigest::infrastructure
