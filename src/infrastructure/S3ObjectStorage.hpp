/**
 * @file S3ObjectStorage.hpp
 * @brief S3-compatible object storage implementation of the StorageBackend.
 */

#pragma once
#include "domain/StorageBackend.hpp"
#include "infrastructure/AwsSigV4Signer.hpp"
#include <string>

namespace docudigest::infrastructure {

/**
 * @class S3ObjectStorage
 * @brief Stores documents as objects "<prefix>documents/<id>" over the S3 REST API.
 *
 * Works against AWS S3 and MinIO-style endpoints. Locators have the form "s3:<key>".
 */
class S3ObjectStorage : public domain::StorageBackend {
public:
    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;          ///< Empty for AWS, "http://host:port" for MinIO and friends.
        std::string prefix;            ///< Key prefix, e.g. "tenant-a/".
        bool pathStyle = false;        ///< Bucket in the path instead of the host name.
        std::string accessKey;
        std::string secretKey;
        std::string sessionToken;      ///< STS temporary credentials.
        int timeoutSeconds = 30;
    };

    /** @brief Parsed form of Config::endpoint. */
    struct Endpoint {
        std::string scheme;            ///< "http" or "https".
        std::string host;
        int port = 443;
        bool explicitPort = false;
    };

    /** @throws std::invalid_argument if the bucket is empty or the endpoint cannot be parsed. */
    explicit S3ObjectStorage(Config config);

    /**
     * @brief Splits "scheme://host[:port]" into its parts. An empty endpoint means the
     * regional AWS endpoint; a missing scheme means https.
     * @throws std::invalid_argument on an unknown scheme, an empty host, a path or an
     *         invalid port (not 1-65535).
     */
    static Endpoint ParseEndpoint(const std::string& endpoint, const std::string& region);

    std::string name() const override { return "s3"; }

    /** @see domain::StorageBackend::put */
    std::string put(const std::vector<char>& bytes, const domain::BlobMetadata& metadata) override;

    /** @see domain::StorageBackend::get */
    std::vector<char> get(const std::string& locator) override;

    /** @see domain::StorageBackend::exists */
    bool exists(const std::string& locator) override;

    /** @see domain::StorageBackend::locatorFor */
    std::string locatorFor(const std::string& documentId) const override;

    /** @brief Object key used for a document. */
    std::string keyFor(const std::string& documentId) const;

    static constexpr const char* kLocatorScheme = "s3:";

private:
    struct Target {
        std::string baseUrl;   ///< scheme://host[:port] for httplib::Client.
        std::string hostHeader;
        std::string path;      ///< Encoded absolute path.
    };

    Target targetFor(const std::string& key) const;
    std::string keyFromLocator(const std::string& locator) const;

    Config m_config;
    AwsSigV4Signer m_signer;
    Endpoint m_endpoint;
};

} // namespace docudigest::infrastructure
