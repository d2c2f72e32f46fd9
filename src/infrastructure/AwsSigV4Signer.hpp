/**
 * @file AwsSigV4Signer.hpp
 * @brief AWS Signature Version 4 request signing for S3-compatible object stores.
 */

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace docudigest::infrastructure {

class AwsSigV4Signer {
public:
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    AwsSigV4Signer(std::string accessKey,
                   std::string secretKey,
                   std::string region,
                   std::string service = "s3",
                   std::string sessionToken = "");

    /**
     * @brief Computes the headers that authenticate one request.
     * @param method HTTP verb ("GET", "PUT", "HEAD").
     * @param host Host header value, including a non-default port.
     * @param canonicalUri Absolute, already URI-encoded path.
     * @param payload Request body (empty for GET/HEAD).
     * @param extraHeaders Further headers sent with the request (x-amz-meta-*). S3 rejects
     *        any x-amz-* header that is not signed, so they enter the signature too.
     * @param now Signing time.
     * @return Host, x-amz-date, x-amz-content-sha256, optional x-amz-security-token, the
     *         extra headers, Authorization.
     * @throws std::invalid_argument if an extra header repeats one the signer sets itself.
     */
    HeaderList sign(const std::string& method,
                    const std::string& host,
                    const std::string& canonicalUri,
                    const std::string& payload,
                    const HeaderList& extraHeaders = {},
                    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    static std::string Sha256Hex(const std::string& data);
    static std::string HmacSha256(const std::string& key, const std::string& data);
    static std::string ToHex(const std::string& bytes);

    /** @brief RFC 3986 encoding as S3 expects; '/' kept unless encodeSlash. */
    static std::string UriEncode(const std::string& value, bool encodeSlash);

private:
    std::string m_accessKey;
    std::string m_secretKey;
    std::string m_region;
    std::string m_service;
    std::string m_sessionToken;
};

} // namespace docudigest::infrastructure
