/**
 * @file AwsSigV4Signer.cpp
 * @brief Implementation of AwsSigV4Signer.
 */

#include "infrastructure/AwsSigV4Signer.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <ctime>
#include <map>
#include <stdexcept>

namespace docudigest::infrastructure {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::string FormatUtc(std::chrono::system_clock::time_point tp, const char* format) {
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(tp));
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), format, &tm);
    return buffer;
}

std::string ToLower(std::string value) {
    for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return value;
}

// Canonical header values have leading and trailing spaces removed.
std::string TrimSpaces(const std::string& value) {
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

} // namespace

AwsSigV4Signer::AwsSigV4Signer(std::string accessKey,
                               std::string secretKey,
                               std::string region,
                               std::string service,
                               std::string sessionToken)
    : m_accessKey(std::move(accessKey)),
      m_secretKey(std::move(secretKey)),
      m_region(std::move(region)),
      m_service(std::move(service)),
      m_sessionToken(std::move(sessionToken)) {}

std::string AwsSigV4Signer::ToHex(const std::string& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0F]);
    }
    return out;
}

std::string AwsSigV4Signer::Sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return ToHex(std::string(reinterpret_cast<const char*>(digest), length));
}

std::string AwsSigV4Signer::HmacSha256(const std::string& key, const std::string& data) {
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              result, &length)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(result), length);
}

std::string AwsSigV4Signer::UriEncode(const std::string& value, bool encodeSlash) {
    static const char digits[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encodeSlash)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0F]);
        }
    }
    return out;
}

AwsSigV4Signer::HeaderList AwsSigV4Signer::sign(const std::string& method,
                                                const std::string& host,
                                                const std::string& canonicalUri,
                                                const std::string& payload,
                                                const HeaderList& extraHeaders,
                                                std::chrono::system_clock::time_point now) const {
    const std::string amzDate = FormatUtc(now, "%Y%m%dT%H%M%SZ");
    const std::string dateStamp = amzDate.substr(0, 8);
    const std::string payloadHash = Sha256Hex(payload);

    // Canonical headers must be sorted by lowercase name.
    std::map<std::string, std::string> canonical = {
        {"host", host},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", amzDate}
    };
    if (!m_sessionToken.empty()) {
        canonical["x-amz-security-token"] = m_sessionToken;
    }
    for (const auto& header : extraHeaders) {
        const std::string name = ToLower(header.first);
        if (!canonical.emplace(name, TrimSpaces(header.second)).second) {
            throw std::invalid_argument("AwsSigV4Signer: header '" + name + "' is set twice");
        }
    }

    std::string canonicalHeaders;
    std::string signedHeaders;
    for (const auto& entry : canonical) {
        canonicalHeaders += entry.first + ":" + entry.second + "\n";
        if (!signedHeaders.empty()) signedHeaders += ";";
        signedHeaders += entry.first;
    }

    const std::string canonicalRequest = method + "\n" +
                                         canonicalUri + "\n" +
                                         "\n" + // no query string
                                         canonicalHeaders + "\n" +
                                         signedHeaders + "\n" +
                                         payloadHash;

    const std::string scope = dateStamp + "/" + m_region + "/" + m_service + "/aws4_request";
    const std::string stringToSign = "AWS4-HMAC-SHA256\n" + amzDate + "\n" + scope + "\n" + Sha256Hex(canonicalRequest);

    std::string signingKey = HmacSha256("AWS4" + m_secretKey, dateStamp);
    signingKey = HmacSha256(signingKey, m_region);
    signingKey = HmacSha256(signingKey, m_service);
    signingKey = HmacSha256(signingKey, "aws4_request");
    const std::string signature = ToHex(HmacSha256(signingKey, stringToSign));

    HeaderList headers = {
        {"Host", host},
        {"x-amz-date", amzDate},
        {"x-amz-content-sha256", payloadHash}
    };
    if (!m_sessionToken.empty()) {
        headers.emplace_back("x-amz-security-token", m_sessionToken);
    }
    headers.insert(headers.end(), extraHeaders.begin(), extraHeaders.end());
    headers.emplace_back("Authorization",
                         "AWS4-HMAC-SHA256 Credential=" + m_accessKey + "/" + scope +
                             ", SignedHeaders=" + signedHeaders +
                             ", Signature=" + signature);
    return headers;
}

} // namespace docudigest::infrastructure
