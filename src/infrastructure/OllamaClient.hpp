/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace docudigest::infrastructure {

class OllamaClient {
public:
    /**
     * @brief Raw outcome of one HTTP exchange.
     * status is empty when no HTTP response arrived (refused, reset, timed out).
     */
    struct Response {
        std::optional<int> status;
        std::string body;
        std::string transportError;
        std::chrono::milliseconds elapsed{0};
        bool deadlineExceeded = false;   ///< The whole exchange ran past its timeout.
    };

    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param bearerToken Sent as "Authorization: Bearer" when non-empty (gateways in front of Ollama).
     */
    OllamaClient(const std::string& host = "localhost", int port = 11434, const std::string& bearerToken = "");

    /**
     * @brief Sends a POST request to /api/generate.
     * @param timeout Deadline for the whole exchange, not only for each socket read.
     */
    Response generate(const nlohmann::json& request, std::chrono::milliseconds timeout);

    /** @brief Fetches available models from /api/tags. Empty on any failure. */
    std::vector<std::string> getAvailableModels();

    const std::string& getHost() const { return m_host; }
    int getPort() const { return m_port; }

private:
    std::string m_host;
    int m_port;
    std::string m_bearerToken;
};

} // namespace docudigest::infrastructure
