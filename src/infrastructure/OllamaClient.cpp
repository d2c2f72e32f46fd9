#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace docudigest::infrastructure {

using json = nlohmann::json;

OllamaClient::OllamaClient(const std::string& host, int port, const std::string& bearerToken)
    : m_host(host), m_port(port), m_bearerToken(bearerToken) {}

OllamaClient::Response OllamaClient::generate(const json& request, std::chrono::milliseconds timeout) {
    httplib::Client cli(m_host, m_port);
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout - seconds);
    cli.set_connection_timeout(seconds.count(), micros.count());
    cli.set_read_timeout(seconds.count(), micros.count());
    cli.set_write_timeout(seconds.count(), micros.count());
    if (!m_bearerToken.empty()) {
        cli.set_bearer_token_auth(m_bearerToken);
    }

    Response response;
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;

    httplib::Request req;
    req.method = "POST";
    req.path = "/api/generate";
    req.body = request.dump();
    req.set_header("Content-Type", "application/json");
    // Socket timeouts bound each read; a server trickling bytes is cut off here.
    req.content_receiver = [&response, deadline](const char* data, size_t length, uint64_t, uint64_t) {
        if (std::chrono::steady_clock::now() >= deadline) {
            response.deadlineExceeded = true;
            return false;
        }
        response.body.append(data, length);
        return true;
    };

    auto res = cli.send(req);
    response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    // A read timeout surfaces as a transport error right at the deadline.
    const auto margin = res ? std::chrono::milliseconds(0) : std::chrono::milliseconds(100);
    if (response.elapsed + margin >= timeout) {
        response.deadlineExceeded = true;
    }

    if (res && !response.deadlineExceeded) {
        response.status = res->status;
        if (response.body.empty()) {
            response.body = res->body;
        }
        if (res->status != 200) {
            std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << response.body.substr(0, 200) << std::endl;
        }
    } else {
        response.body.clear();
        response.transportError = res ? "deadline exceeded while reading the response"
                                      : "httplib error " + std::to_string(static_cast<int>(res.error()));
        std::cerr << "[OllamaClient] Connection failed: " << response.transportError
                  << " after " << response.elapsed.count() << " ms" << std::endl;
    }
    return response;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);
    if (!m_bearerToken.empty()) {
        cli.set_bearer_token_auth(m_bearerToken);
    }

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Tags JSON Parse Error: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace docudigest::infrastructure
