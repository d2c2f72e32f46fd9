/**
 * @file OllamaSummarizer.cpp
 * @brief Implementation of the OllamaSummarizer class.
 */
#include "infrastructure/OllamaSummarizer.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace docudigest::infrastructure {

using domain::SummarizerError;

namespace {

constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;

bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string Trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string FormatSeconds(std::chrono::milliseconds ms) {
    std::ostringstream ss;
    if (ms.count() % 1000 == 0) {
        ss << ms.count() / 1000 << "s";
    } else {
        ss << ms.count() << "ms";
    }
    return ss.str();
}

} // namespace

OllamaSummarizer::OllamaSummarizer(Config config)
    : m_config(std::move(config)), m_client(m_config.host, m_config.port, m_config.bearerToken) {}

bool OllamaSummarizer::checkModelAvailable() {
    auto models = m_client.getAvailableModels();
    if (models.empty()) {
        std::cerr << "[OllamaSummarizer] Failed to list models. Is the server at " << m_config.host << ":"
                  << m_config.port << " running?" << std::endl;
        return false;
    }
    bool found = std::find(models.begin(), models.end(), m_config.model) != models.end();
    if (found) {
        std::cout << "[OllamaSummarizer] Using model: " << m_config.model << std::endl;
    } else {
        std::cerr << "[OllamaSummarizer] Model " << m_config.model << " is not installed on the server." << std::endl;
    }
    return found;
}

std::size_t OllamaSummarizer::CountCodePoints(const std::string& text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return !IsContinuationByte(c);
    }));
}

std::string OllamaSummarizer::TruncateToFit(const std::string& text, std::size_t maxCodePoints, std::size_t& codePoints) {
    codePoints = 0;
    std::size_t cut = text.size();
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (IsContinuationByte(text[i])) continue;
        if (codePoints == maxCodePoints && cut == text.size()) {
            cut = i;
        }
        ++codePoints;
    }
    return text.substr(0, cut);
}

std::string OllamaSummarizer::getSystemPrompt() const {
    return
        "You are a document summarization engine.\n"
        "Summarize the document provided by the user.\n\n"
        "RULES:\n"
        "1. Describe only what is in the text. Do not invent authors, titles, dates or figures.\n"
        "2. Write plain prose, no headings, no lists, no code blocks.\n"
        "3. Keep the summary to at most five sentences.\n"
        "4. Write in the language of the document.";
}

domain::Summary OllamaSummarizer::summarize(const std::string& text, const domain::SummaryOptions& options) {
    const std::string model = options.modelId.empty() ? m_config.model : options.modelId;
    const auto timeout = options.timeout.count() > 0 ? options.timeout : std::chrono::milliseconds(30000);

    std::size_t originalCharacters = 0;
    std::string input = TruncateToFit(text, m_config.maxInputChars, originalCharacters);
    const std::size_t inputCharacters = CountCodePoints(input);
    const bool truncated = input.size() < text.size();
    if (truncated) {
        std::cout << "[OllamaSummarizer] Input truncated from " << originalCharacters << " to "
                  << inputCharacters << " characters." << std::endl;
    }

    json requestData = {
        {"model", model},
        {"system", getSystemPrompt()},
        {"prompt", "Document:\n" + input},
        {"stream", false},
        {"options", {
            {"num_predict", options.maxTokens},
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };

    auto res = m_client.generate(requestData, timeout);
    const std::string endpoint = m_config.host + ":" + std::to_string(m_config.port);

    if (!res.status) {
        if (res.deadlineExceeded) {
            throw SummarizerError(SummarizerError::Kind::RemoteUnavailable,
                                  "request to " + endpoint + " timed out after " + FormatSeconds(timeout));
        }
        throw SummarizerError(SummarizerError::Kind::RemoteUnavailable,
                              "cannot reach " + endpoint + " (" + res.transportError + ")");
    }

    const int status = *res.status;
    if (status == 401 || status == 403) {
        throw SummarizerError(SummarizerError::Kind::AuthError,
                              "credentials rejected by " + endpoint + " (HTTP " + std::to_string(status) + ")");
    }
    if (status == 429) {
        throw SummarizerError(SummarizerError::Kind::RateLimited,
                              "rate limited by " + endpoint + ", back off before retrying");
    }
    if (status >= 500) {
        throw SummarizerError(SummarizerError::Kind::RemoteUnavailable,
                              endpoint + " answered HTTP " + std::to_string(status));
    }
    if (status != 200) {
        std::string detail;
        try {
            auto body = json::parse(res.body);
            if (body.contains("error") && body["error"].is_string()) {
                detail = ": " + body["error"].get<std::string>();
            }
        } catch (const json::exception&) {
            // Non-JSON error body; the status code alone is reported.
        }
        throw SummarizerError(SummarizerError::Kind::InvalidResponse,
                              "unexpected HTTP " + std::to_string(status) + " for model " + model + detail);
    }

    std::string output;
    try {
        auto body = json::parse(res.body);
        if (!body.contains("response") || !body["response"].is_string()) {
            throw SummarizerError(SummarizerError::Kind::InvalidResponse, "response field missing from model output");
        }
        output = Trim(body["response"].get<std::string>());
    } catch (const json::exception& e) {
        std::cerr << "[OllamaSummarizer] JSON Parse Error: " << e.what() << std::endl;
        throw SummarizerError(SummarizerError::Kind::InvalidResponse, std::string("malformed model output: ") + e.what());
    }

    if (output.empty()) {
        throw SummarizerError(SummarizerError::Kind::InvalidResponse, "model returned an empty summary");
    }

    domain::Summary summary;
    summary.text = std::move(output);
    summary.modelId = model;
    summary.truncated = truncated;
    summary.inputCharacters = inputCharacters;
    summary.originalCharacters = originalCharacters;
    summary.generatedAt = std::chrono::system_clock::now();
    return summary;
}

} // namespace docudigest::infrastructure
