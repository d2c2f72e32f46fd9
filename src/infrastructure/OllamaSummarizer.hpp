/**
 * @file OllamaSummarizer.hpp
 * @brief Summarization client speaking the Ollama generate API.
 */

#pragma once
#include "domain/SummarizationService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <cstddef>
#include <string>

namespace docudigest::infrastructure {

/**
 * @class OllamaSummarizer
 * @brief Implements SummarizationService with one /api/generate call per document.
 */
class OllamaSummarizer : public domain::SummarizationService {
public:
    struct Config {
        std::string host = "localhost";
        int port = 11434;
        std::string model = "qwen2.5:7b";
        std::size_t maxInputChars = 12000;  ///< Model input window, in code points.
        std::string bearerToken;
    };

    explicit OllamaSummarizer(Config config);

    /** @see domain::SummarizationService::summarize */
    domain::Summary summarize(const std::string& text, const domain::SummaryOptions& options) override;

    /** @see domain::SummarizationService::getDefaultModel */
    std::string getDefaultModel() const override { return m_config.model; }

    /** @brief Asks the server whether the configured model is installed. Logs the outcome. */
    bool checkModelAvailable();

    /**
     * @brief Longest prefix of text with at most maxCodePoints UTF-8 code points.
     * @param codePoints Receives the code point count of the whole text.
     */
    static std::string TruncateToFit(const std::string& text, std::size_t maxCodePoints, std::size_t& codePoints);

    static std::size_t CountCodePoints(const std::string& text);

private:
    std::string getSystemPrompt() const;

    Config m_config;
    OllamaClient m_client;
};

} // namespace docudigest::infrastructure
