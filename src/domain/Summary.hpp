/**
 * @file Summary.hpp
 * @brief Value Object for a model-generated document summary.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace docudigest::domain {

/**
 * @struct Summary
 * @brief Summary text plus the metadata needed to audit how it was produced.
 */
struct Summary {
    std::string text;                 ///< Model output, trimmed.
    std::string modelId;              ///< Model variant that produced the text.
    bool truncated = false;           ///< Input was cut to fit the model window.
    std::size_t inputCharacters = 0;  ///< Characters actually sent.
    std::size_t originalCharacters = 0; ///< Characters extracted from the document.
    std::chrono::system_clock::time_point generatedAt;
};

/**
 * @struct SummaryOptions
 * @brief Per-call knobs for the summarization client.
 */
struct SummaryOptions {
    int maxTokens = 512;                          ///< Caps response length.
    std::string modelId;                          ///< Empty selects the configured default.
    std::chrono::milliseconds timeout{30000};     ///< Deadline for the remote call.
};

} // namespace docudigest::domain
