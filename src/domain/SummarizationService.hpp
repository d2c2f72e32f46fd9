/**
 * @file SummarizationService.hpp
 * @brief Interface for remote model summarization.
 */

#pragma once

#include <string>

#include "domain/Summary.hpp"

namespace docudigest::domain {

/**
 * @class SummarizationService
 * @brief Abstract client that turns extracted text into a Summary using a remote model.
 */
class SummarizationService {
public:
    virtual ~SummarizationService() = default;

    /**
     * @brief Summarizes text in one remote call. No internal retries.
     * Input longer than the model window is truncated to its longest fitting
     * prefix; the returned Summary records that.
     * @throws SummarizerError RemoteUnavailable, RateLimited, InvalidResponse or AuthError.
     */
    virtual Summary summarize(const std::string& text, const SummaryOptions& options) = 0;

    /** @brief Model used when options.modelId is empty. */
    virtual std::string getDefaultModel() const = 0;
};

} // namespace docudigest::domain
