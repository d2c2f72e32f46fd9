/**
 * @file ContentExtractor.hpp
 * @brief Extracts plain text from PDF, plain-text and Markdown uploads.
 */

#pragma once
#include "domain/TextExtractor.hpp"
#include <string>
#include <vector>

namespace docudigest::infrastructure {

/**
 * @class ContentExtractor
 * @brief TextExtractor backed by poppler's pdftotext for PDFs and direct decoding for text.
 */
class ContentExtractor : public domain::TextExtractor {
public:
    /** @param pdftotextCommand Executable used for PDFs (looked up on PATH). */
    explicit ContentExtractor(std::string pdftotextCommand = "pdftotext");

    /** @see domain::TextExtractor::extract */
    std::string extract(const std::vector<char>& bytes, const std::string& contentType) override;

    /** @see domain::TextExtractor::supports */
    bool supports(const std::string& contentType) const override;

    /** @brief Lowercases and strips parameters: "Text/Plain; charset=UTF-8" -> "text/plain". */
    static std::string NormalizeContentType(const std::string& contentType);

    /** @brief Strict UTF-8 validation (no overlongs, no surrogates). */
    static bool IsValidUtf8(const std::string& text);

    /** @brief True if text has at least one non-whitespace character. */
    static bool HasVisibleText(const std::string& text);

private:
    std::string extractPdf(const std::vector<char>& bytes);
    std::string extractText(const std::vector<char>& bytes);

    std::string m_pdftotext;
};

} // namespace docudigest::infrastructure
