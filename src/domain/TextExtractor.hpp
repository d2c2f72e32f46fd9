/**
 * @file TextExtractor.hpp
 * @brief Interface for converting raw document bytes into plain text.
 */

#pragma once

#include <string>
#include <vector>

namespace docudigest::domain {

class TextExtractor {
public:
    virtual ~TextExtractor() = default;

    /**
     * @brief Extracts the text of a document, pages in document order.
     * @param bytes Raw document content.
     * @param contentType MIME type captured at upload.
     * @return Non-empty text.
     * @throws ExtractorError UnsupportedFormat, CorruptInput or EmptyResult.
     */
    virtual std::string extract(const std::vector<char>& bytes, const std::string& contentType) = 0;

    /** @brief True if the content type is handled at all. */
    virtual bool supports(const std::string& contentType) const = 0;
};

} // namespace docudigest::domain
