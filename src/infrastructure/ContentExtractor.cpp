/**
 * @file ContentExtractor.cpp
 * @brief Implementation of ContentExtractor.
 */

#include "infrastructure/ContentExtractor.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/wait.h>

namespace docudigest::infrastructure {

using domain::ExtractorError;

namespace {

struct CommandResult {
    std::string output;
    int exitCode = -1;
};

CommandResult RunCommand(const std::string& cmd) {
    CommandResult result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return result;
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }
    int status = pclose(pipe);
    result.exitCode = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return result;
}

bool HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

std::string GetTempFilePath(const std::string& suffix) {
    static std::atomic<unsigned long long> counter{0};
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = "docudigest_" + std::to_string(now) + "_" + std::to_string(counter++) + suffix;
    return (std::filesystem::temp_directory_path() / name).string();
}

// Removes the temporary input file on every exit path.
class TempFile {
public:
    explicit TempFile(std::string path) : m_path(std::move(path)) {}
    ~TempFile() {
        std::error_code ignored;
        std::filesystem::remove(m_path, ignored);
    }
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

} // namespace

ContentExtractor::ContentExtractor(std::string pdftotextCommand)
    : m_pdftotext(std::move(pdftotextCommand)) {}

std::string ContentExtractor::NormalizeContentType(const std::string& contentType) {
    std::string type = contentType.substr(0, contentType.find(';'));
    type.erase(0, type.find_first_not_of(" \t"));
    auto last = type.find_last_not_of(" \t");
    type.erase(last == std::string::npos ? 0 : last + 1);
    std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c){ return std::tolower(c); });
    return type;
}

bool ContentExtractor::supports(const std::string& contentType) const {
    std::string type = NormalizeContentType(contentType);
    return type == "application/pdf" || type == "text/plain" || type == "text/markdown";
}

std::string ContentExtractor::extract(const std::vector<char>& bytes, const std::string& contentType) {
    std::string type = NormalizeContentType(contentType);
    std::string text;

    if (type == "application/pdf") {
        text = extractPdf(bytes);
    } else if (type == "text/plain" || type == "text/markdown") {
        text = extractText(bytes);
    } else {
        throw ExtractorError(ExtractorError::Kind::UnsupportedFormat,
                             "unsupported format '" + (type.empty() ? std::string("<none>") : type) + "'");
    }

    if (!HasVisibleText(text)) {
        throw ExtractorError(ExtractorError::Kind::EmptyResult, "document contains no extractable text");
    }
    return text;
}

std::string ContentExtractor::extractText(const std::vector<char>& bytes) {
    std::string text(bytes.begin(), bytes.end());
    if (text.size() >= 3 && std::memcmp(text.data(), "\xEF\xBB\xBF", 3) == 0) {
        text.erase(0, 3);
    }
    if (!IsValidUtf8(text)) {
        throw ExtractorError(ExtractorError::Kind::CorruptInput, "text is not valid UTF-8");
    }
    return text;
}

std::string ContentExtractor::extractPdf(const std::vector<char>& bytes) {
    static const char kMagic[] = "%PDF-";
    if (bytes.size() < 5 || std::memcmp(bytes.data(), kMagic, 5) != 0) {
        throw ExtractorError(ExtractorError::Kind::CorruptInput, "missing %PDF- header");
    }
    if (!HasTool(m_pdftotext)) {
        throw ExtractorError(ExtractorError::Kind::CorruptInput,
                             "cannot parse PDF: '" + m_pdftotext + "' is not installed");
    }

    TempFile input(GetTempFilePath(".pdf"));
    {
        std::ofstream out(input.path(), std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw ExtractorError(ExtractorError::Kind::CorruptInput, "cannot stage PDF for parsing");
        }
    }

    // Pages come out in document order, separated by form feeds.
    auto result = RunCommand(m_pdftotext + " -enc UTF-8 \"" + input.path() + "\" - 2>/dev/null");
    if (result.exitCode != 0) {
        std::cerr << "[ContentExtractor] " << m_pdftotext << " exited with " << result.exitCode << std::endl;
        throw ExtractorError(ExtractorError::Kind::CorruptInput,
                             "PDF could not be parsed (pdftotext exit code " + std::to_string(result.exitCode) + ")");
    }
    return result.output;
}

bool ContentExtractor::HasVisibleText(const std::string& text) {
    return std::any_of(text.begin(), text.end(), [](char c) {
        return !std::isspace(static_cast<unsigned char>(c));
    });
}

bool ContentExtractor::IsValidUtf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) { ++i; continue; }

        size_t len = 0;
        unsigned int cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

} // namespace docudigest::infrastructure
