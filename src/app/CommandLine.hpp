/**
 * @file CommandLine.hpp
 * @brief Parsing of the docudigest command line.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docudigest::app {

enum class Command {
    Submit,
    Process,
    ProcessPending,
    Retry,
    Status,
    List,
    Delete,
    Recover,
    Help
};

struct CommandLine {
    Command command = Command::Help;
    std::optional<std::string> configPath;
    std::string argument;                   ///< File path for submit, document id otherwise.
    std::optional<std::string> contentType; ///< submit --content-type
    bool processAfterSubmit = false;        ///< submit --process
    bool parallel = false;                  ///< process-pending --parallel

    /**
     * @brief Parses argv (without the program name).
     * @throws std::invalid_argument on unknown commands, options or missing arguments.
     */
    static CommandLine Parse(const std::vector<std::string>& args);

    /** @brief Content type inferred from the file extension. */
    static std::string GuessContentType(const std::string& path);

    static std::string Usage();
};

} // namespace docudigest::app
