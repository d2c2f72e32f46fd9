#include "app/CommandLine.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <stdexcept>

namespace docudigest::app {

namespace {

const std::map<std::string, Command> kCommands = {
    {"submit", Command::Submit},
    {"process", Command::Process},
    {"process-pending", Command::ProcessPending},
    {"retry", Command::Retry},
    {"status", Command::Status},
    {"list", Command::List},
    {"delete", Command::Delete},
    {"recover", Command::Recover},
    {"help", Command::Help},
};

bool NeedsArgument(Command command) {
    switch (command) {
        case Command::Submit:
        case Command::Process:
        case Command::Retry:
        case Command::Status:
        case Command::Delete:
            return true;
        default:
            return false;
    }
}

} // namespace

CommandLine CommandLine::Parse(const std::vector<std::string>& args) {
    CommandLine cl;
    bool haveCommand = false;
    bool haveArgument = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--config" || arg == "--content-type") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            if (arg == "--config") cl.configPath = args[++i];
            else cl.contentType = args[++i];
            continue;
        }
        if (arg == "--process") { cl.processAfterSubmit = true; continue; }
        if (arg == "--parallel") { cl.parallel = true; continue; }
        if (arg == "-h" || arg == "--help") { cl.command = Command::Help; return cl; }
        if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("unknown option " + arg);
        }

        if (!haveCommand) {
            auto it = kCommands.find(arg);
            if (it == kCommands.end()) {
                throw std::invalid_argument("unknown command '" + arg + "'");
            }
            cl.command = it->second;
            haveCommand = true;
        } else if (!haveArgument) {
            cl.argument = arg;
            haveArgument = true;
        } else {
            throw std::invalid_argument("unexpected argument '" + arg + "'");
        }
    }

    if (!haveCommand) {
        throw std::invalid_argument("missing command");
    }
    if (NeedsArgument(cl.command) && !haveArgument) {
        throw std::invalid_argument("command requires an argument");
    }
    if (!NeedsArgument(cl.command) && haveArgument) {
        throw std::invalid_argument("command takes no argument");
    }
    if (cl.contentType && cl.command != Command::Submit) {
        throw std::invalid_argument("--content-type only applies to submit");
    }
    if (cl.processAfterSubmit && cl.command != Command::Submit) {
        throw std::invalid_argument("--process only applies to submit");
    }
    if (cl.parallel && cl.command != Command::ProcessPending) {
        throw std::invalid_argument("--parallel only applies to process-pending");
    }
    return cl;
}

std::string CommandLine::GuessContentType(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".txt") return "text/plain";
    if (ext == ".md" || ext == ".markdown") return "text/markdown";
    return "application/octet-stream";
}

std::string CommandLine::Usage() {
    return
        "Usage: docudigest [--config <settings.json>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  submit <file> [--content-type T] [--process]  Store a document (and process it)\n"
        "  process <id>                                  Process a Pending document\n"
        "  process-pending [--parallel]                  Process every Pending document\n"
        "  retry <id>                                    Re-run a Failed or Processed document\n"
        "  status <id>                                   Show status, summary and error\n"
        "  list                                          List active documents\n"
        "  delete <id>                                   Soft-delete a document\n"
        "  recover                                       Fail documents stuck in Processing\n"
        "\n"
        "Exit codes: 0 success, 1 failed outcome or usage error, 2 repository or configuration error.\n";
}

} // namespace docudigest::app
