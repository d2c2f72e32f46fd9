#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/CommandLine.hpp"
#include "app/DocuDigestApp.hpp"

using namespace docudigest;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    app::CommandLine commandLine;
    try {
        commandLine = app::CommandLine::Parse(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "docudigest: " << e.what() << "\n\n" << app::CommandLine::Usage();
        return app::DocuDigestApp::kExitFailed;
    }

    app::DocuDigestApp application;
    return application.Run(commandLine);
}
