#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/PaytrackApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    paytrack::app::CommandLine commandLine;
    try {
        commandLine = paytrack::app::PaytrackApp::ParseArguments(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << paytrack::app::PaytrackApp::Usage() << std::endl;
        return 2;
    }

    paytrack::app::PaytrackApp app;
    return app.Run(commandLine);
}
