#include "Renamarion/CliParser.hpp"
#include "Renamarion/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser defines and parses all command-line options using CLI11.
    Renamarion::CliParser parser;
    auto app = parser.setupCli();

    // We catch CLI11's exit exceptions (help, parse errors) ourselves
    // so that CLI11 prints them and picks the exit code.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    Renamarion::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
