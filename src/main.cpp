#include "Quill/CliParser.hpp"
#include "Quill/Core.hpp"
#include "Quill/Errors.hpp"
#include "Quill/SysInteraction.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Quill::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Paths may also be piped in; never block on an interactive terminal.
    Quill::SysInteraction sys;
    std::istream* path_input = sys.isInteractiveInput() ? nullptr : &std::cin;

    try {
        Quill::Core core(parser.getCommands(), path_input);
        return core.run();
    } catch (const Quill::UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
