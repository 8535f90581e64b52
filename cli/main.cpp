//
// Created by gregorian-rayne on 1/22/26.
//

#include "depmap/cli/commands/command.hpp"
#include "depmap/version.hpp"

#include <iostream>
#include <exception>
#include <string>
#include <vector>

namespace {

    void print_usage(std::ostream& out) {
        out << R"(
DepMap - Python Dependency Mapper & Circular Import Detector

USAGE:
    depmap <COMMAND> <path> [OPTIONS]

COMMANDS:
)";
        for (const auto* command : depmap::cli::CommandRegistry::instance().list()) {
            std::string name(command->name());
            name.resize(15, ' ');
            out << "    " << name << command->description() << "\n";
        }
        out << R"(
GLOBAL OPTIONS:
    -h, --help        Show help (depmap <COMMAND> --help for command options)
    --version         Show version

EXAMPLES:
    depmap scan ./my_project            Scan and show summary
    depmap tree ./my_project            Show dependency tree
    depmap circular ./src               Check for circular imports
    depmap metrics ./src --sort fan_in  Show coupling metrics
    depmap orphans ./src                Find orphan modules
    depmap report ./src --markdown      Full report in Markdown
    depmap graph ./src -o deps.dot      Generate Graphviz DOT graph

EXIT CODES:
    0  Success
    1  Error (bad path, invalid option, unreadable configuration)
    2  Circular imports found (circular command only)
)";
    }

    void print_version() {
        std::cout << depmap::PROJECT_SHORT_NAME << " " << depmap::VERSION_STRING << "\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    using namespace depmap::cli;

    try {
        const std::vector<std::string> args(argv + 1, argv + argc);

        if (args.empty()) {
            print_usage(std::cout);
            return 0;
        }

        const std::string& command_name = args.front();

        if (command_name == "--version" || command_name == "version") {
            print_version();
            return 0;
        }

        if (command_name == "help" || command_name == "--help" || command_name == "-h") {
            if (args.size() > 1) {
                if (const Command* command = CommandRegistry::instance().find(args[1])) {
                    command->print_help();
                    return 0;
                }
            }
            print_usage(std::cout);
            return 0;
        }

        Command* command = CommandRegistry::instance().find(command_name);
        if (command == nullptr) {
            Command::print_error("Unknown command: " + command_name);
            print_usage(std::cerr);
            return 1;
        }

        const std::vector<std::string> command_args(args.begin() + 1, args.end());
        const auto parsed = parse_arguments(command_args, command->arguments());
        if (!parsed.success) {
            Command::print_error(parsed.error);
            return 1;
        }

        if (parsed.args.get_flag("help")) {
            command->print_help();
            return 0;
        }

        if (const auto error = command->validate(parsed.args); !error.empty()) {
            Command::print_error(error);
            std::cerr << command->usage() << "\n";
            return 1;
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
