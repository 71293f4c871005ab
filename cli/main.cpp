//
// Created by gregorian-rayne on 1/21/26.
//

#include "sdkir/cli/commands/command.hpp"
#include "sdkir/version.hpp"

#include <iomanip>
#include <iostream>
#include <exception>
#include <string>
#include <vector>

namespace {

    void print_help() {
        std::cout << sdkir::PROJECT_NAME << " - OpenAPI analysis for SDK generators\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    " << sdkir::PROJECT_SHORT_NAME << " <COMMAND> [OPTIONS]\n\n";
        std::cout << "COMMANDS:\n";
        for (const auto* command : sdkir::cli::CommandRegistry::instance().list()) {
            std::cout << "    " << std::left << std::setw(14) << command->name()
                      << command->description() << "\n";
        }
        std::cout << "\nRun '" << sdkir::PROJECT_SHORT_NAME
                  << " <COMMAND> --help' for the options of a command.\n";
    }

    void print_version() {
        std::cout << sdkir::PROJECT_SHORT_NAME << " " << sdkir::VERSION_STRING << "\n";
    }

    int dispatch(const std::vector<std::string>& argv) {
        if (argv.empty() || argv.front() == "help" || argv.front() == "--help" || argv.front() == "-h") {
            print_help();
            return argv.empty() ? 1 : 0;
        }
        if (argv.front() == "version" || argv.front() == "--version" || argv.front() == "-V") {
            print_version();
            return 0;
        }

        auto* command = sdkir::cli::CommandRegistry::instance().find(argv.front());
        if (command == nullptr) {
            std::cerr << "error: unknown command '" << argv.front() << "'\n\n";
            print_help();
            return 1;
        }

        const std::vector<std::string> rest(argv.begin() + 1, argv.end());
        auto parsed = sdkir::cli::parse_arguments(rest, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return 1;
        }

        if (!parsed.args.get_flag("help")) {
            if (const auto problem = command->validate(parsed.args); !problem.empty()) {
                std::cerr << "error: " << problem << "\n\n" << command->usage() << "\n";
                return 1;
            }
        }

        return command->execute(parsed.args);
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        return dispatch(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
