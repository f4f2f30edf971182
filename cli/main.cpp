//
// Created by gregorian-rayne on 10/16/26.
//

#include "cta/cli/commands/command.hpp"
#include "cta/version.hpp"

#include <iostream>
#include <exception>
#include <iomanip>
#include <string>
#include <vector>

namespace {

    void print_help() {
        std::cout << cta::PROJECT_NAME << " " << cta::VERSION_STRING << "\n"
                  << "Finds crash regression tests deleted while their tracker issue is still open.\n\n"
                  << "Usage: cta [COMMAND] [OPTIONS]\n"
                  << "       cta <REPO_PATH> [OPTIONS]     (same as 'cta audit')\n\n"
                  << "Commands:\n";

        for (const auto* cmd : cta::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }

        std::cout << "\nRun 'cta <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        if (args.empty() || args[0] == "-h" || args[0] == "--help" || args[0] == "help") {
            print_help();
            return args.empty() ? cta::cli::EXIT_USAGE : cta::cli::EXIT_OK;
        }

        if (args[0] == "-V" || args[0] == "--version") {
            std::cout << cta::PROJECT_SHORT_NAME << " " << cta::VERSION_STRING << "\n";
            return cta::cli::EXIT_OK;
        }

        auto& registry = cta::cli::CommandRegistry::instance();
        cta::cli::Command* cmd = registry.find(args[0]);
        if (cmd != nullptr) {
            args.erase(args.begin());
        } else {
            cmd = registry.find("audit");
        }

        if (cmd == nullptr) {
            std::cerr << "error: no audit command registered\n";
            return cta::cli::EXIT_ERROR;
        }

        return cta::cli::run_command(*cmd, args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return cta::cli::EXIT_ERROR;
    }
}
