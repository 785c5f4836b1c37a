#include <iostream>
#include <vector>
#include <string>
#include <optional>
#include "cli/dipole_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    dipole"
              << theme::color::RESET << theme::color::DIM
              << "                       Start an interactive session" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    dipole --session "
              << theme::color::RESET << theme::color::CORAL << "<id>"
              << theme::color::RESET << theme::color::DIM
              << "      Resume a saved session" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    dipole plan "
              << theme::color::RESET << theme::color::CORAL << "[path]"
              << theme::color::RESET << theme::color::DIM
              << "           Plan a deployment" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    dipole deploy "
              << theme::color::RESET << theme::color::CORAL << "[path]"
              << theme::color::RESET << theme::color::DIM
              << "         Deploy and stream logs" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    dipole diagnose "
              << theme::color::RESET << theme::color::CORAL << "--id <r>"
              << theme::color::RESET << theme::color::DIM
              << "     Diagnose a failed deploy" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    dipole logs "
              << theme::color::RESET << theme::color::CORAL << "<id>"
              << theme::color::RESET << theme::color::DIM
              << "             Tail a deployment's log" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    dipole setup"
              << theme::color::RESET << theme::color::DIM
              << "                 Create ~/.dipole/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    dipole --version              Show version\n"
              << "    dipole --help                 Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        if (!args.empty() && args[0] == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "dipole"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.4.0" << theme::color::RESET << "\n";
            return 0;
        }
        if (!args.empty() && args[0] == "--help") {
            print_usage();
            return 0;
        }

        std::optional<std::string> resume_id;
        if (!args.empty() && args[0] == "--session") {
            if (args.size() < 2) {
                std::cout << theme::fail("Missing session id.");
                std::cout << theme::step("Usage: dipole --session <id> [command]");
                return 1;
            }
            resume_id = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }

        DipoleCLI cli;

        if (args.empty()) {
            cli.run_repl(resume_id);
        } else if (args[0] == "setup") {
            cli.run_setup();
        } else {
            std::string cmd = args[0];
            std::vector<std::string> rest(args.begin() + 1, args.end());
            cli.run_command(cmd, rest, resume_id);
        }

        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
