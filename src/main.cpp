#include <iostream>
#include <vector>
#include <string>
#include "cli/deploy_cli.hpp"
#include "cli/theme.hpp"

void print_usage(const DeployCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sitedeploy "
              << theme::color::RESET << theme::color::BROWN << "<command> <site_dir>"
              << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    --json-progress       Print progress as JSON lines\n"
              << "    sitedeploy --version  Show version\n"
              << "    sitedeploy --help     Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        DeployCLI cli;

        std::vector<std::string> args;
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--json-progress") {
                cli.json_progress = true;
            } else {
                args.push_back(arg);
            }
        }

        if (args.empty() || args[0] == "--help") {
            print_usage(cli);
            return 0;
        }

        if (args[0] == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "sitedeploy"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << SITEDEPLOY_VERSION << theme::color::RESET << "\n";
            return 0;
        }

        if (!cli.has_command(args[0])) {
            std::cout << theme::fail("Unknown command: " + args[0]);
            print_usage(cli);
            return 1;
        }

        return cli.execute_command(args[0], args.size() >= 2 ? args[1] : "");
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
