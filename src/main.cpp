#include <iostream>
#include <vector>
#include <string>
#include "cli/tracesync_cli.hpp"
#include "cli/theme.hpp"

static void usage_row(const std::string& cmd, const std::string& args, const std::string& help) {
    std::cout << theme::color::BLUE << "    tracesync " << cmd
              << theme::color::RESET << theme::color::BROWN << args
              << theme::color::RESET << theme::color::DIM
              << help << theme::color::RESET << "\n";
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    usage_row("pull ", "<object_ref>  ", "  Download spans or traces (default: 100 traces)");
    usage_row("push ", "<object_ref>  ", "  Upload a pulled dataset into project logs");
    usage_row("status ", "<object_ref>", "  Show checkpoint state for a spec");

    std::cout << theme::section("Options");
    std::cout << theme::color::DIM
              << "    --json                Machine-readable output\n"
              << "    --filter EXPR         Query filter applied to every query\n"
              << "    --traces N            Sync N whole traces\n"
              << "    --spans N             Sync N spans\n"
              << "    --page-size N         Rows per query or upload batch\n"
              << "    --cursor C            Start spans pull at cursor (implies --fresh)\n"
              << "    --fresh               Discard the checkpoint and start over\n"
              << "    --root DIR            Sync root directory\n"
              << "    --workers N           Concurrent fetch / upload workers\n"
              << "    --in PATH             Push input file or directory\n"
              << "    --direction pull|push Status for a pull or push spec"
              << theme::color::RESET << "\n";

    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    tracesync --version   Show version\n"
              << "    tracesync --help      Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "tracesync"
                      << theme::color::RESET << theme::color::DIM
                      << " version " TRACESYNC_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }

        TraceSyncCLI cli;
        return cli.run(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
