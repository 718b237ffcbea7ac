#include "tracesync_cli.hpp"
#include "theme.hpp"
#include <managers/sync_log.hpp>
#include <iostream>
#include <fmt/format.h>
#include <fmt/ranges.h>

TraceSyncCLI::TraceSyncCLI() : BaseCLI() {
    register_all_commands();
}

void TraceSyncCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::vector<std::string>& args) {
        this->print_help();
        return 0;
    }, "Show this help message");

    register_pull_commands(*this);
    register_push_commands(*this);
    register_status_commands(*this);
}

int TraceSyncCLI::run(const std::vector<std::string>& args) {
    std::vector<std::string> rest;
    std::string command;
    for (const auto& arg : args) {
        if (arg == "--json" && command.empty()) {
            json_output = true;
        } else if (command.empty()) {
            command = arg;
        } else if (arg == "--json") {
            json_output = true;
        } else {
            rest.push_back(arg);
        }
    }

    if (command.empty()) {
        std::cout << theme::fail("Missing command.");
        std::cout << theme::step("Usage: tracesync [--json] <pull|push|status> <object_ref> [options]");
        return 1;
    }

    sync_log(fmt::format("{} {}", command, fmt::join(rest, " ")));
    return execute_command(command, rest);
}
