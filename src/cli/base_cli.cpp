#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error_ = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail(config_error_.empty() ? "Configuration not loaded."
                                                       : config_error_);
        return false;
    }
    return true;
}

std::optional<SessionContext> BaseCLI::require_session() {
    if (!require_config()) {
        return std::nullopt;
    }
    auto session = config->resolve_session();
    if (session.is_err()) {
        std::cout << theme::fail(session.error);
        std::cout << theme::step("Set TRACESYNC_API_KEY and TRACESYNC_API_URL, or add them to "
                                 + get_config_path().string());
        return std::nullopt;
    }
    return session.value;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'tracesync --help' for available commands.");
        return 1;
    }
    return it->second.first(*this, args);
}

void BaseCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::color::BLUE
                  << fmt::format("    {:<10}", name)
                  << theme::color::RESET
                  << theme::color::DIM
                  << entry.second
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n";
}
