#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <optional>
#include <core/config.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Handlers get the arguments after the command name and return the exit code.
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    // Prints the load error and returns false when the config file is malformed.
    bool require_config();

    // Credentials for pull/push; prints the reason and returns nullopt if missing.
    std::optional<SessionContext> require_session();

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Public state
    std::optional<Config> config;
    bool json_output = false;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::string config_error_;
};
