#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_pull_commands(BaseCLI& cli);
void register_push_commands(BaseCLI& cli);
void register_status_commands(BaseCLI& cli);

class TraceSyncCLI : public BaseCLI {
public:
    TraceSyncCLI();

    // argv without the program name. Leading --json applies to every command.
    int run(const std::vector<std::string>& args);

private:
    void register_all_commands();
};
