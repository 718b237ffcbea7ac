#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.tracesync/config.yaml (or $TRACESYNC_CONFIG). A missing file
    // yields defaults; a malformed one is an error.
    static Result<Config> load();

    // Load from an explicit path. Same missing-file semantics as load().
    static Result<Config> load_from(const fs::path& path);

    // Accessors
    const SyncDefaults& defaults() const { return defaults_; }
    const fs::path& source_path() const { return source_path_; }

    // API key / URL / org after environment overrides.
    // Fails if the key or URL is missing.
    Result<SessionContext> resolve_session() const;

public:
    Config() = default;

private:
    SyncDefaults defaults_;
    std::optional<std::string> api_key_;
    std::optional<std::string> api_url_;
    std::optional<std::string> org_name_;
    fs::path source_path_;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();
