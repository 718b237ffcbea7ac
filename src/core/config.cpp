#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdlib>

namespace fs = std::filesystem;

static std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (!value) return std::nullopt;
    return trim_optional(std::string(value));
}

fs::path get_config_dir() {
    return platform::home_dir() / ".tracesync";
}

fs::path get_config_path() {
    if (auto over = env_value("TRACESYNC_CONFIG")) {
        return fs::path(*over);
    }
    return get_config_dir() / "config.yaml";
}

static std::optional<std::string> optional_string(const YAML::Node& node) {
    if (!node || !node.IsScalar()) return std::nullopt;
    return trim_optional(node.as<std::string>());
}

static Result<SyncDefaults> parse_sync_defaults(const YAML::Node& node) {
    SyncDefaults defaults;
    if (!node) return Result<SyncDefaults>::Ok(defaults);
    if (!node.IsMap()) {
        return Result<SyncDefaults>::Err("'sync' must be a mapping");
    }

    defaults.root = node["root"].as<std::string>(defaults.root);

    long workers = node["workers"] ? node["workers"].as<long>()
                                   : static_cast<long>(defaults.workers);
    if (workers <= 0) {
        return Result<SyncDefaults>::Err("sync.workers must be > 0");
    }
    defaults.workers = static_cast<size_t>(workers);

    long page_size = node["page_size"] ? node["page_size"].as<long>()
                                       : static_cast<long>(defaults.page_size);
    if (page_size <= 0) {
        return Result<SyncDefaults>::Err("sync.page_size must be > 0");
    }
    defaults.page_size = static_cast<size_t>(page_size);

    return Result<SyncDefaults>::Ok(defaults);
}

Result<Config> Config::load() {
    return load_from(get_config_path());
}

Result<Config> Config::load_from(const fs::path& path) {
    Config config;
    config.source_path_ = path;

    if (!fs::exists(path)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config " + path.string() + " must be a mapping");
        }

        config.api_url_ = optional_string(root["api_url"]);
        config.api_key_ = optional_string(root["api_key"]);
        config.org_name_ = optional_string(root["org_name"]);

        auto defaults = parse_sync_defaults(root["sync"]);
        if (defaults.is_err()) {
            return Result<Config>::Err("Invalid config " + path.string() + ": " + defaults.error);
        }
        config.defaults_ = defaults.value;
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config " + path.string() + ": " + e.what());
    }

    return Result<Config>::Ok(config);
}

Result<SessionContext> Config::resolve_session() const {
    SessionContext ctx;

    auto api_key = env_value("TRACESYNC_API_KEY");
    if (!api_key) api_key = api_key_;
    auto api_url = env_value("TRACESYNC_API_URL");
    if (!api_url) api_url = api_url_;
    auto org_name = env_value("TRACESYNC_ORG_NAME");
    if (!org_name) org_name = org_name_;

    if (!api_key) {
        return Result<SessionContext>::Err(
            "No API key. Set TRACESYNC_API_KEY or api_key in " + source_path_.string());
    }
    if (!api_url) {
        return Result<SessionContext>::Err(
            "No API URL. Set TRACESYNC_API_URL or api_url in " + source_path_.string());
    }

    ctx.api_key = *api_key;
    ctx.api_url = *api_url;
    while (!ctx.api_url.empty() && ctx.api_url.back() == '/') {
        ctx.api_url.pop_back();
    }
    ctx.org_name = org_name.value_or("");
    return Result<SessionContext>::Ok(ctx);
}
