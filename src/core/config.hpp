#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include <deploy/session_state.hpp>

namespace fs = std::filesystem;

namespace YAML { class Node; }

class Config {
public:
    // Load global config from ~/.sitedeploy/config.yaml
    static Result<Config> load_global(const fs::path& path);

    // Load site config from <site_dir>/deploy.yaml
    static Result<Config> load_site(const fs::path& site_dir);

    // Load both and combine. A missing global config falls back to defaults,
    // a missing site config is an error.
    static Result<Config> load(const fs::path& site_dir, const fs::path& global_path);
    static Result<Config> load(const fs::path& site_dir);

    // Accessors
    const SiteConfig& site() const { return site_; }
    const DeploymentConfig& deployment() const { return site_.deployment; }
    const fs::path& site_dir() const { return site_dir_; }
    const fs::path& sites_dir() const { return sites_dir_; }
    const fs::path& app_dir() const { return app_dir_; }

    // Input <site>/output, cache <site>/input/config, audit logs in app_dir
    SessionPaths session_paths() const;

public:
    Config();

private:
    SiteConfig site_;
    fs::path site_dir_;
    fs::path sites_dir_;
    fs::path app_dir_;
    std::optional<std::string> log_file_;
};

// Helper to check if a site is configured
bool site_config_exists(const fs::path& dir);

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_site_config_path(const fs::path& dir);

// Create default global config (never overwrites)
Result<void> create_default_global_config(const fs::path& config_path);
Result<void> create_default_global_config();

// Parse a `deployment:` block. Throws std::runtime_error on an unknown protocol.
DeploymentConfig parse_deployment_config(const YAML::Node& node);
