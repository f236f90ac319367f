#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <transport/capabilities.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>
#include <stdexcept>

namespace fs = std::filesystem;

Config::Config()
    : sites_dir_(platform::home_dir() / "Documents" / "sitedeploy" / "sites"),
      app_dir_(get_global_config_dir()) {
}

bool site_config_exists(const fs::path& dir) {
    return fs::exists(get_site_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIRNAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_FILENAME;
}

fs::path get_site_config_path(const fs::path& dir) {
    return dir / SITE_CONFIG_FILENAME;
}

Result<void> create_default_global_config() {
    return create_default_global_config(get_global_config_path());
}

Result<void> create_default_global_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() + ": " + ec.message());
    }

    const char* default_config = R"(# sitedeploy global configuration

# Where site directories live
sites_dir: "~/Documents/sitedeploy/sites"

# Where the upload/delete audit logs are written
app_dir: "~/.sitedeploy"

# Optional: debug log location (default: sitedeploy_debug.log in the temp dir)
# log_file: "~/.sitedeploy/debug.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    out.close();
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

DeploymentConfig parse_deployment_config(const YAML::Node& node) {
    DeploymentConfig dep;

    std::string protocol = node["protocol"].as<std::string>("local");
    auto kind = parse_transport_kind(protocol);
    if (!kind) {
        throw std::runtime_error("unknown deployment protocol '" + protocol + "'");
    }
    dep.protocol = *kind;
    dep.protocol_name = protocol;

    dep.path = node["path"].as<std::string>("");
    dep.server = node["server"].as<std::string>("");
    dep.port = node["port"].as<int>(SFTP_DEFAULT_PORT);
    dep.username = node["username"].as<std::string>("");
    dep.password = node["password"].as<std::string>("");
    dep.passphrase = node["passphrase"].as<std::string>("");
    dep.timeout = node["timeout"].as<int>(30);

    if (node["key"]) {
        dep.key_path = node["key"].as<std::string>();
    }

    if (dep.password.empty()) {
        const char* env = std::getenv(PASSWORD_ENV_VAR);
        if (env) dep.password = env;
    }

    return dep;
}

Result<Config> Config::load_global(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Global config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        if (root["sites_dir"]) {
            config.sites_dir_ = expand_home(root["sites_dir"].as<std::string>());
        }
        if (root["app_dir"]) {
            config.app_dir_ = expand_home(root["app_dir"].as<std::string>());
        }
        if (root["log_file"]) {
            config.log_file_ = expand_home(root["log_file"].as<std::string>()).string();
        }
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse global config: ") + e.what());
    }
}

Result<Config> Config::load_site(const fs::path& site_dir) {
    if (!site_config_exists(site_dir)) {
        return Result<Config>::Err("Site config not found at " + get_site_config_path(site_dir).string());
    }

    try {
        YAML::Node root = YAML::LoadFile(get_site_config_path(site_dir).string());

        Config config;
        config.site_dir_ = site_dir;
        config.site_.name = root["name"].as<std::string>("");
        config.site_.deployment = parse_deployment_config(
            root["deployment"] ? root["deployment"] : YAML::Node());

        // Auto-infer site name from directory name if not set
        if (config.site_.name.empty()) {
            config.site_.name = site_dir.filename().string();
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse site config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& site_dir) {
    return load(site_dir, get_global_config_path());
}

Result<Config> Config::load(const fs::path& site_dir, const fs::path& global_path) {
    Config config;
    if (fs::exists(global_path)) {
        auto global_result = load_global(global_path);
        if (global_result.is_err()) {
            return global_result;
        }
        config = global_result.value;
    } else {
        deploy_log("Config: no global config at " + global_path.string() + ", using defaults");
    }

    auto site_result = load_site(site_dir);
    if (site_result.is_err()) {
        return site_result;
    }
    config.site_ = site_result.value.site_;
    config.site_dir_ = site_result.value.site_dir_;

    if (config.log_file_) {
        set_deploy_log_path(*config.log_file_);
    }

    return Result<Config>::Ok(config);
}

SessionPaths Config::session_paths() const {
    SessionPaths paths;
    paths.input_dir = site_dir_ / SITE_OUTPUT_DIRNAME;
    paths.config_dir = site_dir_ / "input" / "config";
    paths.app_dir = app_dir_;
    paths.output_dir = site_.deployment.path;
    return paths;
}
