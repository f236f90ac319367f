#pragma once

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <filesystem>
#include <core/config.hpp>
#include <deploy/progress.hpp>

class DeploySession;

class DeployCLI {
public:
    DeployCLI();

    // Handlers return the process exit code.
    using CommandHandler = std::function<int(DeployCLI&, const std::string&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);

    bool has_command(const std::string& name) const;
    int execute_command(const std::string& command, const std::string& arg = "");
    void print_help() const;

    // Emit progress as JSON lines on stdout; status text moves to stderr.
    bool json_progress = false;

    // Overridable for tests; defaults to ~/.sitedeploy/config.yaml
    std::filesystem::path global_config_path;

    int run_deploy(const std::string& site_dir);
    int run_test(const std::string& site_dir);
    int run_plan(const std::string& site_dir);
    int run_init_config();

private:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;

    void register_all_commands();
    std::optional<Config> load_config(const std::string& site_dir);
    std::ostream& status_stream() const;
    void print_status(const std::string& msg) const;
};

// SIGINT requests cancellation of the active session, if any.
void install_interrupt_handler();
void set_active_session(DeploySession* session);
