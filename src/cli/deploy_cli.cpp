#include "deploy_cli.hpp"
#include "progress_view.hpp"
#include "theme.hpp"
#include <iostream>
#include <atomic>
#include <csignal>
#include <fmt/format.h>
#include <core/log.hpp>
#include <deploy/deploy_session.hpp>
#include <transport/transport_factory.hpp>

namespace {

std::atomic<DeploySession*> g_active_session{nullptr};

void on_interrupt(int) {
    DeploySession* session = g_active_session.load();
    if (session) session->request_cancel();
}

} // namespace

void install_interrupt_handler() {
    std::signal(SIGINT, on_interrupt);
}

void set_active_session(DeploySession* session) {
    g_active_session.store(session);
}

DeployCLI::DeployCLI() : global_config_path(get_global_config_path()) {
    register_all_commands();
}

void DeployCLI::register_all_commands() {
    add_command("deploy", [](DeployCLI& cli, const std::string& arg) {
        return cli.run_deploy(arg);
    }, "Upload changes in <site>/output to the configured target");

    add_command("plan", [](DeployCLI& cli, const std::string& arg) {
        return cli.run_plan(arg);
    }, "Show what a deploy would remove and upload");

    add_command("test", [](DeployCLI& cli, const std::string& arg) {
        return cli.run_test(arg);
    }, "Check the connection to the configured target");

    add_command("init-config", [](DeployCLI& cli, const std::string&) {
        return cli.run_init_config();
    }, "Write a default ~/.sitedeploy/config.yaml");
}

void DeployCLI::add_command(const std::string& name,
                            CommandHandler handler,
                            const std::string& help) {
    commands_[name] = {handler, help};
}

bool DeployCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

int DeployCLI::execute_command(const std::string& command, const std::string& arg) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        status_stream() << theme::fail("Unknown command: " + command);
        status_stream() << theme::step("Run 'sitedeploy --help' for available commands.");
        return 1;
    }

    try {
        return it->second.first(*this, arg);
    } catch (const std::exception& e) {
        status_stream() << theme::fail(std::string(e.what()));
        return 1;
    }
}

void DeployCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::color::BLUE << fmt::format("    {:<14}", name) << theme::color::RESET
                  << theme::color::DIM << entry.second << theme::color::RESET << "\n";
    }
    std::cout << "\n";
}

std::ostream& DeployCLI::status_stream() const {
    return json_progress ? std::cerr : std::cout;
}

void DeployCLI::print_status(const std::string& msg) const {
    status_stream() << theme::log(msg);
}

std::optional<Config> DeployCLI::load_config(const std::string& site_dir) {
    if (site_dir.empty()) {
        status_stream() << theme::fail("Missing site directory.");
        return std::nullopt;
    }

    auto config = Config::load(expand_home(site_dir), global_config_path);
    if (config.is_err()) {
        status_stream() << theme::fail(config.error);
        return std::nullopt;
    }
    return config.value;
}

// ── Commands ───────────────────────────────────────────────

int DeployCLI::run_deploy(const std::string& site_dir) {
    auto config = load_config(site_dir);
    if (!config) return 1;

    auto transport = create_transport(config->deployment());
    if (transport.is_err()) {
        status_stream() << theme::fail(transport.error);
        return 1;
    }

    TerminalProgressSink terminal(std::cout);
    JsonProgressSink json(std::cout);
    ProgressSink& sink = json_progress ? static_cast<ProgressSink&>(json) : terminal;

    status_stream() << theme::step(fmt::format("Deploying {} via {}",
                                               config->site().name,
                                               config->deployment().protocol_name));

    DeploySession session(config->session_paths(), std::move(transport.value), sink);
    set_active_session(&session);
    install_interrupt_handler();

    auto result = session.run([this, &terminal](const std::string& msg) {
        if (!json_progress) terminal.finish();
        print_status(msg);
    });

    set_active_session(nullptr);
    if (!json_progress) terminal.finish();

    if (result.is_err()) {
        status_stream() << theme::fail("Deploy failed: " + result.error);
        return 1;
    }

    const auto& state = session.state();
    status_stream() << theme::ok(fmt::format("Deployed {} ({} operations, snapshot {})",
                                             config->site().name, state.operation_count,
                                             snapshot_verdict_name(session.snapshot().verdict)));
    return 0;
}

int DeployCLI::run_plan(const std::string& site_dir) {
    auto config = load_config(site_dir);
    if (!config) return 1;

    auto transport = create_transport(config->deployment());
    if (transport.is_err()) {
        status_stream() << theme::fail(transport.error);
        return 1;
    }

    NullProgressSink sink;
    DeploySession session(config->session_paths(), std::move(transport.value), sink);
    auto schedule = session.plan([this](const std::string& msg) { print_status(msg); });
    if (schedule.is_err()) {
        status_stream() << theme::fail(schedule.error);
        return 1;
    }

    std::ostream& out = status_stream();
    out << theme::kv("snapshot", snapshot_verdict_name(session.snapshot().verdict));

    out << theme::section(fmt::format("Remove ({})", schedule.value.removals.size()));
    for (const auto& entry : OperationScheduler::pop_order(schedule.value.removals)) {
        out << theme::fail(fmt::format("{} {}", entry_kind_name(entry.kind), entry.path));
    }

    out << theme::section(fmt::format("Upload ({})", schedule.value.uploads.size()));
    for (const auto& entry : OperationScheduler::pop_order(schedule.value.uploads)) {
        out << theme::ok(fmt::format("{} {}", entry_kind_name(entry.kind), entry.path));
    }
    out << "\n";
    return 0;
}

int DeployCLI::run_test(const std::string& site_dir) {
    auto config = load_config(site_dir);
    if (!config) return 1;

    auto transport = create_transport(config->deployment());
    if (transport.is_err()) {
        status_stream() << theme::fail(transport.error);
        return 1;
    }

    auto result = transport.value->test_connection([this](const std::string& msg) {
        print_status(msg);
    });
    if (result.is_err()) {
        status_stream() << theme::fail("Connection test failed: " + result.error);
        return 1;
    }
    status_stream() << theme::ok("Connection OK");
    return 0;
}

int DeployCLI::run_init_config() {
    bool existed = std::filesystem::exists(global_config_path);
    auto result = create_default_global_config(global_config_path);
    if (result.is_err()) {
        status_stream() << theme::fail(result.error);
        return 1;
    }
    if (existed) {
        status_stream() << theme::info("Config already exists at " + global_config_path.string());
    } else {
        status_stream() << theme::ok("Wrote " + global_config_path.string());
    }
    return 0;
}
