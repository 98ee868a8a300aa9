#include "config/ServerConfig.hpp"
#include "mcp/McpClient.hpp"
#include "mcp/SpdlogSessionLog.hpp"
#include "shell/InspectorShell.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace {

bool configure_log_level(const std::string& log_level) {
    if (log_level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (log_level == "critical") {
        spdlog::set_level(spdlog::level::critical);
    } else {
        return false;
    }
    return true;
}

std::optional<std::filesystem::path> home_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::nullopt;
    }
    return std::filesystem::path(home);
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"MCP Inspector - interactive client for MCP servers over stdio"};

    std::string config_path;
    app.add_option("config", config_path, "MCP configuration file (default: ./mcp.json, ~/.cursor/mcp.json)");

    std::string server_name;
    app.add_option("-s,--server", server_name, "Connect to this configured server without asking");

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("warn");

    std::string log_dir = ".";
    app.add_option("--log-dir", log_dir, "Directory for session log files")->default_val(".");

    bool no_log = false;
    app.add_flag("--no-log", no_log, "Do not write a session log file");

    int timeout_seconds = 10;
    app.add_option("--timeout", timeout_seconds, "Default request timeout in seconds")
        ->default_val(10)
        ->check(CLI::PositiveNumber);

    int extend_seconds = 30;
    app.add_option("--extend", extend_seconds, "Seconds added when extending a timed-out wait")
        ->default_val(30)
        ->check(CLI::PositiveNumber);

    bool no_color = false;
    app.add_flag("--no-color", no_color, "Disable ANSI colors");

    bool no_monitor = false;
    app.add_flag("--no-monitor", no_monitor, "Do not echo server traffic and output to the console");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcp-inspector version 0.1.0" << std::endl;
        return 0;
    }

    // Diagnostics go to stderr; stdout belongs to the menu
    spdlog::set_default_logger(spdlog::stderr_color_mt("mcp-inspector"));
    if (!configure_log_level(log_level)) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }

    try {
        auto working_dir = std::filesystem::current_path();

        std::optional<std::filesystem::path> explicit_config;
        if (!config_path.empty()) {
            explicit_config = config_path;
        }

        mcp_inspector::ServerConfig config;
        try {
            config = mcp_inspector::ServerConfig::resolve(explicit_config, working_dir, home_directory());
        } catch (const mcp_inspector::ConfigError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            std::cerr << "Use --help for usage information." << std::endl;
            return 1;
        }

        bool color = !no_color && ::isatty(STDOUT_FILENO);

        std::shared_ptr<spdlog::logger> file_logger;
        std::string log_path;
        if (!no_log) {
            log_path = (std::filesystem::path(log_dir) /
                mcp_inspector::SpdlogSessionLog::default_file_name(std::chrono::system_clock::now())).string();
            file_logger = mcp_inspector::SpdlogSessionLog::make_file_logger(log_path);
            spdlog::info("Session log: {}", log_path);
        }

        std::shared_ptr<spdlog::logger> monitor;
        if (!no_monitor) {
            monitor = mcp_inspector::SpdlogSessionLog::make_console_logger(color);
        }

        std::shared_ptr<mcp_inspector::SpdlogSessionLog> session_log;
        if (file_logger || monitor) {
            session_log = std::make_shared<mcp_inspector::SpdlogSessionLog>(file_logger, "unknown", monitor);
        }

        mcp_inspector::SessionOptions options;
        options.request_timeout = std::chrono::seconds(timeout_seconds);
        options.extension = std::chrono::seconds(extend_seconds);

        mcp_inspector::McpClient client(
            session_log,
            mcp_inspector::InspectorShell::make_timeout_prompt(std::cin, std::cout, options.extension),
            options);

        mcp_inspector::ShellOptions shell_options;
        shell_options.color = color;
        shell_options.log_path = log_path;

        mcp_inspector::InspectorShell shell(client, std::move(config), std::cin, std::cout,
                                            session_log, shell_options);

        std::optional<std::string> preferred;
        if (!server_name.empty()) {
            preferred = server_name;
        }
        return shell.run(preferred);

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
