#pragma once

#include "config/ServerConfig.hpp"
#include "mcp/Errors.hpp"
#include "mcp/McpClient.hpp"
#include "mcp/SpdlogSessionLog.hpp"
#include "shell/ArgumentPrompter.hpp"
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace mcp_inspector {

struct ShellOptions {
    bool color = true;
    std::string log_path;     // shown by [l]; empty when logging is off
    std::size_t output_lines = 50;
    std::size_t preview_length = 200;
};

/**
 * @brief Text menu driving an McpClient
 *
 * Lets the operator list and call tools, read resources, get prompts,
 * inspect recent server output, and switch between configured servers.
 */
class InspectorShell {
public:
    /**
     * @brief Construct shell
     * @param client Client to drive (must outlive the shell)
     * @param config Servers available for selection
     * @param in Operator input
     * @param out Operator output
     * @param session_log Optional log that also receives menu choices and summaries
     * @param options Display options
     */
    InspectorShell(McpClient& client,
                   ServerConfig config,
                   std::istream& in,
                   std::ostream& out,
                   std::shared_ptr<SpdlogSessionLog> session_log,
                   ShellOptions options = {});

    /**
     * @brief Timeout prompt reading Y/n answers from the given streams
     *
     * Empty input, "y", "yes" and end of input mean Extend.
     */
    static TimeoutDecisionPrompt make_timeout_prompt(std::istream& in,
                                                     std::ostream& out,
                                                     std::chrono::milliseconds extension);

    /**
     * @brief Connect to the selected (or only) server, then run the menu
     * @param preferred Server name to connect to without asking
     * @return Process exit code
     */
    int run(const std::optional<std::string>& preferred = std::nullopt);

    /**
     * @brief First text item of a tool result, truncated for display
     */
    static std::optional<std::string> result_preview(const json& result, std::size_t max_length);

private:
    std::optional<ServerSpec> choose_server();
    bool connect(const ServerSpec& spec);
    // Retries with another selection while the command cannot be started
    bool connect_or_choose_again(ServerSpec spec);

    void menu_loop();
    bool tools_menu();  // false when the operator asked to quit
    void resources_menu();
    void prompts_menu();
    void show_output();
    void switch_server();

    std::optional<json> run_operation(const std::string& title,
                                      const std::string& attempted,
                                      const std::function<json()>& operation);
    void summary(const std::string& title, const std::string& attempted, bool success);
    void report_error(const std::string& line);

    std::optional<std::size_t> read_index(const std::string& prompt, std::size_t count);
    std::string read_line();
    void print_and_log(const std::string& line);
    void log_note(const std::string& line);
    std::string paint(const char* color, const std::string& text) const;

    McpClient& client_;
    ServerConfig config_;
    std::istream& in_;
    std::ostream& out_;
    std::shared_ptr<SpdlogSessionLog> session_log_;
    ShellOptions options_;
    ArgumentPrompter prompter_;

    std::optional<ErrorKind> last_error_kind_;
    std::optional<std::string> last_status_;
    std::chrono::steady_clock::time_point last_status_time_;
    std::optional<std::string> last_preview_;
};

} // namespace mcp_inspector
