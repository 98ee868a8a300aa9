#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_inspector {

/**
 * @brief How to launch one MCP server as a child process
 *
 * Environment entries are added to (or override) the inherited environment.
 */
struct ServerSpec {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> env;

    /**
     * @brief Command and arguments joined with spaces, for display
     */
    std::string command_line() const {
        std::string line = command;
        for (const auto& arg : args) {
            line += " " + arg;
        }
        return line;
    }
};

} // namespace mcp_inspector
