#pragma once

#include "core/ServerSpec.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcp_inspector {

/**
 * @brief Configuration file could not be read or parsed
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Set of MCP servers loaded from an mcp.json file
 *
 * Accepts the Cursor-style layout
 * {"mcpServers": {"name": {"command": ..., "args": [...], "env": {...}}}}
 * and the single-server layout {"command": ..., "args": [...], "name": ...}.
 */
class ServerConfig {
public:
    /**
     * @brief Locate a configuration file
     *
     * An explicit_path must exist. Without one, checks working_dir/mcp.json
     * then home_dir/.cursor/mcp.json.
     *
     * @return First existing path, or std::nullopt
     * @throws ConfigError if explicit_path is given but is not a file
     */
    static std::optional<std::filesystem::path> discover(
        const std::optional<std::filesystem::path>& explicit_path,
        const std::filesystem::path& working_dir,
        const std::optional<std::filesystem::path>& home_dir);

    /**
     * @brief Parse a configuration file
     * @param path File to read
     * @param working_dir Default working directory for servers
     * @throws ConfigError if the file cannot be read or is not valid JSON
     */
    static ServerConfig load(const std::filesystem::path& path, const std::filesystem::path& working_dir);

    /**
     * @brief Parse configuration text (same rules as load())
     */
    static ServerConfig parse(const std::string& text, const std::filesystem::path& working_dir);

    /**
     * @brief Discover and load the servers to offer
     *
     * A configuration that cannot be read, is not valid JSON, or names no
     * usable server is reported and replaced by fallback().
     *
     * @throws ConfigError if explicit_path is given but does not exist
     */
    static ServerConfig resolve(const std::optional<std::filesystem::path>& explicit_path,
                                const std::filesystem::path& working_dir,
                                const std::optional<std::filesystem::path>& home_dir);

    /**
     * @brief The single "uv run main.py" server used when nothing is configured
     */
    static ServerConfig fallback(const std::filesystem::path& working_dir);

    const std::vector<ServerSpec>& servers() const { return servers_; }

    bool empty() const { return servers_.empty(); }

    /**
     * @brief Look up a server by name
     */
    std::optional<ServerSpec> find(const std::string& name) const;

private:
    std::vector<ServerSpec> servers_;
};

} // namespace mcp_inspector
