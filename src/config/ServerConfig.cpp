#include "ServerConfig.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace mcp_inspector {

using json = nlohmann::json;

namespace {

std::vector<std::string> string_array(const json& value, const std::string& field, const std::string& server) {
    std::vector<std::string> result;
    if (value.is_null()) {
        return result;
    }
    if (!value.is_array()) {
        throw ConfigError("server '" + server + "': " + field + " must be an array");
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ConfigError("server '" + server + "': " + field + " entries must be strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

// Working directory: explicit "cwd", else the argument after "--directory"
std::string resolve_cwd(const json& entry,
                        const std::vector<std::string>& args,
                        const std::filesystem::path& working_dir) {
    if (entry.contains("cwd") && entry["cwd"].is_string()) {
        return entry["cwd"].get<std::string>();
    }
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--directory") {
            return args[i + 1];
        }
    }
    return working_dir.string();
}

std::optional<ServerSpec> parse_server(const std::string& name,
                                       const json& entry,
                                       const std::filesystem::path& working_dir) {
    if (!entry.is_object()) {
        spdlog::warn("Skipping server '{}': entry is not an object", name);
        return std::nullopt;
    }
    if (!entry.contains("command") || !entry["command"].is_string() ||
        entry["command"].get<std::string>().empty()) {
        spdlog::warn("Skipping server '{}': no command", name);
        return std::nullopt;
    }

    ServerSpec spec;
    spec.name = name;
    spec.command = entry["command"].get<std::string>();
    spec.args = string_array(entry.value("args", json()), "args", name);
    spec.working_directory = resolve_cwd(entry, spec.args, working_dir);

    if (entry.contains("env") && entry["env"].is_object()) {
        for (const auto& [key, value] : entry["env"].items()) {
            spec.env[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return spec;
}

} // namespace

std::optional<std::filesystem::path> ServerConfig::discover(
    const std::optional<std::filesystem::path>& explicit_path,
    const std::filesystem::path& working_dir,
    const std::optional<std::filesystem::path>& home_dir) {
    std::error_code ec;
    if (explicit_path && !explicit_path->empty()) {
        if (!std::filesystem::is_regular_file(*explicit_path, ec)) {
            throw ConfigError("Configuration file not found: " + explicit_path->string());
        }
        return *explicit_path;
    }

    std::vector<std::filesystem::path> candidates;
    candidates.push_back(working_dir / "mcp.json");
    if (home_dir) {
        candidates.push_back(*home_dir / ".cursor" / "mcp.json");
    }

    for (const auto& candidate : candidates) {
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

ServerConfig ServerConfig::load(const std::filesystem::path& path, const std::filesystem::path& working_dir) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    ServerConfig config = parse(buffer.str(), working_dir);
    spdlog::info("Loaded {} server(s) from {}", config.servers_.size(), path.string());
    return config;
}

ServerConfig ServerConfig::parse(const std::string& text, const std::filesystem::path& working_dir) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid configuration JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    ServerConfig config;
    if (root.contains("mcpServers") && root["mcpServers"].is_object()) {
        for (const auto& [name, entry] : root["mcpServers"].items()) {
            if (auto spec = parse_server(name, entry, working_dir)) {
                config.servers_.push_back(std::move(*spec));
            }
        }
    } else if (root.contains("command")) {
        std::string name = "default";
        if (root.contains("name") && root["name"].is_string() && !root["name"].get<std::string>().empty()) {
            name = root["name"].get<std::string>();
        }
        if (auto spec = parse_server(name, root, working_dir)) {
            config.servers_.push_back(std::move(*spec));
        }
    }
    return config;
}

ServerConfig ServerConfig::resolve(const std::optional<std::filesystem::path>& explicit_path,
                                   const std::filesystem::path& working_dir,
                                   const std::optional<std::filesystem::path>& home_dir) {
    auto found = discover(explicit_path, working_dir, home_dir);
    if (!found) {
        spdlog::info("No configuration file found, using fallback server");
        return fallback(working_dir);
    }

    try {
        ServerConfig config = load(*found, working_dir);
        if (!config.empty()) {
            return config;
        }
        spdlog::warn("No usable servers in {}, using fallback server", found->string());
    } catch (const ConfigError& e) {
        spdlog::error("Failed to read config {}: {}", found->string(), e.what());
    }
    return fallback(working_dir);
}

ServerConfig ServerConfig::fallback(const std::filesystem::path& working_dir) {
    ServerSpec spec;
    spec.name = "fallback";
    spec.command = "uv";
    spec.args = {"run", "main.py"};
    spec.working_directory = working_dir.string();

    ServerConfig config;
    config.servers_.push_back(std::move(spec));
    return config;
}

std::optional<ServerSpec> ServerConfig::find(const std::string& name) const {
    for (const auto& server : servers_) {
        if (server.name == name) {
            return server;
        }
    }
    return std::nullopt;
}

} // namespace mcp_inspector
