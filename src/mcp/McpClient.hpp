#pragma once

#include "core/ServerSpec.hpp"
#include "mcp/RpcSession.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcp_inspector {

/**
 * @brief Typed MCP operations over the current RpcSession
 *
 * Holds at most one session. connect() replaces it: the previous session is
 * closed (pending calls fail with SessionClosedError, its process is
 * stopped) before the new server is launched.
 */
class McpClient {
public:
    McpClient(std::shared_ptr<SessionLog> log,
              TimeoutDecisionPrompt prompt,
              SessionOptions options = {});

    /**
     * @brief Tear down the current session (if any) and connect to spec
     * @throws SpawnError, SessionFailedError as RpcSession::connect()
     */
    void connect(const ServerSpec& spec);

    /**
     * @brief Close the current session, if any
     */
    void disconnect();

    bool is_connected() const;

    /**
     * @brief tools/list; returns result.tools or an empty array
     */
    json list_tools();

    /**
     * @brief tools/call with {name, arguments}; returns the full result
     */
    json call_tool(const std::string& name, const json& arguments);

    /**
     * @brief resources/list; returns result.resources or an empty array
     */
    json list_resources();

    /**
     * @brief resources/read with {uri}
     */
    json read_resource(const std::string& uri);

    /**
     * @brief prompts/list; returns result.prompts or an empty array
     */
    json list_prompts();

    /**
     * @brief prompts/get with {name, arguments?}; empty arguments are omitted
     */
    json get_prompt(const std::string& name, const std::optional<json>& arguments = std::nullopt);

    std::vector<RawLine> recent_output(std::size_t n) const;

    SessionState state() const;

    /**
     * @brief serverInfo from the initialize result, or null
     */
    json server_info() const;

    /**
     * @brief The server of the current session, if any
     */
    std::optional<ServerSpec> current_server() const;

private:
    RpcSession& session();

    std::shared_ptr<SessionLog> log_;
    TimeoutDecisionPrompt prompt_;
    SessionOptions options_;
    std::unique_ptr<RpcSession> session_;
};

} // namespace mcp_inspector
