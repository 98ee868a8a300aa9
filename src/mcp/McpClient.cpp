#include "McpClient.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_inspector {

namespace {

json list_member(const json& result, const char* key) {
    if (result.is_object() && result.contains(key) && result[key].is_array()) {
        return result[key];
    }
    return json::array();
}

} // namespace

McpClient::McpClient(std::shared_ptr<SessionLog> log,
                     TimeoutDecisionPrompt prompt,
                     SessionOptions options)
    : log_(std::move(log)),
      prompt_(std::move(prompt)),
      options_(std::move(options)) {}

void McpClient::connect(const ServerSpec& spec) {
    disconnect();

    spdlog::info("Connecting to server {}: {}", spec.name, spec.command_line());
    session_ = std::make_unique<RpcSession>(spec, log_, prompt_, options_);
    session_->connect();
}

void McpClient::disconnect() {
    if (session_) {
        spdlog::info("Disconnecting from server {}", session_->spec().name);
        session_->close();
        session_.reset();
    }
}

bool McpClient::is_connected() const {
    return session_ && session_->state() == SessionState::Ready;
}

RpcSession& McpClient::session() {
    if (!session_) {
        throw std::logic_error("No server connected");
    }
    return *session_;
}

json McpClient::list_tools() {
    return list_member(session().call("tools/list"), "tools");
}

json McpClient::call_tool(const std::string& name, const json& arguments) {
    return session().call("tools/call", json{{"name", name}, {"arguments", arguments}});
}

json McpClient::list_resources() {
    return list_member(session().call("resources/list"), "resources");
}

json McpClient::read_resource(const std::string& uri) {
    return session().call("resources/read", json{{"uri", uri}});
}

json McpClient::list_prompts() {
    return list_member(session().call("prompts/list"), "prompts");
}

json McpClient::get_prompt(const std::string& name, const std::optional<json>& arguments) {
    json params = {{"name", name}};
    if (arguments && !arguments->empty()) {
        params["arguments"] = *arguments;
    }
    return session().call("prompts/get", params);
}

std::vector<RawLine> McpClient::recent_output(std::size_t n) const {
    if (!session_) {
        return {};
    }
    return session_->recent_output(n);
}

SessionState McpClient::state() const {
    return session_ ? session_->state() : SessionState::Unstarted;
}

json McpClient::server_info() const {
    if (!session_) {
        return json();
    }
    const json& result = session_->initialize_result();
    if (result.is_object() && result.contains("serverInfo")) {
        return result["serverInfo"];
    }
    return json();
}

std::optional<ServerSpec> McpClient::current_server() const {
    if (!session_) {
        return std::nullopt;
    }
    return session_->spec();
}

} // namespace mcp_inspector
