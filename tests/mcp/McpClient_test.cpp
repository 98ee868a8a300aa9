#include <gtest/gtest.h>
#include "mcp/McpClient.hpp"
#include "mcp/Errors.hpp"
#include "RecordingSessionLog.hpp"
#include "StubServer.hpp"

using namespace mcp_inspector;
using namespace std::chrono_literals;

class McpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<RecordingSessionLog>();
        SessionOptions options;
        options.handshake_timeout = 5s;
        options.request_timeout = 5s;
        options.long_request_timeout = 5s;
        options.stop_grace = 1s;
        client_ = std::make_unique<McpClient>(
            log_,
            [](std::chrono::milliseconds, const std::string&) { return TimeoutDecision::Abandon; },
            options);
    }

    std::shared_ptr<RecordingSessionLog> log_;
    std::unique_ptr<McpClient> client_;
};

TEST_F(McpClientTest, NotConnectedByDefault) {
    EXPECT_FALSE(client_->is_connected());
    EXPECT_EQ(client_->state(), SessionState::Unstarted);
    EXPECT_FALSE(client_->current_server().has_value());
    EXPECT_TRUE(client_->recent_output(5).empty());
    EXPECT_THROW(client_->list_tools(), std::logic_error);
}

TEST_F(McpClientTest, TypedOperations) {
    client_->connect(stub_spec("ok"));
    ASSERT_TRUE(client_->is_connected());
    EXPECT_EQ(client_->server_info()["name"], "stub-server");

    json tools = client_->list_tools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0]["name"], "echo");

    json called = client_->call_tool("echo", {{"message", "ping"}});
    EXPECT_EQ(called["content"][0]["text"], "ping");

    json resources = client_->list_resources();
    ASSERT_EQ(resources.size(), 1u);
    std::string uri = resources[0]["uri"];

    json contents = client_->read_resource(uri);
    EXPECT_EQ(contents["contents"][0]["text"], "hello from " + uri);

    json prompts = client_->list_prompts();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0]["name"], "greet");

    json prompt = client_->get_prompt("greet", json{{"who", "world"}});
    EXPECT_EQ(prompt["messages"][0]["content"]["text"], "Hello, world");
}

TEST_F(McpClientTest, EmptyPromptArgumentsAreOmitted) {
    client_->connect(stub_spec("ok"));

    json prompt = client_->get_prompt("greet", json::object());
    EXPECT_EQ(prompt["receivedArguments"], false);
}

TEST_F(McpClientTest, SwitchingServersClosesPreviousSession) {
    client_->connect(stub_spec("ok"));
    client_->connect(stub_spec("notify"));

    ASSERT_TRUE(client_->current_server().has_value());
    EXPECT_EQ(client_->current_server()->name, "stub-notify");
    EXPECT_TRUE(client_->is_connected());

    // The first session went through Closing -> Closed before the second started
    auto changes = log_->state_changes();
    std::vector<SessionState> targets;
    for (const auto& change : changes) {
        targets.push_back(change.to);
    }
    std::vector<SessionState> expected = {
        SessionState::Handshaking, SessionState::Ready,
        SessionState::Closing, SessionState::Closed,
        SessionState::Handshaking, SessionState::Ready
    };
    EXPECT_EQ(targets, expected);
}

TEST_F(McpClientTest, FailedConnectLeavesClientDisconnected) {
    EXPECT_THROW(client_->connect(stub_spec("error-init")), SessionFailedError);

    EXPECT_FALSE(client_->is_connected());
    EXPECT_EQ(client_->state(), SessionState::Failed);
    EXPECT_THROW(client_->list_tools(), SessionFailedError);

    // A new connect replaces the failed session
    client_->connect(stub_spec("ok"));
    EXPECT_TRUE(client_->is_connected());
}

TEST_F(McpClientTest, DisconnectIsIdempotent) {
    client_->connect(stub_spec("ok"));
    client_->disconnect();
    client_->disconnect();

    EXPECT_FALSE(client_->is_connected());
    EXPECT_EQ(client_->state(), SessionState::Unstarted);
}
