#pragma once

#include "core/Channel.hpp"
#include "core/Message.hpp"
#include "core/ServerSpec.hpp"
#include "mcp/OutputTap.hpp"
#include "mcp/ProcessSupervisor.hpp"
#include "mcp/SessionLog.hpp"
#include "mcp/SessionState.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace mcp_inspector {

/**
 * @brief What to do when a call's deadline passes without a response
 */
enum class TimeoutDecision {
    Extend,   // keep waiting for another extension period
    Abandon   // give up; the call fails with TimeoutError
};

/**
 * @brief Asked synchronously, on the calling thread, when a deadline passes
 * @param elapsed Time since the request was written
 * @param method Method of the call that timed out
 */
using TimeoutDecisionPrompt =
    std::function<TimeoutDecision(std::chrono::milliseconds elapsed, const std::string& method)>;

/**
 * @brief Tunables for one session
 */
struct SessionOptions {
    std::chrono::milliseconds handshake_timeout{15000};
    std::chrono::milliseconds request_timeout{10000};
    std::chrono::milliseconds long_request_timeout{60000};
    std::chrono::milliseconds extension{30000};
    std::chrono::milliseconds stop_grace{2000};
    // How long to wait for an exit status once the server's stdout closes
    std::chrono::milliseconds exit_status_wait{500};
    OutputTapOptions tap;
    std::string client_name = "mcp-inspector";
    std::string client_version = "0.1.0";
    json client_capabilities = json::object();
};

/**
 * @brief MCP protocol version sent in the initialize request
 */
inline constexpr const char* kProtocolVersion = "2024-11-05";

/**
 * @brief One client session with one MCP server child process
 *
 * Owns the child process, the OutputTap draining it, a writer thread that
 * alone writes the child's stdin, and a dispatcher thread that exclusively
 * owns the table of pending calls. The drain threads and callers never
 * touch that table; they post events to the dispatcher through a channel:
 *  - decoded inbound messages and stream closures (from the drain threads)
 *  - registration and abandonment of calls (from callers)
 *  - shutdown (from close())
 *
 * Each call waits on a promise that the dispatcher completes exactly once:
 * with the result, a RemoteError, a TimeoutError (after Abandon), or the
 * terminal session error. Whichever of these the dispatcher processes first
 * wins; later events for the same id are logged as stray.
 *
 * Callers queue outgoing frames for the writer and wait only on their
 * promise, so a server that stops reading stdin cannot stall a call past
 * its deadline.
 *
 * A session is single-use: after Closed or Failed, build a new one.
 */
class RpcSession {
public:
    /**
     * @brief Construct an unstarted session
     * @param spec Server to launch on connect()
     * @param log Event sink (may be null)
     * @param prompt Timeout decision strategy (null means always abandon)
     * @param options Timeouts and limits
     */
    RpcSession(ServerSpec spec,
               std::shared_ptr<SessionLog> log,
               TimeoutDecisionPrompt prompt,
               SessionOptions options = {});

    ~RpcSession();

    RpcSession(const RpcSession&) = delete;
    RpcSession& operator=(const RpcSession&) = delete;

    /**
     * @brief Launch the server and perform the initialize handshake
     *
     * Unstarted -> Handshaking -> Ready. Sends notifications/initialized
     * after a well-formed initialize response.
     *
     * @throws SpawnError if the process cannot be started (state Failed)
     * @throws SessionFailedError on timeout, remote error, malformed
     *         response, or early process exit (state Failed)
     * @throws std::logic_error if the session was already started
     */
    void connect();

    /**
     * @brief Issue a request and wait for its response
     *
     * When the timeout passes, the prompt decides whether to extend the
     * deadline by options.extension or abandon the call.
     *
     * @return The response's result member
     * @throws RemoteError, TimeoutError, SessionFailedError, SessionClosedError
     */
    json call(const std::string& method,
              const std::optional<json>& params,
              std::chrono::milliseconds timeout);

    /**
     * @brief Issue a request with the default timeout for its method
     */
    json call(const std::string& method, const std::optional<json>& params = std::nullopt);

    /**
     * @brief Cancel pending calls and stop the tap and the process
     *
     * Ready -> Closing -> Closed. On a Failed session, only releases
     * resources. Idempotent.
     */
    void close();

    SessionState state() const;

    /**
     * @brief Reason recorded when the session entered Failed
     */
    std::optional<std::string> failure_reason() const;

    /**
     * @brief Last n raw output lines of the server, most recent last
     */
    std::vector<RawLine> recent_output(std::size_t n) const;

    /**
     * @brief The result of the initialize call (empty until Ready)
     */
    const json& initialize_result() const { return initialize_result_; }

    const ServerSpec& spec() const { return spec_; }

    /**
     * @brief Default timeout for a method (long for tool calls and reads)
     */
    std::chrono::milliseconds default_timeout(const std::string& method) const;

private:
    struct PendingCall {
        std::int64_t id;
        std::string method;
        std::chrono::steady_clock::time_point submitted_at;
        std::shared_ptr<std::promise<json>> slot;
    };

    struct InboundEvent {
        Message message;
        Timestamp received_at;
    };
    struct RegisterEvent {
        PendingCall call;
    };
    struct AbandonEvent {
        std::int64_t id;
    };
    struct StreamClosedEvent {
        StreamKind stream;
    };
    struct ShutdownEvent {};

    using Event = std::variant<InboundEvent, RegisterEvent, AbandonEvent,
                               StreamClosedEvent, ShutdownEvent>;

    struct Outgoing {
        Message message;
        std::shared_ptr<std::promise<bool>> delivered;  // may be null
    };

    json request(const std::string& method,
                 const std::optional<json>& params,
                 std::chrono::milliseconds timeout);
    json await_response(std::int64_t id,
                        const std::string& method,
                        std::future<json>& future,
                        std::chrono::milliseconds timeout);
    void ensure_ready() const;
    [[noreturn]] void fail_handshake(const std::string& reason);

    // Queue a message for the writer thread; false once the writer has stopped
    bool send(const Message& message, std::shared_ptr<std::promise<bool>> delivered = nullptr);

    // Writer thread
    void write_loop();
    bool write_message(const Message& message);

    bool transition(SessionState to, std::optional<std::string> reason = std::nullopt);

    // Dispatcher thread
    void dispatch_loop();
    void on_inbound(InboundEvent& event);
    void on_register(RegisterEvent& event);
    void on_abandon(const AbandonEvent& event);
    void on_stream_closed(const StreamClosedEvent& event);
    void on_shutdown();
    void answer_server_request(const Request& request);
    void fail_all(std::exception_ptr error);
    std::exception_ptr terminal_error() const;

    ServerSpec spec_;
    std::shared_ptr<SessionLog> log_;
    TimeoutDecisionPrompt prompt_;
    SessionOptions options_;

    mutable std::mutex state_mutex_;
    SessionState state_ = SessionState::Unstarted;
    std::optional<std::string> failure_reason_;

    std::mutex close_mutex_;
    // Held across id allocation and queueing so queue order is id order
    std::mutex submit_mutex_;
    std::int64_t next_id_ = 1;

    std::unique_ptr<ProcessHandle> process_;
    std::unique_ptr<OutputTap> tap_;

    Channel<Outgoing> outbox_;
    std::thread writer_;

    Channel<Event> events_;
    std::thread dispatcher_;
    // Owned by the dispatcher thread only
    std::map<std::int64_t, PendingCall> pending_;
    bool shutting_down_ = false;

    json initialize_result_;
};

} // namespace mcp_inspector
