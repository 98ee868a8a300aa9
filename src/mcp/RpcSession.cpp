#include "RpcSession.hpp"
#include "core/FrameCodec.hpp"
#include "core/Overloaded.hpp"
#include "mcp/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_inspector {

namespace {

Timestamp now() {
    return std::chrono::system_clock::now();
}

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

RpcSession::RpcSession(ServerSpec spec,
                       std::shared_ptr<SessionLog> log,
                       TimeoutDecisionPrompt prompt,
                       SessionOptions options)
    : spec_(std::move(spec)),
      log_(log ? std::move(log) : std::make_shared<NullSessionLog>()),
      prompt_(std::move(prompt)),
      options_(std::move(options)) {}

RpcSession::~RpcSession() {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::error("Error closing session with {}: {}", spec_.name, e.what());
    }
}

void RpcSession::connect() {
    if (state() != SessionState::Unstarted) {
        throw std::logic_error("connect() called on a session that was already started");
    }
    transition(SessionState::Handshaking, "connecting to " + spec_.name);

    try {
        process_ = ProcessSupervisor::start(spec_);
    } catch (const SpawnError& e) {
        transition(SessionState::Failed, e.what());
        throw;
    }

    tap_ = std::make_unique<OutputTap>(
        process_->stdout_fd(),
        process_->stderr_fd(),
        [this](Message message, Timestamp received_at) {
            events_.push(InboundEvent{std::move(message), received_at});
        },
        [this](StreamKind stream) {
            events_.push(StreamClosedEvent{stream});
        },
        log_,
        options_.tap);

    dispatcher_ = std::thread(&RpcSession::dispatch_loop, this);
    writer_ = std::thread(&RpcSession::write_loop, this);

    json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", options_.client_capabilities},
        {"clientInfo", {
            {"name", options_.client_name},
            {"version", options_.client_version}
        }}
    };

    json result;
    try {
        result = request("initialize", params, options_.handshake_timeout);
    } catch (const RemoteError& e) {
        fail_handshake(std::string("initialize rejected: ") + e.what());
    } catch (const TimeoutError&) {
        fail_handshake("handshake timed out");
    }

    if (!result.is_object() || !result.contains("protocolVersion") ||
        !result["protocolVersion"].is_string()) {
        fail_handshake("malformed initialize response");
    }
    if (!result.contains("capabilities") || !result["capabilities"].is_object()) {
        fail_handshake("malformed initialize response: no capabilities object");
    }
    if (result["protocolVersion"] != kProtocolVersion) {
        spdlog::warn("Server {} negotiated protocol version {}", spec_.name,
                     result["protocolVersion"].get<std::string>());
    }
    initialize_result_ = result;

    auto delivered = std::make_shared<std::promise<bool>>();
    std::future<bool> written = delivered->get_future();
    bool notified = send(Notification{"notifications/initialized", std::nullopt}, delivered) &&
        written.wait_for(options_.handshake_timeout) == std::future_status::ready &&
        written.get();
    if (!notified) {
        if (state() == SessionState::Failed) {
            ensure_ready();
        }
        auto status = process_->wait_for_exit(options_.exit_status_wait);
        fail_handshake(status ? status->describe() : "could not send notifications/initialized");
    }

    if (!transition(SessionState::Ready)) {
        // The process died between the response and now
        ensure_ready();
    }
}

void RpcSession::fail_handshake(const std::string& reason) {
    transition(SessionState::Failed, reason);
    throw SessionFailedError(reason);
}

json RpcSession::call(const std::string& method,
                      const std::optional<json>& params,
                      std::chrono::milliseconds timeout) {
    ensure_ready();
    return request(method, params, timeout);
}

json RpcSession::call(const std::string& method, const std::optional<json>& params) {
    return call(method, params, default_timeout(method));
}

std::chrono::milliseconds RpcSession::default_timeout(const std::string& method) const {
    if (method == "tools/call" || method == "resources/read" || method == "prompts/get") {
        return options_.long_request_timeout;
    }
    return options_.request_timeout;
}

void RpcSession::ensure_ready() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    switch (state_) {
        case SessionState::Ready:
            return;
        case SessionState::Failed:
            throw SessionFailedError(failure_reason_.value_or("unknown failure"));
        case SessionState::Closing:
        case SessionState::Closed:
            throw SessionClosedError("session closed by client");
        default:
            throw std::logic_error("session with " + spec_.name + " is not connected");
    }
}

json RpcSession::request(const std::string& method,
                         const std::optional<json>& params,
                         std::chrono::milliseconds timeout) {
    auto slot = std::make_shared<std::promise<json>>();
    std::future<json> future = slot->get_future();
    std::int64_t id;

    {
        std::lock_guard<std::mutex> lock(submit_mutex_);
        id = next_id_++;

        PendingCall pending{id, method, std::chrono::steady_clock::now(), slot};
        if (!events_.push(RegisterEvent{std::move(pending)})) {
            std::rethrow_exception(terminal_error());
        }
        if (!send(Request{id, method, params})) {
            spdlog::warn("Request {} id={} was not queued for {}", method, id, spec_.name);
        }
    }

    return await_response(id, method, future, timeout);
}

json RpcSession::await_response(std::int64_t id,
                                const std::string& method,
                                std::future<json>& future,
                                std::chrono::milliseconds timeout) {
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + timeout;

    while (future.wait_until(deadline) != std::future_status::ready) {
        TimeoutDecision decision = TimeoutDecision::Abandon;
        if (prompt_) {
            try {
                decision = prompt_(since(started), method);
            } catch (const std::exception& e) {
                spdlog::error("Timeout prompt failed, abandoning {}: {}", method, e.what());
            }
        }

        if (decision == TimeoutDecision::Extend) {
            spdlog::info("Extending wait for {} id={} by {} ms", method, id, options_.extension.count());
            deadline = std::chrono::steady_clock::now() + options_.extension;
            continue;
        }

        spdlog::info("Abandoning {} id={} after {} ms", method, id, since(started).count());
        // If the dispatcher is gone it has already completed every slot
        events_.push(AbandonEvent{id});
        break;
    }

    return future.get();
}

bool RpcSession::send(const Message& message, std::shared_ptr<std::promise<bool>> delivered) {
    return outbox_.push(Outgoing{message, std::move(delivered)});
}

void RpcSession::write_loop() {
    while (auto outgoing = outbox_.pop()) {
        bool written = write_message(outgoing->message);
        if (!written) {
            spdlog::warn("{} was not delivered to {}", describe(outgoing->message), spec_.name);
        }
        if (outgoing->delivered) {
            outgoing->delivered->set_value(written);
        }
    }
    spdlog::debug("Writer for {} exited", spec_.name);
}

bool RpcSession::write_message(const Message& message) {
    if (!process_) {
        return false;
    }
    if (!process_->write_stdin(FrameCodec::encode(message))) {
        return false;
    }
    spdlog::debug("-> {}: {}", spec_.name, describe(message));
    try {
        log_->on_sent(now(), message);
    } catch (const std::exception& e) {
        spdlog::error("Session log rejected sent message: {}", e.what());
    }
    return true;
}

void RpcSession::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (state() == SessionState::Closed) {
        return;
    }

    bool live = transition(SessionState::Closing, "close requested");

    if (dispatcher_.joinable()) {
        events_.push(ShutdownEvent{});
        dispatcher_.join();
    }
    // The writer drains what is queued; stopping the process unblocks a stalled write
    outbox_.close();
    if (tap_) {
        tap_->stop();
    }
    if (process_) {
        ProcessSupervisor::stop(*process_, options_.stop_grace);
    }
    if (writer_.joinable()) {
        writer_.join();
    }

    if (live) {
        transition(SessionState::Closed);
    }
}

SessionState RpcSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<std::string> RpcSession::failure_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failure_reason_;
}

std::vector<RawLine> RpcSession::recent_output(std::size_t n) const {
    if (!tap_) {
        return {};
    }
    return tap_->recent_output(n);
}

bool RpcSession::transition(SessionState to, std::optional<std::string> reason) {
    SessionState from;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        from = state_;
        if (!is_valid_transition(from, to)) {
            spdlog::debug("Ignoring transition {} -> {} for {}", to_string(from), to_string(to), spec_.name);
            return false;
        }
        state_ = to;
        if (to == SessionState::Failed) {
            failure_reason_ = reason.value_or("unknown failure");
        }
    }

    if (to == SessionState::Failed) {
        spdlog::error("Session with {} failed: {}", spec_.name, reason.value_or("unknown failure"));
    } else {
        spdlog::info("Session with {}: {} -> {}", spec_.name, to_string(from), to_string(to));
    }
    try {
        log_->on_state_change(now(), from, to, reason);
    } catch (const std::exception& e) {
        spdlog::error("Session log rejected state change: {}", e.what());
    }
    return true;
}

void RpcSession::dispatch_loop() {
    while (auto event = events_.pop()) {
        std::visit(overloaded{
            [this](InboundEvent& e) { on_inbound(e); },
            [this](RegisterEvent& e) { on_register(e); },
            [this](AbandonEvent& e) { on_abandon(e); },
            [this](StreamClosedEvent& e) { on_stream_closed(e); },
            [this](ShutdownEvent&) { on_shutdown(); }
        }, *event);
    }
    spdlog::debug("Dispatcher for {} exited", spec_.name);
}

void RpcSession::on_inbound(InboundEvent& event) {
    try {
        log_->on_received(event.received_at, event.message);
    } catch (const std::exception& e) {
        spdlog::error("Session log rejected received message: {}", e.what());
    }
    spdlog::debug("<- {}: {}", spec_.name, describe(event.message));

    if (auto* notification = std::get_if<Notification>(&event.message)) {
        spdlog::debug("Notification {} from {}", notification->method, spec_.name);
        return;
    }
    if (auto* server_request = std::get_if<Request>(&event.message)) {
        if (!shutting_down_ && !is_terminal(state())) {
            answer_server_request(*server_request);
        }
        return;
    }

    auto& response = std::get<Response>(event.message);
    auto it = response.id.is_number_integer()
        ? pending_.find(response.id.get<std::int64_t>())
        : pending_.end();
    if (it == pending_.end()) {
        spdlog::warn("Stray response id={} from {} (no pending call)", response.id.dump(), spec_.name);
        return;
    }

    PendingCall call = std::move(it->second);
    pending_.erase(it);
    spdlog::debug("{} id={} resolved after {} ms", call.method, call.id, since(call.submitted_at).count());

    if (response.error) {
        call.slot->set_exception(std::make_exception_ptr(
            RemoteError(response.error->code, response.error->message, response.error->data)));
    } else {
        call.slot->set_value(response.result.value_or(json::object()));
    }
}

void RpcSession::on_register(RegisterEvent& event) {
    SessionState current = state();
    if (shutting_down_ || is_terminal(current) || current == SessionState::Closing) {
        event.call.slot->set_exception(terminal_error());
        return;
    }
    std::int64_t id = event.call.id;
    pending_.emplace(id, std::move(event.call));
}

void RpcSession::on_abandon(const AbandonEvent& event) {
    auto it = pending_.find(event.id);
    if (it == pending_.end()) {
        return;  // already resolved; the response won
    }
    PendingCall call = std::move(it->second);
    pending_.erase(it);
    call.slot->set_exception(std::make_exception_ptr(TimeoutError(call.method, call.id)));
}

void RpcSession::on_stream_closed(const StreamClosedEvent& event) {
    if (event.stream != StreamKind::Stdout) {
        spdlog::debug("Server {} closed its stderr", spec_.name);
        return;
    }

    SessionState current = state();
    if (current != SessionState::Handshaking && current != SessionState::Ready) {
        return;
    }

    auto status = process_->wait_for_exit(options_.exit_status_wait);
    std::string reason = status ? status->describe() : "server closed its stdout";
    transition(SessionState::Failed, reason);
    fail_all(terminal_error());
}

void RpcSession::on_shutdown() {
    shutting_down_ = true;
    fail_all(terminal_error());
    events_.close();
}

void RpcSession::answer_server_request(const Request& server_request) {
    Response reply{server_request.id, std::nullopt, std::nullopt};
    if (server_request.method == "ping") {
        reply.result = json::object();
    } else {
        spdlog::warn("Server {} sent unsupported request {}", spec_.name, server_request.method);
        reply.error = RpcError{-32601, "Method not found: " + server_request.method, std::nullopt};
    }
    send(reply);
}

void RpcSession::fail_all(std::exception_ptr error) {
    if (!pending_.empty()) {
        spdlog::info("Failing {} pending call(s) to {}", pending_.size(), spec_.name);
    }
    // std::map iterates in id order
    for (auto& [id, call] : pending_) {
        call.slot->set_exception(error);
    }
    pending_.clear();
}

std::exception_ptr RpcSession::terminal_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == SessionState::Failed) {
        return std::make_exception_ptr(SessionFailedError(failure_reason_.value_or("unknown failure")));
    }
    return std::make_exception_ptr(SessionClosedError("session closed by client"));
}

} // namespace mcp_inspector
