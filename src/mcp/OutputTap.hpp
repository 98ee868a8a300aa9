#pragma once

#include "core/Message.hpp"
#include "core/RingBuffer.hpp"
#include "mcp/SessionLog.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mcp_inspector {

struct OutputTapOptions {
    std::size_t ring_capacity = 1000;
    std::size_t max_line_length = 1024 * 1024;
};

/**
 * @brief Drains a child's stdout and stderr on two background threads
 *
 * Each complete stdout line is decoded with FrameCodec; decoded messages
 * go to the message handler, everything else (undecodable stdout lines,
 * every stderr line, a final unterminated fragment, the head of an
 * over-long line) becomes a RawLine in the ring buffer and in the
 * SessionLog. The handlers are invoked on the drain threads and must not
 * block.
 */
class OutputTap {
public:
    using MessageHandler = std::function<void(Message message, Timestamp received_at)>;
    using ClosedHandler = std::function<void(StreamKind stream)>;

    /**
     * @brief Start draining both descriptors
     * @param stdout_fd Read end of the child's stdout (not owned)
     * @param stderr_fd Read end of the child's stderr (not owned)
     * @param on_message Called for each decoded stdout message
     * @param on_closed Called once per stream when it reaches EOF
     * @param log Sink for raw output events
     * @param options Buffer limits
     */
    OutputTap(int stdout_fd,
              int stderr_fd,
              MessageHandler on_message,
              ClosedHandler on_closed,
              std::shared_ptr<SessionLog> log,
              OutputTapOptions options = {});

    ~OutputTap();

    OutputTap(const OutputTap&) = delete;
    OutputTap& operator=(const OutputTap&) = delete;

    /**
     * @brief Last n raw lines across both streams, most recent last
     */
    std::vector<RawLine> recent_output(std::size_t n) const;

    /**
     * @brief Stop both drain threads and wait for them to exit
     *
     * Idempotent; safe to call after the streams have already closed.
     */
    void stop();

private:
    void drain(int fd, StreamKind stream);
    void handle_line(StreamKind stream, std::string line, bool complete);
    void emit_raw(StreamKind stream, std::string text);

    MessageHandler on_message_;
    ClosedHandler on_closed_;
    std::shared_ptr<SessionLog> log_;
    OutputTapOptions options_;
    RingBuffer<RawLine> ring_;

    int wake_pipe_[2] = {-1, -1};
    std::mutex stop_mutex_;
    bool stopped_ = false;
    std::thread stdout_thread_;
    std::thread stderr_thread_;
};

} // namespace mcp_inspector
