#include "OutputTap.hpp"
#include "core/FrameCodec.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>

namespace mcp_inspector {

OutputTap::OutputTap(int stdout_fd,
                     int stderr_fd,
                     MessageHandler on_message,
                     ClosedHandler on_closed,
                     std::shared_ptr<SessionLog> log,
                     OutputTapOptions options)
    : on_message_(std::move(on_message)),
      on_closed_(std::move(on_closed)),
      log_(log ? std::move(log) : std::make_shared<NullSessionLog>()),
      options_(options),
      ring_(options.ring_capacity) {
    if (options_.max_line_length == 0) {
        throw std::invalid_argument("max_line_length must be positive");
    }
    if (::pipe2(wake_pipe_, O_CLOEXEC) != 0) {
        throw std::runtime_error("Failed to create wake pipe: " + std::string(std::strerror(errno)));
    }

    stdout_thread_ = std::thread(&OutputTap::drain, this, stdout_fd, StreamKind::Stdout);
    stderr_thread_ = std::thread(&OutputTap::drain, this, stderr_fd, StreamKind::Stderr);
    spdlog::debug("OutputTap started (ring capacity {})", options_.ring_capacity);
}

OutputTap::~OutputTap() {
    stop();
    for (int& fd : wake_pipe_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

std::vector<RawLine> OutputTap::recent_output(std::size_t n) const {
    return ring_.last(n);
}

void OutputTap::stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;

    // The byte is never consumed, so both threads observe the wake-up
    char byte = 1;
    while (::write(wake_pipe_[1], &byte, 1) < 0 && errno == EINTR) {
    }

    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
    spdlog::debug("OutputTap stopped");
}

void OutputTap::drain(int fd, StreamKind stream) {
    std::string pending;
    bool discarding = false;
    bool reached_eof = false;
    char buffer[4096];

    while (true) {
        pollfd fds[2] = {
            {fd, POLLIN, 0},
            {wake_pipe_[0], POLLIN, 0}
        };
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on server {} failed: {}", to_string(stream), std::strerror(errno));
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }
        if (fds[0].revents == 0) {
            continue;
        }

        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::error("read from server {} failed: {}", to_string(stream), std::strerror(errno));
            reached_eof = true;
            break;
        }
        if (n == 0) {
            reached_eof = true;
            break;
        }

        pending.append(buffer, static_cast<size_t>(n));

        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            if (discarding) {
                discarding = false;
            } else {
                handle_line(stream, pending.substr(start, newline - start), true);
            }
            start = newline + 1;
        }
        pending.erase(0, start);

        if (pending.size() > options_.max_line_length) {
            if (!discarding) {
                spdlog::warn("Server {} line exceeds {} bytes, truncating",
                             to_string(stream), options_.max_line_length);
                handle_line(stream, pending, false);
                discarding = true;
            }
            pending.clear();
        }
    }

    if (reached_eof) {
        if (!pending.empty() && !discarding) {
            handle_line(stream, std::move(pending), false);
        }
        spdlog::debug("Server {} reached EOF", to_string(stream));
        if (on_closed_) {
            on_closed_(stream);
        }
    }
}

void OutputTap::handle_line(StreamKind stream, std::string line, bool complete) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.size() > options_.max_line_length) {
        line.resize(options_.max_line_length);
        complete = false;
    }

    // stderr is never protocol-framed, and a fragment cannot be a whole message
    if (stream == StreamKind::Stdout && complete) {
        DecodeResult result = FrameCodec::decode_line(line);
        if (auto* message = std::get_if<Message>(&result)) {
            if (on_message_) {
                on_message_(std::move(*message), std::chrono::system_clock::now());
            }
            return;
        }
        spdlog::trace("Non-protocol stdout line ({})", std::get<ParseError>(result).reason);
    }

    emit_raw(stream, std::move(line));
}

void OutputTap::emit_raw(StreamKind stream, std::string text) {
    RawLine raw{stream, std::chrono::system_clock::now(), std::move(text)};
    ring_.push(raw);
    try {
        log_->on_raw_output(raw);
    } catch (const std::exception& e) {
        spdlog::error("Session log rejected raw output: {}", e.what());
    }
}

} // namespace mcp_inspector
