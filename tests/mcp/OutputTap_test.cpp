#include <gtest/gtest.h>
#include "mcp/OutputTap.hpp"
#include "RecordingSessionLog.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <unistd.h>

using namespace mcp_inspector;

class OutputTapTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(stdout_pipe_), 0);
        ASSERT_EQ(::pipe(stderr_pipe_), 0);
        log_ = std::make_shared<RecordingSessionLog>();
    }

    void TearDown() override {
        tap_.reset();
        for (int fd : {stdout_pipe_[0], stdout_pipe_[1], stderr_pipe_[0], stderr_pipe_[1]}) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    void start(OutputTapOptions options = {}) {
        tap_ = std::make_unique<OutputTap>(
            stdout_pipe_[0], stderr_pipe_[0],
            [this](Message message, Timestamp) {
                std::lock_guard<std::mutex> lock(mutex_);
                messages_.push_back(std::move(message));
            },
            [this](StreamKind stream) {
                if (stream == StreamKind::Stdout) {
                    ++stdout_closed_;
                } else {
                    ++stderr_closed_;
                }
            },
            log_, options);
    }

    void write_stdout(const std::string& data) {
        ASSERT_EQ(::write(stdout_pipe_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void write_stderr(const std::string& data) {
        ASSERT_EQ(::write(stderr_pipe_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_writers() {
        ::close(stdout_pipe_[1]);
        ::close(stderr_pipe_[1]);
        stdout_pipe_[1] = -1;
        stderr_pipe_[1] = -1;
    }

    bool wait_closed() {
        return log_->wait_for([this](const RecordingSessionLog&) {
            return stdout_closed_ == 1 && stderr_closed_ == 1;
        });
    }

    std::vector<Message> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    int stdout_pipe_[2] = {-1, -1};
    int stderr_pipe_[2] = {-1, -1};
    std::shared_ptr<RecordingSessionLog> log_;
    std::unique_ptr<OutputTap> tap_;

    std::mutex mutex_;
    std::vector<Message> messages_;
    std::atomic<int> stdout_closed_{0};
    std::atomic<int> stderr_closed_{0};
};

TEST_F(OutputTapTest, DecodesProtocolLinesAndKeepsOthersRaw) {
    start();
    write_stdout("not json\n");
    write_stdout("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n");
    close_writers();
    ASSERT_TRUE(wait_closed());

    auto decoded = messages();
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<Response>(decoded[0]));

    auto recent = tap_->recent_output(10);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].stream, StreamKind::Stdout);
    EXPECT_EQ(recent[0].text, "not json");
}

TEST_F(OutputTapTest, ReassemblesLinesSplitAcrossWrites) {
    start();
    write_stdout("{\"jsonrpc\":\"2.0\",");
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    write_stdout("\"method\":\"notifications/message\"}\n{\"jsonrpc\":\"2.0\",\"id\":2,");
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    write_stdout("\"result\":{}}\n");
    close_writers();
    ASSERT_TRUE(wait_closed());

    auto decoded = messages();
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<Notification>(decoded[0]));
    EXPECT_TRUE(std::holds_alternative<Response>(decoded[1]));
    EXPECT_TRUE(tap_->recent_output(10).empty());
}

TEST_F(OutputTapTest, EmptyStdoutLineIsRawAndDrainContinues) {
    start();
    write_stdout("\n");
    write_stdout("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n");
    close_writers();
    ASSERT_TRUE(wait_closed());

    auto decoded = messages();
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<Response>(decoded[0]));

    auto recent = tap_->recent_output(10);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].stream, StreamKind::Stdout);
    EXPECT_EQ(recent[0].text, "");
}

TEST_F(OutputTapTest, StderrIsAlwaysRaw) {
    start();
    write_stderr("warning: something\n");
    write_stderr("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n");
    close_writers();
    ASSERT_TRUE(wait_closed());

    EXPECT_TRUE(messages().empty());
    auto raw = log_->raw_output();
    ASSERT_EQ(raw.size(), 2u);
    EXPECT_EQ(raw[0].stream, StreamKind::Stderr);
    EXPECT_EQ(raw[0].text, "warning: something");
}

TEST_F(OutputTapTest, UnterminatedFinalLineIsRaw) {
    start();
    write_stdout("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}");
    close_writers();
    ASSERT_TRUE(wait_closed());

    EXPECT_TRUE(messages().empty());
    auto recent = tap_->recent_output(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].text, "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}");
}

TEST_F(OutputTapTest, StripsCarriageReturns) {
    start();
    write_stderr("windows line\r\n");
    close_writers();
    ASSERT_TRUE(wait_closed());

    auto recent = tap_->recent_output(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].text, "windows line");
}

TEST_F(OutputTapTest, OverlongLineIsTruncatedAndRestDiscarded) {
    OutputTapOptions options;
    options.max_line_length = 16;
    start(options);

    write_stdout(std::string(100, 'x') + "\nshort\n");
    close_writers();
    ASSERT_TRUE(wait_closed());

    auto recent = tap_->recent_output(10);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].text, std::string(16, 'x'));
    EXPECT_EQ(recent[1].text, "short");
}

TEST_F(OutputTapTest, RingKeepsMostRecentLines) {
    OutputTapOptions options;
    options.ring_capacity = 3;
    start(options);

    for (int i = 0; i < 10; ++i) {
        write_stderr("line " + std::to_string(i) + "\n");
    }
    close_writers();
    ASSERT_TRUE(wait_closed());

    auto recent = tap_->recent_output(100);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].text, "line 7");
    EXPECT_EQ(recent[2].text, "line 9");
    // The session log sees everything, not just what the ring keeps
    EXPECT_EQ(log_->raw_output().size(), 10u);
}

TEST_F(OutputTapTest, ClosedFiresOncePerStream) {
    start();
    close_writers();
    ASSERT_TRUE(wait_closed());

    tap_->stop();
    EXPECT_EQ(stdout_closed_.load(), 1);
    EXPECT_EQ(stderr_closed_.load(), 1);
}

TEST_F(OutputTapTest, StopReturnsWhileStreamsStillOpen) {
    start();
    write_stderr("still running\n");
    ASSERT_TRUE(log_->wait_for([](const RecordingSessionLog& log) { return log.raw_output().size() == 1; }));

    tap_->stop();
    tap_->stop();

    // Stopping is not a stream closure
    EXPECT_EQ(stdout_closed_.load(), 0);
    EXPECT_EQ(stderr_closed_.load(), 0);
}
