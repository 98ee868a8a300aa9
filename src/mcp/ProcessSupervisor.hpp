#pragma once

#include "core/ServerSpec.hpp"
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcp_inspector {

/**
 * @brief How a child process ended
 */
struct ExitStatus {
    bool signaled = false;
    int code = 0;  // exit status, or signal number when signaled

    /**
     * @brief "process exited with status N" or "process killed by signal N"
     */
    std::string describe() const;
};

/**
 * @brief A running child process and its three pipe endpoints
 *
 * Owns the write end of the child's stdin and the read ends of its stdout
 * and stderr. Descriptors are closed on destruction; the process itself is
 * terminated by ProcessSupervisor::stop(), which the destructor also calls
 * if the process was never stopped.
 */
class ProcessHandle {
public:
    ProcessHandle(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd, std::string name);
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }
    const std::string& name() const { return name_; }

    /**
     * @brief Write all bytes to the child's stdin
     *
     * The pipe is non-blocking; while it is full the write waits for the
     * child to read, until close_stdin() is called from another thread.
     *
     * @return false if the pipe is closed, broken, or closed while waiting
     */
    bool write_stdin(const std::string& data);

    /**
     * @brief Close the child's stdin (the child sees EOF)
     *
     * A write_stdin() blocked on a full pipe gives up within kWritePollInterval.
     */
    void close_stdin();

    static constexpr std::chrono::milliseconds kWritePollInterval{100};

    /**
     * @brief Non-blocking exit check; the result is cached once known
     * @return Exit status, or std::nullopt while the process is running
     */
    std::optional<ExitStatus> exit_status();

    /**
     * @brief Poll exit_status() until it resolves or the timeout elapses
     */
    std::optional<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout);

private:
    friend class ProcessSupervisor;

    std::optional<ExitStatus> reap(bool block);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    std::string name_;

    std::mutex stdin_mutex_;
    std::atomic<bool> stdin_closing_{false};
    std::mutex status_mutex_;
    std::optional<ExitStatus> exit_status_;
    bool stopped_ = false;
};

/**
 * @brief Starts and stops MCP server child processes
 */
class ProcessSupervisor {
public:
    /**
     * @brief Spawn the server described by spec with piped stdio
     *
     * The command is resolved through PATH. The child runs in
     * spec.working_directory when set, with spec.env merged into the
     * inherited environment.
     *
     * @throws SpawnError if pipes cannot be created, the working directory
     *         is unusable, or the command cannot be executed
     */
    static std::unique_ptr<ProcessHandle> start(const ServerSpec& spec);

    /**
     * @brief Terminate the process: SIGTERM, wait up to grace_period, then SIGKILL
     *
     * Best effort and idempotent. The stdin pipe is closed first so
     * well-behaved servers can exit on EOF.
     *
     * @return true if the process was still alive when stop() was called
     */
    static bool stop(ProcessHandle& handle, std::chrono::milliseconds grace_period);
};

} // namespace mcp_inspector
