#include "ProcessSupervisor.hpp"
#include "mcp/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace mcp_inspector {

namespace {

// Written by the child to the exec-status pipe when it cannot start
struct ChildFailure {
    int stage;  // 0 = chdir, 1 = exec
    int error;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[item.substr(0, eq)] = item.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

std::vector<char*> as_argv(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

std::once_flag sigpipe_once;

} // namespace

std::string ExitStatus::describe() const {
    if (signaled) {
        return "process killed by signal " + std::to_string(code);
    }
    return "process exited with status " + std::to_string(code);
}

ProcessHandle::ProcessHandle(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd, std::string name)
    : pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      name_(std::move(name)) {}

ProcessHandle::~ProcessHandle() {
    if (!stopped_) {
        ProcessSupervisor::stop(*this, std::chrono::milliseconds(500));
    }
    close_stdin();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

bool ProcessHandle::write_stdin(const std::string& data) {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    if (stdin_fd_ < 0) {
        return false;
    }

    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        if (stdin_closing_) {
            spdlog::debug("Write to {} stdin interrupted by close", name_);
            return false;
        }
        ssize_t written = ::write(stdin_fd_, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Pipe full: the child is not reading right now
                pollfd pfd{stdin_fd_, POLLOUT, 0};
                ::poll(&pfd, 1, static_cast<int>(kWritePollInterval.count()));
                continue;
            }
            spdlog::warn("Write to {} stdin failed: {}", name_, std::strerror(errno));
            return false;
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

void ProcessHandle::close_stdin() {
    stdin_closing_ = true;
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    close_fd(stdin_fd_);
}

std::optional<ExitStatus> ProcessHandle::exit_status() {
    return reap(false);
}

std::optional<ExitStatus> ProcessHandle::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto status = reap(false);
        if (status || std::chrono::steady_clock::now() >= deadline) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::optional<ExitStatus> ProcessHandle::reap(bool block) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (exit_status_ || pid_ <= 0) {
        return exit_status_;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return std::nullopt;
    }
    if (result < 0) {
        spdlog::error("waitpid({}) failed: {}", pid_, std::strerror(errno));
        exit_status_ = ExitStatus{false, -1};
        return exit_status_;
    }

    if (WIFSIGNALED(status)) {
        exit_status_ = ExitStatus{true, WTERMSIG(status)};
    } else {
        exit_status_ = ExitStatus{false, WEXITSTATUS(status)};
    }
    spdlog::info("Server {} (pid {}) ended: {}", name_, pid_, exit_status_->describe());
    return exit_status_;
}

std::unique_ptr<ProcessHandle> ProcessSupervisor::start(const ServerSpec& spec) {
    if (spec.command.empty()) {
        throw SpawnError("server '" + spec.name + "' has no command");
    }

    // A dead child must surface as a failed write, not kill the inspector
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    std::vector<std::string> argv_strings;
    argv_strings.push_back(spec.command);
    argv_strings.insert(argv_strings.end(), spec.args.begin(), spec.args.end());
    std::vector<std::string> env_strings = build_environment(spec.env);

    std::vector<char*> argv = as_argv(argv_strings);
    std::vector<char*> envp = as_argv(env_strings);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&] {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
    };

    if (::pipe2(stdin_pipe, O_CLOEXEC) != 0 || ::pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(stderr_pipe, O_CLOEXEC) != 0 || ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        throw SpawnError("failed to create pipes: " + std::string(std::strerror(err)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw SpawnError("fork failed: " + std::string(std::strerror(err)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        std::signal(SIGPIPE, SIG_DFL);

        ChildFailure failure{0, 0};
        if (spec.working_directory && ::chdir(spec.working_directory->c_str()) != 0) {
            failure = ChildFailure{0, errno};
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            failure = ChildFailure{1, errno};
        }
        ssize_t ignored = ::write(status_pipe[1], &failure, sizeof(failure));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_all();
        std::string what = failure.stage == 0
            ? "cannot enter working directory '" + spec.working_directory.value_or("") + "'"
            : "cannot execute '" + spec.command + "'";
        throw SpawnError(what + ": " + std::strerror(failure.error));
    }

    // Writes must not block past close_stdin(); see write_stdin()
    int flags = ::fcntl(stdin_pipe[1], F_GETFL);
    if (flags < 0 || ::fcntl(stdin_pipe[1], F_SETFL, flags | O_NONBLOCK) != 0) {
        spdlog::warn("Cannot make stdin of {} non-blocking: {}", spec.name, std::strerror(errno));
    }

    spdlog::info("Started server {} (pid {}): {}", spec.name, pid, spec.command_line());

    auto handle = std::make_unique<ProcessHandle>(
        pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0], spec.name);
    stdin_pipe[1] = -1;
    stdout_pipe[0] = -1;
    stderr_pipe[0] = -1;
    return handle;
}

bool ProcessSupervisor::stop(ProcessHandle& handle, std::chrono::milliseconds grace_period) {
    bool was_alive = !handle.exit_status().has_value();
    handle.close_stdin();

    if (was_alive) {
        spdlog::info("Stopping server {} (pid {})", handle.name(), handle.pid());
        ::kill(handle.pid(), SIGTERM);

        if (!handle.wait_for_exit(grace_period)) {
            spdlog::warn("Server {} did not exit within {} ms, sending SIGKILL",
                         handle.name(), grace_period.count());
            ::kill(handle.pid(), SIGKILL);
            handle.reap(true);
        }
    }

    handle.stopped_ = true;
    return was_alive;
}

} // namespace mcp_inspector
