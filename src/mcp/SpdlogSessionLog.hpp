#pragma once

#include "mcp/SessionLog.hpp"
#include <spdlog/common.h>
#include <memory>
#include <mutex>
#include <string>

namespace spdlog {
class logger;
}

namespace mcp_inspector {

/**
 * @brief SessionLog that renders events as text lines on a spdlog logger
 *
 * The logger is expected to use the "%v" pattern; each line is prefixed
 * with the event's own timestamp (HH:MM:SS.mmm) rather than spdlog's.
 *
 * An optional monitor logger receives the same traffic, raw output and
 * state lines as they happen (live console view). Notes go to the main
 * logger only. Server stderr is logged at warn and failures at error, so a
 * color sink tells them apart.
 */
class SpdlogSessionLog : public SessionLog {
public:
    /**
     * @brief Construct sink
     * @param logger Destination logger (typically a basic_file_sink_mt); may be
     *        null when a monitor is given
     * @param server_name Name shown in message prefixes
     * @param monitor Optional live console logger
     * @throws std::invalid_argument if both loggers are null
     */
    SpdlogSessionLog(std::shared_ptr<spdlog::logger> logger,
                     std::string server_name,
                     std::shared_ptr<spdlog::logger> monitor = nullptr);

    /**
     * @brief Create a file-backed logger for a new session log
     * @param path File to append to; parent directories are created
     */
    static std::shared_ptr<spdlog::logger> make_file_logger(const std::string& path);

    /**
     * @brief Create a stdout logger for live monitoring
     * @param color Color lines by level (otherwise plain text)
     */
    static std::shared_ptr<spdlog::logger> make_console_logger(bool color);

    /**
     * @brief Build the default log file name, session-YYYYMMDD-HHMMSS.txt
     */
    static std::string default_file_name(Timestamp at);

    /**
     * @brief Format a timestamp as local HH:MM:SS.mmm
     */
    static std::string format_time(Timestamp at);

    void set_server_name(std::string server_name);

    void on_sent(Timestamp at, const Message& message) override;
    void on_received(Timestamp at, const Message& message) override;
    void on_raw_output(const RawLine& line) override;
    void on_state_change(Timestamp at,
                         SessionState old_state,
                         SessionState new_state,
                         const std::optional<std::string>& reason) override;

    /**
     * @brief Append a free-form line (menu choices, summaries)
     */
    void note(Timestamp at, const std::string& text);

private:
    std::string server_name() const;
    void emit(spdlog::level::level_enum level, const std::string& line);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> monitor_;
    mutable std::mutex name_mutex_;
    std::string server_name_;
};

} // namespace mcp_inspector
