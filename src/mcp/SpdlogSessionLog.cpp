#include "SpdlogSessionLog.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/fmt.h>
#include <ctime>
#include <cstdio>
#include <stdexcept>

namespace mcp_inspector {

namespace {

std::tm local_time(Timestamp at) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(at);
    std::tm tm{};
    localtime_r(&seconds, &tm);
    return tm;
}

} // namespace

SpdlogSessionLog::SpdlogSessionLog(std::shared_ptr<spdlog::logger> logger,
                                   std::string server_name,
                                   std::shared_ptr<spdlog::logger> monitor)
    : logger_(std::move(logger)), monitor_(std::move(monitor)), server_name_(std::move(server_name)) {
    if (!logger_ && !monitor_) {
        throw std::invalid_argument("Logger cannot be null");
    }
}

std::shared_ptr<spdlog::logger> SpdlogSessionLog::make_file_logger(const std::string& path) {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    auto logger = std::make_shared<spdlog::logger>("session", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::info);
    return logger;
}

std::shared_ptr<spdlog::logger> SpdlogSessionLog::make_console_logger(bool color) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(
        color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
    auto logger = std::make_shared<spdlog::logger>("monitor", sink);
    logger->set_pattern("%^%v%$");
    logger->set_level(spdlog::level::info);
    return logger;
}

std::string SpdlogSessionLog::default_file_name(Timestamp at) {
    std::tm tm = local_time(at);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "session-%Y%m%d-%H%M%S.txt", &tm);
    return buffer;
}

std::string SpdlogSessionLog::format_time(Timestamp at) {
    std::tm tm = local_time(at);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        at.time_since_epoch()).count() % 1000;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
    return buffer;
}

void SpdlogSessionLog::set_server_name(std::string server_name) {
    std::lock_guard<std::mutex> lock(name_mutex_);
    server_name_ = std::move(server_name);
}

std::string SpdlogSessionLog::server_name() const {
    std::lock_guard<std::mutex> lock(name_mutex_);
    return server_name_;
}

void SpdlogSessionLog::emit(spdlog::level::level_enum level, const std::string& line) {
    if (logger_) {
        logger_->log(level, "{}", line);
    }
    if (monitor_) {
        monitor_->log(level, "{}", line);
    }
}

void SpdlogSessionLog::on_sent(Timestamp at, const Message& message) {
    emit(spdlog::level::info, fmt::format("[{}] INSPECTOR -> {}: {}",
                                          format_time(at), server_name(), to_json(message).dump()));
}

void SpdlogSessionLog::on_received(Timestamp at, const Message& message) {
    emit(spdlog::level::info, fmt::format("[{}] MCP-{} -> INSPECTOR: {}",
                                          format_time(at), server_name(), to_json(message).dump()));
}

void SpdlogSessionLog::on_raw_output(const RawLine& line) {
    if (line.stream == StreamKind::Stderr) {
        emit(spdlog::level::warn, fmt::format("[{}] ! STDERR {}: {}",
                                              format_time(line.timestamp), server_name(), line.text));
    } else {
        emit(spdlog::level::info, fmt::format("[{}] MCP-{} stdout: {}",
                                              format_time(line.timestamp), server_name(), line.text));
    }
}

void SpdlogSessionLog::on_state_change(Timestamp at,
                                       SessionState old_state,
                                       SessionState new_state,
                                       const std::optional<std::string>& reason) {
    auto level = new_state == SessionState::Failed ? spdlog::level::err : spdlog::level::info;
    if (reason) {
        emit(level, fmt::format("[{}] STATE {} -> {} ({})", format_time(at),
                                to_string(old_state), to_string(new_state), *reason));
    } else {
        emit(level, fmt::format("[{}] STATE {} -> {}", format_time(at),
                                to_string(old_state), to_string(new_state)));
    }
}

void SpdlogSessionLog::note(Timestamp at, const std::string& text) {
    if (logger_) {
        logger_->info("[{}] {}", format_time(at), text);
    }
}

} // namespace mcp_inspector
