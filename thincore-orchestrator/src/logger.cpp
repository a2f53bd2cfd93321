/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace thincore {

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

std::map<std::string, std::string> Logger::context_fields(
    const std::string& event,
    const LogContext& ctx
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    if (!ctx.run_id.empty()) fields["run_id"] = ctx.run_id;
    if (!ctx.task_key.empty()) fields["task_key"] = ctx.task_key;
    if (!ctx.task_type.empty()) fields["task_type"] = ctx.task_type;
    if (!ctx.worker_id.empty()) fields["worker_id"] = ctx.worker_id;
    if (!ctx.phase.empty()) fields["phase"] = ctx.phase;
    return fields;
}

void Logger::log_task_dispatched(const LogContext& ctx, int attempt) {
    auto fields = context_fields("task_dispatched", ctx);
    fields["attempt"] = std::to_string(attempt);
    log(LogLevel::INFO, "Task dispatched", fields);
}

void Logger::log_task_cached(const LogContext& ctx, const std::string& artifact_hash) {
    auto fields = context_fields("task_cached", ctx);
    fields["artifact_hash"] = artifact_hash;
    log(LogLevel::INFO, "Task resolved from manifest", fields);
}

void Logger::log_task_claimed(const LogContext& ctx, int attempt) {
    auto fields = context_fields("task_claimed", ctx);
    fields["attempt"] = std::to_string(attempt);
    log(attempt > 0 ? LogLevel::WARN : LogLevel::INFO,
        attempt > 0 ? "Task redelivered" : "Task claimed", fields);
}

void Logger::log_task_completed(
    const LogContext& ctx,
    const std::string& artifact_hash,
    int64_t cost_units,
    double duration_ms
) {
    auto fields = context_fields("task_completed", ctx);
    fields["artifact_hash"] = artifact_hash;
    fields["cost_units"] = std::to_string(cost_units);
    fields["duration_ms"] = std::to_string(duration_ms);
    log(LogLevel::INFO, "Task completed", fields);
}

void Logger::log_task_dead_lettered(
    const LogContext& ctx,
    const std::string& status,
    const std::string& reason
) {
    auto fields = context_fields("task_dead_lettered", ctx);
    fields["status"] = status;
    fields["reason"] = reason;
    log(status == "failed" ? LogLevel::ERROR : LogLevel::WARN, "Task dead-lettered", fields);
}

void Logger::log_cost_decision(
    const LogContext& ctx,
    bool granted,
    int64_t estimate_units,
    int64_t spent_units,
    int64_t in_flight_units,
    int64_t ceiling_units
) {
    auto fields = context_fields("cost_decision", ctx);
    fields["granted"] = granted ? "true" : "false";
    fields["estimate_units"] = std::to_string(estimate_units);
    fields["spent_units"] = std::to_string(spent_units);
    fields["in_flight_units"] = std::to_string(in_flight_units);
    fields["ceiling_units"] = ceiling_units < 0 ? "unlimited" : std::to_string(ceiling_units);
    log(granted ? LogLevel::DEBUG : LogLevel::WARN,
        granted ? "Reservation granted" : "Reservation denied", fields);
}

void Logger::log_state_transition(
    const LogContext& ctx,
    const std::string& old_state,
    const std::string& new_state
) {
    auto fields = context_fields("state_transition", ctx);
    fields["old_state"] = old_state;
    fields["new_state"] = new_state;
    log(LogLevel::DEBUG, "State transition", fields);
}

void Logger::log_run_summary(
    const LogContext& ctx,
    const std::string& status,
    const std::map<std::string, std::string>& counters
) {
    auto fields = context_fields("run_summary", ctx);
    fields["status"] = status;
    for (const auto& [key, value] : counters) {
        fields[key] = value;
    }
    log(status == "completed" ? LogLevel::INFO : LogLevel::WARN, "Run finished", fields);
}

void Logger::log_info(
    const LogContext& ctx,
    const std::string& message,
    const std::map<std::string, std::string>& extra
) {
    auto fields = context_fields("info", ctx);
    for (const auto& [key, value] : extra) {
        fields[key] = value;
    }
    log(LogLevel::INFO, message, fields);
}

void Logger::log_debug(
    const LogContext& ctx,
    const std::string& message,
    const std::map<std::string, std::string>& extra
) {
    auto fields = context_fields("debug", ctx);
    for (const auto& [key, value] : extra) {
        fields[key] = value;
    }
    log(LogLevel::DEBUG, message, fields);
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    auto fields = context_fields("error", ctx);
    fields["error_message"] = error_message;
    log(LogLevel::ERROR, error_message, fields);
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    auto fields = context_fields("warning", ctx);
    fields["warning"] = warning_message;
    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    return oss.str();
}

std::string Logger::mask_token(const std::string& token) {
    if (token.size() <= 8) {
        return "***";
    }
    // Show first 4 and last 4 characters
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
}

std::string Logger::mask_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return url;
    }
    auto authority_start = scheme_end + 3;
    auto at = url.find('@', authority_start);
    auto slash = url.find('/', authority_start);
    if (at == std::string::npos || (slash != std::string::npos && slash < at)) {
        return url;
    }

    std::string userinfo = url.substr(authority_start, at - authority_start);
    auto colon = userinfo.find(':');
    std::string masked = colon == std::string::npos
        ? "***"
        : userinfo.substr(0, colon) + ":***";
    return url.substr(0, authority_start) + masked + url.substr(at);
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace thincore
