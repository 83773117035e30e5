/**
 * @file Logger.cpp
 * @brief Thread-safe logging utility implementation
 */

#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace util {

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::WARNING;
    }
    if (lower == "error") {
        return LogLevel::ERROR;
    }
    return std::nullopt;
}

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::initialize(const LoggerConfig& config) -> std::expected<void, Error> {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    config_ = config;
    initialized_ = false;
    current_file_size_ = 0;

    if (config_.app_name.empty()) {
        return std::unexpected(Error{"Logger: application name is empty",
                                     ErrorCode::INVALID_ARGUMENT});
    }

    std::error_code ec;
    if (!std::filesystem::exists(config_.log_dir, ec)) {
        if (!std::filesystem::create_directories(config_.log_dir, ec)) {
            return std::unexpected(Error{
                std::format("Logger: failed to create log directory {}: {}",
                            config_.log_dir.string(), ec.message()),
                ErrorCode::INVALID_ARGUMENT});
        }
    }

    if (!open_log_file_locked()) {
        return std::unexpected(Error{
            std::format("Logger: failed to open log file {}", active_path_locked().string()),
            ErrorCode::INVALID_ARGUMENT});
    }

    initialized_ = true;

    write_line_locked(std::format("{}[{}] [Logger] Logger initialized: app={} dir={} level={} "
                                  "max_size={} max_files={}\n",
                                  get_timestamp(), level_to_string(LogLevel::INFO),
                                  config_.app_name, config_.log_dir.string(),
                                  level_to_string(config_.min_level),
                                  config_.rotation.max_file_size_bytes,
                                  config_.rotation.max_files));
    return {};
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::active_path_locked() const -> std::filesystem::path {
    return config_.log_dir / (config_.app_name + ".log");
}

auto Logger::rotated_path_locked(int index) const -> std::filesystem::path {
    return config_.log_dir / std::format("{}.{}.log", config_.app_name, index);
}

auto Logger::open_log_file_locked() -> bool {
    auto log_path = active_path_locked();

    file_.open(log_path, std::ios::app);
    if (!file_.is_open()) {
        return false;
    }

    std::error_code ec;
    current_file_size_ = std::filesystem::file_size(log_path, ec);
    if (ec) {
        current_file_size_ = 0;
    }
    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    auto line = std::format("{}[{}] [{}] {}\n", get_timestamp(), level_to_string(level),
                            component, message);

    if (initialized_ && file_.is_open()) {
        if (current_file_size_ + line.size() > config_.rotation.max_file_size_bytes) {
            rotate_logs_locked();
        }
        write_line_locked(line);
    }

    if (config_.console_output) {
        std::cerr << line;
    }
}

void Logger::write_line_locked(const std::string& line) {
    if (!file_.is_open()) {
        return;
    }
    file_ << line;
    file_.flush();
    current_file_size_ += line.size();
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    config_.min_level = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return config_.min_level;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    config_.console_output = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return active_path_locked();
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);

    if (initialized_ && file_.is_open()) {
        write_line_locked(std::format("{}[{}] [Logger] Logger shutting down\n", get_timestamp(),
                                      level_to_string(LogLevel::INFO)));
        file_.close();
    }

    initialized_ = false;
}

auto Logger::get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << "Z ";

    return oss.str();
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

void Logger::rotate_logs_locked() {
    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;
    const int max_files = std::max(config_.rotation.max_files, 1);

    std::filesystem::remove(rotated_path_locked(max_files), ec);

    // {app}.{n-1}.log -> {app}.{n}.log ... {app}.1.log -> {app}.2.log
    for (int i = max_files - 1; i >= 1; --i) {
        auto old_path = rotated_path_locked(i);
        if (std::filesystem::exists(old_path, ec)) {
            std::filesystem::rename(old_path, rotated_path_locked(i + 1), ec);
        }
    }

    auto base_path = active_path_locked();
    if (std::filesystem::exists(base_path, ec)) {
        std::filesystem::rename(base_path, rotated_path_locked(1), ec);
    }

    if (!open_log_file_locked()) {
        initialized_ = false;
        std::cerr << "Logger: failed to reopen log file after rotation: " << base_path << '\n';
        return;
    }

    write_line_locked(std::format("{}[{}] [Logger] Log file rotated\n", get_timestamp(),
                                  level_to_string(LogLevel::INFO)));
}

}  // namespace util
