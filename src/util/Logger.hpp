/**
 * @file Logger.hpp
 * @brief Thread-safe logging utility with file rotation
 *
 * Structured log lines carry an ISO 8601 timestamp, a level and a component
 * tag. Files rotate by size; an optional stderr mirror serves --debug runs.
 */

#pragma once

#include "util/Error.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Raw tool output, per-field normalization decisions
    INFO,     ///< Scan progress and per-device verdicts
    WARNING,  ///< Device-level failures that do not stop the batch
    ERROR     ///< Batch-level failures
};

/**
 * @brief Parse a level name ("debug", "info", "warning", "error")
 * @return Level, or nullopt for an unknown name
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 5 * 1024 * 1024;  ///< Size that triggers rotation
    int max_files = 5;                              ///< Rotated files kept beside the active one
};

/**
 * @struct LoggerConfig
 * @brief Everything Logger::initialize needs
 */
struct LoggerConfig {
    std::filesystem::path log_dir;      ///< Created if missing
    std::string app_name;               ///< Log file stem ({app_name}.log)
    LogLevel min_level = LogLevel::INFO;
    bool console_output = false;        ///< Mirror every accepted line to stderr
    LogRotationPolicy rotation;
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger with file output and rotation
 *
 * Usage:
 * @code
 * auto& log = util::Logger::instance();
 * log.initialize({.log_dir = dir, .app_name = "storage-grader"});
 * LOG_INFO("Discovery", std::format("Found {} devices", count));
 * @endcode
 *
 * Logging before initialize() is allowed; lines then only reach stderr
 * when console output is enabled.
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open {log_dir}/{app_name}.log for appending
     *
     * Reinitializing closes the previous file first. On failure the logger
     * keeps the level and console settings from @p config so stderr output
     * still works.
     */
    auto initialize(const LoggerConfig& config) -> std::expected<void, Error>;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void flush();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Enable/disable the stderr mirror
     */
    void set_console_output(bool enable);

    /**
     * @brief Path of the active log file, empty if not initialized
     */
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    /**
     * @brief Flush and close the log file
     */
    void shutdown();

private:
    Logger() = default;
    ~Logger();

    /**
     * @brief ISO 8601 UTC timestamp, e.g. "2026-01-22T14:32:45.123Z"
     */
    [[nodiscard]] static auto get_timestamp() -> std::string;

    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

    void write_line_locked(const std::string& line);
    void rotate_logs_locked();
    auto open_log_file_locked() -> bool;

    [[nodiscard]] auto active_path_locked() const -> std::filesystem::path;
    [[nodiscard]] auto rotated_path_locked(int index) const -> std::filesystem::path;

    mutable std::mutex mutex_;
    std::ofstream file_;
    LoggerConfig config_;
    bool initialized_ = false;
    size_t current_file_size_ = 0;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
