/**
 * @file SecureLogger.hpp
 * @brief Logging facility with levels, file rotation and secret redaction
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace mcprelay {
namespace sdk {

/**
 * @brief Process-wide logger shared by the relay and the bridge
 *
 * Until initialize() is called, WARNING and above go to stderr and everything
 * else is dropped. Secrets must never be passed in; fingerprints go through
 * redact().
 */
class SecureLogger {
public:
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Get the singleton instance of the logger
     * @return Reference to the singleton instance
     */
    static SecureLogger& instance();

    /**
     * @brief Check whether initialize() has been called on the singleton
     */
    static bool is_initialized();

    /**
     * @brief Initialize the logger
     * @param log_dir Directory to store log files in
     * @param file_prefix Log file name prefix ("relay", "bridge")
     * @param min_level Minimum log level to record
     */
    void initialize(const std::string& log_dir,
                    const std::string& file_prefix,
                    LogLevel min_level = LogLevel::INFO);

    /**
     * @brief Log a message with a specific level
     */
    void log(LogLevel level, const std::string& message);

    // Convenience methods for different log levels
    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    ~SecureLogger();

    LogLevel get_log_level() const { return min_level_; }
    void set_log_level(LogLevel level) { min_level_ = level; }
    bool is_level_enabled(LogLevel level) const { return level >= min_level_; }

    /**
     * @brief Mirror every record to stderr, not only WARNING and above
     */
    void set_console_output(bool enabled) { console_output_ = enabled; }

    std::string get_log_path() const { return log_path_; }

    /**
     * @brief Flush log buffers
     */
    void flush();

    /**
     * @brief Shorten a fingerprint or identifier for log output
     * @return The first few characters followed by "..."
     */
    static std::string redact(const std::string& value);

    /**
     * @brief Parse "trace", "debug", "info", "warning", "error" or "critical"
     * @return The parsed level, INFO for anything unrecognised
     */
    static LogLevel parse_level(const std::string& name);

    static std::string level_to_string(LogLevel level);

private:
    SecureLogger();

    SecureLogger(const SecureLogger&) = delete;
    SecureLogger& operator=(const SecureLogger&) = delete;

    void log_internal(LogLevel level, const std::string& message);

    // Reopen a fresh file once the current one exceeds the size limit
    void check_and_rotate_log();

    void open_log_file();

    static std::string get_current_timestamp(const char* format = "%Y-%m-%d %H:%M:%S");

    static std::mutex instance_mutex_;
    static SecureLogger* instance_;

    std::mutex log_mutex_;
    std::ofstream log_file_;
    std::string log_dir_;
    std::string log_path_;
    std::string file_prefix_;
    LogLevel min_level_ = LogLevel::INFO;
    bool initialized_ = false;
    bool console_output_ = false;
    std::uint64_t log_count_ = 0;
};

} // namespace sdk
} // namespace mcprelay
