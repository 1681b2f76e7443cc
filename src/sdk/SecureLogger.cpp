#include "mcprelay/sdk/SecureLogger.hpp"
#include "mcprelay/sdk/constants.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>

namespace mcprelay {
namespace sdk {

// Initialize static variables
std::mutex SecureLogger::instance_mutex_;
SecureLogger* SecureLogger::instance_ = nullptr;

SecureLogger& SecureLogger::instance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = new SecureLogger();
    }
    return *instance_;
}

bool SecureLogger::is_initialized() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    return instance_ != nullptr && instance_->initialized_;
}

SecureLogger::SecureLogger()
    : min_level_(LogLevel::INFO),
      initialized_(false) {
}

SecureLogger::~SecureLogger() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void SecureLogger::initialize(const std::string& log_dir,
                              const std::string& file_prefix,
                              LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (initialized_) {
        log_internal(LogLevel::INFO, "Logger already initialized, reinitializing with new parameters");
    }

    log_dir_ = log_dir;
    file_prefix_ = file_prefix;
    min_level_ = min_level;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "Cannot create log directory " << log_dir_ << ": " << ec.message() << std::endl;
    }

    open_log_file();

    initialized_ = true;
    log_internal(LogLevel::INFO, "SecureLogger initialized (" + log_path_ + ")");
}

void SecureLogger::open_log_file() {
    if (log_file_.is_open()) {
        log_file_.close();
    }

    log_path_ = (std::filesystem::path(log_dir_) /
                 (file_prefix_ + "_" + get_current_timestamp("%Y%m%d_%H%M%S") + ".log")).string();
    log_file_.open(log_path_, std::ios::out | std::ios::app);

    if (!log_file_.is_open()) {
        // Fall back to the working directory
        log_path_ = file_prefix_ + ".log";
        log_file_.open(log_path_, std::ios::out | std::ios::app);
    }
}

void SecureLogger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(level, message);
}

void SecureLogger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void SecureLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void SecureLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void SecureLogger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void SecureLogger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void SecureLogger::critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

void SecureLogger::log_internal(LogLevel level, const std::string& message) {
    if (level < min_level_) {
        return;
    }

    const std::string line = "[" + get_current_timestamp() + "] [" + level_to_string(level) + "] " + message;

    if (log_file_.is_open()) {
        check_and_rotate_log();
        log_file_ << line << '\n';
        log_file_.flush();
        ++log_count_;
    }

    if (console_output_ || level >= LogLevel::WARNING) {
        std::cerr << line << std::endl;
    }
}

void SecureLogger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
    }
}

void SecureLogger::check_and_rotate_log() {
    const auto position = log_file_.tellp();
    if (position >= 0 && static_cast<std::size_t>(position) >= constants::MAX_LOG_FILE_SIZE) {
        open_log_file();
    }
}

std::string SecureLogger::redact(const std::string& value) {
    if (value.size() <= constants::REDACTED_PREFIX_LENGTH) {
        return value;
    }
    return value.substr(0, constants::REDACTED_PREFIX_LENGTH) + "...";
}

SecureLogger::LogLevel SecureLogger::parse_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

std::string SecureLogger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string SecureLogger::get_current_timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    char buffer[128];
    strftime(buffer, sizeof(buffer), format, &tm_now);

    return std::string(buffer);
}

} // namespace sdk
} // namespace mcprelay
