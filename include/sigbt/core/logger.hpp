// include/sigbt/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "sigbt/core/config_base.hpp"

namespace sigbt {

enum class LogLevel {
    TRACE,
    DEBUG,    // Per-trade diagnostics
    INFO,     // Run lifecycle
    WARNING,  // Dropped bars, failed sweep entries
    ERR,      // Errors that abort a run
    FATAL
};

enum class LogDestination { CONSOLE, FILE, BOTH };

std::string level_to_string(LogLevel level);

/**
 * @brief Parse an upper-case level name
 * @return The matching level, or fallback for an unknown name
 */
LogLevel level_from_string(const std::string& name, LogLevel fallback);

std::string log_destination_to_string(LogDestination dest);

LogDestination log_destination_from_string(const std::string& name, LogDestination fallback);

/**
 * @brief Logger settings, usually the "logger" object of a run file
 *
 * File output goes to <log_directory>/<filename_prefix>_YYYYMMDD_HHMMSS_partN.log.
 * A part is closed once it reaches max_file_size bytes, and the oldest .log
 * files in the directory are removed so that at most max_files remain.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"sigbt"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{5};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide, thread-safe logger
 *
 * Messages logged before initialize() are echoed to stderr with a warning.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply a configuration and open the first log file if needed
     * @throws std::runtime_error if the log directory or file cannot be opened
     */
    void initialize(const LoggerConfig& config);

    // Drops configuration and closes the file so each test starts clean
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
        min_level_.store(level, std::memory_order_release);
    }

    // Lock-free; the LOG macros call this on every statement
    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag messages logged from the calling thread with "[component] "
     *
     * The tag is thread_local, so sweep workers do not overwrite each other.
     * An empty name removes the tag.
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool writes_to_console() const {
        return config_.destination != LogDestination::FILE;
    }

    bool writes_to_file() const {
        return config_.destination != LogDestination::CONSOLE;
    }

    std::filesystem::path log_directory_path() const {
        return std::filesystem::absolute(config_.log_directory);
    }

    // The following expect mutex_ to be held
    void prune_old_files(const std::filesystem::path& log_dir);
    void open_part(const std::filesystem::path& log_dir);
    void start_next_part();
    void append_to_file(const std::string& line);
    std::string format_line(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};  // Mirrors config_.min_level
    static inline thread_local std::string current_component_;

    std::string session_stamp_;  // YYYYMMDD_HHMMSS of initialize()
    int part_number_{1};
};

/**
 * @brief Stream-style logging, e.g. INFO("Loaded " << bars.size() << " bars")
 *
 * The message expression is only evaluated when the level is enabled.
 */
#define LOG(level, message)                                              \
    do {                                                                 \
        if (level >= ::sigbt::Logger::instance().get_min_level()) {      \
            std::ostringstream sigbt_log_stream_;                        \
            sigbt_log_stream_ << message;                                \
            ::sigbt::Logger::instance().log(level, sigbt_log_stream_.str()); \
        }                                                                \
    } while (0)

#define TRACE(message) LOG(::sigbt::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::sigbt::LogLevel::DEBUG, message)
#define INFO(message) LOG(::sigbt::LogLevel::INFO, message)
#define WARN(message) LOG(::sigbt::LogLevel::WARNING, message)
#define ERROR(message) LOG(::sigbt::LogLevel::ERR, message)
#define FATAL(message) LOG(::sigbt::LogLevel::FATAL, message)

}  // namespace sigbt
