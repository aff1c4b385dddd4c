// src/core/logger.cpp

#include "sigbt/core/logger.hpp"
#include <algorithm>
#include <array>
#include <utility>
#include <vector>
#include "sigbt/core/time_utils.hpp"

namespace sigbt {

namespace {

constexpr std::array<std::pair<LogLevel, const char*>, 6> kLevelNames = {{
    {LogLevel::TRACE, "TRACE"},
    {LogLevel::DEBUG, "DEBUG"},
    {LogLevel::INFO, "INFO"},
    {LogLevel::WARNING, "WARNING"},
    {LogLevel::ERR, "ERROR"},
    {LogLevel::FATAL, "FATAL"},
}};

constexpr std::array<std::pair<LogDestination, const char*>, 3> kDestinationNames = {{
    {LogDestination::CONSOLE, "CONSOLE"},
    {LogDestination::FILE, "FILE"},
    {LogDestination::BOTH, "BOTH"},
}};

template <typename Enum, size_t N>
std::string name_of(const std::array<std::pair<Enum, const char*>, N>& table, Enum value) {
    for (const auto& entry : table) {
        if (entry.first == value) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

template <typename Enum, size_t N>
Enum value_of(const std::array<std::pair<Enum, const char*>, N>& table, const std::string& name,
              Enum fallback) {
    for (const auto& entry : table) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return fallback;
}

}  // namespace

std::string level_to_string(LogLevel level) {
    return name_of(kLevelNames, level);
}

LogLevel level_from_string(const std::string& name, LogLevel fallback) {
    return value_of(kLevelNames, name, fallback);
}

std::string log_destination_to_string(LogDestination dest) {
    return name_of(kDestinationNames, dest);
}

LogDestination log_destination_from_string(const std::string& name, LogDestination fallback) {
    return value_of(kDestinationNames, name, fallback);
}

nlohmann::json LoggerConfig::to_json() const {
    return nlohmann::json{{"min_level", level_to_string(min_level)},
                          {"destination", log_destination_to_string(destination)},
                          {"log_directory", log_directory},
                          {"filename_prefix", filename_prefix},
                          {"include_timestamp", include_timestamp},
                          {"include_level", include_level},
                          {"max_file_size", max_file_size},
                          {"max_files", max_files}};
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level"))
        min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
    if (j.contains("destination"))
        destination =
            log_destination_from_string(j.at("destination").get<std::string>(), destination);
    log_directory = j.value("log_directory", log_directory);
    filename_prefix = j.value("filename_prefix", filename_prefix);
    include_timestamp = j.value("include_timestamp", include_timestamp);
    include_level = j.value("include_level", include_level);
    max_file_size = j.value("max_file_size", max_file_size);
    max_files = j.value("max_files", max_files);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.min_level_.store(logger.config_.min_level, std::memory_order_release);
    logger.session_stamp_.clear();
    logger.part_number_ = 1;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    min_level_.store(config.min_level, std::memory_order_release);
    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (writes_to_file()) {
        std::filesystem::path log_dir = log_directory_path();
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Cannot create log directory " + log_dir.string() + ": " +
                                     ec.message());
        }

        prune_old_files(log_dir);
        session_stamp_ = core::format_now("%Y%m%d_%H%M%S");
        part_number_ = 1;
        open_part(log_dir);
        if (!log_file_.is_open()) {
            throw std::runtime_error("Cannot open a log file in " + log_dir.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_initialized()) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_.load(std::memory_order_acquire)) {
        return;
    }

    const std::string line = format_line(level, message);
    if (writes_to_console()) {
        std::cout << line << std::endl;
    }
    if (writes_to_file()) {
        append_to_file(line);
    }
}

std::string Logger::format_line(LogLevel level, const std::string& message) const {
    std::ostringstream line;
    if (config_.include_timestamp) {
        line << core::format_now("%Y-%m-%d %H:%M:%S") << ' ';
    }
    if (config_.include_level) {
        line << '[' << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        line << '[' << current_component_ << "] ";
    }
    line << message;
    return line.str();
}

void Logger::append_to_file(const std::string& line) {
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << line << std::endl;
    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        start_next_part();
    }
}

void Logger::prune_old_files(const std::filesystem::path& log_dir) {
    // Runs inside log() on rotation, so filesystem failures are ignored here
    std::error_code ec;
    std::vector<std::pair<std::filesystem::file_time_type, std::filesystem::path>> parts;
    for (std::filesystem::directory_iterator it(log_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code entry_ec;
        if (it->path().extension() != ".log" || !it->is_regular_file(entry_ec)) {
            continue;
        }
        auto written = std::filesystem::last_write_time(it->path(), entry_ec);
        if (!entry_ec) {
            parts.emplace_back(written, it->path());
        }
    }

    // Make room for the part about to be opened
    if (parts.size() < config_.max_files) {
        return;
    }
    std::sort(parts.begin(), parts.end());
    size_t excess = parts.size() - config_.max_files + 1;
    for (size_t i = 0; i < excess && i < parts.size(); ++i) {
        std::filesystem::remove(parts[i].second, ec);
    }
}

void Logger::open_part(const std::filesystem::path& log_dir) {
    std::string name = config_.filename_prefix + "_" + session_stamp_ + "_part" +
                       std::to_string(part_number_) + ".log";
    log_file_.open(log_dir / name, std::ios::app);
}

void Logger::start_next_part() {
    log_file_.close();
    std::filesystem::path log_dir = log_directory_path();
    prune_old_files(log_dir);
    ++part_number_;
    open_part(log_dir);
}

}  // namespace sigbt
