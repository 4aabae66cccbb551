// src/core/logger.cpp

#include "options_ngin/core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {

thread_local std::string Logger::current_component_;

namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool has_prefix(const std::string& name, const std::string& prefix) {
    return name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

std::optional<LogLevel> log_level_from_string(const std::string& name) {
    const std::string upper = to_upper(name);
    if (upper == "TRACE")
        return LogLevel::TRACE;
    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "INFO")
        return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::WARNING;
    if (upper == "ERROR" || upper == "ERR")
        return LogLevel::ERR;
    if (upper == "FATAL")
        return LogLevel::FATAL;
    return std::nullopt;
}

std::optional<LogDestination> log_destination_from_string(const std::string& name) {
    const std::string upper = to_upper(name);
    if (upper == "CONSOLE")
        return LogDestination::CONSOLE;
    if (upper == "FILE")
        return LogDestination::FILE;
    if (upper == "BOTH")
        return LogDestination::BOTH;
    return std::nullopt;
}

Result<void> LoggerConfig::validate() const {
    if (filename_prefix.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "filename_prefix must not be empty",
                                "LoggerConfig");
    }
    if (writes_file() && (max_file_size == 0 || max_files == 0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_file_size and max_files must be positive for file logging",
                                "LoggerConfig");
    }
    return Result<void>();
}

nlohmann::json LoggerConfig::to_json() const {
    return nlohmann::json{{"min_level", level_to_string(min_level)},
                          {"destination", log_destination_to_string(destination)},
                          {"log_directory", log_directory},
                          {"filename_prefix", filename_prefix},
                          {"include_timestamp", include_timestamp},
                          {"utc_timestamps", utc_timestamps},
                          {"include_level", include_level},
                          {"max_file_size", max_file_size},
                          {"max_files", max_files}};
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level")) {
        if (auto level = log_level_from_string(j.at("min_level").get<std::string>()))
            min_level = *level;
    }
    if (j.contains("destination")) {
        if (auto dest = log_destination_from_string(j.at("destination").get<std::string>()))
            destination = *dest;
    }
    if (j.contains("log_directory"))
        log_directory = j.at("log_directory").get<std::string>();
    if (j.contains("filename_prefix"))
        filename_prefix = j.at("filename_prefix").get<std::string>();
    if (j.contains("include_timestamp"))
        include_timestamp = j.at("include_timestamp").get<bool>();
    if (j.contains("utc_timestamps"))
        utc_timestamps = j.at("utc_timestamps").get<bool>();
    if (j.contains("include_level"))
        include_level = j.at("include_level").get<bool>();
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    close_file();
}

Result<void> Logger::initialize(const LoggerConfig& config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    initialized_.store(false, std::memory_order_release);
    close_file();
    config_ = config;
    for (auto& count : counts_) {
        count.store(0, std::memory_order_relaxed);
    }

    if (config_.writes_file()) {
        std::error_code ec;
        log_dir_ = std::filesystem::absolute(config_.log_directory, ec);
        if (!ec) {
            std::filesystem::create_directories(log_dir_, ec);
        }
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Cannot create log directory " + config_.log_directory + ": " +
                                        ec.message(),
                                    "Logger");
        }
        session_ = core::get_formatted_time("%Y%m%d_%H%M%S", !config_.utc_timestamps);
        part_ = 0;
        auto opened = open_next_part();
        if (opened.is_error()) {
            return opened;
        }
    }

    min_level_.store(config_.min_level, std::memory_order_release);
    initialized_.store(true, std::memory_order_release);
    return Result<void>();
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    logger.close_file();
    logger.config_ = LoggerConfig();
    logger.min_level_.store(LogLevel::INFO, std::memory_order_release);
    for (auto& count : logger.counts_) {
        count.store(0, std::memory_order_relaxed);
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire) || level < get_min_level()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counts_[static_cast<size_t>(level)].fetch_add(1, std::memory_order_relaxed);
    const std::string line = format_line(level, message);

    if (config_.writes_console()) {
        std::cout << line << std::endl;
    }

    if (config_.writes_file() && file_.is_open()) {
        file_ << line << std::endl;
        if (file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
            // A failed rotation leaves file_ closed; console output is unaffected
            auto rotated = open_next_part();
            if (rotated.is_error()) {
                std::cerr << rotated.error()->to_string() << std::endl;
            }
        }
    }
}

std::string Logger::current_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open() ? file_path_.string() : std::string();
}

std::string Logger::format_line(LogLevel level, const std::string& message) const {
    std::ostringstream ss;
    if (config_.include_timestamp) {
        if (config_.utc_timestamps) {
            ss << core::get_formatted_time("%Y-%m-%dT%H:%M:%SZ", false) << " ";
        } else {
            ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S", true) << " ";
        }
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    ss << message;
    return ss.str();
}

Result<void> Logger::open_next_part() {
    close_file();
    // Pruning first keeps the directory at max_files once the new part exists
    prune_old_parts();

    ++part_;
    file_path_ = log_dir_ / (config_.filename_prefix + "_" + session_ + "_part" +
                             std::to_string(part_) + ".log");
    file_.open(file_path_, std::ios::app);
    if (!file_.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Cannot open log file " + file_path_.string(), "Logger");
    }
    return Result<void>();
}

void Logger::prune_old_parts() {
    std::error_code ec;
    std::vector<std::filesystem::path> parts;
    const std::string prefix = config_.filename_prefix + "_";
    for (const auto& entry : std::filesystem::directory_iterator(log_dir_, ec)) {
        const auto& path = entry.path();
        if (entry.is_regular_file(ec) && path.extension() == ".log" &&
            has_prefix(path.filename().string(), prefix)) {
            parts.push_back(path);
        }
    }
    if (ec || parts.size() < config_.max_files) {
        return;
    }

    // Names embed the session timestamp and part number, so the name breaks
    // modification-time ties between parts written within the same second
    std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) {
        std::error_code ignored;
        auto ta = std::filesystem::last_write_time(a, ignored);
        auto tb = std::filesystem::last_write_time(b, ignored);
        if (ta != tb)
            return ta < tb;
        return a.filename().string() < b.filename().string();
    });

    size_t excess = parts.size() - config_.max_files + 1;
    for (size_t i = 0; i < excess; ++i) {
        std::filesystem::remove(parts[i], ec);
    }
}

void Logger::close_file() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    file_path_.clear();
}

}  // namespace options_ngin
