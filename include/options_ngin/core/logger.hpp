// include/options_ngin/core/logger.hpp
#pragma once

#include <array>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "options_ngin/core/config_base.hpp"
#include "options_ngin/core/error.hpp"

namespace options_ngin {

enum class LogLevel {
    TRACE,
    DEBUG,    // Per-contract detail
    INFO,     // Run progress and summaries
    WARNING,  // Recovered failures: fallbacks, skipped tickers, rejected contracts
    ERR,      // A run step failed
    FATAL     // The process cannot continue
};

constexpr size_t LOG_LEVEL_COUNT = 6;

enum class LogDestination { CONSOLE, FILE, BOTH };

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name, any case; "WARN" and "ERR" are accepted
 */
std::optional<LogLevel> log_level_from_string(const std::string& name);

inline std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "CONSOLE";
    }
}

std::optional<LogDestination> log_destination_from_string(const std::string& name);

struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"options_scan"};
    bool include_timestamp{true};
    bool utc_timestamps{true};  // "2025-01-10T21:00:00Z", otherwise local "2025-01-10 16:00:00"
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};
    size_t max_files{10};  // per prefix, older parts are deleted

    bool writes_console() const {
        return destination != LogDestination::FILE;
    }
    bool writes_file() const {
        return destination != LogDestination::CONSOLE;
    }

    /**
     * @return INVALID_ARGUMENT for an empty prefix, or a zero size or file count
     *         when logging to file
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;

    /**
     * Unknown level or destination names keep the current value
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide, thread-safe logger
 *
 * File output goes to <prefix>_<YYYYMMDD_HHMMSS>_part<N>.log, rotating to a
 * new part once max_file_size is reached. Only files carrying the configured
 * prefix count toward (and are deleted by) max_files. The logger also keeps
 * a per-level count of emitted messages so a run can report how many
 * warnings it produced.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief (Re)configure the logger and reset the message counts
     * @return INVALID_ARGUMENT for an invalid config, FILE_IO_ERROR if the
     *         log directory or file cannot be created
     */
    Result<void> initialize(const LoggerConfig& config);

    /**
     * @brief Close any open file and return to the uninitialized state
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_release);
    }

    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Messages emitted at a level since initialize()
     */
    size_t message_count(LogLevel level) const {
        return counts_[static_cast<size_t>(level)].load(std::memory_order_relaxed);
    }

    /**
     * @brief Path of the file currently written, empty for console-only logging
     */
    std::string current_file() const;

    /**
     * @brief Tag subsequent messages from the calling thread, "" clears the tag
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    Result<void> open_next_part();
    void prune_old_parts();
    std::string format_line(LogLevel level, const std::string& message) const;
    void close_file();

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::filesystem::path log_dir_;
    std::filesystem::path file_path_;
    std::ofstream file_;
    std::string session_;  // YYYYMMDD_HHMMSS of initialize()
    int part_{0};

    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::array<std::atomic<size_t>, LOG_LEVEL_COUNT> counts_{};
    static thread_local std::string current_component_;
};

/**
 * @brief Stream-style logging, e.g. LOG(LogLevel::INFO, "scored " << n << " contracts")
 * The message is only formatted when the level passes the filter.
 */
#define LOG(level, message)                                                    \
    do {                                                                       \
        if (level >= ::options_ngin::Logger::instance().get_min_level()) {     \
            std::ostringstream os;                                             \
            os << message;                                                     \
            ::options_ngin::Logger::instance().log(level, os.str());           \
        }                                                                      \
    } while (0)

#define TRACE(message) LOG(::options_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::options_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::options_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::options_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::options_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::options_ngin::LogLevel::FATAL, message)

}  // namespace options_ngin
