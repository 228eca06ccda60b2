/**
 * @file utilities.cpp
 * @brief Logging, time and string helpers shared by all components
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "toolmesh/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>

namespace toolmesh {
namespace utilities {

namespace {

constexpr const char* kLoggerName = "toolmesh";
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr size_t kLogFileSize = 10 * 1024 * 1024;
constexpr size_t kLogFileCount = 3;

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARN:     return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> build_logger(const std::string& log_file, LogLevel level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, kLogFileSize, kLogFileCount));
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog_level(level));
    logger->set_pattern(kLogPattern);
    return logger;
}

std::shared_ptr<spdlog::logger> active_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = build_logger("", LogLevel::INFO);
    }
    return g_logger;
}

} // namespace

// ============================================================================
// Logging
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = build_logger(log_file, level);
    } catch (const spdlog::spdlog_ex& ex) {
        // Fall back to console only when the log file cannot be opened
        std::fprintf(stderr, "toolmesh: cannot open log file %s: %s\n", log_file.c_str(), ex.what());
        logger = build_logger("", level);
    }

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = logger;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    const std::string level = to_lowercase(trim_string(name));

    if (level == "debug") return LogLevel::DEBUG;
    if (level == "info") return LogLevel::INFO;
    if (level == "warn" || level == "warning") return LogLevel::WARN;
    if (level == "error") return LogLevel::ERROR;
    if (level == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    active_logger()->log(spdlog_level(level), message);
}

void log_debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void log_info(const std::string& message) { log(LogLevel::INFO, message); }
void log_warn(const std::string& message) { log(LogLevel::WARN, message); }
void log_error(const std::string& message) { log(LogLevel::ERROR, message); }
void log_critical(const std::string& message) { log(LogLevel::CRITICAL, message); }

// ============================================================================
// Time
// ============================================================================

uint64_t current_time_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string format_timestamp(uint64_t timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

// ============================================================================
// Files and environment
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return content;
}

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

// ============================================================================
// Strings
// ============================================================================

std::vector<std::string> split_list(const std::string& str, char delimiter) {
    std::vector<std::string> items;

    size_t begin = 0;
    while (begin <= str.size()) {
        size_t end = str.find(delimiter, begin);
        if (end == std::string::npos) {
            end = str.size();
        }

        std::string item = trim_string(str.substr(begin, end - begin));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        begin = end + 1;
    }

    return items;
}

std::string trim_string(const std::string& str) {
    static const char* whitespace = " \t\r\n\f\v";

    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::string to_lowercase(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    for (unsigned char c : str) {
        lower.push_back(static_cast<char>(std::tolower(c)));
    }
    return lower;
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    return to_lowercase(haystack).find(to_lowercase(needle)) != std::string::npos;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string generate_random_string(size_t length) {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 generator(std::random_device{}());
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::string result(length, '0');
    for (auto& c : result) {
        c = alphabet[pick(generator)];
    }
    return result;
}

} // namespace utilities
} // namespace toolmesh
