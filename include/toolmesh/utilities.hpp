/**
 * @file utilities.hpp
 * @brief Common utility functions for ToolMesh
 *
 * ToolMesh - Federated Tool Registry and Router
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout ToolMesh:
 * - Logging and error reporting
 * - Wall-clock time and formatting
 * - String manipulation
 * - File and environment helpers
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <functional>
#include <cstdint>

namespace toolmesh {

/**
 * @brief Source of wall-clock time in milliseconds since the Unix epoch
 *
 * Components take a Clock so TTLs and staleness can be driven in tests.
 */
using Clock = std::function<uint64_t()>;

namespace utilities {

/**
 * @brief Log levels for ToolMesh logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log through the "toolmesh" logger, creating a console-only
 *        logger on first use if initialize_logging was never called
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Current wall-clock time in milliseconds since epoch
 */
uint64_t current_time_ms();

/**
 * @brief Format timestamp as ISO 8601 string
 * @param timestamp_ms Milliseconds since epoch
 * @return Formatted string (e.g., "2025-11-10T15:30:45Z")
 */
std::string format_timestamp(uint64_t timestamp_ms);

/**
 * @brief Read a whole text file (config documents, snapshots)
 * @return File contents or std::nullopt if the file cannot be opened
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Split a delimited list, trimming items and dropping empty ones
 *
 * "a, b,,c" with ',' yields {"a", "b", "c"}.
 */
std::vector<std::string> split_list(const std::string& str, char delimiter);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Case-insensitive substring test
 * @param haystack String to search in
 * @param needle String to search for
 * @return true if haystack contains needle ignoring case
 */
bool contains_ignore_case(const std::string& haystack, const std::string& needle);

bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Random string over [0-9a-z]
 * @param length Number of characters
 */
std::string generate_random_string(size_t length);

} // namespace utilities
} // namespace toolmesh
