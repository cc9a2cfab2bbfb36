#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 *
 * Used for log lines.
 */
std::string timestamp();

/**
 * @brief Get the current UTC time as an RFC 3339 string with millisecond
 *        precision (e.g. `2025-01-31T12:00:00.123Z`).
 *
 * Used for record timestamps in the store.
 */
std::string rfc3339_now();

/**
 * @brief Format a duration in seconds as a short string like 1h2m3s.
 */
std::string format_duration_short(std::chrono::seconds dur);

#endif // TIME_UTILS_HPP
