#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path in append mode and starts the background
 * writer thread. Calling it again re-targets the logger; entries queued in the
 * meantime are written to the new file. If @p path cannot be opened the
 * previous file (if any) stays active.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Parse a textual level such as `debug`, `INFO`, `warn` or `error`.
 *
 * @param text  Level name, case-insensitive.
 * @param level Receives the parsed level on success.
 * @return `true` if @p text named a known level.
 */
bool parse_log_level(const std::string& text, LogLevel& level);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/** @brief Emit one JSON object per line instead of plain text. */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files. */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger has an open file.
 */
bool logger_initialized();

/**
 * @brief Block until every queued entry has been written and flushed.
 */
void flush_logger();

void log_event(LogLevel level, const std::string& message);
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

/**
 * @brief Convenience wrappers for each level.
 *
 * The `data` overload attaches a single `data=` field; the map overload
 * attaches arbitrary structured fields, e.g. `{{"session", id}}`.
 */
void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::string& data);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::string& data);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::string& data);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::string& data);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log entries to syslog using the given facility.
 *
 * No-op on platforms without syslog.
 */
void init_syslog(int facility = 0);

/**
 * @brief Drain the queue, stop the writer thread and close the file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
