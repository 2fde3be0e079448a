#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/// Structured key/value context attached to a log entry.
using LogFields = std::map<std::string, std::string>;

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and starts the background
 * writer thread. Entries are queued by the calling thread and written in
 * batches, so logging from worker threads never blocks on disk I/O.
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
 * @brief Parse a level name such as "debug" or "WARN".
 *
 * @param name  Case-insensitive level name.
 * @param level Receives the parsed level.
 * @return `false` if @p name is not a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files.
 */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger has an open log file.
 */
bool logger_initialized();

/**
 * @brief Block until all queued entries have been written.
 */
void flush_logger();

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::string& data);
void log_debug(const std::string& msg, const LogFields& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::string& data);
void log_info(const std::string& msg, const LogFields& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::string& data);
void log_warning(const std::string& msg, const LogFields& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::string& data);
void log_error(const std::string& msg, const LogFields& fields);

/**
 * @brief Mirror log entries to syslog using the specified facility.
 *
 * Starts the background writer when no log file is open, so syslog output
 * does not depend on init_logger().
 */
void init_syslog(int facility = 0);

/**
 * @brief Stop the writer thread, flush and close the log file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
