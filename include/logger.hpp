#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Start the background log writer.
 *
 * Opens the log file at @p path for appending and configures log rotation.
 * An empty @p path starts the writer without a file sink, which is useful
 * together with @ref set_log_stderr.
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
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Parse `DEBUG`, `INFO`, `WARNING`/`WARN` or `ERROR` (any case).
 *
 * @param text  Level name.
 * @param level Receives the parsed level on success.
 * @return `false` when @p text names no level.
 */
bool parse_log_level(const std::string& text, LogLevel& level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files when enabled.
 */
void set_log_compression(bool enable);

/**
 * @brief Mirror every recorded line to standard error.
 */
void set_log_stderr(bool enable);

/**
 * @brief Check whether a file sink is open.
 */
bool logger_initialized();

/**
 * @brief Log a message with the specified severity.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log lines to syslog using the specified facility.
 *
 * @param facility Syslog facility identifier; `0` selects `LOG_USER`.
 */
void init_syslog(int facility = 0);

/**
 * @brief Block until every queued message has been written.
 */
void flush_logger();

/**
 * @brief Shut down the logging subsystem and release resources.
 */
void shutdown_logger();

#endif // LOGGER_HPP
