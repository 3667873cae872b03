#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, SUCCESS, WARNING, ERR };

/**
 * @brief Label printed for @p level (`DEBUG`, `INFO`, `SUCCESS`, `WARN`,
 *        `ERROR`).
 */
const char* log_level_label(LogLevel level);

/**
 * @brief Parse a level name as accepted by `--log-level`.
 *
 * Matching is case-insensitive; `WARNING` and `ERR` are accepted as
 * aliases.
 *
 * @param name Level name.
 * @param ok   Set to `false` when @p name is not a known level.
 */
LogLevel parse_log_level(const std::string& name, bool& ok);

/**
 * @brief Attach a log file in addition to the console.
 *
 * Opens the log file at @p path for appending and configures rotation.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `false` if the file could not be opened.
 */
bool init_logger(const std::string& path, size_t max_size = 0, size_t max_files = 1);

/**
 * @brief Set the global minimum log level for every sink.
 */
void set_log_level(LogLevel level);

/**
 * @brief Emit JSON objects instead of plain lines to the log file.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files.
 */
void set_log_compression(bool enable);

/**
 * @brief Enable or disable console output (enabled by default).
 */
void set_console_logging(bool enable);

/**
 * @brief Enable or disable ANSI colors on the console.
 *
 * Colors are only emitted when the stream is a terminal.
 */
void set_console_colors(bool enable);

/**
 * @brief Check whether a log file is attached.
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
 * Plain text sinks append the fields as ` key=value`; the JSON sink emits
 * them as additional members.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_success(const std::string& msg);
void log_success(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Flush every sink.
 */
void flush_logger();

/**
 * @brief Close the log file and restore console defaults.
 */
void shutdown_logger();

#endif // LOGGER_HPP
