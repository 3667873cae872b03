#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a duration in seconds as a short string like 1h2m3s.
 */
std::string format_duration_short(std::chrono::seconds dur);

/**
 * @brief Format a millisecond duration for log lines.
 *
 * Values below one second print as `250ms`; longer values use
 * @ref format_duration_short and keep a millisecond remainder (`1m5s`,
 * `2s500ms`).
 */
std::string format_millis(std::chrono::milliseconds dur);

#endif // TIME_UTILS_HPP
