#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a duration in seconds as a short string like 1h2m3s.
 */
std::string format_duration_short(std::chrono::seconds dur);

/**
 * @brief Format a commit time in its author's timezone, e.g.
 *        `2024-03-01 14:05 +0100`.
 *
 * @param seconds        Seconds since the epoch.
 * @param offset_minutes Author's offset from UTC.
 */
std::string format_commit_time(std::int64_t seconds, int offset_minutes);

#endif // TIME_UTILS_HPP
