#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <ctime>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format the time elapsed since @a then using its largest unit.
 *
 * @return Strings such as "12s", "4m", "3h" or "2d". Times in the future
 *         are reported as "0s".
 */
std::string format_age(std::chrono::system_clock::time_point then,
                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/**
 * @brief Format @a t as local time using a strftime pattern.
 */
std::string format_local_time(std::time_t t, const char* pattern = "%Y-%m-%d %H:%M:%S");

#endif // TIME_UTILS_HPP
