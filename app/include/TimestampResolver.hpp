#ifndef TIMESTAMP_RESOLVER_HPP
#define TIMESTAMP_RESOLVER_HPP

#include "Types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace TimestampResolver {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Best estimate of when a file was captured.
 *
 * Minimum of the modification time and the birth time (metadata-change time where
 * the platform has no birth time). Falls back to the parent directory, then to the
 * current instant when the path has vanished. Never throws.
 */
TimePoint earliest_timestamp(const std::filesystem::path& path) noexcept;

/**
 * @brief Local calendar date of a timestamp.
 */
CalendarDate to_local_date(TimePoint timestamp);

/**
 * @brief Folder label such as "04-April" for the month of @p date.
 */
std::string month_folder_name(const CalendarDate& date);

/**
 * @brief Destination "<base>/<YYYY>/<MM>-<MonthName>" for a date.
 */
std::filesystem::path dated_folder(const std::filesystem::path& base, const CalendarDate& date);

}

#endif
