#include "TimestampResolver.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <ctime>

#include <fcntl.h>
#include <sys/stat.h>

namespace {

using TimePoint = TimestampResolver::TimePoint;

TimePoint from_timespec(std::int64_t seconds, std::int64_t nanoseconds)
{
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanoseconds)));
}

/**
 * Earliest of the platform timestamps for @p path, or nullopt when it cannot be stat'ed.
 */
std::optional<TimePoint> stat_earliest(const std::filesystem::path& path)
{
#if defined(__linux__) && defined(STATX_BTIME)
    struct statx stx {};
    if (::statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT,
                STATX_MTIME | STATX_CTIME | STATX_BTIME, &stx) != 0) {
        return std::nullopt;
    }
    TimePoint earliest = from_timespec(stx.stx_mtime.tv_sec, stx.stx_mtime.tv_nsec);
    if (stx.stx_mask & STATX_BTIME) {
        earliest = std::min(earliest, from_timespec(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec));
    } else {
        earliest = std::min(earliest, from_timespec(stx.stx_ctime.tv_sec, stx.stx_ctime.tv_nsec));
    }
    return earliest;
#elif defined(__APPLE__)
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return std::min(from_timespec(st.st_mtimespec.tv_sec, st.st_mtimespec.tv_nsec),
                    from_timespec(st.st_birthtimespec.tv_sec, st.st_birthtimespec.tv_nsec));
#else
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return std::min(from_timespec(st.st_mtime, 0), from_timespec(st.st_ctime, 0));
#endif
}

}

namespace TimestampResolver {

TimePoint earliest_timestamp(const std::filesystem::path& path) noexcept
{
    if (auto own = stat_earliest(path)) {
        return *own;
    }
    if (path.has_parent_path()) {
        if (auto parent = stat_earliest(path.parent_path())) {
            return *parent;
        }
    }
    return std::chrono::system_clock::now();
}


CalendarDate to_local_date(TimePoint timestamp)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm local {};
    localtime_r(&seconds, &local);
    return CalendarDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}


std::string month_folder_name(const CalendarDate& date)
{
    return fmt::format("{:02d}-{}", date.month, Utils::month_name(date.month));
}


std::filesystem::path dated_folder(const std::filesystem::path& base, const CalendarDate& date)
{
    return base / std::to_string(date.year) / month_folder_name(date);
}

}
