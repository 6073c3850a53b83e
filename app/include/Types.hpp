#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class MediaKind {
    Plain,
    Screenshot,
    ScreenRecording
};

inline std::string to_string(MediaKind kind) {
    switch (kind) {
        case MediaKind::Plain: return "plain";
        case MediaKind::Screenshot: return "screenshot";
        case MediaKind::ScreenRecording: return "screen_recording";
        default: return "unknown";
    }
}

enum class FolderKind {
    Generated,
    Year,
    Month,
    Backup,
    Unclassified
};

inline std::string to_string(FolderKind kind) {
    switch (kind) {
        case FolderKind::Generated: return "generated";
        case FolderKind::Year: return "year";
        case FolderKind::Month: return "month";
        case FolderKind::Backup: return "backup";
        case FolderKind::Unclassified: return "unclassified";
        default: return "unknown";
    }
}

struct CalendarDate {
    int year{0};
    int month{1};
    int day{1};

    friend bool operator==(const CalendarDate&, const CalendarDate&) = default;
    friend auto operator<=>(const CalendarDate&, const CalendarDate&) = default;
};

inline std::string to_string(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buffer;
}

enum class DatePrecision {
    Day,
    Month
};

enum class BackupConfidence {
    Exact,      ///< The folder name carries a day.
    Majority,   ///< Month-precision name refined by the contained files.
    Unresolved  ///< No reliable date; files are dispersed by their own timestamps.
};

struct BackupDate {
    CalendarDate date;
    DatePrecision precision{DatePrecision::Day};
};

struct BackupInference {
    std::optional<CalendarDate> date;
    BackupConfidence confidence{BackupConfidence::Unresolved};
};

/**
 * @brief Tagged result of visiting one folder during the sort walk.
 */
enum class WalkAction {
    Continue,
    SkipSubtree,
    Abort
};

enum class FolderDecision {
    Keep,
    SortInside,
    SortIntoYears,
    Skip,
    Quit
};

struct DuplicateDecision {
    enum class Action {
        ConfirmDefault,
        KeepIndex,
        KeepAll,
        DeleteAll,
        Quit
    };

    Action action{Action::ConfirmDefault};
    std::size_t index{0}; ///< Only meaningful for KeepIndex.

    static DuplicateDecision confirm() { return {Action::ConfirmDefault, 0}; }
    static DuplicateDecision keep(std::size_t i) { return {Action::KeepIndex, i}; }
    static DuplicateDecision keep_all() { return {Action::KeepAll, 0}; }
    static DuplicateDecision delete_all() { return {Action::DeleteAll, 0}; }
    static DuplicateDecision quit() { return {Action::Quit, 0}; }
};

enum class LivePhotoDecision {
    Keep,
    Trash,
    Quit
};

struct ImageReviewDecision {
    enum class Action {
        Ok,
        Junk,
        Meme,
        Rename,
        ChangeDate,
        SkipFolder,
        Quit
    };

    Action action{Action::Ok};
    std::string new_stem;   ///< Only meaningful for Rename.
    int year{0};            ///< Only meaningful for ChangeDate.
    int month{1};           ///< Only meaningful for ChangeDate.

    static ImageReviewDecision ok() { return {Action::Ok, {}, 0, 1}; }
    static ImageReviewDecision junk() { return {Action::Junk, {}, 0, 1}; }
    static ImageReviewDecision meme() { return {Action::Meme, {}, 0, 1}; }
    static ImageReviewDecision rename(std::string stem) { return {Action::Rename, std::move(stem), 0, 1}; }
    static ImageReviewDecision change_date(int y, int m) { return {Action::ChangeDate, {}, y, m}; }
    static ImageReviewDecision skip_folder() { return {Action::SkipFolder, {}, 0, 1}; }
    static ImageReviewDecision quit() { return {Action::Quit, {}, 0, 1}; }

    friend bool operator==(const ImageReviewDecision&, const ImageReviewDecision&) = default;
};

struct DuplicateMember {
    std::filesystem::path path;
    std::chrono::system_clock::time_point timestamp;
};

struct DuplicateGroup {
    std::uintmax_t size_bytes{0};
    std::string content_hash;
    std::vector<DuplicateMember> members;
    std::size_t canonical_index{0};
};

enum class RunStatus {
    Completed,
    Cancelled
};

struct SortReport {
    int moved{0};
    int kept{0};
    int skipped{0};
    int trashed{0};
    int pruned{0};
    int archived_folders{0};
    RunStatus status{RunStatus::Completed};
};

struct DuplicateReport {
    int groups{0};
    int trashed{0};
    int kept{0};
    int failed{0};
    int unreadable{0};
    RunStatus status{RunStatus::Completed};
};

struct ReviewReport {
    int reviewed{0};
    int trashed{0};
    int moved{0};
    int renamed{0};
    int redated{0};
    int skipped{0};
    int failed{0};
    RunStatus status{RunStatus::Completed};
};

#endif
