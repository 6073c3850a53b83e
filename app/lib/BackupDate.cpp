#include "BackupDate.hpp"
#include "Logger.hpp"
#include "MediaClassifier.hpp"
#include "TimestampResolver.hpp"
#include "Utils.hpp"

#include <charconv>
#include <map>
#include <regex>
#include <system_error>
#include <vector>

namespace {

std::vector<std::string> split_components(const std::string& name)
{
    std::vector<std::string> parts;
    std::string current;
    for (char ch : name) {
        if (ch == '-' || ch == '_') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(current);
    return parts;
}

int to_int(const std::string& digits)
{
    int value = 0;
    std::from_chars(digits.data(), digits.data() + digits.size(), value);
    return value;
}

int promote_year(const std::string& digits)
{
    const int year = to_int(digits);
    return digits.size() == 2 ? 2000 + year : year;
}

}

namespace BackupDates {

bool matches_backup_grammar(const std::string& name)
{
    static const std::regex kMonthFirst(R"(^\d{1,2}[-_]\d{1,2}[-_](\d{2}|\d{4})$)");
    static const std::regex kYearFirst(R"(^\d{4}[-_]\d{1,2}[-_]\d{1,2}$)");
    static const std::regex kYearMonth(R"(^\d{4}[-_]\d{1,2}$)");
    static const std::regex kMonthYear(R"(^\d{1,2}[-_]\d{4}$)");

    return std::regex_match(name, kMonthFirst)
        || std::regex_match(name, kYearFirst)
        || std::regex_match(name, kYearMonth)
        || std::regex_match(name, kMonthYear);
}


bool is_valid_date(int year, int month, int day)
{
    if (year < 1 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int max_day = kDaysInMonth[month - 1];
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        max_day = 29;
    }
    return day <= max_day;
}


std::optional<BackupDate> parse_backup_date(const std::string& name)
{
    if (!matches_backup_grammar(name)) {
        return std::nullopt;
    }

    const auto parts = split_components(name);
    if (parts.size() == 3) {
        CalendarDate date;
        if (parts[0].size() == 4) {
            date = {to_int(parts[0]), to_int(parts[1]), to_int(parts[2])};
        } else {
            date = {promote_year(parts[2]), to_int(parts[0]), to_int(parts[1])};
        }
        if (!is_valid_date(date.year, date.month, date.day)) {
            return std::nullopt;
        }
        return BackupDate{date, DatePrecision::Day};
    }

    if (parts.size() == 2) {
        // year-month first, then month-year
        if (parts[0].size() == 4) {
            const int year = to_int(parts[0]);
            const int month = to_int(parts[1]);
            if (month >= 1 && month <= 12) {
                return BackupDate{CalendarDate{year, month, 1}, DatePrecision::Month};
            }
        }
        if (parts[1].size() == 4) {
            const int month = to_int(parts[0]);
            const int year = to_int(parts[1]);
            if (month >= 1 && month <= 12) {
                return BackupDate{CalendarDate{year, month, 1}, DatePrecision::Month};
            }
        }
    }

    return std::nullopt;
}


BackupInference infer_backup_date(const std::filesystem::path& folder,
                                  const MediaClassifier& classifier)
{
    const auto parsed = parse_backup_date(Utils::path_to_utf8(folder.filename()));
    if (!parsed) {
        return {};
    }
    if (parsed->precision == DatePrecision::Day) {
        return BackupInference{parsed->date, BackupConfidence::Exact};
    }

    std::map<CalendarDate, int> tally;
    int total = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || !classifier.is_media(it->path())) {
            continue;
        }
        const CalendarDate date = TimestampResolver::to_local_date(
            TimestampResolver::earliest_timestamp(it->path()));
        if (date.year != parsed->date.year || date.month != parsed->date.month) {
            continue;
        }
        ++tally[date];
        ++total;
    }
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Could not list backup folder '{}': {}", Utils::path_to_utf8(folder), ec.message());
        }
    }

    const std::pair<const CalendarDate, int>* best = nullptr;
    for (const auto& entry : tally) {
        if (!best || entry.second > best->second) {
            best = &entry;
        }
    }

    if (best && best->second * 2 > total) {
        return BackupInference{best->first, BackupConfidence::Majority};
    }
    return BackupInference{std::nullopt, BackupConfidence::Unresolved};
}

}
