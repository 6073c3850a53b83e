#include "ConsoleDecisionSource.hpp"
#include "TimestampResolver.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <istream>
#include <ostream>
#include <system_error>
#include <utility>

namespace {

std::string trim(const std::string& value)
{
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    const auto first = std::find_if(value.begin(), value.end(), not_space);
    const auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();
    return first < last ? std::string(first, last) : std::string();
}

std::optional<std::size_t> parse_index(const std::string& value)
{
    std::size_t index = 0;
    const auto result = std::from_chars(value.data(), value.data() + value.size(), index);
    if (result.ec != std::errc() || result.ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return index;
}

/// Accepts "YYYY" or "YYYY-MM"; the month defaults to January.
std::optional<std::pair<int, int>> parse_year_month(const std::string& value)
{
    const auto dash = value.find('-');
    const std::string year_text = value.substr(0, dash);
    const std::string month_text = dash == std::string::npos ? std::string() : value.substr(dash + 1);

    int year = 0;
    const auto year_result = std::from_chars(year_text.data(), year_text.data() + year_text.size(), year);
    if (year_text.size() != 4 || year_result.ec != std::errc()
        || year_result.ptr != year_text.data() + year_text.size() || year < 1) {
        return std::nullopt;
    }
    if (dash == std::string::npos) {
        return std::make_pair(year, 1);
    }

    int month = 0;
    const auto month_result = std::from_chars(month_text.data(), month_text.data() + month_text.size(), month);
    if (month_text.empty() || month_text.size() > 2 || month_result.ec != std::errc()
        || month_result.ptr != month_text.data() + month_text.size() || month < 1 || month > 12) {
        return std::nullopt;
    }
    return std::make_pair(year, month);
}

}


ConsoleDecisionSource::ConsoleDecisionSource(std::istream& in,
                                             std::ostream& out,
                                             std::shared_ptr<spdlog::logger> logger)
    : in(in),
      out(out),
      logger(std::move(logger))
{
}


std::optional<std::string> ConsoleDecisionSource::read_line(const std::string& prompt)
{
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        out << '\n';
        if (logger) {
            logger->debug("Input closed while waiting for an answer");
        }
        return std::nullopt;
    }
    return trim(line);
}


std::optional<std::string> ConsoleDecisionSource::ask(const std::string& prompt)
{
    auto line = read_line(prompt);
    if (!line) {
        return std::nullopt;
    }
    return Utils::to_lower_copy(*line);
}


FolderDecision ConsoleDecisionSource::decide_folder(const std::filesystem::path& folder)
{
    out << fmt::format("\nFolder '{}' holds media.\n", Utils::path_to_utf8(folder));
    while (true) {
        const auto answer = ask("[k]eep as is, sort [i]nside, sort into [y]ears, [s]kip, [q]uit: ");
        if (!answer || *answer == "q" || *answer == "quit") {
            return FolderDecision::Quit;
        }
        if (*answer == "k" || *answer == "keep") {
            return FolderDecision::Keep;
        }
        if (*answer == "i" || *answer == "inside") {
            return FolderDecision::SortInside;
        }
        if (*answer == "y" || *answer == "years") {
            return FolderDecision::SortIntoYears;
        }
        if (*answer == "s" || *answer == "skip") {
            return FolderDecision::Skip;
        }
        out << "Please answer k, i, y, s or q.\n";
    }
}


DuplicateDecision ConsoleDecisionSource::decide_duplicate(const DuplicateGroup& group, std::size_t default_index)
{
    out << fmt::format("\n{} identical files ({} bytes):\n", group.members.size(), group.size_bytes);
    for (std::size_t i = 0; i < group.members.size(); ++i) {
        const auto& member = group.members[i];
        out << fmt::format("  {}{} {}  {}\n",
                           i == default_index ? '*' : ' ', i,
                           to_string(TimestampResolver::to_local_date(member.timestamp)),
                           Utils::path_to_utf8(member.path));
    }

    while (true) {
        const auto answer = ask(fmt::format(
            "Enter keeps {}, a number keeps that file, [a]ll keeps every copy, [d]elete all, [q]uit: ",
            default_index));
        if (!answer || *answer == "q" || *answer == "quit") {
            return DuplicateDecision::quit();
        }
        if (answer->empty()) {
            return DuplicateDecision::confirm();
        }
        if (*answer == "a" || *answer == "all") {
            return DuplicateDecision::keep_all();
        }
        if (*answer == "d" || *answer == "delete") {
            return DuplicateDecision::delete_all();
        }
        if (const auto index = parse_index(*answer); index && *index < group.members.size()) {
            return DuplicateDecision::keep(*index);
        }
        out << fmt::format("Please answer a number between 0 and {}, a, d or q.\n", group.members.size() - 1);
    }
}


std::optional<std::filesystem::path> ConsoleDecisionSource::pick_relocation_target(const std::filesystem::path& folder)
{
    out << fmt::format("Move '{}' to which folder? ", Utils::path_to_utf8(folder.filename()));
    std::string line;
    if (!std::getline(in, line)) {
        out << '\n';
        return std::nullopt;
    }
    const std::string target = trim(line);
    if (target.empty()) {
        return std::nullopt;
    }
    if (logger) {
        logger->debug("Relocation target for '{}': '{}'", Utils::path_to_utf8(folder), target);
    }
    return Utils::utf8_to_path(target);
}


LivePhotoDecision ConsoleDecisionSource::decide_live_photo(const std::filesystem::path& file)
{
    out << fmt::format("\nLive photo clip '{}'\n", Utils::path_to_utf8(file));
    while (true) {
        const auto answer = ask("[k]eep, [t]rash, [q]uit: ");
        if (!answer || *answer == "q" || *answer == "quit") {
            return LivePhotoDecision::Quit;
        }
        if (*answer == "k" || *answer == "keep") {
            return LivePhotoDecision::Keep;
        }
        if (*answer == "t" || *answer == "trash") {
            return LivePhotoDecision::Trash;
        }
        out << "Please answer k, t or q.\n";
    }
}


ImageReviewDecision ConsoleDecisionSource::review_image(const std::filesystem::path& file)
{
    out << fmt::format("\nImage '{}'\n", Utils::path_to_utf8(file));
    while (true) {
        const auto answer = ask("[o]k, [j]unk, [m]eme, [r]ename, [c]hange date, [s]kip folder, [q]uit: ");
        if (!answer || *answer == "q" || *answer == "quit") {
            return ImageReviewDecision::quit();
        }
        if (*answer == "o" || *answer == "ok") {
            return ImageReviewDecision::ok();
        }
        if (*answer == "j" || *answer == "junk") {
            return ImageReviewDecision::junk();
        }
        if (*answer == "m" || *answer == "meme") {
            return ImageReviewDecision::meme();
        }
        if (*answer == "s" || *answer == "skip") {
            return ImageReviewDecision::skip_folder();
        }
        if (*answer == "r" || *answer == "rename") {
            const auto stem = read_line(fmt::format("New name without extension [{}]: ",
                                                    Utils::path_to_utf8(file.stem())));
            if (!stem) {
                return ImageReviewDecision::quit();
            }
            if (!stem->empty()) {
                return ImageReviewDecision::rename(*stem);
            }
            continue;
        }
        if (*answer == "c" || *answer == "change" || *answer == "date") {
            const auto date = read_line("New date (YYYY or YYYY-MM): ");
            if (!date) {
                return ImageReviewDecision::quit();
            }
            if (date->empty()) {
                continue;
            }
            if (const auto parsed = parse_year_month(*date)) {
                return ImageReviewDecision::change_date(parsed->first, parsed->second);
            }
            out << "Please enter a date as YYYY or YYYY-MM.\n";
            continue;
        }
        out << "Please answer o, j, m, r, c, s or q.\n";
    }
}
