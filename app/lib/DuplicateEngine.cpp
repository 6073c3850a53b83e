#include "DuplicateEngine.hpp"
#include "IDecisionSource.hpp"
#include "MediaClassifier.hpp"
#include "TimestampResolver.hpp"
#include "Utils.hpp"

#include <QByteArray>
#include <QCryptographicHash>
#include <QFile>
#include <QString>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <future>
#include <iterator>
#include <limits>
#include <map>
#include <regex>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace {

struct HashResult {
    std::size_t index;
    std::optional<std::string> digest;
};

struct Candidate {
    std::size_t index;
    bool auxiliary;
    std::uint64_t number;
    std::chrono::system_clock::time_point timestamp;
    DuplicateEngine::LocationKind location;
};

using Candidates = std::vector<Candidate>;

Candidates keep_earliest(const Candidates& candidates)
{
    Candidates result;
    for (const auto& candidate : candidates) {
        if (result.empty() || candidate.timestamp < result.front().timestamp) {
            result.assign(1, candidate);
        } else if (candidate.timestamp == result.front().timestamp) {
            result.push_back(candidate);
        }
    }
    return result;
}

Candidates filter_location(const Candidates& candidates, DuplicateEngine::LocationKind location)
{
    Candidates result;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(result),
                 [location](const Candidate& c) { return c.location == location; });
    return result;
}

}


DuplicateEngine::DuplicateEngine(const MediaClassifier& classifier,
                                 ITrashBin& trash,
                                 std::shared_ptr<spdlog::logger> logger)
    : classifier(classifier),
      logger(logger),
      reclaimer(classifier, trash, logger)
{
}


DuplicateEngine::GroupScan DuplicateEngine::find_groups(const fs::path& root) const
{
    GroupScan scan;

    std::map<std::uintmax_t, std::vector<fs::path>> by_size;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec) || !it->is_regular_file(entry_ec) || !classifier.is_media(it->path())) {
            continue;
        }
        const auto size = it->file_size(entry_ec);
        if (entry_ec) {
            ++scan.unreadable;
            continue;
        }
        by_size[size].push_back(it->path());
    }
    if (ec && logger) {
        logger->warn("Duplicate scan of '{}' stopped early: {}", Utils::path_to_utf8(root), ec.message());
    }

    std::vector<std::pair<std::uintmax_t, fs::path>> candidates;
    for (auto& [size, paths] : by_size) {
        if (paths.size() < 2) {
            continue;
        }
        for (auto& path : paths) {
            candidates.emplace_back(size, std::move(path));
        }
    }
    if (candidates.empty()) {
        return scan;
    }

    const unsigned int workers = worker_count(candidates.size());
    if (logger) {
        logger->info("Hashing {} candidate file(s) on {} worker(s)", candidates.size(), workers);
    }

    std::vector<std::future<std::vector<HashResult>>> futures;
    futures.reserve(workers);
    for (unsigned int worker = 0; worker < workers; ++worker) {
        futures.push_back(std::async(std::launch::async, [&candidates, worker, workers]() {
            std::vector<HashResult> results;
            for (std::size_t i = worker; i < candidates.size(); i += workers) {
                results.push_back({i, hash_file(candidates[i].second)});
            }
            return results;
        }));
    }

    std::map<std::pair<std::uintmax_t, std::string>, std::vector<fs::path>> by_content;
    for (auto& future : futures) {
        for (auto& result : future.get()) {
            const auto& [size, path] = candidates[result.index];
            if (!result.digest) {
                ++scan.unreadable;
                if (logger) {
                    logger->warn("Could not read '{}' for hashing", Utils::path_to_utf8(path));
                }
                continue;
            }
            by_content[{size, *result.digest}].push_back(path);
        }
    }

    for (auto& [key, paths] : by_content) {
        if (paths.size() < 2) {
            continue;
        }
        std::sort(paths.begin(), paths.end());

        DuplicateGroup group;
        group.size_bytes = key.first;
        group.content_hash = key.second;
        for (auto& path : paths) {
            const auto timestamp = TimestampResolver::earliest_timestamp(path);
            group.members.push_back({std::move(path), timestamp});
        }
        group.canonical_index = choose_default(group, root);
        scan.groups.push_back(std::move(group));
    }

    std::sort(scan.groups.begin(), scan.groups.end(), [](const DuplicateGroup& lhs, const DuplicateGroup& rhs) {
        return lhs.members.front().path < rhs.members.front().path;
    });
    return scan;
}


std::size_t DuplicateEngine::choose_default(const DuplicateGroup& group, const fs::path& root) const
{
    if (group.members.empty()) {
        return 0;
    }

    const std::string& live_suffix = classifier.config().live_suffix;
    Candidates all;
    for (std::size_t i = 0; i < group.members.size(); ++i) {
        const auto& member = group.members[i];
        const std::string stem = Utils::path_to_utf8(member.path.stem());
        all.push_back({i,
                       is_auxiliary_stem(stem, live_suffix),
                       trailing_number(stem).value_or(std::numeric_limits<std::uint64_t>::max()),
                       member.timestamp,
                       location_kind(root, member.path)});
    }

    // Members are ordered by path, so the first survivor is also the smallest path.
    Candidates survivors;
    std::copy_if(all.begin(), all.end(), std::back_inserter(survivors),
                 [](const Candidate& c) { return !c.auxiliary; });
    if (survivors.empty()) {
        survivors = all;
    }
    if (survivors.size() == 1) {
        return survivors.front().index;
    }

    const auto smallest = std::min_element(survivors.begin(), survivors.end(),
        [](const Candidate& lhs, const Candidate& rhs) { return lhs.number < rhs.number; })->number;
    Candidates numbered;
    std::copy_if(survivors.begin(), survivors.end(), std::back_inserter(numbered),
                 [smallest](const Candidate& c) { return c.number == smallest; });
    survivors = std::move(numbered);
    if (survivors.size() == 1) {
        return survivors.front().index;
    }

    for (LocationKind preferred : {LocationKind::Dated, LocationKind::Generated}) {
        const Candidates located = filter_location(survivors, preferred);
        if (!located.empty()) {
            return keep_earliest(located).front().index;
        }
    }

    const Candidates earliest = keep_earliest(survivors);
    if (earliest.size() == 1) {
        return earliest.front().index;
    }

    const auto best = std::min_element(earliest.begin(), earliest.end(),
        [](const Candidate& lhs, const Candidate& rhs) { return lhs.location < rhs.location; })->location;
    return filter_location(earliest, best).front().index;
}


DuplicateReport DuplicateEngine::run(const fs::path& root, IDecisionSource& decisions)
{
    const fs::path canonical_root = Utils::require_directory(root);
    DuplicateReport report;

    GroupScan scan = find_groups(canonical_root);
    report.groups = static_cast<int>(scan.groups.size());
    report.unreadable = scan.unreadable;
    if (logger) {
        logger->info("Found {} duplicate group(s) under '{}'", report.groups, Utils::path_to_utf8(canonical_root));
    }

    for (const auto& group : scan.groups) {
        const DuplicateDecision decision = decisions.decide_duplicate(group, group.canonical_index);
        switch (decision.action) {
            case DuplicateDecision::Action::Quit:
                report.status = RunStatus::Cancelled;
                if (logger) {
                    logger->info("Duplicate review cancelled: {} trashed, {} kept", report.trashed, report.kept);
                }
                return report;
            case DuplicateDecision::Action::ConfirmDefault:
                trash_all_except(group, group.canonical_index, canonical_root, report);
                break;
            case DuplicateDecision::Action::KeepIndex:
                if (decision.index >= group.members.size()) {
                    if (logger) {
                        logger->warn("Ignoring out-of-range choice {} for a group of {}",
                                     decision.index, group.members.size());
                    }
                    report.kept += static_cast<int>(group.members.size());
                    break;
                }
                trash_all_except(group, decision.index, canonical_root, report);
                break;
            case DuplicateDecision::Action::DeleteAll:
                trash_all_except(group, std::nullopt, canonical_root, report);
                break;
            case DuplicateDecision::Action::KeepAll:
                report.kept += static_cast<int>(group.members.size());
                break;
        }
    }

    if (logger) {
        logger->info("Duplicate review complete: {} trashed, {} kept, {} failed, {} unreadable",
                     report.trashed, report.kept, report.failed, report.unreadable);
    }
    return report;
}


void DuplicateEngine::trash_all_except(const DuplicateGroup& group,
                                       std::optional<std::size_t> keep_index,
                                       const fs::path& root,
                                       DuplicateReport& report)
{
    for (std::size_t i = 0; i < group.members.size(); ++i) {
        if (keep_index && *keep_index == i) {
            ++report.kept;
            continue;
        }
        if (reclaimer.trash_and_prune(group.members[i].path, root)) {
            ++report.trashed;
        } else {
            ++report.failed;
        }
    }
}


DuplicateEngine::LocationKind DuplicateEngine::location_kind(const fs::path& root, const fs::path& file) const
{
    // Only the top of the layout counts: `<year>/<month>/...` or a generated or
    // backup folder directly under the root.
    const fs::path relative = file.parent_path().lexically_relative(root);
    std::vector<std::string> parts;
    for (const auto& part : relative) {
        parts.push_back(Utils::path_to_utf8(part));
    }
    if (parts.empty() || parts.front() == "." || parts.front() == "..") {
        return LocationKind::Other;
    }

    if (parts.size() >= 2
        && classifier.classify_folder_name(parts[0]) == FolderKind::Year
        && classifier.classify_folder_name(parts[1]) == FolderKind::Month) {
        return LocationKind::Dated;
    }
    if (classifier.is_generated_name(parts[0])) {
        return LocationKind::Generated;
    }
    if (classifier.classify_folder_name(parts[0]) == FolderKind::Backup) {
        return LocationKind::Backup;
    }
    return LocationKind::Other;
}


bool DuplicateEngine::is_auxiliary_stem(const std::string& stem, const std::string& live_suffix)
{
    static const std::regex kNumberedCopy(R"(\(\d+\)$)");
    static const std::regex kSpacedNumber(R"(\s+\d+$)");

    if (std::regex_search(stem, kNumberedCopy) || std::regex_search(stem, kSpacedNumber)) {
        return true;
    }
    if (live_suffix.empty() || stem.size() < live_suffix.size()) {
        return false;
    }
    return Utils::to_lower_copy(stem.substr(stem.size() - live_suffix.size()))
        == Utils::to_lower_copy(live_suffix);
}


std::optional<std::uint64_t> DuplicateEngine::trailing_number(const std::string& stem)
{
    std::size_t start = stem.size();
    while (start > 0 && stem[start - 1] >= '0' && stem[start - 1] <= '9') {
        --start;
    }
    if (start == stem.size()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    const auto parsed = std::from_chars(stem.data() + start, stem.data() + stem.size(), value);
    if (parsed.ec == std::errc::result_out_of_range) {
        return std::numeric_limits<std::uint64_t>::max() - 1;
    }
    return value;
}


std::optional<std::string> DuplicateEngine::hash_file(const fs::path& path)
{
    QFile file(QString::fromStdString(Utils::path_to_utf8(path)));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        return std::nullopt;
    }
    return hash.result().toHex().toStdString();
}


unsigned int DuplicateEngine::worker_count(std::size_t candidates) const
{
    unsigned int workers = classifier.config().hash_workers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<unsigned int>(std::min<std::size_t>(workers, candidates));
}
