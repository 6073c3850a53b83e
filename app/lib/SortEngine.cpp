#include "SortEngine.hpp"
#include "BackupDate.hpp"
#include "IDecisionSource.hpp"
#include "MediaClassifier.hpp"
#include "TimestampResolver.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::size_t depth_below(const fs::path& path, const fs::path& root)
{
    const fs::path relative = path.lexically_relative(root);
    return static_cast<std::size_t>(std::distance(relative.begin(), relative.end()));
}

bool is_plain_directory(const fs::directory_entry& entry)
{
    std::error_code ec;
    return !entry.is_symlink(ec) && entry.is_directory(ec);
}

bool is_plain_file(const fs::directory_entry& entry)
{
    std::error_code ec;
    return !entry.is_symlink(ec) && entry.is_regular_file(ec);
}

}


SortEngine::SortEngine(const MediaClassifier& classifier,
                       ITrashBin& trash,
                       std::shared_ptr<spdlog::logger> logger)
    : classifier(classifier),
      logger(logger),
      reclaimer(classifier, trash, logger),
      placer(classifier, reclaimer, logger)
{
}


SortReport SortEngine::run(const fs::path& root, IDecisionSource& decisions)
{
    RunState state{Utils::require_directory(root), decisions, {}, {}};
    if (logger) {
        logger->info("Sorting '{}'", Utils::path_to_utf8(state.root));
    }

    const auto purge = reclaimer.purge(state.root);
    state.report.trashed += purge.trashed;
    state.report.pruned += purge.pruned;
    state.report.skipped += purge.failed;

    consolidate_backups(state);

    if (!walk(state)) {
        state.report.status = RunStatus::Cancelled;
        if (logger) {
            logger->info("Sort of '{}' cancelled: {} moved, {} kept, {} skipped",
                         Utils::path_to_utf8(state.root), state.report.moved,
                         state.report.kept, state.report.skipped);
        }
        return state.report;
    }

    final_sweep(state);

    if (logger) {
        logger->info("Sort of '{}' complete: {} moved, {} kept, {} skipped, {} trashed, {} pruned, {} backup folder(s) archived",
                     Utils::path_to_utf8(state.root), state.report.moved, state.report.kept,
                     state.report.skipped, state.report.trashed, state.report.pruned,
                     state.report.archived_folders);
    }
    return state.report;
}


void SortEngine::consolidate_backups(RunState& state)
{
    std::vector<fs::path> backups;
    std::error_code ec;
    fs::recursive_directory_iterator it(state.root, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (!is_plain_directory(*it)) {
            continue;
        }
        const std::string name = Utils::path_to_utf8(it->path().filename());
        if (classifier.classify_folder_name(name) == FolderKind::Backup) {
            backups.push_back(it->path());
        }
    }
    if (ec && logger) {
        logger->warn("Backup scan of '{}' stopped early: {}", Utils::path_to_utf8(state.root), ec.message());
    }

    std::sort(backups.begin(), backups.end(), [&](const fs::path& lhs, const fs::path& rhs) {
        const auto lhs_depth = depth_below(lhs, state.root);
        const auto rhs_depth = depth_below(rhs, state.root);
        if (lhs_depth != rhs_depth) {
            return lhs_depth > rhs_depth;
        }
        return lhs < rhs;
    });

    for (const auto& folder : backups) {
        consolidate_backup(state, folder);
    }
}


void SortEngine::consolidate_backup(RunState& state, const fs::path& folder)
{
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(folder, ec))) {
        return;
    }

    const BackupInference inference = BackupDates::infer_backup_date(folder, classifier);

    std::vector<fs::path> media;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (is_plain_file(*it) && classifier.is_media(it->path())) {
            media.push_back(it->path());
        }
    }
    if (ec) {
        if (logger) {
            logger->warn("Could not list backup folder '{}': {}", Utils::path_to_utf8(folder), ec.message());
        }
        return;
    }
    std::sort(media.begin(), media.end());

    const int moved_before = state.report.moved;
    const int kept_before = state.report.kept;
    for (const auto& file : media) {
        if (classifier.classify_file(file) == MediaKind::Plain && inference.date) {
            const CalendarDate own_date = TimestampResolver::to_local_date(
                TimestampResolver::earliest_timestamp(file));
            if (own_date == *inference.date) {
                ++state.report.kept;
                continue;
            }
        }
        // Pruning stops at the backup folder itself; it is archived or removed below.
        place_one(state, file, state.root, folder);
    }

    const std::string name = Utils::path_to_utf8(folder.filename());
    if (logger) {
        logger->info("Backup '{}': moved {}, kept {}", name,
                     state.report.moved - moved_before, state.report.kept - kept_before);
    }

    if (!inference.date) {
        if (fs::is_empty(folder, ec) && !ec) {
            state.report.pruned += reclaimer.prune_empty_ancestors(folder, state.root);
        } else if (logger) {
            logger->warn("Backup folder '{}' has no reliable date and still holds other files; leaving it in place",
                         Utils::path_to_utf8(folder));
        }
        return;
    }

    const fs::path year_dir = state.root / std::to_string(inference.date->year);
    if (folder.parent_path().lexically_normal() == year_dir.lexically_normal()) {
        return;
    }

    const fs::path archive = year_dir / folder.filename();
    const auto archive_status = fs::symlink_status(archive, ec);
    if (fs::exists(archive_status)) {
        if (!fs::is_directory(archive_status)) {
            if (logger) {
                logger->warn("Cannot archive '{}': '{}' exists and is not a folder",
                             Utils::path_to_utf8(folder), Utils::path_to_utf8(archive));
            }
            ++state.report.skipped;
            return;
        }
        if (merge_into_archive(state, folder, archive)) {
            ++state.report.archived_folders;
        }
        state.protected_roots.push_back(archive);
        return;
    }

    if (auto archived = placer.move_into(folder, year_dir, state.root, &state.report.pruned)) {
        ++state.report.archived_folders;
        state.protected_roots.push_back(*archived);
    } else {
        ++state.report.skipped;
    }
}


bool SortEngine::merge_into_archive(RunState& state, const fs::path& folder, const fs::path& archive)
{
    std::vector<fs::path> children;
    std::error_code ec;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        if (logger) {
            logger->warn("Could not list backup folder '{}': {}", Utils::path_to_utf8(folder), ec.message());
        }
        ++state.report.skipped;
        return false;
    }
    std::sort(children.begin(), children.end());

    bool complete = true;
    for (const auto& child : children) {
        // Pruning stops at the folder being merged; it is removed once empty.
        if (!placer.move_into(child, archive, folder)) {
            ++state.report.skipped;
            complete = false;
        }
    }
    if (!complete) {
        if (logger) {
            logger->warn("Backup '{}' was only partly merged into '{}'",
                         Utils::path_to_utf8(folder), Utils::path_to_utf8(archive));
        }
        return false;
    }

    if (logger) {
        logger->info("Merged backup '{}' into existing '{}'",
                     Utils::path_to_utf8(folder), Utils::path_to_utf8(archive));
    }
    state.report.pruned += reclaimer.prune_empty_ancestors(folder, state.root);
    return true;
}


bool SortEngine::walk(RunState& state)
{
    struct Frame {
        fs::path folder;
        bool expanded{false};
    };

    std::vector<Frame> stack;
    stack.push_back({state.root, false});

    while (!stack.empty()) {
        Frame& top = stack.back();
        if (!top.expanded) {
            top.expanded = true;
            auto children = walkable_children(state, top.folder);
            // Reverse so the lexicographically first child is visited first.
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                stack.push_back({std::move(*it), false});
            }
            continue;
        }

        const fs::path folder = std::move(top.folder);
        stack.pop_back();
        if (folder == state.root) {
            continue;
        }

        const WalkAction action = visit_folder(state, folder);
        if (action == WalkAction::Abort) {
            return false;
        }
        if (action == WalkAction::SkipSubtree) {
            state.protected_roots.push_back(folder);
        }
    }
    return true;
}


WalkAction SortEngine::visit_folder(RunState& state, const fs::path& folder)
{
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(folder, ec)) || is_protected(state, folder)) {
        return WalkAction::Continue;
    }

    const FolderKind kind = classifier.classify_folder_name(Utils::path_to_utf8(folder.filename()));
    if (kind != FolderKind::Unclassified) {
        return WalkAction::Continue;
    }

    if (collect_media(state, folder).empty()) {
        if (fs::is_empty(folder, ec) && !ec && fs::remove(folder, ec) && !ec) {
            ++state.report.pruned;
            if (logger) {
                logger->debug("Removed empty folder '{}'", Utils::path_to_utf8(folder));
            }
        }
        return WalkAction::Continue;
    }

    switch (state.decisions.decide_folder(folder)) {
        case FolderDecision::Keep:
            keep_folder(state, folder);
            return WalkAction::SkipSubtree;
        case FolderDecision::SortInside:
            place_all(state, folder, folder);
            return WalkAction::SkipSubtree;
        case FolderDecision::SortIntoYears:
            place_all(state, folder, state.root);
            return WalkAction::Continue;
        case FolderDecision::Skip:
            if (logger) {
                logger->info("Leaving '{}' untouched", Utils::path_to_utf8(folder));
            }
            return WalkAction::SkipSubtree;
        case FolderDecision::Quit:
        default:
            return WalkAction::Abort;
    }
}


void SortEngine::keep_folder(RunState& state, const fs::path& folder)
{
    const auto target = state.decisions.pick_relocation_target(folder);
    if (!target) {
        return;
    }

    const fs::path target_dir = target->lexically_normal();
    if (Utils::is_within(target_dir, folder)) {
        if (logger) {
            logger->warn("Cannot move '{}' into itself ('{}'); leaving it in place",
                         Utils::path_to_utf8(folder), Utils::path_to_utf8(target_dir));
        }
        ++state.report.skipped;
        return;
    }
    if (target_dir == folder.parent_path().lexically_normal()) {
        return;
    }

    if (auto moved_to = placer.move_into(folder, target_dir, state.root, &state.report.pruned)) {
        ++state.report.moved;
        state.protected_roots.push_back(*moved_to);
    } else {
        ++state.report.skipped;
    }
}


void SortEngine::place_all(RunState& state, const fs::path& folder, const fs::path& target_root)
{
    const fs::path prune_root = target_root == folder ? folder : state.root;
    for (const auto& file : collect_media(state, folder)) {
        place_one(state, file, target_root, prune_root);
    }
}


void SortEngine::final_sweep(RunState& state)
{
    for (const auto& file : collect_media(state, state.root)) {
        if (is_already_placed(state.root, file)) {
            continue;
        }
        place_one(state, file, state.root, state.root);
    }
}


void SortEngine::place_one(RunState& state,
                           const fs::path& file,
                           const fs::path& target_root,
                           const fs::path& prune_root)
{
    switch (placer.place(file, target_root, prune_root, &state.report.pruned)) {
        case MediaPlacer::Outcome::Moved:
            ++state.report.moved;
            break;
        case MediaPlacer::Outcome::AlreadyPlaced:
            ++state.report.kept;
            break;
        case MediaPlacer::Outcome::Skipped:
            ++state.report.skipped;
            break;
    }
}


bool SortEngine::is_already_placed(const fs::path& root, const fs::path& file) const
{
    const fs::path relative = file.lexically_relative(root);
    std::vector<std::string> parts;
    for (const auto& part : relative) {
        parts.push_back(Utils::path_to_utf8(part));
    }

    if (parts.size() == 3) {
        return classifier.classify_folder_name(parts[0]) == FolderKind::Year
            && classifier.classify_folder_name(parts[1]) == FolderKind::Month;
    }
    if (parts.size() == 2) {
        return classifier.is_generated_name(parts[0]);
    }
    return false;
}


std::vector<fs::path> SortEngine::collect_media(const RunState& state, const fs::path& folder) const
{
    std::vector<fs::path> media;
    std::error_code ec;
    fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (is_plain_directory(*it)) {
            const std::string name = Utils::path_to_utf8(it->path().filename());
            if (classifier.classify_folder_name(name) == FolderKind::Backup || is_protected(state, it->path())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (is_plain_file(*it) && classifier.is_media(it->path())) {
            media.push_back(it->path());
        }
    }
    if (ec && logger) {
        logger->warn("Listing of '{}' stopped early: {}", Utils::path_to_utf8(folder), ec.message());
    }

    std::sort(media.begin(), media.end());
    return media;
}


std::vector<fs::path> SortEngine::walkable_children(const RunState& state, const fs::path& folder) const
{
    std::vector<fs::path> children;
    std::error_code ec;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (!is_plain_directory(*it)) {
            continue;
        }
        const std::string name = Utils::path_to_utf8(it->path().filename());
        if (classifier.classify_folder_name(name) == FolderKind::Backup || is_protected(state, it->path())) {
            continue;
        }
        children.push_back(it->path());
    }
    if (ec && logger) {
        logger->warn("Could not list '{}': {}", Utils::path_to_utf8(folder), ec.message());
    }

    std::sort(children.begin(), children.end());
    return children;
}


bool SortEngine::is_protected(const RunState& state, const fs::path& path) const
{
    return std::any_of(state.protected_roots.begin(), state.protected_roots.end(),
                       [&](const fs::path& protected_root) {
                           return Utils::is_within(path, protected_root);
                       });
}

