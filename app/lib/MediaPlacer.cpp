#include "MediaPlacer.hpp"
#include "MediaClassifier.hpp"
#include "SidecarReclaimer.hpp"
#include "TimestampResolver.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace fs = std::filesystem;

namespace {

bool is_permission_problem(const std::error_code& ec)
{
    return ec == std::errc::read_only_file_system
        || ec == std::errc::permission_denied
        || ec == std::errc::operation_not_permitted;
}

}


MediaPlacer::MediaPlacer(const MediaClassifier& classifier,
                         SidecarReclaimer& reclaimer,
                         std::shared_ptr<spdlog::logger> logger)
    : classifier(classifier),
      reclaimer(reclaimer),
      logger(std::move(logger))
{
}


fs::path MediaPlacer::destination_dir(const fs::path& file, const fs::path& target_root) const
{
    const SorterConfig& config = classifier.config();
    switch (classifier.classify_file(file)) {
        case MediaKind::Screenshot:
            return target_root / Utils::utf8_to_path(config.screenshots_folder);
        case MediaKind::ScreenRecording:
            return target_root / Utils::utf8_to_path(config.screen_recordings_folder);
        case MediaKind::Plain:
        default:
            break;
    }
    const CalendarDate date = TimestampResolver::to_local_date(
        TimestampResolver::earliest_timestamp(file));
    return TimestampResolver::dated_folder(target_root, date);
}


MediaPlacer::Outcome MediaPlacer::place(const fs::path& file,
                                        const fs::path& target_root,
                                        const fs::path& prune_root,
                                        int* pruned)
{
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(file, ec))) {
        if (logger) {
            logger->debug("'{}' vanished before it could be placed", Utils::path_to_utf8(file));
        }
        return Outcome::Skipped;
    }

    const fs::path dest_dir = destination_dir(file, target_root);
    if (file.parent_path().lexically_normal() == dest_dir.lexically_normal()) {
        return Outcome::AlreadyPlaced;
    }

    return move_into(file, dest_dir, prune_root, pruned) ? Outcome::Moved : Outcome::Skipped;
}


std::optional<fs::path> MediaPlacer::move_into(const fs::path& source,
                                               const fs::path& dest_dir,
                                               const fs::path& prune_root,
                                               int* pruned)
{
    if (!ensure_directory(dest_dir)) {
        return std::nullopt;
    }

    std::error_code ec;
    const bool is_directory = fs::is_directory(fs::symlink_status(source, ec));
    const fs::path destination = unique_destination(dest_dir, source.filename(), is_directory);

    if (!relocate(source, destination)) {
        return std::nullopt;
    }

    if (logger) {
        logger->info("Moved '{}' to '{}'", Utils::path_to_utf8(source), Utils::path_to_utf8(destination));
    }
    const int removed = reclaimer.prune_empty_ancestors(source.parent_path(), prune_root);
    if (pruned) {
        *pruned += removed;
    }
    return destination;
}


fs::path MediaPlacer::unique_destination(const fs::path& dir, const fs::path& name, bool is_directory)
{
    std::error_code ec;
    fs::path candidate = dir / name;
    if (!fs::exists(fs::symlink_status(candidate, ec))) {
        return candidate;
    }

    const fs::path stem = is_directory ? name : name.stem();
    const fs::path extension = is_directory ? fs::path() : name.extension();
    for (int n = 1;; ++n) {
        fs::path candidate_name = stem;
        candidate_name += fmt::format(" ({})", n);
        candidate_name += extension;
        candidate = dir / candidate_name;
        if (!fs::exists(fs::symlink_status(candidate, ec))) {
            return candidate;
        }
    }
}


bool MediaPlacer::ensure_directory(const fs::path& dir) const
{
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }

    fs::create_directories(dir, ec);
    if (!ec && fs::is_directory(dir, ec)) {
        return true;
    }

    if (logger) {
        if (is_permission_problem(ec)) {
            logger->warn("Cannot create '{}' ({}); skipping the move", Utils::path_to_utf8(dir), ec.message());
        } else {
            logger->warn("Failed to create directory '{}': {}", Utils::path_to_utf8(dir),
                         ec ? ec.message() : std::string("a file with that name exists"));
        }
    }
    return false;
}


bool MediaPlacer::relocate(const fs::path& source, const fs::path& destination) const
{
    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) {
        return true;
    }

    if (ec == std::errc::cross_device_link) {
        std::error_code copy_ec;
        if (copy_then_remove(source, destination, copy_ec)) {
            return true;
        }
        ec = copy_ec;
    }

    if (logger) {
        logger->error("Failed to move '{}' to '{}': {}",
                      Utils::path_to_utf8(source), Utils::path_to_utf8(destination), ec.message());
    }
    return false;
}


bool MediaPlacer::copy_then_remove(const fs::path& source, const fs::path& destination, std::error_code& ec) const
{
    if (fs::is_directory(fs::symlink_status(source, ec))) {
        fs::copy(source, destination,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        if (ec) {
            std::error_code cleanup_ec;
            fs::remove_all(destination, cleanup_ec);
            return false;
        }
        std::error_code walk_ec;
        for (fs::recursive_directory_iterator it(source, walk_ec), end; !walk_ec && it != end; it.increment(walk_ec)) {
            std::error_code time_ec;
            if (!it->is_regular_file(time_ec)) {
                continue;
            }
            const auto mtime = fs::last_write_time(it->path(), time_ec);
            if (!time_ec) {
                fs::last_write_time(destination / it->path().lexically_relative(source), mtime, time_ec);
            }
        }
        fs::remove_all(source, ec);
        return !ec;
    }

    const auto mtime = fs::last_write_time(source, ec);
    if (ec) {
        return false;
    }
    if (!fs::copy_file(source, destination, fs::copy_options::none, ec) || ec) {
        return false;
    }
    std::error_code time_ec;
    fs::last_write_time(destination, mtime, time_ec);
    if (time_ec && logger) {
        logger->warn("Could not preserve the modification time of '{}': {}",
                     Utils::path_to_utf8(destination), time_ec.message());
    }

    if (!fs::remove(source, ec) || ec) {
        // Leave a single copy behind rather than two.
        std::error_code cleanup_ec;
        fs::remove(destination, cleanup_ec);
        return false;
    }
    return true;
}
