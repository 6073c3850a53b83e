#include "ImageReview.hpp"
#include "IDecisionSource.hpp"
#include "MediaClassifier.hpp"
#include "TimestampResolver.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace fs = std::filesystem;


ImageReview::ImageReview(const MediaClassifier& classifier,
                         ITrashBin& trash,
                         std::shared_ptr<spdlog::logger> logger)
    : classifier(classifier),
      logger(logger),
      reclaimer(classifier, trash, logger),
      placer(classifier, reclaimer, logger)
{
}


std::vector<fs::path> ImageReview::folders_with_images(const fs::path& root) const
{
    const fs::path memes_dir = root / Utils::utf8_to_path(classifier.config().memes_folder);
    std::set<fs::path> folders;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec)) {
            continue;
        }
        if (it->is_directory(entry_ec)) {
            if (it->path() == memes_dir) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file(entry_ec) && classifier.is_media(it->path()) && classifier.is_image(it->path())) {
            folders.insert(it->path().parent_path());
        }
    }
    if (ec && logger) {
        logger->warn("Image scan of '{}' stopped early: {}", Utils::path_to_utf8(root), ec.message());
    }
    return {folders.begin(), folders.end()};
}


std::vector<fs::path> ImageReview::images_in(const fs::path& folder) const
{
    std::vector<fs::path> images;
    std::error_code ec;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_symlink(entry_ec) && it->is_regular_file(entry_ec)
            && classifier.is_media(it->path()) && classifier.is_image(it->path())) {
            images.push_back(it->path());
        }
    }
    if (ec && logger) {
        logger->warn("Could not list '{}': {}", Utils::path_to_utf8(folder), ec.message());
    }
    std::sort(images.begin(), images.end());
    return images;
}


ReviewReport ImageReview::run(const fs::path& root, IDecisionSource& decisions)
{
    const fs::path canonical_root = Utils::require_directory(root);
    const fs::path memes_dir = canonical_root / Utils::utf8_to_path(classifier.config().memes_folder);
    ReviewReport report;

    for (const auto& folder : folders_with_images(canonical_root)) {
        const auto images = images_in(folder);
        for (std::size_t i = 0; i < images.size(); ++i) {
            const fs::path& image = images[i];
            const ImageReviewDecision decision = decisions.review_image(image);
            using Action = ImageReviewDecision::Action;
            if (decision.action == Action::Quit) {
                report.status = RunStatus::Cancelled;
                if (logger) {
                    logger->info("Image review cancelled: {} reviewed, {} trashed, {} moved",
                                 report.reviewed, report.trashed, report.moved);
                }
                return report;
            }
            if (decision.action == Action::SkipFolder) {
                report.skipped += static_cast<int>(images.size() - i);
                break;
            }

            ++report.reviewed;
            switch (decision.action) {
                case Action::Junk:
                    if (reclaimer.trash_and_prune(image, canonical_root)) {
                        ++report.trashed;
                    } else {
                        ++report.failed;
                    }
                    break;
                case Action::Meme:
                    if (placer.move_into(image, memes_dir, canonical_root)) {
                        ++report.moved;
                    } else {
                        ++report.failed;
                    }
                    break;
                case Action::Rename:
                    if (rename_image(image, decision.new_stem)) {
                        ++report.renamed;
                    } else {
                        ++report.failed;
                    }
                    break;
                case Action::ChangeDate:
                    if (change_date(image, canonical_root, decision.year, decision.month)) {
                        ++report.redated;
                    } else {
                        ++report.failed;
                    }
                    break;
                default:
                    break;
            }
        }
    }

    if (logger) {
        logger->info("Image review complete: {} reviewed, {} trashed, {} moved to '{}', {} renamed, {} redated, {} skipped",
                     report.reviewed, report.trashed, report.moved,
                     Utils::path_to_utf8(memes_dir), report.renamed, report.redated, report.skipped);
    }
    return report;
}


std::optional<fs::path> ImageReview::live_companion_of(const fs::path& image) const
{
    const std::string& suffix = classifier.config().live_suffix;
    if (suffix.empty()) {
        return std::nullopt;
    }
    const std::string wanted = Utils::to_lower_copy(Utils::path_to_utf8(image.stem()) + suffix);

    std::error_code ec;
    for (fs::directory_iterator it(image.parent_path(), ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec) || !it->is_regular_file(entry_ec) || !classifier.is_video(it->path())) {
            continue;
        }
        if (Utils::to_lower_copy(Utils::path_to_utf8(it->path().stem())) == wanted) {
            return it->path();
        }
    }
    return std::nullopt;
}


bool ImageReview::rename_image(const fs::path& image, const std::string& new_stem)
{
    const fs::path new_stem_path = Utils::utf8_to_path(new_stem);
    if (new_stem.empty() || new_stem_path.has_parent_path()
        || new_stem_path == "." || new_stem_path == "..") {
        if (logger) {
            logger->warn("Refusing to rename '{}' to '{}'", Utils::path_to_utf8(image), new_stem);
        }
        return false;
    }

    fs::path new_name = new_stem_path;
    new_name += image.extension();
    const fs::path target = image.parent_path() / new_name;
    if (target == image) {
        return true;
    }

    std::error_code ec;
    if (fs::exists(fs::symlink_status(target, ec))) {
        if (logger) {
            logger->warn("Cannot rename '{}': '{}' already exists",
                         Utils::path_to_utf8(image), Utils::path_to_utf8(target));
        }
        return false;
    }

    const auto companion = live_companion_of(image);
    fs::rename(image, target, ec);
    if (ec) {
        if (logger) {
            logger->error("Failed to rename '{}' to '{}': {}",
                          Utils::path_to_utf8(image), Utils::path_to_utf8(target), ec.message());
        }
        return false;
    }
    if (logger) {
        logger->info("Renamed '{}' to '{}'", Utils::path_to_utf8(image), Utils::path_to_utf8(target));
    }

    if (companion) {
        fs::path companion_name = new_stem_path;
        companion_name += Utils::utf8_to_path(classifier.config().live_suffix);
        companion_name += companion->extension();
        const fs::path companion_target = image.parent_path() / companion_name;
        if (fs::exists(fs::symlink_status(companion_target, ec))) {
            if (logger) {
                logger->warn("Live clip '{}' keeps its name: '{}' already exists",
                             Utils::path_to_utf8(*companion), Utils::path_to_utf8(companion_target));
            }
        } else {
            fs::rename(*companion, companion_target, ec);
            if (ec && logger) {
                logger->warn("Failed to rename live clip '{}': {}", Utils::path_to_utf8(*companion), ec.message());
            }
        }
    }
    return true;
}


bool ImageReview::change_date(const fs::path& image, const fs::path& root, int year, int month)
{
    if (year < 1 || month < 1 || month > 12) {
        if (logger) {
            logger->warn("Refusing to move '{}' to an invalid date {}-{}", Utils::path_to_utf8(image), year, month);
        }
        return false;
    }

    const fs::path dest_dir = TimestampResolver::dated_folder(root, CalendarDate{year, month, 1});
    if (image.parent_path().lexically_normal() == dest_dir.lexically_normal()) {
        return true;
    }

    const auto companion = live_companion_of(image);
    const auto moved = placer.move_into(image, dest_dir, root);
    if (!moved) {
        return false;
    }

    if (companion) {
        // The clip follows whatever name the image ended up with.
        fs::path companion_name = moved->stem();
        companion_name += Utils::utf8_to_path(classifier.config().live_suffix);
        companion_name += companion->extension();
        std::error_code ec;
        const fs::path companion_target = dest_dir / companion_name;
        if (fs::exists(fs::symlink_status(companion_target, ec))) {
            placer.move_into(*companion, dest_dir, root);
        } else {
            fs::rename(*companion, companion_target, ec);
            if (ec) {
                if (logger) {
                    logger->warn("Failed to move live clip '{}': {}", Utils::path_to_utf8(*companion), ec.message());
                }
            } else {
                reclaimer.prune_empty_ancestors(companion->parent_path(), root);
            }
        }
    }
    return true;
}
