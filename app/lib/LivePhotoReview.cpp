#include "LivePhotoReview.hpp"
#include "IDecisionSource.hpp"
#include "MediaClassifier.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;


LivePhotoReview::LivePhotoReview(const MediaClassifier& classifier,
                                 ITrashBin& trash,
                                 std::shared_ptr<spdlog::logger> logger)
    : classifier(classifier),
      logger(logger),
      reclaimer(classifier, trash, logger)
{
}


bool LivePhotoReview::is_live_companion(const fs::path& path) const
{
    const std::string& suffix = classifier.config().live_suffix;
    if (suffix.empty() || !classifier.is_media(path) || !classifier.is_video(path)) {
        return false;
    }
    const std::string stem = Utils::to_lower_copy(Utils::path_to_utf8(path.stem()));
    return stem.ends_with(Utils::to_lower_copy(suffix));
}


std::vector<fs::path> LivePhotoReview::find_companions(const fs::path& root) const
{
    std::vector<fs::path> companions;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_symlink(entry_ec) && it->is_regular_file(entry_ec) && is_live_companion(it->path())) {
            companions.push_back(it->path());
        }
    }
    if (ec && logger) {
        logger->warn("Live photo scan of '{}' stopped early: {}", Utils::path_to_utf8(root), ec.message());
    }
    std::sort(companions.begin(), companions.end());
    return companions;
}


ReviewReport LivePhotoReview::run(const fs::path& root, IDecisionSource& decisions)
{
    const fs::path canonical_root = Utils::require_directory(root);
    ReviewReport report;

    for (const auto& clip : find_companions(canonical_root)) {
        const LivePhotoDecision decision = decisions.decide_live_photo(clip);
        if (decision == LivePhotoDecision::Quit) {
            report.status = RunStatus::Cancelled;
            break;
        }
        ++report.reviewed;
        if (decision == LivePhotoDecision::Trash) {
            if (reclaimer.trash_and_prune(clip, canonical_root)) {
                ++report.trashed;
            } else {
                ++report.failed;
            }
        }
    }

    if (logger) {
        logger->info("Live photo review {}: {} reviewed, {} trashed, {} failed",
                     report.status == RunStatus::Cancelled ? "cancelled" : "complete",
                     report.reviewed, report.trashed, report.failed);
    }
    return report;
}
