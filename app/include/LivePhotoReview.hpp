#ifndef LIVE_PHOTO_REVIEW_HPP
#define LIVE_PHOTO_REVIEW_HPP

#include "SidecarReclaimer.hpp"
#include "Types.hpp"

#include <filesystem>
#include <memory>
#include <vector>

class IDecisionSource;
class ITrashBin;
class MediaClassifier;
namespace spdlog { class logger; }

/**
 * @brief Offers every live-photo companion clip ("IMG_0001-Live.mov") for keep or trash.
 */
class LivePhotoReview {
public:
    LivePhotoReview(const MediaClassifier& classifier,
                    ITrashBin& trash,
                    std::shared_ptr<spdlog::logger> logger);

    std::vector<std::filesystem::path> find_companions(const std::filesystem::path& root) const;

    /**
     * @throws ErrorCodes::AppException when @p root is missing or not a readable directory.
     */
    ReviewReport run(const std::filesystem::path& root, IDecisionSource& decisions);

    bool is_live_companion(const std::filesystem::path& path) const;

private:
    const MediaClassifier& classifier;
    std::shared_ptr<spdlog::logger> logger;
    SidecarReclaimer reclaimer;
};

#endif
