#ifndef IMAGE_REVIEW_HPP
#define IMAGE_REVIEW_HPP

#include "MediaPlacer.hpp"
#include "SidecarReclaimer.hpp"
#include "Types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class IDecisionSource;
class ITrashBin;
class MediaClassifier;
namespace spdlog { class logger; }

/**
 * @brief Image-by-image review of every folder that holds images.
 *
 * Folders are visited in lexicographic order and their direct images in name order.
 * Junk is trashed, memes are moved into the memes bucket at the root, and the memes
 * bucket itself is never reviewed. Renaming or re-dating an image carries its live
 * clip (`<stem><live_suffix>.<ext>`) along.
 */
class ImageReview {
public:
    ImageReview(const MediaClassifier& classifier,
                ITrashBin& trash,
                std::shared_ptr<spdlog::logger> logger);

    std::vector<std::filesystem::path> folders_with_images(const std::filesystem::path& root) const;

    ReviewReport run(const std::filesystem::path& root, IDecisionSource& decisions);

private:
    std::vector<std::filesystem::path> images_in(const std::filesystem::path& folder) const;
    std::optional<std::filesystem::path> live_companion_of(const std::filesystem::path& image) const;
    bool rename_image(const std::filesystem::path& image, const std::string& new_stem);
    /// Moves the image into `root/<year>/<MM-Month>` and prunes what it leaves empty.
    bool change_date(const std::filesystem::path& image, const std::filesystem::path& root, int year, int month);

    const MediaClassifier& classifier;
    std::shared_ptr<spdlog::logger> logger;
    SidecarReclaimer reclaimer;
    MediaPlacer placer;
};

#endif
