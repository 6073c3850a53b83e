#pragma once

#include "Types.hpp"

#include <filesystem>
#include <optional>

/**
 * @brief Answers the questions the engines cannot settle on their own.
 *
 * Implementations may block (a console prompt, a dialog). Every method may answer
 * Quit, which the caller honors before applying anything further.
 */
class IDecisionSource {
public:
    virtual ~IDecisionSource() = default;

    /// Unclassified folder that holds media.
    virtual FolderDecision decide_folder(const std::filesystem::path& folder) = 0;

    /// @p default_index is the member the canonical-choice cascade picked.
    virtual DuplicateDecision decide_duplicate(const DuplicateGroup& group, std::size_t default_index) = 0;

    /// Where a kept folder should go; nullopt leaves it in place.
    virtual std::optional<std::filesystem::path> pick_relocation_target(const std::filesystem::path& folder) = 0;

    virtual LivePhotoDecision decide_live_photo(const std::filesystem::path& file) = 0;

    virtual ImageReviewDecision review_image(const std::filesystem::path& file) = 0;
};
