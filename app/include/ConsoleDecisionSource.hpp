#ifndef CONSOLE_DECISION_SOURCE_HPP
#define CONSOLE_DECISION_SOURCE_HPP

#include "IDecisionSource.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief Line-oriented prompts on a pair of streams.
 *
 * Unrecognized answers repeat the prompt. End of input answers Quit everywhere
 * (and "leave in place" for relocation targets).
 */
class ConsoleDecisionSource : public IDecisionSource {
public:
    ConsoleDecisionSource(std::istream& in,
                          std::ostream& out,
                          std::shared_ptr<spdlog::logger> logger);

    FolderDecision decide_folder(const std::filesystem::path& folder) override;
    DuplicateDecision decide_duplicate(const DuplicateGroup& group, std::size_t default_index) override;
    std::optional<std::filesystem::path> pick_relocation_target(const std::filesystem::path& folder) override;
    LivePhotoDecision decide_live_photo(const std::filesystem::path& file) override;
    ImageReviewDecision review_image(const std::filesystem::path& file) override;

private:
    std::optional<std::string> read_line(const std::string& prompt);
    std::optional<std::string> ask(const std::string& prompt);

    std::istream& in;
    std::ostream& out;
    std::shared_ptr<spdlog::logger> logger;
};

#endif
