#ifndef MEDIA_PLACER_HPP
#define MEDIA_PLACER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

class MediaClassifier;
class SidecarReclaimer;
namespace spdlog { class logger; }

/**
 * @brief Applies the placement rule and performs the actual moves.
 *
 * Screenshots go to the screenshots bucket, screen recordings to the recordings
 * bucket, everything else to "<target>/<YYYY>/<MM>-<MonthName>" keyed off the
 * file's earliest timestamp. Existing names are never overwritten.
 */
class MediaPlacer {
public:
    enum class Outcome {
        Moved,
        AlreadyPlaced,
        Skipped
    };

    MediaPlacer(const MediaClassifier& classifier,
                SidecarReclaimer& reclaimer,
                std::shared_ptr<spdlog::logger> logger);

    std::filesystem::path destination_dir(const std::filesystem::path& file,
                                          const std::filesystem::path& target_root) const;

    /**
     * @brief Moves @p file under @p target_root and prunes emptied folders up to @p prune_root.
     */
    Outcome place(const std::filesystem::path& file,
                  const std::filesystem::path& target_root,
                  const std::filesystem::path& prune_root,
                  int* pruned = nullptr);

    /**
     * @brief Moves a file or folder into @p dest_dir, creating it on demand.
     * @return The final path, or nullopt when the move was skipped.
     */
    std::optional<std::filesystem::path> move_into(const std::filesystem::path& source,
                                                   const std::filesystem::path& dest_dir,
                                                   const std::filesystem::path& prune_root,
                                                   int* pruned = nullptr);

    /**
     * @brief First free path for @p name inside @p dir, appending " (n)" before the extension.
     */
    static std::filesystem::path unique_destination(const std::filesystem::path& dir,
                                                    const std::filesystem::path& name,
                                                    bool is_directory);

    bool ensure_directory(const std::filesystem::path& dir) const;

private:
    bool relocate(const std::filesystem::path& source, const std::filesystem::path& destination) const;
    bool copy_then_remove(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          std::error_code& ec) const;

    const MediaClassifier& classifier;
    SidecarReclaimer& reclaimer;
    std::shared_ptr<spdlog::logger> logger;
};

#endif
