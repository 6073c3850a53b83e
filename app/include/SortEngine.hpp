#ifndef SORT_ENGINE_HPP
#define SORT_ENGINE_HPP

#include "MediaPlacer.hpp"
#include "SidecarReclaimer.hpp"
#include "Types.hpp"

#include <filesystem>
#include <memory>
#include <vector>

class IDecisionSource;
class ITrashBin;
class MediaClassifier;
namespace spdlog { class logger; }

class SortEngine {
public:
    SortEngine(const MediaClassifier& classifier,
               ITrashBin& trash,
               std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Sorts the tree under @p root in place.
     *
     * Runs the sidecar purge, the backup consolidation (deepest folder first), the
     * interactive post-order walk and the final loose-file sweep. Per-file failures are
     * logged and counted; a Quit answer stops the run with RunStatus::Cancelled.
     * @throws ErrorCodes::AppException when @p root is missing or not a readable directory.
     */
    SortReport run(const std::filesystem::path& root, IDecisionSource& decisions);

    /**
     * @brief True for "<root>/<year>/<month>/file" and "<root>/<generated>/file".
     */
    bool is_already_placed(const std::filesystem::path& root, const std::filesystem::path& file) const;

private:
    struct RunState {
        std::filesystem::path root;
        IDecisionSource& decisions;
        SortReport report;
        std::vector<std::filesystem::path> protected_roots;
    };

    void consolidate_backups(RunState& state);
    void consolidate_backup(RunState& state, const std::filesystem::path& folder);
    bool merge_into_archive(RunState& state,
                            const std::filesystem::path& folder,
                            const std::filesystem::path& archive);
    bool walk(RunState& state);
    WalkAction visit_folder(RunState& state, const std::filesystem::path& folder);
    void keep_folder(RunState& state, const std::filesystem::path& folder);
    void place_all(RunState& state,
                   const std::filesystem::path& folder,
                   const std::filesystem::path& target_root);
    void final_sweep(RunState& state);

    void place_one(RunState& state,
                   const std::filesystem::path& file,
                   const std::filesystem::path& target_root,
                   const std::filesystem::path& prune_root);
    std::vector<std::filesystem::path> collect_media(const RunState& state,
                                                     const std::filesystem::path& folder) const;
    std::vector<std::filesystem::path> walkable_children(const RunState& state,
                                                         const std::filesystem::path& folder) const;
    bool is_protected(const RunState& state, const std::filesystem::path& path) const;

    const MediaClassifier& classifier;
    std::shared_ptr<spdlog::logger> logger;
    SidecarReclaimer reclaimer;
    MediaPlacer placer;
};

#endif
