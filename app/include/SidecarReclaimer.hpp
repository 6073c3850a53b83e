#ifndef SIDECAR_RECLAIMER_HPP
#define SIDECAR_RECLAIMER_HPP

#include <filesystem>
#include <memory>
#include <string>

class ITrashBin;
class MediaClassifier;
namespace spdlog { class logger; }

class SidecarReclaimer {
public:
    struct PurgeResult {
        int trashed{0};
        int failed{0};
        int pruned{0};
    };

    SidecarReclaimer(const MediaClassifier& classifier,
                     ITrashBin& trash,
                     std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Trashes every sidecar file under @p root and prunes emptied folders.
     */
    PurgeResult purge(const std::filesystem::path& root);

    /**
     * @brief Trashes one file, then prunes its emptied ancestors below @p root.
     * @return false when the trash refused the file; a file that already vanished
     *         counts as success.
     */
    bool trash_and_prune(const std::filesystem::path& file,
                         const std::filesystem::path& root,
                         int* pruned = nullptr,
                         std::string* error = nullptr);

    /**
     * @brief Removes @p dir and its ancestors while they are empty.
     *
     * Stops at @p root (never removed), at the first non-empty directory and at the
     * first directory that cannot be removed.
     * @return Number of directories removed.
     */
    int prune_empty_ancestors(const std::filesystem::path& dir,
                              const std::filesystem::path& root) const;

private:
    const MediaClassifier& classifier;
    ITrashBin& trash;
    std::shared_ptr<spdlog::logger> logger;
};

#endif
