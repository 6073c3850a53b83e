#ifndef DUPLICATE_ENGINE_HPP
#define DUPLICATE_ENGINE_HPP

#include "SidecarReclaimer.hpp"
#include "Types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class IDecisionSource;
class ITrashBin;
class MediaClassifier;
namespace spdlog { class logger; }

class DuplicateEngine {
public:
    /// Folder-type priority used as the last tie-break, best first.
    enum class LocationKind {
        Dated,
        Generated,
        Other,
        Backup
    };

    struct GroupScan {
        std::vector<DuplicateGroup> groups;
        int unreadable{0};
    };

    DuplicateEngine(const MediaClassifier& classifier,
                    ITrashBin& trash,
                    std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Groups byte-identical media under @p root.
     *
     * Files are bucketed by size first; only sizes shared by two or more files are
     * hashed (SHA-256, on a pool of worker threads). Members are ordered by path and
     * each group's canonical_index is already filled in.
     */
    GroupScan find_groups(const std::filesystem::path& root) const;

    /**
     * @brief Index of the member that should survive, by the canonical-choice cascade.
     */
    std::size_t choose_default(const DuplicateGroup& group, const std::filesystem::path& root) const;

    /**
     * @brief Finds every group and applies the decision source's answer to each.
     * @throws ErrorCodes::AppException when @p root is missing or not a readable directory.
     */
    DuplicateReport run(const std::filesystem::path& root, IDecisionSource& decisions);

    LocationKind location_kind(const std::filesystem::path& root, const std::filesystem::path& file) const;

    static bool is_auxiliary_stem(const std::string& stem, const std::string& live_suffix);
    static std::optional<std::uint64_t> trailing_number(const std::string& stem);
    static std::optional<std::string> hash_file(const std::filesystem::path& path);

private:
    unsigned int worker_count(std::size_t candidates) const;
    void trash_all_except(const DuplicateGroup& group,
                          std::optional<std::size_t> keep_index,
                          const std::filesystem::path& root,
                          DuplicateReport& report);

    const MediaClassifier& classifier;
    std::shared_ptr<spdlog::logger> logger;
    SidecarReclaimer reclaimer;
};

#endif
