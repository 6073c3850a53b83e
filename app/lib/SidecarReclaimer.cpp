#include "SidecarReclaimer.hpp"
#include "ITrashBin.hpp"
#include "MediaClassifier.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;


SidecarReclaimer::SidecarReclaimer(const MediaClassifier& classifier,
                                   ITrashBin& trash,
                                   std::shared_ptr<spdlog::logger> logger)
    : classifier(classifier),
      trash(trash),
      logger(std::move(logger))
{
}


SidecarReclaimer::PurgeResult SidecarReclaimer::purge(const fs::path& root)
{
    PurgeResult result;
    std::vector<fs::path> sidecars;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && classifier.is_sidecar(it->path())) {
            sidecars.push_back(it->path());
        }
    }
    if (ec && logger) {
        logger->warn("Sidecar scan of '{}' stopped early: {}", Utils::path_to_utf8(root), ec.message());
    }

    for (const auto& sidecar : sidecars) {
        std::string error;
        int pruned = 0;
        std::error_code exists_ec;
        if (!fs::exists(sidecar, exists_ec)) {
            // Companion files can disappear together with their primary file.
            continue;
        }
        if (trash_and_prune(sidecar, root, &pruned, &error)) {
            ++result.trashed;
            result.pruned += pruned;
        } else {
            ++result.failed;
        }
    }

    if (logger) {
        logger->info("Sidecar purge under '{}': {} trashed, {} failed, {} folder(s) pruned",
                     Utils::path_to_utf8(root), result.trashed, result.failed, result.pruned);
    }
    return result;
}


bool SidecarReclaimer::trash_and_prune(const fs::path& file,
                                       const fs::path& root,
                                       int* pruned,
                                       std::string* error)
{
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(file, ec))) {
        return true;
    }

    std::string trash_error;
    if (!trash.move_to_trash(file, &trash_error)) {
        std::error_code recheck_ec;
        if (!fs::exists(fs::symlink_status(file, recheck_ec))) {
            return true;
        }
        if (logger) {
            logger->warn("Could not trash '{}': {}", Utils::path_to_utf8(file), trash_error);
        }
        if (error) {
            *error = trash_error;
        }
        return false;
    }

    if (logger) {
        logger->debug("Trashed '{}'", Utils::path_to_utf8(file));
    }
    const int removed = prune_empty_ancestors(file.parent_path(), root);
    if (pruned) {
        *pruned = removed;
    }
    return true;
}


int SidecarReclaimer::prune_empty_ancestors(const fs::path& dir, const fs::path& root) const
{
    int removed = 0;
    const fs::path normalized_root = root.lexically_normal();
    fs::path current = dir.lexically_normal();

    while (!current.empty() && current != normalized_root && Utils::is_within(current, normalized_root)) {
        std::error_code ec;
        if (!fs::is_directory(fs::symlink_status(current, ec)) || !fs::is_empty(current, ec) || ec) {
            break;
        }
        if (!fs::remove(current, ec) || ec) {
            if (logger) {
                logger->debug("Stopped pruning at '{}': {}", Utils::path_to_utf8(current), ec.message());
            }
            break;
        }
        ++removed;
        if (logger) {
            logger->debug("Pruned empty folder '{}'", Utils::path_to_utf8(current));
        }
        current = current.parent_path();
    }
    return removed;
}
