#ifndef SORTER_CONFIG_HPP
#define SORTER_CONFIG_HPP

#include <filesystem>
#include <set>
#include <string>

/**
 * @brief Immutable configuration shared by every engine component.
 *
 * Extension sets hold lowercase extensions with their leading dot; sidecar
 * names are lowercase file names.
 */
struct SorterConfig {
    std::set<std::string> image_extensions;
    std::set<std::string> video_extensions;
    std::set<std::string> sidecar_extensions;
    std::set<std::string> sidecar_names;
    std::string sidecar_prefix;

    std::string screenshots_folder;
    std::string screen_recordings_folder;
    std::string memes_folder;
    std::set<std::string> generated_folders; ///< Includes the three buckets above.

    std::string live_suffix;
    unsigned int hash_workers{0}; ///< 0 selects the hardware concurrency.

    static SorterConfig defaults();
};

#endif
