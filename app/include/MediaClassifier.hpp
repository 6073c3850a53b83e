#ifndef MEDIA_CLASSIFIER_HPP
#define MEDIA_CLASSIFIER_HPP

#include "SorterConfig.hpp"
#include "Types.hpp"

#include <filesystem>
#include <string>

class IMetadataReader;

class MediaClassifier {
public:
    MediaClassifier(const SorterConfig& config, IMetadataReader& metadata);

    bool is_image(const std::filesystem::path& path) const;
    bool is_video(const std::filesystem::path& path) const;
    /// Image or video extension, excluding AppleDouble companions.
    bool is_media(const std::filesystem::path& path) const;
    bool is_sidecar(const std::filesystem::path& path) const;

    /**
     * @brief Screenshot / screen recording / plain. Reads embedded tags; never throws.
     */
    MediaKind classify_file(const std::filesystem::path& path) const;

    /**
     * @brief Pure function of the folder basename; never touches the filesystem.
     */
    FolderKind classify_folder_name(const std::string& name) const;

    bool is_generated_name(const std::string& name) const;

    const SorterConfig& config() const { return config_; }

private:
    bool is_screenshot(const std::filesystem::path& path, const std::string& ext) const;
    bool is_screen_recording(const std::filesystem::path& path, const std::string& ext) const;
    bool is_apple_double(const std::filesystem::path& path) const;

    const SorterConfig& config_;
    IMetadataReader& metadata_;
};

#endif
