#pragma once

#include <filesystem>
#include <optional>
#include <string>

class IMetadataReader {
public:
    virtual ~IMetadataReader() = default;
    /// EXIF "Software" tag of an image, if present and readable.
    virtual std::optional<std::string> image_software(const std::filesystem::path& path) = 0;
    /// Creation-software tags of a video container, joined with "; ".
    virtual std::optional<std::string> video_software(const std::filesystem::path& path) = 0;
};
