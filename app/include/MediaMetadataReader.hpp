#ifndef MEDIA_METADATA_READER_HPP
#define MEDIA_METADATA_READER_HPP

#include "IMetadataReader.hpp"

#include <memory>

namespace spdlog { class logger; }

/**
 * @brief Reads embedded tags with Exiv2 (images) and libavformat (videos).
 *
 * Decode failures are logged at debug level and reported as "no tag".
 */
class MediaMetadataReader : public IMetadataReader {
public:
    explicit MediaMetadataReader(std::shared_ptr<spdlog::logger> logger = nullptr);

    std::optional<std::string> image_software(const std::filesystem::path& path) override;
    std::optional<std::string> video_software(const std::filesystem::path& path) override;

private:
    std::shared_ptr<spdlog::logger> logger;
};

#endif
