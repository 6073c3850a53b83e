#include "MediaMetadataReader.hpp"
#include "Utils.hpp"

#include <exiv2/exiv2.hpp>
#include <spdlog/spdlog.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}

#include <array>
#include <mutex>

namespace {
const std::array<const char*, 3> kVideoSoftwareKeys = {
    "com.apple.quicktime.software",
    "software",
    "encoder"
};

void silence_libav_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] { av_log_set_level(AV_LOG_QUIET); });
}

struct FormatContextCloser {
    void operator()(AVFormatContext* ctx) const {
        avformat_close_input(&ctx);
    }
};
}


MediaMetadataReader::MediaMetadataReader(std::shared_ptr<spdlog::logger> logger)
    : logger(std::move(logger))
{
}


std::optional<std::string> MediaMetadataReader::image_software(const std::filesystem::path& path)
{
    try {
        auto image = Exiv2::ImageFactory::open(Utils::path_to_utf8(path));
        if (!image.get()) {
            return std::nullopt;
        }
        image->readMetadata();
        const Exiv2::ExifData& exif = image->exifData();
        const auto it = exif.findKey(Exiv2::ExifKey("Exif.Image.Software"));
        if (it == exif.end()) {
            return std::nullopt;
        }
        return it->toString();
    } catch (const Exiv2::Error& ex) {
        if (logger) {
            logger->debug("Exiv2 could not read '{}': {}", Utils::path_to_utf8(path), ex.what());
        }
    } catch (const std::exception& ex) {
        if (logger) {
            logger->debug("Metadata read failed for '{}': {}", Utils::path_to_utf8(path), ex.what());
        }
    }
    return std::nullopt;
}


std::optional<std::string> MediaMetadataReader::video_software(const std::filesystem::path& path)
{
    silence_libav_once();

    AVFormatContext* raw_ctx = nullptr;
    const std::string utf8_path = Utils::path_to_utf8(path);
    const int rc = avformat_open_input(&raw_ctx, utf8_path.c_str(), nullptr, nullptr);
    if (rc < 0) {
        if (logger) {
            char message[AV_ERROR_MAX_STRING_SIZE] = {0};
            av_strerror(rc, message, sizeof(message));
            logger->debug("libavformat could not open '{}': {}", utf8_path, message);
        }
        return std::nullopt;
    }
    std::unique_ptr<AVFormatContext, FormatContextCloser> ctx(raw_ctx);

    std::string joined;
    for (const char* key : kVideoSoftwareKeys) {
        const AVDictionaryEntry* entry = av_dict_get(ctx->metadata, key, nullptr, 0);
        if (!entry || !entry->value || !*entry->value) {
            continue;
        }
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += entry->value;
    }

    if (joined.empty()) {
        return std::nullopt;
    }
    return joined;
}
