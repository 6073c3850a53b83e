#include "MediaClassifier.hpp"
#include "BackupDate.hpp"
#include "IMetadataReader.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <array>
#include <regex>

namespace {
const std::array<const char*, 3> kRecordingSoftwareMarkers = {
    "avfoundation", "quicktime player", "screen"
};
const std::array<const char*, 2> kRecordingStemMarkers = {
    "screenrecording", "screen recording"
};
}


MediaClassifier::MediaClassifier(const SorterConfig& config, IMetadataReader& metadata)
    : config_(config),
      metadata_(metadata)
{
}


bool MediaClassifier::is_image(const std::filesystem::path& path) const
{
    return config_.image_extensions.contains(Utils::lowercase_extension(path));
}


bool MediaClassifier::is_video(const std::filesystem::path& path) const
{
    return config_.video_extensions.contains(Utils::lowercase_extension(path));
}


bool MediaClassifier::is_apple_double(const std::filesystem::path& path) const
{
    return !config_.sidecar_prefix.empty()
        && Utils::path_to_utf8(path.filename()).starts_with(config_.sidecar_prefix);
}


bool MediaClassifier::is_media(const std::filesystem::path& path) const
{
    return !is_apple_double(path) && (is_image(path) || is_video(path));
}


bool MediaClassifier::is_sidecar(const std::filesystem::path& path) const
{
    if (is_apple_double(path)) {
        return true;
    }
    const std::string name = Utils::to_lower_copy(Utils::path_to_utf8(path.filename()));
    if (config_.sidecar_names.contains(name)) {
        return true;
    }
    return config_.sidecar_extensions.contains(Utils::lowercase_extension(path));
}


MediaKind MediaClassifier::classify_file(const std::filesystem::path& path) const
{
    const std::string ext = Utils::lowercase_extension(path);
    try {
        if (is_screenshot(path, ext)) {
            return MediaKind::Screenshot;
        }
        if (is_screen_recording(path, ext)) {
            return MediaKind::ScreenRecording;
        }
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Classification of '{}' fell back to plain: {}", Utils::path_to_utf8(path), ex.what());
        }
    }
    return MediaKind::Plain;
}


bool MediaClassifier::is_screenshot(const std::filesystem::path& path, const std::string& ext) const
{
    if (ext == ".png") {
        return true;
    }
    if (!config_.image_extensions.contains(ext)) {
        return false;
    }
    const auto software = metadata_.image_software(path);
    return software && Utils::contains_case_insensitive(*software, "screen");
}


bool MediaClassifier::is_screen_recording(const std::filesystem::path& path, const std::string& ext) const
{
    if (!config_.video_extensions.contains(ext)) {
        return false;
    }
    if (const auto software = metadata_.video_software(path)) {
        for (const char* marker : kRecordingSoftwareMarkers) {
            if (Utils::contains_case_insensitive(*software, marker)) {
                return true;
            }
        }
    }
    const std::string stem = Utils::to_lower_copy(Utils::path_to_utf8(path.stem()));
    for (const char* marker : kRecordingStemMarkers) {
        if (stem.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}


bool MediaClassifier::is_generated_name(const std::string& name) const
{
    return config_.generated_folders.contains(name);
}


FolderKind MediaClassifier::classify_folder_name(const std::string& name) const
{
    static const std::regex kYear(R"(^\d{4}$)");
    static const std::regex kMonth(R"(^\d{2}-[A-Za-z]+$)");

    if (is_generated_name(name)) {
        return FolderKind::Generated;
    }
    if (std::regex_match(name, kYear)) {
        return FolderKind::Year;
    }
    if (std::regex_match(name, kMonth)) {
        return FolderKind::Month;
    }
    if (BackupDates::matches_backup_grammar(name) && BackupDates::parse_backup_date(name)) {
        return FolderKind::Backup;
    }
    return FolderKind::Unclassified;
}
