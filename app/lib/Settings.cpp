#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <cstdio>
#include <cstdlib>
#include <QStandardPaths>
#include <QString>
#include <QByteArray>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <set>


namespace {
constexpr const char* kSection = "Sorter";
constexpr const char* kAppName = "PhotoSorter";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::vector<std::string> normalize_extensions(const std::vector<std::string>& values)
{
    std::vector<std::string> result;
    result.reserve(values.size());
    for (const auto& value : values) {
        std::string ext = Utils::to_lower_copy(value);
        if (ext.empty()) {
            continue;
        }
        if (ext.front() != '.') {
            ext.insert(ext.begin(), '.');
        }
        if (std::find(result.begin(), result.end(), ext) == result.end()) {
            result.push_back(std::move(ext));
        }
    }
    return result;
}

std::vector<std::string> normalize_names(const std::vector<std::string>& values)
{
    std::vector<std::string> result;
    result.reserve(values.size());
    for (const auto& value : values) {
        std::string name = Utils::to_lower_copy(value);
        if (!name.empty() && std::find(result.begin(), result.end(), name) == result.end()) {
            result.push_back(std::move(name));
        }
    }
    return result;
}

bool is_valid_folder_name(const std::string& name)
{
    return !name.empty() && name != "." && name != ".."
        && name.find('/') == std::string::npos
        && name.find('\\') == std::string::npos;
}

std::string to_utf8(const QString& value)
{
    const QByteArray bytes = value.toUtf8();
    return std::string(bytes.constData(), static_cast<std::size_t>(bytes.size()));
}
}


Settings::Settings()
{
    const SorterConfig defaults = SorterConfig::defaults();
    image_extensions.assign(defaults.image_extensions.begin(), defaults.image_extensions.end());
    video_extensions.assign(defaults.video_extensions.begin(), defaults.video_extensions.end());
    sidecar_extensions.assign(defaults.sidecar_extensions.begin(), defaults.sidecar_extensions.end());
    sidecar_names.assign(defaults.sidecar_names.begin(), defaults.sidecar_names.end());
    screenshots_folder = defaults.screenshots_folder;
    screen_recordings_folder = defaults.screen_recordings_folder;
    memes_folder = defaults.memes_folder;
    live_suffix = defaults.live_suffix;
    hash_workers = static_cast<int>(defaults.hash_workers);

    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }

    QString pictures = QStandardPaths::writableLocation(QStandardPaths::PicturesLocation);
    if (!pictures.isEmpty()) {
        default_sort_folder = to_utf8(pictures);
    } else {
        QString home = QStandardPaths::writableLocation(QStandardPaths::HomeLocation);
        if (!home.isEmpty()) {
            default_sort_folder = to_utf8(home);
        }
    }

    if (default_sort_folder.empty()) {
        default_sort_folder = Utils::path_to_utf8(std::filesystem::current_path());
    }

    sort_folder = default_sort_folder;
}


std::string Settings::define_config_path()
{
    if (const char* override_root = std::getenv("PHOTO_SORTER_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / kAppName / "config.ini").string();
    }
#if defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/Library/Application Support/" + kAppName + "/config.ini";
    }
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (std::filesystem::path(xdg) / kAppName / "config.ini").string();
    }
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/" + kAppName + "/config.ini";
    }
#endif
    return "config.ini";
}


std::string Settings::get_config_dir() const
{
    return config_dir.string();
}


std::string Settings::get_log_dir() const
{
    return (config_dir / "logs").string();
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    image_extensions = normalize_extensions(
        config.getList(kSection, "ImageExtensions", image_extensions));
    video_extensions = normalize_extensions(
        config.getList(kSection, "VideoExtensions", video_extensions));
    sidecar_extensions = normalize_extensions(
        config.getList(kSection, "SidecarExtensions", sidecar_extensions));
    sidecar_names = normalize_names(config.getList(kSection, "SidecarNames", sidecar_names));

    screenshots_folder = config.getValue(kSection, "ScreenshotsFolder", screenshots_folder);
    screen_recordings_folder = config.getValue(kSection, "ScreenRecordingsFolder", screen_recordings_folder);
    memes_folder = config.getValue(kSection, "MemesFolder", memes_folder);
    extra_generated_folders = config.getList(kSection, "ExtraGeneratedFolders", extra_generated_folders);
    live_suffix = Utils::to_lower_copy(config.getValue(kSection, "LiveSuffix", live_suffix));
    hash_workers = config.getInt(kSection, "HashWorkers", hash_workers);
    sort_folder = config.getValue(kSection, "SortFolder", default_sort_folder);
    log_level = config.getValue(kSection, "LogLevel", log_level);

    validate();

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded settings from '{}' (image exts: {}, video exts: {}, sidecar exts: {}, sort folder: '{}')",
                     config_path,
                     image_extensions.size(),
                     video_extensions.size(),
                     sidecar_extensions.size(),
                     sort_folder);
    }

    return true;
}


void Settings::validate() const
{
    if (image_extensions.empty() && video_extensions.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                            "No media extensions configured",
                            "Config file: " + config_path);
    }
    for (const auto* name : {&screenshots_folder, &screen_recordings_folder, &memes_folder}) {
        if (!is_valid_folder_name(*name)) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                                "Invalid generated folder name '" + *name + "'",
                                "Config file: " + config_path);
        }
    }
    for (const auto& name : extra_generated_folders) {
        if (!is_valid_folder_name(name)) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                                "Invalid generated folder name '" + name + "'",
                                "Config file: " + config_path);
        }
    }
    if (hash_workers < 0) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID,
                            "HashWorkers must not be negative",
                            "Config file: " + config_path);
    }
}


bool Settings::save()
{
    config.setList(kSection, "ImageExtensions", image_extensions);
    config.setList(kSection, "VideoExtensions", video_extensions);
    config.setList(kSection, "SidecarExtensions", sidecar_extensions);
    config.setList(kSection, "SidecarNames", sidecar_names);
    config.setValue(kSection, "ScreenshotsFolder", screenshots_folder);
    config.setValue(kSection, "ScreenRecordingsFolder", screen_recordings_folder);
    config.setValue(kSection, "MemesFolder", memes_folder);
    config.setList(kSection, "ExtraGeneratedFolders", extra_generated_folders);
    config.setValue(kSection, "LiveSuffix", live_suffix);
    config.setValue(kSection, "HashWorkers", std::to_string(hash_workers));
    config.setValue(kSection, "SortFolder", sort_folder);
    config.setValue(kSection, "LogLevel", log_level);

    return config.save(config_path);
}


SorterConfig Settings::to_sorter_config() const
{
    SorterConfig result = SorterConfig::defaults();
    result.image_extensions = std::set<std::string>(image_extensions.begin(), image_extensions.end());
    result.video_extensions = std::set<std::string>(video_extensions.begin(), video_extensions.end());
    result.sidecar_extensions = std::set<std::string>(sidecar_extensions.begin(), sidecar_extensions.end());
    result.sidecar_names = std::set<std::string>(sidecar_names.begin(), sidecar_names.end());
    result.screenshots_folder = screenshots_folder;
    result.screen_recordings_folder = screen_recordings_folder;
    result.memes_folder = memes_folder;
    result.generated_folders = {screenshots_folder, screen_recordings_folder, memes_folder};
    result.generated_folders.insert(extra_generated_folders.begin(), extra_generated_folders.end());
    result.live_suffix = live_suffix;
    result.hash_workers = static_cast<unsigned int>(std::max(0, hash_workers));
    return result;
}


std::vector<std::string> Settings::get_image_extensions() const
{
    return image_extensions;
}


void Settings::set_image_extensions(std::vector<std::string> values)
{
    image_extensions = normalize_extensions(values);
}


std::vector<std::string> Settings::get_video_extensions() const
{
    return video_extensions;
}


void Settings::set_video_extensions(std::vector<std::string> values)
{
    video_extensions = normalize_extensions(values);
}


std::vector<std::string> Settings::get_sidecar_extensions() const
{
    return sidecar_extensions;
}


void Settings::set_sidecar_extensions(std::vector<std::string> values)
{
    sidecar_extensions = normalize_extensions(values);
}


std::vector<std::string> Settings::get_sidecar_names() const
{
    return sidecar_names;
}


void Settings::set_sidecar_names(std::vector<std::string> values)
{
    sidecar_names = normalize_names(values);
}


std::string Settings::get_screenshots_folder() const
{
    return screenshots_folder;
}


void Settings::set_screenshots_folder(const std::string& name)
{
    screenshots_folder = name;
}


std::string Settings::get_screen_recordings_folder() const
{
    return screen_recordings_folder;
}


void Settings::set_screen_recordings_folder(const std::string& name)
{
    screen_recordings_folder = name;
}


std::string Settings::get_memes_folder() const
{
    return memes_folder;
}


void Settings::set_memes_folder(const std::string& name)
{
    memes_folder = name;
}


std::vector<std::string> Settings::get_extra_generated_folders() const
{
    return extra_generated_folders;
}


void Settings::set_extra_generated_folders(std::vector<std::string> values)
{
    extra_generated_folders = std::move(values);
}


std::string Settings::get_live_suffix() const
{
    return live_suffix;
}


void Settings::set_live_suffix(const std::string& suffix)
{
    live_suffix = Utils::to_lower_copy(suffix);
}


int Settings::get_hash_workers() const
{
    return hash_workers;
}


void Settings::set_hash_workers(int value)
{
    hash_workers = value;
}


std::string Settings::get_sort_folder() const
{
    return sort_folder;
}


void Settings::set_sort_folder(const std::string& path)
{
    sort_folder = path;
}


std::string Settings::get_log_level() const
{
    return log_level;
}


void Settings::set_log_level(const std::string& level)
{
    log_level = level;
}
