#include "SorterConfig.hpp"


SorterConfig SorterConfig::defaults()
{
    SorterConfig config;
    config.image_extensions = {".jpg", ".jpeg", ".png", ".gif", ".heic", ".heif", ".tiff"};
    config.video_extensions = {".mp4", ".mov", ".avi", ".mkv", ".lrv", ".3gp", ".m2ts", ".webm", ".wmv"};
    config.sidecar_extensions = {".aae", ".modd", ".moff", ".thm"};
    config.sidecar_names = {"thumbs.db", ".ds_store", "desktop.ini"};
    config.sidecar_prefix = "._";

    config.screenshots_folder = "Screenshots";
    config.screen_recordings_folder = "ScreenRecordings";
    config.memes_folder = "Memes";
    config.generated_folders = {config.screenshots_folder,
                                config.screen_recordings_folder,
                                config.memes_folder};

    config.live_suffix = "-live";
    config.hash_workers = 0;
    return config;
}
