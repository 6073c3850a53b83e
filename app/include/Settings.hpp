#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <SorterConfig.hpp>
#include <string>
#include <filesystem>
#include <vector>


class Settings
{
public:
    Settings();

    /**
     * @brief Loads config.ini; returns false (keeping defaults) when the file is missing.
     * @throws ErrorCodes::AppException with CONFIG_INVALID for unusable values.
     */
    bool load();
    bool save();

    std::string define_config_path();
    std::string get_config_dir() const;
    std::string get_log_dir() const;

    std::vector<std::string> get_image_extensions() const;
    void set_image_extensions(std::vector<std::string> values);

    std::vector<std::string> get_video_extensions() const;
    void set_video_extensions(std::vector<std::string> values);

    std::vector<std::string> get_sidecar_extensions() const;
    void set_sidecar_extensions(std::vector<std::string> values);

    std::vector<std::string> get_sidecar_names() const;
    void set_sidecar_names(std::vector<std::string> values);

    std::string get_screenshots_folder() const;
    void set_screenshots_folder(const std::string& name);
    std::string get_screen_recordings_folder() const;
    void set_screen_recordings_folder(const std::string& name);
    std::string get_memes_folder() const;
    void set_memes_folder(const std::string& name);
    std::vector<std::string> get_extra_generated_folders() const;
    void set_extra_generated_folders(std::vector<std::string> values);

    std::string get_live_suffix() const;
    void set_live_suffix(const std::string& suffix);

    int get_hash_workers() const;
    void set_hash_workers(int value);

    std::string get_sort_folder() const;
    void set_sort_folder(const std::string& path);

    std::string get_log_level() const;
    void set_log_level(const std::string& level);

    /**
     * @brief Snapshot of the current values as the engine's immutable configuration.
     */
    SorterConfig to_sorter_config() const;

private:
    void validate() const;

    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    std::vector<std::string> image_extensions;
    std::vector<std::string> video_extensions;
    std::vector<std::string> sidecar_extensions;
    std::vector<std::string> sidecar_names;
    std::string screenshots_folder;
    std::string screen_recordings_folder;
    std::string memes_folder;
    std::vector<std::string> extra_generated_folders;
    std::string live_suffix;
    int hash_workers{0};
    std::string default_sort_folder;
    std::string sort_folder;
    std::string log_level{"info"};
};

#endif
