#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
const std::vector<std::string> kLoggerNames = {"core_logger", "ui_logger"};
}


void Logger::setup_loggers(const std::string& log_dir, spdlog::level::level_enum level)
{
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (!log_dir.empty()) {
        std::filesystem::create_directories(log_dir);
        const std::string log_file = (std::filesystem::path(log_dir) / "photo_sorter.log").string();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, kMaxLogFileSize, kMaxLogFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(file_sink);
    }

    for (const auto& name : kLoggerNames) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


spdlog::level::level_enum Logger::parse_level(const std::string& value,
                                              spdlog::level::level_enum fallback)
{
    if (value.empty()) {
        return fallback;
    }
    const auto level = spdlog::level::from_str(value);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && value != "off") {
        return fallback;
    }
    return level;
}
