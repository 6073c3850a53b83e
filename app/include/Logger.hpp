#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

class Logger {
public:
    /**
     * @brief Registers the application loggers with a console and a rotating file sink.
     * @param log_dir Directory for the log file; console only when empty.
     * @param level Minimum level applied to every registered logger.
     */
    static void setup_loggers(const std::string& log_dir = std::string(),
                              spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Returns a registered logger, or nullptr when logging is not set up.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static spdlog::level::level_enum parse_level(const std::string& value,
                                                 spdlog::level::level_enum fallback);
};

#endif
