#include "docnet/Logging.hpp"
#include "docnet/Exceptions.hpp"
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace docnet {

std::shared_ptr<spdlog::logger> setup_logging(const StoreConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("cannot open log file " + config.log_file + ": " + e.what());
        }
    }

    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("⚠️ Unknown log level '{}', logging disabled", config.log_level);
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S :: %l :: %v");
    logger->set_level(level);

    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    return logger;
}

}
