#include "upl/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace upl::core {

void init_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", config.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("upl", sinks.begin(), sinks.end());
    auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    spdlog::set_default_logger(logger);
}

} // namespace upl::core
