#include "log_sink.hpp"
#include "utils.h"

#include <filesystem>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

LoggerPtr make_run_logger(const LogConfig& cfg, std::string* log_path) {
    std::filesystem::create_directories(cfg.log_dir);
    std::filesystem::path path = std::filesystem::path(cfg.log_dir) / (cfg.prefix + "_" + file_timestamp() + ".txt");

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
    file_sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(
        "[%Y-%m-%dT%H:%M:%S.%eZ] [%l] %v", spdlog::pattern_time_type::utc));

    std::vector<spdlog::sink_ptr> sinks{file_sink};
    if (cfg.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("%^%v%$");
        sinks.push_back(console_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(cfg.prefix, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(cfg.level));
    logger->flush_on(spdlog::level::warn);

    if (log_path) {
        *log_path = path.string();
    }
    return logger;
}

LoggerPtr make_null_logger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}
