#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @brief The run-wide log sink.
 *
 * Every component receives this handle explicitly; nothing logs through
 * the spdlog default logger.
 */
using LoggerPtr = std::shared_ptr<spdlog::logger>;

struct LogConfig {
    std::string log_dir = "logs";
    std::string prefix = "load_test";
    bool console = true;
    std::string level = "info";
};

/**
 * @brief Creates the run logger.
 *
 * Lines go to <log_dir>/<prefix>_<UTC timestamp>.txt as
 * "[timestamp] [level] message" and, when enabled, are mirrored to the
 * console without decoration.
 *
 * @param cfg       Log settings from the configuration file.
 * @param log_path  Receives the path of the created log file (may be null).
 */
LoggerPtr make_run_logger(const LogConfig& cfg, std::string* log_path = nullptr);

/**
 * @brief A logger that drops everything. Used where no sink was provided.
 */
LoggerPtr make_null_logger(const std::string& name);
