#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "datastore_monitor.hpp"
#include "pg_stat_probe.hpp"
#include "ramp_controller.hpp"
#include "request_executor.hpp"
#include "run_config.hpp"
#include "utils.h"

namespace {

const int kExitConfigError = 1;
const int kExitRunFailed = 2;

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --config <path/to/config.json>\n"
              << "Example: " << argv0 << " --config config/load_test.example.json\n";
}

/**
 * @brief Returns the value of --config, or an empty string if absent.
 */
std::string find_config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return "";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = find_config_path(argc, argv);
    if (config_path.empty()) {
        std::cerr << "Error: Missing required '--config' option with the path to the JSON configuration file.\n";
        print_usage(argv[0]);
        return kExitConfigError;
    }

    LoadTestConfig cfg;
    try {
        cfg = load_config_from_file(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Error: Failed to load or parse the configuration file at '" << config_path << "'.\n"
                  << e.what() << "\n";
        return kExitConfigError;
    }

    LoggerPtr log;
    std::string log_path;
    try {
        log = make_run_logger(cfg.log, &log_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot create log file in '" << cfg.log.log_dir << "': " << e.what() << "\n";
        return kExitConfigError;
    }
    log->info("Load test started. Logging to: {}", log_path);
    log->info("Target: {} {} | users {}..{} step {} | {}s per step, {}s ramp-up",
              cfg.run.method, cfg.run.url, cfg.run.start_users, cfg.run.max_users, cfg.run.increment_by,
              cfg.run.duration_per_step_sec, cfg.run.ramp_up_time_sec);

    int exit_code = 0;
    try {
        std::unique_ptr<DatastoreMonitor> monitor;
        if (cfg.datastore) {
            DatastoreConfig ds = *cfg.datastore;
            auto interval = std::chrono::milliseconds(static_cast<long long>(ds.interval_sec * 1000.0));
            monitor = std::make_unique<DatastoreMonitor>(
                [ds]() { return std::make_unique<PgStatProbe>(ds); }, interval, log);
        }

        RampController controller(cfg.run, std::make_unique<HttpRequestExecutor>(cfg.run), log, monitor.get());
        if (!cfg.results_file.empty()) {
            std::string results_path = cfg.results_file;
            controller.SetStepObserver([results_path, log](const StepSummary& s) {
                try {
                    append_step_summary_to_file(s, results_path);
                } catch (const std::exception& e) {
                    log->error("Could not record step results: {}", e.what());
                }
            });
        }

        controller.Run();

        if (!cfg.results_file.empty()) {
            log->info("Step results written to '{}'", cfg.results_file);
        }
    } catch (const ConfigError& e) {
        log->critical("Invalid configuration: {}", e.what());
        exit_code = kExitConfigError;
    } catch (const std::exception& e) {
        log->critical("Load test aborted: {}", e.what());
        exit_code = kExitRunFailed;
    }

    log->flush();
    return exit_code;
}
