#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log_sink.hpp"

/**
 * @brief Raised for any missing, malformed or out-of-range configuration.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Everything the ramp engine needs. Validated once, then read-only.
 */
struct RunConfig {
    std::string url = "http://localhost:3000";
    std::string method = "GET";
    std::optional<std::string> body;                // serialized JSON payload
    std::map<std::string, std::string> headers;

    int start_users = 1;
    int max_users = 100;
    int increment_by = 10;
    double duration_per_step_sec = 60.0;
    double ramp_up_time_sec = 10.0;

    double connect_timeout_sec = 5.0;
    double request_timeout_sec = 30.0;
    bool keep_alive = true;
};

struct DatastoreConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string dbname = "postgres";
    std::string user = "postgres";
    std::string password;
    double interval_sec = 5.0;
};

struct LoadTestConfig {
    RunConfig run;
    LogConfig log;
    std::optional<DatastoreConfig> datastore;   // no monitoring when absent
    std::string results_file;                   // empty: no results file
};

/**
 * @brief Throws ConfigError if the run settings cannot produce a finite,
 * non-empty step sequence or carry invalid request settings.
 */
void validate_run_config(const RunConfig& cfg);

LoadTestConfig load_config_from_json(const nlohmann::json& j);
LoadTestConfig load_config_from_string(const std::string& text);
LoadTestConfig load_config_from_file(const std::string& path);

/**
 * @brief Step sizes start, start+inc, ... while the size does not exceed max.
 */
std::vector<int> build_step_sequence(const RunConfig& cfg);
