#include "run_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace {

const char* const kJsonContentType = "application/json";

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

// Integer fields must be whole numbers; 2.5 users is a typo, not a request.
void read_count(const nlohmann::json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    auto value = it->get<long long>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigError(std::string("'") + key + "' is out of range");
    }
    out = static_cast<int>(value);
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool has_header(const std::map<std::string, std::string>& headers, const std::string& name) {
    return std::any_of(headers.begin(), headers.end(), [&](const auto& kv) {
        return upper(kv.first) == upper(name);
    });
}

DatastoreConfig load_datastore(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("'datastore' must be an object");
    }
    DatastoreConfig ds;
    read_field(j, "host", ds.host);
    read_count(j, "port", ds.port);
    read_field(j, "dbname", ds.dbname);
    read_field(j, "user", ds.user);
    read_field(j, "password", ds.password);
    read_field(j, "intervalSeconds", ds.interval_sec);

    if (ds.host.empty()) throw ConfigError("'datastore.host' must not be empty");
    if (ds.port <= 0 || ds.port > 65535) throw ConfigError("'datastore.port' must be in 1..65535");
    if (ds.dbname.empty()) throw ConfigError("'datastore.dbname' must not be empty");
    if (!(ds.interval_sec > 0.0)) throw ConfigError("'datastore.intervalSeconds' must be > 0");
    return ds;
}

} // namespace

void validate_run_config(const RunConfig& cfg) {
    if (cfg.url.rfind("http://", 0) != 0 && cfg.url.rfind("https://", 0) != 0) {
        throw ConfigError("'apiUrl' must start with http:// or https://, got '" + cfg.url + "'");
    }
    if (cfg.method.empty()) {
        throw ConfigError("'method' must not be empty");
    }
    if (cfg.start_users < 1) {
        throw ConfigError("'startUsers' must be >= 1");
    }
    if (cfg.max_users < cfg.start_users) {
        throw ConfigError("'maxUsers' must be >= 'startUsers'");
    }
    if (cfg.increment_by < 1) {
        throw ConfigError("'incrementBy' must be >= 1");
    }
    if (!(cfg.duration_per_step_sec > 0.0)) {
        throw ConfigError("'durationPerStep' must be > 0");
    }
    if (!(cfg.ramp_up_time_sec >= 0.0)) {
        throw ConfigError("'rampUpTime' must be >= 0");
    }
    if (!(cfg.connect_timeout_sec > 0.0)) {
        throw ConfigError("'connectTimeoutSeconds' must be > 0");
    }
    if (!(cfg.request_timeout_sec > 0.0)) {
        throw ConfigError("'requestTimeoutSeconds' must be > 0");
    }
}

LoadTestConfig load_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    LoadTestConfig cfg;
    RunConfig& run = cfg.run;

    read_field(j, "url", run.url);
    read_field(j, "apiUrl", run.url);
    read_field(j, "method", run.method);
    run.method = upper(run.method);

    auto payload = j.find("payload");
    if (payload != j.end() && !payload->is_null()) {
        run.body = payload->dump();
    }

    auto headers = j.find("headers");
    if (headers != j.end() && !headers->is_null()) {
        if (!headers->is_object()) {
            throw ConfigError("'headers' must be an object of strings");
        }
        for (auto it = headers->begin(); it != headers->end(); ++it) {
            if (!it.value().is_string()) {
                throw ConfigError("header '" + it.key() + "' must be a string");
            }
            run.headers[it.key()] = it.value().get<std::string>();
        }
    }
    if (!has_header(run.headers, "Content-Type")) {
        run.headers["Content-Type"] = kJsonContentType;
    }

    read_count(j, "startUsers", run.start_users);
    read_count(j, "maxUsers", run.max_users);
    read_count(j, "incrementBy", run.increment_by);
    read_field(j, "durationPerStep", run.duration_per_step_sec);
    read_field(j, "rampUpTime", run.ramp_up_time_sec);
    read_field(j, "connectTimeoutSeconds", run.connect_timeout_sec);
    read_field(j, "requestTimeoutSeconds", run.request_timeout_sec);
    read_field(j, "keepAlive", run.keep_alive);

    read_field(j, "logDir", cfg.log.log_dir);
    read_field(j, "prefix", cfg.log.prefix);
    read_field(j, "console", cfg.log.console);
    read_field(j, "logLevel", cfg.log.level);
    if (spdlog::level::from_str(cfg.log.level) == spdlog::level::off && cfg.log.level != "off") {
        throw ConfigError("unknown 'logLevel' '" + cfg.log.level + "'");
    }

    read_field(j, "resultsFile", cfg.results_file);

    auto ds = j.find("datastore");
    if (ds != j.end() && !ds->is_null()) {
        cfg.datastore = load_datastore(*ds);
    }

    validate_run_config(run);
    return cfg;
}

LoadTestConfig load_config_from_string(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError("configuration is not valid JSON");
    }
    return load_config_from_json(j);
}

LoadTestConfig load_config_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        throw ConfigError("cannot open configuration file '" + path + "'");
    }
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        return load_config_from_string(ss.str());
    } catch (const ConfigError& e) {
        throw ConfigError("'" + path + "': " + e.what());
    }
}

std::vector<int> build_step_sequence(const RunConfig& cfg) {
    std::vector<int> steps;
    if (cfg.start_users < 1 || cfg.increment_by < 1) {
        return steps;
    }
    // 64-bit so that max_users near INT_MAX cannot wrap the counter.
    for (long long users = cfg.start_users; users <= cfg.max_users; users += cfg.increment_by) {
        steps.push_back(static_cast<int>(users));
    }
    return steps;
}
