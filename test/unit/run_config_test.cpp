#include "run_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

TEST(ConfigLoader, DefaultsWhenKeysAbsent) {
    auto cfg = load_config_from_string("{}");

    EXPECT_EQ(cfg.run.url, "http://localhost:3000");
    EXPECT_EQ(cfg.run.method, "GET");
    EXPECT_FALSE(cfg.run.body.has_value());
    EXPECT_EQ(cfg.run.start_users, 1);
    EXPECT_EQ(cfg.run.max_users, 100);
    EXPECT_EQ(cfg.run.increment_by, 10);
    EXPECT_DOUBLE_EQ(cfg.run.duration_per_step_sec, 60.0);
    EXPECT_DOUBLE_EQ(cfg.run.ramp_up_time_sec, 10.0);
    EXPECT_EQ(cfg.run.headers.at("Content-Type"), "application/json");
    EXPECT_EQ(cfg.log.log_dir, "logs");
    EXPECT_EQ(cfg.log.prefix, "load_test");
    EXPECT_FALSE(cfg.datastore.has_value());
    EXPECT_TRUE(cfg.results_file.empty());
}

TEST(ConfigLoader, FromJson) {
    nlohmann::json j = {
        {"apiUrl", "https://api.example.com/v1/lookup"},
        {"method", "put"},
        {"payload", {{"key", "abc"}}},
        {"headers", {{"content-type", "text/plain"}, {"X-Trace", "1"}}},
        {"startUsers", 5},
        {"maxUsers", 50},
        {"incrementBy", 5},
        {"durationPerStep", 2.5},
        {"rampUpTime", 0},
        {"keepAlive", false},
        {"resultsFile", "out.json"}
    };

    auto cfg = load_config_from_json(j);
    EXPECT_EQ(cfg.run.url, "https://api.example.com/v1/lookup");
    EXPECT_EQ(cfg.run.method, "PUT");
    ASSERT_TRUE(cfg.run.body.has_value());
    EXPECT_EQ(nlohmann::json::parse(*cfg.run.body), j["payload"]);
    // A user-supplied content type wins regardless of case.
    EXPECT_EQ(cfg.run.headers.count("Content-Type"), 0u);
    EXPECT_EQ(cfg.run.headers.at("content-type"), "text/plain");
    EXPECT_EQ(cfg.run.headers.at("X-Trace"), "1");
    EXPECT_EQ(cfg.run.start_users, 5);
    EXPECT_DOUBLE_EQ(cfg.run.duration_per_step_sec, 2.5);
    EXPECT_DOUBLE_EQ(cfg.run.ramp_up_time_sec, 0.0);
    EXPECT_FALSE(cfg.run.keep_alive);
    EXPECT_EQ(cfg.results_file, "out.json");
}

TEST(ConfigLoader, FromFile) {
    namespace fs = std::filesystem;
    fs::path path;
#ifdef TEST_SOURCE_DIR
    path = fs::path(TEST_SOURCE_DIR) / "test_config" / "sample_config.json";
#else
    path = fs::path(__FILE__).parent_path().parent_path() / "test_config" / "sample_config.json";
#endif

    auto cfg = load_config_from_file(path.string());
    EXPECT_EQ(cfg.run.url, "http://127.0.0.1:8080/items?limit=5");
    EXPECT_EQ(cfg.run.method, "POST");
    EXPECT_EQ(cfg.run.start_users, 2);
    EXPECT_EQ(cfg.run.max_users, 10);
    EXPECT_EQ(cfg.run.increment_by, 4);
    EXPECT_DOUBLE_EQ(cfg.run.request_timeout_sec, 2.0);
    EXPECT_DOUBLE_EQ(cfg.run.connect_timeout_sec, 5.0);
    EXPECT_EQ(cfg.log.prefix, "sample");

    ASSERT_TRUE(cfg.datastore.has_value());
    EXPECT_EQ(cfg.datastore->host, "db.internal");
    EXPECT_EQ(cfg.datastore->port, 5432);
    EXPECT_EQ(cfg.datastore->dbname, "orders");
    EXPECT_DOUBLE_EQ(cfg.datastore->interval_sec, 2.0);

    EXPECT_EQ(build_step_sequence(cfg.run), (std::vector<int>{2, 6, 10}));
}

TEST(ConfigLoader, MissingFileIsConfigError) {
    EXPECT_THROW(load_config_from_file("/nonexistent/ramp/config.json"), ConfigError);
}

TEST(ConfigLoader, MalformedJsonIsConfigError) {
    EXPECT_THROW(load_config_from_string("{ \"startUsers\": "), ConfigError);
    EXPECT_THROW(load_config_from_string("[1, 2, 3]"), ConfigError);
}

TEST(ConfigLoader, RejectsInvalidValues) {
    EXPECT_THROW(load_config_from_string(R"({"startUsers": 0})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"startUsers": 10, "maxUsers": 5})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"incrementBy": 0})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"durationPerStep": 0})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"rampUpTime": -1})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"startUsers": 2.5})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"maxUsers": "many"})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"apiUrl": "ftp://host/file"})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"headers": {"X-Count": 3}})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"logLevel": "loud"})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"datastore": {"port": 70000}})"), ConfigError);
    EXPECT_THROW(load_config_from_string(R"({"datastore": {"intervalSeconds": 0}})"), ConfigError);
}

TEST(StepSequence, LargeRampHasNineteenSteps) {
    RunConfig cfg;
    cfg.start_users = 200;
    cfg.max_users = 2000;
    cfg.increment_by = 100;

    auto steps = build_step_sequence(cfg);
    ASSERT_EQ(steps.size(), 19u);
    EXPECT_EQ(steps.front(), 200);
    EXPECT_EQ(steps.back(), 2000);
}

TEST(StepSequence, NeverExceedsMaxUsers) {
    RunConfig cfg;
    cfg.start_users = 1;
    cfg.max_users = 100;
    cfg.increment_by = 10;

    auto steps = build_step_sequence(cfg);
    ASSERT_EQ(steps.size(), 10u);
    EXPECT_EQ(steps.back(), 91);
}

TEST(StepSequence, ArithmeticProgression) {
    for (int start : {1, 3, 17}) {
        for (int inc : {1, 2, 7, 50}) {
            for (int max : {start, start + 1, start + 99}) {
                RunConfig cfg;
                cfg.start_users = start;
                cfg.max_users = max;
                cfg.increment_by = inc;

                auto steps = build_step_sequence(cfg);
                ASSERT_FALSE(steps.empty());
                for (std::size_t k = 0; k < steps.size(); ++k) {
                    EXPECT_EQ(steps[k], start + static_cast<int>(k) * inc);
                    EXPECT_LE(steps[k], max);
                }
                // The next size would have passed max.
                EXPECT_GT(steps.back() + inc, max);
            }
        }
    }
}

TEST(StepSequence, SingleStepWhenStartEqualsMax) {
    RunConfig cfg;
    cfg.start_users = 4;
    cfg.max_users = 4;
    cfg.increment_by = 10;
    EXPECT_EQ(build_step_sequence(cfg), (std::vector<int>{4}));
}

TEST(StepSequence, NoWrapNearIntMax) {
    RunConfig cfg;
    cfg.start_users = 2147483600;
    cfg.max_users = 2147483647;
    cfg.increment_by = 40;
    EXPECT_EQ(build_step_sequence(cfg), (std::vector<int>{2147483600, 2147483640}));
}
