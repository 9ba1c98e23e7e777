#include "log_sink.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

TEST(RunLogger, WritesTimestampedLevelledLines) {
    fs::path dir = fs::temp_directory_path() / "ramp_log_sink_test";
    fs::remove_all(dir);

    LogConfig cfg;
    cfg.log_dir = dir.string();
    cfg.prefix = "unit";
    cfg.console = false;
    cfg.level = "debug";

    std::string path;
    {
        auto log = make_run_logger(cfg, &path);
        log->info("Ramping up to {} users...", 3);
        log->warn("Request failed with error: {} {} {}", "Connection", 0, 12);
        log->trace("dropped below level");
        log->flush();
    }

    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::path(path).parent_path(), dir);
    EXPECT_TRUE(std::regex_match(fs::path(path).filename().string(),
                                 std::regex(R"(unit_\d{4}-\d{2}-\d{2}_\d{2}-\d{2}-\d{2}-\d{3}\.txt)")));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    std::string content = ss.str();

    EXPECT_TRUE(std::regex_search(content,
        std::regex(R"(\[\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z\] \[info\] Ramping up to 3 users\.\.\.)")));
    EXPECT_NE(content.find("[warning] Request failed with error: Connection 0 12"), std::string::npos);
    EXPECT_EQ(content.find("dropped below level"), std::string::npos);

    fs::remove_all(dir);
}

TEST(RunLogger, NullLoggerAcceptsEverything) {
    auto log = make_null_logger("quiet");
    EXPECT_NO_THROW(log->error("nothing {}", 1));
}
