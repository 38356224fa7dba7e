#include "config.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>

TEST(ParseConfig, DefaultsWhenEmpty) {
    AppConfig cfg;
    ASSERT_TRUE(parse_config("{}", cfg));
    EXPECT_EQ(cfg.audit, "long-tasks");
    EXPECT_DOUBLE_EQ(cfg.thresholdMs, 50.0);
    EXPECT_EQ(cfg.output, "text");
    EXPECT_TRUE(cfg.autoReload);
}

TEST(ParseConfig, OverridesPresentKeys) {
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(parse_config(R"({
        "trace": "page.json",
        "devtoolsLog": "page.log.json",
        "audit": "main-thread-tasks",
        "thresholdMs": 120,
        "output": "json",
        "autoReload": false,
        "autoReloadIntervalS": 2.5
    })", cfg, &err)) << err;
    EXPECT_EQ(cfg.tracePath, "page.json");
    EXPECT_EQ(cfg.devtoolsLogPath, "page.log.json");
    EXPECT_EQ(cfg.audit, "main-thread-tasks");
    EXPECT_DOUBLE_EQ(cfg.thresholdMs, 120.0);
    EXPECT_EQ(cfg.output, "json");
    EXPECT_FALSE(cfg.autoReload);
    EXPECT_FLOAT_EQ(cfg.autoReloadIntervalS, 2.5f);
    EXPECT_EQ(cfg.logLevel, "info");
}

TEST(ParseConfig, RejectsBadValues) {
    AppConfig cfg;
    std::string err;
    EXPECT_FALSE(parse_config("[1, 2]", cfg, &err));
    EXPECT_FALSE(parse_config("{ broken", cfg, &err));
    EXPECT_FALSE(parse_config(R"({"thresholdMs": "fifty"})", cfg, &err));
    EXPECT_FALSE(parse_config(R"({"thresholdMs": -1})", cfg, &err));
    EXPECT_FALSE(parse_config(R"({"output": "html"})", cfg, &err));
    EXPECT_NE(err.find("output"), std::string::npos);
    // a rejected file leaves the config untouched
    EXPECT_DOUBLE_EQ(cfg.thresholdMs, 50.0);
    EXPECT_EQ(cfg.output, "text");
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

TEST(CommandLine, Flags) {
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(apply_command_line({"--devtools-log", "d.json", "--audit", "main-thread-tasks",
                                    "--threshold", "75.5", "--json", "t.json"},
                                   cfg, &err)) << err;
    EXPECT_EQ(cfg.tracePath, "t.json");
    EXPECT_EQ(cfg.devtoolsLogPath, "d.json");
    EXPECT_EQ(cfg.audit, "main-thread-tasks");
    EXPECT_DOUBLE_EQ(cfg.thresholdMs, 75.5);
    EXPECT_EQ(cfg.output, "json");
}

TEST(CommandLine, Errors) {
    AppConfig cfg;
    std::string err;
    EXPECT_FALSE(apply_command_line({"--verbose"}, cfg, &err));
    EXPECT_NE(err.find("unknown option"), std::string::npos);
    EXPECT_FALSE(apply_command_line({"--threshold", "50ms"}, cfg, &err));
    EXPECT_FALSE(apply_command_line({"--threshold", "-5"}, cfg, &err));
    EXPECT_FALSE(apply_command_line({"--trace"}, cfg, &err));
    EXPECT_NE(err.find("needs a value"), std::string::npos);
}

TEST(CommandLine, FlagsOverrideConfigFile) {
    const std::string path = ::testing::TempDir() + "tasklens_config.json";
    {
        std::ofstream f(path);
        f << R"({"trace": "from-file.json", "thresholdMs": 200, "output": "json"})";
    }
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(apply_command_line({"--threshold", "30", "--config", path}, cfg, &err)) << err;
    EXPECT_EQ(cfg.tracePath, "from-file.json");
    EXPECT_DOUBLE_EQ(cfg.thresholdMs, 30.0);
    EXPECT_EQ(cfg.output, "json");

    EXPECT_FALSE(apply_command_line({"--config", path + ".missing"}, cfg, &err));
    std::remove(path.c_str());
}

TEST(LogLevel, KnownAndUnknownNames) {
    std::string err;
    EXPECT_TRUE(apply_log_level("debug", &err));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    EXPECT_TRUE(apply_log_level("off", &err));
    EXPECT_FALSE(apply_log_level("loud", &err));
    EXPECT_NE(err.find("loud"), std::string::npos);
    EXPECT_TRUE(apply_log_level("info", &err));
}
