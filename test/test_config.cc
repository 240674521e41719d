#include <gtest/gtest.h>
#include "../src/config.hh"

#include <fstream>

namespace
{
    string writeFile(const string &name, const string &content)
    {
        ofstream out(name, ios::trunc);
        out << content;
        return name;
    }
}

TEST(ConfigTest, MissingKeysKeepDefaults)
{
    AppConfig cfg = configFromJSON(json::object());

    EXPECT_EQ(cfg.runtime.maxConcurrent, 0u);
    EXPECT_EQ(cfg.rateLimit.minDelay, chrono::milliseconds(2000));
    EXPECT_EQ(cfg.rateLimit.jitter, chrono::milliseconds(500));
    EXPECT_EQ(cfg.retry.maxAttempts, 3);
    EXPECT_EQ(cfg.bulk.maxItems, 500u);
    EXPECT_EQ(cfg.registry.maxTerminalJobs, 1000u);
    EXPECT_EQ(cfg.logging.level, LogLevel::Info);
    EXPECT_FALSE(cfg.statusServer.enabled);
    EXPECT_EQ(cfg.profilesFile, "profiles.json");
}

TEST(ConfigTest, ReadsEverySection)
{
    json j = json::parse(R"({
        "runtime": {"max_concurrent": 4, "drain_grace_ms": 750},
        "rate_limit": {"min_delay_ms": 100, "max_delay_ms": 900, "jitter_ms": 20},
        "retry": {"max_attempts": 5, "backoff_ms": 50},
        "bulk": {"max_items": 20, "parse_limit": 300},
        "registry": {"max_terminal_jobs": 10, "max_terminal_age_s": 60},
        "events": {"max_queued": 128},
        "logging": {"file": "run.jsonl", "level": "debug", "truncate": false},
        "status_server": {"enabled": true, "port": 9100},
        "profiles_file": "accounts.json"
    })");

    AppConfig cfg = configFromJSON(j);

    EXPECT_EQ(cfg.runtime.maxConcurrent, 4u);
    EXPECT_EQ(cfg.runtime.drainGrace, chrono::milliseconds(750));
    EXPECT_EQ(cfg.rateLimit.maxDelay, chrono::milliseconds(900));
    EXPECT_EQ(cfg.retry.backoff, chrono::milliseconds(50));
    EXPECT_EQ(cfg.bulk.parseLimit, 300);
    EXPECT_EQ(cfg.registry.maxTerminalAge, chrono::seconds(60));
    EXPECT_EQ(cfg.maxQueuedEvents, 128u);
    EXPECT_EQ(cfg.logging.file, "run.jsonl");
    EXPECT_EQ(cfg.logging.level, LogLevel::Debug);
    EXPECT_FALSE(cfg.logging.truncate);
    EXPECT_TRUE(cfg.statusServer.enabled);
    EXPECT_EQ(cfg.statusServer.port, 9100);
    EXPECT_EQ(cfg.profilesFile, "accounts.json");

    // What we read is what we render
    EXPECT_EQ(configToJSON(cfg)["rate_limit"]["jitter_ms"], 20);
    EXPECT_EQ(configFromJSON(configToJSON(cfg)).runtime.maxConcurrent, 4u);
}

TEST(ConfigTest, BadValuesAreValidationErrors)
{
    EXPECT_THROW(configFromJSON(json::array()), ValidationError);
    EXPECT_THROW(configFromJSON({{"rate_limit", {{"min_delay_ms", -1}}}}), ValidationError);
    EXPECT_THROW(configFromJSON({{"retry", {{"max_attempts", 0}}}}), ValidationError);
    EXPECT_THROW(configFromJSON({{"bulk", {{"max_items", 0}}}}), ValidationError);
    EXPECT_THROW(configFromJSON({{"status_server", {{"port", 70000}}}}), ValidationError);
    EXPECT_THROW(configFromJSON({{"logging", {{"level", "loud"}}}}), ValidationError);
    EXPECT_THROW(configFromJSON({{"runtime", {{"max_concurrent", "four"}}}}), ValidationError);
}

TEST(ConfigTest, LoadConfigFromFile)
{
    string path = writeFile("config_test.json", R"({"bulk": {"max_items": 7}})");
    EXPECT_EQ(loadConfig(path).bulk.maxItems, 7u);

    EXPECT_THROW(loadConfig("does_not_exist.json"), runtime_error);

    string broken = writeFile("config_broken.json", "{ not json");
    EXPECT_THROW(loadConfig(broken), runtime_error);
}
