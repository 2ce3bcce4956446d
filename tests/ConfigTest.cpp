#include "core/Config.hpp"
#include "core/transfer/TransferQueueOptions.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <fstream>

using courier::core::Config;
using courier::core::json;
using courier::core::transfer::TransferQueueOptions;
using courier::test::TempDir;

TEST(ConfigTest, DefaultsMatchQueueDefaults) {
    Config config;

    EXPECT_EQ(config.get<int>("transfers.maxConcurrent"), 3);
    EXPECT_TRUE(config.get<bool>("transfers.autoStart"));
    EXPECT_FALSE(config.get<bool>("transfers.autoRetry"));
    EXPECT_EQ(config.get<int>("transfers.maxRetries"), 3);
    EXPECT_EQ(config.get<std::string>("logging.level"), "info");
    EXPECT_EQ(config.get<int>("cache.maxEntries"), 1000);
}

TEST(ConfigTest, DotNotationGetAndSet) {
    Config config;
    config.set("transfers.maxConcurrent", 8);
    config.set("custom.nested.flag", true);

    EXPECT_EQ(config.get<int>("transfers.maxConcurrent"), 8);
    EXPECT_TRUE(config.get<bool>("custom.nested.flag"));
    EXPECT_TRUE(config.has("custom.nested"));
    EXPECT_FALSE(config.has("custom.missing"));
    EXPECT_EQ(config.get<int>("custom.missing", 42), 42);
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    Config config;
    config.set("transfers.maxConcurrent", std::string("many"));
    EXPECT_EQ(config.get<int>("transfers.maxConcurrent", 5), 5);
}

TEST(ConfigTest, LoadMergesOverDefaults) {
    TempDir dir;
    auto path = dir.write("config.json", R"({"transfers": {"maxConcurrent": 6}})");

    Config config;
    ASSERT_TRUE(config.load(path.string()));

    EXPECT_EQ(config.get<int>("transfers.maxConcurrent"), 6);
    EXPECT_EQ(config.get<int>("transfers.maxRetries"), 3);
}

TEST(ConfigTest, LoadRejectsMissingOrMalformedFiles) {
    TempDir dir;
    auto broken = dir.write("broken.json", "{ not json");

    Config config;
    EXPECT_FALSE(config.load((dir.path() / "absent.json").string()));
    EXPECT_FALSE(config.load(broken.string()));
    EXPECT_EQ(config.get<int>("transfers.maxConcurrent"), 3);
}

TEST(ConfigTest, SaveWritesReadableJson) {
    TempDir dir;
    auto path = dir.path() / "nested" / "config.json";

    Config config;
    config.set("transfers.historyLimit", 7);
    ASSERT_TRUE(config.save(path.string()));

    std::ifstream file(path);
    auto saved = json::parse(file);
    EXPECT_EQ(saved["transfers"]["historyLimit"], 7);

    Config reloaded;
    ASSERT_TRUE(reloaded.load(path.string()));
    EXPECT_EQ(reloaded.get<int>("transfers.historyLimit"), 7);
}

TEST(ConfigTest, QueueOptionsFromConfig) {
    Config config;
    config.set("transfers.maxConcurrent", 5);
    config.set("transfers.autoStart", false);
    config.set("transfers.autoRetry", true);
    config.set("transfers.maxRetries", 1);
    config.set("transfers.historyLimit", 10);

    auto options = TransferQueueOptions::fromConfig(config);
    EXPECT_EQ(options.maxConcurrent, 5u);
    EXPECT_FALSE(options.autoStart);
    EXPECT_TRUE(options.autoRetry);
    EXPECT_EQ(options.maxRetries, 1);
    EXPECT_EQ(options.historyLimit, 10u);
}

TEST(ConfigTest, QueueOptionsRejectInvalidValues) {
    Config zero;
    zero.set("transfers.maxConcurrent", 0);
    EXPECT_THROW(TransferQueueOptions::fromConfig(zero), std::invalid_argument);

    Config negative;
    negative.set("transfers.maxRetries", -2);
    EXPECT_THROW(TransferQueueOptions::fromConfig(negative), std::invalid_argument);
}
