#include <gtest/gtest.h>
#include "postrelay/core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <filesystem>

using namespace postrelay::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_postrelay_config.txt";
        unsetenv("POSTRELAY_SERVER_URL");
        unsetenv("POSTRELAY_DATABASE");
        unsetenv("POSTRELAY_LOG_LEVEL");
    }

    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
        unsetenv("POSTRELAY_SERVER_URL");
        unsetenv("POSTRELAY_DATABASE");
        unsetenv("POSTRELAY_LOG_LEVEL");
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("server.base_url", "http://example.test:9000");

    auto value = config.get("server.base_url");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "http://example.test:9000");
    EXPECT_FALSE(config.get("nonexistent.key").has_value());
}

TEST_F(ConfigTest, TypedGettersFallBackToDefaults) {
    auto& config = Config::instance();
    config.set("queue.failure_pause_ms", "250");
    config.set("resumable.chunk_size", "not-a-number");
    config.set("flag", "yes");

    EXPECT_EQ(config.get_int("queue.failure_pause_ms", 1500), 250);
    EXPECT_EQ(config.get_int("resumable.chunk_size", 7), 7);
    EXPECT_TRUE(config.get_bool("flag"));
    EXPECT_TRUE(config.get_bool("missing", true));
    EXPECT_EQ(config.get_string("missing", "fallback"), "fallback");
    EXPECT_FALSE(config.get_as<uint64_t>("resumable.chunk_size").has_value());
}

TEST_F(ConfigTest, DefaultsCoverEveryKey) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_EQ(config.get_string("server.base_url"), "http://localhost:8080");
    EXPECT_EQ(config.get_int("server.timeout_ms"), 30000);
    EXPECT_EQ(config.get_string("storage.database"), "postrelay.db");
    EXPECT_FALSE(config.get_string("storage.temp_dir").empty());
    EXPECT_EQ(config.get_string("delivery.strategy"), "level2");
    EXPECT_EQ(config.get_as<uint64_t>("resumable.chunk_size"), 524288u);
    EXPECT_EQ(config.get_int("queue.failure_pause_ms"), 1500);
    EXPECT_EQ(config.get_int("queue.drain_timeout_ms"), 10000);
    EXPECT_EQ(config.get_string("log.level"), "info");
    EXPECT_EQ(config.get_string("log.file"), "postrelay.log");
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "server.base_url=http://10.0.0.2:8080\n";
    file << "delivery.strategy = level3 \n";
    file << "not a key value line\n";
    file << "resumable.chunk_size=1024\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("server.base_url"), "http://10.0.0.2:8080");
    EXPECT_EQ(config.get_string("delivery.strategy"), "level3");
    EXPECT_EQ(config.get_int("resumable.chunk_size"), 1024);
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load_from_file("does/not/exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("server.base_url", "http://localhost:9999");
    config.set("log.level", "debug");

    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));

    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("server.base_url"), "http://localhost:9999");
    EXPECT_EQ(new_config.get_string("log.level"), "debug");
}

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("storage.database", "from-file.db");

    setenv("POSTRELAY_SERVER_URL", "http://override:1234", 1);
    setenv("POSTRELAY_DATABASE", "override.db", 1);
    config.apply_environment_overrides();

    EXPECT_EQ(config.get_string("server.base_url"), "http://override:1234");
    EXPECT_EQ(config.get_string("storage.database"), "override.db");
    EXPECT_EQ(config.get_string("log.level"), "info");
}

TEST_F(ConfigTest, QuotedValuesAreUnwrapped) {
    std::ofstream file(test_file);
    file << "storage.temp_dir = \"/tmp/post relay\"\n";
    file << "log.file=\"\n";
    file.close();

    auto& config = Config::instance();
    ASSERT_TRUE(config.load_from_file(test_file));
    EXPECT_EQ(config.get_string("storage.temp_dir"), "/tmp/post relay");
    EXPECT_EQ(config.get_string("log.file"), "\"");
}

TEST_F(ConfigTest, DefaultsValidate) {
    auto& config = Config::instance();
    config.set_defaults();
    EXPECT_TRUE(config.validate().empty());
}

TEST_F(ConfigTest, ValidateReportsEachBadKey) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("server.base_url", "https://secure.example");
    config.set("delivery.strategy", "level7");
    config.set("resumable.chunk_size", "0");
    config.set("queue.drain_timeout_ms", "-5");

    auto problems = config.validate();
    ASSERT_EQ(problems.size(), 4u);
    EXPECT_EQ(problems[0], "server.base_url must start with http://, got https://secure.example");
    EXPECT_EQ(problems[1], "delivery.strategy must be one of level1..level4, got level7");
    EXPECT_EQ(problems[2], "resumable.chunk_size must be a positive byte count");
    EXPECT_EQ(problems[3], "queue.drain_timeout_ms must be a non-negative number of milliseconds");
}

TEST_F(ConfigTest, KnownKeys) {
    EXPECT_TRUE(Config::is_known_key("queue.drain_timeout_ms"));
    EXPECT_FALSE(Config::is_known_key("discovery.port"));
}
