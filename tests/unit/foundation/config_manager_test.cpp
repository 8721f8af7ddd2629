#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "lra/foundation/config_manager.hpp"

using namespace lra::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("lra_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("agent.yaml", R"(
resilience:
  retry:
    max_retries: 5
  circuit_breaker:
    name: "ollama"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto retries = config.get<int>("resilience.retry.max_retries");
    ASSERT_TRUE(retries.hasValue());
    EXPECT_EQ(retries.value(), 5);

    auto name = config.get<std::string>("resilience.circuit_breaker.name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "ollama");
}

TEST_F(ConfigManagerTest, LoadFromString) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("cache:\n  enabled: false\n").hasValue());

    auto enabled = config.get<bool>("cache.enabled");
    ASSERT_TRUE(enabled.hasValue());
    EXPECT_FALSE(enabled.value());
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "value: hello");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYamlFails) {
    ConfigManager config;
    auto result = config.loadFromString("retry: [1, 2");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, NonMappingRootFails) {
    ConfigManager config;
    auto result = config.loadFromString("- a\n- b\n");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1").hasValue());
    ASSERT_TRUE(config.loadFromString("b: 2").hasValue());
    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("resilience.rate_limit.requests_per_minute", 120);

    auto result = config.get<int>("resilience.rate_limit.requests_per_minute");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 120);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "key: value");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("resilience.cache.enabled", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<bool>("resilience.cache.enabled", false);
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "resilience.cache.enabled");
}
