#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "oas/foundation/config_manager.hpp"

using namespace oas::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("oas_test_") + info->name();
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
    auto path = writeYaml("test.yaml", R"(
auth:
  lockout_threshold: 5
store:
  redis_uri: "tcp://127.0.0.1:6379"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto threshold = config.get<int>("auth.lockout_threshold");
    ASSERT_TRUE(threshold.hasValue());
    EXPECT_EQ(threshold.value(), 5);

    auto uri = config.get<std::string>("store.redis_uri");
    ASSERT_TRUE(uri.hasValue());
    EXPECT_EQ(uri.value(), "tcp://127.0.0.1:6379");
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

TEST_F(ConfigManagerTest, LoadMalformedYaml) {
    auto path = writeYaml("broken.yaml", "auth: [unclosed");
    ConfigManager config;
    auto result = config.load(path);
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "key: value");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST(ConfigManagerStringTest, LoadFromStringFlattensNestedKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a:\n  b:\n    c: 3\n").hasValue());

    EXPECT_TRUE(config.hasKey("a.b.c"));
    EXPECT_FALSE(config.hasKey("a.b"));
    EXPECT_EQ(config.get<int>("a.b.c").value(), 3);
}

TEST(ConfigManagerStringTest, ScalarRootIsRejected) {
    ConfigManager config;
    auto result = config.loadFromString("just a string");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerStringTest, EmptyDocumentLoadsNoKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("").hasValue());
    EXPECT_FALSE(config.hasKey("auth.lockout_threshold"));
}

TEST(ConfigManagerStringTest, ReloadReplacesPreviousEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("old: 1").hasValue());
    ASSERT_TRUE(config.loadFromString("new: 2").hasValue());

    EXPECT_FALSE(config.hasKey("old"));
    EXPECT_TRUE(config.hasKey("new"));
}

TEST(ConfigManagerStringTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("auth.lockout_threshold", 9);

    auto result = config.get<int>("auth.lockout_threshold");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 9);
}

TEST(ConfigManagerStringTest, GetOrFallsBackOnlyForMissingKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("present: nope").hasValue());

    auto missing = config.getOr<int>("absent", 17);
    ASSERT_TRUE(missing.hasValue());
    EXPECT_EQ(missing.value(), 17);

    auto wrongType = config.getOr<int>("present", 17);
    ASSERT_TRUE(wrongType.hasError());
    EXPECT_EQ(wrongType.error().code(), ErrorCode::ConfigTypeMismatch);
}
