//
// Created by gregorian-rayne on 1/22/26.
//

#include "sdkir/config/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace sdkir::config
{
    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "sdkir_config_test";
            fs::remove_all(temp_dir);
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir, ec);
        }

        [[nodiscard]] fs::path create_test_file(const std::string& filename, const std::string& content) const {
            const fs::path file_path = temp_dir / filename;
            std::ofstream file(file_path);
            file << content;
            return file_path;
        }

        fs::path temp_dir;
    };

    TEST_F(ConfigTest, Defaults) {
        const auto config = Config::defaults();

        EXPECT_EQ(config.resolver.cache_dir, "~/.sdkir/cache");
        EXPECT_EQ(config.resolver.fetch_timeout_ms, 30000);
        EXPECT_TRUE(config.resolver.prefetch);
        EXPECT_EQ(config.resolver.prefetch_threads, 0u);
        EXPECT_TRUE(config.naming.report_ambiguity);
        EXPECT_EQ(config.nested.extension_key, "x-nested-resource");
        EXPECT_EQ(config.nested.min_operations, 2u);
        EXPECT_TRUE(config.namespaces.default_name.empty());
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST_F(ConfigTest, LoadFromString) {
        const auto config = Config::load_from_string(R"(
[resolver]
cache_dir = "/tmp/sdkir-cache"
fetch_timeout_ms = 5000
prefetch = false
prefetch_threads = 4

[naming]
report_ambiguity = false

[nested]
extension_key = "x-sdk-group"
min_operations = 3

[namespaces]
default_name = "default"
)");
        ASSERT_TRUE(config.is_ok()) << config.error().to_string();

        const auto& value = config.value();
        EXPECT_EQ(value.resolver.cache_dir, "/tmp/sdkir-cache");
        EXPECT_EQ(value.resolver.fetch_timeout_ms, 5000);
        EXPECT_FALSE(value.resolver.prefetch);
        EXPECT_EQ(value.resolver.prefetch_threads, 4u);
        EXPECT_FALSE(value.naming.report_ambiguity);
        EXPECT_EQ(value.nested.extension_key, "x-sdk-group");
        EXPECT_EQ(value.nested.min_operations, 3u);
        EXPECT_EQ(value.namespaces.default_name, "default");
        EXPECT_EQ(value.cache_directory(), fs::path("/tmp/sdkir-cache"));
    }

    TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
        const auto config = Config::load_from_string("[nested]\nmin_operations = 1\n");
        ASSERT_TRUE(config.is_ok());

        EXPECT_EQ(config.value().nested.min_operations, 1u);
        EXPECT_EQ(config.value().resolver.fetch_timeout_ms, 30000);
    }

    TEST_F(ConfigTest, InvalidTomlIsConfigError) {
        const auto config = Config::load_from_string("[resolver\ncache_dir = ");
        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
        EXPECT_TRUE(config.error().has_context());
    }

    TEST_F(ConfigTest, WrongTypeIsReported) {
        const auto config = Config::load_from_string("[resolver]\nprefetch = \"yes\"\n");
        ASSERT_TRUE(config.is_err());
        EXPECT_NE(config.error().message().find("resolver.prefetch has an invalid type"), std::string::npos);
    }

    TEST_F(ConfigTest, SectionMustBeTable) {
        const auto config = Config::load_from_string("naming = 1\n");
        ASSERT_TRUE(config.is_err());
        EXPECT_NE(config.error().message().find("[naming] must be a table"), std::string::npos);
    }

    TEST_F(ConfigTest, ValidationRejectsBadValues) {
        EXPECT_TRUE(Config::load_from_string("[resolver]\nfetch_timeout_ms = 0\n").is_err());
        EXPECT_TRUE(Config::load_from_string("[resolver]\nprefetch_threads = -1\n").is_err());
        EXPECT_TRUE(Config::load_from_string("[nested]\nmin_operations = 0\n").is_err());
        EXPECT_TRUE(Config::load_from_string("[nested]\nextension_key = \"\"\n").is_err());
    }

    TEST_F(ConfigTest, LoadFromFileAddsPathToErrors) {
        const auto path = create_test_file("bad.toml", "[resolver]\nfetch_timeout_ms = -5\n");

        const auto config = Config::load_from_file(path);
        ASSERT_TRUE(config.is_err());
        EXPECT_NE(config.error().context().value_or("").find("bad.toml"), std::string::npos);
    }

    TEST_F(ConfigTest, LoadDefaultWithoutFile) {
        const auto config = Config::load_default(temp_dir);
        ASSERT_TRUE(config.is_ok());
        EXPECT_EQ(config.value().nested.min_operations, 2u);
    }

    TEST_F(ConfigTest, LoadDefaultReadsProjectFile) {
        static_cast<void>(create_test_file(DEFAULT_CONFIG_FILE, "[namespaces]\ndefault_name = \"main\"\n"));

        const auto config = Config::load_default(temp_dir);
        ASSERT_TRUE(config.is_ok());
        EXPECT_EQ(config.value().namespaces.default_name, "main");
    }

    TEST_F(ConfigTest, LoadMissingFileIsNotFound) {
        const auto config = Config::load_from_file(temp_dir / "nope.toml");
        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::NotFound);
    }

}  // namespace sdkir::config
