#include <gtest/gtest.h>
#include "utils/config.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace trivium;

TEST(ConfigTest, DefaultsWhenSectionsMissing) {
    auto cfg = EngineConfig::fromJson(nlohmann::json::object());
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_FALSE(cfg.query.parallel_siblings);
    EXPECT_EQ(cfg.query.timeout_ms, 0);
    EXPECT_TRUE(cfg.storage.enable_wal);
}

TEST(ConfigTest, ReadsAllSections) {
    auto cfg = EngineConfig::fromJson({
        {"logging", {{"level", "debug"}, {"file", ""}}},
        {"tracing", {{"enabled", true}, {"service_name", "trivium-test"}}},
        {"query", {{"parallel_siblings", true}, {"timeout_ms", 250}}},
        {"storage", {{"db_path", "/tmp/x"}, {"compression", "lz4"}, {"bloom_bits_per_key", 12}}}
    });
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_TRUE(cfg.logging.file.empty());
    EXPECT_TRUE(cfg.tracing.enabled);
    EXPECT_EQ(cfg.tracing.service_name, "trivium-test");
    EXPECT_TRUE(cfg.query.parallel_siblings);
    EXPECT_EQ(cfg.query.timeout_ms, 250);
    EXPECT_EQ(cfg.storage.db_path, "/tmp/x");
    EXPECT_EQ(cfg.storage.compression, "lz4");
    EXPECT_EQ(cfg.storage.bloom_bits_per_key, 12);
}

TEST(ConfigTest, WrongTypesAreConfigErrors) {
    EXPECT_THROW(EngineConfig::fromJson({{"query", {{"timeout_ms", "soon"}}}}), ConfigError);
    EXPECT_THROW(EngineConfig::fromJson({{"query", {{"timeout_ms", -5}}}}), ConfigError);
    EXPECT_THROW(EngineConfig::fromJson({{"storage", "rocksdb"}}), ConfigError);
    EXPECT_THROW(EngineConfig::fromJson(nlohmann::json::array()), ConfigError);
}

TEST(ConfigTest, ToJsonFeedsBackIntoFromJson) {
    EngineConfig a;
    a.query.timeout_ms = 42;
    a.storage.compression = "zstd";
    auto b = EngineConfig::fromJson(a.toJson());
    EXPECT_EQ(b.query.timeout_ms, 42);
    EXPECT_EQ(b.storage.compression, "zstd");
}

TEST(ConfigTest, YamlScalarsAreTyped) {
    auto j = utils::parseYaml("query:\n  parallel_siblings: true\n  timeout_ms: 100\nname: \"123\"\nratio: 0.5\n");
    EXPECT_EQ(j["query"]["parallel_siblings"], true);
    EXPECT_EQ(j["query"]["timeout_ms"], 100);
    EXPECT_EQ(j["name"], "123");
    EXPECT_DOUBLE_EQ(j["ratio"].get<double>(), 0.5);
    EXPECT_THROW(utils::parseYaml("a: [1, 2"), ConfigError);
}

TEST(ConfigTest, LoadFromYamlFile) {
    const fs::path path = fs::temp_directory_path() / "trivium_config_test.yaml";
    {
        std::ofstream out(path);
        out << "logging:\n  level: warn\nquery:\n  timeout_ms: 1500\n";
    }
    auto cfg = EngineConfig::loadFromFile(path.string());
    EXPECT_EQ(cfg.logging.level, "warn");
    EXPECT_EQ(cfg.query.timeout_ms, 1500);
    fs::remove(path);

    EXPECT_THROW(EngineConfig::loadFromFile("/nonexistent/trivium.yaml"), ConfigError);
}
