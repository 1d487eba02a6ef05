// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include <chunkguard/core/config.hpp>
#include <chunkguard/core/logger.hpp>
#include <chunkguard/chunking/chunking_config.hpp>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>

using namespace chunkguard;

TEST(ConfigTest, DottedLookup) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"chunking": {"max_bytes": 2048, "warning_ratio": 0.5},
                                    "log_level": "debug", "enabled": true})"));

    EXPECT_EQ(cfg.get_int("chunking.max_bytes", 0), 2048);
    EXPECT_DOUBLE_EQ(cfg.get_double("chunking.warning_ratio", 0.0), 0.5);
    EXPECT_EQ(cfg.get_string("log_level", "info"), "debug");
    EXPECT_TRUE(cfg.get_bool("enabled", false));
    EXPECT_TRUE(cfg.has("chunking.max_bytes"));
    EXPECT_FALSE(cfg.has("chunking.missing"));
}

TEST(ConfigTest, DefaultsOnMissingOrMistyped) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"chunking": {"max_bytes": "big"}})"));

    EXPECT_EQ(cfg.get_int("chunking.max_bytes", 7), 7);
    EXPECT_EQ(cfg.get_int("chunking.max_bytes.deeper", 8), 8);
    EXPECT_EQ(cfg.get_string("nope", "fallback"), "fallback");
    EXPECT_FALSE(cfg.get_bool("nope", false));
}

TEST(ConfigTest, RejectsInvalidDocumentsAndKeepsOldSettings) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"a": 1})"));

    EXPECT_FALSE(cfg.load_string("{not json"));
    EXPECT_FALSE(cfg.last_error().empty());
    EXPECT_FALSE(cfg.load_string("[1, 2, 3]"));
    EXPECT_EQ(cfg.get_int("a", 0), 1);
}

TEST(ConfigTest, LoadFile) {
    std::string path = ::testing::TempDir() + "chunkguard_config_test.json";
    {
        std::ofstream out(path.c_str());
        out << R"({"tokens": {"ttl_minutes": 5}})";
    }
    Config cfg;
    ASSERT_TRUE(cfg.load_file(path));
    EXPECT_EQ(cfg.get_int("tokens.ttl_minutes", 30), 5);
    std::remove(path.c_str());

    EXPECT_FALSE(cfg.load_file(path));
}

TEST(ConfigTest, SettersCreateNestedKeys) {
    Config cfg;
    cfg.set_int("chunking.probe_step", 512);
    cfg.set_string("log_level", "warn");
    cfg.set_bool("a.b.c", true);

    EXPECT_EQ(cfg.get_int("chunking.probe_step", 0), 512);
    EXPECT_EQ(cfg.get_string("log_level", ""), "warn");
    EXPECT_TRUE(cfg.get_bool("a.b.c", false));
}

TEST(ChunkingConfigTest, DefaultsMatchTransportMargins) {
    ChunkingConfig c;
    EXPECT_DOUBLE_EQ(c.max_bytes, 0.9 * 1024 * 1024);
    EXPECT_DOUBLE_EQ(c.warning_ratio, 0.85);
    EXPECT_DOUBLE_EQ(c.safety_margin, 1.2);
    EXPECT_EQ(c.probe_step, 4096u);
    EXPECT_EQ(c.token_ttl_ms, 30LL * 60 * 1000);

    std::string error;
    EXPECT_TRUE(c.validate(error));
}

TEST(ChunkingConfigTest, FromConfig) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"chunking": {"max_bytes": 1000, "safety_margin": 1.0,
                                                  "probe_step": 64},
                                    "tokens": {"ttl_minutes": 2}})"));
    ChunkingConfig c = ChunkingConfig::from_config(cfg);

    EXPECT_DOUBLE_EQ(c.max_bytes, 1000.0);
    EXPECT_DOUBLE_EQ(c.safety_margin, 1.0);
    EXPECT_DOUBLE_EQ(c.warning_ratio, 0.85);
    EXPECT_EQ(c.probe_step, 64u);
    EXPECT_EQ(c.token_ttl_ms, 2LL * 60 * 1000);
}

TEST(ChunkingConfigTest, ValidateNamesTheBadField) {
    std::string error;

    ChunkingConfig c;
    c.max_bytes = 0;
    EXPECT_FALSE(c.validate(error));
    EXPECT_NE(error.find("max_bytes"), std::string::npos);

    c = ChunkingConfig();
    c.warning_ratio = 1.5;
    EXPECT_FALSE(c.validate(error));

    c = ChunkingConfig();
    c.safety_margin = 0.5;
    EXPECT_FALSE(c.validate(error));

    c = ChunkingConfig();
    c.probe_step = 0;
    EXPECT_FALSE(c.validate(error));
    EXPECT_NE(error.find("probe_step"), std::string::npos);

    c = ChunkingConfig();
    c.token_ttl_ms = 0;
    EXPECT_FALSE(c.validate(error));
}

TEST(ConfigTest, OutOfRangeIntegersUseDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"huge": 1e30, "tiny": -1e30, "wide": 18446744073709551615,
                                    "edge": 9223372036854775807, "fraction": 2.75})"));

    EXPECT_EQ(cfg.get_int("huge", 5), 5);
    EXPECT_EQ(cfg.get_int("tiny", 5), 5);
    EXPECT_EQ(cfg.get_int("wide", 5), 5);
    EXPECT_EQ(cfg.get_int("edge", 5), INT64_MAX);
    EXPECT_EQ(cfg.get_int("fraction", 5), 2);
}

TEST(ChunkingConfigTest, OutOfRangeValuesFailValidation) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"chunking": {"probe_step": 1e30},
                                    "tokens": {"ttl_minutes": 1e300}})"));
    ChunkingConfig c = ChunkingConfig::from_config(cfg);

    EXPECT_EQ(c.probe_step, 0u);
    EXPECT_EQ(c.token_ttl_ms, 0);
    std::string error;
    EXPECT_FALSE(c.validate(error));
}

TEST(ChunkingConfigTest, NegativeValuesFailValidation) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"chunking": {"probe_step": -4},
                                    "tokens": {"ttl_minutes": -1}})"));
    ChunkingConfig c = ChunkingConfig::from_config(cfg);

    EXPECT_EQ(c.probe_step, 0u);
    EXPECT_EQ(c.token_ttl_ms, 0);
}

TEST(LoggerTest, LevelFromString) {
    Logger& log = Logger::instance();
    LogLevel original = log.level();

    EXPECT_TRUE(log.set_level_from_string("DEBUG"));
    EXPECT_EQ(log.level(), LogLevel::DEBUG);
    EXPECT_TRUE(log.set_level_from_string(" warning "));
    EXPECT_EQ(log.level(), LogLevel::WARN);
    EXPECT_FALSE(log.set_level_from_string("verbose"));
    EXPECT_EQ(log.level(), LogLevel::WARN);

    log.set_level(original);
}

TEST(LoggerTest, LevelFromConfig) {
    Logger& log = Logger::instance();
    LogLevel original = log.level();

    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"log_level": "error"})"));
    EXPECT_TRUE(cfg.apply_log_level());
    EXPECT_EQ(log.level(), LogLevel::ERROR);

    cfg.set_string("log_level", "loud");
    EXPECT_FALSE(cfg.apply_log_level());
    EXPECT_EQ(log.level(), LogLevel::ERROR);

    log.set_level(original);
}
