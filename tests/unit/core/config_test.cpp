// HexForge Core Tests
// config_test.cpp - Configuration loading and typed access

#include <gtest/gtest.h>

#include <hexforge/core/config.hpp>
#include <hexforge/platform/file_io.hpp>

#include <limits>

namespace hexforge::core {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        test_dir_ = platform::FileSystem::get_temp_directory() / "hexforge_config_test";
        platform::FileSystem::create_directories(test_dir_);
    }

    void TearDown() override { platform::FileSystem::remove_all(test_dir_); }
};

TEST_F(ConfigTest, DefaultsDescribeTheStandardPlatform) {
    Config config;

    EXPECT_DOUBLE_EQ(config.get_double(config_section::PLATFORM, config_key::RADIUS), 7.0);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::PLATFORM, config_key::HEIGHT), 0.5);
    EXPECT_EQ(config.get_int(config_section::PLATFORM, config_key::SIDES), 6);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::RINGS, config_key::OUTER_RADIUS), 5.5);
    EXPECT_EQ(config.get_int(config_section::PILLARS, config_key::COUNT), 6);
    EXPECT_EQ(config.get_int(config_section::DECORATIONS, config_key::SKULL_COUNT), 8);
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::SEED), 42);
    EXPECT_FALSE(config.get_bool(config_section::FEATURES, config_key::RUNES, true));
    EXPECT_EQ(config.get_string(config_section::OUTPUT, config_key::PATH), "boss_platform.glb");
}

TEST_F(ConfigTest, MissingKeyReturnsCallerDefault) {
    Config config;

    EXPECT_EQ(config.get_int("nonexistent", "key", 17), 17);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::PLATFORM, "missing", 2.5), 2.5);
    EXPECT_EQ(config.get_string(config_section::PLATFORM, "missing", "fallback"), "fallback");
    EXPECT_FALSE(config.has(config_section::PLATFORM, "missing"));
    EXPECT_FALSE(config.has_section("nonexistent"));
}

TEST_F(ConfigTest, WrongTypeReturnsCallerDefault) {
    Config config;
    config.set_string(config_section::PILLARS, config_key::COUNT, "six");

    EXPECT_EQ(config.get_int(config_section::PILLARS, config_key::COUNT, 4), 4);
}

TEST_F(ConfigTest, OutOfRangeIntegerReturnsCallerDefault) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"generation": {"seed": 3000000000}, "pillars": {"count": -3000000000}})"));

    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::SEED, 42), 42);
    EXPECT_EQ(config.get_int(config_section::PILLARS, config_key::COUNT, 6), 6);
}

TEST_F(ConfigTest, WideIntegerReadKeepsFullValue) {
    Config config;
    ASSERT_TRUE(config.load_from_string(
        R"({"generation": {"seed": 4294967296}, "pillars": {"count": -3000000000}, "rings": {"circle_segments": 18446744073709551615}})"));

    EXPECT_EQ(config.get_int64(config_section::GENERATION, config_key::SEED), 4294967296LL);
    EXPECT_EQ(config.get_int64(config_section::PILLARS, config_key::COUNT), -3000000000LL);
    EXPECT_EQ(config.get_int64(config_section::RINGS, config_key::CIRCLE_SEGMENTS),
              std::numeric_limits<int64_t>::max());
    EXPECT_EQ(config.get_int64(config_section::PLATFORM, config_key::RADIUS, 5), 5);
}

TEST_F(ConfigTest, IntegerReadsAsDouble) {
    Config config;
    config.set_int(config_section::PLATFORM, config_key::RADIUS, 9);

    EXPECT_DOUBLE_EQ(config.get_double(config_section::PLATFORM, config_key::RADIUS), 9.0);
}

TEST_F(ConfigTest, LoadFromStringMergesOverDefaults) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"platform": {"radius": 9.5}, "features": {"chains": true}})"));

    EXPECT_DOUBLE_EQ(config.get_double(config_section::PLATFORM, config_key::RADIUS), 9.5);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::PLATFORM, config_key::HEIGHT), 0.5);
    EXPECT_TRUE(config.get_bool(config_section::FEATURES, config_key::CHAINS));
    EXPECT_FALSE(config.get_bool(config_section::FEATURES, config_key::RUNES));
}

TEST_F(ConfigTest, MalformedJsonIsRejected) {
    Config config;
    EXPECT_FALSE(config.load_from_string("{ not json"));
    EXPECT_DOUBLE_EQ(config.get_double(config_section::PLATFORM, config_key::RADIUS), 7.0);
}

TEST_F(ConfigTest, NonObjectRootIsRejected) {
    Config config;
    EXPECT_FALSE(config.load_from_string("[1, 2, 3]"));
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    Config config;
    EXPECT_FALSE(config.load(test_dir_ / "missing.json"));
}

TEST_F(ConfigTest, SaveAndLoadPreservesValues) {
    const auto path = test_dir_ / "hexforge.json";
    {
        Config config;
        config.set_double(config_section::PILLARS, config_key::HEIGHT, 4.25);
        config.set_bool(config_section::FEATURES, config_key::LAVA_CRACKS, true);
        ASSERT_TRUE(config.save(path));
    }

    Config loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_DOUBLE_EQ(loaded.get_double(config_section::PILLARS, config_key::HEIGHT), 4.25);
    EXPECT_TRUE(loaded.get_bool(config_section::FEATURES, config_key::LAVA_CRACKS));
    EXPECT_EQ(loaded.get_path(), path);
    EXPECT_FALSE(loaded.is_dirty());
}

TEST_F(ConfigTest, LoadOrCreateDefaultWritesFile) {
    const auto path = test_dir_ / "created.json";
    ASSERT_FALSE(platform::FileSystem::exists(path));

    Config config;
    EXPECT_TRUE(config.load_or_create_default(path));
    EXPECT_TRUE(platform::FileSystem::exists(path));
    EXPECT_EQ(config.get_int(config_section::PLATFORM, config_key::SIDES), 6);
}

TEST_F(ConfigTest, DirtyTracking) {
    Config config;
    config.mark_clean();
    EXPECT_FALSE(config.is_dirty());

    config.set_int(config_section::GENERATION, config_key::SEED, 7);
    EXPECT_TRUE(config.is_dirty());
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::SEED), 7);
}

TEST_F(ConfigTest, SetDefaultsDiscardsOverrides) {
    Config config;
    config.set_int(config_section::PILLARS, config_key::COUNT, 9);
    config.set_defaults();

    EXPECT_EQ(config.get_int(config_section::PILLARS, config_key::COUNT), 6);
}

}  // namespace
}  // namespace hexforge::core
