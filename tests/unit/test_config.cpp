#include <filesystem>
#include <gtest/gtest.h>
#include <plotscale/config.hpp>
#include <plotscale/errors.hpp>

using namespace plotscale;

// ─── Validation ──────────────────────────────────────────────────────────────

TEST(NormalizeConfigValidate, DefaultsAreValid)
{
    NormalizeConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.epsilon, 1e-3);
    EXPECT_DOUBLE_EQ(config.bar_width_ratio, 0.8);
    EXPECT_DOUBLE_EQ(config.padding, 0.0);
    EXPECT_DOUBLE_EQ(config.stack_key_quantum, 0.0);
}

TEST(NormalizeConfigValidate, RejectsNonPositiveEpsilon)
{
    NormalizeConfig config;
    config.epsilon = 0.0;
    try
    {
        config.validate();
        FAIL() << "expected NormalizeError";
    }
    catch (const NormalizeError& e)
    {
        EXPECT_EQ(e.code(), ErrorCode::InvalidConfig);
    }
}

TEST(NormalizeConfigValidate, RejectsBarWidthOutOfRange)
{
    NormalizeConfig config;
    config.bar_width_ratio = 1.5;
    EXPECT_THROW(config.validate(), NormalizeError);
    config.bar_width_ratio = 0.0;
    EXPECT_THROW(config.validate(), NormalizeError);
    config.bar_width_ratio = 1.0;
    EXPECT_NO_THROW(config.validate());
}

TEST(NormalizeConfigValidate, RejectsNegativePadding)
{
    NormalizeConfig config;
    config.padding = -1.0;
    EXPECT_THROW(config.validate(), NormalizeError);
}

TEST(NormalizeConfigValidate, RejectsNegativeQuantum)
{
    NormalizeConfig config;
    config.stack_key_quantum = -0.5;
    EXPECT_THROW(config.validate(), NormalizeError);
}

// ─── Hash ────────────────────────────────────────────────────────────────────

TEST(NormalizeConfigHash, EqualConfigsHashEqual)
{
    NormalizeConfig a;
    NormalizeConfig b;
    EXPECT_EQ(a.hash(), b.hash());
}

TEST(NormalizeConfigHash, FieldChangeChangesHash)
{
    NormalizeConfig a;
    NormalizeConfig b;
    b.padding = 4.0;
    EXPECT_NE(a.hash(), b.hash());
}

// ─── Serialization ───────────────────────────────────────────────────────────

TEST(NormalizeConfigSerialize, RoundTrip)
{
    NormalizeConfig config;
    config.epsilon           = 0.25;
    config.bar_width_ratio   = 0.6;
    config.padding           = 12.0;
    config.stack_key_quantum = 0.1;

    NormalizeConfig loaded;
    EXPECT_TRUE(loaded.deserialize(config.serialize()));
    EXPECT_EQ(loaded, config);
}

TEST(NormalizeConfigSerialize, ContainsVersion)
{
    std::string json = NormalizeConfig{}.serialize();
    EXPECT_NE(json.find("\"version\": 1"), std::string::npos);
}

TEST(NormalizeConfigSerialize, DeserializeEmpty)
{
    NormalizeConfig config;
    EXPECT_FALSE(config.deserialize(""));
}

TEST(NormalizeConfigSerialize, DeserializeFutureVersion)
{
    NormalizeConfig config;
    EXPECT_FALSE(config.deserialize("{\"version\": 99, \"padding\": 3}"));
    EXPECT_DOUBLE_EQ(config.padding, 0.0);
}

TEST(NormalizeConfigSerialize, MissingKeysKeepValues)
{
    NormalizeConfig config;
    config.bar_width_ratio = 0.5;
    EXPECT_TRUE(config.deserialize("{\"version\": 1, \"padding\": 8}"));
    EXPECT_DOUBLE_EQ(config.padding, 8.0);
    EXPECT_DOUBLE_EQ(config.bar_width_ratio, 0.5);
}

TEST(NormalizeConfigSerialize, InvalidValueLeavesConfigUntouched)
{
    NormalizeConfig config;
    EXPECT_FALSE(config.deserialize("{\"epsilon\": -1, \"padding\": 8}"));
    EXPECT_EQ(config, NormalizeConfig{});
}

TEST(NormalizeConfigSerialize, NonNumericValueIgnored)
{
    NormalizeConfig config;
    EXPECT_TRUE(config.deserialize("{\"epsilon\": \"big\"}"));
    EXPECT_DOUBLE_EQ(config.epsilon, 1e-3);
}

// ─── File I/O ────────────────────────────────────────────────────────────────

TEST(NormalizeConfigFile, SaveAndLoad)
{
    auto path     = std::filesystem::temp_directory_path() / "plotscale_test" / "normalize.json";
    auto path_str = path.string();
    std::filesystem::remove_all(path.parent_path());

    NormalizeConfig config;
    config.padding = 6.0;
    EXPECT_TRUE(config.save(path_str));
    EXPECT_TRUE(std::filesystem::exists(path));

    NormalizeConfig loaded;
    EXPECT_TRUE(loaded.load(path_str));
    EXPECT_DOUBLE_EQ(loaded.padding, 6.0);

    std::filesystem::remove_all(path.parent_path());
}

TEST(NormalizeConfigFile, LoadNonexistent)
{
    NormalizeConfig config;
    EXPECT_FALSE(config.load("/nonexistent/path/normalize.json"));
}

TEST(NormalizeConfigFile, SaveToInvalidPath)
{
    NormalizeConfig config;
    EXPECT_FALSE(config.save("/dev/null/impossible/path/normalize.json"));
}

TEST(NormalizeConfigFile, DefaultPath)
{
    std::string path = NormalizeConfig::default_path();
    EXPECT_FALSE(path.empty());
    EXPECT_NE(path.find("normalize.json"), std::string::npos);
}
