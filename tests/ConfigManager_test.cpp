#include "Config/ConfigManager.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace call_capture;

TEST(ConfigManagerTest, DefaultsMatchDocumentedValues) {
    ConfigManager manager;
    const AppConfig config = manager.GetConfig();

    EXPECT_EQ(config.quality, AudioQuality::Standard());
    EXPECT_FALSE(config.keepRawCapture);
    EXPECT_TRUE(config.enhancement.noiseReduction);
    EXPECT_TRUE(config.enhancement.compression);
    EXPECT_TRUE(config.enhancement.normalization);
    EXPECT_FLOAT_EQ(config.enhancement.noiseGate.thresholdRatio, 0.01f);
    EXPECT_FLOAT_EQ(config.enhancement.noiseGate.reduction, 0.3f);
    EXPECT_FLOAT_EQ(config.enhancement.compressor.thresholdRatio, 0.7f);
    EXPECT_FLOAT_EQ(config.enhancement.compressor.ratio, 4.0f);
    EXPECT_FLOAT_EQ(config.agc.targetLevel, 0.5f);
    EXPECT_FLOAT_EQ(config.agc.maxGainDb, 20.0f);
    EXPECT_FALSE(config.silenceTrim.enabled);
    EXPECT_EQ(config.silenceTrim.minSilenceMs, 500u);
}

TEST(ConfigManagerTest, PartialDocumentKeepsOtherDefaults) {
    ConfigManager manager;
    manager.LoadFromString(R"({
        "quality": "HIGH_QUALITY",
        "compressor": { "ratio": 8.0 },
        "silenceTrim": { "enabled": true }
    })");

    const AppConfig config = manager.GetConfig();
    EXPECT_EQ(config.quality, AudioQuality::HighQuality());
    EXPECT_FLOAT_EQ(config.enhancement.compressor.ratio, 8.0f);
    EXPECT_FLOAT_EQ(config.enhancement.compressor.thresholdRatio, 0.7f);
    EXPECT_TRUE(config.silenceTrim.enabled);
    EXPECT_FLOAT_EQ(config.silenceTrim.thresholdRatio, 0.02f);
}

TEST(ConfigManagerTest, MalformedDocumentsThrow) {
    ConfigManager manager;
    EXPECT_THROW(manager.LoadFromString("{ not json"), ConfigException);
    EXPECT_THROW(manager.LoadFromString("[1, 2]"), ConfigException);
    EXPECT_THROW(manager.LoadFromString(R"({"quality": "ULTRA"})"), ConfigException);
    EXPECT_THROW(manager.LoadFromString(R"({"agc": {"realtime": "yes"}})"), ConfigException);
    EXPECT_THROW(manager.LoadFromString(R"({"filters": 5})"), ConfigException);

    // Failed loads leave the previous configuration in place
    EXPECT_EQ(manager.GetConfig().quality, AudioQuality::Standard());
}

TEST(ConfigManagerTest, NegativeMinSilenceIsRejected) {
    ConfigManager manager;
    EXPECT_THROW(manager.LoadFromString(R"({"silenceTrim": {"minSilenceMs": -1}})"),
                 ConfigException);
    EXPECT_EQ(manager.GetConfig().silenceTrim.minSilenceMs, 500u);

    manager.LoadFromString(R"({"silenceTrim": {"minSilenceMs": 0}})");
    EXPECT_EQ(manager.GetConfig().silenceTrim.minSilenceMs, 0u);
}

TEST(ConfigManagerTest, MissingFileReturnsFalse) {
    test_utils::TempDir dir;
    ConfigManager manager;
    EXPECT_FALSE(manager.Load(dir.File("absent.json")));
    EXPECT_TRUE(manager.GetConfigPath().empty());
}

TEST(ConfigManagerTest, SaveAndLoadFile) {
    test_utils::TempDir dir;
    const std::string path = dir.File("config.json");

    ConfigManager writer;
    AppConfig config;
    config.quality = AudioQuality::SpaceSaving();
    config.keepRawCapture = true;
    config.filters.highPassHz = 80.0f;
    config.enhancement.targetGainDb = -3.0f;
    writer.ApplyConfig(config);
    ASSERT_TRUE(writer.Save(path));

    ConfigManager reader;
    ASSERT_TRUE(reader.Load(path));
    EXPECT_EQ(reader.GetConfigPath(), path);

    const AppConfig loaded = reader.GetConfig();
    EXPECT_EQ(loaded.quality, AudioQuality::SpaceSaving());
    EXPECT_TRUE(loaded.keepRawCapture);
    EXPECT_FLOAT_EQ(loaded.filters.highPassHz, 80.0f);
    EXPECT_FLOAT_EQ(loaded.enhancement.targetGainDb, -3.0f);
}

TEST(ConfigManagerTest, InvalidFileThrows) {
    test_utils::TempDir dir;
    const std::string path = dir.File("broken.json");
    {
        std::ofstream file(path);
        file << "{ \"quality\": ";
    }

    ConfigManager manager;
    EXPECT_THROW(manager.Load(path), ConfigException);
}

TEST(ConfigManagerTest, LoadDefaultsResets) {
    ConfigManager manager;
    manager.LoadFromString(R"({"keepRawCapture": true})");
    ASSERT_TRUE(manager.GetConfig().keepRawCapture);

    manager.LoadDefaults();
    EXPECT_FALSE(manager.GetConfig().keepRawCapture);
}

TEST(ConfigManagerTest, JsonUsesQualityNames) {
    AppConfig config;
    config.quality = AudioQuality::HighQuality();
    const nlohmann::json json = ToJson(config);

    EXPECT_EQ(json.at("quality").get<std::string>(), "HIGH_QUALITY");
    EXPECT_EQ(json.at("silenceTrim").at("minSilenceMs").get<unsigned int>(), 500u);
}
