#include "test_base.hpp"
#include "core/deeplink_config.hpp"
#include <algorithm>
#include <fstream>

class DeepLinkConfigTest : public TestBase
{
};

TEST_F(DeepLinkConfigTest, DefaultsWithoutFile)
{
    DeepLinkConfig config;
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_TRUE(config.getPreviewEnabled());
    EXPECT_DOUBLE_EQ(config.getPreviewLengthSeconds(), 3.0);
    EXPECT_EQ(config.getCollageFrames(), 4);
    EXPECT_FALSE(config.getWatermarkEnabled());
    EXPECT_EQ(config.getWatermarkPosition(), "bottom-right");
    EXPECT_TRUE(config.getContentProtection());
    EXPECT_FALSE(config.getPreferCollage());
    EXPECT_EQ(config.getTransferConcurrency(), 8);
    EXPECT_EQ(config.getMaxRetries(), 3);
    EXPECT_EQ(config.getChunkSizeBytes(), 1048576u);
}

TEST_F(DeepLinkConfigTest, LoadsNestedJsonFile)
{
    std::string path = createDummyFile("deeplink.json", R"({
        "log_level": "DEBUG",
        "preview": {"length_seconds": 5.5, "enabled": false},
        "collage": {"frames": 9},
        "limits": {"max_video_bytes": 4294967296},
        "transfer": {"concurrency": 3}
    })");

    DeepLinkConfig config;
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_FALSE(config.getPreviewEnabled());
    EXPECT_DOUBLE_EQ(config.getPreviewLengthSeconds(), 5.5);
    EXPECT_EQ(config.getCollageFrames(), 9);
    EXPECT_EQ(config.getMaxVideoBytes(), 4294967296ULL);
    EXPECT_EQ(config.getTransferConcurrency(), 3);
    EXPECT_EQ(config.getWorkerThreads(), 3);
}

TEST_F(DeepLinkConfigTest, UnreadableOrInvalidFileKeepsDefaults)
{
    DeepLinkConfig config;
    EXPECT_FALSE(config.load((testRoot() / "absent.json").string()));
    EXPECT_FALSE(config.load(createDummyFile("broken.json", "{ not json")));
    EXPECT_EQ(config.getCollageFrames(), 4);
}

TEST_F(DeepLinkConfigTest, OverlayAppliesPersistedRecords)
{
    DeepLinkConfig config;
    std::map<std::string, std::string> records = {
        {"watermark.text", "\"(c) studio\""},
        {"watermark.opacity", "0.8"},
        {"delivery.prefer_collage", "true"},
        {"no.such.key", "1"}};

    EXPECT_EQ(config.overlay(records), 3u);
    EXPECT_EQ(config.getWatermarkText(), "(c) studio");
    EXPECT_DOUBLE_EQ(config.getWatermarkOpacity(), 0.8);
    EXPECT_TRUE(config.getPreferCollage());
}

TEST_F(DeepLinkConfigTest, SetValueRejectsUnknownKeys)
{
    DeepLinkConfig config;
    EXPECT_FALSE(config.setValue("preview.colour", "\"red\""));
    EXPECT_TRUE(config.setValue("preview.length_seconds", "7"));
    EXPECT_DOUBLE_EQ(config.getPreviewLengthSeconds(), 7.0);
}

TEST_F(DeepLinkConfigTest, OutOfRangeValuesAreClamped)
{
    DeepLinkConfig config;
    config.update({{"preview", {{"anchor_ratio", 3.0}}}, {"collage", {{"quality", 400}}}, {"transfer", {{"concurrency", 0}}}});
    EXPECT_DOUBLE_EQ(config.getPreviewAnchorRatio(), 1.0);
    EXPECT_EQ(config.getCollageQuality(), 100);
    EXPECT_EQ(config.getTransferConcurrency(), 1);
}

TEST_F(DeepLinkConfigTest, RetryCountIsBounded)
{
    DeepLinkConfig config;
    config.update({{"transfer", {{"max_retries", 1000}}}});
    EXPECT_EQ(config.getMaxRetries(), TransferLimits::MAX_RETRIES);

    config.update({{"transfer", {{"max_retries", -4}}}});
    EXPECT_EQ(config.getMaxRetries(), 0);
}

TEST_F(DeepLinkConfigTest, SaveThenLoadKeepsValues)
{
    DeepLinkConfig config;
    config.update({{"watermark", {{"text", "saved"}, {"enabled", true}}}});
    std::string path = (testRoot() / "saved.json").string();
    ASSERT_TRUE(config.save(path));

    DeepLinkConfig reloaded;
    ASSERT_TRUE(reloaded.load(path));
    EXPECT_EQ(reloaded.getWatermarkText(), "saved");
    EXPECT_TRUE(reloaded.getWatermarkEnabled());
}

TEST_F(DeepLinkConfigTest, ShippedConfigCoversEveryKnownKey)
{
    // Tests run from the source tree
    DeepLinkConfig config;
    ASSERT_TRUE(config.load("config/deeplink.json"));

    nlohmann::json all = config.getAll();
    for (const auto &key : DeepLinkConfig::knownKeys())
    {
        std::string pointer = "/" + key;
        std::replace(pointer.begin(), pointer.end(), '.', '/');
        EXPECT_TRUE(all.contains(nlohmann::json::json_pointer(pointer))) << key;
    }
}
