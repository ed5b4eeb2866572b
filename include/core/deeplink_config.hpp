#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct TransferLimits
{
    // Upper bound for transfer.max_retries; keeps the backoff exponent small
    static constexpr int MAX_RETRIES = 16;
};

/**
 * @brief Load-once configuration shared by reference with every component
 *
 * Values come from a JSON file (Poco JSONConfiguration), overlaid with the
 * config records persisted in the token registry. Missing keys fall back to
 * the built-in defaults of each getter.
 */
class DeepLinkConfig
{
public:
    DeepLinkConfig();
    DeepLinkConfig(const DeepLinkConfig &) = delete;
    DeepLinkConfig &operator=(const DeepLinkConfig &) = delete;

    /**
     * @brief Load a JSON configuration file, replacing the current values
     * @return false if the file cannot be read or parsed
     */
    bool load(const std::string &path);

    bool save(const std::string &path) const;

    /**
     * @brief Apply a nested JSON patch, e.g. {"preview": {"length_seconds": 5}}
     */
    void update(const nlohmann::json &patch);

    /**
     * @brief Apply persisted records (dotted key -> JSON encoded value)
     * @return Number of records applied
     */
    size_t overlay(const std::map<std::string, std::string> &records);

    /**
     * @brief Set a single dotted key from a JSON encoded value
     * @return false if the key is unknown or the value does not parse
     */
    bool setValue(const std::string &key, const std::string &json_value);

    nlohmann::json getAll() const;

    static const std::vector<std::string> &knownKeys();

    // General
    std::string getLogLevel() const;
    std::string getDatabasePath() const;
    std::string getArtifactDir() const;
    std::string getTempDir() const;

    // Preview
    bool getPreviewEnabled() const;
    double getPreviewLengthSeconds() const;
    double getPreviewAnchorRatio() const;

    // Collage
    bool getCollageEnabled() const;
    int getCollageFrames() const;
    int getCollageQuality() const;
    int getCollageCellWidth() const;
    int getCollageCellHeight() const;

    // Watermark
    bool getWatermarkEnabled() const;
    std::string getWatermarkText() const;
    std::string getWatermarkPosition() const;
    double getWatermarkOpacity() const;
    std::string getWatermarkTarget() const;

    // Delivery
    bool getContentProtection() const;
    bool getPreferCollage() const;

    // Limits
    uint64_t getMaxVideoBytes() const;
    uint64_t getMaxPhotoBytes() const;

    // Pipeline
    int getWorkerThreads() const;
    int getMaxQueueDepth() const;
    int getStageTimeoutSeconds() const;

    // Transfer
    int getTransferConcurrency() const;
    uint64_t getChunkSizeBytes() const;
    int getMaxRetries() const; // Clamped to [0, TransferLimits::MAX_RETRIES]
    int getRetryBaseDelayMs() const;
    int getChunkTimeoutMs() const;
    int getSessionTimeoutSeconds() const;

private:
    void applyValue(const std::string &key, const nlohmann::json &value);

    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    int64_t getInt64(const std::string &key, int64_t def) const;
    double getDouble(const std::string &key, double def) const;
    bool getBool(const std::string &key, bool def) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
