#include "core/deeplink_config.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

DeepLinkConfig::DeepLinkConfig()
{
    cfg_ = new JSONConfiguration();
}

bool DeepLinkConfig::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Configuration file not readable: " + path + ", using defaults");
        return false;
    }

    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration " + path + ": " + e.displayText());
        return false;
    }

    Logger::info("Loaded configuration from " + path);
    return true;
}

bool DeepLinkConfig::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

void DeepLinkConfig::update(const nlohmann::json &patch)
{
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            applyValue(prefix, node);
        }
    };
    apply("", patch);
}

size_t DeepLinkConfig::overlay(const std::map<std::string, std::string> &records)
{
    size_t applied = 0;
    for (const auto &[key, value] : records)
    {
        if (setValue(key, value))
            applied++;
    }
    if (applied > 0)
        Logger::info("Applied " + std::to_string(applied) + " persisted configuration records");
    return applied;
}

bool DeepLinkConfig::setValue(const std::string &key, const std::string &json_value)
{
    const auto &keys = knownKeys();
    if (std::find(keys.begin(), keys.end(), key) == keys.end())
    {
        Logger::warn("Ignoring unknown configuration key: " + key);
        return false;
    }

    nlohmann::json value = nlohmann::json::parse(json_value, nullptr, false);
    if (value.is_discarded())
    {
        // Bare strings are stored unquoted by older records
        value = json_value;
    }
    applyValue(key, value);
    return true;
}

void DeepLinkConfig::applyValue(const std::string &key, const nlohmann::json &value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (value.is_boolean())
        cfg_->setBool(key, value.get<bool>());
    else if (value.is_number_integer())
        cfg_->setInt64(key, value.get<int64_t>());
    else if (value.is_number_float())
        cfg_->setDouble(key, value.get<double>());
    else if (value.is_string())
        cfg_->setString(key, value.get<std::string>());
    else
        cfg_->setString(key, value.dump());
}

nlohmann::json DeepLinkConfig::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str(), nullptr, false);
}

const std::vector<std::string> &DeepLinkConfig::knownKeys()
{
    static const std::vector<std::string> keys = {
        "log_level",
        "database.path",
        "storage.artifact_dir",
        "storage.temp_dir",
        "preview.enabled",
        "preview.length_seconds",
        "preview.anchor_ratio",
        "collage.enabled",
        "collage.frames",
        "collage.quality",
        "collage.cell_width",
        "collage.cell_height",
        "watermark.enabled",
        "watermark.text",
        "watermark.position",
        "watermark.opacity",
        "watermark.target",
        "content_protection",
        "delivery.prefer_collage",
        "limits.max_video_bytes",
        "limits.max_photo_bytes",
        "pipeline.worker_threads",
        "pipeline.max_queue_depth",
        "pipeline.stage_timeout_seconds",
        "transfer.concurrency",
        "transfer.chunk_size_bytes",
        "transfer.max_retries",
        "transfer.retry_base_delay_ms",
        "transfer.chunk_timeout_ms",
        "transfer.session_timeout_seconds"};
    return keys;
}

std::string DeepLinkConfig::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int DeepLinkConfig::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

int64_t DeepLinkConfig::getInt64(const std::string &key, int64_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt64(key, def);
}

double DeepLinkConfig::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

bool DeepLinkConfig::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

std::string DeepLinkConfig::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string DeepLinkConfig::getDatabasePath() const
{
    return getString("database.path", "deeplink.db");
}

std::string DeepLinkConfig::getArtifactDir() const
{
    return getString("storage.artifact_dir", "artifacts");
}

std::string DeepLinkConfig::getTempDir() const
{
    return getString("storage.temp_dir", (std::filesystem::temp_directory_path() / "deeplink_work").string());
}

bool DeepLinkConfig::getPreviewEnabled() const
{
    return getBool("preview.enabled", true);
}

double DeepLinkConfig::getPreviewLengthSeconds() const
{
    return getDouble("preview.length_seconds", 3.0);
}

double DeepLinkConfig::getPreviewAnchorRatio() const
{
    return std::clamp(getDouble("preview.anchor_ratio", 0.5), 0.0, 1.0);
}

bool DeepLinkConfig::getCollageEnabled() const
{
    return getBool("collage.enabled", true);
}

int DeepLinkConfig::getCollageFrames() const
{
    return getInt("collage.frames", 4);
}

int DeepLinkConfig::getCollageQuality() const
{
    return std::clamp(getInt("collage.quality", 85), 1, 100);
}

int DeepLinkConfig::getCollageCellWidth() const
{
    return std::max(16, getInt("collage.cell_width", 640));
}

int DeepLinkConfig::getCollageCellHeight() const
{
    return std::max(16, getInt("collage.cell_height", 480));
}

bool DeepLinkConfig::getWatermarkEnabled() const
{
    return getBool("watermark.enabled", false);
}

std::string DeepLinkConfig::getWatermarkText() const
{
    return getString("watermark.text", "");
}

std::string DeepLinkConfig::getWatermarkPosition() const
{
    return getString("watermark.position", "bottom-right");
}

double DeepLinkConfig::getWatermarkOpacity() const
{
    return getDouble("watermark.opacity", 0.5);
}

std::string DeepLinkConfig::getWatermarkTarget() const
{
    return getString("watermark.target", "raw");
}

bool DeepLinkConfig::getContentProtection() const
{
    return getBool("content_protection", true);
}

bool DeepLinkConfig::getPreferCollage() const
{
    return getBool("delivery.prefer_collage", false);
}

uint64_t DeepLinkConfig::getMaxVideoBytes() const
{
    return static_cast<uint64_t>(std::max<int64_t>(0, getInt64("limits.max_video_bytes", 2147483648LL)));
}

uint64_t DeepLinkConfig::getMaxPhotoBytes() const
{
    return static_cast<uint64_t>(std::max<int64_t>(0, getInt64("limits.max_photo_bytes", 20971520LL)));
}

int DeepLinkConfig::getWorkerThreads() const
{
    return std::clamp(getInt("pipeline.worker_threads", getTransferConcurrency()), 1, 64);
}

int DeepLinkConfig::getMaxQueueDepth() const
{
    return std::max(1, getInt("pipeline.max_queue_depth", 64));
}

int DeepLinkConfig::getStageTimeoutSeconds() const
{
    return std::max(1, getInt("pipeline.stage_timeout_seconds", 600));
}

int DeepLinkConfig::getTransferConcurrency() const
{
    return std::clamp(getInt("transfer.concurrency", 8), 1, 64);
}

uint64_t DeepLinkConfig::getChunkSizeBytes() const
{
    return static_cast<uint64_t>(std::max<int64_t>(1, getInt64("transfer.chunk_size_bytes", 1048576LL)));
}

int DeepLinkConfig::getMaxRetries() const
{
    return std::clamp(getInt("transfer.max_retries", 3), 0, TransferLimits::MAX_RETRIES);
}

int DeepLinkConfig::getRetryBaseDelayMs() const
{
    return std::max(0, getInt("transfer.retry_base_delay_ms", 100));
}

int DeepLinkConfig::getChunkTimeoutMs() const
{
    return std::max(1, getInt("transfer.chunk_timeout_ms", 60000));
}

int DeepLinkConfig::getSessionTimeoutSeconds() const
{
    return std::max(1, getInt("transfer.session_timeout_seconds", 900));
}
