#pragma once

#include "core/deeplink_config.hpp"
#include "core/media_types.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Per-upload overrides; unset fields fall back to DeepLinkConfig
 */
struct ProcessingOptions
{
    std::optional<bool> generate_preview;
    std::optional<bool> generate_collage;
    std::optional<bool> apply_watermark;
    std::optional<bool> content_protection;

    std::optional<double> preview_length_seconds;
    std::optional<int> collage_frames;
    std::optional<std::string> watermark_text;
    std::optional<std::string> watermark_position;
    std::optional<double> watermark_opacity;
    std::optional<std::string> watermark_target; // "raw", "preview" or "collage"
};

/**
 * @brief Effective job parameters after applying overrides to the defaults
 */
struct JobParameters
{
    double preview_length_seconds = 3.0;
    double preview_anchor_ratio = 0.5;
    int collage_frames = 4;
    int collage_quality = 85;
    int collage_cell_width = 640;
    int collage_cell_height = 480;
    std::string watermark_text;
    std::string watermark_position = "bottom-right";
    double watermark_opacity = 0.5;
    std::string watermark_target = "raw";
    int stage_timeout_seconds = 600;
};

struct ResolvedOptions
{
    std::vector<StageKind> stages; // In scheduling order
    bool content_protection = true;
    JobParameters params;
};

class OptionResolver
{
public:
    /**
     * @brief Merge per-upload options with configured defaults
     * @throws DeepLinkError VALIDATION_ERROR on an out-of-range value
     */
    static ResolvedOptions resolve(const ProcessingOptions &options, const DeepLinkConfig &config);

    static bool isValidCollageFrameCount(int frames);
    static bool isValidWatermarkTarget(const std::string &target);
};
