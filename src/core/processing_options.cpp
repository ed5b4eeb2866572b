#include "core/processing_options.hpp"
#include "core/errors.hpp"
#include "core/watermark_renderer.hpp"

bool OptionResolver::isValidCollageFrameCount(int frames)
{
    return frames == 4 || frames == 6 || frames == 9 || frames == 12;
}

bool OptionResolver::isValidWatermarkTarget(const std::string &target)
{
    return target == "raw" || target == "preview" || target == "collage";
}

ResolvedOptions OptionResolver::resolve(const ProcessingOptions &options, const DeepLinkConfig &config)
{
    ResolvedOptions resolved;
    JobParameters &p = resolved.params;

    p.preview_length_seconds = options.preview_length_seconds.value_or(config.getPreviewLengthSeconds());
    p.preview_anchor_ratio = config.getPreviewAnchorRatio();
    p.collage_frames = options.collage_frames.value_or(config.getCollageFrames());
    p.collage_quality = config.getCollageQuality();
    p.collage_cell_width = config.getCollageCellWidth();
    p.collage_cell_height = config.getCollageCellHeight();
    p.watermark_text = options.watermark_text.value_or(config.getWatermarkText());
    p.watermark_position = options.watermark_position.value_or(config.getWatermarkPosition());
    p.watermark_opacity = options.watermark_opacity.value_or(config.getWatermarkOpacity());
    p.watermark_target = options.watermark_target.value_or(config.getWatermarkTarget());
    p.stage_timeout_seconds = config.getStageTimeoutSeconds();

    resolved.content_protection = options.content_protection.value_or(config.getContentProtection());

    bool preview = options.generate_preview.value_or(config.getPreviewEnabled());
    bool collage = options.generate_collage.value_or(config.getCollageEnabled());
    bool watermark = options.apply_watermark.value_or(config.getWatermarkEnabled());

    if (preview)
    {
        if (!(p.preview_length_seconds > 0.0))
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR,
                                "Preview length must be positive: " + std::to_string(p.preview_length_seconds));
        resolved.stages.push_back(StageKind::PREVIEW);
    }

    if (collage)
    {
        if (!isValidCollageFrameCount(p.collage_frames))
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR,
                                "Collage frame count must be one of 4, 6, 9, 12: " + std::to_string(p.collage_frames));
        resolved.stages.push_back(StageKind::COLLAGE);
    }

    if (watermark)
    {
        if (p.watermark_text.empty())
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Watermark requested without text");
        if (!WatermarkRenderer::isValidOpacity(p.watermark_opacity))
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR,
                                "Watermark opacity must be within [0.1, 1.0]: " + std::to_string(p.watermark_opacity));
        if (!WatermarkRenderer::anchorFromString(p.watermark_position))
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Unknown watermark position: " + p.watermark_position);
        if (!isValidWatermarkTarget(p.watermark_target))
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Unknown watermark target: " + p.watermark_target);
        resolved.stages.push_back(StageKind::WATERMARK);
    }

    return resolved;
}
