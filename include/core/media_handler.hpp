#pragma once

#include "core/cancellation.hpp"
#include "core/media_types.hpp"
#include "core/stage_result.hpp"
#include "core/watermark_renderer.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Per-media-kind capability set used by the pipeline stages
 *
 * Capabilities a kind lacks keep the default implementations, which report a
 * no-op result (or no duration / no frames) instead of failing.
 */
class MediaHandler
{
public:
    virtual ~MediaHandler() = default;

    virtual MediaKind kind() const = 0;
    virtual bool supports(StageKind stage) const = 0;

    /**
     * @brief Source duration in seconds
     * @return std::nullopt if the source has no timeline or cannot be probed
     */
    virtual std::optional<double> probeDuration(const std::string &source);

    /**
     * @brief Write a clip [start, start + length) of the source to output_path
     */
    virtual StageResult extractPreview(const std::string &source, double start_seconds, double length_seconds,
                                       const std::string &output_path, CancellationToken &cancel);

    /**
     * @brief Decode one BGR frame per offset (seconds)
     *
     * Stops at the first offset that cannot be decoded, so a result shorter
     * than offsets means the remaining frames were not extractable.
     */
    virtual std::vector<cv::Mat> extractFrames(const std::string &source, const std::vector<double> &offsets,
                                               CancellationToken &cancel);

    virtual StageResult overlayWatermark(const std::string &input, const WatermarkStyle &style,
                                         const std::string &output_path, CancellationToken &cancel);

    // File extension (with dot) of the preview and watermark outputs
    virtual std::string previewExtension() const { return ".mp4"; }
    virtual std::string watermarkExtension(const std::string &input) const;
};

using MediaHandlerMap = std::map<MediaKind, std::shared_ptr<MediaHandler>>;

/**
 * @brief Video capability set: FFmpeg for probing, decoding and muxing,
 * OpenCV for frame rendering and encoding
 */
class VideoHandler : public MediaHandler
{
public:
    MediaKind kind() const override { return MediaKind::VIDEO; }
    bool supports(StageKind stage) const override;

    std::optional<double> probeDuration(const std::string &source) override;
    StageResult extractPreview(const std::string &source, double start_seconds, double length_seconds,
                               const std::string &output_path, CancellationToken &cancel) override;
    std::vector<cv::Mat> extractFrames(const std::string &source, const std::vector<double> &offsets,
                                       CancellationToken &cancel) override;
    StageResult overlayWatermark(const std::string &input, const WatermarkStyle &style,
                                 const std::string &output_path, CancellationToken &cancel) override;

private:
    /**
     * @brief Mux a video-only file with the source's audio segment (stream copy)
     * @param length_seconds Audio length to copy, <= 0 for all of it
     * @return false if no audio was muxed; error is empty when the source has no audio
     */
    bool muxWithSourceAudio(const std::string &video_only, const std::string &audio_source, double start_seconds,
                            double length_seconds, const std::string &output_path, std::string &error);
};

/**
 * @brief Photo capability set: watermark only (OpenCV image IO)
 */
class PhotoHandler : public MediaHandler
{
public:
    MediaKind kind() const override { return MediaKind::PHOTO; }
    bool supports(StageKind stage) const override { return stage == StageKind::WATERMARK; }

    StageResult overlayWatermark(const std::string &input, const WatermarkStyle &style,
                                 const std::string &output_path, CancellationToken &cancel) override;
    std::string watermarkExtension(const std::string &input) const override;
};

class MediaHandlers
{
public:
    // Video and photo handlers backed by FFmpeg and OpenCV
    static MediaHandlerMap defaults();
};
