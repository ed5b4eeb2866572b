#pragma once

#include "core/cancellation.hpp"
#include "core/scoped_temp_dir.hpp"
#include "core/stage_result.hpp"
#include <optional>
#include <string>
#include <opencv2/core.hpp>

class MediaHandler;

enum class WatermarkAnchor
{
    TOP_LEFT,
    TOP_CENTER,
    TOP_RIGHT,
    CENTER_LEFT,
    CENTER,
    CENTER_RIGHT,
    BOTTOM_LEFT,
    BOTTOM_CENTER,
    BOTTOM_RIGHT
};

struct WatermarkStyle
{
    std::string text;
    WatermarkAnchor anchor = WatermarkAnchor::BOTTOM_RIGHT;
    double opacity = 0.5;
};

/**
 * @brief Text watermark overlay (outlined white text blended at an anchor)
 *
 * Drawing never changes frame size or aspect ratio.
 */
class WatermarkRenderer
{
public:
    static constexpr int MARGIN_PX = 20;
    static constexpr double MIN_OPACITY = 0.1;
    static constexpr double MAX_OPACITY = 1.0;

    static std::optional<WatermarkAnchor> anchorFromString(const std::string &name);
    static std::string getAnchorName(WatermarkAnchor anchor);
    static bool isValidOpacity(double opacity);

    static double fontScaleFor(int frame_height);
    static int thicknessFor(int frame_height);

    /**
     * @brief Baseline-left origin for cv::putText
     * @param frame Frame size
     * @param text Text box size from cv::getTextSize
     * @param baseline Baseline offset from cv::getTextSize
     */
    static cv::Point computeTextOrigin(const cv::Size &frame, const cv::Size &text, int baseline, WatermarkAnchor anchor);

    /**
     * @brief Draw the watermark into an 8-bit BGR frame in place
     */
    static void renderOnto(cv::Mat &frame, const WatermarkStyle &style);

    /**
     * @brief Watermark a still image file
     * @return done with the written file, or failed(STAGE_FAILED)
     */
    static StageResult applyToImage(const std::string &input, const std::string &output, const WatermarkStyle &style);

    static bool isImageFile(const std::string &path);

    /**
     * @brief Watermark stage: overlay onto input through the kind's handler
     *
     * The output is written inside work_dir; the caller moves it to storage.
     */
    static StageResult run(MediaHandler &handler, const std::string &input, const WatermarkStyle &style,
                           const ScopedTempDir &work_dir, CancellationToken &cancel);
};
