#include "core/watermark_renderer.hpp"
#include "core/media_handler.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace
{
    const std::map<std::string, WatermarkAnchor> &anchorNames()
    {
        static const std::map<std::string, WatermarkAnchor> names = {
            {"top-left", WatermarkAnchor::TOP_LEFT},
            {"top-center", WatermarkAnchor::TOP_CENTER},
            {"top-right", WatermarkAnchor::TOP_RIGHT},
            {"center-left", WatermarkAnchor::CENTER_LEFT},
            {"center", WatermarkAnchor::CENTER},
            {"center-right", WatermarkAnchor::CENTER_RIGHT},
            {"bottom-left", WatermarkAnchor::BOTTOM_LEFT},
            {"bottom-center", WatermarkAnchor::BOTTOM_CENTER},
            {"bottom-right", WatermarkAnchor::BOTTOM_RIGHT}};
        return names;
    }

    const int FONT_FACE = cv::FONT_HERSHEY_SIMPLEX;

    std::string lowerExtension(const std::string &path)
    {
        std::string ext = std::filesystem::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return ext;
    }
}

std::optional<WatermarkAnchor> WatermarkRenderer::anchorFromString(const std::string &name)
{
    auto it = anchorNames().find(name);
    if (it == anchorNames().end())
        return std::nullopt;
    return it->second;
}

std::string WatermarkRenderer::getAnchorName(WatermarkAnchor anchor)
{
    for (const auto &[name, value] : anchorNames())
    {
        if (value == anchor)
            return name;
    }
    return "bottom-right";
}

bool WatermarkRenderer::isValidOpacity(double opacity)
{
    return opacity >= MIN_OPACITY && opacity <= MAX_OPACITY;
}

double WatermarkRenderer::fontScaleFor(int frame_height)
{
    return frame_height / 1000.0;
}

int WatermarkRenderer::thicknessFor(int frame_height)
{
    return std::max(1, frame_height / 400);
}

cv::Point WatermarkRenderer::computeTextOrigin(const cv::Size &frame, const cv::Size &text, int baseline, WatermarkAnchor anchor)
{
    int left = MARGIN_PX;
    int center_x = (frame.width - text.width) / 2;
    int right = frame.width - text.width - MARGIN_PX;

    int top = MARGIN_PX + text.height;
    int center_y = (frame.height + text.height) / 2;
    int bottom = frame.height - MARGIN_PX - baseline;

    int x = left;
    int y = bottom;
    switch (anchor)
    {
    case WatermarkAnchor::TOP_LEFT:
        x = left, y = top;
        break;
    case WatermarkAnchor::TOP_CENTER:
        x = center_x, y = top;
        break;
    case WatermarkAnchor::TOP_RIGHT:
        x = right, y = top;
        break;
    case WatermarkAnchor::CENTER_LEFT:
        x = left, y = center_y;
        break;
    case WatermarkAnchor::CENTER:
        x = center_x, y = center_y;
        break;
    case WatermarkAnchor::CENTER_RIGHT:
        x = right, y = center_y;
        break;
    case WatermarkAnchor::BOTTOM_LEFT:
        x = left, y = bottom;
        break;
    case WatermarkAnchor::BOTTOM_CENTER:
        x = center_x, y = bottom;
        break;
    case WatermarkAnchor::BOTTOM_RIGHT:
        x = right, y = bottom;
        break;
    }

    // Text wider than the frame still starts inside it
    return cv::Point(std::max(0, x), std::max(0, y));
}

void WatermarkRenderer::renderOnto(cv::Mat &frame, const WatermarkStyle &style)
{
    if (frame.empty() || style.text.empty())
        return;

    double scale = fontScaleFor(frame.rows);
    int thickness = thicknessFor(frame.rows);
    int outline = thickness + 2;

    int baseline = 0;
    cv::Size text_size = cv::getTextSize(style.text, FONT_FACE, scale, outline, &baseline);
    cv::Point origin = computeTextOrigin(frame.size(), text_size, baseline, style.anchor);

    cv::Mat overlay = frame.clone();
    cv::putText(overlay, style.text, origin, FONT_FACE, scale, cv::Scalar(0, 0, 0), outline, cv::LINE_AA);
    cv::putText(overlay, style.text, origin, FONT_FACE, scale, cv::Scalar(255, 255, 255), thickness, cv::LINE_AA);

    double alpha = std::clamp(style.opacity, MIN_OPACITY, MAX_OPACITY);
    cv::addWeighted(overlay, alpha, frame, 1.0 - alpha, 0.0, frame);
}

StageResult WatermarkRenderer::applyToImage(const std::string &input, const std::string &output, const WatermarkStyle &style)
{
    try
    {
        cv::Mat image = cv::imread(input, cv::IMREAD_COLOR);
        if (image.empty())
        {
            return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not read image: " + input);
        }

        renderOnto(image, style);

        std::vector<int> params;
        std::string ext = lowerExtension(output);
        if (ext == ".jpg" || ext == ".jpeg")
            params = {cv::IMWRITE_JPEG_QUALITY, 95};

        if (!cv::imwrite(output, image, params))
        {
            return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not write watermarked image: " + output);
        }

        nlohmann::json meta;
        meta["width"] = image.cols;
        meta["height"] = image.rows;
        meta["anchor"] = getAnchorName(style.anchor);
        meta["opacity"] = style.opacity;
        return StageResult::done(output, meta.dump());
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during image watermarking: " + std::string(e.what()));
        return StageResult::failed(ErrorCode::STAGE_FAILED, "OpenCV processing error: " + std::string(e.what()));
    }
}

bool WatermarkRenderer::isImageFile(const std::string &path)
{
    std::string ext = lowerExtension(path);
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".bmp" || ext == ".webp";
}

StageResult WatermarkRenderer::run(MediaHandler &handler, const std::string &input, const WatermarkStyle &style,
                                   const ScopedTempDir &work_dir, CancellationToken &cancel)
{
    if (!handler.supports(StageKind::WATERMARK))
    {
        return StageResult::noOp(input, "Watermark not supported for " + MediaTypes::getKindName(handler.kind()));
    }

    std::string output = work_dir.file("watermark" + handler.watermarkExtension(input)).string();
    Logger::debug("Watermarking " + input + " at " + getAnchorName(style.anchor));
    return handler.overlayWatermark(input, style, output, cancel);
}
