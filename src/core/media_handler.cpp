#include "core/media_handler.hpp"
#include "logging/logger.hpp"
#include <filesystem>

std::optional<double> MediaHandler::probeDuration(const std::string &)
{
    return std::nullopt;
}

StageResult MediaHandler::extractPreview(const std::string &source, double, double, const std::string &,
                                         CancellationToken &)
{
    return StageResult::noOp(source, "Preview not supported for " + MediaTypes::getKindName(kind()));
}

std::vector<cv::Mat> MediaHandler::extractFrames(const std::string &, const std::vector<double> &, CancellationToken &)
{
    return {};
}

StageResult MediaHandler::overlayWatermark(const std::string &input, const WatermarkStyle &, const std::string &,
                                           CancellationToken &)
{
    return StageResult::noOp(input, "Watermark not supported for " + MediaTypes::getKindName(kind()));
}

std::string MediaHandler::watermarkExtension(const std::string &input) const
{
    if (WatermarkRenderer::isImageFile(input))
        return std::filesystem::path(input).extension().string();
    return previewExtension();
}

StageResult PhotoHandler::overlayWatermark(const std::string &input, const WatermarkStyle &style,
                                           const std::string &output_path, CancellationToken &cancel)
{
    cancel.throwIfStopped("Photo watermark");
    return WatermarkRenderer::applyToImage(input, output_path, style);
}

MediaHandlerMap MediaHandlers::defaults()
{
    MediaHandlerMap handlers;
    handlers[MediaKind::VIDEO] = std::make_shared<VideoHandler>();
    handlers[MediaKind::PHOTO] = std::make_shared<PhotoHandler>();
    return handlers;
}

std::string PhotoHandler::watermarkExtension(const std::string &input) const
{
    if (WatermarkRenderer::isImageFile(input))
        return std::filesystem::path(input).extension().string();
    return ".jpg";
}
