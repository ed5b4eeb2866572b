#include "core/frame_sampler.hpp"
#include "core/media_handler.hpp"
#include "logging/logger.hpp"
#include <algorithm>

double FrameSampler::computeStart(double source_seconds, double clip_seconds, double anchor_ratio)
{
    if (source_seconds <= clip_seconds)
        return 0.0;
    return (source_seconds - clip_seconds) * std::clamp(anchor_ratio, 0.0, 1.0);
}

StageResult FrameSampler::run(MediaHandler &handler, const std::string &source, const JobParameters &params,
                              const ScopedTempDir &work_dir, CancellationToken &cancel)
{
    if (!handler.supports(StageKind::PREVIEW))
    {
        return StageResult::noOp(source, "Preview not supported for " + MediaTypes::getKindName(handler.kind()));
    }

    auto duration = handler.probeDuration(source);
    if (!duration)
    {
        return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not determine duration of " + source);
    }

    double length = params.preview_length_seconds;
    if (*duration < length)
    {
        Logger::info("Source shorter than preview (" + std::to_string(*duration) + "s < " + std::to_string(length) +
                     "s), keeping original");
        return StageResult::noOp(source, "Source shorter than requested preview length");
    }

    cancel.throwIfStopped("Preview");

    double start = computeStart(*duration, length, params.preview_anchor_ratio);
    std::string output = work_dir.file("preview" + handler.previewExtension()).string();
    Logger::debug("Preview window " + std::to_string(start) + "s + " + std::to_string(length) + "s of " +
                  std::to_string(*duration) + "s");
    return handler.extractPreview(source, start, length, output, cancel);
}
