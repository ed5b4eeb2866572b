#pragma once

#include "core/cancellation.hpp"
#include "core/processing_options.hpp"
#include "core/scoped_temp_dir.hpp"
#include "core/stage_result.hpp"
#include <string>

class MediaHandler;

/**
 * @brief Preview stage: a fixed-length clip from a representative window
 *
 * Sources shorter than the requested length are returned unchanged and the
 * artifact is marked no-op.
 */
class FrameSampler
{
public:
    /**
     * @brief Clip start for a source of source_seconds and a clip of clip_seconds
     * @param anchor_ratio Position of the window inside [0, L - D], clamped to [0, 1]
     * @return Start offset in [0, L - D]; 0 when the clip does not fit
     */
    static double computeStart(double source_seconds, double clip_seconds, double anchor_ratio);

    static StageResult run(MediaHandler &handler, const std::string &source, const JobParameters &params,
                           const ScopedTempDir &work_dir, CancellationToken &cancel);
};
