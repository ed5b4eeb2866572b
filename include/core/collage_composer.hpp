#pragma once

#include "core/cancellation.hpp"
#include "core/processing_options.hpp"
#include "core/scoped_temp_dir.hpp"
#include "core/stage_result.hpp"
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

class MediaHandler;

struct CollageGrid
{
    int columns;
    int rows;
};

/**
 * @brief Collage stage: N evenly spaced frames composed into a JPEG grid
 */
class CollageComposer
{
public:
    // 4 -> 2x2, 6 -> 3x2, 9 -> 3x3, 12 -> 4x3
    static std::optional<CollageGrid> gridFor(int frame_count);

    // Offsets i * L / N for i in [0, N)
    static std::vector<double> sampleOffsets(double source_seconds, int frame_count);

    /**
     * @brief Resize every frame to cell and tile them row-major
     * @throws DeepLinkError INSUFFICIENT_FRAMES if frames do not fill the grid
     */
    static cv::Mat compose(const std::vector<cv::Mat> &frames, const CollageGrid &grid, const cv::Size &cell);

    static StageResult run(MediaHandler &handler, const std::string &source, const JobParameters &params,
                           const ScopedTempDir &work_dir, CancellationToken &cancel);
};
