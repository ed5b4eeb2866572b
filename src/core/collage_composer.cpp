#include "core/collage_composer.hpp"
#include "core/media_handler.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

std::optional<CollageGrid> CollageComposer::gridFor(int frame_count)
{
    switch (frame_count)
    {
    case 4:
        return CollageGrid{2, 2};
    case 6:
        return CollageGrid{3, 2};
    case 9:
        return CollageGrid{3, 3};
    case 12:
        return CollageGrid{4, 3};
    default:
        return std::nullopt;
    }
}

std::vector<double> CollageComposer::sampleOffsets(double source_seconds, int frame_count)
{
    std::vector<double> offsets;
    if (frame_count <= 0)
        return offsets;
    offsets.reserve(frame_count);
    for (int i = 0; i < frame_count; ++i)
    {
        offsets.push_back(i * source_seconds / frame_count);
    }
    return offsets;
}

cv::Mat CollageComposer::compose(const std::vector<cv::Mat> &frames, const CollageGrid &grid, const cv::Size &cell)
{
    size_t cells = static_cast<size_t>(grid.columns * grid.rows);
    if (frames.size() < cells)
    {
        throw DeepLinkError(ErrorCode::INSUFFICIENT_FRAMES,
                            "Collage needs " + std::to_string(cells) + " frames, got " + std::to_string(frames.size()));
    }

    cv::Mat canvas(cell.height * grid.rows, cell.width * grid.columns, CV_8UC3, cv::Scalar(0, 0, 0));
    for (size_t i = 0; i < cells; ++i)
    {
        const cv::Mat &frame = frames[i];
        if (frame.empty())
        {
            throw DeepLinkError(ErrorCode::INSUFFICIENT_FRAMES, "Frame " + std::to_string(i) + " is empty");
        }

        cv::Mat bgr;
        if (frame.channels() == 1)
            cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
        else if (frame.channels() == 4)
            cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
        else
            bgr = frame;

        int col = static_cast<int>(i) % grid.columns;
        int row = static_cast<int>(i) / grid.columns;
        cv::Mat target = canvas(cv::Rect(col * cell.width, row * cell.height, cell.width, cell.height));
        cv::resize(bgr, target, cell, 0, 0, cv::INTER_AREA);
    }
    return canvas;
}

StageResult CollageComposer::run(MediaHandler &handler, const std::string &source, const JobParameters &params,
                                 const ScopedTempDir &work_dir, CancellationToken &cancel)
{
    if (!handler.supports(StageKind::COLLAGE))
    {
        return StageResult::noOp(source, "Collage not supported for " + MediaTypes::getKindName(handler.kind()));
    }

    auto grid = gridFor(params.collage_frames);
    if (!grid)
    {
        return StageResult::failed(ErrorCode::VALIDATION_ERROR,
                                   "Unsupported collage frame count: " + std::to_string(params.collage_frames));
    }

    auto duration = handler.probeDuration(source);
    if (!duration || *duration <= 0.0)
    {
        return StageResult::failed(ErrorCode::INSUFFICIENT_FRAMES, "Could not determine duration of " + source);
    }

    auto offsets = sampleOffsets(*duration, params.collage_frames);
    auto frames = handler.extractFrames(source, offsets, cancel);
    cancel.throwIfStopped("Collage");

    try
    {
        cv::Size cell(params.collage_cell_width, params.collage_cell_height);
        cv::Mat canvas = compose(frames, *grid, cell);

        std::string output = work_dir.file("collage.jpg").string();
        if (!cv::imwrite(output, canvas, {cv::IMWRITE_JPEG_QUALITY, params.collage_quality}))
        {
            return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not write collage: " + output);
        }

        nlohmann::json meta;
        meta["frames"] = params.collage_frames;
        meta["columns"] = grid->columns;
        meta["rows"] = grid->rows;
        meta["cell_width"] = cell.width;
        meta["cell_height"] = cell.height;
        meta["offsets"] = offsets;
        Logger::debug("Composed " + std::to_string(grid->columns) + "x" + std::to_string(grid->rows) + " collage for " + source);
        return StageResult::done(output, meta.dump());
    }
    catch (const DeepLinkError &e)
    {
        return StageResult::failed(e.code(), e.what());
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during collage composition: " + std::string(e.what()));
        return StageResult::failed(ErrorCode::STAGE_FAILED, "OpenCV processing error: " + std::string(e.what()));
    }
}
