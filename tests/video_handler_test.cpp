#include "test_base.hpp"
#include "core/errors.hpp"
#include "core/media_handler.hpp"
#include "core/watermark_renderer.hpp"
#include <cmath>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

namespace fs = std::filesystem;

/**
 * @brief Runs the FFmpeg/OpenCV video handler against short synthetic clips
 *
 * Clips are written with cv::VideoWriter (mp4v, no audio track) so the tests
 * need no fixture files.
 */
class VideoHandlerTest : public TestBase
{
protected:
    static constexpr double FPS = 25.0;
    static constexpr int WIDTH = 160;
    static constexpr int HEIGHT = 120;

    std::string writeClip(const std::string &name, double seconds)
    {
        std::string path = (testRoot() / "files" / name).string();
        cv::VideoWriter writer(path, cv::VideoWriter::fourcc('m', 'p', '4', 'v'), FPS, cv::Size(WIDTH, HEIGHT));
        EXPECT_TRUE(writer.isOpened()) << path;

        int frames = static_cast<int>(std::llround(seconds * FPS));
        for (int i = 0; i < frames; ++i)
        {
            cv::Mat frame(HEIGHT, WIDTH, CV_8UC3, cv::Scalar(40, (i * 5) % 255, 200));
            cv::rectangle(frame, cv::Rect((i * 3) % (WIDTH - 20), 40, 20, 20), cv::Scalar(255, 255, 255), cv::FILLED);
            writer.write(frame);
        }
        writer.release();
        return path;
    }

    std::string outputPath(const std::string &name)
    {
        fs::path dir = testRoot() / "out";
        fs::create_directories(dir);
        return (dir / name).string();
    }

    static int countFrames(const std::string &path, int &width, int &height)
    {
        cv::VideoCapture capture(path, cv::CAP_FFMPEG);
        if (!capture.isOpened())
            return -1;
        width = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_WIDTH));
        height = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_HEIGHT));

        int frames = 0;
        cv::Mat frame;
        while (capture.read(frame))
            ++frames;
        return frames;
    }

    VideoHandler handler_;
    CancellationToken cancel_;
};

TEST_F(VideoHandlerTest, DurationMatchesClipLength)
{
    std::string clip = writeClip("duration.mp4", 4.0);

    auto duration = handler_.probeDuration(clip);
    ASSERT_TRUE(duration.has_value());
    EXPECT_NEAR(*duration, 4.0, 0.2);

    EXPECT_FALSE(handler_.probeDuration(createDummyFile("not_a_video.mp4", "garbage")).has_value());
}

TEST_F(VideoHandlerTest, PreviewHasRoundedFrameCount)
{
    std::string clip = writeClip("clip.mp4", 4.0);
    std::string output = outputPath("preview.mp4");

    StageResult result = handler_.extractPreview(clip, 1.0, 1.5, output, cancel_);
    ASSERT_EQ(result.status, ArtifactStatus::DONE) << result.error_message;
    EXPECT_EQ(result.output_path, output);

    const int expected = static_cast<int>(std::llround(1.5 * FPS));
    auto meta = nlohmann::json::parse(result.metadata);
    EXPECT_EQ(meta["frames"].get<int>(), expected);
    EXPECT_FALSE(meta["audio"].get<bool>());

    int width = 0;
    int height = 0;
    EXPECT_EQ(countFrames(output, width, height), expected);
    EXPECT_EQ(width, WIDTH);
    EXPECT_EQ(height, HEIGHT);
    EXPECT_FALSE(fs::exists(fs::path(output).parent_path() / "preview_video.mp4"));
}

TEST_F(VideoHandlerTest, PreviewPastTheEndIsPaddedToFullLength)
{
    std::string clip = writeClip("clip.mp4", 2.0);
    std::string output = outputPath("preview.mp4");

    // Only ~0.5s of source remain after the start point
    StageResult result = handler_.extractPreview(clip, 1.5, 1.0, output, cancel_);
    ASSERT_EQ(result.status, ArtifactStatus::DONE) << result.error_message;

    int width = 0;
    int height = 0;
    EXPECT_EQ(countFrames(output, width, height), static_cast<int>(std::llround(1.0 * FPS)));
}

TEST_F(VideoHandlerTest, ExtractFramesReturnsOneFramePerOffset)
{
    std::string clip = writeClip("clip.mp4", 4.0);

    auto frames = handler_.extractFrames(clip, {0.5, 1.5, 2.5, 3.5}, cancel_);
    ASSERT_EQ(frames.size(), 4u);
    for (const auto &frame : frames)
    {
        EXPECT_EQ(frame.cols, WIDTH);
        EXPECT_EQ(frame.rows, HEIGHT);
        EXPECT_EQ(frame.type(), CV_8UC3);
    }

    EXPECT_TRUE(handler_.extractFrames(createDummyFile("broken.mp4", "garbage"), {0.5}, cancel_).empty());
}

TEST_F(VideoHandlerTest, WatermarkKeepsFrameSize)
{
    std::string clip = writeClip("clip.mp4", 2.0);
    std::string output = outputPath("watermark.mp4");

    WatermarkStyle style;
    style.text = "(c) studio";
    style.anchor = WatermarkAnchor::TOP_LEFT;
    style.opacity = 0.8;

    StageResult result = handler_.overlayWatermark(clip, style, output, cancel_);
    ASSERT_EQ(result.status, ArtifactStatus::DONE) << result.error_message;

    auto meta = nlohmann::json::parse(result.metadata);
    EXPECT_EQ(meta["width"].get<int>(), WIDTH);
    EXPECT_EQ(meta["height"].get<int>(), HEIGHT);
    EXPECT_EQ(meta["anchor"].get<std::string>(), "top-left");

    int width = 0;
    int height = 0;
    EXPECT_EQ(countFrames(output, width, height), meta["frames"].get<int>());
    EXPECT_EQ(width, WIDTH);
    EXPECT_EQ(height, HEIGHT);
}

TEST_F(VideoHandlerTest, CancelledPreviewThrows)
{
    std::string clip = writeClip("clip.mp4", 2.0);
    cancel_.cancel();

    try
    {
        handler_.extractPreview(clip, 0.0, 1.0, outputPath("preview.mp4"), cancel_);
        FAIL() << "expected CANCELLED";
    }
    catch (const DeepLinkError &e)
    {
        EXPECT_EQ(e.code(), ErrorCode::CANCELLED);
    }
}

TEST_F(VideoHandlerTest, UnreadableSourceFailsPreview)
{
    StageResult result = handler_.extractPreview(createDummyFile("broken.mp4", "garbage"), 0.0, 1.0,
                                                 outputPath("preview.mp4"), cancel_);
    EXPECT_EQ(result.status, ArtifactStatus::FAILED);
    EXPECT_EQ(result.code, ErrorCode::STAGE_FAILED);
}
