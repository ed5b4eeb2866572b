#include "test_base.hpp"
#include "core/collage_composer.hpp"
#include "fake_media_handler.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>

class CollageComposerTest : public TestBase
{
protected:
    JobParameters params(int frames)
    {
        JobParameters p;
        p.collage_frames = frames;
        p.collage_cell_width = 64;
        p.collage_cell_height = 48;
        p.collage_quality = 90;
        return p;
    }

    static std::vector<cv::Mat> solidFrames(size_t count)
    {
        std::vector<cv::Mat> frames;
        for (size_t i = 0; i < count; ++i)
            frames.emplace_back(120, 200, CV_8UC3, cv::Scalar(static_cast<double>(i * 20), 50, 250));
        return frames;
    }

    CancellationToken cancel_;
};

TEST_F(CollageComposerTest, GridShapes)
{
    auto grid4 = CollageComposer::gridFor(4);
    auto grid6 = CollageComposer::gridFor(6);
    auto grid9 = CollageComposer::gridFor(9);
    auto grid12 = CollageComposer::gridFor(12);
    ASSERT_TRUE(grid4 && grid6 && grid9 && grid12);

    EXPECT_EQ(grid4->columns, 2);
    EXPECT_EQ(grid4->rows, 2);
    EXPECT_EQ(grid6->columns, 3);
    EXPECT_EQ(grid6->rows, 2);
    EXPECT_EQ(grid9->columns, 3);
    EXPECT_EQ(grid9->rows, 3);
    EXPECT_EQ(grid12->columns, 4);
    EXPECT_EQ(grid12->rows, 3);

    EXPECT_FALSE(CollageComposer::gridFor(5).has_value());
    EXPECT_FALSE(CollageComposer::gridFor(0).has_value());
}

TEST_F(CollageComposerTest, OffsetsAreEvenlySpacedFromZero)
{
    auto offsets = CollageComposer::sampleOffsets(60.0, 4);
    ASSERT_EQ(offsets.size(), 4u);
    EXPECT_DOUBLE_EQ(offsets[0], 0.0);
    EXPECT_DOUBLE_EQ(offsets[1], 15.0);
    EXPECT_DOUBLE_EQ(offsets[2], 30.0);
    EXPECT_DOUBLE_EQ(offsets[3], 45.0);
}

TEST_F(CollageComposerTest, ComposeTilesRowMajor)
{
    CollageGrid grid{3, 2};
    cv::Mat canvas = CollageComposer::compose(solidFrames(6), grid, cv::Size(40, 30));

    EXPECT_EQ(canvas.cols, 120);
    EXPECT_EQ(canvas.rows, 60);
    EXPECT_EQ(canvas.type(), CV_8UC3);

    // Cell (row 1, col 2) holds frame 5
    cv::Vec3b pixel = canvas.at<cv::Vec3b>(45, 100);
    EXPECT_EQ(pixel[0], 100);
    EXPECT_EQ(pixel[2], 250);
}

TEST_F(CollageComposerTest, ComposeAcceptsGrayAndAlphaFrames)
{
    std::vector<cv::Mat> frames = solidFrames(2);
    frames.emplace_back(50, 50, CV_8UC1, cv::Scalar(128));
    frames.emplace_back(50, 50, CV_8UC4, cv::Scalar(1, 2, 3, 255));

    cv::Mat canvas = CollageComposer::compose(frames, CollageGrid{2, 2}, cv::Size(20, 20));
    EXPECT_EQ(canvas.size(), cv::Size(40, 40));
    EXPECT_EQ(canvas.at<cv::Vec3b>(30, 5), cv::Vec3b(128, 128, 128));
}

TEST_F(CollageComposerTest, TooFewFramesIsInsufficientFrames)
{
    try
    {
        CollageComposer::compose(solidFrames(8), CollageGrid{3, 3}, cv::Size(10, 10));
        FAIL() << "expected INSUFFICIENT_FRAMES";
    }
    catch (const DeepLinkError &e)
    {
        EXPECT_EQ(e.code(), ErrorCode::INSUFFICIENT_FRAMES);
    }
}

TEST_F(CollageComposerTest, RunWritesJpegGrid)
{
    FakeMediaHandler handler;
    handler.duration = 30.0;
    ScopedTempDir work_dir(workDir(), "stage_");

    StageResult result = CollageComposer::run(handler, createDummyFile("clip.mp4"), params(6), work_dir, cancel_);

    ASSERT_EQ(result.status, ArtifactStatus::DONE) << result.error_message;
    cv::Mat written = cv::imread(result.output_path);
    ASSERT_FALSE(written.empty());
    EXPECT_EQ(written.cols, 3 * 64);
    EXPECT_EQ(written.rows, 2 * 48);

    auto meta = nlohmann::json::parse(result.metadata);
    EXPECT_EQ(meta["frames"], 6);
    EXPECT_EQ(meta["offsets"].size(), 6u);
    EXPECT_DOUBLE_EQ(meta["offsets"][1].get<double>(), 5.0);
}

TEST_F(CollageComposerTest, RunReportsInsufficientFrames)
{
    FakeMediaHandler handler;
    handler.available_frames = 3;
    ScopedTempDir work_dir(workDir(), "stage_");

    StageResult result = CollageComposer::run(handler, createDummyFile("clip.mp4"), params(4), work_dir, cancel_);

    EXPECT_EQ(result.status, ArtifactStatus::FAILED);
    EXPECT_EQ(result.code, ErrorCode::INSUFFICIENT_FRAMES);
}

TEST_F(CollageComposerTest, PhotosHaveNoCollage)
{
    FakeMediaHandler handler(MediaKind::PHOTO);
    std::string source = createDummyFile("photo.jpg");
    ScopedTempDir work_dir(workDir(), "stage_");

    StageResult result = CollageComposer::run(handler, source, params(4), work_dir, cancel_);

    EXPECT_EQ(result.status, ArtifactStatus::NO_OP);
    EXPECT_EQ(result.output_path, source);
    EXPECT_EQ(handler.collage_calls.load(), 0);
}
