#include "test_base.hpp"
#include "core/frame_sampler.hpp"
#include "fake_media_handler.hpp"

class FrameSamplerTest : public TestBase
{
protected:
    JobParameters params(double length, double anchor = 0.5)
    {
        JobParameters p;
        p.preview_length_seconds = length;
        p.preview_anchor_ratio = anchor;
        return p;
    }

    CancellationToken cancel_;
};

TEST_F(FrameSamplerTest, StartIsCentredInTheSlack)
{
    EXPECT_DOUBLE_EQ(FrameSampler::computeStart(60.0, 3.0, 0.5), 28.5);
    EXPECT_DOUBLE_EQ(FrameSampler::computeStart(60.0, 3.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(FrameSampler::computeStart(60.0, 3.0, 1.0), 57.0);
}

TEST_F(FrameSamplerTest, StartStaysInsideTheSource)
{
    EXPECT_DOUBLE_EQ(FrameSampler::computeStart(10.0, 4.0, 7.0), 6.0);
    EXPECT_DOUBLE_EQ(FrameSampler::computeStart(10.0, 4.0, -1.0), 0.0);
    EXPECT_DOUBLE_EQ(FrameSampler::computeStart(2.0, 4.0, 0.5), 0.0);
    EXPECT_DOUBLE_EQ(FrameSampler::computeStart(4.0, 4.0, 0.5), 0.0);
}

TEST_F(FrameSamplerTest, ProducesClipFromTheMiddleWindow)
{
    FakeMediaHandler handler;
    handler.duration = 20.0;
    std::string source = createDummyFile("clip.mp4", "VIDEO");
    ScopedTempDir work_dir(workDir(), "stage_");

    StageResult result = FrameSampler::run(handler, source, params(4.0), work_dir, cancel_);

    ASSERT_EQ(result.status, ArtifactStatus::DONE) << result.error_message;
    EXPECT_EQ(std::filesystem::path(result.output_path).parent_path(), work_dir.path());
    EXPECT_EQ(readFile(result.output_path), "preview[8.000000+4.000000] of VIDEO");
}

TEST_F(FrameSamplerTest, ShortSourceIsDeliveredUnchanged)
{
    FakeMediaHandler handler;
    handler.duration = 2.0;
    std::string source = createDummyFile("short.mp4");
    ScopedTempDir work_dir(workDir(), "stage_");

    StageResult result = FrameSampler::run(handler, source, params(3.0), work_dir, cancel_);

    EXPECT_EQ(result.status, ArtifactStatus::NO_OP);
    EXPECT_EQ(result.output_path, source);
    EXPECT_EQ(handler.preview_calls.load(), 0);
}

TEST_F(FrameSamplerTest, UnknownDurationFails)
{
    FakeMediaHandler handler;
    handler.duration = std::nullopt;
    ScopedTempDir work_dir(workDir(), "stage_");

    StageResult result = FrameSampler::run(handler, createDummyFile("broken.mp4"), params(3.0), work_dir, cancel_);

    EXPECT_EQ(result.status, ArtifactStatus::FAILED);
    EXPECT_EQ(result.code, ErrorCode::STAGE_FAILED);
}

TEST_F(FrameSamplerTest, PhotosHaveNoPreview)
{
    FakeMediaHandler handler(MediaKind::PHOTO);
    std::string source = createDummyFile("photo.jpg");
    ScopedTempDir work_dir(workDir(), "stage_");

    StageResult result = FrameSampler::run(handler, source, params(3.0), work_dir, cancel_);

    EXPECT_EQ(result.status, ArtifactStatus::NO_OP);
    EXPECT_EQ(result.output_path, source);
}

TEST_F(FrameSamplerTest, CancelledBeforeExtractionThrows)
{
    FakeMediaHandler handler;
    ScopedTempDir work_dir(workDir(), "stage_");
    cancel_.cancel();

    try
    {
        FrameSampler::run(handler, createDummyFile("clip.mp4"), params(3.0), work_dir, cancel_);
        FAIL() << "expected CANCELLED";
    }
    catch (const DeepLinkError &e)
    {
        EXPECT_EQ(e.code(), ErrorCode::CANCELLED);
    }
    EXPECT_EQ(handler.preview_calls.load(), 0);
}
