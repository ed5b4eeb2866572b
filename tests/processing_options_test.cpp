#include "test_base.hpp"
#include "core/errors.hpp"
#include "core/processing_options.hpp"

class ProcessingOptionsTest : public TestBase
{
protected:
    void expectInvalid(const ProcessingOptions &options)
    {
        try
        {
            OptionResolver::resolve(options, config_);
            FAIL() << "expected VALIDATION_ERROR";
        }
        catch (const DeepLinkError &e)
        {
            EXPECT_EQ(e.code(), ErrorCode::VALIDATION_ERROR) << e.what();
        }
    }
};

TEST_F(ProcessingOptionsTest, ConfiguredDefaultsApply)
{
    ResolvedOptions resolved = OptionResolver::resolve(ProcessingOptions(), config_);

    ASSERT_EQ(resolved.stages.size(), 2u);
    EXPECT_EQ(resolved.stages[0], StageKind::PREVIEW);
    EXPECT_EQ(resolved.stages[1], StageKind::COLLAGE);
    EXPECT_TRUE(resolved.content_protection);
    EXPECT_DOUBLE_EQ(resolved.params.preview_length_seconds, 3.0);
    EXPECT_EQ(resolved.params.collage_frames, 4);
    EXPECT_EQ(resolved.params.watermark_target, "raw");
}

TEST_F(ProcessingOptionsTest, PerUploadOverridesWin)
{
    ProcessingOptions options;
    options.generate_preview = false;
    options.collage_frames = 12;
    options.apply_watermark = true;
    options.watermark_text = "(c) studio";
    options.watermark_position = "top-left";
    options.watermark_opacity = 0.3;
    options.watermark_target = "collage";
    options.content_protection = false;

    ResolvedOptions resolved = OptionResolver::resolve(options, config_);

    ASSERT_EQ(resolved.stages.size(), 2u);
    EXPECT_EQ(resolved.stages[0], StageKind::COLLAGE);
    EXPECT_EQ(resolved.stages[1], StageKind::WATERMARK);
    EXPECT_FALSE(resolved.content_protection);
    EXPECT_EQ(resolved.params.collage_frames, 12);
    EXPECT_EQ(resolved.params.watermark_position, "top-left");
    EXPECT_DOUBLE_EQ(resolved.params.watermark_opacity, 0.3);
}

TEST_F(ProcessingOptionsTest, NothingRequestedMeansNoStages)
{
    ProcessingOptions options;
    options.generate_preview = false;
    options.generate_collage = false;
    EXPECT_TRUE(OptionResolver::resolve(options, config_).stages.empty());
}

TEST_F(ProcessingOptionsTest, DisabledStagesAreNotValidated)
{
    ProcessingOptions options;
    options.generate_collage = false;
    options.collage_frames = 7;
    options.watermark_opacity = 5.0;
    EXPECT_NO_THROW(OptionResolver::resolve(options, config_));
}

TEST_F(ProcessingOptionsTest, OutOfRangeValuesAreRejected)
{
    ProcessingOptions frames;
    frames.collage_frames = 8;
    expectInvalid(frames);

    ProcessingOptions length;
    length.preview_length_seconds = 0.0;
    expectInvalid(length);

    ProcessingOptions anchor;
    anchor.apply_watermark = true;
    anchor.watermark_text = "x";
    anchor.watermark_position = "middle";
    expectInvalid(anchor);

    ProcessingOptions target;
    target.apply_watermark = true;
    target.watermark_text = "x";
    target.watermark_target = "watermark";
    expectInvalid(target);

    ProcessingOptions opacity;
    opacity.apply_watermark = true;
    opacity.watermark_text = "x";
    opacity.watermark_opacity = 1.2;
    expectInvalid(opacity);
}

TEST_F(ProcessingOptionsTest, ConfigValuesFeedParameters)
{
    config_.update({{"collage", {{"cell_width", 320}, {"quality", 70}}}, {"pipeline", {{"stage_timeout_seconds", 42}}}});
    ResolvedOptions resolved = OptionResolver::resolve(ProcessingOptions(), config_);
    EXPECT_EQ(resolved.params.collage_cell_width, 320);
    EXPECT_EQ(resolved.params.collage_quality, 70);
    EXPECT_EQ(resolved.params.stage_timeout_seconds, 42);
}
