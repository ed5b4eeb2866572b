#include "test_base.hpp"
#include "core/errors.hpp"
#include "fake_media_handler.hpp"
#include "local_http_server.hpp"
#include "pipeline/processing_pipeline.hpp"
#include "service/ingestion_coordinator.hpp"
#include "transfer/transfer_manager.hpp"

namespace fs = std::filesystem;

class IngestionCoordinatorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        handler_ = std::make_shared<FakeMediaHandler>();
    }

    void TearDown() override
    {
        handler_->release();
        coordinator_.reset();
        pipeline_.reset();
        transfers_.reset();
        TestBase::TearDown();
    }

    void start()
    {
        MediaHandlerMap handlers;
        handlers[MediaKind::VIDEO] = handler_;
        handlers[MediaKind::PHOTO] = std::make_shared<FakeMediaHandler>(MediaKind::PHOTO);
        transfers_ = std::make_unique<TransferManager>(TransferOptions::fromConfig(config_), workDir());
        pipeline_ = std::make_unique<ProcessingPipeline>(config_, *registry_, *transfers_, handlers);
        coordinator_ = std::make_unique<IngestionCoordinator>(config_, *registry_, *pipeline_);
    }

    UploadRequest video(const std::string &path)
    {
        UploadRequest request;
        request.kind = "video";
        request.source.reference = path;
        return request;
    }

    static ProcessingOptions nothing()
    {
        ProcessingOptions options;
        options.generate_preview = false;
        options.generate_collage = false;
        options.apply_watermark = false;
        return options;
    }

    void expectRejected(const UploadRequest &request, ErrorCode code)
    {
        try
        {
            coordinator_->ingest(request);
            FAIL() << "expected " << ErrorCodes::getName(code);
        }
        catch (const DeepLinkError &e)
        {
            EXPECT_EQ(e.code(), code) << e.what();
        }
        EXPECT_EQ(registry_->count(), 0u);
    }

    std::shared_ptr<FakeMediaHandler> handler_;
    std::unique_ptr<TransferManager> transfers_;
    std::unique_ptr<ProcessingPipeline> pipeline_;
    std::unique_ptr<IngestionCoordinator> coordinator_;
};

TEST_F(IngestionCoordinatorTest, TokenIsReturnedBeforeProcessingFinishes)
{
    start();
    handler_->block(StageKind::PREVIEW);

    UploadRequest request = video(createDummyFile("clip.mp4", "VIDEO"));
    request.options.generate_collage = false;
    std::string token = coordinator_->ingest(request);

    EXPECT_EQ(token.size(), 16u);
    MediaDescriptor descriptor = registry_->get(token);
    EXPECT_EQ(descriptor.kind, MediaKind::VIDEO);
    EXPECT_TRUE(descriptor.content_protection);

    auto status = coordinator_->jobStatus(token);
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0].stage, StageKind::PREVIEW);
    EXPECT_FALSE(status[0].state == JobState::DONE);

    handler_->release();
    ASSERT_TRUE(pipeline_->waitIdle(std::chrono::seconds(20)));
    status = coordinator_->jobStatus(token);
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0].state, JobState::DONE);
}

TEST_F(IngestionCoordinatorTest, DefaultsScheduleConfiguredStages)
{
    config_.update({{"watermark", {{"enabled", true}, {"text", "(c) studio"}}}});
    start();

    std::string token = coordinator_->ingest(video(createDummyFile("clip.mp4")));
    ASSERT_TRUE(pipeline_->waitIdle(std::chrono::seconds(20)));

    auto artifacts = registry_->getArtifacts(token);
    EXPECT_EQ(artifacts.size(), 3u);
    EXPECT_EQ(handler_->preview_calls.load(), 1);
    EXPECT_EQ(handler_->collage_calls.load(), 1);
    EXPECT_EQ(handler_->watermark_calls.load(), 1);
}

TEST_F(IngestionCoordinatorTest, SourcePathIsStoredNormalized)
{
    start();
    std::string path = createDummyFile("clip.mp4");
    fs::path winding = testRoot() / "files" / ".." / "files" / "clip.mp4";

    UploadRequest request = video(winding.string());
    request.options = nothing();
    std::string token = coordinator_->ingest(request);

    EXPECT_EQ(registry_->get(token).source_ref, fs::path(path).lexically_normal().string());
}

TEST_F(IngestionCoordinatorTest, InstantLinkSchedulesNothing)
{
    start();
    UploadRequest request = video(createDummyFile("clip.mp4"));
    request.options = nothing();
    request.options.content_protection = false;

    std::string token = coordinator_->ingest(request);

    EXPECT_FALSE(registry_->get(token).content_protection);
    EXPECT_TRUE(coordinator_->jobStatus(token).empty());
    EXPECT_EQ(pipeline_->pendingDepth(), 0u);
}

TEST_F(IngestionCoordinatorTest, UnknownKindIsRejected)
{
    start();
    UploadRequest request = video(createDummyFile("clip.mp4"));
    request.kind = "audio";
    expectRejected(request, ErrorCode::VALIDATION_ERROR);
}

TEST_F(IngestionCoordinatorTest, MissingOrEmptySourceIsRejected)
{
    start();
    expectRejected(video((testRoot() / "files" / "absent.mp4").string()), ErrorCode::VALIDATION_ERROR);
    expectRejected(video(""), ErrorCode::VALIDATION_ERROR);
    expectRejected(video(createDummyFile("empty.mp4", "")), ErrorCode::VALIDATION_ERROR);
}

TEST_F(IngestionCoordinatorTest, OversizedUploadsAreRejected)
{
    config_.update({{"limits", {{"max_photo_bytes", 10}, {"max_video_bytes", 1000}}}});
    start();

    UploadRequest photo;
    photo.kind = "photo";
    photo.source.reference = createDummyFile("big.jpg", std::string(11, 'x'));
    expectRejected(photo, ErrorCode::VALIDATION_ERROR);

    UploadRequest remote = video("https://cdn.example.com/clip.mp4");
    remote.source.size_bytes = 1001;
    expectRejected(remote, ErrorCode::VALIDATION_ERROR);
}

TEST_F(IngestionCoordinatorTest, RemoteSourceWithoutHostIsRejected)
{
    start();
    expectRejected(video("https:///clip.mp4"), ErrorCode::VALIDATION_ERROR);
}

TEST_F(IngestionCoordinatorTest, InvalidOptionsAreRejectedBeforeRegistration)
{
    start();
    std::string path = createDummyFile("clip.mp4");

    UploadRequest frames = video(path);
    frames.options.collage_frames = 5;
    expectRejected(frames, ErrorCode::VALIDATION_ERROR);

    UploadRequest opacity = video(path);
    opacity.options.apply_watermark = true;
    opacity.options.watermark_text = "x";
    opacity.options.watermark_opacity = 0.01;
    expectRejected(opacity, ErrorCode::VALIDATION_ERROR);

    UploadRequest text = video(path);
    text.options.apply_watermark = true;
    expectRejected(text, ErrorCode::VALIDATION_ERROR);
}

TEST_F(IngestionCoordinatorTest, BusyPipelineRegistersNothing)
{
    config_.update({{"pipeline", {{"max_queue_depth", 1}}}});
    start();

    expectRejected(video(createDummyFile("clip.mp4")), ErrorCode::BUSY);
}

TEST_F(IngestionCoordinatorTest, RemoveCancelsJobsAndDeletesArtifacts)
{
    start();
    handler_->block(StageKind::COLLAGE);

    std::string token = coordinator_->ingest(video(createDummyFile("clip.mp4")));
    ASSERT_TRUE(handler_->waitEntered(StageKind::COLLAGE, std::chrono::seconds(10)));

    coordinator_->remove(DeleteRequest{token});
    ASSERT_TRUE(pipeline_->waitIdle(std::chrono::seconds(20)));

    EXPECT_FALSE(registry_->find(token).has_value());
    EXPECT_TRUE(registry_->getArtifacts(token).empty());
    EXPECT_FALSE(fs::exists(fs::path(config_.getArtifactDir()) / token));

    try
    {
        coordinator_->jobStatus(token);
        FAIL() << "expected NOT_FOUND";
    }
    catch (const DeepLinkError &e)
    {
        EXPECT_EQ(e.code(), ErrorCode::NOT_FOUND);
    }
}

TEST_F(IngestionCoordinatorTest, RemoveUnknownTokenIsNotFound)
{
    start();
    try
    {
        coordinator_->remove(DeleteRequest{"unknown-token"});
        FAIL() << "expected NOT_FOUND";
    }
    catch (const DeepLinkError &e)
    {
        EXPECT_EQ(e.code(), ErrorCode::NOT_FOUND);
    }
}

TEST_F(IngestionCoordinatorTest, RemoteUploadWithoutSizeIsCheckedAgainstTheServer)
{
    config_.update({{"limits", {{"max_video_bytes", 4096}}}});
    LocalHttpServer server(std::string(8192, 'v'));
    start();

    expectRejected(video(server.url("/clip.mp4")), ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(server.get_requests.load(), 0);
}

TEST_F(IngestionCoordinatorTest, RemoteUploadOfUnknownLengthIsAdmitted)
{
    config_.update({{"limits", {{"max_video_bytes", 4096}}}});
    LocalHttpServer server(std::string(100, 'v'), false);
    start();

    UploadRequest request = video(server.url("/clip.mp4"));
    request.options = nothing();
    std::string token = coordinator_->ingest(request);
    EXPECT_EQ(registry_->get(token).source_ref, server.url("/clip.mp4"));
}
