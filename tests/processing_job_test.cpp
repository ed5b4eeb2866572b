#include <gtest/gtest.h>
#include "pipeline/processing_job.hpp"
#include <thread>

TEST(ProcessingJobTest, RunsToDone)
{
    ProcessingJob job("tok", StageKind::PREVIEW);
    EXPECT_EQ(job.state(), JobState::PENDING);
    EXPECT_FALSE(job.isTerminal());

    ASSERT_TRUE(job.start(std::chrono::seconds(60)));
    EXPECT_EQ(job.state(), JobState::RUNNING);

    Artifact artifact;
    artifact.token = "tok";
    artifact.status = ArtifactStatus::DONE;
    artifact.storage_ref = "/artifacts/tok/preview.mp4";
    ASSERT_TRUE(job.complete(artifact));

    JobSnapshot snap = job.snapshot();
    EXPECT_EQ(snap.state, JobState::DONE);
    ASSERT_TRUE(snap.artifact.has_value());
    EXPECT_EQ(snap.artifact->storage_ref, "/artifacts/tok/preview.mp4");
}

TEST(ProcessingJobTest, TerminalStatesAreFinal)
{
    ProcessingJob job("tok", StageKind::COLLAGE);
    ASSERT_TRUE(job.start(std::chrono::seconds(60)));
    ASSERT_TRUE(job.fail(ErrorCode::INSUFFICIENT_FRAMES, "2 of 4 frames"));

    EXPECT_FALSE(job.complete(Artifact()));
    EXPECT_FALSE(job.cancelPending());
    job.markCancelled("late");

    JobSnapshot snap = job.snapshot();
    EXPECT_EQ(snap.state, JobState::FAILED);
    EXPECT_EQ(snap.code, ErrorCode::INSUFFICIENT_FRAMES);
    EXPECT_EQ(snap.error_message, "2 of 4 frames");
}

TEST(ProcessingJobTest, PendingJobCannotCompleteWithoutRunning)
{
    ProcessingJob job("tok", StageKind::WATERMARK);
    EXPECT_FALSE(job.complete(Artifact()));
    EXPECT_EQ(job.state(), JobState::PENDING);
}

TEST(ProcessingJobTest, CancelledPendingJobNeverStarts)
{
    ProcessingJob job("tok", StageKind::PREVIEW);
    ASSERT_TRUE(job.cancelPending());
    EXPECT_EQ(job.state(), JobState::CANCELLED);
    EXPECT_EQ(job.snapshot().code, ErrorCode::CANCELLED);
    EXPECT_FALSE(job.start(std::chrono::seconds(60)));
    EXPECT_TRUE(job.cancellation().isCancelled());
}

TEST(ProcessingJobTest, StartArmsStageTimeout)
{
    ProcessingJob job("tok", StageKind::PREVIEW);
    ASSERT_TRUE(job.start(std::chrono::milliseconds(20)));
    EXPECT_FALSE(job.cancellation().isExpired());

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_TRUE(job.cancellation().shouldStop());
    EXPECT_THROW(job.cancellation().throwIfStopped("Preview"), DeepLinkError);
}

TEST(ProcessingJobTest, WaitForWakesOnTerminalState)
{
    ProcessingJob job("tok", StageKind::COLLAGE);
    ASSERT_TRUE(job.start(std::chrono::seconds(60)));
    EXPECT_FALSE(job.waitFor(std::chrono::milliseconds(10)));

    std::thread worker([&job]()
                       {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        job.requestCancel();
        job.markCancelled("stopped"); });

    EXPECT_TRUE(job.waitFor(std::chrono::seconds(5)));
    worker.join();
    EXPECT_EQ(job.state(), JobState::CANCELLED);
}

TEST(ProcessingJobTest, StateNames)
{
    EXPECT_EQ(ProcessingJob::getStateName(JobState::PENDING), "pending");
    EXPECT_EQ(ProcessingJob::getStateName(JobState::RUNNING), "running");
    EXPECT_EQ(ProcessingJob::getStateName(JobState::CANCELLED), "cancelled");
}
