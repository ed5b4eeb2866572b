#pragma once

#include "core/deeplink_config.hpp"
#include "core/media_handler.hpp"
#include "core/processing_options.hpp"
#include "database/token_registry.hpp"
#include "pipeline/processing_job.hpp"
#include "transfer/transfer_manager.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <tbb/task_arena.h>

/**
 * @brief Stages to run for one registered token
 */
struct StagePlan
{
    std::string token;
    std::string source_ref;
    MediaKind kind = MediaKind::VIDEO;
    std::vector<StageKind> stages;
    JobParameters params;
};

class ProcessingPipeline;

/**
 * @brief Queue slots held between admission and scheduling
 *
 * Slots not consumed by ProcessingPipeline::schedule are returned on destruction.
 */
class PipelineReservation
{
public:
    ~PipelineReservation();

    PipelineReservation(const PipelineReservation &) = delete;
    PipelineReservation &operator=(const PipelineReservation &) = delete;

    size_t slots() const { return slots_; }

private:
    friend class ProcessingPipeline;
    PipelineReservation(ProcessingPipeline &pipeline, size_t slots) : pipeline_(pipeline), slots_(slots) {}

    ProcessingPipeline &pipeline_;
    size_t slots_;
};

/**
 * @brief Bounded worker pool running preview, collage and watermark jobs
 *
 * Jobs run on a oneTBB task_arena. Remote sources are first materialized into
 * a per-token cache file shared by that token's jobs; the watermark job is
 * started as a continuation of the job producing its target artifact. Stage
 * outcomes are recorded in the TokenRegistry; a failed stage never affects
 * its siblings.
 */
class ProcessingPipeline
{
public:
    ProcessingPipeline(const DeepLinkConfig &config, TokenRegistry &registry, TransferManager &transfers,
                       MediaHandlerMap handlers);
    ~ProcessingPipeline();

    ProcessingPipeline(const ProcessingPipeline &) = delete;
    ProcessingPipeline &operator=(const ProcessingPipeline &) = delete;

    /**
     * @brief Reserve queue capacity for n jobs
     * @throws DeepLinkError BUSY if the pending queue would exceed its depth
     */
    std::unique_ptr<PipelineReservation> reserve(size_t n);

    /**
     * @brief Create one job per planned stage, consuming reserved slots
     * @return Handles in plan order (existing handles for coalesced stages)
     */
    std::vector<JobHandle> schedule(const StagePlan &plan, PipelineReservation &reservation);

    /**
     * @brief Schedule a single stage, coalescing with an in-flight job
     * @throws DeepLinkError BUSY if no slot is available for a new job
     */
    JobHandle submit(const StagePlan &plan, StageKind stage);

    /**
     * @brief Cancel one job and wait until it released its temp resources
     * @return false if no such job is in flight
     */
    bool cancel(const std::string &token, StageKind stage);

    /**
     * @brief Cancel every job of a token, including a running source transfer
     * @return Number of jobs cancelled
     */
    size_t cancelAll(const std::string &token);

    std::vector<JobSnapshot> snapshot(const std::string &token) const;

    /**
     * @brief Wait until no job or transfer is in flight
     * @return true if idle within timeout
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    // Cancel everything, wait for workers, refuse new work
    void shutdown();

    size_t pendingDepth() const;
    size_t workerCount() const { return worker_count_; }
    TransferManager &transfers() { return transfers_; }

private:
    friend class PipelineReservation;

    enum class SourcePhase
    {
        UNPREPARED,
        PREPARING,
        READY,
        FAILED
    };

    // In-flight state of one token
    struct TokenWork
    {
        StagePlan plan;
        SourcePhase phase = SourcePhase::UNPREPARED;
        std::string local_source;
        std::string cache_file; // Set for remote sources
        ErrorCode prepare_code = ErrorCode::NONE;
        std::string prepare_error;
        std::map<StageKind, JobHandle> jobs;               // Non-terminal jobs
        std::vector<JobHandle> awaiting_source;            // Queued until the source is local
        std::map<StageKind, JobHandle> awaiting_stage;     // Target stage -> watermark job
        std::shared_ptr<DownloadSession> source_session;   // Registered before the transfer starts
        bool source_cancelled = false;
        bool source_running = false;
    };

    void releaseSlots(size_t n);
    size_t pendingDepthLocked() const;

    JobHandle submitLocked(const std::shared_ptr<TokenWork> &work, StageKind stage, bool &created);
    void dispatchLocked(const std::shared_ptr<TokenWork> &work, const JobHandle &job);
    void enqueue(std::function<void()> task);

    void prepareSource(std::shared_ptr<TokenWork> work);
    void runJob(std::shared_ptr<TokenWork> work, JobHandle job);
    StageResult executeStage(TokenWork &work, ProcessingJob &job);
    std::string watermarkInput(TokenWork &work);
    Artifact recordResult(const TokenWork &work, const ProcessingJob &job, const StageResult &result);
    void onJobTerminal(const std::shared_ptr<TokenWork> &work, const JobHandle &job);
    std::string collectIfIdleLocked(const std::shared_ptr<TokenWork> &work);
    void finishWithoutRunning(const std::shared_ptr<TokenWork> &work, const JobHandle &job, ErrorCode code,
                              const std::string &message);

    static std::string prepareSessionId(const std::string &token);

    TokenRegistry &registry_;
    TransferManager &transfers_;
    MediaHandlerMap handlers_;

    std::filesystem::path artifact_dir_;
    std::filesystem::path temp_dir_;
    size_t max_queue_depth_;
    size_t worker_count_;
    uint64_t max_video_bytes_;
    uint64_t max_photo_bytes_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<std::string, std::shared_ptr<TokenWork>> work_;
    size_t reserved_ = 0;
    size_t running_tasks_ = 0;
    bool stopping_ = false;

    tbb::task_arena arena_;
};
