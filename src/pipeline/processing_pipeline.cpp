#include "pipeline/processing_pipeline.hpp"
#include "core/collage_composer.hpp"
#include "core/frame_sampler.hpp"
#include "core/scoped_temp_dir.hpp"
#include "core/watermark_renderer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <ctime>

namespace fs = std::filesystem;

namespace
{
    const char *const STAGE_PREFIX = "stage_";
    const char *const SOURCE_PREFIX = "source_";

    void moveIntoStorage(const fs::path &from, const fs::path &to)
    {
        fs::create_directories(to.parent_path());
        std::error_code ec;
        fs::rename(from, to, ec);
        if (ec)
        {
            fs::copy_file(from, to, fs::copy_options::overwrite_existing);
            fs::remove(from);
        }
    }

    void removeStoredFile(const std::string &path)
    {
        std::error_code ec;
        fs::path file(path);
        fs::remove(file, ec);
        if (fs::is_directory(file.parent_path(), ec) && fs::is_empty(file.parent_path(), ec))
            fs::remove(file.parent_path(), ec);
    }

    // Extension of the path part of a URL or file reference, ".bin" if none
    std::string referenceExtension(const std::string &reference)
    {
        std::string path = reference.substr(0, reference.find_first_of("?#"));
        auto slash = path.find_last_of('/');
        std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
        std::string ext = fs::path(name).extension().string();
        return ext.empty() ? ".bin" : ext;
    }
}

// ---------------------------------------------------------------------------
// PipelineReservation

PipelineReservation::~PipelineReservation()
{
    if (slots_ > 0)
        pipeline_.releaseSlots(slots_);
}

// ---------------------------------------------------------------------------
// ProcessingPipeline

ProcessingPipeline::ProcessingPipeline(const DeepLinkConfig &config, TokenRegistry &registry, TransferManager &transfers,
                                       MediaHandlerMap handlers)
    : registry_(registry), transfers_(transfers), handlers_(std::move(handlers)),
      artifact_dir_(config.getArtifactDir()), temp_dir_(config.getTempDir()),
      max_queue_depth_(static_cast<size_t>(std::max(1, config.getMaxQueueDepth()))),
      worker_count_(static_cast<size_t>(config.getWorkerThreads())),
      max_video_bytes_(config.getMaxVideoBytes()), max_photo_bytes_(config.getMaxPhotoBytes()),
      arena_(static_cast<int>(worker_count_), 0)
{
    fs::create_directories(artifact_dir_);
    fs::create_directories(temp_dir_);

    // Leftovers from an interrupted run
    size_t swept = ScopedTempDir::sweep(temp_dir_, STAGE_PREFIX);
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(temp_dir_, ec))
    {
        if (entry.is_regular_file() && entry.path().filename().string().rfind(SOURCE_PREFIX, 0) == 0)
        {
            fs::remove(entry.path(), ec);
            ++swept;
        }
    }
    if (swept > 0)
        Logger::info("Removed " + std::to_string(swept) + " stale pipeline work entries from " + temp_dir_.string());

    Logger::info("Processing pipeline started with " + std::to_string(worker_count_) + " workers, queue depth " +
                 std::to_string(max_queue_depth_));
}

ProcessingPipeline::~ProcessingPipeline()
{
    shutdown();
}

std::string ProcessingPipeline::prepareSessionId(const std::string &token)
{
    return "source-" + token;
}

size_t ProcessingPipeline::pendingDepthLocked() const
{
    size_t pending = 0;
    for (const auto &[token, work] : work_)
    {
        for (const auto &[stage, job] : work->jobs)
        {
            if (job->state() == JobState::PENDING)
                ++pending;
        }
    }
    return pending;
}

size_t ProcessingPipeline::pendingDepth() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingDepthLocked() + reserved_;
}

std::unique_ptr<PipelineReservation> ProcessingPipeline::reserve(size_t n)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_)
        throw DeepLinkError(ErrorCode::BUSY, "Pipeline is shutting down");

    size_t depth = pendingDepthLocked() + reserved_;
    if (depth + n > max_queue_depth_)
    {
        throw DeepLinkError(ErrorCode::BUSY, "Pipeline queue full (" + std::to_string(depth) + "/" +
                                                 std::to_string(max_queue_depth_) + " pending)");
    }
    reserved_ += n;
    return std::unique_ptr<PipelineReservation>(new PipelineReservation(*this, n));
}

void ProcessingPipeline::releaseSlots(size_t n)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reserved_ -= std::min(n, reserved_);
    }
    idle_cv_.notify_all();
}

std::vector<JobHandle> ProcessingPipeline::schedule(const StagePlan &plan, PipelineReservation &reservation)
{
    std::vector<JobHandle> handles;
    std::lock_guard<std::mutex> lock(mutex_);

    auto &work = work_[plan.token];
    if (!work)
    {
        work = std::make_shared<TokenWork>();
        work->plan = plan;
    }

    std::vector<JobHandle> created_jobs;
    for (StageKind stage : plan.stages)
    {
        bool created = false;
        JobHandle job = submitLocked(work, stage, created);
        if (created)
        {
            created_jobs.push_back(job);
            if (reservation.slots_ > 0)
            {
                reservation.slots_--;
                reserved_ -= std::min<size_t>(1, reserved_);
            }
        }
        handles.push_back(job);
    }

    // Dispatch after creation so a watermark can see its target job
    for (const auto &job : created_jobs)
        dispatchLocked(work, job);

    if (work->jobs.empty())
        collectIfIdleLocked(work);

    return handles;
}

JobHandle ProcessingPipeline::submit(const StagePlan &plan, StageKind stage)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = work_.find(plan.token);
        if (it != work_.end())
        {
            auto job = it->second->jobs.find(stage);
            if (job != it->second->jobs.end())
                return job->second;
        }
    }

    auto reservation = reserve(1);
    StagePlan single = plan;
    single.stages = {stage};
    return schedule(single, *reservation).front();
}

// Caller holds mutex_
JobHandle ProcessingPipeline::submitLocked(const std::shared_ptr<TokenWork> &work, StageKind stage, bool &created)
{
    auto it = work->jobs.find(stage);
    if (it != work->jobs.end())
    {
        Logger::debug("Coalescing " + MediaTypes::getStageName(stage) + " request for " + work->plan.token);
        created = false;
        return it->second;
    }

    auto job = std::make_shared<ProcessingJob>(work->plan.token, stage);
    work->jobs[stage] = job;
    created = true;
    return job;
}

// Caller holds mutex_
void ProcessingPipeline::dispatchLocked(const std::shared_ptr<TokenWork> &work, const JobHandle &job)
{
    if (job->isTerminal())
        return;

    switch (work->phase)
    {
    case SourcePhase::UNPREPARED:
        if (MediaTypes::isRemoteSource(work->plan.source_ref))
        {
            work->phase = SourcePhase::PREPARING;
            work->cache_file = (temp_dir_ / (SOURCE_PREFIX + work->plan.token + referenceExtension(work->plan.source_ref))).string();
            work->awaiting_source.push_back(job);
            enqueue([this, work]()
                    { prepareSource(work); });
            return;
        }
        work->phase = SourcePhase::READY;
        work->local_source = work->plan.source_ref;
        break;
    case SourcePhase::PREPARING:
        work->awaiting_source.push_back(job);
        return;
    case SourcePhase::FAILED:
    {
        ErrorCode code = work->prepare_code;
        std::string message = work->prepare_error;
        enqueue([this, work, job, code, message]()
                { finishWithoutRunning(work, job, code, message); });
        return;
    }
    case SourcePhase::READY:
        break;
    }

    if (job->stage() == StageKind::WATERMARK)
    {
        auto target = MediaTypes::stageFromString(work->plan.params.watermark_target);
        if (target && *target != StageKind::WATERMARK)
        {
            auto it = work->jobs.find(*target);
            if (it != work->jobs.end() && !it->second->isTerminal())
            {
                work->awaiting_stage[*target] = job;
                return;
            }
        }
    }

    enqueue([this, work, job]()
            { runJob(work, job); });
}

// Caller holds mutex_
void ProcessingPipeline::enqueue(std::function<void()> task)
{
    ++running_tasks_;
    arena_.enqueue([this, task = std::move(task)]()
                   {
        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            Logger::error("Unhandled error in pipeline task: " + std::string(e.what()));
        }
        // Notify under the lock: once running_tasks_ hits zero the pipeline may be destroyed
        std::lock_guard<std::mutex> lock(mutex_);
        --running_tasks_;
        idle_cv_.notify_all(); });
}

void ProcessingPipeline::prepareSource(std::shared_ptr<TokenWork> work)
{
    const std::string &token = work->plan.token;
    uint64_t max_bytes = work->plan.kind == MediaKind::VIDEO ? max_video_bytes_ : max_photo_bytes_;
    ErrorCode code = ErrorCode::NONE;
    std::string message;
    std::shared_ptr<DownloadSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool wanted = std::any_of(work->awaiting_source.begin(), work->awaiting_source.end(),
                                  [](const JobHandle &job)
                                  { return !job->isTerminal(); });
        if (!wanted || stopping_ || work->source_cancelled)
        {
            work->phase = SourcePhase::FAILED;
            work->prepare_code = ErrorCode::CANCELLED;
            work->prepare_error = "Source transfer cancelled";
            work->awaiting_source.clear();
            collectIfIdleLocked(work);
            return;
        }

        // Registered under mutex_ so cancelAll either sees the session or stops us above
        try
        {
            session = transfers_.openSession(transfers_.sourceFor(work->plan.source_ref), work->cache_file,
                                             prepareSessionId(token), max_bytes);
            work->source_session = session;
            work->source_running = true;
        }
        catch (const DeepLinkError &e)
        {
            code = e.code();
            message = e.what();
        }
        catch (const std::exception &e)
        {
            code = ErrorCode::VALIDATION_ERROR;
            message = "Source unusable: " + std::string(e.what());
        }
    }

    if (session)
    {
        Logger::info("Materializing remote source for " + token + ": " + work->plan.source_ref);
        try
        {
            transfers_.runSession(session);
        }
        catch (const DeepLinkError &e)
        {
            code = e.code();
            message = e.what();
        }
        catch (const std::exception &e)
        {
            code = ErrorCode::CHUNK_FETCH_ERROR;
            message = "Source transfer failed: " + std::string(e.what());
        }
    }

    std::vector<JobHandle> waiting;
    std::string cache_to_remove;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        waiting.swap(work->awaiting_source);
        if (code == ErrorCode::NONE)
        {
            work->phase = SourcePhase::READY;
            work->local_source = work->cache_file;
            for (const auto &job : waiting)
                dispatchLocked(work, job);
            waiting.clear();
        }
        else
        {
            work->phase = SourcePhase::FAILED;
            work->prepare_code = code;
            work->prepare_error = message;
        }
        cache_to_remove = collectIfIdleLocked(work);
    }

    if (code != ErrorCode::NONE)
    {
        Logger::error("Source transfer failed for " + token + ": " + message);
        for (const auto &job : waiting)
            finishWithoutRunning(work, job, code, message);
    }

    if (!cache_to_remove.empty())
    {
        std::error_code ec;
        fs::remove(cache_to_remove, ec);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        work->source_session.reset();
        work->source_running = false;
        idle_cv_.notify_all();
    }
}

void ProcessingPipeline::finishWithoutRunning(const std::shared_ptr<TokenWork> &work, const JobHandle &job,
                                              ErrorCode code, const std::string &message)
{
    if (job->isTerminal())
        return;

    bool transitioned = false;
    if (code == ErrorCode::CANCELLED)
    {
        transitioned = job->cancelPending();
    }
    else
    {
        Artifact artifact = recordResult(*work, *job, StageResult::failed(code, message));
        transitioned = job->fail(code, message, artifact);
    }

    if (transitioned)
        onJobTerminal(work, job);
}

void ProcessingPipeline::runJob(std::shared_ptr<TokenWork> work, JobHandle job)
{
    auto timeout = std::chrono::seconds(std::max(1, work->plan.params.stage_timeout_seconds));
    if (!job->start(std::chrono::duration_cast<std::chrono::milliseconds>(timeout)))
        return;

    const std::string stage_name = MediaTypes::getStageName(job->stage());
    Logger::info("Running " + stage_name + " for " + job->token());

    StageResult result;
    bool cancelled = false;
    std::string cancel_message;
    try
    {
        result = executeStage(*work, *job);
    }
    catch (const DeepLinkError &e)
    {
        if (e.code() == ErrorCode::CANCELLED)
        {
            cancelled = true;
            cancel_message = e.what();
        }
        else
        {
            result = StageResult::failed(e.code(), e.what());
        }
    }
    catch (const std::exception &e)
    {
        result = StageResult::failed(ErrorCode::STAGE_FAILED, e.what());
    }

    if (cancelled)
    {
        job->markCancelled(cancel_message);
        Logger::info("Cancelled " + stage_name + " for " + job->token());
    }
    else
    {
        Artifact artifact = recordResult(*work, *job, result);
        if (result.status == ArtifactStatus::FAILED)
        {
            Logger::warn(stage_name + " failed for " + job->token() + ": " + result.error_message);
            job->fail(result.code, result.error_message, artifact);
        }
        else
        {
            Logger::info(stage_name + " " + MediaTypes::getStatusName(result.status) + " for " + job->token());
            job->complete(artifact);
        }
    }

    onJobTerminal(work, job);
}

StageResult ProcessingPipeline::executeStage(TokenWork &work, ProcessingJob &job)
{
    CancellationToken &cancel = job.cancellation();
    cancel.throwIfStopped(MediaTypes::getStageName(job.stage()));

    auto handler_it = handlers_.find(work.plan.kind);
    if (handler_it == handlers_.end() || !handler_it->second)
    {
        return StageResult::noOp(work.plan.source_ref, "No handler for " + MediaTypes::getKindName(work.plan.kind));
    }
    MediaHandler &handler = *handler_it->second;
    const JobParameters &params = work.plan.params;

    StageResult result;
    {
        ScopedTempDir work_dir(temp_dir_, STAGE_PREFIX);

        switch (job.stage())
        {
        case StageKind::PREVIEW:
            result = FrameSampler::run(handler, work.local_source, params, work_dir, cancel);
            break;
        case StageKind::COLLAGE:
            result = CollageComposer::run(handler, work.local_source, params, work_dir, cancel);
            break;
        case StageKind::WATERMARK:
        {
            WatermarkStyle style;
            style.text = params.watermark_text;
            style.anchor = WatermarkRenderer::anchorFromString(params.watermark_position).value_or(WatermarkAnchor::BOTTOM_RIGHT);
            style.opacity = params.watermark_opacity;
            result = WatermarkRenderer::run(handler, watermarkInput(work), style, work_dir, cancel);
            break;
        }
        }

        if (result.status == ArtifactStatus::DONE)
        {
            cancel.throwIfStopped(MediaTypes::getStageName(job.stage()));
            fs::path output(result.output_path);
            fs::path dest = artifact_dir_ / work.plan.token / (MediaTypes::getStageName(job.stage()) + output.extension().string());
            moveIntoStorage(output, dest);
            result.output_path = dest.string();
        }
    }

    // A no-op keeps the raw source; never point at the transient cache copy
    if (result.status == ArtifactStatus::NO_OP)
        result.output_path = work.plan.source_ref;

    return result;
}

std::string ProcessingPipeline::watermarkInput(TokenWork &work)
{
    auto target = MediaTypes::stageFromString(work.plan.params.watermark_target);
    if (!target || *target == StageKind::WATERMARK)
        return work.local_source;

    auto artifact = registry_.getArtifact(work.plan.token, *target);
    if (artifact && artifact->status == ArtifactStatus::DONE && fs::exists(artifact->storage_ref))
        return artifact->storage_ref;

    Logger::info("Watermark target " + work.plan.params.watermark_target + " unavailable for " + work.plan.token +
                 ", watermarking the original");
    return work.local_source;
}

Artifact ProcessingPipeline::recordResult(const TokenWork &work, const ProcessingJob &job, const StageResult &result)
{
    Artifact artifact;
    artifact.token = work.plan.token;
    artifact.stage = job.stage();
    artifact.status = result.status;
    artifact.storage_ref = result.status == ArtifactStatus::FAILED ? std::string() : result.output_path;
    artifact.error_message = result.error_message;
    artifact.metadata = result.metadata;
    artifact.updated_at = std::time(nullptr);

    try
    {
        registry_.attachArtifact(artifact);
    }
    catch (const DeepLinkError &e)
    {
        // Token deleted while the stage ran
        Logger::warn("Discarding " + MediaTypes::getStageName(job.stage()) + " output for " + work.plan.token + ": " + e.what());
        if (result.status == ArtifactStatus::DONE)
            removeStoredFile(artifact.storage_ref);
    }
    return artifact;
}

// Caller holds mutex_
std::string ProcessingPipeline::collectIfIdleLocked(const std::shared_ptr<TokenWork> &work)
{
    if (!work->jobs.empty() || work->phase == SourcePhase::PREPARING || !work->awaiting_source.empty())
        return std::string();

    auto it = work_.find(work->plan.token);
    if (it == work_.end() || it->second != work)
        return std::string();

    work_.erase(it);
    return work->cache_file;
}

void ProcessingPipeline::onJobTerminal(const std::shared_ptr<TokenWork> &work, const JobHandle &job)
{
    std::string cache_to_remove;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = work->jobs.find(job->stage());
        if (it != work->jobs.end() && it->second == job)
            work->jobs.erase(it);

        auto continuation = work->awaiting_stage.find(job->stage());
        if (continuation != work->awaiting_stage.end())
        {
            JobHandle next = continuation->second;
            work->awaiting_stage.erase(continuation);
            dispatchLocked(work, next);
        }

        cache_to_remove = collectIfIdleLocked(work);
    }

    if (!cache_to_remove.empty())
    {
        std::error_code ec;
        fs::remove(cache_to_remove, ec);
        Logger::debug("Removed source cache " + cache_to_remove);
    }
    idle_cv_.notify_all();
}

bool ProcessingPipeline::cancel(const std::string &token, StageKind stage)
{
    std::shared_ptr<TokenWork> work;
    JobHandle job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = work_.find(token);
        if (it == work_.end())
            return false;
        work = it->second;

        auto job_it = work->jobs.find(stage);
        if (job_it == work->jobs.end())
            return false;
        job = job_it->second;

        auto &waiting = work->awaiting_source;
        waiting.erase(std::remove(waiting.begin(), waiting.end(), job), waiting.end());
        for (auto cont = work->awaiting_stage.begin(); cont != work->awaiting_stage.end();)
        {
            if (cont->second == job)
                cont = work->awaiting_stage.erase(cont);
            else
                ++cont;
        }
    }

    if (job->cancelPending())
    {
        Logger::info("Cancelled pending " + MediaTypes::getStageName(stage) + " for " + token);
        onJobTerminal(work, job);
        return true;
    }

    job->requestCancel();
    // Bounded by the stage timeout; stages check cancellation per frame
    while (!job->waitFor(std::chrono::milliseconds(500)))
    {
        Logger::debug("Waiting for " + MediaTypes::getStageName(stage) + " of " + token + " to stop");
    }
    return true;
}

size_t ProcessingPipeline::cancelAll(const std::string &token)
{
    std::vector<StageKind> stages;
    std::shared_ptr<TokenWork> work;
    std::shared_ptr<DownloadSession> source_session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = work_.find(token);
        if (it == work_.end())
            return 0;
        work = it->second;
        for (const auto &[stage, job] : work->jobs)
            stages.push_back(stage);
        // A source transfer still queued on the arena must not start
        work->source_cancelled = true;
        source_session = work->source_session;
    }
    if (source_session)
        source_session->cancel();

    // Watermark first, so a cancelled target cannot release it as a continuation
    size_t cancelled = 0;
    for (auto it = stages.rbegin(); it != stages.rend(); ++it)
    {
        if (cancel(token, *it))
            ++cancelled;
    }
    if (source_session)
    {
        // Wait until the transfer and its cache file are gone
        std::unique_lock<std::mutex> lock(mutex_);
        while (!idle_cv_.wait_for(lock, std::chrono::milliseconds(500), [&work]
                                  { return !work->source_running; }))
        {
            Logger::debug("Waiting for the source transfer of " + token + " to stop");
        }
    }

    Logger::info("Cancelled " + std::to_string(cancelled) + " jobs for " + token);
    return cancelled;
}

std::vector<JobSnapshot> ProcessingPipeline::snapshot(const std::string &token) const
{
    std::map<StageKind, JobSnapshot> by_stage;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = work_.find(token);
        if (it != work_.end())
        {
            for (const auto &[stage, job] : it->second->jobs)
                by_stage[stage] = job->snapshot();
        }
    }

    // Finished stages are reported from their recorded artifacts
    for (const auto &artifact : registry_.getArtifacts(token))
    {
        if (by_stage.count(artifact.stage))
            continue;
        JobSnapshot snap;
        snap.token = token;
        snap.stage = artifact.stage;
        snap.state = artifact.status == ArtifactStatus::FAILED ? JobState::FAILED : JobState::DONE;
        snap.code = artifact.status == ArtifactStatus::FAILED ? ErrorCode::STAGE_FAILED : ErrorCode::NONE;
        snap.error_message = artifact.error_message;
        snap.artifact = artifact;
        by_stage[artifact.stage] = snap;
    }

    std::vector<JobSnapshot> snapshots;
    for (auto &[stage, snap] : by_stage)
        snapshots.push_back(std::move(snap));
    return snapshots;
}

bool ProcessingPipeline::waitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]
                             { return work_.empty() && running_tasks_ == 0; });
}

void ProcessingPipeline::shutdown()
{
    std::vector<std::string> tokens;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && work_.empty() && running_tasks_ == 0)
            return;
        stopping_ = true;
        for (const auto &[token, work] : work_)
            tokens.push_back(token);
    }

    for (const auto &token : tokens)
        cancelAll(token);

    while (!waitIdle(std::chrono::seconds(5)))
    {
        Logger::warn("Waiting for pipeline workers to finish");
    }
    Logger::info("Processing pipeline stopped");
}
