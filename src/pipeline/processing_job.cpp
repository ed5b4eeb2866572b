#include "pipeline/processing_job.hpp"
#include "logging/logger.hpp"

ProcessingJob::ProcessingJob(const std::string &token, StageKind stage)
    : token_(token), stage_(stage), state_(JobState::PENDING), code_(ErrorCode::NONE)
{
}

std::string ProcessingJob::getStateName(JobState state)
{
    switch (state)
    {
    case JobState::PENDING:
        return "pending";
    case JobState::RUNNING:
        return "running";
    case JobState::DONE:
        return "done";
    case JobState::FAILED:
        return "failed";
    case JobState::CANCELLED:
        return "cancelled";
    default:
        return "unknown";
    }
}

JobState ProcessingJob::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ProcessingJob::isTerminal() const
{
    JobState s = state();
    return s == JobState::DONE || s == JobState::FAILED || s == JobState::CANCELLED;
}

JobSnapshot ProcessingJob::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    JobSnapshot snap;
    snap.token = token_;
    snap.stage = stage_;
    snap.state = state_;
    snap.code = code_;
    snap.error_message = error_message_;
    snap.artifact = artifact_;
    return snap;
}

bool ProcessingJob::waitFor(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]
                        { return state_ == JobState::DONE || state_ == JobState::FAILED || state_ == JobState::CANCELLED; });
}

// Caller holds mutex_
bool ProcessingJob::transition(JobState to)
{
    bool allowed = false;
    switch (state_)
    {
    case JobState::PENDING:
        allowed = to == JobState::RUNNING || to == JobState::FAILED || to == JobState::CANCELLED;
        break;
    case JobState::RUNNING:
        allowed = to == JobState::DONE || to == JobState::FAILED || to == JobState::CANCELLED;
        break;
    default:
        allowed = false;
        break;
    }

    if (!allowed)
    {
        Logger::debug("Ignoring " + getStateName(state_) + " -> " + getStateName(to) + " for " + token_ + "/" +
                      MediaTypes::getStageName(stage_));
        return false;
    }
    state_ = to;
    return true;
}

bool ProcessingJob::start(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != JobState::PENDING || cancel_.isCancelled())
        return false;
    cancel_.armTimeout(timeout);
    return transition(JobState::RUNNING);
}

bool ProcessingJob::complete(const Artifact &artifact)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!transition(JobState::DONE))
            return false;
        artifact_ = artifact;
    }
    cv_.notify_all();
    return true;
}

bool ProcessingJob::fail(ErrorCode code, const std::string &message, const std::optional<Artifact> &artifact)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!transition(JobState::FAILED))
            return false;
        code_ = code;
        error_message_ = message;
        artifact_ = artifact;
    }
    cv_.notify_all();
    return true;
}

bool ProcessingJob::cancelPending()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != JobState::PENDING)
            return false;
        cancel_.cancel();
        transition(JobState::CANCELLED);
        code_ = ErrorCode::CANCELLED;
        error_message_ = "Cancelled before start";
    }
    cv_.notify_all();
    return true;
}

void ProcessingJob::markCancelled(const std::string &message)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!transition(JobState::CANCELLED))
            return;
        code_ = ErrorCode::CANCELLED;
        error_message_ = message;
    }
    cv_.notify_all();
}
