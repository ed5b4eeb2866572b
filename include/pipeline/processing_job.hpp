#pragma once

#include "core/cancellation.hpp"
#include "core/errors.hpp"
#include "core/media_types.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Job lifecycle: PENDING -> RUNNING -> {DONE, FAILED, CANCELLED},
 * PENDING -> {FAILED, CANCELLED}
 */
enum class JobState
{
    PENDING,
    RUNNING,
    DONE,
    FAILED,
    CANCELLED
};

struct JobSnapshot
{
    std::string token;
    StageKind stage = StageKind::PREVIEW;
    JobState state = JobState::PENDING;
    ErrorCode code = ErrorCode::NONE;
    std::string error_message;
    std::optional<Artifact> artifact; // Recorded artifact once terminal
};

/**
 * @brief One (token, stage) unit of work shared between the pipeline and callers
 */
class ProcessingJob
{
public:
    ProcessingJob(const std::string &token, StageKind stage);

    ProcessingJob(const ProcessingJob &) = delete;
    ProcessingJob &operator=(const ProcessingJob &) = delete;

    const std::string &token() const { return token_; }
    StageKind stage() const { return stage_; }

    JobState state() const;
    bool isTerminal() const;
    JobSnapshot snapshot() const;

    /**
     * @brief Wait until the job is terminal
     * @return true if terminal within timeout
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

    CancellationToken &cancellation() { return cancel_; }

    // PENDING -> RUNNING, arming the stage timeout; false if no longer pending
    bool start(std::chrono::milliseconds timeout);

    // RUNNING -> DONE (done or no-op artifact), RUNNING/PENDING -> FAILED; false if the transition is not allowed
    bool complete(const Artifact &artifact);
    bool fail(ErrorCode code, const std::string &message, const std::optional<Artifact> &artifact = std::nullopt);

    // PENDING -> CANCELLED; false if the job already left PENDING
    bool cancelPending();
    // RUNNING -> CANCELLED after the stage observed its cancellation
    void markCancelled(const std::string &message);

    // Signal a running stage to stop at its next checkpoint
    void requestCancel() { cancel_.cancel(); }

    static std::string getStateName(JobState state);

private:
    bool transition(JobState to);

    std::string token_;
    StageKind stage_;
    CancellationToken cancel_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    JobState state_;
    ErrorCode code_;
    std::string error_message_;
    std::optional<Artifact> artifact_;
};

using JobHandle = std::shared_ptr<ProcessingJob>;
