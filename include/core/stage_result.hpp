#pragma once

#include "core/errors.hpp"
#include "core/media_types.hpp"
#include <string>

/**
 * @brief Outcome of one pipeline stage
 *
 * Stages never throw for media library failures; they report through this
 * result and the pipeline records it as the stage's Artifact.
 */
struct StageResult
{
    ArtifactStatus status;
    ErrorCode code;
    std::string error_message;
    std::string output_path; // File produced (or the untouched source for a no-op)
    std::string metadata;    // JSON string

    StageResult() : status(ArtifactStatus::FAILED), code(ErrorCode::STAGE_FAILED) {}

    static StageResult done(const std::string &output, const std::string &metadata = "")
    {
        StageResult result;
        result.status = ArtifactStatus::DONE;
        result.code = ErrorCode::NONE;
        result.output_path = output;
        result.metadata = metadata;
        return result;
    }

    static StageResult noOp(const std::string &output, const std::string &reason)
    {
        StageResult result;
        result.status = ArtifactStatus::NO_OP;
        result.code = ErrorCode::NONE;
        result.output_path = output;
        result.error_message = reason;
        return result;
    }

    static StageResult failed(ErrorCode code, const std::string &message)
    {
        StageResult result;
        result.status = ArtifactStatus::FAILED;
        result.code = code;
        result.error_message = message;
        return result;
    }

    bool succeeded() const { return status == ArtifactStatus::DONE; }
};
