#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error taxonomy surfaced by the deep link engine
 */
enum class ErrorCode
{
    NONE,
    VALIDATION_ERROR,    // Bad kind, size, source or option value
    DUPLICATE_TOKEN,     // Token already registered
    NOT_FOUND,           // Unknown token or requested artifact absent
    INSUFFICIENT_FRAMES, // Collage could not sample enough frames
    SIZE_MISMATCH,       // Assembled transfer does not match the expected size
    CHUNK_FETCH_ERROR,   // Chunk retries exhausted or transfer timed out
    BUSY,                // Worker pool queue at capacity
    CANCELLED,           // Cooperative cancellation observed
    STAGE_FAILED,        // Media library failure inside a pipeline stage
    FATAL                // Registry unreachable
};

class ErrorCodes
{
public:
    static std::string getName(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case ErrorCode::DUPLICATE_TOKEN:
            return "DUPLICATE_TOKEN";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::INSUFFICIENT_FRAMES:
            return "INSUFFICIENT_FRAMES";
        case ErrorCode::SIZE_MISMATCH:
            return "SIZE_MISMATCH";
        case ErrorCode::CHUNK_FETCH_ERROR:
            return "CHUNK_FETCH_ERROR";
        case ErrorCode::BUSY:
            return "BUSY";
        case ErrorCode::CANCELLED:
            return "CANCELLED";
        case ErrorCode::STAGE_FAILED:
            return "STAGE_FAILED";
        case ErrorCode::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
        }
    }
};

/**
 * @brief Exception carrying an ErrorCode for callers of the engine
 */
class DeepLinkError : public std::runtime_error
{
public:
    DeepLinkError(ErrorCode code, const std::string &message)
        : std::runtime_error(ErrorCodes::getName(code) + ": " + message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};
