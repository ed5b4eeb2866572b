#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

enum class MediaKind
{
    VIDEO,
    PHOTO
};

enum class StageKind
{
    PREVIEW,
    COLLAGE,
    WATERMARK
};

enum class ArtifactStatus
{
    DONE,
    FAILED,
    NO_OP // Stage not applicable, source delivered unchanged
};

/**
 * @brief Immutable record published behind a deep link token
 */
struct MediaDescriptor
{
    std::string token;
    std::string source_ref; // Local path, remote URL or transport file id
    MediaKind kind;
    bool content_protection;
    std::time_t created_at;

    MediaDescriptor() : kind(MediaKind::VIDEO), content_protection(true), created_at(0) {}
    MediaDescriptor(const std::string &t, const std::string &src, MediaKind k, bool protect = true, std::time_t created = 0)
        : token(t), source_ref(src), kind(k), content_protection(protect), created_at(created) {}
};

/**
 * @brief Derived artifact record, at most one per (token, stage)
 */
struct Artifact
{
    std::string token;
    StageKind stage;
    std::string storage_ref;
    ArtifactStatus status;
    std::string error_message;
    std::string metadata; // JSON text
    std::time_t updated_at;

    Artifact() : stage(StageKind::PREVIEW), status(ArtifactStatus::FAILED), updated_at(0) {}
};

class MediaTypes
{
public:
    static const std::vector<StageKind> &allStages()
    {
        static const std::vector<StageKind> stages = {StageKind::PREVIEW, StageKind::COLLAGE, StageKind::WATERMARK};
        return stages;
    }

    static std::string getKindName(MediaKind kind)
    {
        switch (kind)
        {
        case MediaKind::VIDEO:
            return "video";
        case MediaKind::PHOTO:
            return "photo";
        default:
            return "unknown";
        }
    }

    static std::optional<MediaKind> kindFromString(const std::string &name)
    {
        if (name == "video" || name == "VIDEO")
            return MediaKind::VIDEO;
        if (name == "photo" || name == "PHOTO")
            return MediaKind::PHOTO;
        return std::nullopt;
    }

    static std::string getStageName(StageKind stage)
    {
        switch (stage)
        {
        case StageKind::PREVIEW:
            return "preview";
        case StageKind::COLLAGE:
            return "collage";
        case StageKind::WATERMARK:
            return "watermark";
        default:
            return "unknown";
        }
    }

    static std::optional<StageKind> stageFromString(const std::string &name)
    {
        if (name == "preview")
            return StageKind::PREVIEW;
        if (name == "collage")
            return StageKind::COLLAGE;
        if (name == "watermark")
            return StageKind::WATERMARK;
        return std::nullopt;
    }

    static std::string getStatusName(ArtifactStatus status)
    {
        switch (status)
        {
        case ArtifactStatus::DONE:
            return "done";
        case ArtifactStatus::FAILED:
            return "failed";
        case ArtifactStatus::NO_OP:
            return "no-op";
        default:
            return "unknown";
        }
    }

    static ArtifactStatus statusFromString(const std::string &name)
    {
        if (name == "done")
            return ArtifactStatus::DONE;
        if (name == "no-op")
            return ArtifactStatus::NO_OP;
        return ArtifactStatus::FAILED;
    }

    static bool isRemoteSource(const std::string &source_ref)
    {
        return source_ref.rfind("http://", 0) == 0 || source_ref.rfind("https://", 0) == 0;
    }
};
