#include "service/ingestion_coordinator.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

IngestionCoordinator::IngestionCoordinator(const DeepLinkConfig &config, TokenRegistry &registry, ProcessingPipeline &pipeline)
    : config_(config), registry_(registry), pipeline_(pipeline)
{
}

MediaKind IngestionCoordinator::validateKind(const std::string &kind) const
{
    auto parsed = MediaTypes::kindFromString(kind);
    if (!parsed)
        throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Unsupported media kind: '" + kind + "'");
    return *parsed;
}

std::string IngestionCoordinator::validateSource(const SourceHandle &source, MediaKind kind) const
{
    if (source.reference.empty())
        throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Upload has no source");

    std::optional<uint64_t> size = source.size_bytes;
    std::string reference = source.reference;

    if (MediaTypes::isRemoteSource(reference))
    {
        auto host_start = reference.find("://") + 3;
        if (host_start >= reference.size() || reference[host_start] == '/')
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Source URL has no host: " + reference);
        // Unknown length stays admissible; the source transfer enforces the limit
        if (!size)
            size = pipeline_.transfers().sourceFor(reference)->contentLength();
    }
    else
    {
        std::error_code ec;
        fs::path path = fs::absolute(reference, ec);
        if (ec || !fs::is_regular_file(path, ec))
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Source file does not exist: " + reference);
        size = static_cast<uint64_t>(fs::file_size(path, ec));
        if (ec)
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Cannot read source size: " + ec.message());
        reference = path.lexically_normal().string();
    }

    if (size)
    {
        uint64_t limit = kind == MediaKind::VIDEO ? config_.getMaxVideoBytes() : config_.getMaxPhotoBytes();
        if (*size == 0)
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Source is empty: " + reference);
        if (*size > limit)
        {
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, MediaTypes::getKindName(kind) + " of " + std::to_string(*size) +
                                                                 " bytes exceeds the limit of " + std::to_string(limit));
        }
    }
    return reference;
}

std::string IngestionCoordinator::ingest(const UploadRequest &request)
{
    MediaKind kind = validateKind(request.kind);
    std::string source_ref = validateSource(request.source, kind);
    ResolvedOptions resolved = OptionResolver::resolve(request.options, config_);

    // Admission first: nothing is persisted for a rejected upload
    std::unique_ptr<PipelineReservation> reservation;
    if (!resolved.stages.empty())
        reservation = pipeline_.reserve(resolved.stages.size());

    MediaDescriptor descriptor = registry_.registerMedia(source_ref, kind, resolved.content_protection);

    if (resolved.stages.empty())
    {
        Logger::info("Instant link " + descriptor.token + " for " + MediaTypes::getKindName(kind));
        return descriptor.token;
    }

    StagePlan plan;
    plan.token = descriptor.token;
    plan.source_ref = source_ref;
    plan.kind = kind;
    plan.stages = resolved.stages;
    plan.params = resolved.params;
    pipeline_.schedule(plan, *reservation);

    std::string stages;
    for (StageKind stage : resolved.stages)
        stages += (stages.empty() ? "" : ", ") + MediaTypes::getStageName(stage);
    Logger::info("Ingested " + MediaTypes::getKindName(kind) + " as " + descriptor.token + ", scheduled: " + stages);
    return descriptor.token;
}

void IngestionCoordinator::remove(const DeleteRequest &request)
{
    if (request.token.empty())
        throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Delete request has no token");

    size_t cancelled = pipeline_.cancelAll(request.token);
    if (cancelled > 0)
        Logger::info("Stopped " + std::to_string(cancelled) + " jobs before deleting " + request.token);
    registry_.remove(request.token);
}

std::vector<JobSnapshot> IngestionCoordinator::jobStatus(const std::string &token)
{
    registry_.get(token);
    return pipeline_.snapshot(token);
}
