#include "service/delivery_gate.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

std::unique_ptr<std::istream> ResolveResult::openStream() const
{
    if (MediaTypes::isRemoteSource(storage_ref))
    {
        if (!transfers)
            throw DeepLinkError(ErrorCode::NOT_FOUND, "Link unavailable: no transfer manager for " + storage_ref);
        try
        {
            return transfers->openSpooled(storage_ref, max_bytes);
        }
        catch (const std::exception &e)
        {
            throw DeepLinkError(ErrorCode::NOT_FOUND, "Link unavailable: " + std::string(e.what()));
        }
    }

    auto file = std::make_unique<std::ifstream>(storage_ref, std::ios::binary);
    if (!file->is_open())
        throw DeepLinkError(ErrorCode::NOT_FOUND, "Link unavailable: " + storage_ref);
    return file;
}

DeliveryGate::DeliveryGate(const DeepLinkConfig &config, TokenRegistry &registry, TransferManager &transfers)
    : config_(config), registry_(registry), transfers_(transfers)
{
}

ResolveResult DeliveryGate::resolve(const std::string &token)
{
    MediaDescriptor descriptor = registry_.get(token);

    ResolveResult result;
    result.token = token;
    result.kind = descriptor.kind;
    result.content_protection = descriptor.content_protection;
    result.transfers = &transfers_;
    result.max_bytes = descriptor.kind == MediaKind::VIDEO ? config_.getMaxVideoBytes() : config_.getMaxPhotoBytes();

    std::vector<StageKind> preference = {StageKind::WATERMARK, StageKind::PREVIEW, StageKind::COLLAGE};
    if (config_.getPreferCollage())
        preference = {StageKind::WATERMARK, StageKind::COLLAGE, StageKind::PREVIEW};

    auto artifacts = registry_.getArtifacts(token);
    for (StageKind stage : preference)
    {
        for (const auto &artifact : artifacts)
        {
            if (artifact.stage != stage || artifact.status != ArtifactStatus::DONE)
                continue;

            std::error_code ec;
            if (!fs::exists(artifact.storage_ref, ec))
            {
                Logger::warn("Artifact file missing for " + token + "/" + MediaTypes::getStageName(stage) + ": " +
                             artifact.storage_ref);
                continue;
            }

            result.storage_ref = artifact.storage_ref;
            result.stage = stage;
            Logger::debug("Resolved " + token + " to " + MediaTypes::getStageName(stage));
            return result;
        }
    }

    if (!MediaTypes::isRemoteSource(descriptor.source_ref))
    {
        std::error_code ec;
        if (!fs::exists(descriptor.source_ref, ec))
            throw DeepLinkError(ErrorCode::NOT_FOUND, "Link unavailable: source of " + token + " is gone");
    }

    result.storage_ref = descriptor.source_ref;
    Logger::debug("Resolved " + token + " to the original upload");
    return result;
}
