#pragma once

#include "core/deeplink_config.hpp"
#include "core/processing_options.hpp"
#include "database/token_registry.hpp"
#include "pipeline/processing_pipeline.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Where an upload's bytes live: a local path or an http(s) URL
 */
struct SourceHandle
{
    std::string reference;
    std::optional<uint64_t> size_bytes; // Required for the size check of remote sources
};

struct UploadRequest
{
    SourceHandle source;
    std::string kind; // "video" or "photo"
    ProcessingOptions options;
};

struct DeleteRequest
{
    std::string token;
};

/**
 * @brief Admission of uploads: validate, register, schedule
 *
 * ingest() returns as soon as the descriptor is durable; derived artifacts are
 * produced asynchronously by the ProcessingPipeline.
 */
class IngestionCoordinator
{
public:
    IngestionCoordinator(const DeepLinkConfig &config, TokenRegistry &registry, ProcessingPipeline &pipeline);

    /**
     * @brief Register an upload and schedule its requested stages
     * @return The new token
     * @throws DeepLinkError VALIDATION_ERROR, BUSY or FATAL
     */
    std::string ingest(const UploadRequest &request);

    /**
     * @brief Cancel in-flight jobs of the token, then delete it with its artifacts
     * @throws DeepLinkError NOT_FOUND for an unknown token
     */
    void remove(const DeleteRequest &request);

    // Per-stage job state for diagnostics
    std::vector<JobSnapshot> jobStatus(const std::string &token);

private:
    MediaKind validateKind(const std::string &kind) const;
    std::string validateSource(const SourceHandle &source, MediaKind kind) const;

    const DeepLinkConfig &config_;
    TokenRegistry &registry_;
    ProcessingPipeline &pipeline_;
};
