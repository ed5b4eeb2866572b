#pragma once

#include "core/deeplink_config.hpp"
#include "core/media_types.hpp"
#include "database/token_registry.hpp"
#include "transfer/transfer_manager.hpp"
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief Artifact chosen for a token
 *
 * content_protection is a hint for the transport (e.g. forbid forwarding);
 * the gate itself does not enforce it.
 */
struct ResolveResult
{
    std::string token;
    std::string storage_ref;
    std::optional<StageKind> stage; // std::nullopt for the raw source
    MediaKind kind = MediaKind::VIDEO;
    bool content_protection = true;
    TransferManager *transfers = nullptr; // Fetches a remote raw source
    uint64_t max_bytes = 0;

    /**
     * @brief Open the artifact bytes
     *
     * A remote raw source is spooled to a temp file first; the file goes away
     * with the returned stream.
     * @throws DeepLinkError NOT_FOUND if the artifact can no longer be read
     */
    std::unique_ptr<std::istream> openStream() const;
};

/**
 * @brief Resolves tokens to the best available artifact
 *
 * Preference: watermark, preview, collage, raw (preview and collage swap with
 * delivery.prefer_collage). Only done artifacts whose file exists qualify.
 */
class DeliveryGate
{
public:
    DeliveryGate(const DeepLinkConfig &config, TokenRegistry &registry, TransferManager &transfers);

    /**
     * @throws DeepLinkError NOT_FOUND for an unknown token or an unreadable raw source
     */
    ResolveResult resolve(const std::string &token);

private:
    const DeepLinkConfig &config_;
    TokenRegistry &registry_;
    TransferManager &transfers_;
};
