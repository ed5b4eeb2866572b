#pragma once

#include "core/media_types.hpp"
#include "database/database_access_queue.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sqlite3.h>

class TokenRegistry;

/**
 * @brief Lazy, restartable sequence over stored descriptors
 *
 * Pages are fetched on demand in insertion order. reset() restarts from the
 * first record; descriptors inserted after the cursor passed their position
 * are picked up by the next pass.
 */
class DescriptorCursor
{
public:
    DescriptorCursor(TokenRegistry &registry, size_t page_size);

    std::optional<MediaDescriptor> next();
    void reset();

private:
    TokenRegistry &registry_;
    size_t page_size_;
    int64_t last_row_id_;
    bool exhausted_;
    std::deque<std::pair<int64_t, MediaDescriptor>> buffer_;
};

/**
 * @brief Durable token -> media descriptor + artifact records (SQLite)
 *
 * Every statement runs on the registry's DatabaseAccessQueue thread, so each
 * mutation is atomic per token and no lock is held while artifact files are
 * removed.
 */
class TokenRegistry
{
public:
    /**
     * @brief Open (or create) the registry database
     * @throws DeepLinkError FATAL if the database cannot be opened or initialized
     */
    explicit TokenRegistry(const std::string &db_path);
    ~TokenRegistry();

    TokenRegistry(const TokenRegistry &) = delete;
    TokenRegistry &operator=(const TokenRegistry &) = delete;

    /**
     * @brief Insert a descriptor
     * @throws DeepLinkError DUPLICATE_TOKEN if the token already exists
     */
    void put(const MediaDescriptor &descriptor);

    /**
     * @brief Generate a fresh token and put a descriptor for it
     *
     * Token collisions are retried with a new token rather than surfaced.
     */
    MediaDescriptor registerMedia(const std::string &source_ref, MediaKind kind, bool content_protection);

    /**
     * @throws DeepLinkError NOT_FOUND for an unknown token
     */
    MediaDescriptor get(const std::string &token);

    std::optional<MediaDescriptor> find(const std::string &token);

    /**
     * @brief Upsert keyed by (token, stage); replaced storage is released
     * @throws DeepLinkError NOT_FOUND if the token no longer exists
     */
    void attachArtifact(const Artifact &artifact);

    std::vector<Artifact> getArtifacts(const std::string &token);
    std::optional<Artifact> getArtifact(const std::string &token, StageKind stage);

    /**
     * @brief Delete a token with all its artifacts and their stored files
     * @throws DeepLinkError NOT_FOUND for an unknown token
     */
    void remove(const std::string &token);

    DescriptorCursor list(size_t page_size = 100);
    size_t count();

    // Config record set (dotted key -> JSON encoded value)
    void setConfigValue(const std::string &key, const std::string &json_value);
    std::map<std::string, std::string> getConfigValues();

    /**
     * @brief Random URL-safe token carrying TOKEN_ENTROPY_BYTES of entropy
     */
    static std::string generateToken();
    static constexpr size_t TOKEN_ENTROPY_BYTES = 12;

    const std::string &path() const { return db_path_; }

    // Used by DescriptorCursor
    std::vector<std::pair<int64_t, MediaDescriptor>> fetchPage(int64_t after_row_id, size_t limit);

private:
    template <typename T>
    T runQueued(std::function<T()> operation);

    void initialize();
    void executeStatement(const std::string &sql);
    void releaseStorage(const std::vector<std::string> &storage_refs);

    sqlite3 *db_;
    std::string db_path_;
    std::unique_ptr<DatabaseAccessQueue> access_queue_;
};
