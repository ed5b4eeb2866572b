#include "database/token_registry.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    // RAII wrapper for a prepared statement
    class Statement
    {
    public:
        Statement(sqlite3 *db, const std::string &sql) : db_(db), stmt_(nullptr)
        {
            int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
            if (rc != SQLITE_OK)
            {
                throw DeepLinkError(ErrorCode::FATAL, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
            }
        }

        ~Statement()
        {
            if (stmt_)
                sqlite3_finalize(stmt_);
        }

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        void bind(int index, const std::string &value)
        {
            sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
        }

        void bind(int index, int64_t value)
        {
            sqlite3_bind_int64(stmt_, index, value);
        }

        int step() { return sqlite3_step(stmt_); }

        void stepDone(const std::string &what)
        {
            int rc = step();
            if (rc != SQLITE_DONE)
            {
                throw DeepLinkError(ErrorCode::FATAL, what + " failed: " + std::string(sqlite3_errmsg(db_)));
            }
        }

        std::string text(int column)
        {
            const unsigned char *value = sqlite3_column_text(stmt_, column);
            return value ? reinterpret_cast<const char *>(value) : std::string();
        }

        int64_t int64(int column) { return sqlite3_column_int64(stmt_, column); }

    private:
        sqlite3 *db_;
        sqlite3_stmt *stmt_;
    };

    // Rolls back unless commit() was reached
    class Transaction
    {
    public:
        explicit Transaction(sqlite3 *db) : db_(db), committed_(false)
        {
            if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK)
            {
                throw DeepLinkError(ErrorCode::FATAL, "Failed to begin transaction: " + std::string(sqlite3_errmsg(db_)));
            }
        }

        ~Transaction()
        {
            if (!committed_)
                sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }

        void commit()
        {
            if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
            {
                throw DeepLinkError(ErrorCode::FATAL, "Failed to commit transaction: " + std::string(sqlite3_errmsg(db_)));
            }
            committed_ = true;
        }

    private:
        sqlite3 *db_;
        bool committed_;
    };

    MediaDescriptor readDescriptor(Statement &stmt, int first_column)
    {
        MediaDescriptor descriptor;
        descriptor.token = stmt.text(first_column);
        descriptor.source_ref = stmt.text(first_column + 1);
        descriptor.kind = MediaTypes::kindFromString(stmt.text(first_column + 2)).value_or(MediaKind::VIDEO);
        descriptor.content_protection = stmt.int64(first_column + 3) != 0;
        descriptor.created_at = static_cast<std::time_t>(stmt.int64(first_column + 4));
        return descriptor;
    }

    Artifact readArtifact(Statement &stmt)
    {
        Artifact artifact;
        artifact.token = stmt.text(0);
        artifact.stage = MediaTypes::stageFromString(stmt.text(1)).value_or(StageKind::PREVIEW);
        artifact.storage_ref = stmt.text(2);
        artifact.status = MediaTypes::statusFromString(stmt.text(3));
        artifact.error_message = stmt.text(4);
        artifact.metadata = stmt.text(5);
        artifact.updated_at = static_cast<std::time_t>(stmt.int64(6));
        return artifact;
    }

    const char *const SELECT_ARTIFACT_COLUMNS =
        "SELECT token, stage, storage_ref, status, error_message, metadata, updated_at FROM artifacts ";
}

// ---------------------------------------------------------------------------
// DescriptorCursor

DescriptorCursor::DescriptorCursor(TokenRegistry &registry, size_t page_size)
    : registry_(registry), page_size_(std::max<size_t>(1, page_size)), last_row_id_(0), exhausted_(false)
{
}

std::optional<MediaDescriptor> DescriptorCursor::next()
{
    if (buffer_.empty() && !exhausted_)
    {
        auto page = registry_.fetchPage(last_row_id_, page_size_);
        if (page.size() < page_size_)
            exhausted_ = true;
        for (auto &entry : page)
            buffer_.push_back(std::move(entry));
    }

    if (buffer_.empty())
        return std::nullopt;

    auto [row_id, descriptor] = std::move(buffer_.front());
    buffer_.pop_front();
    last_row_id_ = row_id;
    return descriptor;
}

void DescriptorCursor::reset()
{
    buffer_.clear();
    last_row_id_ = 0;
    exhausted_ = false;
}

// ---------------------------------------------------------------------------
// TokenRegistry

template <typename T>
T TokenRegistry::runQueued(std::function<T()> operation)
{
    return access_queue_->run<T>(std::move(operation));
}

TokenRegistry::TokenRegistry(const std::string &db_path)
    : db_(nullptr), db_path_(db_path)
{
    Logger::info("Opening token registry: " + db_path);
    access_queue_ = std::make_unique<DatabaseAccessQueue>("token_registry");

    runQueued<void>([this]()
                    {
        int rc = sqlite3_open(db_path_.c_str(), &db_);
        if (rc != SQLITE_OK)
        {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw DeepLinkError(ErrorCode::FATAL, "Failed to open database " + db_path_ + ": " + msg);
        }

        sqlite3_busy_timeout(db_, 5000);
        if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK)
        {
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(db_)));
        }
        if (sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr) != SQLITE_OK)
        {
            Logger::warn("Failed to set synchronous=NORMAL: " + std::string(sqlite3_errmsg(db_)));
        }
        executeStatement("PRAGMA foreign_keys=ON;");
        initialize(); });

    Logger::info("Token registry ready: " + db_path);
}

TokenRegistry::~TokenRegistry()
{
    if (access_queue_)
    {
        try
        {
            runQueued<void>([this]()
                            {
                if (db_)
                {
                    sqlite3_close(db_);
                    db_ = nullptr;
                } });
        }
        catch (const std::exception &e)
        {
            Logger::error("Failed to close token registry: " + std::string(e.what()));
        }
        access_queue_->stop();
    }
    Logger::debug("Token registry closed: " + db_path_);
}

void TokenRegistry::executeStatement(const std::string &sql)
{
    char *err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw DeepLinkError(ErrorCode::FATAL, "SQL execution failed: " + msg);
    }
}

void TokenRegistry::initialize()
{
    executeStatement(R"(
        CREATE TABLE IF NOT EXISTS media (
            token TEXT PRIMARY KEY,
            source_ref TEXT NOT NULL,
            media_kind TEXT NOT NULL,
            content_protection INTEGER NOT NULL DEFAULT 1,
            created_at INTEGER NOT NULL
        )
    )");

    executeStatement(R"(
        CREATE TABLE IF NOT EXISTS artifacts (
            token TEXT NOT NULL,
            stage TEXT NOT NULL,
            storage_ref TEXT NOT NULL DEFAULT '',
            status TEXT NOT NULL,
            error_message TEXT NOT NULL DEFAULT '',
            metadata TEXT NOT NULL DEFAULT '',
            updated_at INTEGER NOT NULL,
            PRIMARY KEY (token, stage),
            FOREIGN KEY (token) REFERENCES media(token) ON DELETE CASCADE
        )
    )");

    executeStatement(R"(
        CREATE TABLE IF NOT EXISTS config (
            key TEXT PRIMARY KEY,
            value TEXT
        )
    )");
}

void TokenRegistry::put(const MediaDescriptor &descriptor)
{
    if (descriptor.token.empty())
        throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Descriptor token is empty");

    MediaDescriptor row = descriptor;
    if (row.created_at == 0)
        row.created_at = std::time(nullptr);

    runQueued<void>([this, row]()
                    {
        Statement stmt(db_, R"(
            INSERT INTO media (token, source_ref, media_kind, content_protection, created_at)
            VALUES (?, ?, ?, ?, ?)
        )");
        stmt.bind(1, row.token);
        stmt.bind(2, row.source_ref);
        stmt.bind(3, MediaTypes::getKindName(row.kind));
        stmt.bind(4, static_cast<int64_t>(row.content_protection ? 1 : 0));
        stmt.bind(5, static_cast<int64_t>(row.created_at));

        int rc = stmt.step();
        if (rc == SQLITE_CONSTRAINT)
        {
            throw DeepLinkError(ErrorCode::DUPLICATE_TOKEN, "Token already registered: " + row.token);
        }
        if (rc != SQLITE_DONE)
        {
            throw DeepLinkError(ErrorCode::FATAL, "Failed to insert media record: " + std::string(sqlite3_errmsg(db_)));
        } });

    Logger::debug("Registered token " + row.token + " (" + MediaTypes::getKindName(row.kind) + ")");
}

MediaDescriptor TokenRegistry::registerMedia(const std::string &source_ref, MediaKind kind, bool content_protection)
{
    MediaDescriptor descriptor(std::string(), source_ref, kind, content_protection, std::time(nullptr));
    while (true)
    {
        descriptor.token = generateToken();
        try
        {
            put(descriptor);
            return descriptor;
        }
        catch (const DeepLinkError &e)
        {
            if (e.code() != ErrorCode::DUPLICATE_TOKEN)
                throw;
            Logger::warn("Token collision on " + descriptor.token + ", generating a new token");
        }
    }
}

std::optional<MediaDescriptor> TokenRegistry::find(const std::string &token)
{
    return runQueued<std::optional<MediaDescriptor>>([this, token]() -> std::optional<MediaDescriptor>
                                                     {
        Statement stmt(db_, R"(
            SELECT token, source_ref, media_kind, content_protection, created_at
            FROM media WHERE token = ?
        )");
        stmt.bind(1, token);
        if (stmt.step() != SQLITE_ROW)
            return std::nullopt;
        return readDescriptor(stmt, 0); });
}

MediaDescriptor TokenRegistry::get(const std::string &token)
{
    auto descriptor = find(token);
    if (!descriptor)
        throw DeepLinkError(ErrorCode::NOT_FOUND, "Unknown token: " + token);
    return *descriptor;
}

void TokenRegistry::attachArtifact(const Artifact &artifact)
{
    Artifact row = artifact;
    if (row.updated_at == 0)
        row.updated_at = std::time(nullptr);

    auto replaced = runQueued<std::string>([this, row]()
                                           {
        Transaction tx(db_);

        Statement exists(db_, "SELECT 1 FROM media WHERE token = ?");
        exists.bind(1, row.token);
        if (exists.step() != SQLITE_ROW)
        {
            throw DeepLinkError(ErrorCode::NOT_FOUND, "Cannot attach artifact to unknown token: " + row.token);
        }

        std::string previous_ref;
        Statement previous(db_, "SELECT storage_ref, status FROM artifacts WHERE token = ? AND stage = ?");
        previous.bind(1, row.token);
        previous.bind(2, MediaTypes::getStageName(row.stage));
        if (previous.step() == SQLITE_ROW && previous.text(1) == MediaTypes::getStatusName(ArtifactStatus::DONE))
        {
            previous_ref = previous.text(0);
        }

        Statement upsert(db_, R"(
            INSERT OR REPLACE INTO artifacts
                (token, stage, storage_ref, status, error_message, metadata, updated_at)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )");
        upsert.bind(1, row.token);
        upsert.bind(2, MediaTypes::getStageName(row.stage));
        upsert.bind(3, row.storage_ref);
        upsert.bind(4, MediaTypes::getStatusName(row.status));
        upsert.bind(5, row.error_message);
        upsert.bind(6, row.metadata);
        upsert.bind(7, static_cast<int64_t>(row.updated_at));
        upsert.stepDone("Artifact upsert");

        tx.commit();
        return previous_ref != row.storage_ref ? previous_ref : std::string(); });

    if (!replaced.empty())
        releaseStorage({replaced});

    Logger::debug("Attached " + MediaTypes::getStageName(row.stage) + " artifact (" +
                  MediaTypes::getStatusName(row.status) + ") to token " + row.token);
}

std::vector<Artifact> TokenRegistry::getArtifacts(const std::string &token)
{
    return runQueued<std::vector<Artifact>>([this, token]()
                                            {
        std::vector<Artifact> artifacts;
        Statement stmt(db_, std::string(SELECT_ARTIFACT_COLUMNS) + "WHERE token = ? ORDER BY stage");
        stmt.bind(1, token);
        while (stmt.step() == SQLITE_ROW)
        {
            artifacts.push_back(readArtifact(stmt));
        }
        return artifacts; });
}

std::optional<Artifact> TokenRegistry::getArtifact(const std::string &token, StageKind stage)
{
    return runQueued<std::optional<Artifact>>([this, token, stage]() -> std::optional<Artifact>
                                              {
        Statement stmt(db_, std::string(SELECT_ARTIFACT_COLUMNS) + "WHERE token = ? AND stage = ?");
        stmt.bind(1, token);
        stmt.bind(2, MediaTypes::getStageName(stage));
        if (stmt.step() != SQLITE_ROW)
            return std::nullopt;
        return readArtifact(stmt); });
}

void TokenRegistry::remove(const std::string &token)
{
    auto storage_refs = runQueued<std::vector<std::string>>([this, token]()
                                                            {
        Transaction tx(db_);

        std::vector<std::string> refs;
        Statement owned(db_, "SELECT storage_ref FROM artifacts WHERE token = ? AND status = ?");
        owned.bind(1, token);
        owned.bind(2, MediaTypes::getStatusName(ArtifactStatus::DONE));
        while (owned.step() == SQLITE_ROW)
        {
            refs.push_back(owned.text(0));
        }

        Statement artifacts(db_, "DELETE FROM artifacts WHERE token = ?");
        artifacts.bind(1, token);
        artifacts.stepDone("Artifact delete");

        Statement media(db_, "DELETE FROM media WHERE token = ?");
        media.bind(1, token);
        media.stepDone("Media delete");
        if (sqlite3_changes(db_) == 0)
        {
            throw DeepLinkError(ErrorCode::NOT_FOUND, "Unknown token: " + token);
        }

        tx.commit();
        return refs; });

    releaseStorage(storage_refs);
    Logger::info("Deleted token " + token + " and " + std::to_string(storage_refs.size()) + " stored artifacts");
}

void TokenRegistry::releaseStorage(const std::vector<std::string> &storage_refs)
{
    for (const auto &ref : storage_refs)
    {
        if (ref.empty())
            continue;

        std::error_code ec;
        fs::path file(ref);
        fs::remove(file, ec);
        if (ec)
        {
            Logger::warn("Could not remove artifact file " + ref + ": " + ec.message());
            continue;
        }

        // Per-token artifact directory goes away with its last file
        fs::path parent = file.parent_path();
        if (!parent.empty() && fs::is_directory(parent, ec) && fs::is_empty(parent, ec))
        {
            fs::remove(parent, ec);
        }
    }
}

std::vector<std::pair<int64_t, MediaDescriptor>> TokenRegistry::fetchPage(int64_t after_row_id, size_t limit)
{
    return runQueued<std::vector<std::pair<int64_t, MediaDescriptor>>>([this, after_row_id, limit]()
                                                                       {
        std::vector<std::pair<int64_t, MediaDescriptor>> page;
        Statement stmt(db_, R"(
            SELECT rowid, token, source_ref, media_kind, content_protection, created_at
            FROM media WHERE rowid > ? ORDER BY rowid LIMIT ?
        )");
        stmt.bind(1, after_row_id);
        stmt.bind(2, static_cast<int64_t>(limit));
        while (stmt.step() == SQLITE_ROW)
        {
            page.emplace_back(stmt.int64(0), readDescriptor(stmt, 1));
        }
        return page; });
}

DescriptorCursor TokenRegistry::list(size_t page_size)
{
    return DescriptorCursor(*this, page_size);
}

size_t TokenRegistry::count()
{
    return runQueued<size_t>([this]()
                             {
        Statement stmt(db_, "SELECT COUNT(*) FROM media");
        if (stmt.step() != SQLITE_ROW)
            return size_t(0);
        return static_cast<size_t>(stmt.int64(0)); });
}

void TokenRegistry::setConfigValue(const std::string &key, const std::string &json_value)
{
    runQueued<void>([this, key, json_value]()
                    {
        Statement stmt(db_, "INSERT OR REPLACE INTO config (key, value) VALUES (?, ?)");
        stmt.bind(1, key);
        stmt.bind(2, json_value);
        stmt.stepDone("Config upsert"); });
    Logger::info("Saved config: " + key + " = " + json_value);
}

std::map<std::string, std::string> TokenRegistry::getConfigValues()
{
    return runQueued<std::map<std::string, std::string>>([this]()
                                                         {
        std::map<std::string, std::string> values;
        Statement stmt(db_, "SELECT key, value FROM config");
        while (stmt.step() == SQLITE_ROW)
        {
            values[stmt.text(0)] = stmt.text(1);
        }
        return values; });
}

std::string TokenRegistry::generateToken()
{
    unsigned char entropy[TOKEN_ENTROPY_BYTES];
    if (RAND_bytes(entropy, static_cast<int>(sizeof(entropy))) != 1)
    {
        throw DeepLinkError(ErrorCode::FATAL, "RAND_bytes failed to produce token entropy");
    }

    // 12 bytes encode to exactly 16 base64 characters, no padding
    unsigned char encoded[4 * ((TOKEN_ENTROPY_BYTES + 2) / 3) + 1];
    int length = EVP_EncodeBlock(encoded, entropy, static_cast<int>(sizeof(entropy)));

    std::string token(reinterpret_cast<const char *>(encoded), static_cast<size_t>(length));
    for (auto &c : token)
    {
        if (c == '+')
            c = '-';
        else if (c == '/')
            c = '_';
    }
    token.erase(std::remove(token.begin(), token.end(), '='), token.end());
    return token;
}
