#pragma once

#include "core/cancellation.hpp"
#include "core/deeplink_config.hpp"
#include "core/scoped_temp_dir.hpp"
#include "transfer/chunk_source.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct TransferOptions
{
    size_t concurrency = 8;
    uint64_t chunk_size_bytes = 1024 * 1024;
    int max_retries = 3;
    std::chrono::milliseconds retry_base_delay{100};
    std::chrono::milliseconds chunk_timeout{60000};
    std::chrono::seconds session_timeout{900};
    bool compute_digest = false;

    static TransferOptions fromConfig(const DeepLinkConfig &config);
};

enum class ChunkState
{
    PENDING,
    IN_FLIGHT,
    VERIFIED,
    FAILED
};

struct ChunkInfo
{
    size_t index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
    ChunkState state = ChunkState::PENDING;
    int attempts = 0;
};

struct TransferResult
{
    std::string output_path;
    uint64_t bytes = 0;
    size_t chunks = 0;
    std::string sha256; // Hex, empty unless requested
};

/**
 * @brief One chunked download into a private work directory
 *
 * Chunks are fetched by up to concurrency workers, land as chunk_<i>.part
 * files and are reassembled in offset order. The work directory is removed on
 * every exit path before finished() reports true.
 */
class DownloadSession
{
public:
    /**
     * @param max_bytes Largest accepted source size, 0 for no limit
     */
    DownloadSession(const std::string &id, std::shared_ptr<ChunkSource> source, const std::string &output_path,
                    const TransferOptions &options, const std::filesystem::path &work_parent, uint64_t max_bytes = 0);

    DownloadSession(const DownloadSession &) = delete;
    DownloadSession &operator=(const DownloadSession &) = delete;

    const std::string &id() const { return id_; }

    /**
     * @brief Run the transfer on the calling thread
     * @throws DeepLinkError CANCELLED, CHUNK_FETCH_ERROR, SIZE_MISMATCH, or
     * VALIDATION_ERROR when the source is larger than the byte limit
     */
    TransferResult run();

    // Signal only; pair with waitFinished() to wait for cleanup
    void cancel();
    bool waitFinished(std::chrono::milliseconds timeout);
    bool finished() const;

    std::vector<ChunkInfo> chunkMap() const;

private:
    TransferResult runChunked(const std::filesystem::path &work_dir, uint64_t total);
    TransferResult runSequential(const std::filesystem::path &work_dir);
    void fetchChunk(const std::filesystem::path &work_dir, size_t index);
    bool isLastChunk(size_t index) const;
    void setChunkState(size_t index, ChunkState state);
    void publish(const std::filesystem::path &assembled, TransferResult &result);
    void markFinished();

    std::string id_;
    std::shared_ptr<ChunkSource> source_;
    std::string output_path_;
    TransferOptions options_;
    std::filesystem::path work_parent_;
    uint64_t max_bytes_;

    CancellationToken cancel_;
    std::atomic<bool> abort_{false};

    mutable std::mutex mutex_;
    std::condition_variable finished_cv_;
    bool finished_ = false;
    std::vector<ChunkInfo> chunks_;
    std::exception_ptr first_error_;
};

/**
 * @brief Read-only stream over a downloaded copy; the copy is deleted with the stream
 */
class SpooledFileStream : public std::istream
{
public:
    SpooledFileStream(std::unique_ptr<ScopedTempDir> dir, const std::filesystem::path &file);

private:
    std::unique_ptr<ScopedTempDir> dir_; // Outlives buffer_ so the file is closed before removal
    std::filebuf buffer_;
};

/**
 * @brief Parallel chunked fetcher with retry, reassembly and cancellation
 */
class TransferManager
{
public:
    TransferManager(const TransferOptions &options, const std::filesystem::path &work_parent);
    ~TransferManager();

    TransferManager(const TransferManager &) = delete;
    TransferManager &operator=(const TransferManager &) = delete;

    /**
     * @brief Download source into output_path, blocking until done
     * @param session_id Identifier usable with cancel(); generated when empty
     * @param max_bytes Largest accepted source size, 0 for no limit
     * @throws DeepLinkError CANCELLED, CHUNK_FETCH_ERROR, SIZE_MISMATCH or VALIDATION_ERROR
     */
    TransferResult download(std::shared_ptr<ChunkSource> source, const std::string &output_path,
                            const std::string &session_id = "", uint64_t max_bytes = 0);

    // HttpRangeSource for http(s) references, FileRangeSource otherwise
    TransferResult download(const std::string &reference, const std::string &output_path,
                            const std::string &session_id = "", uint64_t max_bytes = 0);

    /**
     * @brief Register a session without starting it
     *
     * From here on cancel(session_id) finds the session, even before
     * runSession() is called. Every opened session must be run.
     * @throws DeepLinkError VALIDATION_ERROR if the id is already registered
     */
    std::shared_ptr<DownloadSession> openSession(std::shared_ptr<ChunkSource> source, const std::string &output_path,
                                                 const std::string &session_id = "", uint64_t max_bytes = 0);

    // Run an opened session on the calling thread and unregister it
    TransferResult runSession(const std::shared_ptr<DownloadSession> &session);

    /**
     * @brief Download reference into a private temp copy and stream it
     *
     * Memory use does not grow with the source size.
     */
    std::unique_ptr<std::istream> openSpooled(const std::string &reference, uint64_t max_bytes = 0);

    std::shared_ptr<ChunkSource> sourceFor(const std::string &reference) const;

    /**
     * @brief Cancel a running session and wait until its chunks are removed
     * @return false if no session with that id is running
     */
    bool cancel(const std::string &session_id);
    void cancelAll();

    size_t activeSessions() const;
    std::string newSessionId();

    const TransferOptions &options() const { return options_; }

    static std::string sha256File(const std::string &path);

private:
    TransferOptions options_;
    std::filesystem::path work_parent_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<DownloadSession>> sessions_;
    std::atomic<uint64_t> next_session_{0};
};
