#include "transfer/transfer_manager.hpp"
#include "core/errors.hpp"
#include "core/media_types.hpp"
#include "core/scoped_temp_dir.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <openssl/sha.h>

namespace fs = std::filesystem;

namespace
{
    const char *const WORK_PREFIX = "transfer_";
    // Shares WORK_PREFIX so the startup sweep also clears abandoned spools
    const char *const SPOOL_PREFIX = "transfer_spool_";

    // Forwards writes to target until limit bytes; refuses anything beyond it
    class BoundedOutputBuffer : public std::streambuf
    {
    public:
        BoundedOutputBuffer(std::ostream &target, uint64_t limit) : target_(target), limit_(limit) {}

        bool exceeded() const { return exceeded_; }

    protected:
        std::streamsize xsputn(const char *data, std::streamsize count) override
        {
            if (limit_ > 0 && written_ + static_cast<uint64_t>(count) > limit_)
            {
                exceeded_ = true;
                return 0;
            }
            target_.write(data, count);
            if (!target_)
                return 0;
            written_ += static_cast<uint64_t>(count);
            return count;
        }

        int_type overflow(int_type ch) override
        {
            if (traits_type::eq_int_type(ch, traits_type::eof()))
                return traits_type::not_eof(ch);
            char c = traits_type::to_char_type(ch);
            return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
        }

        int sync() override
        {
            target_.flush();
            return target_ ? 0 : -1;
        }

    private:
        std::ostream &target_;
        uint64_t limit_;
        uint64_t written_ = 0;
        bool exceeded_ = false;
    };

    // base * 2^attempt, with the exponent capped so the shift cannot overflow
    std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base, int attempt)
    {
        int exponent = std::clamp(attempt, 0, TransferLimits::MAX_RETRIES);
        return base * (int64_t{1} << exponent);
    }

    std::string chunkFileName(size_t index)
    {
        return "chunk_" + std::to_string(index) + ".part";
    }

    // Rename, or copy when the work directory sits on another filesystem
    void moveFile(const fs::path &from, const fs::path &to)
    {
        if (!to.parent_path().empty())
            fs::create_directories(to.parent_path());

        std::error_code ec;
        fs::rename(from, to, ec);
        if (ec)
        {
            fs::copy_file(from, to, fs::copy_options::overwrite_existing);
            fs::remove(from);
        }
    }
}

TransferOptions TransferOptions::fromConfig(const DeepLinkConfig &config)
{
    TransferOptions options;
    options.concurrency = static_cast<size_t>(config.getTransferConcurrency());
    options.chunk_size_bytes = config.getChunkSizeBytes();
    options.max_retries = config.getMaxRetries();
    options.retry_base_delay = std::chrono::milliseconds(config.getRetryBaseDelayMs());
    options.chunk_timeout = std::chrono::milliseconds(config.getChunkTimeoutMs());
    options.session_timeout = std::chrono::seconds(config.getSessionTimeoutSeconds());
    return options;
}

// ---------------------------------------------------------------------------
// DownloadSession

DownloadSession::DownloadSession(const std::string &id, std::shared_ptr<ChunkSource> source, const std::string &output_path,
                                 const TransferOptions &options, const fs::path &work_parent, uint64_t max_bytes)
    : id_(id), source_(std::move(source)), output_path_(output_path), options_(options), work_parent_(work_parent),
      max_bytes_(max_bytes), cancel_(std::chrono::duration_cast<std::chrono::milliseconds>(options.session_timeout))
{
    options_.concurrency = std::max<size_t>(1, options_.concurrency);
    options_.chunk_size_bytes = std::max<uint64_t>(1, options_.chunk_size_bytes);
    options_.max_retries = std::clamp(options_.max_retries, 0, TransferLimits::MAX_RETRIES);
}

void DownloadSession::cancel()
{
    cancel_.cancel();
}

bool DownloadSession::waitFinished(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_cv_.wait_for(lock, timeout, [this]
                                 { return finished_; });
}

bool DownloadSession::finished() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

void DownloadSession::markFinished()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

std::vector<ChunkInfo> DownloadSession::chunkMap() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

bool DownloadSession::isLastChunk(size_t index) const
{
    return index + 1 == chunks_.size();
}

void DownloadSession::setChunkState(size_t index, ChunkState state)
{
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_[index].state = state;
    if (state == ChunkState::IN_FLIGHT)
        chunks_[index].attempts++;
}

TransferResult DownloadSession::run()
{
    // Declared first so it fires after the work directory is gone
    struct FinishGuard
    {
        DownloadSession &session;
        ~FinishGuard() { session.markFinished(); }
    } finish_guard{*this};

    // Cancelled before it started: touch neither the source nor the disk
    if (cancel_.isCancelled())
        throw DeepLinkError(ErrorCode::CANCELLED, "Transfer " + id_ + " cancelled");

    ScopedTempDir work_dir(work_parent_, WORK_PREFIX);
    Logger::info("Transfer " + id_ + " started: " + source_->describe());

    auto total = source_->contentLength();
    cancel_.throwIfStopped("Transfer " + id_, ErrorCode::CHUNK_FETCH_ERROR);

    TransferResult result = total ? runChunked(work_dir.path(), *total) : runSequential(work_dir.path());

    if (options_.compute_digest)
        result.sha256 = TransferManager::sha256File(result.output_path);

    Logger::info("Transfer " + id_ + " completed: " + std::to_string(result.bytes) + " bytes in " +
                 std::to_string(result.chunks) + " chunks");
    return result;
}

TransferResult DownloadSession::runChunked(const fs::path &work_dir, uint64_t total)
{
    if (max_bytes_ > 0 && total > max_bytes_)
    {
        throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Transfer " + id_ + ": source has " + std::to_string(total) +
                                                             " bytes, limit is " + std::to_string(max_bytes_));
    }

    size_t count = static_cast<size_t>((total + options_.chunk_size_bytes - 1) / options_.chunk_size_bytes);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.clear();
        for (size_t i = 0; i < count; ++i)
        {
            ChunkInfo chunk;
            chunk.index = i;
            chunk.offset = i * options_.chunk_size_bytes;
            chunk.length = std::min<uint64_t>(options_.chunk_size_bytes, total - chunk.offset);
            chunks_.push_back(chunk);
        }
    }

    std::atomic<size_t> next_chunk{0};
    size_t worker_count = std::min(options_.concurrency, std::max<size_t>(1, count));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t w = 0; w < worker_count; ++w)
    {
        workers.emplace_back([this, &work_dir, &next_chunk, count]()
                             {
            while (!cancel_.shouldStop() && !abort_.load())
            {
                size_t index = next_chunk.fetch_add(1);
                if (index >= count)
                    break;
                try
                {
                    fetchChunk(work_dir, index);
                }
                catch (const std::exception &)
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!first_error_)
                        first_error_ = std::current_exception();
                    abort_.store(true);
                }
            } });
    }
    for (auto &worker : workers)
        worker.join();

    if (cancel_.isCancelled())
    {
        Logger::info("Transfer " + id_ + " cancelled, discarding chunks");
        throw DeepLinkError(ErrorCode::CANCELLED, "Transfer " + id_ + " cancelled");
    }
    cancel_.throwIfStopped("Transfer " + id_, ErrorCode::CHUNK_FETCH_ERROR);
    if (first_error_)
        std::rethrow_exception(first_error_);

    // Reassemble in offset order regardless of completion order
    fs::path assembled = work_dir / "assembled.part";
    {
        std::ofstream out(assembled, std::ios::binary | std::ios::trunc);
        if (!out)
            throw DeepLinkError(ErrorCode::CHUNK_FETCH_ERROR, "Cannot create " + assembled.string());
        for (size_t i = 0; i < count; ++i)
        {
            std::ifstream in(work_dir / chunkFileName(i), std::ios::binary);
            if (!in)
                throw DeepLinkError(ErrorCode::CHUNK_FETCH_ERROR, "Missing chunk " + std::to_string(i));
            out << in.rdbuf();
        }
        out.flush();
        if (!out)
            throw DeepLinkError(ErrorCode::CHUNK_FETCH_ERROR, "Write failed while assembling " + assembled.string());
    }

    uint64_t assembled_size = fs::file_size(assembled);
    if (assembled_size != total)
    {
        fs::remove(assembled);
        throw DeepLinkError(ErrorCode::SIZE_MISMATCH, "Transfer " + id_ + " assembled " + std::to_string(assembled_size) +
                                                          " bytes, expected " + std::to_string(total));
    }

    TransferResult result;
    result.bytes = assembled_size;
    result.chunks = count;
    publish(assembled, result);
    return result;
}

TransferResult DownloadSession::runSequential(const fs::path &work_dir)
{
    Logger::info("Transfer " + id_ + ": size unknown, using a single sequential fetch");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.assign(1, ChunkInfo());
    }

    fs::path assembled = work_dir / "assembled.part";
    for (int attempt = 0;; ++attempt)
    {
        setChunkState(0, ChunkState::IN_FLIGHT);
        std::ofstream file(assembled, std::ios::binary | std::ios::trunc);
        BoundedOutputBuffer bounded(file, max_bytes_);
        try
        {
            std::ostream out(&bounded);
            source_->fetchAll(out, cancel_);
            out.flush();
            if (!out)
                throw std::runtime_error("write failed");
            break;
        }
        catch (const std::exception &e)
        {
            if (bounded.exceeded())
            {
                throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Transfer " + id_ + ": source exceeds the limit of " +
                                                                     std::to_string(max_bytes_) + " bytes");
            }
            if (cancel_.isCancelled())
                throw DeepLinkError(ErrorCode::CANCELLED, "Transfer " + id_ + " cancelled");
            setChunkState(0, ChunkState::FAILED);
            if (attempt >= options_.max_retries)
            {
                throw DeepLinkError(ErrorCode::CHUNK_FETCH_ERROR, "Transfer " + id_ + " failed after " +
                                                                      std::to_string(attempt + 1) + " attempts: " + e.what());
            }
            auto delay = backoffDelay(options_.retry_base_delay, attempt);
            Logger::warn("Sequential fetch failed for " + id_ + ", retrying in " + std::to_string(delay.count()) +
                         "ms: " + e.what());
            if (!cancel_.sleepFor(delay))
            {
                if (cancel_.isCancelled())
                    throw DeepLinkError(ErrorCode::CANCELLED, "Transfer " + id_ + " cancelled");
                throw DeepLinkError(ErrorCode::CHUNK_FETCH_ERROR, "Transfer " + id_ + " timed out");
            }
        }
    }
    setChunkState(0, ChunkState::VERIFIED);

    TransferResult result;
    result.bytes = fs::file_size(assembled);
    result.chunks = 1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_[0].length = result.bytes;
    }
    publish(assembled, result);
    return result;
}

void DownloadSession::fetchChunk(const fs::path &work_dir, size_t index)
{
    ChunkInfo chunk;
    bool last = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunk = chunks_[index];
        last = isLastChunk(index);
    }

    for (int attempt = 0;; ++attempt)
    {
        if (cancel_.shouldStop() || abort_.load())
            return;

        setChunkState(index, ChunkState::IN_FLIGHT);
        std::string failure;
        try
        {
            std::string data = source_->fetchRange(chunk.offset, chunk.length, cancel_);
            bool verified = data.size() == chunk.length || (last && !data.empty() && data.size() < chunk.length);
            if (verified)
            {
                std::ofstream out(work_dir / chunkFileName(index), std::ios::binary | std::ios::trunc);
                out.write(data.data(), static_cast<std::streamsize>(data.size()));
                out.flush();
                if (!out)
                    throw std::runtime_error("could not write chunk file");
                setChunkState(index, ChunkState::VERIFIED);
                return;
            }
            failure = "got " + std::to_string(data.size()) + " of " + std::to_string(chunk.length) + " bytes";
        }
        catch (const std::exception &e)
        {
            failure = e.what();
        }

        setChunkState(index, ChunkState::FAILED);
        if (cancel_.shouldStop())
            return;
        if (attempt >= options_.max_retries)
        {
            throw DeepLinkError(ErrorCode::CHUNK_FETCH_ERROR, "Chunk " + std::to_string(index) + " of " + id_ +
                                                                  " failed after " + std::to_string(attempt + 1) +
                                                                  " attempts: " + failure);
        }

        auto delay = backoffDelay(options_.retry_base_delay, attempt);
        Logger::warn("Chunk " + std::to_string(index) + " of " + id_ + " failed, retrying in " +
                     std::to_string(delay.count()) + "ms (attempt " + std::to_string(attempt + 1) + "/" +
                     std::to_string(options_.max_retries + 1) + "): " + failure);
        if (!cancel_.sleepFor(delay))
            return;
    }
}

void DownloadSession::publish(const fs::path &assembled, TransferResult &result)
{
    cancel_.throwIfStopped("Transfer " + id_, ErrorCode::CHUNK_FETCH_ERROR);
    moveFile(assembled, output_path_);
    result.output_path = output_path_;
}

// ---------------------------------------------------------------------------
// SpooledFileStream

SpooledFileStream::SpooledFileStream(std::unique_ptr<ScopedTempDir> dir, const fs::path &file)
    : std::istream(nullptr), dir_(std::move(dir))
{
    if (!buffer_.open(file.string(), std::ios::in | std::ios::binary))
        throw DeepLinkError(ErrorCode::NOT_FOUND, "Spooled copy is gone: " + file.string());
    rdbuf(&buffer_);
}

// ---------------------------------------------------------------------------
// TransferManager

TransferManager::TransferManager(const TransferOptions &options, const fs::path &work_parent)
    : options_(options), work_parent_(work_parent)
{
    options_.max_retries = std::clamp(options_.max_retries, 0, TransferLimits::MAX_RETRIES);
    fs::create_directories(work_parent_);
    size_t swept = ScopedTempDir::sweep(work_parent_, WORK_PREFIX);
    if (swept > 0)
        Logger::info("Removed " + std::to_string(swept) + " stale transfer work directories");
}

TransferManager::~TransferManager()
{
    cancelAll();
}

std::string TransferManager::newSessionId()
{
    return "dl-" + std::to_string(++next_session_);
}

std::shared_ptr<ChunkSource> TransferManager::sourceFor(const std::string &reference) const
{
    if (MediaTypes::isRemoteSource(reference))
        return std::make_shared<HttpRangeSource>(reference, options_.chunk_timeout);
    return std::make_shared<FileRangeSource>(reference);
}

TransferResult TransferManager::download(const std::string &reference, const std::string &output_path,
                                         const std::string &session_id, uint64_t max_bytes)
{
    return download(sourceFor(reference), output_path, session_id, max_bytes);
}

TransferResult TransferManager::download(std::shared_ptr<ChunkSource> source, const std::string &output_path,
                                         const std::string &session_id, uint64_t max_bytes)
{
    return runSession(openSession(std::move(source), output_path, session_id, max_bytes));
}

std::shared_ptr<DownloadSession> TransferManager::openSession(std::shared_ptr<ChunkSource> source, const std::string &output_path,
                                                              const std::string &session_id, uint64_t max_bytes)
{
    std::string id = session_id.empty() ? newSessionId() : session_id;
    auto session = std::make_shared<DownloadSession>(id, std::move(source), output_path, options_, work_parent_, max_bytes);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!sessions_.emplace(id, session).second)
        throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Transfer session already running: " + id);
    return session;
}

TransferResult TransferManager::runSession(const std::shared_ptr<DownloadSession> &session)
{
    struct Unregister
    {
        TransferManager &manager;
        const std::shared_ptr<DownloadSession> &session;
        ~Unregister()
        {
            std::lock_guard<std::mutex> lock(manager.mutex_);
            auto it = manager.sessions_.find(session->id());
            if (it != manager.sessions_.end() && it->second == session)
                manager.sessions_.erase(it);
        }
    } unregister{*this, session};

    return session->run();
}

std::unique_ptr<std::istream> TransferManager::openSpooled(const std::string &reference, uint64_t max_bytes)
{
    auto dir = std::make_unique<ScopedTempDir>(work_parent_, SPOOL_PREFIX);
    fs::path file = dir->file("content.bin");
    download(reference, file.string(), "", max_bytes);
    Logger::debug("Spooled " + reference + " to " + file.string());
    return std::make_unique<SpooledFileStream>(std::move(dir), file);
}

bool TransferManager::cancel(const std::string &session_id)
{
    std::shared_ptr<DownloadSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
            return false;
        session = it->second;
    }

    session->cancel();
    // Bounded by the session timeout; workers only block inside a single fetch
    while (!session->waitFinished(std::chrono::milliseconds(500)))
    {
        Logger::debug("Waiting for transfer " + session_id + " to release its chunks");
    }
    return true;
}

void TransferManager::cancelAll()
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[id, session] : sessions_)
            ids.push_back(id);
    }
    for (const auto &id : ids)
        cancel(id);
}

size_t TransferManager::activeSessions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::string TransferManager::sha256File(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw DeepLinkError(ErrorCode::NOT_FOUND, "Cannot open " + path + " for hashing");

    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    std::vector<char> buffer(1 << 16);
    while (in)
    {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (in.gcount() > 0)
            SHA256_Update(&sha256, buffer.data(), static_cast<size_t>(in.gcount()));
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &sha256);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}
