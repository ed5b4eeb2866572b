#pragma once

#include "core/cancellation.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

/**
 * @brief Byte-range readable source of a transfer
 *
 * Implementations must allow concurrent fetchRange() calls from several
 * transfer workers. Transient failures are reported by throwing; the
 * TransferManager decides whether to retry.
 */
class ChunkSource
{
public:
    virtual ~ChunkSource() = default;

    virtual std::string describe() const = 0;

    /**
     * @return Total size in bytes, or std::nullopt if unknown or ranges are unsupported
     */
    virtual std::optional<uint64_t> contentLength() = 0;

    /**
     * @brief Read up to length bytes starting at offset
     * @throws std::runtime_error on a transient failure
     */
    virtual std::string fetchRange(uint64_t offset, uint64_t length, CancellationToken &cancel) = 0;

    /**
     * @brief Stream the whole source sequentially into out
     * @throws std::runtime_error on failure
     */
    virtual void fetchAll(std::ostream &out, CancellationToken &cancel) = 0;
};

/**
 * @brief HTTP(S) source using HEAD for size and Range GETs for chunks
 */
class HttpRangeSource : public ChunkSource
{
public:
    HttpRangeSource(const std::string &url, std::chrono::milliseconds timeout);

    std::string describe() const override { return url_; }
    std::optional<uint64_t> contentLength() override;
    std::string fetchRange(uint64_t offset, uint64_t length, CancellationToken &cancel) override;
    void fetchAll(std::ostream &out, CancellationToken &cancel) override;

private:
    std::string url_;
    std::string origin_; // scheme://host[:port]
    std::string path_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Local file source (cache files, tests, file:// style uploads)
 */
class FileRangeSource : public ChunkSource
{
public:
    explicit FileRangeSource(const std::string &path);

    std::string describe() const override { return path_; }
    std::optional<uint64_t> contentLength() override;
    std::string fetchRange(uint64_t offset, uint64_t length, CancellationToken &cancel) override;
    void fetchAll(std::ostream &out, CancellationToken &cancel) override;

private:
    std::string path_;
};
