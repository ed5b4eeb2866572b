#include "transfer/chunk_source.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <httplib.h>

namespace
{
    std::unique_ptr<httplib::Client> makeClient(const std::string &origin, std::chrono::milliseconds timeout)
    {
        auto client = std::make_unique<httplib::Client>(origin);
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout - seconds);
        client->set_connection_timeout(static_cast<time_t>(seconds.count()), static_cast<time_t>(micros.count()));
        client->set_read_timeout(static_cast<time_t>(seconds.count()), static_cast<time_t>(micros.count()));
        client->set_follow_location(true);
        return client;
    }
}

HttpRangeSource::HttpRangeSource(const std::string &url, std::chrono::milliseconds timeout)
    : url_(url), timeout_(timeout)
{
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("Not an absolute URL: " + url);

    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos)
    {
        origin_ = url;
        path_ = "/";
    }
    else
    {
        origin_ = url.substr(0, path_start);
        path_ = url.substr(path_start);
    }
}

std::optional<uint64_t> HttpRangeSource::contentLength()
{
    auto client = makeClient(origin_, timeout_);
    auto res = client->Head(path_);
    if (!res)
    {
        Logger::warn("HEAD failed for " + url_ + ": " + httplib::to_string(res.error()));
        return std::nullopt;
    }
    if (res->status != 200)
    {
        Logger::warn("HEAD returned " + std::to_string(res->status) + " for " + url_);
        return std::nullopt;
    }
    if (res->get_header_value("Accept-Ranges") != "bytes" || !res->has_header("Content-Length"))
    {
        return std::nullopt;
    }

    try
    {
        return std::stoull(res->get_header_value("Content-Length"));
    }
    catch (const std::exception &)
    {
        Logger::warn("Unparsable Content-Length from " + url_);
        return std::nullopt;
    }
}

std::string HttpRangeSource::fetchRange(uint64_t offset, uint64_t length, CancellationToken &cancel)
{
    if (length == 0)
        return std::string();

    auto client = makeClient(origin_, timeout_);
    httplib::Headers headers = {
        {"Range", "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1)}};

    std::string body;
    body.reserve(length);
    auto res = client->Get(path_, headers, [&](const char *data, size_t size)
                           {
        body.append(data, size);
        return !cancel.shouldStop(); });

    if (!res)
        throw std::runtime_error("Range GET failed: " + httplib::to_string(res.error()));
    if (res->status != 206)
        throw std::runtime_error("Range GET returned HTTP " + std::to_string(res->status));
    return body;
}

void HttpRangeSource::fetchAll(std::ostream &out, CancellationToken &cancel)
{
    auto client = makeClient(origin_, timeout_);
    auto res = client->Get(path_, [&](const char *data, size_t size)
                           {
        out.write(data, static_cast<std::streamsize>(size));
        return out.good() && !cancel.shouldStop(); });

    if (!res)
        throw std::runtime_error("GET failed: " + httplib::to_string(res.error()));
    if (res->status != 200)
        throw std::runtime_error("GET returned HTTP " + std::to_string(res->status));
}

FileRangeSource::FileRangeSource(const std::string &path) : path_(path)
{
}

std::optional<uint64_t> FileRangeSource::contentLength()
{
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    if (ec)
        return std::nullopt;
    return static_cast<uint64_t>(size);
}

std::string FileRangeSource::fetchRange(uint64_t offset, uint64_t length, CancellationToken &)
{
    std::ifstream in(path_, std::ios::binary);
    if (!in)
        throw std::runtime_error("Cannot open " + path_);

    in.seekg(static_cast<std::streamoff>(offset));
    std::string data(length, '\0');
    in.read(&data[0], static_cast<std::streamsize>(length));
    data.resize(static_cast<size_t>(in.gcount()));
    return data;
}

void FileRangeSource::fetchAll(std::ostream &out, CancellationToken &cancel)
{
    std::ifstream in(path_, std::ios::binary);
    if (!in)
        throw std::runtime_error("Cannot open " + path_);

    std::vector<char> buffer(1 << 16);
    while (in)
    {
        cancel.throwIfStopped("File read", ErrorCode::CHUNK_FETCH_ERROR);
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        out.write(buffer.data(), in.gcount());
    }
    if (!out)
        throw std::runtime_error("Write failed while copying " + path_);
}
