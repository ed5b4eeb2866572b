#include "core/scoped_temp_dir.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <chrono>
#include <random>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    std::string uniqueSuffix()
    {
        static std::atomic<uint64_t> counter{0};
        thread_local std::mt19937_64 rng(std::random_device{}());
        std::ostringstream ss;
        ss << getpid() << "_" << counter.fetch_add(1) << "_" << std::hex << (rng() & 0xffffffULL);
        return ss.str();
    }
}

ScopedTempDir::ScopedTempDir(const fs::path &parent, const std::string &prefix)
    : released_(false)
{
    fs::create_directories(parent);
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        fs::path candidate = parent / (prefix + uniqueSuffix());
        if (fs::create_directory(candidate))
        {
            path_ = candidate;
            Logger::trace("Created work directory: " + path_.string());
            return;
        }
    }
    throw fs::filesystem_error("Could not create unique work directory", parent,
                               std::make_error_code(std::errc::file_exists));
}

ScopedTempDir::~ScopedTempDir()
{
    release();
}

bool ScopedTempDir::release()
{
    if (released_)
        return true;
    released_ = true;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
        Logger::error("Failed to remove work directory " + path_.string() + ": " + ec.message());
        return false;
    }
    Logger::trace("Removed work directory: " + path_.string());
    return true;
}

size_t ScopedTempDir::sweep(const fs::path &parent, const std::string &prefix)
{
    size_t removed = 0;
    std::error_code ec;
    if (!fs::exists(parent, ec))
        return 0;

    std::vector<fs::path> stale;
    for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec))
    {
        const std::string name = it->path().filename().string();
        if (it->is_directory() && name.rfind(prefix, 0) == 0)
            stale.push_back(it->path());
    }

    for (const auto &dir : stale)
    {
        std::error_code remove_ec;
        fs::remove_all(dir, remove_ec);
        if (remove_ec)
        {
            Logger::warn("Could not remove stale work directory " + dir.string() + ": " + remove_ec.message());
            continue;
        }
        removed++;
    }
    if (removed > 0)
        Logger::info("Removed " + std::to_string(removed) + " stale work directories from " + parent.string());
    return removed;
}
