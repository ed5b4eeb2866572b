#pragma once

#include <filesystem>
#include <string>

/**
 * @brief Uniquely named work directory removed with all its contents on destruction
 */
class ScopedTempDir
{
public:
    /**
     * @param parent Directory the work directory is created in
     * @param prefix Leading part of the directory name
     * @throws std::filesystem::filesystem_error if the directory cannot be created
     */
    ScopedTempDir(const std::filesystem::path &parent, const std::string &prefix);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir &) = delete;
    ScopedTempDir &operator=(const ScopedTempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }
    std::filesystem::path file(const std::string &name) const { return path_ / name; }

    /**
     * @brief Remove the directory now; later calls and the destructor are no-ops
     * @return true if nothing is left on disk
     */
    bool release();

    /**
     * @brief Remove leftover work directories with the given prefix (startup sweep)
     * @return Number of directories removed
     */
    static size_t sweep(const std::filesystem::path &parent, const std::string &prefix);

private:
    std::filesystem::path path_;
    bool released_;
};
