#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "core/deeplink_config.hpp"
#include "database/token_registry.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a private work area, config and registry
 *
 * Every test gets its own directory under the system temp dir holding the
 * registry database, the artifact store and the pipeline work directory.
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_root_ = std::filesystem::temp_directory_path() /
                     ("deeplink_test_" + std::to_string(getpid()) + "_" + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(test_root_);
        std::filesystem::create_directories(test_root_ / "files");

        config_.update({{"database", {{"path", (test_root_ / "registry.db").string()}}},
                        {"storage", {{"artifact_dir", (test_root_ / "artifacts").string()}, {"temp_dir", (test_root_ / "work").string()}}},
                        {"transfer", {{"retry_base_delay_ms", 1}, {"chunk_size_bytes", 1024}}},
                        {"pipeline", {{"worker_threads", 4}, {"max_queue_depth", 16}}}});

        registry_ = std::make_unique<TokenRegistry>(config_.getDatabasePath());
    }

    void TearDown() override
    {
        registry_.reset();

        std::error_code ec;
        std::filesystem::remove_all(test_root_, ec);
    }

    // Helper to create a dummy file for tests, returns its absolute path
    std::string createDummyFile(const std::string &filename, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_root_ / "files" / filename;
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path.lexically_normal().string();
    }

    static std::string readFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    std::filesystem::path testRoot() const { return test_root_; }
    std::filesystem::path workDir() const { return test_root_ / "work"; }

    DeepLinkConfig config_;
    std::unique_ptr<TokenRegistry> registry_;

private:
    std::filesystem::path test_root_;
};
