#include <gtest/gtest.h>
#include "poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <fstream>
#include <filesystem>

class PocoConfigManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");
        test_config_path_ = (std::filesystem::temp_directory_path() / "inference_blackbox_test_config.json").string();
        clearEnvironment();
    }

    void TearDown() override
    {
        if (std::filesystem::exists(test_config_path_))
        {
            std::filesystem::remove(test_config_path_);
        }
        clearEnvironment();
    }

    void writeConfig(const std::string &content)
    {
        std::ofstream config_file(test_config_path_);
        config_file << content;
        config_file.close();
    }

    static void clearEnvironment()
    {
        unsetenv("INFERENCE_BLACKBOX_UPLOAD_DIR");
        unsetenv("INFERENCE_BLACKBOX_LOG_LEVEL");
        unsetenv("INFERENCE_BLACKBOX_HOST");
        unsetenv("INFERENCE_BLACKBOX_PORT");
    }

    std::string test_config_path_;
};

TEST_F(PocoConfigManagerTest, DefaultsWithoutFile)
{
    PocoConfigManager config;

    EXPECT_EQ(config.getUploadDir(), "./uploads");
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getServerHost(), "0.0.0.0");
    EXPECT_EQ(config.getServerPort(), 5000);
    EXPECT_EQ(config.getMaxProcessingThreads(), 1);
    EXPECT_EQ(config.getItemTimeoutSeconds(), 300);
    EXPECT_EQ(config.getMaxAbandonedWorkers(), 8);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, ShippedConfigMatchesDefaults)
{
    PocoConfigManager config;
    ASSERT_TRUE(config.load(std::string(INFERENCE_BLACKBOX_SOURCE_DIR) + "/config/config.json"));

    EXPECT_EQ(config.getMaxProcessingThreads(), 1);
    EXPECT_EQ(config.getItemTimeoutSeconds(), 300);
    EXPECT_EQ(config.getMaxAbandonedWorkers(), 8);
    EXPECT_EQ(config.getServerPort(), 5000);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, MissingFileKeepsDefaults)
{
    PocoConfigManager config;

    EXPECT_FALSE(config.load("/nonexistent/inference_blackbox.json"));
    EXPECT_EQ(config.getServerPort(), 5000);
}

TEST_F(PocoConfigManagerTest, FileOverlaysDefaults)
{
    writeConfig(R"({
        "upload_dir": "/srv/uploads",
        "server_port": 9090,
        "threading": { "max_processing_threads": 6 }
    })");
    PocoConfigManager config;

    ASSERT_TRUE(config.load(test_config_path_));

    EXPECT_EQ(config.getUploadDir(), "/srv/uploads");
    EXPECT_EQ(config.getServerPort(), 9090);
    EXPECT_EQ(config.getMaxProcessingThreads(), 6);
    // Keys absent from the file keep their defaults
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getItemTimeoutSeconds(), 300);
    EXPECT_TRUE(config.hasKey("processing.item_timeout_seconds"));
}

TEST_F(PocoConfigManagerTest, InvalidJsonIsRejected)
{
    writeConfig("{ \"server_port\": ");
    PocoConfigManager config;

    EXPECT_FALSE(config.load(test_config_path_));
    EXPECT_EQ(config.getServerPort(), 5000);
}

TEST_F(PocoConfigManagerTest, EnvironmentOverridesFile)
{
    writeConfig(R"({ "server_port": 9090, "log_level": "WARN" })");
    setenv("INFERENCE_BLACKBOX_PORT", "7070", 1);
    setenv("INFERENCE_BLACKBOX_LOG_LEVEL", "debug", 1);
    setenv("INFERENCE_BLACKBOX_UPLOAD_DIR", "/data/uploads", 1);
    PocoConfigManager config;
    ASSERT_TRUE(config.load(test_config_path_));

    EXPECT_EQ(config.applyEnvironmentOverrides(), 3);

    EXPECT_EQ(config.getServerPort(), 7070);
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getUploadDir(), "/data/uploads");
    EXPECT_EQ(config.getServerHost(), "0.0.0.0");
}

TEST_F(PocoConfigManagerTest, NonNumericPortOverrideIsIgnored)
{
    setenv("INFERENCE_BLACKBOX_PORT", "http", 1);
    PocoConfigManager config;

    EXPECT_EQ(config.applyEnvironmentOverrides(), 0);
    EXPECT_EQ(config.getServerPort(), 5000);
}

TEST_F(PocoConfigManagerTest, ValidationReportsEachProblem)
{
    PocoConfigManager config;
    config.update({{"server_port", 0},
                   {"log_level", "VERBOSE"},
                   {"threading", {{"max_processing_threads", 0}}},
                   {"processing", {{"item_timeout_seconds", -1}, {"max_abandoned_workers", 0}}}});

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validateConfig(errors));
    EXPECT_EQ(errors.size(), 5u);
}

TEST_F(PocoConfigManagerTest, SaveAndReload)
{
    PocoConfigManager original;
    original.update({{"server_host", "127.0.0.1"}, {"processing", {{"item_timeout_seconds", 30}}}});
    ASSERT_TRUE(original.save(test_config_path_));

    PocoConfigManager reloaded;
    ASSERT_TRUE(reloaded.load(test_config_path_));
    EXPECT_EQ(reloaded.getServerHost(), "127.0.0.1");
    EXPECT_EQ(reloaded.getItemTimeoutSeconds(), 30);
    EXPECT_EQ(reloaded.getAll()["processing"]["item_timeout_seconds"], 30);
}
