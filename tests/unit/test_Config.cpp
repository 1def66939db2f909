#include <gtest/gtest.h>
#include "Config.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        testDir = "test_config";
        std::filesystem::create_directories(testDir);
        configPath = testDir + "/counts.conf";
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir);
    }

    void writeConfig(const std::string &contents)
    {
        std::ofstream file(configPath);
        file << contents;
    }

    std::string testDir;
    std::string configPath;
};

TEST_F(ConfigTest, DefaultsAreValid)
{
    DownloadCountsConfig config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.historyWindowDays, 90u);
    EXPECT_TRUE(config.fillGaps);
    EXPECT_EQ(config.utcOffsetMinutes, 0);
    EXPECT_EQ(config.maxUpsertAttempts, 3u);
}

TEST_F(ConfigTest, LoadOverridesDefaults)
{
    writeConfig("# download counter settings\n"
                "databasePath = /tmp/counts.db\n"
                "busyTimeoutMs=250\n"
                "historyWindowDays=30\n"
                "fillGaps=false\n"
                "utcOffsetMinutes=-300\n"
                "\n"
                "numWriterThreads=4\n");

    DownloadCountsConfig config = loadConfigFromFile(configPath);
    EXPECT_EQ(config.databasePath, "/tmp/counts.db");
    EXPECT_EQ(config.busyTimeout, std::chrono::milliseconds(250));
    EXPECT_EQ(config.historyWindowDays, 30u);
    EXPECT_FALSE(config.fillGaps);
    EXPECT_EQ(config.utcOffsetMinutes, -300);
    EXPECT_EQ(config.numWriterThreads, 4u);
    EXPECT_EQ(config.batchSize, DownloadCountsConfig().batchSize);
}

TEST_F(ConfigTest, MissingFileThrows)
{
    EXPECT_THROW(loadConfigFromFile(testDir + "/missing.conf"), std::runtime_error);
}

TEST_F(ConfigTest, UnknownKeyThrows)
{
    writeConfig("historyWindow=30\n");
    EXPECT_THROW(loadConfigFromFile(configPath), std::runtime_error);
}

TEST_F(ConfigTest, MalformedValuesThrow)
{
    writeConfig("historyWindowDays=ninety\n");
    EXPECT_THROW(loadConfigFromFile(configPath), std::runtime_error);

    writeConfig("fillGaps=maybe\n");
    EXPECT_THROW(loadConfigFromFile(configPath), std::runtime_error);

    writeConfig("batchSize=-1\n");
    EXPECT_THROW(loadConfigFromFile(configPath), std::runtime_error);

    writeConfig("databasePath\n");
    EXPECT_THROW(loadConfigFromFile(configPath), std::runtime_error);
}

TEST_F(ConfigTest, InvalidResultThrows)
{
    writeConfig("historyWindowDays=0\n");
    EXPECT_THROW(loadConfigFromFile(configPath), std::runtime_error);

    writeConfig("utcOffsetMinutes=2000\n");
    EXPECT_THROW(loadConfigFromFile(configPath), std::runtime_error);
}

TEST_F(ConfigTest, BusyTimeoutMustFitSqlite)
{
    DownloadCountsConfig config;
    config.busyTimeout = std::chrono::milliseconds(std::numeric_limits<int>::max());
    EXPECT_TRUE(config.validate());

    config.busyTimeout = std::chrono::milliseconds(static_cast<long long>(std::numeric_limits<int>::max()) + 1);
    EXPECT_FALSE(config.validate());

    config.busyTimeout = std::chrono::milliseconds(-1);
    EXPECT_FALSE(config.validate());

    writeConfig("busyTimeoutMs=3000000000\n");
    EXPECT_THROW(loadConfigFromFile(configPath), std::runtime_error);
}

TEST_F(ConfigTest, NegativeDelaysAreInvalid)
{
    DownloadCountsConfig config;
    config.baseRetryDelay = std::chrono::milliseconds(-1);
    EXPECT_FALSE(config.validate());

    config = DownloadCountsConfig();
    config.appendTimeout = std::chrono::milliseconds(-5);
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, SaveThenLoadKeepsSettings)
{
    DownloadCountsConfig config;
    config.databasePath = "saved.db";
    config.historyWindowDays = 14;
    config.fillGaps = false;
    config.readOnly = true;
    config.appendTimeout = std::chrono::milliseconds(42);

    ASSERT_TRUE(saveConfigToFile(config, configPath));
    DownloadCountsConfig loaded = loadConfigFromFile(configPath);

    EXPECT_EQ(loaded.databasePath, "saved.db");
    EXPECT_EQ(loaded.historyWindowDays, 14u);
    EXPECT_FALSE(loaded.fillGaps);
    EXPECT_TRUE(loaded.readOnly);
    EXPECT_EQ(loaded.appendTimeout, std::chrono::milliseconds(42));
}
