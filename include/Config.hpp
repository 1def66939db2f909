#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <chrono>

struct DownloadCountsConfig
{
    // store
    std::string databasePath = "./downloads.db";
    std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000);
    bool readOnly = false;
    // recording
    size_t maxUpsertAttempts = 3;
    std::chrono::milliseconds baseRetryDelay = std::chrono::milliseconds(1);
    // history
    unsigned historyWindowDays = 90;
    bool fillGaps = true;
    int utcOffsetMinutes = 0; // reference calendar for "today"
    // buffered counting
    std::chrono::milliseconds appendTimeout = std::chrono::milliseconds(100);
    size_t queueCapacity = 8192;
    size_t maxExplicitProducers = 16; // maximum number of producers creating a producer token
    size_t batchSize = 100;
    size_t numWriterThreads = 1;
    std::chrono::milliseconds writerIdleDelay = std::chrono::milliseconds(5);

    bool validate() const;
};

// Reads key=value lines on top of the defaults. Throws std::runtime_error on
// unreadable files, unknown keys, malformed values or an invalid result.
DownloadCountsConfig loadConfigFromFile(const std::string &configFilePath);
bool saveConfigToFile(const DownloadCountsConfig &config, const std::string &configFilePath);

#endif
