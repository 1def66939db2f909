#include "CounterRecorder.hpp"
#include "DownloadCountingSystem.hpp"
#include "HistoryReader.hpp"
#include "VersionResolver.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <filesystem>

int main()
{
    // system parameters
    DownloadCountsConfig config;
    config.databasePath = "./example_downloads.db";
    config.busyTimeout = std::chrono::seconds(5);
    config.historyWindowDays = 7;
    config.queueCapacity = 1000;
    config.maxExplicitProducers = 1;
    config.batchSize = 10;
    config.numWriterThreads = 1;
    config.appendTimeout = std::chrono::seconds(1);

    if (std::filesystem::exists(config.databasePath))
    {
        std::filesystem::remove(config.databasePath);
    }

    auto provider = std::make_shared<SqliteConnectionProvider>(config);

    InMemoryVersionResolver resolver;
    resolver.addVersion("serde", "1.0.0", "serde-1.0.0");

    // direct path: resolve, then count
    auto sink = std::make_shared<CollectingTimingSink>();
    CounterRecorder recorder(provider, config);
    CalendarDate today = CalendarDate::today(config.utcOffsetMinutes);

    RecordedDownload download = recorder.recordResolvedDownload(resolver, "serde", "1.0.0", today, TimingRecorder(sink));
    std::cout << download.crateName << " counted: " << std::boolalpha << download.counted << std::endl;

    try
    {
        recorder.recordResolvedDownload(resolver, "serde", "9.9.9", today);
    }
    catch (const VersionNotFound &e)
    {
        std::cout << "not found: " << e.what() << std::endl;
    }

    // buffered path
    DownloadCountingSystem countingSystem(config, provider);
    countingSystem.start();

    auto producerToken = countingSystem.createProducerToken();
    countingSystem.enqueueDownload("serde-1.0.0", today, producerToken);

    std::vector<DownloadEvent> batch{
        DownloadEvent("serde-1.0.0", today.addDays(-1)),
        DownloadEvent("serde-1.0.0", today.addDays(-3))};
    countingSystem.enqueueDownloads(batch, producerToken);

    countingSystem.stop();

    HistoryReader reader(provider, config);
    for (const auto &entry : reader.fetchHistory("serde-1.0.0"))
    {
        std::cout << entry.date.toString() << " " << entry.count << std::endl;
    }

    return 0;
}
