#include "BenchmarkUtils.hpp"
#include "ConnectionProvider.hpp"
#include "VersionDownloads.hpp"
#include <future>
#include <iomanip>
#include <thread>

void runBenchmark(const DownloadCountsConfig &baseConfig, int numProducerThreads, int downloadsPerProducer, int numKeys)
{
    DownloadCountsConfig config = baseConfig;
    config.databasePath = "./bench_producers_" + std::to_string(numProducerThreads) + ".db";
    removeDatabase(config.databasePath);

    auto provider = std::make_shared<SqliteConnectionProvider>(config);
    CounterRecorder recorder(provider, config);
    CalendarDate day = CalendarDate::today();

    std::vector<std::future<std::pair<LatencyCollector, size_t>>> futures;
    auto startTime = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < numProducerThreads; i++)
    {
        futures.push_back(std::async(std::launch::async, [&]()
                                     {
            size_t failures = 0;
            LatencyCollector collector = recordDownloads(recorder, "crate-", numKeys, downloadsPerProducer, day, failures);
            return std::make_pair(std::move(collector), failures); }));
    }

    LatencyCollector merged;
    size_t failures = 0;
    for (auto &future : futures)
    {
        auto result = future.get();
        merged.merge(result.first);
        failures += result.second;
    }
    auto endTime = std::chrono::high_resolution_clock::now();
    double elapsedSeconds = std::chrono::duration<double>(endTime - startTime).count();

    int64_t stored = 0;
    auto connection = provider->acquire();
    for (int k = 0; k < numKeys; k++)
    {
        stored += VersionDownloads::countFor(*connection, "crate-" + std::to_string(k), day).value_or(0);
    }

    const int totalDownloads = numProducerThreads * downloadsPerProducer;
    std::cout << "============== Benchmark Results ==============" << std::endl;
    std::cout << "Producer threads: " << numProducerThreads << std::endl;
    std::cout << "Downloads recorded: " << totalDownloads << " (" << failures << " uncounted)" << std::endl;
    std::cout << "Downloads stored: " << stored << std::endl;
    std::cout << "Execution time: " << std::fixed << std::setprecision(3) << elapsedSeconds << " s" << std::endl;
    std::cout << "Throughput: " << totalDownloads / elapsedSeconds << " downloads/s" << std::endl;
    printLatencyStats(calculateLatencyStats(merged));

    removeDatabase(config.databasePath);
}

int main()
{
    DownloadCountsConfig config;
    config.busyTimeout = std::chrono::seconds(30);
    config.maxUpsertAttempts = 5;

    const int downloadsPerProducer = 500;
    const int numKeys = 8;

    for (int producers : {1, 2, 4, 8, 16})
    {
        runBenchmark(config, producers, downloadsPerProducer, numKeys);
    }
    return 0;
}
