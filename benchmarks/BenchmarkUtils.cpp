#include "BenchmarkUtils.hpp"
#include <filesystem>

LatencyCollector recordDownloads(CounterRecorder &recorder,
                                 const std::string &keyPrefix,
                                 int numKeys,
                                 int downloads,
                                 const CalendarDate &day,
                                 size_t &failures)
{
    LatencyCollector collector;
    collector.reserve(downloads);
    failures = 0;

    for (int i = 0; i < downloads; i++)
    {
        std::string key = keyPrefix + std::to_string(i % numKeys);

        auto start = std::chrono::high_resolution_clock::now();
        bool counted = recorder.recordDownload(key, day);
        auto end = std::chrono::high_resolution_clock::now();

        collector.addMeasurement(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start));
        if (!counted)
        {
            failures++;
        }
    }
    return collector;
}

void removeDatabase(const std::string &databasePath)
{
    try
    {
        for (const char *suffix : {"", "-journal", "-wal", "-shm"})
        {
            std::filesystem::remove(databasePath + suffix);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error removing database: " << e.what() << std::endl;
    }
}

LatencyStats calculateLatencyStats(const LatencyCollector &collector)
{
    const auto &latencies = collector.getMeasurements();

    if (latencies.empty())
    {
        return {0.0, 0.0, 0.0, 0};
    }

    // Convert to milliseconds for easier reading
    std::vector<double> latenciesMs;
    latenciesMs.reserve(latencies.size());
    for (const auto &lat : latencies)
    {
        latenciesMs.push_back(static_cast<double>(lat.count()) / 1e6); // ns to ms
    }

    std::sort(latenciesMs.begin(), latenciesMs.end());

    LatencyStats stats;
    stats.count = latenciesMs.size();
    stats.maxMs = latenciesMs.back();
    stats.avgMs = std::accumulate(latenciesMs.begin(), latenciesMs.end(), 0.0) / latenciesMs.size();

    size_t medianIdx = latenciesMs.size() / 2;
    if (latenciesMs.size() % 2 == 0)
    {
        stats.medianMs = (latenciesMs[medianIdx - 1] + latenciesMs[medianIdx]) / 2.0;
    }
    else
    {
        stats.medianMs = latenciesMs[medianIdx];
    }

    return stats;
}

void printLatencyStats(const LatencyStats &stats)
{
    std::cout << "============== Latency Statistics ==============" << std::endl;
    std::cout << "Total record operations: " << stats.count << std::endl;
    std::cout << "Max latency: " << stats.maxMs << " ms" << std::endl;
    std::cout << "Average latency: " << stats.avgMs << " ms" << std::endl;
    std::cout << "Median latency: " << stats.medianMs << " ms" << std::endl;
    std::cout << "===============================================" << std::endl;
}
