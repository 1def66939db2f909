#ifndef BENCHMARK_UTILS_HPP
#define BENCHMARK_UTILS_HPP

#include "CounterRecorder.hpp"
#include <vector>
#include <string>
#include <iostream>
#include <chrono>
#include <algorithm>
#include <numeric>

class LatencyCollector
{
private:
    std::vector<std::chrono::nanoseconds> latencies;

public:
    void addMeasurement(std::chrono::nanoseconds latency)
    {
        latencies.push_back(latency);
    }

    void reserve(size_t capacity)
    {
        latencies.reserve(capacity);
    }

    const std::vector<std::chrono::nanoseconds> &getMeasurements() const
    {
        return latencies;
    }

    void clear()
    {
        latencies.clear();
    }

    // Merge another collector's measurements into this one
    void merge(const LatencyCollector &other)
    {
        const auto &otherLatencies = other.getMeasurements();
        latencies.insert(latencies.end(), otherLatencies.begin(), otherLatencies.end());
    }
};

struct LatencyStats
{
    double maxMs;
    double avgMs;
    double medianMs;
    size_t count;
};

LatencyStats calculateLatencyStats(const LatencyCollector &collector);

// Records `downloads` downloads spread over `numKeys` keys on one day and
// returns the latency of each call; uncounted downloads are tallied in `failures`
LatencyCollector recordDownloads(CounterRecorder &recorder,
                                 const std::string &keyPrefix,
                                 int numKeys,
                                 int downloads,
                                 const CalendarDate &day,
                                 size_t &failures);

void removeDatabase(const std::string &databasePath);

void printLatencyStats(const LatencyStats &stats);

#endif
