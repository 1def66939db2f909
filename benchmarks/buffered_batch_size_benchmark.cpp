#include "BenchmarkUtils.hpp"
#include "DownloadCountingSystem.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <future>
#include <iomanip>

std::vector<std::vector<DownloadEvent>> generateBatches(int numEvents, int numKeys, int batchSize, const CalendarDate &day)
{
    std::vector<std::vector<DownloadEvent>> batches;
    int generated = 0;

    while (generated < numEvents)
    {
        int currentBatchSize = std::min(batchSize, numEvents - generated);

        std::vector<DownloadEvent> batch;
        batch.reserve(currentBatchSize);
        for (int i = 0; i < currentBatchSize; i++)
        {
            batch.emplace_back("version-" + std::to_string((generated + i) % numKeys), day);
        }

        batches.push_back(std::move(batch));
        generated += currentBatchSize;
    }

    return batches;
}

void appendDownloads(DownloadCountingSystem &system, const std::vector<std::vector<DownloadEvent>> &batches)
{
    BufferQueue::ProducerToken token = system.createProducerToken();
    for (const auto &batch : batches)
    {
        if (!system.enqueueDownloads(batch, token))
        {
            std::cerr << "Failed to append batch of " << batch.size() << " downloads" << std::endl;
        }
    }
}

// Runs one benchmark with a specific writer batch size
double runBatchSizeBenchmark(int writerBatchSize, int numProducerThreads,
                             int downloadsPerProducer, int numKeys, int producerBatchSize)
{
    DownloadCountsConfig config;
    config.databasePath = "./bench_batch_" + std::to_string(writerBatchSize) + ".db";
    config.busyTimeout = std::chrono::milliseconds(60000);
    config.queueCapacity = 1000000;
    config.batchSize = writerBatchSize;
    config.numWriterThreads = 2;
    config.appendTimeout = std::chrono::milliseconds(300000);

    removeDatabase(config.databasePath);

    CalendarDate day = CalendarDate::today();
    std::vector<std::vector<std::vector<DownloadEvent>>> allBatches(numProducerThreads);
    for (int i = 0; i < numProducerThreads; i++)
    {
        allBatches[i] = generateBatches(downloadsPerProducer, numKeys, producerBatchSize, day);
    }

    DownloadCountingSystem system(config);
    system.start();
    auto startTime = std::chrono::high_resolution_clock::now();

    std::vector<std::future<void>> futures;
    for (int i = 0; i < numProducerThreads; i++)
    {
        futures.push_back(std::async(
            std::launch::async,
            appendDownloads,
            std::ref(system),
            std::cref(allBatches[i])));
    }
    for (auto &future : futures)
    {
        future.wait();
    }

    system.stop();
    auto endTime = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = endTime - startTime;

    double elapsedSeconds = elapsed.count();
    const size_t totalDownloads = static_cast<size_t>(numProducerThreads) * downloadsPerProducer;
    double throughput = totalDownloads / elapsedSeconds;

    std::cout << "============== Benchmark Results ==============" << std::endl;
    std::cout << "Writer batch size: " << writerBatchSize << std::endl;
    std::cout << "Distinct keys: " << numKeys << std::endl;
    std::cout << "Execution time: " << elapsedSeconds << " seconds" << std::endl;
    std::cout << "Persisted: " << system.persistedEvents() << " / " << totalDownloads << std::endl;
    std::cout << "Dropped: " << system.droppedEvents() << std::endl;
    std::cout << "Throughput: " << throughput << " downloads/second" << std::endl;
    std::cout << "===============================================" << std::endl;

    removeDatabase(config.databasePath);
    return throughput;
}

int main()
{
    const int numKeys = 50;
    const int producerBatchSize = 50;
    const int numProducers = 8;
    const int downloadsPerProducer = 50000;

    std::vector<int> batchSizes = {10, 100, 500, 1000, 5000};
    std::vector<double> throughputs;

    for (int batchSize : batchSizes)
    {
        std::cout << "\nRunning benchmark with writer batch size: " << batchSize << "..." << std::endl;
        throughputs.push_back(runBatchSizeBenchmark(batchSize, numProducers, downloadsPerProducer,
                                                    numKeys, producerBatchSize));
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    std::cout << "\n=========== WRITER BATCH SIZE BENCHMARK SUMMARY ===========" << std::endl;
    std::cout << std::left << std::setw(15) << "Batch Size"
              << std::setw(25) << "Throughput (downloads/s)"
              << std::setw(20) << "Relative Performance" << std::endl;
    std::cout << "--------------------------------------------------------" << std::endl;
    for (size_t i = 0; i < batchSizes.size(); i++)
    {
        double relativePerf = throughputs[i] / throughputs[0];
        std::cout << std::left << std::setw(15) << batchSizes[i]
                  << std::setw(25) << std::fixed << std::setprecision(2) << throughputs[i]
                  << std::setw(20) << std::fixed << std::setprecision(2) << relativePerf << "x" << std::endl;
    }
    std::cout << "=========================================================" << std::endl;

    return 0;
}
