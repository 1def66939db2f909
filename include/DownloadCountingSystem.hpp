#ifndef DOWNLOAD_COUNTING_SYSTEM_HPP
#define DOWNLOAD_COUNTING_SYSTEM_HPP

#include "Config.hpp"
#include "BufferQueue.hpp"
#include "ConnectionProvider.hpp"
#include "CountWriter.hpp"
#include "DownloadEvent.hpp"
#include <memory>
#include <vector>
#include <atomic>
#include <mutex>
#include <string>

// Buffered fire-and-forget counting: producers enqueue download events and
// writer threads persist them in aggregated batches. Unlike CounterRecorder,
// success only means the event was queued; the writers count it later and
// report failures through droppedEvents().
class DownloadCountingSystem
{
public:
    explicit DownloadCountingSystem(const DownloadCountsConfig &config,
                                    std::shared_ptr<ConnectionProvider> provider = nullptr);
    ~DownloadCountingSystem();

    bool start();
    bool stop();

    BufferQueue::ProducerToken createProducerToken();
    // true once the event is queued, not once it is counted. false when the
    // system is stopped or the queue stayed full past the append timeout.
    // Every queued event is persisted or dropped before stop() returns.
    bool enqueueDownload(const std::string &key, const CalendarDate &day,
                         BufferQueue::ProducerToken &token);
    bool enqueueDownloads(std::vector<DownloadEvent> events,
                          BufferQueue::ProducerToken &token);

    size_t persistedEvents() const;
    size_t droppedEvents() const;

    std::shared_ptr<ConnectionProvider> getProvider() const
    {
        return m_provider;
    }

private:
    bool enqueue(std::vector<DownloadEvent> events, BufferQueue::ProducerToken &token);

    std::shared_ptr<ConnectionProvider> m_provider;
    std::shared_ptr<BufferQueue> m_queue;
    std::vector<std::unique_ptr<CountWriter>> m_writers;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_acceptingEvents{false};
    // producers between the accepting check and the end of their enqueue
    std::atomic<size_t> m_inFlightProducers{0};
    mutable std::mutex m_systemMutex;

    size_t m_numWriterThreads;
    size_t m_batchSize;
    size_t m_maxUpsertAttempts;
    std::chrono::milliseconds m_appendTimeout;
    std::chrono::milliseconds m_writerIdleDelay;

    // counts of writers that have already been stopped
    size_t m_retiredPersisted = 0;
    size_t m_retiredDropped = 0;
};

#endif
