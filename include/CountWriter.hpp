#ifndef COUNT_WRITER_HPP
#define COUNT_WRITER_HPP

#include <thread>
#include <atomic>
#include <chrono>
#include <memory>
#include <vector>
#include "DownloadEvent.hpp"
#include "BufferQueue.hpp"
#include "ConnectionProvider.hpp"

// Drains download events from the queue, folds each batch into one
// increment per (key, day) and persists the increments. A failed increment
// is reported and dropped.
class CountWriter
{
public:
    explicit CountWriter(BufferQueue &queue,
                         std::shared_ptr<ConnectionProvider> provider,
                         size_t batchSize = 100,
                         size_t maxUpsertAttempts = 3,
                         std::chrono::milliseconds idleDelay = std::chrono::milliseconds(5));

    ~CountWriter();

    void start();
    // Joins the thread after persisting whatever is still queued
    void stop();
    bool isRunning() const;

    size_t persistedEvents() const { return m_persistedEvents.load(); }
    size_t droppedEvents() const { return m_droppedEvents.load(); }

private:
    void processEvents();
    void persistBatch(std::vector<DownloadEvent> &batch);
    void reportError(const std::string &message);

    BufferQueue &m_queue;
    std::shared_ptr<ConnectionProvider> m_provider;
    std::unique_ptr<std::thread> m_writerThread;
    std::atomic<bool> m_running{false};
    const size_t m_batchSize;
    const size_t m_maxUpsertAttempts;
    const std::chrono::milliseconds m_idleDelay;

    std::atomic<size_t> m_persistedEvents{0};
    std::atomic<size_t> m_droppedEvents{0};

    BufferQueue::ConsumerToken m_consumerToken;
};
#endif
