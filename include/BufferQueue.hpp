#ifndef BUFFER_QUEUE_HPP
#define BUFFER_QUEUE_HPP

#include "DownloadEvent.hpp"
#include "concurrentqueue.h"
#include <atomic>
#include <vector>
#include <memory>
#include <chrono>

class BufferQueue
{
public:
    using ProducerToken = moodycamel::ProducerToken;
    using ConsumerToken = moodycamel::ConsumerToken;

private:
    moodycamel::ConcurrentQueue<DownloadEvent> m_queue;

public:
    explicit BufferQueue(size_t capacity, size_t maxExplicitProducers);

    ProducerToken createProducerToken() { return ProducerToken(m_queue); }
    ConsumerToken createConsumerToken() { return ConsumerToken(m_queue); }

    bool enqueueBlocking(DownloadEvent event,
                         ProducerToken &token,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds::max());
    bool enqueueBatchBlocking(std::vector<DownloadEvent> events,
                              ProducerToken &token,
                              std::chrono::milliseconds timeout = std::chrono::milliseconds::max());
    bool tryDequeue(DownloadEvent &event, ConsumerToken &token);
    size_t tryDequeueBatch(std::vector<DownloadEvent> &events, size_t maxEvents, ConsumerToken &token);
    // Waits until the queue is empty or the timeout passes
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds::max());
    size_t size() const;

    // delete copy/move
    BufferQueue(const BufferQueue &) = delete;
    BufferQueue &operator=(const BufferQueue &) = delete;
    BufferQueue(BufferQueue &&) = delete;
    BufferQueue &operator=(BufferQueue &&) = delete;

private:
    bool enqueue(DownloadEvent event, ProducerToken &token);
    bool enqueueBatch(std::vector<DownloadEvent> events, ProducerToken &token);

    template <typename Attempt>
    bool retryUntil(Attempt &&attempt, std::chrono::milliseconds timeout);
};

#endif
