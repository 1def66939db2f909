#include "BufferQueue.hpp"
#include <algorithm>
#include <thread>
#include <chrono>

BufferQueue::BufferQueue(size_t capacity, size_t maxExplicitProducers)
{
    m_queue = moodycamel::ConcurrentQueue<DownloadEvent>(capacity, maxExplicitProducers, 0);
}

template <typename Attempt>
bool BufferQueue::retryUntil(Attempt &&attempt, std::chrono::milliseconds timeout)
{
    // milliseconds::max() means no deadline
    const bool bounded = timeout != std::chrono::milliseconds::max();
    auto start = std::chrono::steady_clock::now();
    int backoffMs = 1;
    const int maxBackoffMs = 100;

    while (true)
    {
        if (attempt())
        {
            return true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (bounded && elapsed >= timeout)
        {
            return false;
        }

        int sleepTime = backoffMs;

        // Make sure we don't sleep longer than our remaining timeout
        if (bounded)
        {
            auto remainingTime = timeout - elapsed;
            if (remainingTime <= std::chrono::milliseconds(sleepTime))
            {
                sleepTime = std::max(1, static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(remainingTime).count()));
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(sleepTime));
        backoffMs = std::min(backoffMs * 2, maxBackoffMs);
    }
}

bool BufferQueue::enqueue(DownloadEvent event, ProducerToken &token)
{
    return m_queue.try_enqueue(token, std::move(event));
}

bool BufferQueue::enqueueBlocking(DownloadEvent event, ProducerToken &token, std::chrono::milliseconds timeout)
{
    return retryUntil([&]()
                      { return enqueue(event, token); },
                      timeout);
}

bool BufferQueue::enqueueBatch(std::vector<DownloadEvent> events, ProducerToken &token)
{
    return m_queue.try_enqueue_bulk(token, std::make_move_iterator(events.begin()), events.size());
}

bool BufferQueue::enqueueBatchBlocking(std::vector<DownloadEvent> events, ProducerToken &token,
                                       std::chrono::milliseconds timeout)
{
    if (events.empty())
    {
        return true;
    }
    return retryUntil([&]()
                      { return enqueueBatch(events, token); },
                      timeout);
}

bool BufferQueue::tryDequeue(DownloadEvent &event, ConsumerToken &token)
{
    return m_queue.try_dequeue(token, event);
}

size_t BufferQueue::tryDequeueBatch(std::vector<DownloadEvent> &events, size_t maxEvents, ConsumerToken &token)
{
    events.clear();
    events.resize(maxEvents);

    size_t dequeued = m_queue.try_dequeue_bulk(token, events.begin(), maxEvents);
    events.resize(dequeued);

    return dequeued;
}

bool BufferQueue::flush(std::chrono::milliseconds timeout)
{
    return retryUntil([&]()
                      { return m_queue.size_approx() == 0; },
                      timeout);
}

size_t BufferQueue::size() const
{
    return m_queue.size_approx();
}
