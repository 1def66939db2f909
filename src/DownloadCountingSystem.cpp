#include "DownloadCountingSystem.hpp"
#include <iostream>
#include <stdexcept>
#include <thread>

namespace
{
    class InFlightGuard
    {
    public:
        explicit InFlightGuard(std::atomic<size_t> &counter) : m_counter(counter) { ++m_counter; }
        ~InFlightGuard() { --m_counter; }

        InFlightGuard(const InFlightGuard &) = delete;
        InFlightGuard &operator=(const InFlightGuard &) = delete;

    private:
        std::atomic<size_t> &m_counter;
    };
}

DownloadCountingSystem::DownloadCountingSystem(const DownloadCountsConfig &config,
                                               std::shared_ptr<ConnectionProvider> provider)
    : m_provider(std::move(provider)),
      m_numWriterThreads(config.numWriterThreads),
      m_batchSize(config.batchSize),
      m_maxUpsertAttempts(config.maxUpsertAttempts),
      m_appendTimeout(config.appendTimeout),
      m_writerIdleDelay(config.writerIdleDelay)
{
    if (!config.validate())
    {
        throw std::invalid_argument("DownloadCountingSystem: invalid configuration");
    }
    if (!m_provider)
    {
        m_provider = std::make_shared<SqliteConnectionProvider>(config);
    }

    m_queue = std::make_shared<BufferQueue>(config.queueCapacity, config.maxExplicitProducers);
    m_writers.reserve(m_numWriterThreads);
}

DownloadCountingSystem::~DownloadCountingSystem()
{
    stop();
}

bool DownloadCountingSystem::start()
{
    std::lock_guard<std::mutex> lock(m_systemMutex);

    if (m_running.load(std::memory_order_acquire))
    {
        std::cerr << "DownloadCountingSystem: Already running" << std::endl;
        return false;
    }

    m_running.store(true, std::memory_order_release);
    m_acceptingEvents.store(true, std::memory_order_release);

    for (size_t i = 0; i < m_numWriterThreads; ++i)
    {
        auto writer = std::make_unique<CountWriter>(*m_queue, m_provider, m_batchSize,
                                                    m_maxUpsertAttempts, m_writerIdleDelay);
        writer->start();
        m_writers.push_back(std::move(writer));
    }

    std::cout << "DownloadCountingSystem: Started " << m_numWriterThreads << " writer threads" << std::endl;
    return true;
}

bool DownloadCountingSystem::stop()
{
    std::lock_guard<std::mutex> lock(m_systemMutex);

    if (!m_running.load(std::memory_order_acquire))
    {
        return false;
    }

    m_acceptingEvents.store(false);
    // let producers that passed the accepting check finish their enqueue,
    // so the writers below drain everything that was accepted
    while (m_inFlightProducers.load() > 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    // writers drain the remainder of the queue before their threads exit
    for (auto &writer : m_writers)
    {
        writer->stop();
        m_retiredPersisted += writer->persistedEvents();
        m_retiredDropped += writer->droppedEvents();
    }
    m_writers.clear();

    m_running.store(false, std::memory_order_release);

    std::cout << "DownloadCountingSystem: Stopped" << std::endl;
    return true;
}

BufferQueue::ProducerToken DownloadCountingSystem::createProducerToken()
{
    return m_queue->createProducerToken();
}

bool DownloadCountingSystem::enqueueDownload(const std::string &key, const CalendarDate &day,
                                             BufferQueue::ProducerToken &token)
{
    std::vector<DownloadEvent> events;
    events.emplace_back(key, day);
    return enqueue(std::move(events), token);
}

bool DownloadCountingSystem::enqueueDownloads(std::vector<DownloadEvent> events,
                                              BufferQueue::ProducerToken &token)
{
    return enqueue(std::move(events), token);
}

bool DownloadCountingSystem::enqueue(std::vector<DownloadEvent> events, BufferQueue::ProducerToken &token)
{
    for (const auto &event : events)
    {
        if (event.key.empty())
        {
            throw std::invalid_argument("DownloadCountingSystem: empty counter key");
        }
    }

    // Registered before the accepting check, so stop() either sees this
    // producer in flight or the producer sees the system stopping
    InFlightGuard guard(m_inFlightProducers);
    if (!m_acceptingEvents.load())
    {
        std::cerr << "DownloadCountingSystem: Not accepting downloads" << std::endl;
        return false;
    }

    if (events.size() == 1)
    {
        return m_queue->enqueueBlocking(std::move(events.front()), token, m_appendTimeout);
    }
    return m_queue->enqueueBatchBlocking(std::move(events), token, m_appendTimeout);
}

size_t DownloadCountingSystem::persistedEvents() const
{
    std::lock_guard<std::mutex> lock(m_systemMutex);
    size_t total = m_retiredPersisted;
    for (const auto &writer : m_writers)
    {
        total += writer->persistedEvents();
    }
    return total;
}

size_t DownloadCountingSystem::droppedEvents() const
{
    std::lock_guard<std::mutex> lock(m_systemMutex);
    size_t total = m_retiredDropped;
    for (const auto &writer : m_writers)
    {
        total += writer->droppedEvents();
    }
    return total;
}
