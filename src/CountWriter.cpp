#include "CountWriter.hpp"
#include "Database.hpp"
#include "VersionDownloads.hpp"
#include <iostream>
#include <map>
#include <utility>

CountWriter::CountWriter(BufferQueue &queue,
                         std::shared_ptr<ConnectionProvider> provider,
                         size_t batchSize,
                         size_t maxUpsertAttempts,
                         std::chrono::milliseconds idleDelay)
    : m_queue(queue),
      m_provider(std::move(provider)),
      m_batchSize(batchSize),
      m_maxUpsertAttempts(maxUpsertAttempts),
      m_idleDelay(idleDelay),
      m_consumerToken(queue.createConsumerToken()) {}

CountWriter::~CountWriter()
{
    stop();
}

void CountWriter::start()
{
    if (m_running.exchange(true))
    {
        return;
    }

    m_writerThread.reset(new std::thread(&CountWriter::processEvents, this));
}

void CountWriter::stop()
{
    if (m_running.exchange(false))
    {
        if (m_writerThread && m_writerThread->joinable())
        {
            m_writerThread->join();
        }
    }
}

bool CountWriter::isRunning() const
{
    return m_running.load();
}

void CountWriter::processEvents()
{
    std::vector<DownloadEvent> batch;

    while (m_running)
    {
        size_t eventsDequeued = m_queue.tryDequeueBatch(batch, m_batchSize, m_consumerToken);
        if (eventsDequeued == 0)
        {
            std::this_thread::sleep_for(m_idleDelay);
            continue;
        }

        persistBatch(batch);
        batch.clear();
    }

    // drain what producers left behind before stop()
    while (m_queue.tryDequeueBatch(batch, m_batchSize, m_consumerToken) > 0)
    {
        persistBatch(batch);
        batch.clear();
    }
}

void CountWriter::persistBatch(std::vector<DownloadEvent> &batch)
{
    std::map<std::pair<std::string, int64_t>, int64_t> increments;
    for (auto &event : batch)
    {
        ++increments[{std::move(event.key), event.day.daysSinceEpoch()}];
    }

    std::unique_ptr<Connection> connection;
    try
    {
        connection = m_provider->acquire();
    }
    catch (const StoreError &e)
    {
        reportError(std::string("dropping ") + std::to_string(batch.size()) + " downloads: " + e.what());
        m_droppedEvents += batch.size();
        return;
    }

    for (const auto &[target, amount] : increments)
    {
        const CalendarDate day = CalendarDate::fromDaysSinceEpoch(target.second);
        try
        {
            TransactionScope transaction(*connection);
            VersionDownloads::createOrIncrement(*connection, target.first, day, amount, m_maxUpsertAttempts);
            transaction.commit();
            m_persistedEvents += static_cast<size_t>(amount);
        }
        catch (const StoreError &e)
        {
            reportError("dropping " + std::to_string(amount) + " downloads of " + target.first +
                        " on " + day.toString() + ": " + e.what());
            m_droppedEvents += static_cast<size_t>(amount);
        }
    }
}

void CountWriter::reportError(const std::string &message)
{
    std::cerr << "CountWriter Error: " << message << std::endl;
}
