#include "CounterRecorder.hpp"
#include "VersionDownloads.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace
{
    void requireKey(const std::string &key)
    {
        if (key.empty())
        {
            throw std::invalid_argument("CounterRecorder: empty counter key");
        }
    }
}

CounterRecorder::CounterRecorder(std::shared_ptr<ConnectionProvider> provider, const DownloadCountsConfig &config)
    : CounterRecorder(std::move(provider), config.maxUpsertAttempts, config.baseRetryDelay)
{
}

CounterRecorder::CounterRecorder(std::shared_ptr<ConnectionProvider> provider,
                                 size_t maxUpsertAttempts,
                                 std::chrono::milliseconds baseRetryDelay)
    : m_provider(std::move(provider)),
      m_maxAttempts(maxUpsertAttempts),
      m_baseRetryDelay(baseRetryDelay)
{
    if (!m_provider)
    {
        throw std::invalid_argument("CounterRecorder: null connection provider");
    }
    if (m_maxAttempts == 0)
    {
        throw std::invalid_argument("CounterRecorder: maxUpsertAttempts must be positive");
    }
}

bool CounterRecorder::recordDownload(const std::string &key, const CalendarDate &day, TimingRecorder recorder)
{
    requireKey(key);

    try
    {
        auto connection = recorder.record("get_conn", [&]()
                                          { return m_provider->acquire(); });
        recorder.record("update_count", [&]()
                        { updateCount(*connection, key, day); });
        return true;
    }
    catch (const StoreError &e)
    {
        reportError("download of " + key + " on " + day.toString() + " not counted (" +
                    toString(e.kind()) + "): " + e.what());
    }
    catch (const std::runtime_error &e)
    {
        reportError("download of " + key + " on " + day.toString() + " not counted: " + e.what());
    }
    return false;
}

bool CounterRecorder::recordDownload(Connection &connection, const std::string &key, const CalendarDate &day,
                                     TimingRecorder recorder)
{
    requireKey(key);

    try
    {
        recorder.record("update_count", [&]()
                        { updateCount(connection, key, day); });
        return true;
    }
    catch (const StoreError &e)
    {
        reportError("download of " + key + " on " + day.toString() + " not counted (" +
                    toString(e.kind()) + "): " + e.what());
    }
    catch (const std::runtime_error &e)
    {
        reportError("download of " + key + " on " + day.toString() + " not counted: " + e.what());
    }
    return false;
}

RecordedDownload CounterRecorder::recordResolvedDownload(const VersionResolver &resolver,
                                                         const std::string &name,
                                                         const std::string &version,
                                                         const CalendarDate &day,
                                                         TimingRecorder recorder)
{
    auto resolved = recorder.record("get_version", [&]()
                                    { return resolver.resolve(name, version); });
    if (!resolved)
    {
        throw VersionNotFound(name, version);
    }

    RecordedDownload result;
    result.key = resolved->key;
    result.crateName = resolved->crateName;
    result.counted = recordDownload(resolved->key, day, recorder);
    return result;
}

void CounterRecorder::updateCount(Connection &connection, const std::string &key, const CalendarDate &day)
{
    for (size_t attempt = 1;; ++attempt)
    {
        try
        {
            TransactionScope transaction(connection);
            VersionDownloads::createOrIncrement(connection, key, day, 1, m_maxAttempts);
            transaction.commit();
            return;
        }
        catch (const StoreError &e)
        {
            if (!e.isTransient() || attempt >= m_maxAttempts)
                throw;
            auto delay = m_baseRetryDelay * (1 << std::min<size_t>(attempt - 1, 10));
            std::this_thread::sleep_for(delay);
        }
    }
}

void CounterRecorder::reportError(const std::string &message)
{
    std::cerr << "CounterRecorder Error: " << message << std::endl;
}
