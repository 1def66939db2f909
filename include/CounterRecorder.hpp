#ifndef COUNTER_RECORDER_HPP
#define COUNTER_RECORDER_HPP

#include "CalendarDate.hpp"
#include "Config.hpp"
#include "ConnectionProvider.hpp"
#include "Database.hpp"
#include "TimingRecorder.hpp"
#include "VersionResolver.hpp"
#include <chrono>
#include <memory>
#include <string>

struct RecordedDownload
{
    std::string key;
    std::string crateName;
    bool counted = false;
};

// Best-effort daily download counting. Store failures are reported on
// std::cerr and returned as false, never thrown: a download must succeed
// even when it cannot be counted.
class CounterRecorder
{
public:
    CounterRecorder(std::shared_ptr<ConnectionProvider> provider, const DownloadCountsConfig &config);
    CounterRecorder(std::shared_ptr<ConnectionProvider> provider,
                    size_t maxUpsertAttempts = 3,
                    std::chrono::milliseconds baseRetryDelay = std::chrono::milliseconds(1));

    // Acquires its own connection ("get_conn") and adds one download for
    // (key, day) in a dedicated transaction ("update_count").
    bool recordDownload(const std::string &key, const CalendarDate &day,
                        TimingRecorder recorder = TimingRecorder());

    // Counts on a connection owned by the caller. If the caller has a
    // transaction open, the update runs in a savepoint inside it and a
    // failure rolls back only that savepoint.
    bool recordDownload(Connection &connection, const std::string &key, const CalendarDate &day,
                        TimingRecorder recorder = TimingRecorder());

    // Resolves (name, version) first ("get_version"). Throws VersionNotFound
    // when the version does not exist; counting failures only clear `counted`.
    RecordedDownload recordResolvedDownload(const VersionResolver &resolver,
                                            const std::string &name,
                                            const std::string &version,
                                            const CalendarDate &day,
                                            TimingRecorder recorder = TimingRecorder());

private:
    void updateCount(Connection &connection, const std::string &key, const CalendarDate &day);
    void reportError(const std::string &message);

    std::shared_ptr<ConnectionProvider> m_provider;
    size_t m_maxAttempts;
    std::chrono::milliseconds m_baseRetryDelay;
};

#endif
