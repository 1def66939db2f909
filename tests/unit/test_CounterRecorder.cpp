#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "CounterRecorder.hpp"
#include "VersionDownloads.hpp"
#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

class MockConnectionProvider : public ConnectionProvider
{
public:
    MOCK_METHOD(std::unique_ptr<Connection>, acquire, (), (override));
};

class CounterRecorderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        testDir = "test_counter_recorder";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
        dbPath = testDir + "/downloads.db";

        config.databasePath = dbPath;
        config.busyTimeout = std::chrono::seconds(30);
        config.maxUpsertAttempts = 5;

        provider = std::make_shared<SqliteConnectionProvider>(config);
        recorder = std::make_unique<CounterRecorder>(provider, config);
    }

    void TearDown() override
    {
        recorder.reset();
        provider.reset();
        std::filesystem::remove_all(testDir);
    }

    std::optional<int64_t> storedCount(const std::string &key, const CalendarDate &day)
    {
        auto connection = provider->acquire();
        return VersionDownloads::countFor(*connection, key, day);
    }

    int64_t rowCount()
    {
        auto connection = provider->acquire();
        Statement stmt = connection->prepare("SELECT COUNT(*) FROM version_downloads");
        EXPECT_TRUE(stmt.step());
        return stmt.columnInt64(0);
    }

    void installTrigger(const std::string &sql)
    {
        auto connection = provider->acquire();
        connection->execute(sql);
    }

    std::string testDir;
    std::string dbPath;
    DownloadCountsConfig config;
    std::shared_ptr<SqliteConnectionProvider> provider;
    std::unique_ptr<CounterRecorder> recorder;
    const CalendarDate day{2024, 1, 10};
};

TEST_F(CounterRecorderTest, FirstDownloadCreatesRow)
{
    EXPECT_TRUE(recorder->recordDownload("K", day));
    EXPECT_EQ(storedCount("K", day), 1);
    EXPECT_EQ(rowCount(), 1);
}

TEST_F(CounterRecorderTest, LaterDownloadsIncrementSameRow)
{
    for (int i = 0; i < 3; ++i)
    {
        EXPECT_TRUE(recorder->recordDownload("K", day));
    }
    EXPECT_TRUE(recorder->recordDownload("K", day.addDays(1)));

    EXPECT_EQ(storedCount("K", day), 3);
    EXPECT_EQ(storedCount("K", day.addDays(1)), 1);
    EXPECT_EQ(rowCount(), 2);
}

TEST_F(CounterRecorderTest, ReportsConnectionAndUpdatePhases)
{
    auto sink = std::make_shared<CollectingTimingSink>();
    EXPECT_TRUE(recorder->recordDownload("K", day, TimingRecorder(sink)));
    EXPECT_EQ(sink->phaseNames(), (std::vector<std::string>{"get_conn", "update_count"}));
}

TEST_F(CounterRecorderTest, EmptyKeyIsAContractViolation)
{
    EXPECT_THROW(recorder->recordDownload("", day), std::invalid_argument);
    EXPECT_EQ(rowCount(), 0);
}

TEST_F(CounterRecorderTest, ConstructionRequiresProviderAndAttempts)
{
    EXPECT_THROW(CounterRecorder(nullptr, config), std::invalid_argument);
    EXPECT_THROW(CounterRecorder(provider, 0), std::invalid_argument);
}

TEST_F(CounterRecorderTest, OfflineStoreReturnsFalseAndLeavesNoResidue)
{
    auto mock = std::make_shared<MockConnectionProvider>();
    EXPECT_CALL(*mock, acquire())
        .WillOnce(::testing::Throw(StoreError(StoreErrorKind::Unavailable, 0, "store offline")))
        .WillOnce(::testing::Invoke([this]()
                                    { return provider->acquire(); }));

    CounterRecorder offlineRecorder(mock, config);

    EXPECT_FALSE(offlineRecorder.recordDownload("K", day));
    EXPECT_FALSE(storedCount("K", day).has_value());

    EXPECT_TRUE(offlineRecorder.recordDownload("K", day));
    EXPECT_EQ(storedCount("K", day), 1);
}

TEST_F(CounterRecorderTest, OfflineStoreStillReportsConnectionPhase)
{
    auto mock = std::make_shared<MockConnectionProvider>();
    EXPECT_CALL(*mock, acquire())
        .WillOnce(::testing::Throw(StoreError(StoreErrorKind::Unavailable, 0, "store offline")));

    auto sink = std::make_shared<CollectingTimingSink>();
    CounterRecorder offlineRecorder(mock, config);

    EXPECT_FALSE(offlineRecorder.recordDownload("K", day, TimingRecorder(sink)));
    EXPECT_EQ(sink->phaseNames(), (std::vector<std::string>{"get_conn"}));
}

TEST_F(CounterRecorderTest, UnopenableDatabaseReturnsFalse)
{
    auto missing = std::make_shared<SqliteConnectionProvider>(
        testDir + "/no/such/dir/downloads.db", std::chrono::milliseconds(100));
    CounterRecorder missingRecorder(missing, config);

    EXPECT_FALSE(missingRecorder.recordDownload("K", day));
}

TEST_F(CounterRecorderTest, ReadOnlyStoreReturnsFalse)
{
    EXPECT_TRUE(recorder->recordDownload("K", day));

    auto readOnly = std::make_shared<SqliteConnectionProvider>(dbPath, std::chrono::milliseconds(100), true);
    CounterRecorder readOnlyRecorder(readOnly, config);

    EXPECT_FALSE(readOnlyRecorder.recordDownload("K", day));
    EXPECT_FALSE(readOnlyRecorder.recordDownload("NEW", day));
    EXPECT_EQ(storedCount("K", day), 1);
    EXPECT_EQ(rowCount(), 1);
}

TEST_F(CounterRecorderTest, RejectedInsertLeavesNoPartialRow)
{
    installTrigger("CREATE TRIGGER reject_new_rows AFTER INSERT ON version_downloads "
                   "BEGIN SELECT RAISE(ABORT, 'store rejected insert'); END");

    EXPECT_FALSE(recorder->recordDownload("K", day));
    EXPECT_EQ(rowCount(), 0);
}

TEST_F(CounterRecorderTest, RejectedIncrementLeavesCountUnchanged)
{
    EXPECT_TRUE(recorder->recordDownload("K", day));
    EXPECT_TRUE(recorder->recordDownload("K", day));

    installTrigger("CREATE TRIGGER reject_updates AFTER UPDATE ON version_downloads "
                   "BEGIN SELECT RAISE(ABORT, 'store rejected update'); END");

    EXPECT_FALSE(recorder->recordDownload("K", day));
    EXPECT_EQ(storedCount("K", day), 2);
}

class FailingTimingSink : public PhaseTimingSink
{
public:
    void recordPhase(const std::string &, std::chrono::nanoseconds) override
    {
        throw std::runtime_error("metrics collector down");
    }
};

TEST_F(CounterRecorderTest, FailingTimingSinkDoesNotAffectCounting)
{
    auto sink = std::make_shared<FailingTimingSink>();

    EXPECT_TRUE(recorder->recordDownload("K", day, TimingRecorder(sink)));
    EXPECT_EQ(storedCount("K", day), 1);
}

// The trigger creates the row just before each insert, so every insert hits
// the primary key and the conflict never resolves.
class UnresolvableConflictTest : public CounterRecorderTest,
                                 public ::testing::WithParamInterface<size_t>
{
};

TEST_P(UnresolvableConflictTest, ExhaustedUpsertAttemptsReturnFalse)
{
    installTrigger("CREATE TRIGGER steal_row BEFORE INSERT ON version_downloads "
                   "WHEN NEW.version_key = 'K' BEGIN "
                   "INSERT INTO version_downloads (version_key, date, downloads) "
                   "VALUES (NEW.version_key, NEW.date, 1); END");

    CounterRecorder boundedRecorder(provider, GetParam());

    EXPECT_FALSE(boundedRecorder.recordDownload("K", day));
    EXPECT_FALSE(storedCount("K", day).has_value());
    EXPECT_EQ(rowCount(), 0);

    EXPECT_TRUE(boundedRecorder.recordDownload("OTHER", day));
    EXPECT_EQ(storedCount("OTHER", day), 1);
}

INSTANTIATE_TEST_SUITE_P(AttemptBounds, UnresolvableConflictTest, ::testing::Values(1, 3));

TEST_F(CounterRecorderTest, LockedStoreGivesUpAfterBusyTimeout)
{
    EXPECT_TRUE(recorder->recordDownload("K", day));

    Connection locker(dbPath);
    locker.execute("BEGIN IMMEDIATE");

    auto impatient = std::make_shared<SqliteConnectionProvider>(dbPath, std::chrono::milliseconds(50));
    CounterRecorder impatientRecorder(impatient, 2, std::chrono::milliseconds(1));

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(impatientRecorder.recordDownload("K", day));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));

    locker.execute("ROLLBACK");

    EXPECT_TRUE(impatientRecorder.recordDownload("K", day));
    EXPECT_EQ(storedCount("K", day), 2);
}

TEST_F(CounterRecorderTest, FailedRecordingDoesNotPoisonCallerTransaction)
{
    auto connection = provider->acquire();
    connection->execute("CREATE TABLE orders (id INTEGER PRIMARY KEY, item TEXT NOT NULL)");
    installTrigger("CREATE TRIGGER reject_new_rows AFTER INSERT ON version_downloads "
                   "BEGIN SELECT RAISE(ABORT, 'store rejected insert'); END");

    {
        TransactionScope callerTransaction(*connection);
        connection->execute("INSERT INTO orders (item) VALUES ('crate download')");

        EXPECT_FALSE(recorder->recordDownload(*connection, "K", day));
        EXPECT_TRUE(connection->inTransaction());

        connection->execute("INSERT INTO orders (item) VALUES ('after recording')");
        callerTransaction.commit();
    }

    Statement stmt = connection->prepare("SELECT COUNT(*) FROM orders");
    ASSERT_TRUE(stmt.step());
    EXPECT_EQ(stmt.columnInt64(0), 2);
    EXPECT_EQ(rowCount(), 0);
}

TEST_F(CounterRecorderTest, NestedRecordingFollowsCallerOutcome)
{
    auto connection = provider->acquire();

    {
        TransactionScope callerTransaction(*connection);
        EXPECT_TRUE(recorder->recordDownload(*connection, "K", day));
        callerTransaction.commit();
    }
    EXPECT_EQ(storedCount("K", day), 1);

    {
        TransactionScope callerTransaction(*connection);
        EXPECT_TRUE(recorder->recordDownload(*connection, "K", day));
        callerTransaction.rollback();
    }
    EXPECT_EQ(storedCount("K", day), 1);
}

TEST_F(CounterRecorderTest, CallerConnectionWithoutTransactionCommitsImmediately)
{
    auto connection = provider->acquire();
    EXPECT_TRUE(recorder->recordDownload(*connection, "K", day));
    EXPECT_FALSE(connection->inTransaction());
    EXPECT_EQ(storedCount("K", day), 1);
}

TEST_F(CounterRecorderTest, ResolvedDownloadCountsUnderResolvedKey)
{
    InMemoryVersionResolver resolver;
    resolver.addVersion("Serde_Json", "1.0.0", "v-42");

    auto sink = std::make_shared<CollectingTimingSink>();
    RecordedDownload result = recorder->recordResolvedDownload(resolver, "serde-json", "1.0.0", day, TimingRecorder(sink));

    EXPECT_TRUE(result.counted);
    EXPECT_EQ(result.key, "v-42");
    EXPECT_EQ(result.crateName, "Serde_Json");
    EXPECT_EQ(storedCount("v-42", day), 1);
    EXPECT_EQ(sink->phaseNames(), (std::vector<std::string>{"get_version", "get_conn", "update_count"}));
}

TEST_F(CounterRecorderTest, UnknownVersionPropagatesNotFound)
{
    InMemoryVersionResolver resolver;
    resolver.addVersion("serde", "1.0.0", "v-1");

    EXPECT_THROW(recorder->recordResolvedDownload(resolver, "serde", "2.0.0", day), VersionNotFound);
    EXPECT_THROW(recorder->recordResolvedDownload(resolver, "tokio", "1.0.0", day), VersionNotFound);
    EXPECT_EQ(rowCount(), 0);
}

TEST_F(CounterRecorderTest, ResolvedDownloadOnFailingStoreIsUncounted)
{
    InMemoryVersionResolver resolver;
    resolver.addVersion("serde", "1.0.0", "v-1");

    auto mock = std::make_shared<MockConnectionProvider>();
    EXPECT_CALL(*mock, acquire())
        .WillOnce(::testing::Throw(StoreError(StoreErrorKind::ReadOnly, 0, "read only mode")));
    CounterRecorder offlineRecorder(mock, config);

    RecordedDownload result = offlineRecorder.recordResolvedDownload(resolver, "serde", "1.0.0", day);
    EXPECT_FALSE(result.counted);
    EXPECT_EQ(result.crateName, "serde");
}

class ConcurrentRecordingTest : public CounterRecorderTest,
                                public ::testing::WithParamInterface<int>
{
};

TEST_P(ConcurrentRecordingTest, EveryConcurrentDownloadIsCounted)
{
    const int numThreads = GetParam();
    std::atomic<bool> go{false};
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    threads.reserve(numThreads);
    for (int i = 0; i < numThreads; ++i)
    {
        threads.emplace_back([&]()
                             {
            while (!go.load())
            {
                std::this_thread::yield();
            }
            if (recorder->recordDownload("K", day))
            {
                successes++;
            } });
    }

    go.store(true);
    for (auto &thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(successes.load(), numThreads);
    EXPECT_EQ(storedCount("K", day), numThreads);
    EXPECT_EQ(rowCount(), 1);
}

INSTANTIATE_TEST_SUITE_P(ThreadCounts, ConcurrentRecordingTest, ::testing::Values(1, 2, 10, 100));
