#include <gtest/gtest.h>
#include "TimingRecorder.hpp"
#include <stdexcept>
#include <thread>

TEST(TimingRecorderTest, RecordsPhaseAndReturnsValue)
{
    auto sink = std::make_shared<CollectingTimingSink>();
    TimingRecorder recorder(sink);

    int result = recorder.record("compute", []()
                                 {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return 42; });

    EXPECT_EQ(result, 42);
    auto measurements = sink->getMeasurements();
    ASSERT_EQ(measurements.size(), 1u);
    EXPECT_EQ(measurements[0].first, "compute");
    EXPECT_GE(measurements[0].second, std::chrono::milliseconds(2));
}

TEST(TimingRecorderTest, RecordsVoidPhasesInOrder)
{
    auto sink = std::make_shared<CollectingTimingSink>();
    TimingRecorder recorder(sink);

    int calls = 0;
    recorder.record("first", [&]()
                    { ++calls; });
    recorder.record("second", [&]()
                    { ++calls; });

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(sink->phaseNames(), (std::vector<std::string>{"first", "second"}));
}

TEST(TimingRecorderTest, RecordsPhaseWhenCallableThrows)
{
    auto sink = std::make_shared<CollectingTimingSink>();
    TimingRecorder recorder(sink);

    EXPECT_THROW(recorder.record("failing", []() -> int
                                 { throw std::runtime_error("boom"); }),
                 std::runtime_error);
    EXPECT_EQ(sink->phaseNames(), (std::vector<std::string>{"failing"}));
}

TEST(TimingRecorderTest, RecorderWithoutSinkStillRuns)
{
    TimingRecorder recorder;
    EXPECT_EQ(recorder.record("unobserved", []()
                              { return std::string("ok"); }),
              "ok");
}

TEST(TimingRecorderTest, CopiesShareTheSink)
{
    auto sink = std::make_shared<CollectingTimingSink>();
    TimingRecorder recorder(sink);
    TimingRecorder copy = recorder;

    recorder.record("a", []() {});
    copy.record("b", []() {});

    EXPECT_EQ(sink->getMeasurements().size(), 2u);
    sink->clear();
    EXPECT_TRUE(sink->getMeasurements().empty());
}

class FailingTimingSink : public PhaseTimingSink
{
public:
    void recordPhase(const std::string &, std::chrono::nanoseconds) override
    {
        ++calls;
        throw std::runtime_error("metrics collector down");
    }

    int calls = 0;
};

TEST(TimingRecorderTest, FailingSinkDoesNotReachCaller)
{
    auto sink = std::make_shared<FailingTimingSink>();
    TimingRecorder recorder(sink);

    int result = 0;
    EXPECT_NO_THROW(result = recorder.record("compute", []()
                                             { return 7; }));
    EXPECT_EQ(result, 7);
    EXPECT_EQ(sink->calls, 1);
}

TEST(TimingRecorderTest, FailingSinkKeepsCallableException)
{
    auto sink = std::make_shared<FailingTimingSink>();
    TimingRecorder recorder(sink);

    EXPECT_THROW(recorder.record("failing", []() -> int
                                 { throw std::logic_error("boom"); }),
                 std::logic_error);
    EXPECT_EQ(sink->calls, 1);
}
