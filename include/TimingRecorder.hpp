#ifndef TIMING_RECORDER_HPP
#define TIMING_RECORDER_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Receives the duration of each named phase of a request
class PhaseTimingSink
{
public:
    virtual ~PhaseTimingSink() = default;
    virtual void recordPhase(const std::string &phase, std::chrono::nanoseconds duration) = 0;
};

// Keeps every reported phase in memory
class CollectingTimingSink : public PhaseTimingSink
{
public:
    void recordPhase(const std::string &phase, std::chrono::nanoseconds duration) override;

    std::vector<std::pair<std::string, std::chrono::nanoseconds>> getMeasurements() const;
    std::vector<std::string> phaseNames() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, std::chrono::nanoseconds>> m_measurements;
};

// Times a callable and reports it to the sink under the given phase name.
// The phase is reported whether the callable returns or throws. Sink
// failures never reach the caller.
// A recorder without a sink only runs the callable.
class TimingRecorder
{
public:
    TimingRecorder() = default;
    explicit TimingRecorder(std::shared_ptr<PhaseTimingSink> sink) : m_sink(std::move(sink)) {}

    template <typename Func>
    auto record(const std::string &phase, Func &&f) -> decltype(f())
    {
        PhaseTimer timer(m_sink.get(), phase);
        return f();
    }

private:
    class PhaseTimer
    {
    public:
        PhaseTimer(PhaseTimingSink *sink, const std::string &phase)
            : m_sink(sink), m_phase(phase), m_start(std::chrono::steady_clock::now()) {}

        // A failing sink is reported and otherwise ignored
        ~PhaseTimer();

        PhaseTimer(const PhaseTimer &) = delete;
        PhaseTimer &operator=(const PhaseTimer &) = delete;

    private:
        PhaseTimingSink *m_sink;
        const std::string &m_phase;
        std::chrono::steady_clock::time_point m_start;
    };

    std::shared_ptr<PhaseTimingSink> m_sink;
};

#endif
