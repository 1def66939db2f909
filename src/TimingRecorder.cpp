#include "TimingRecorder.hpp"
#include <iostream>

TimingRecorder::PhaseTimer::~PhaseTimer()
{
    if (!m_sink)
    {
        return;
    }
    try
    {
        m_sink->recordPhase(m_phase, std::chrono::steady_clock::now() - m_start);
    }
    catch (const std::exception &e)
    {
        std::cerr << "TimingRecorder Error: phase " << m_phase << " not reported: " << e.what() << std::endl;
    }
}

void CollectingTimingSink::recordPhase(const std::string &phase, std::chrono::nanoseconds duration)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_measurements.emplace_back(phase, duration);
}

std::vector<std::pair<std::string, std::chrono::nanoseconds>> CollectingTimingSink::getMeasurements() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_measurements;
}

std::vector<std::string> CollectingTimingSink::phaseNames() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_measurements.size());
    for (const auto &measurement : m_measurements)
    {
        names.push_back(measurement.first);
    }
    return names;
}

void CollectingTimingSink::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_measurements.clear();
}
