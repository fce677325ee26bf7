#include "engine/core/Time.hpp"

#include <algorithm>
#include <cmath>

namespace engine::core
{
namespace
{
constexpr float kMinTimerInterval = 1.0e-4F;
}

Time::Time()
    : m_deltaSeconds(0.0)
    , m_totalSeconds(0.0)
    , m_lastFrameSeconds(0.0)
    , m_frameIndex(0)
    , m_firstFrame(true)
{
}

void Time::BeginFrame(double nowSeconds)
{
    if (m_firstFrame)
    {
        m_lastFrameSeconds = nowSeconds;
        m_firstFrame = false;
    }

    const double rawDelta = nowSeconds - m_lastFrameSeconds;
    m_deltaSeconds = std::clamp(rawDelta, 0.0, 0.25);
    m_lastFrameSeconds = nowSeconds;
    m_totalSeconds += m_deltaSeconds;
    ++m_frameIndex;
}

RepeatingTimer::RepeatingTimer(float intervalSeconds)
    : m_interval(std::max(kMinTimerInterval, intervalSeconds))
{
}

void RepeatingTimer::SetInterval(float intervalSeconds)
{
    m_interval = std::max(kMinTimerInterval, intervalSeconds);
    m_elapsed = std::min(m_elapsed, m_interval);
}

void RepeatingTimer::Reset()
{
    m_elapsed = 0.0F;
    m_timesFinishedThisTick = 0;
}

void RepeatingTimer::Tick(float deltaSeconds)
{
    m_timesFinishedThisTick = 0;
    if (deltaSeconds <= 0.0F)
    {
        return;
    }

    m_elapsed += deltaSeconds;
    if (m_elapsed < m_interval)
    {
        return;
    }

    const float wraps = std::floor(m_elapsed / m_interval);
    m_timesFinishedThisTick = static_cast<int>(wraps);
    m_elapsed = std::max(0.0F, m_elapsed - wraps * m_interval);
}
} // namespace engine::core
