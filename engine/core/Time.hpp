#pragma once

namespace engine::core
{
class Time
{
public:
    Time();

    void BeginFrame(double nowSeconds);

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double TotalSeconds() const { return m_totalSeconds; }
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }

private:
    double m_deltaSeconds;
    double m_totalSeconds;
    double m_lastFrameSeconds;
    unsigned long long m_frameIndex;
    bool m_firstFrame;
};

// Interval timer that wraps instead of stopping. JustFinished() reports whether
// at least one interval boundary was crossed by the most recent Tick().
class RepeatingTimer
{
public:
    explicit RepeatingTimer(float intervalSeconds = 1.0F);

    void SetInterval(float intervalSeconds);
    void Reset();
    void Tick(float deltaSeconds);

    [[nodiscard]] bool JustFinished() const { return m_timesFinishedThisTick > 0; }
    [[nodiscard]] int TimesFinishedThisTick() const { return m_timesFinishedThisTick; }
    [[nodiscard]] float Elapsed() const { return m_elapsed; }
    [[nodiscard]] float Interval() const { return m_interval; }

private:
    float m_interval;
    float m_elapsed = 0.0F;
    int m_timesFinishedThisTick = 0;
};
} // namespace engine::core
