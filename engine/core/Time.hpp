#pragma once

namespace engine::core
{
/// Fixed-step frame clock. The game ticks at a fixed rate regardless of the render rate.
class Time
{
public:
    explicit Time(double fixedDeltaSeconds = 1.0 / 30.0, int maxStepsPerFrame = 4);

    void SetFixedDeltaSeconds(double fixedDeltaSeconds);

    void BeginFrame(double nowSeconds);
    [[nodiscard]] bool ShouldRunFixedStep() const;
    void ConsumeFixedStep();

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] double TotalSeconds() const { return m_totalSeconds; }
    [[nodiscard]] double InterpolationAlpha() const;
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }
    [[nodiscard]] unsigned long long FixedStepIndex() const { return m_fixedStepIndex; }
    [[nodiscard]] int StepsThisFrame() const { return m_stepsThisFrame; }

private:
    double m_fixedDeltaSeconds;
    int m_maxStepsPerFrame;
    double m_deltaSeconds;
    double m_totalSeconds;
    double m_lastFrameSeconds;
    double m_accumulator;
    unsigned long long m_frameIndex;
    unsigned long long m_fixedStepIndex;
    int m_stepsThisFrame;
    bool m_firstFrame;
};
} // namespace engine::core
