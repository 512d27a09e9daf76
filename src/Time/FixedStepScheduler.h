#pragma once
#include <cstdint>

struct StepPlan
{
    int steps = 0;              // passos fixos a simular neste frame
    double interpolation = 0.0; // [0,1) para o render
};

class FixedStepScheduler
{
public:
    explicit FixedStepScheduler(double fixedStepMs = 1000.0 / 60.0, int maxFrameSteps = 5);

    void reset();

    // Engine: chamada 1x por frame com o tempo medido do frame
    StepPlan tick(double frameTimeMs);

    double interpolation() const;

    double fixedStep() const { return fixedStep_; }
    double maxFrameTime() const { return maxFrameTime_; }
    double accumulated() const { return accumulated_; }

    std::uint64_t frameCount() const { return frameCount_; }
    std::uint64_t stepCount() const { return stepCount_; }
    double clampedTotal() const { return clampedTotal_; } // ms descartados pelo clamp
    double timeSinceStart() const { return timeSinceStart_; }
    double lastFrameTime() const { return lastFrameTime_; }
    float fps() const { return fps_; }

private:
    double fixedStep_;
    double maxFrameTime_;

    double accumulated_ = 0.0;
    double lastFrameTime_ = 0.0;
    double clampedTotal_ = 0.0;
    double timeSinceStart_ = 0.0;

    std::uint64_t frameCount_ = 0;
    std::uint64_t stepCount_ = 0;

    float fps_ = 0.0f;
    double fpsAccumTime_ = 0.0;
    int fpsAccumFrames_ = 0;
};
