#include "FixedStepScheduler.h"

// residuo de ponto flutuante aceito como passo inteiro (ms)
static constexpr double kStepTolerance = 1e-6;

FixedStepScheduler::FixedStepScheduler(double fixedStepMs, int maxFrameSteps)
    : fixedStep_(fixedStepMs > 0.0 ? fixedStepMs : 1000.0 / 60.0),
      maxFrameTime_(fixedStep_ * (maxFrameSteps > 0 ? maxFrameSteps : 1))
{
}

void FixedStepScheduler::reset()
{
    accumulated_ = 0.0;
    lastFrameTime_ = 0.0;
    clampedTotal_ = 0.0;
    timeSinceStart_ = 0.0;
    frameCount_ = 0;
    stepCount_ = 0;
    fps_ = 0.0f;
    fpsAccumTime_ = 0.0;
    fpsAccumFrames_ = 0;
}

StepPlan FixedStepScheduler::tick(double frameTimeMs)
{
    if (frameTimeMs < 0.0)
        frameTimeMs = 0.0;

    fpsAccumTime_ += frameTimeMs;
    fpsAccumFrames_++;
    if (fpsAccumTime_ >= 500.0)
    {
        fps_ = (float)(fpsAccumFrames_ * 1000.0 / fpsAccumTime_);
        fpsAccumTime_ = 0.0;
        fpsAccumFrames_ = 0;
    }

    // clamp anti "spiral of death"
    double clamped = frameTimeMs;
    if (clamped > maxFrameTime_)
    {
        clampedTotal_ += clamped - maxFrameTime_;
        clamped = maxFrameTime_;
    }

    lastFrameTime_ = clamped;
    timeSinceStart_ += clamped;
    accumulated_ += clamped;
    frameCount_++;

    StepPlan plan;
    while (accumulated_ + kStepTolerance >= fixedStep_)
    {
        accumulated_ -= fixedStep_;
        if (accumulated_ < 0.0)
            accumulated_ = 0.0;
        stepCount_++;
        plan.steps++;
    }

    plan.interpolation = interpolation();
    return plan;
}

double FixedStepScheduler::interpolation() const
{
    double alpha = accumulated_ / fixedStep_;
    return alpha < 0.0 ? 0.0 : alpha;
}
