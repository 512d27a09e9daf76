#include "TimeScaleController.h"
#include <cstdio>

TimeScaleController::TimeScaleController(const Clock &clock, const TimeScaleSettings &settings, Era initialEra)
    : clock_(clock),
      settings_(settings),
      currentEra_(initialEra),
      sourceEra_(initialEra),
      targetEra_(initialEra)
{
    if (settings_.transitionRate <= 0.0f)
        settings_.transitionRate = 1.0f / 30.0f;
}

const TimeStepEvents &TimeScaleController::update()
{
    events_ = TimeStepEvents{};

    updateSlowMotion(clock_.nowMs());
    updateTransition();

    return events_;
}

void TimeScaleController::updateSlowMotion(std::uint64_t now)
{
    if (!slowMotionActive_ || now < slowMotionEndsAt_)
        return;

    slowMotionActive_ = false;
    scale_ = 1.0f;
    cooldownEndsAt_ = now + settings_.slowMotionCooldownMs;
    events_.slowMotionEnded = true;
}

void TimeScaleController::updateTransition()
{
    if (phase_ == TransitionPhase::FadingOut)
    {
        progress_ += settings_.transitionRate;
        if (progress_ >= 1.0f)
        {
            // unico instante em que a era muda de fato
            progress_ = 1.0f;
            currentEra_ = targetEra_;
            phase_ = TransitionPhase::FadingIn;
            events_.eraSwitched = true;
        }
    }
    else if (phase_ == TransitionPhase::FadingIn)
    {
        progress_ -= settings_.transitionRate;
        if (progress_ <= 0.0f)
        {
            progress_ = 0.0f;
            phase_ = TransitionPhase::Stable;
            events_.transitionCompleted = true;
        }
    }
}

bool TimeScaleController::startSlowMotion()
{
    std::uint64_t now = clock_.nowMs();
    if (slowMotionActive_ || now < cooldownEndsAt_)
        return false;

    slowMotionActive_ = true;
    scale_ = settings_.slowMotionFactor;
    slowMotionEndsAt_ = now + settings_.slowMotionDurationMs;
    return true;
}

bool TimeScaleController::beginTransition(Era targetEra)
{
    if (transitioning() || targetEra == currentEra_)
        return false;

    sourceEra_ = currentEra_;
    targetEra_ = targetEra;
    progress_ = 0.0f;
    phase_ = TransitionPhase::FadingOut;
    std::printf("TimeScaleController: transition %s -> %s\n", EraName(sourceEra_), EraName(targetEra_));
    return true;
}

bool TimeScaleController::resetEra(Era era)
{
    if (transitioning())
        return false;

    currentEra_ = era;
    sourceEra_ = era;
    targetEra_ = era;
    return true;
}

SlowMotionState TimeScaleController::slowMotionState() const
{
    if (slowMotionActive_)
        return SlowMotionState::Active;
    if (clock_.nowMs() < cooldownEndsAt_)
        return SlowMotionState::Cooldown;
    return SlowMotionState::Idle;
}

std::uint64_t TimeScaleController::slowMotionRemainingMs() const
{
    if (!slowMotionActive_)
        return 0;
    std::uint64_t now = clock_.nowMs();
    return now < slowMotionEndsAt_ ? slowMotionEndsAt_ - now : 0;
}

std::uint64_t TimeScaleController::cooldownRemainingMs() const
{
    if (slowMotionActive_)
        return 0;
    std::uint64_t now = clock_.nowMs();
    return now < cooldownEndsAt_ ? cooldownEndsAt_ - now : 0;
}
