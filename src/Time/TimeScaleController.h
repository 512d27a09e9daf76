#pragma once
#include <cstdint>
#include "Clock.h"
#include "../Game/Era.h"

struct TimeScaleSettings
{
    float slowMotionFactor = 0.5f;
    std::uint64_t slowMotionDurationMs = 5000;
    std::uint64_t slowMotionCooldownMs = 30000;
    float transitionRate = 1.0f / 30.0f; // progresso por passo fixo
};

enum class SlowMotionState : std::uint8_t
{
    Idle,
    Active,
    Cooldown
};

enum class TransitionPhase : std::uint8_t
{
    Stable,
    FadingOut, // progresso 0 -> 1
    FadingIn   // progresso 1 -> 0
};

// O que aconteceu no ultimo update(); valido ate o proximo passo
struct TimeStepEvents
{
    bool slowMotionEnded = false;
    bool eraSwitched = false;
    bool transitionCompleted = false;
};

class TimeScaleController
{
public:
    TimeScaleController(const Clock &clock, const TimeScaleSettings &settings, Era initialEra = Era::Medieval);

    // Chamada 1x por passo fixo, antes do update do jogo
    const TimeStepEvents &update();
    const TimeStepEvents &lastStepEvents() const { return events_; }

    // Falha (false) se ja ativo ou em cooldown
    bool startSlowMotion();

    // No-op (false) se ja em transicao ou target == era atual
    bool beginTransition(Era targetEra);

    // Resincroniza a era (ex: save carregado). Recusado durante transicao.
    bool resetEra(Era era);

    float timeScale() const { return scale_; }

    SlowMotionState slowMotionState() const;
    bool slowMotionActive() const { return slowMotionActive_; }
    std::uint64_t slowMotionRemainingMs() const;
    std::uint64_t cooldownRemainingMs() const;

    bool transitioning() const { return phase_ != TransitionPhase::Stable; }
    TransitionPhase transitionPhase() const { return phase_; }
    float transitionProgress() const { return progress_; }

    Era currentEra() const { return currentEra_; }
    Era sourceEra() const { return sourceEra_; }
    Era targetEra() const { return targetEra_; }

    const TimeScaleSettings &settings() const { return settings_; }

private:
    void updateSlowMotion(std::uint64_t now);
    void updateTransition();

private:
    const Clock &clock_;
    TimeScaleSettings settings_;

    float scale_ = 1.0f;
    bool slowMotionActive_ = false;
    std::uint64_t slowMotionEndsAt_ = 0;
    std::uint64_t cooldownEndsAt_ = 0;

    TransitionPhase phase_ = TransitionPhase::Stable;
    float progress_ = 0.0f;
    Era currentEra_;
    Era sourceEra_;
    Era targetEra_;

    TimeStepEvents events_;
};
