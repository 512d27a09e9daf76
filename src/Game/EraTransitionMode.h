#pragma once
#include "DrawContext.h"
#include "GameModeMachine.h"

class PlayingMode;
class TimeScaleController;

// Fade para a cor da era alvo e de volta. Gameplay congelado durante o fade.
class EraTransitionMode
{
public:
    EraTransitionMode(PlayingMode &playing, const TimeScaleController &timeScale);

    ModeRequest update(float dtMs);
    void draw(DrawContext &ctx) const;

    float overlayAlpha() const;

private:
    PlayingMode &playing_;
    const TimeScaleController &timeScale_;
};
