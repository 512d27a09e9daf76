#pragma once
#include "DrawContext.h"
#include "GameModeMachine.h"

class Input;
class PlayingMode;

class PausedMode
{
public:
    static constexpr float kOverlayTargetAlpha = 128.0f;
    static constexpr float kOverlayFadeSpeed = 512.0f; // alpha/s

    PausedMode(const Input &bindings, const PlayingMode &playing);

    void onEnter(GameMode previous);
    ModeRequest handleInput(const InputEvent &event);
    ModeRequest update(float dtMs);
    void draw(DrawContext &ctx) const;

    int selected() const { return selected_; }
    float overlayAlpha() const { return overlayAlpha_; }

private:
    const Input &bindings_;
    const PlayingMode &playing_;
    int selected_ = 0; // 0 = Resume, 1 = Return to Menu
    float overlayAlpha_ = 0.0f;
};
