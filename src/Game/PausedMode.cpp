#include "PausedMode.h"
#include "PlayingMode.h"
#include "../Input/Input.h"
#include "../Renderer/CommandBuffer.h"
#include <algorithm>

static const char *kPauseOptions[] = {"Resume", "Return to Menu"};
static constexpr int kPauseOptionCount = 2;

PausedMode::PausedMode(const Input &bindings, const PlayingMode &playing)
    : bindings_(bindings),
      playing_(playing)
{
}

void PausedMode::onEnter(GameMode previous)
{
    (void)previous;
    selected_ = 0;
    overlayAlpha_ = 0.0f;
}

ModeRequest PausedMode::handleInput(const InputEvent &event)
{
    if (event.type != InputEventType::KeyDown)
        return std::nullopt;

    if (bindings_.matches("MenuUp", event.key))
        selected_ = (selected_ + kPauseOptionCount - 1) % kPauseOptionCount;
    else if (bindings_.matches("MenuDown", event.key))
        selected_ = (selected_ + 1) % kPauseOptionCount;
    else if (event.repeat)
        return std::nullopt;
    else if (bindings_.matches("Back", event.key))
        return GameMode::Playing;
    else if (bindings_.matches("Confirm", event.key))
        return selected_ == 0 ? GameMode::Playing : GameMode::Menu;

    return std::nullopt;
}

ModeRequest PausedMode::update(float dtMs)
{
    overlayAlpha_ = std::min(kOverlayTargetAlpha, overlayAlpha_ + kOverlayFadeSpeed * (dtMs / 1000.0f));
    return std::nullopt;
}

void PausedMode::draw(DrawContext &ctx) const
{
    // mundo congelado por baixo
    ctx.interpolation = 1.0f;
    playing_.draw(ctx);

    CommandBuffer &cmds = ctx.cmds;
    float cx = ctx.surfaceW * 0.5f;

    cmds.rect(400, 0.0f, 0.0f, ctx.surfaceW, ctx.surfaceH, 0, 0, 0, (unsigned char)overlayAlpha_, true);
    cmds.text(401, "PAUSED", cx, ctx.surfaceH * 0.33f, FontStyle::Title, 255, 255, 255, 255, true);

    for (int i = 0; i < kPauseOptionCount; ++i)
    {
        bool active = (i == selected_);
        unsigned char shade = active ? 255 : 128;
        cmds.text(401, kPauseOptions[i], cx, ctx.surfaceH * 0.5f + i * 50.0f, FontStyle::Body,
                  shade, shade, active ? 0 : 128, 255, true);
    }
}
