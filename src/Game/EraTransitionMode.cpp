#include "EraTransitionMode.h"
#include "PlayingMode.h"
#include "../Renderer/CommandBuffer.h"
#include "../Time/TimeScaleController.h"

EraTransitionMode::EraTransitionMode(PlayingMode &playing, const TimeScaleController &timeScale)
    : playing_(playing),
      timeScale_(timeScale)
{
}

ModeRequest EraTransitionMode::update(float dtMs)
{
    (void)dtMs;

    // o controller ja avancou neste passo; so reagimos aos eventos dele
    const TimeStepEvents &events = timeScale_.lastStepEvents();
    if (events.eraSwitched)
        playing_.applyEra(timeScale_.currentEra());
    if (events.transitionCompleted)
        return GameMode::Playing;
    return std::nullopt;
}

float EraTransitionMode::overlayAlpha() const
{
    return timeScale_.transitionProgress() * 255.0f;
}

void EraTransitionMode::draw(DrawContext &ctx) const
{
    ctx.interpolation = 1.0f;
    playing_.draw(ctx);

    const EraColor &c = GetEraTuning(timeScale_.targetEra()).color;
    ctx.cmds.rect(500, 0.0f, 0.0f, ctx.surfaceW, ctx.surfaceH, c.r, c.g, c.b,
                  (unsigned char)overlayAlpha(), true);
}
