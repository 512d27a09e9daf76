#include "RenderSystem.h"
#include "../World/Scene.h"
#include "../Renderer/CommandBuffer.h"

static float Lerp(float a, float b, float t)
{
    return a + (b - a) * t;
}

void RenderSystem::render(const Scene &scene, CommandBuffer &cmds, float alpha) const
{
    if (alpha < 0.0f)
        alpha = 0.0f;
    if (alpha > 1.0f)
        alpha = 1.0f;

    for (const auto &e : scene.entities())
    {
        if (!e.rect.enabled || e.pendingDestroy)
            continue;

        RenderCommand cmd;
        cmd.type = RenderCommandType::Rect;
        cmd.layer = e.renderLayer;
        cmd.x = Lerp(e.transform.prevX, e.transform.x, alpha);
        cmd.y = Lerp(e.transform.prevY, e.transform.y, alpha);
        cmd.w = e.rect.w;
        cmd.h = e.rect.h;
        cmd.r = e.rect.r;
        cmd.g = e.rect.g;
        cmd.b = e.rect.b;
        cmd.a = e.rect.a;
        cmds.submit(cmd);

        // barra de vida dos inimigos
        if (e.kind == EntityKind::Enemy && e.health.max > 0 && e.health.current < e.health.max)
        {
            float frac = (float)e.health.current / (float)e.health.max;
            cmds.rect(e.renderLayer + 1, cmd.x, cmd.y - 6.0f, e.rect.w, 3, 60, 0, 0, 255);
            cmds.rect(e.renderLayer + 1, cmd.x, cmd.y - 6.0f, (int)(e.rect.w * frac), 3, 220, 40, 40, 255);
        }
    }
}
