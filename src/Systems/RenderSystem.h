#pragma once

class Scene;
class CommandBuffer;

class RenderSystem
{
public:
    // alpha: fracao de interpolacao entre o passo anterior e o atual
    void render(const Scene &scene, CommandBuffer &cmds, float alpha) const;
};
