#pragma once
#include <string>
#include "RenderCommand.h"
#include "../Engine/Camera2D.h"

class Texture;
class CommandBuffer;

// Superficie de desenho opaca. O jogo so escreve; le apenas o tamanho.
class Renderer
{
public:
    virtual ~Renderer() = default;

    virtual void beginFrame() = 0;
    virtual void endFrame() = 0;

    virtual void drawRect(float x, float y, int w, int h,
                          unsigned char r, unsigned char g, unsigned char b, unsigned char a,
                          bool screenSpace, bool outline) = 0;

    virtual void drawTexture(const Texture &tex, float x, float y, int w, int h, bool screenSpace) = 0;

    // texto UTF-8
    virtual void drawText(FontStyle font, const std::string &text,
                          float x, float y, bool centered,
                          unsigned char r, unsigned char g, unsigned char b, unsigned char a) = 0;

    virtual void setCamera(const Camera2D &cam, int screenW, int screenH) = 0;
    virtual void submit(const CommandBuffer &cmds) = 0;

    virtual void outputSize(int &w, int &h) const = 0;
};
