#pragma once
#include <cstdint>
#include <string>

class Texture;

enum class RenderCommandType : std::uint8_t
{
    Rect,
    Texture,
    Text
};

enum class FontStyle : std::uint8_t
{
    Body,
    Title
};

struct RenderCommand
{
    RenderCommandType type = RenderCommandType::Rect;

    int layer = 0; // ordenação

    // comum
    float x = 0, y = 0;
    bool screenSpace = false; // ignora a camera (HUD, overlays)

    // rect / destino da textura
    int w = 0, h = 0;
    std::uint8_t r = 255, g = 255, b = 255, a = 255;
    bool outline = false;

    // texture
    const Texture *texture = nullptr; // ponteiro não-dono (AssetManager mantém vivo)

    // text
    std::string text;
    FontStyle font = FontStyle::Body;
    bool centered = false; // x,y = centro do texto
};
