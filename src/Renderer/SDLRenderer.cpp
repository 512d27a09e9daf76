#include "SDLRenderer.h"
#include "../Assets/Texture.h"
#include <SDL.h>
#include "../Assets/Font.h"
#include "CommandBuffer.h"
#include <SDL_ttf.h>
#include <cstdio>

SDLRenderer::SDLRenderer(SDL_Renderer *sdlRenderer) : r_(sdlRenderer)
{
    // overlays e fades usam alpha
    SDL_SetRenderDrawBlendMode(r_, SDL_BLENDMODE_BLEND);
}

SDLRenderer::~SDLRenderer()
{
    for (auto &kv : textCache_)
    {
        if (kv.second.tex)
            SDL_DestroyTexture(kv.second.tex);
    }
    textCache_.clear();
}

void SDLRenderer::beginFrame()
{
    SDL_SetRenderDrawColor(r_, 15, 15, 15, 255);
    SDL_RenderClear(r_);
}

void SDLRenderer::endFrame()
{
    SDL_RenderPresent(r_);
}

void SDLRenderer::drawRect(float x, float y, int w, int h,
                           unsigned char r, unsigned char g, unsigned char b, unsigned char a,
                           bool screenSpace, bool outline)
{
    SDL_Rect rect;
    if (screenSpace)
    {
        rect.x = (int)x;
        rect.y = (int)y;
        rect.w = w;
        rect.h = h;
    }
    else
    {
        rect.x = (int)worldToScreenX(x);
        rect.y = (int)worldToScreenY(y);
        rect.w = (int)(w * cam_.zoom);
        rect.h = (int)(h * cam_.zoom);
    }

    SDL_SetRenderDrawColor(r_, r, g, b, a);
    if (outline)
        SDL_RenderDrawRect(r_, &rect);
    else
        SDL_RenderFillRect(r_, &rect);
}

void SDLRenderer::drawTexture(const Texture &tex, float x, float y, int w, int h, bool screenSpace)
{
    if (!tex.native())
        return;

    SDL_SetTextureBlendMode(tex.native(), SDL_BLENDMODE_BLEND);

    if (w <= 0)
        w = tex.width_;
    if (h <= 0)
        h = tex.height_;

    SDL_Rect dst;
    if (screenSpace)
    {
        dst.x = (int)x;
        dst.y = (int)y;
        dst.w = w;
        dst.h = h;
    }
    else
    {
        dst.x = (int)worldToScreenX(x);
        dst.y = (int)worldToScreenY(y);
        dst.w = (int)(w * cam_.zoom);
        dst.h = (int)(h * cam_.zoom);
    }

    if (SDL_RenderCopy(r_, tex.native(), nullptr, &dst) != 0)
        std::printf("SDL_RenderCopy failed: %s\n", SDL_GetError());
}

void SDLRenderer::drawText(FontStyle style, const std::string &text,
                           float x, float y, bool centered,
                           unsigned char r, unsigned char g, unsigned char b, unsigned char a)
{
    const Font *font = fonts_[static_cast<int>(style)].get();
    if (!font || !font->native())
        return;
    if (text.empty())
        return;

    TextKey key;
    key.font = font;
    key.r = r;
    key.g = g;
    key.b = b;
    key.a = a;
    key.text = text;

    auto it = textCache_.find(key);
    if (it == textCache_.end())
    {
        SDL_Color color{r, g, b, a};
        SDL_Surface *surf = TTF_RenderUTF8_Blended(font->native(), text.c_str(), color);
        if (!surf)
        {
            std::printf("TTF_RenderUTF8_Blended failed: %s\n", TTF_GetError());
            return;
        }

        SDL_Texture *tex = SDL_CreateTextureFromSurface(r_, surf);
        if (!tex)
        {
            std::printf("SDL_CreateTextureFromSurface(text) failed: %s\n", SDL_GetError());
            SDL_FreeSurface(surf);
            return;
        }

        SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
        // o blended ignora o alpha da cor; aplicado na textura
        SDL_SetTextureAlphaMod(tex, a);

        TextCacheEntry entry;
        entry.tex = tex;
        entry.w = surf->w;
        entry.h = surf->h;
        entry.lastUsed = ++textCacheCounter_;
        SDL_FreeSurface(surf);

        textCache_.insert({key, entry});
        trimTextCache();
        it = textCache_.find(key);
        if (it == textCache_.end())
            return;
    }
    else
    {
        it->second.lastUsed = ++textCacheCounter_;
    }

    SDL_Rect dst;
    dst.w = it->second.w;
    dst.h = it->second.h;
    dst.x = centered ? (int)(x - dst.w * 0.5f) : (int)x;
    dst.y = centered ? (int)(y - dst.h * 0.5f) : (int)y;

    int rc = SDL_RenderCopy(r_, it->second.tex, nullptr, &dst);
    if (rc != 0)
    {
        std::printf("SDL_RenderCopy(text) failed: %s\n", SDL_GetError());
    }
}

void SDLRenderer::setCamera(const Camera2D &cam, int screenW, int screenH)
{
    cam_ = cam;
    screenW_ = screenW;
    screenH_ = screenH;
}

void SDLRenderer::submit(const CommandBuffer &cmds)
{
    // ja ordenado por layer no finalize()
    for (const auto &c : cmds.commands())
    {
        switch (c.type)
        {
        case RenderCommandType::Rect:
            drawRect(c.x, c.y, c.w, c.h, c.r, c.g, c.b, c.a, c.screenSpace, c.outline);
            break;
        case RenderCommandType::Texture:
            if (c.texture)
                drawTexture(*c.texture, c.x, c.y, c.w, c.h, c.screenSpace);
            break;
        case RenderCommandType::Text:
            drawText(c.font, c.text, c.x, c.y, c.centered, c.r, c.g, c.b, c.a);
            break;
        }
    }
}

void SDLRenderer::outputSize(int &w, int &h) const
{
    if (SDL_GetRendererOutputSize(r_, &w, &h) != 0)
    {
        w = screenW_;
        h = screenH_;
    }
}

void SDLRenderer::setFont(FontStyle style, std::shared_ptr<Font> font)
{
    auto &slot = fonts_[static_cast<int>(style)];
    if (slot)
        invalidateTextCache(slot.get());
    slot = std::move(font);
}

void SDLRenderer::invalidateTextCache(const Font *font)
{
    if (!font)
        return;

    for (auto it = textCache_.begin(); it != textCache_.end();)
    {
        if (it->first.font == font)
        {
            if (it->second.tex)
                SDL_DestroyTexture(it->second.tex);
            it = textCache_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

float SDLRenderer::worldToScreenX(float worldX) const
{
    // camera centrada: (world - camCenter) * zoom + halfScreen
    return (worldX - cam_.x) * cam_.zoom + (screenW_ * 0.5f);
}

float SDLRenderer::worldToScreenY(float worldY) const
{
    return (worldY - cam_.y) * cam_.zoom + (screenH_ * 0.5f);
}

std::size_t SDLRenderer::TextKeyHash::operator()(const TextKey &k) const
{
    std::size_t h = std::hash<const Font *>{}(k.font);
    h ^= std::hash<std::string>{}(k.text) + 0x9e3779b9 + (h << 6) + (h >> 2);
    std::size_t color = (std::size_t)k.r | ((std::size_t)k.g << 8) | ((std::size_t)k.b << 16) | ((std::size_t)k.a << 24);
    h ^= color + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

bool SDLRenderer::TextKeyEq::operator()(const TextKey &a, const TextKey &b) const
{
    return a.font == b.font && a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a && a.text == b.text;
}

void SDLRenderer::trimTextCache()
{
    while (textCache_.size() > textCacheLimit_)
    {
        auto lru = textCache_.end();
        for (auto it = textCache_.begin(); it != textCache_.end(); ++it)
        {
            if (lru == textCache_.end() || it->second.lastUsed < lru->second.lastUsed)
                lru = it;
        }
        if (lru == textCache_.end())
            break;
        if (lru->second.tex)
            SDL_DestroyTexture(lru->second.tex);
        textCache_.erase(lru);
    }
}
