#include "AssetManager.h"
#include "AssetManifest.h"
#include "Texture.h"
#include "Font.h"
#include "../Renderer/SDLRenderer.h"

#include <SDL.h>
#include <SDL_image.h>
#include <SDL_ttf.h>
#include <cctype>
#include <cstdio>

static std::string FontKey(const std::string &path, int size)
{
    return path + "|" + std::to_string(size);
}

AssetManager::AssetManager(SDLRenderer &renderer) : renderer_(renderer)
{
    // SDL_image (PNG)
    int imgFlags = IMG_INIT_PNG;
    if ((IMG_Init(imgFlags) & imgFlags) != imgFlags)
    {
        std::printf("IMG_Init error: %s\n", IMG_GetError());
    }

    if (TTF_Init() != 0)
    {
        std::printf("TTF_Init error: %s\n", TTF_GetError());
    }
}

AssetManager::~AssetManager()
{
    clear();
    TTF_Quit();
    IMG_Quit();
}

bool AssetManager::loadManifest(const std::string &path)
{
    if (!manifest_)
        manifest_ = std::make_unique<AssetManifest>();

    manifestLoaded_ = manifest_->loadFromFile(path);
    return manifestLoaded_;
}

std::shared_ptr<Texture> AssetManager::loadTextureById(const std::string &id)
{
    auto it = texturesById_.find(id);
    if (it != texturesById_.end())
        return it->second;

    if (!manifest_)
    {
        std::printf("AssetManager: manifest not loaded (texture id '%s')\n", id.c_str());
        return nullptr;
    }

    const std::string *path = manifest_->texturePath(id);
    if (!path)
    {
        std::printf("AssetManager: texture id '%s' not found in manifest\n", id.c_str());
        return nullptr;
    }

    auto tex = loadTexture(*path);
    if (tex)
        texturesById_[id] = tex;
    return tex;
}

std::shared_ptr<Texture> AssetManager::loadTexture(const std::string &path)
{
    auto it = textures_.find(path);
    if (it != textures_.end())
    {
        if (auto existing = it->second.lock())
            return existing;
    }

    SDL_Surface *surf = IMG_Load(path.c_str());
    if (!surf)
    {
        std::printf("IMG_Load failed for '%s': %s\n", path.c_str(), IMG_GetError());
        return nullptr;
    }

    SDL_Texture *sdlTex = SDL_CreateTextureFromSurface(renderer_.native(), surf);
    if (!sdlTex)
    {
        std::printf("SDL_CreateTextureFromSurface failed: %s\n", SDL_GetError());
        SDL_FreeSurface(surf);
        return nullptr;
    }

    auto tex = std::make_shared<Texture>(sdlTex, surf->w, surf->h, path);
    SDL_FreeSurface(surf);

    textures_[path] = tex;
    return tex;
}

std::shared_ptr<Font> AssetManager::loadFontById(const std::string &id)
{
    auto it = fontsById_.find(id);
    if (it != fontsById_.end())
        return it->second;

    if (!manifest_)
    {
        std::printf("AssetManager: manifest not loaded (font id '%s')\n", id.c_str());
        return nullptr;
    }

    const FontDef *def = manifest_->fontDef(id);
    if (!def)
    {
        std::printf("AssetManager: font id '%s' not found in manifest\n", id.c_str());
        return nullptr;
    }

    auto font = loadFont(def->path, def->size);
    if (font)
        fontsById_[id] = font;
    return font;
}

std::shared_ptr<Font> AssetManager::loadFont(const std::string &path, int ptSize)
{
    const std::string key = FontKey(path, ptSize);

    auto it = fonts_.find(key);
    if (it != fonts_.end())
    {
        if (auto existing = it->second.lock())
            return existing;
    }

    TTF_Font *f = TTF_OpenFont(path.c_str(), ptSize);
    if (!f)
    {
        std::printf("TTF_OpenFont failed for '%s' size=%d: %s\n", path.c_str(), ptSize, TTF_GetError());
        return nullptr;
    }

    auto font = std::make_shared<Font>(f, ptSize, path);

    fonts_[key] = font;
    return font;
}

std::array<std::shared_ptr<Texture>, kEraCount> AssetManager::loadEraBackgrounds()
{
    std::array<std::shared_ptr<Texture>, kEraCount> out;
    if (!manifest_)
        return out;

    for (int i = 0; i < kEraCount; ++i)
    {
        std::string id = "bg_";
        for (const char *c = EraName(static_cast<Era>(i)); *c; ++c)
            id.push_back((char)std::tolower((unsigned char)*c));

        // fundo e opcional: sem entrada no manifest nao e erro
        if (manifest_->texturePath(id))
            out[i] = loadTextureById(id);
    }
    return out;
}

void AssetManager::clear()
{
    // Texture/Font se destroem sozinhos quando o ultimo dono soltar
    textures_.clear();
    texturesById_.clear();

    for (auto &kv : fonts_)
    {
        if (auto f = kv.second.lock())
            renderer_.invalidateTextCache(f.get());
    }
    fonts_.clear();
    fontsById_.clear();
}
