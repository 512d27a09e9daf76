#pragma once
#include <array>
#include <memory>
#include <string>
#include <unordered_map>
#include "../Game/Era.h"

class Texture;
class Font;
class SDLRenderer;
class AssetManifest;

class AssetManager
{
public:
    explicit AssetManager(SDLRenderer &renderer);
    ~AssetManager();

    bool loadManifest(const std::string &path);
    bool manifestLoaded() const { return manifestLoaded_; }

    std::shared_ptr<Texture> loadTextureById(const std::string &id);
    std::shared_ptr<Texture> loadTexture(const std::string &path);

    std::shared_ptr<Font> loadFontById(const std::string &id);
    std::shared_ptr<Font> loadFont(const std::string &path, int ptSize);

    // Fundos opcionais "bg_<era>"; ausentes ficam nulos (o jogo pinta a cor da era)
    std::array<std::shared_ptr<Texture>, kEraCount> loadEraBackgrounds();

    void clear();

private:
    SDLRenderer &renderer_;

    std::unique_ptr<AssetManifest> manifest_;
    bool manifestLoaded_ = false;

    std::unordered_map<std::string, std::weak_ptr<Texture>> textures_;
    std::unordered_map<std::string, std::shared_ptr<Texture>> texturesById_;

    // chave = "path|size"
    std::unordered_map<std::string, std::weak_ptr<Font>> fonts_;
    std::unordered_map<std::string, std::shared_ptr<Font>> fontsById_;
};
