#pragma once
#include <string>
#include <utility>
#include <SDL.h>

// Dona da SDL_Texture. Tem que morrer antes do SDL_Renderer que a criou.
class Texture
{
public:
    Texture(SDL_Texture *native, int width, int height, std::string path)
        : native_(native), width_(width), height_(height), path_(std::move(path)) {}

    ~Texture()
    {
        if (native_)
            SDL_DestroyTexture(native_);
    }

    Texture(const Texture &) = delete;
    Texture &operator=(const Texture &) = delete;

    SDL_Texture *native() const { return native_; }
    int width() const { return width_; }
    int height() const { return height_; }
    const std::string &path() const { return path_; }

private:
    SDL_Texture *native_ = nullptr;
    int width_ = 0;
    int height_ = 0;
    std::string path_;
};
