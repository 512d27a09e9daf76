#pragma once
#include <string>
#include <utility>
#include <SDL_ttf.h>

// Fecha o TTF_Font no destrutor; precisa acontecer antes do TTF_Quit
class Font
{
public:
    Font(TTF_Font *native, int size, std::string path)
        : native_(native), size_(size), path_(std::move(path)) {}

    ~Font()
    {
        if (native_)
            TTF_CloseFont(native_);
    }

    Font(const Font &) = delete;
    Font &operator=(const Font &) = delete;

    TTF_Font *native() const { return native_; }
    int size() const { return size_; }
    const std::string &path() const { return path_; }

private:
    TTF_Font *native_ = nullptr;
    int size_ = 0;
    std::string path_;
};
