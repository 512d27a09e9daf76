#pragma once
#include <memory>
#include <vector>

struct SDL_Window;
struct SDL_Renderer;

#include "../Game/GameConfig.h"
#include "../Input/Input.h"
#include "../Renderer/CommandBuffer.h"
#include "../Time/SDLClock.h"

class SDLRenderer;
class AssetManager;
class SaveManager;
class Game;

// Camada de plataforma: janela, eventos, ritmo de frames. O jogo em si fica em Game.
class Engine
{
public:
    explicit Engine(const GameConfig &config);
    ~Engine();

    int run();

private:
    bool init();
    void shutdown();
    void pollEvents(std::vector<InputEvent> &events);
    void render();

private:
    GameConfig config_;
    bool running_ = false;

    SDL_Window *window_ = nullptr;
    SDL_Renderer *sdlRenderer_ = nullptr;

    std::unique_ptr<SDLRenderer> renderer_;
    std::unique_ptr<AssetManager> assets_;
    std::unique_ptr<SaveManager> saves_;
    std::unique_ptr<Game> game_;

    SDLClock clock_;
    Input input_;
    CommandBuffer commandBuffer_;
    std::uint64_t frameIndex_ = 0;
};
