#include "Engine.h"
#include "../Assets/AssetManager.h"
#include "../Assets/Font.h"
#include "../Game/Game.h"
#include "../Persistence/SaveManager.h"
#include "../Renderer/SDLRenderer.h"

#include <SDL.h>
#include <cstdio>

static Key ToKey(SDL_Keycode k)
{
    switch (k)
    {
    case SDLK_a:
        return Key::A;
    case SDLK_c:
        return Key::C;
    case SDLK_d:
        return Key::D;
    case SDLK_w:
        return Key::W;
    case SDLK_s:
        return Key::S;
    case SDLK_q:
        return Key::Q;
    case SDLK_e:
        return Key::E;
    case SDLK_z:
        return Key::Z;
    case SDLK_f:
        return Key::F;
    case SDLK_SPACE:
        return Key::Space;
    case SDLK_RETURN:
        return Key::Return;
    case SDLK_LSHIFT:
        return Key::LShift;
    case SDLK_TAB:
        return Key::Tab;

    case SDLK_LEFT:
        return Key::Left;
    case SDLK_RIGHT:
        return Key::Right;
    case SDLK_UP:
        return Key::Up;
    case SDLK_DOWN:
        return Key::Down;

    case SDLK_ESCAPE:
        return Key::Escape;
    case SDLK_F5:
        return Key::F5;
    case SDLK_F9:
        return Key::F9;
    default:
        return Key::Unknown;
    }
}

Engine::Engine(const GameConfig &config) : config_(config) {}

Engine::~Engine()
{
    shutdown();
}

int Engine::run()
{
    if (!init())
        return 1;

    running_ = true;
    std::vector<InputEvent> events;

    const std::uint64_t targetFrameMs = config_.targetFps > 0 ? (std::uint64_t)(1000 / config_.targetFps) : 0;
    std::uint64_t lastTicks = clock_.nowMs();

    while (running_)
    {
        std::uint64_t frameStart = clock_.nowMs();
        double frameMs = (double)(frameStart - lastTicks);
        lastTicks = frameStart;

        events.clear();
        pollEvents(events);

        game_->frame(events, input_, frameMs);
        if (game_->quitRequested())
            running_ = false;

        render();

        const FixedStepScheduler &sched = game_->scheduler();
        if (sched.frameCount() % 120 == 0)
        {
            const auto &s = commandBuffer_.stats();
            std::printf("[FrameStats] fps=%.1f steps=%llu clamped=%.1fms cmds=%u rect=%u text=%u\n",
                        sched.fps(), (unsigned long long)sched.stepCount(), sched.clampedTotal(),
                        s.commandsSubmitted, s.rectDraws, s.textDraws);
        }

        // ritmo do frame
        std::uint64_t elapsed = clock_.nowMs() - frameStart;
        if (elapsed < targetFrameMs)
            SDL_Delay((Uint32)(targetFrameMs - elapsed));
    }

    game_->suspendSession();
    shutdown();
    return 0;
}

bool Engine::init()
{
    if (SDL_Init(SDL_INIT_VIDEO) != 0)
    {
        std::printf("SDL_Init error: %s\n", SDL_GetError());
        return false;
    }

    window_ = SDL_CreateWindow(
        config_.title.c_str(),
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        config_.windowWidth,
        config_.windowHeight,
        SDL_WINDOW_SHOWN);

    if (!window_)
    {
        std::printf("SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return false;
    }

    sdlRenderer_ = SDL_CreateRenderer(
        window_,
        -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);

    if (!sdlRenderer_)
    {
        std::printf("SDL_CreateRenderer error: %s\n", SDL_GetError());
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        SDL_Quit();
        return false;
    }

    renderer_ = std::make_unique<SDLRenderer>(sdlRenderer_);

    assets_ = std::make_unique<AssetManager>(*renderer_);
    if (assets_->loadManifest(config_.assetManifest))
    {
        renderer_->setFont(FontStyle::Body, assets_->loadFontById("ui_font"));
        renderer_->setFont(FontStyle::Title, assets_->loadFontById("title_font"));
    }

    saves_ = std::make_unique<SaveManager>(config_.saveDir);
    game_ = std::make_unique<Game>(config_, clock_, input_, saves_.get(), assets_->loadEraBackgrounds());

    return true;
}

void Engine::shutdown()
{
    game_.reset();
    saves_.reset();
    if (renderer_)
    {
        // fontes fecham antes do TTF_Quit no ~AssetManager
        renderer_->setFont(FontStyle::Body, nullptr);
        renderer_->setFont(FontStyle::Title, nullptr);
    }
    assets_.reset();
    renderer_.reset();

    if (sdlRenderer_)
    {
        SDL_DestroyRenderer(sdlRenderer_);
        sdlRenderer_ = nullptr;
    }
    if (window_)
    {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        SDL_Quit();
    }
}

void Engine::pollEvents(std::vector<InputEvent> &events)
{
    input_.beginFrame();

    SDL_Event e;
    while (SDL_PollEvent(&e))
    {
        if (e.type == SDL_QUIT)
        {
            InputEvent ev;
            ev.type = InputEventType::Quit;
            events.push_back(ev);
            continue;
        }

        if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_FOCUS_LOST)
        {
            // sem KeyUp depois de perder o foco
            input_.releaseAll();
            continue;
        }

        if (e.type == SDL_KEYDOWN || e.type == SDL_KEYUP)
        {
            Key key = ToKey(e.key.keysym.sym);
            if (key == Key::Unknown)
                continue;

            InputEvent ev;
            ev.type = (e.type == SDL_KEYDOWN) ? InputEventType::KeyDown : InputEventType::KeyUp;
            ev.key = key;
            ev.repeat = e.key.repeat != 0;
            input_.apply(ev);
            events.push_back(ev);
        }
    }
}

void Engine::render()
{
    renderer_->beginFrame();

    commandBuffer_.nextFrame(++frameIndex_);
    commandBuffer_.clear();

    DrawContext ctx{commandBuffer_};
    renderer_->outputSize(ctx.surfaceW, ctx.surfaceH);
    game_->draw(ctx);

    commandBuffer_.finalize();

    renderer_->setCamera(ctx.camera, ctx.surfaceW, ctx.surfaceH);
    renderer_->submit(commandBuffer_);
    renderer_->endFrame();
}
