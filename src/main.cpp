#include "Engine/Engine.h"
#include "Game/GameConfig.h"
#include <cstdio>

int main(int argc, char *argv[])
{
    (void)argc;
    (void)argv;

    GameConfig config;
    if (!config.loadFromFile("config/game.cfg"))
        std::printf("main: running with built-in settings\n");
    config.sanitize();

    Engine engine(config);
    return engine.run();
}
