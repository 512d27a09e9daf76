#pragma once
#include <string>
#include "Era.h"

struct PlayerSnapshot
{
    float x = 0.0f;
    float y = 0.0f;
    int health = 100;
    float stamina = 100.0f;
    Era era = Era::Medieval;
};

struct WorldSnapshot
{
    int levelIndex = 0;
    int checkpointIndex = -1;
    int enemiesDefeated = 0;
};

// Estado exportado pelo modo Playing para o SaveManager
struct GameSnapshot
{
    PlayerSnapshot player;
    WorldSnapshot world;
    std::string timestamp; // ISO-8601, preenchido ao salvar
    std::string saveType;  // "manual", "checkpoint" ou "suspend"
};
