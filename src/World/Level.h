#pragma once
#include <string>
#include <vector>
#include "Scene.h"
#include "../Game/Era.h"

struct LevelPoint
{
    float x = 0.0f;
    float y = 0.0f;
};

struct WallDef
{
    float x = 0.0f;
    float y = 0.0f;
    int w = 0;
    int h = 0;
};

struct EnemyDef
{
    Era era = Era::Medieval;
    float x = 0.0f;
    float y = 0.0f;
};

struct LevelDef
{
    std::string name;
    std::string message; // mostrado por 5s ao entrar

    float width = 1280.0f;
    float height = 720.0f;

    LevelPoint start{100.0f, 600.0f};
    std::vector<WallDef> walls;
    std::vector<EnemyDef> enemies;
    std::vector<LevelPoint> checkpoints;

    // requisitos de conclusao (os que estiverem ativos precisam valer)
    float exitX = -1.0f;
    int requiredEnemiesDefeated = 0;
    bool requireAllCheckpoints = false;
};

// Tutoriais (movimento, tempo, eras, poderes) + demo, nessa ordem
std::vector<LevelDef> BuildLevelCatalog();

class Level
{
public:
    static constexpr float kCheckpointRadius = 48.0f;
    static constexpr float kMessageDurationMs = 5000.0f;

    explicit Level(LevelDef def);

    const LevelDef &def() const { return def_; }

    // Recria paredes e inimigos no scene (o player e responsabilidade do chamador)
    void populate(Scene &scene) const;

    void restart();
    void update(float dtMs);

    LevelPoint spawnPosition() const;

    // true se o proximo checkpoint foi alcancado agora
    bool tryReachCheckpoint(float px, float py);
    int checkpointIndex() const { return checkpointIndex_; }
    int checkpointsReached() const { return checkpointIndex_ + 1; }

    void addEnemiesDefeated(int n) { enemiesDefeated_ += n; }
    int enemiesDefeated() const { return enemiesDefeated_; }

    void restoreProgress(int checkpointIndex, int enemiesDefeated);

    bool isCompleted(float playerX) const;

    const std::string *activeMessage() const;

private:
    LevelDef def_;
    int checkpointIndex_ = -1;
    int enemiesDefeated_ = 0;
    float messageTimerMs_ = 0.0f;
};

Entity &CreateWall(Scene &scene, const WallDef &wall);
