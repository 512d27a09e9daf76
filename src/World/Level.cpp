#include "Level.h"
#include <cmath>
#include <utility>

Level::Level(LevelDef def) : def_(std::move(def))
{
    restart();
}

Entity &CreateWall(Scene &scene, const WallDef &wall)
{
    auto &e = scene.createEntity(EntityKind::Wall);
    e.transform.x = wall.x;
    e.transform.y = wall.y;
    e.transform.prevX = wall.x;
    e.transform.prevY = wall.y;
    e.rect.w = wall.w;
    e.rect.h = wall.h;
    e.rect.r = 100;
    e.rect.g = 100;
    e.rect.b = 100;
    e.rect.enabled = true;
    e.collider.enabled = true;
    e.collider.w = (float)wall.w;
    e.collider.h = (float)wall.h;
    e.rigidbody.enabled = true;
    e.rigidbody.isKinematic = true;
    e.renderLayer = 1;
    return e;
}

static void CreateEnemy(Scene &scene, const EnemyDef &def)
{
    const EraTuning &tuning = GetEraTuning(def.era);

    auto &e = scene.createEntity(EntityKind::Enemy);
    e.era = def.era;
    e.transform.x = def.x;
    e.transform.y = def.y;
    e.transform.prevX = def.x;
    e.transform.prevY = def.y;
    e.rect.w = 32;
    e.rect.h = 32;
    e.rect.r = tuning.color.r;
    e.rect.g = tuning.color.g;
    e.rect.b = tuning.color.b;
    e.collider.enabled = true;
    e.collider.w = 32.0f;
    e.collider.h = 32.0f;
    e.rigidbody.enabled = true;
    e.rigidbody.useGravity = false;
    e.health.current = tuning.enemyHealth;
    e.health.max = tuning.enemyHealth;
    e.renderLayer = 2;
}

void Level::populate(Scene &scene) const
{
    scene.bounds().w = def_.width;
    scene.bounds().h = def_.height;

    for (const auto &wall : def_.walls)
        CreateWall(scene, wall);
    for (const auto &enemy : def_.enemies)
        CreateEnemy(scene, enemy);
}

void Level::restart()
{
    checkpointIndex_ = -1;
    enemiesDefeated_ = 0;
    messageTimerMs_ = def_.message.empty() ? 0.0f : kMessageDurationMs;
}

void Level::update(float dtMs)
{
    if (messageTimerMs_ > 0.0f)
    {
        messageTimerMs_ -= dtMs;
        if (messageTimerMs_ < 0.0f)
            messageTimerMs_ = 0.0f;
    }
}

LevelPoint Level::spawnPosition() const
{
    if (checkpointIndex_ >= 0 && checkpointIndex_ < (int)def_.checkpoints.size())
        return def_.checkpoints[checkpointIndex_];
    return def_.start;
}

bool Level::tryReachCheckpoint(float px, float py)
{
    int next = checkpointIndex_ + 1;
    if (next >= (int)def_.checkpoints.size())
        return false;

    const LevelPoint &cp = def_.checkpoints[next];
    float dx = px - cp.x;
    float dy = py - cp.y;
    if (std::sqrt(dx * dx + dy * dy) > kCheckpointRadius)
        return false;

    checkpointIndex_ = next;
    return true;
}

void Level::restoreProgress(int checkpointIndex, int enemiesDefeated)
{
    if (checkpointIndex >= (int)def_.checkpoints.size())
        checkpointIndex = (int)def_.checkpoints.size() - 1;
    checkpointIndex_ = checkpointIndex < -1 ? -1 : checkpointIndex;
    enemiesDefeated_ = enemiesDefeated < 0 ? 0 : enemiesDefeated;
}

bool Level::isCompleted(float playerX) const
{
    bool anyRequirement = false;

    if (def_.exitX > 0.0f)
    {
        anyRequirement = true;
        if (playerX < def_.exitX)
            return false;
    }
    if (def_.requiredEnemiesDefeated > 0)
    {
        anyRequirement = true;
        if (enemiesDefeated_ < def_.requiredEnemiesDefeated)
            return false;
    }
    if (def_.requireAllCheckpoints && !def_.checkpoints.empty())
    {
        anyRequirement = true;
        if (checkpointsReached() < (int)def_.checkpoints.size())
            return false;
    }

    return anyRequirement;
}

const std::string *Level::activeMessage() const
{
    if (messageTimerMs_ <= 0.0f || def_.message.empty())
        return nullptr;
    return &def_.message;
}

static void AddFloor(LevelDef &def)
{
    def.walls.push_back({0.0f, 680.0f, 1280, 40});
    def.walls.push_back({0.0f, 0.0f, 20, 720});
    def.walls.push_back({1260.0f, 0.0f, 20, 720});
}

std::vector<LevelDef> BuildLevelCatalog()
{
    std::vector<LevelDef> levels;

    {
        LevelDef def;
        def.name = "Movement";
        def.message = "Use A and D to move, SPACE to jump";
        AddFloor(def);
        def.walls.push_back({400.0f, 550.0f, 100, 20});
        def.walls.push_back({600.0f, 450.0f, 100, 20});
        def.exitX = 1180.0f;
        levels.push_back(std::move(def));
    }
    {
        LevelDef def;
        def.name = "Time Manipulation";
        def.message = "Press SHIFT to slow down time";
        AddFloor(def);
        def.walls.push_back({200.0f, 500.0f, 100, 20});
        def.walls.push_back({900.0f, 500.0f, 100, 20});
        def.enemies.push_back({Era::Medieval, 600.0f, 630.0f});
        def.exitX = 1180.0f;
        levels.push_back(std::move(def));
    }
    {
        LevelDef def;
        def.name = "Era Switching";
        def.message = "Press Q for the next era, Z for the previous one";
        AddFloor(def);
        def.walls.push_back({100.0f, 500.0f, 300, 20});
        def.walls.push_back({500.0f, 500.0f, 300, 20});
        def.walls.push_back({900.0f, 500.0f, 300, 20});
        def.enemies.push_back({Era::Prehistoric, 250.0f, 450.0f});
        def.enemies.push_back({Era::Medieval, 650.0f, 450.0f});
        def.enemies.push_back({Era::Futuristic, 1050.0f, 450.0f});
        def.exitX = 1180.0f;
        levels.push_back(std::move(def));
    }
    {
        LevelDef def;
        def.name = "Powers";
        def.message = "Press E to use your era power, F to attack";
        AddFloor(def);
        def.walls.push_back({100.0f, 400.0f, 200, 20});
        def.walls.push_back({500.0f, 400.0f, 200, 20});
        def.walls.push_back({900.0f, 400.0f, 200, 20});
        def.enemies.push_back({Era::Prehistoric, 200.0f, 350.0f});
        def.enemies.push_back({Era::Medieval, 600.0f, 350.0f});
        def.enemies.push_back({Era::Futuristic, 1000.0f, 350.0f});
        def.checkpoints = {{100.0f, 600.0f}, {500.0f, 600.0f}, {900.0f, 600.0f}};
        def.exitX = 1180.0f;
        levels.push_back(std::move(def));
    }
    {
        LevelDef def;
        def.name = "Demo";
        def.message = "Welcome to the Chronosta Demo Level!";
        AddFloor(def);
        def.walls.push_back({300.0f, 500.0f, 200, 20});
        def.walls.push_back({600.0f, 400.0f, 200, 20});
        def.walls.push_back({900.0f, 300.0f, 200, 20});
        def.enemies.push_back({Era::Prehistoric, 400.0f, 450.0f});
        def.enemies.push_back({Era::Medieval, 700.0f, 350.0f});
        def.enemies.push_back({Era::Futuristic, 1000.0f, 250.0f});
        def.checkpoints = {{100.0f, 600.0f}, {500.0f, 450.0f}, {900.0f, 250.0f}};
        def.requiredEnemiesDefeated = 3;
        def.requireAllCheckpoints = true;
        levels.push_back(std::move(def));
    }

    return levels;
}
