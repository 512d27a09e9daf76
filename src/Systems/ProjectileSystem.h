#pragma once
#include <vector>
#include "../Game/Era.h"

class Scene;

struct ProjectileSettings
{
    float speed = 600.0f; // px/s
    int baseDamage = 15;
    float lifetimeMs = 5000.0f;
};

struct ProjectileSpawn
{
    float x = 0.0f; // centro de origem
    float y = 0.0f;
    float targetX = 0.0f;
    float targetY = 0.0f;
    Era era = Era::Medieval;
    bool hostile = true;
};

struct ProjectileReport
{
    int damageToPlayer = 0;
    int enemiesDefeated = 0;
};

class ProjectileSystem
{
public:
    explicit ProjectileSystem(const ProjectileSettings &settings = ProjectileSettings{}) : settings_(settings) {}

    // Pedidos durante a iteracao; criados em spawnQueued() depois do passe
    void queue(const ProjectileSpawn &spawn);
    int spawnQueued(Scene &scene);
    std::size_t queuedCount() const { return queued_.size(); }

    ProjectileReport update(Scene &scene, float dtMs, int playerId);

    void reset() { queued_.clear(); }

    int damageFor(Era era) const;

private:
    ProjectileSettings settings_;
    std::vector<ProjectileSpawn> queued_;
};
