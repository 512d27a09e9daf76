#pragma once
#include "../Game/Era.h"

class Scene;
class ProjectileSystem;
struct Entity;

struct EnemyContext
{
    float playerX = 0.0f; // centro do player
    float playerY = 0.0f;
    float worldW = 0.0f;
    float worldH = 0.0f;
    ProjectileSystem *projectiles = nullptr;
};

using EnemyBehavior = void (*)(Entity &enemy, const EnemyContext &ctx, float dtMs);

class EnemySystem
{
public:
    // Define velocidades (o PhysicsSystem integra) e enfileira disparos
    void update(Scene &scene, float dtMs, const EnemyContext &ctx);

    static EnemyBehavior behaviorFor(Era era);
};
