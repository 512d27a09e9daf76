#pragma once
#include <cstdint>
#include "../Game/Era.h"

enum class EntityKind : std::uint8_t
{
    Player,
    Wall,
    Enemy,
    Projectile
};

struct Transform
{
    float x = 0.0f; // canto superior esquerdo (px)
    float y = 0.0f;
    float prevX = 0.0f; // posicao no passo anterior (interpolacao)
    float prevY = 0.0f;
};

struct RectRender
{
    int w = 32;
    int h = 32;
    unsigned char r = 255, g = 255, b = 255, a = 255;
    bool enabled = true;
};

struct ColliderAABB
{
    float w = 32.0f;
    float h = 32.0f;
    float offsetX = 0.0f;
    float offsetY = 0.0f;
    bool isTrigger = false;
    bool enabled = false;
};

struct RigidBody2D
{
    float vx = 0.0f; // pixels/segundo
    float vy = 0.0f;
    bool isKinematic = false; // estatico: nao integra, so colide
    bool useGravity = false;
    bool grounded = false;
    bool enabled = false;
};

struct Health
{
    int current = 100;
    int max = 100;
};

struct EnemyState
{
    float attackCooldownMs = 0.0f;
    float chargeTimerMs = 0.0f;
    float restTimerMs = 0.0f;
    float teleportCooldownMs = 0.0f;
    bool charging = false;
};

struct ProjectileState
{
    float aliveMs = 0.0f;
    float lifetimeMs = 5000.0f;
    int damage = 0;
    bool hostile = false; // true: atinge o player; false: atinge inimigos
};

// Registro unico para todos os tipos; comportamento escolhido por era via tabela.
struct Entity
{
    int id = 0;
    EntityKind kind = EntityKind::Wall;
    Era era = Era::Medieval;
    bool pendingDestroy = false;

    int renderLayer = 0;

    Transform transform;
    RectRender rect;
    ColliderAABB collider;
    RigidBody2D rigidbody;
    Health health;

    EnemyState enemy;
    ProjectileState projectile;

    float centerX() const { return transform.x + collider.offsetX + collider.w * 0.5f; }
    float centerY() const { return transform.y + collider.offsetY + collider.h * 0.5f; }
};
