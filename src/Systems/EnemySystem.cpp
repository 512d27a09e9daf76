#include "EnemySystem.h"
#include "ProjectileSystem.h"
#include "../World/Scene.h"
#include <algorithm>
#include <array>
#include <cmath>

static void CountDown(float &timerMs, float dtMs)
{
    if (timerMs > 0.0f)
        timerMs = std::max(0.0f, timerMs - dtMs);
}

static void Fire(Entity &enemy, const EnemyContext &ctx)
{
    if (!ctx.projectiles)
        return;

    ProjectileSpawn spawn;
    spawn.x = enemy.centerX();
    spawn.y = enemy.centerY();
    spawn.targetX = ctx.playerX;
    spawn.targetY = ctx.playerY;
    spawn.era = enemy.era;
    spawn.hostile = true;
    ctx.projectiles->queue(spawn);
}

// Prehistoric: anda devagar, investe quando o player chega perto, depois descansa
static void UpdateCharger(Entity &enemy, const EnemyContext &ctx, float dtMs)
{
    const EraTuning &t = GetEraTuning(enemy.era);
    EnemyState &st = enemy.enemy;
    RigidBody2D &rb = enemy.rigidbody;

    if (st.restTimerMs > 0.0f)
    {
        CountDown(st.restTimerMs, dtMs);
        rb.vx = 0.0f;
        rb.vy = 0.0f;
        return;
    }

    float dx = ctx.playerX - enemy.centerX();
    float dy = ctx.playerY - enemy.centerY();
    float dist = std::sqrt(dx * dx + dy * dy);

    if (st.charging)
    {
        CountDown(st.chargeTimerMs, dtMs);
        if (st.chargeTimerMs <= 0.0f)
        {
            st.charging = false;
            st.restTimerMs = t.chargeRestMs;
            rb.vx = 0.0f;
            rb.vy = 0.0f;
            return;
        }
    }
    else if (dist < t.chargeRadius)
    {
        st.charging = true;
        st.chargeTimerMs = t.chargeDurationMs;
    }

    float speed = st.charging ? t.enemyChargeSpeed : t.enemySpeed;
    if (dist > 0.0f)
    {
        rb.vx = (dx / dist) * speed;
        rb.vy = (dy / dist) * speed;
    }
}

// Medieval: mantem distancia e atira flechas
static void UpdateArcher(Entity &enemy, const EnemyContext &ctx, float dtMs)
{
    const EraTuning &t = GetEraTuning(enemy.era);
    EnemyState &st = enemy.enemy;
    RigidBody2D &rb = enemy.rigidbody;

    CountDown(st.attackCooldownMs, dtMs);

    float dx = ctx.playerX - enemy.centerX();
    float dy = ctx.playerY - enemy.centerY();
    float dist = std::sqrt(dx * dx + dy * dy);
    if (dist <= 0.0f)
    {
        rb.vx = 0.0f;
        rb.vy = 0.0f;
        return;
    }

    if (dist < t.attackRange * 0.5f)
    {
        rb.vx = -(dx / dist) * t.enemySpeed;
        rb.vy = -(dy / dist) * t.enemySpeed;
    }
    else if (dist > t.attackRange)
    {
        rb.vx = (dx / dist) * t.enemySpeed;
        rb.vy = (dy / dist) * t.enemySpeed;
    }
    else
    {
        rb.vx = 0.0f;
        rb.vy = 0.0f;
        if (st.attackCooldownMs <= 0.0f)
        {
            Fire(enemy, ctx);
            st.attackCooldownMs = t.attackCooldownMs;
        }
    }
}

// Futuristic: teleporta para longe quando o player encosta, atira energy bolts
static void UpdateTeleporter(Entity &enemy, const EnemyContext &ctx, float dtMs)
{
    const EraTuning &t = GetEraTuning(enemy.era);
    EnemyState &st = enemy.enemy;
    RigidBody2D &rb = enemy.rigidbody;

    CountDown(st.teleportCooldownMs, dtMs);
    CountDown(st.attackCooldownMs, dtMs);

    float dx = ctx.playerX - enemy.centerX();
    float dy = ctx.playerY - enemy.centerY();
    float dist = std::sqrt(dx * dx + dy * dy);

    if (dist < t.teleportRadius && st.teleportCooldownMs <= 0.0f)
    {
        float angle = std::atan2(enemy.centerY() - ctx.playerY, enemy.centerX() - ctx.playerX);
        float cx = ctx.playerX + std::cos(angle) * t.teleportDistance;
        float cy = ctx.playerY + std::sin(angle) * t.teleportDistance;

        float x = cx - enemy.collider.w * 0.5f;
        float y = cy - enemy.collider.h * 0.5f;
        if (ctx.worldW > 0.0f)
            x = std::clamp(x, 0.0f, ctx.worldW - enemy.collider.w);
        if (ctx.worldH > 0.0f)
            y = std::clamp(y, 0.0f, ctx.worldH - enemy.collider.h);

        enemy.transform.x = x;
        enemy.transform.y = y;
        enemy.transform.prevX = x; // sem rastro na interpolacao
        enemy.transform.prevY = y;
        rb.vx = 0.0f;
        rb.vy = 0.0f;
        st.teleportCooldownMs = t.teleportCooldownMs;
        return;
    }

    if (dist > 0.0f)
    {
        rb.vx = (dx / dist) * t.enemySpeed;
        rb.vy = (dy / dist) * t.enemySpeed;
    }

    if (dist < t.attackRange && st.attackCooldownMs <= 0.0f)
    {
        Fire(enemy, ctx);
        st.attackCooldownMs = t.attackCooldownMs;
    }
}

EnemyBehavior EnemySystem::behaviorFor(Era era)
{
    static const std::array<EnemyBehavior, kEraCount> behaviors = {
        UpdateCharger,   // Prehistoric
        UpdateArcher,    // Medieval
        UpdateTeleporter // Futuristic
    };
    return behaviors[EraIndex(era)];
}

void EnemySystem::update(Scene &scene, float dtMs, const EnemyContext &ctx)
{
    for (auto &e : scene.entities())
    {
        if (e.kind != EntityKind::Enemy || e.pendingDestroy)
            continue;
        behaviorFor(e.era)(e, ctx, dtMs);
    }
}
