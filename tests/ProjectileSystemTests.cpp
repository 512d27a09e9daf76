#include <gtest/gtest.h>

#include "Systems/ProjectileSystem.h"
#include "World/Level.h"
#include "World/Scene.h"

namespace {

constexpr float kStepMs = 1000.0f / 60.0f;

int MakeTarget(Scene &scene, EntityKind kind, float x, float y, int health) {
    Entity &e = scene.createEntity(kind);
    e.transform.x = x;
    e.transform.y = y;
    e.collider.enabled = true;
    e.collider.w = 32.0f;
    e.collider.h = 32.0f;
    e.health.current = health;
    e.health.max = health;
    return e.id;
}

ProjectileSpawn Shot(float x, float y, float tx, float ty, Era era, bool hostile) {
    ProjectileSpawn s;
    s.x = x;
    s.y = y;
    s.targetX = tx;
    s.targetY = ty;
    s.era = era;
    s.hostile = hostile;
    return s;
}

TEST(ProjectileSystemTests, DamageScalesWithEraMultiplier) {
    ProjectileSystem projectiles;
    EXPECT_EQ(projectiles.damageFor(Era::Prehistoric), 22);
    EXPECT_EQ(projectiles.damageFor(Era::Medieval), 15);
    EXPECT_EQ(projectiles.damageFor(Era::Futuristic), 12);
}

TEST(ProjectileSystemTests, SpawnsAreQueuedUntilRequested) {
    Scene scene;
    ProjectileSystem projectiles;
    projectiles.queue(Shot(0, 0, 10, 0, Era::Medieval, true));
    projectiles.queue(Shot(0, 0, 0, 10, Era::Medieval, true));
    EXPECT_EQ(scene.count(EntityKind::Projectile), 0);

    EXPECT_EQ(projectiles.spawnQueued(scene), 2);
    EXPECT_EQ(projectiles.queuedCount(), 0u);
    EXPECT_EQ(scene.count(EntityKind::Projectile), 2);

    const Entity &p = scene.entities().front();
    EXPECT_NEAR(p.rigidbody.vx, 600.0f, 1e-3f);
    EXPECT_NEAR(p.rigidbody.vy, 0.0f, 1e-3f);
    EXPECT_FALSE(p.rigidbody.enabled);
}

TEST(ProjectileSystemTests, HostileShotDamagesPlayer) {
    Scene scene;
    int player = MakeTarget(scene, EntityKind::Player, 100.0f, 0.0f, 100);
    ProjectileSystem projectiles;
    projectiles.queue(Shot(90.0f, 16.0f, 200.0f, 16.0f, Era::Medieval, true));
    projectiles.spawnQueued(scene);

    ProjectileReport report = projectiles.update(scene, kStepMs, player);
    EXPECT_EQ(report.damageToPlayer, 15);
    EXPECT_EQ(scene.flushDestroyed(), 1);
}

TEST(ProjectileSystemTests, FriendlyShotKillsEnemyAndCountsIt) {
    Scene scene;
    int enemy = MakeTarget(scene, EntityKind::Enemy, 100.0f, 0.0f, 20);
    ProjectileSystem projectiles;
    projectiles.queue(Shot(90.0f, 16.0f, 200.0f, 16.0f, Era::Prehistoric, false));
    projectiles.queue(Shot(90.0f, 16.0f, 200.0f, 16.0f, Era::Prehistoric, false));
    projectiles.spawnQueued(scene);

    ProjectileReport report = projectiles.update(scene, kStepMs, 0);
    EXPECT_EQ(report.enemiesDefeated, 1);
    EXPECT_EQ(report.damageToPlayer, 0);
    EXPECT_TRUE(scene.findEntity(enemy)->pendingDestroy);

    // o segundo tiro nao acerta um inimigo ja destruido
    EXPECT_EQ(scene.flushDestroyed(), 2);
    EXPECT_EQ(scene.count(EntityKind::Projectile), 1);
}

TEST(ProjectileSystemTests, FriendlyShotIgnoresPlayer) {
    Scene scene;
    int player = MakeTarget(scene, EntityKind::Player, 100.0f, 0.0f, 100);
    ProjectileSystem projectiles;
    projectiles.queue(Shot(90.0f, 16.0f, 200.0f, 16.0f, Era::Medieval, false));
    projectiles.spawnQueued(scene);

    ProjectileReport report = projectiles.update(scene, kStepMs, player);
    EXPECT_EQ(report.damageToPlayer, 0);
    EXPECT_EQ(scene.flushDestroyed(), 0);
}

TEST(ProjectileSystemTests, WallStopsProjectile) {
    Scene scene;
    CreateWall(scene, WallDef{100.0f, 0.0f, 20, 100});
    ProjectileSystem projectiles;
    projectiles.queue(Shot(95.0f, 50.0f, 200.0f, 50.0f, Era::Futuristic, true));
    projectiles.spawnQueued(scene);

    projectiles.update(scene, kStepMs, 0);
    EXPECT_EQ(scene.flushDestroyed(), 1);
    EXPECT_EQ(scene.count(EntityKind::Projectile), 0);
}

TEST(ProjectileSystemTests, ExpiresAfterLifetime) {
    Scene scene;
    ProjectileSettings settings;
    settings.lifetimeMs = 90.0f;
    ProjectileSystem projectiles(settings);
    projectiles.queue(Shot(0.0f, 0.0f, 0.0f, -10.0f, Era::Medieval, true));
    projectiles.spawnQueued(scene);

    for (int i = 0; i < 5; ++i)
        projectiles.update(scene, kStepMs, 0);
    EXPECT_EQ(scene.flushDestroyed(), 0);

    projectiles.update(scene, kStepMs, 0);
    EXPECT_EQ(scene.flushDestroyed(), 1);
}

} // namespace
