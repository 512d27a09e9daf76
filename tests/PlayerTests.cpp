#include <gtest/gtest.h>

#include "Game/Player.h"
#include "Systems/ProjectileSystem.h"
#include "World/Scene.h"

namespace {

constexpr float kStepMs = 1000.0f / 60.0f;

class PlayerTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        id = player.spawn(scene, 100.0f, 600.0f);
    }

    Entity &body() { return *player.entity(scene); }

    Scene scene;
    ProjectileSystem projectiles;
    Player player{PlayerSettings{}};
    int id = 0;
};

TEST_F(PlayerTests, SpawnCreatesPlayerEntity) {
    ASSERT_NE(player.entity(scene), nullptr);
    EXPECT_EQ(body().kind, EntityKind::Player);
    EXPECT_FLOAT_EQ(body().collider.w, 32.0f);
    EXPECT_FLOAT_EQ(body().collider.h, 64.0f);
    EXPECT_TRUE(body().rigidbody.useGravity);
    EXPECT_EQ(player.health(scene), 100);
    EXPECT_EQ(player.era(), Era::Medieval);
}

TEST_F(PlayerTests, MoveIntentSetsHorizontalVelocity) {
    player.setMoveIntent(-1.0f);
    player.preStep(scene, projectiles);
    EXPECT_FLOAT_EQ(body().rigidbody.vx, -300.0f);
    EXPECT_FLOAT_EQ(player.facing(), -1.0f);
}

TEST_F(PlayerTests, JumpsOnlyWhenGrounded) {
    player.requestJump();
    player.preStep(scene, projectiles);
    EXPECT_FLOAT_EQ(body().rigidbody.vy, 0.0f);

    body().rigidbody.grounded = true;
    player.requestJump();
    player.preStep(scene, projectiles);
    EXPECT_FLOAT_EQ(body().rigidbody.vy, -600.0f);
    EXPECT_FALSE(body().rigidbody.grounded);
}

TEST_F(PlayerTests, RequestsAreConsumedByOneStep) {
    body().rigidbody.grounded = true;
    player.requestJump();
    player.preStep(scene, projectiles);

    body().rigidbody.vy = 0.0f;
    body().rigidbody.grounded = true;
    player.preStep(scene, projectiles);
    EXPECT_FLOAT_EQ(body().rigidbody.vy, 0.0f);
}

TEST_F(PlayerTests, AttackQueuesFriendlyShotWithCooldown) {
    player.requestAttack();
    player.preStep(scene, projectiles);
    EXPECT_EQ(projectiles.queuedCount(), 1u);

    player.requestAttack();
    player.preStep(scene, projectiles);
    EXPECT_EQ(projectiles.queuedCount(), 1u);

    for (int i = 0; i < 19; ++i)
        player.postStep(scene, kStepMs);
    player.requestAttack();
    player.preStep(scene, projectiles);
    EXPECT_EQ(projectiles.queuedCount(), 2u);

    projectiles.spawnQueued(scene);
    for (const Entity &e : scene.entities())
    {
        if (e.kind == EntityKind::Projectile)
            EXPECT_FALSE(e.projectile.hostile);
    }
}

TEST_F(PlayerTests, DamageGrantsInvulnerability) {
    EXPECT_TRUE(player.takeDamage(scene, 30));
    EXPECT_EQ(player.health(scene), 70);
    EXPECT_TRUE(player.invulnerable());

    EXPECT_FALSE(player.takeDamage(scene, 30));
    EXPECT_EQ(player.health(scene), 70);

    for (int i = 0; i < 31; ++i)
        player.postStep(scene, kStepMs);
    EXPECT_FALSE(player.invulnerable());
    EXPECT_TRUE(player.takeDamage(scene, 80));
    EXPECT_EQ(player.health(scene), 0);
}

TEST_F(PlayerTests, ShieldBlocksDamageAndCostsStamina) {
    player.requestPower();
    player.preStep(scene, projectiles);

    EXPECT_TRUE(player.shieldActive());
    EXPECT_FLOAT_EQ(player.stamina(), 80.0f);
    EXPECT_FLOAT_EQ(player.powerCooldownMs(), 3000.0f);
    EXPECT_FALSE(player.takeDamage(scene, 50));
    EXPECT_EQ(player.health(scene), 100);

    // cooldown ativo: nada acontece
    player.requestPower();
    player.preStep(scene, projectiles);
    EXPECT_FLOAT_EQ(player.stamina(), 80.0f);
}

TEST_F(PlayerTests, StaminaRegeneratesUpToMax) {
    player.requestPower();
    player.preStep(scene, projectiles);
    ASSERT_FLOAT_EQ(player.stamina(), 80.0f);

    player.postStep(scene, 500.0f);
    EXPECT_NEAR(player.stamina(), 90.0f, 1e-3f);
    player.postStep(scene, 5000.0f);
    EXPECT_FLOAT_EQ(player.stamina(), 100.0f);
}

TEST_F(PlayerTests, PowerNeedsEnoughStamina) {
    PlayerSettings settings;
    settings.maxStamina = 10.0f;
    Player weak(settings);
    Scene other;
    weak.spawn(other, 0.0f, 0.0f);

    weak.requestPower();
    weak.preStep(other, projectiles);
    EXPECT_FALSE(weak.shieldActive());
    EXPECT_FLOAT_EQ(weak.stamina(), 10.0f);
}

TEST_F(PlayerTests, SwitchEraResetsPowerCooldown) {
    player.requestPower();
    player.preStep(scene, projectiles);
    ASSERT_GT(player.powerCooldownMs(), 0.0f);

    player.switchEra(scene, Era::Futuristic);
    EXPECT_EQ(player.era(), Era::Futuristic);
    EXPECT_EQ(body().era, Era::Futuristic);
    EXPECT_FLOAT_EQ(player.powerCooldownMs(), 0.0f);
}

TEST_F(PlayerTests, GroundSlamDamagesNearbyEnemiesOnLanding) {
    player.switchEra(scene, Era::Prehistoric);

    Entity &near = scene.createEntity(EntityKind::Enemy);
    near.transform.x = 150.0f;
    near.transform.y = 620.0f;
    near.collider.enabled = true;
    near.health.current = 30;
    int nearId = near.id;

    Entity &far = scene.createEntity(EntityKind::Enemy);
    far.transform.x = 900.0f;
    far.transform.y = 620.0f;
    far.collider.enabled = true;
    far.health.current = 30;
    int farId = far.id;

    body().rigidbody.grounded = true;
    player.requestPower();
    player.preStep(scene, projectiles);
    EXPECT_TRUE(player.slamPending());
    EXPECT_FLOAT_EQ(body().rigidbody.vy, -600.0f);

    PlayerStepReport airborne = player.postStep(scene, kStepMs);
    EXPECT_FALSE(airborne.landedSlam);

    body().rigidbody.grounded = true;
    PlayerStepReport landed = player.postStep(scene, kStepMs);
    EXPECT_TRUE(landed.landedSlam);
    EXPECT_EQ(landed.enemiesDefeated, 1);
    EXPECT_TRUE(scene.findEntity(nearId)->pendingDestroy);
    EXPECT_EQ(scene.findEntity(farId)->health.current, 30);
    EXPECT_FALSE(player.slamPending());
}

TEST_F(PlayerTests, TimeRewindReturnsToOldestSample) {
    player.switchEra(scene, Era::Futuristic);

    for (int i = 0; i < 10; ++i)
    {
        body().transform.x = 100.0f + i * 10.0f;
        player.postStep(scene, kStepMs);
    }
    EXPECT_EQ(player.rewindSamples(), 10u);

    player.requestPower();
    player.preStep(scene, projectiles);
    EXPECT_FLOAT_EQ(body().transform.x, 100.0f);
    EXPECT_EQ(player.rewindSamples(), 0u);
}

TEST_F(PlayerTests, RewindHistoryKeepsThreeSeconds) {
    for (int i = 0; i < 400; ++i)
        player.postStep(scene, 10.0f);
    EXPECT_LE(player.rewindSamples(), 301u);
    EXPECT_GE(player.rewindSamples(), 300u);
}

TEST_F(PlayerTests, SnapshotRestoreKeepsVitals) {
    player.switchEra(scene, Era::Prehistoric);
    player.takeDamage(scene, 40);
    body().transform.x = 420.0f;
    PlayerSnapshot snap = player.snapshot(scene);
    EXPECT_FLOAT_EQ(snap.x, 420.0f);
    EXPECT_EQ(snap.health, 60);
    EXPECT_EQ(snap.era, Era::Prehistoric);

    Scene fresh;
    Player loaded{PlayerSettings{}};
    loaded.spawn(fresh, 0.0f, 0.0f);
    loaded.restore(fresh, snap);
    EXPECT_EQ(loaded.era(), Era::Prehistoric);
    EXPECT_EQ(loaded.health(fresh), 60);
    EXPECT_FLOAT_EQ(loaded.entity(fresh)->transform.x, 420.0f);
    EXPECT_FALSE(loaded.invulnerable());
}

TEST(PlayerLimitsTests, RestoreWithZeroMaxHealthStaysInRange) {
    PlayerSettings settings;
    settings.maxHealth = 0;
    settings.maxStamina = 0.0f;
    Player player(settings);
    Scene scene;
    player.spawn(scene, 0.0f, 0.0f);

    PlayerSnapshot snap;
    snap.health = 50;
    snap.stamina = 30.0f;
    player.restore(scene, snap);

    EXPECT_EQ(player.health(scene), 1);
    EXPECT_FLOAT_EQ(player.stamina(), 0.0f);
}

} // namespace
