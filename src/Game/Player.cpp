#include "Player.h"
#include "../World/Scene.h"
#include "../Systems/ProjectileSystem.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>

Player::Player(const PlayerSettings &settings)
    : settings_(settings),
      stamina_(settings.maxStamina)
{
}

int Player::spawn(Scene &scene, float x, float y)
{
    auto &e = scene.createEntity(EntityKind::Player);
    e.era = era_;
    e.rect.w = kWidth;
    e.rect.h = kHeight;
    e.collider.enabled = true;
    e.collider.w = (float)kWidth;
    e.collider.h = (float)kHeight;
    e.rigidbody.enabled = true;
    e.rigidbody.useGravity = true;
    e.health.max = settings_.maxHealth;
    e.health.current = settings_.maxHealth;
    e.renderLayer = 4;
    entityId_ = e.id;

    resetAt(scene, x, y);
    return entityId_;
}

void Player::resetAt(Scene &scene, float x, float y)
{
    Entity *e = entity(scene);
    if (!e)
        return;

    e->transform.x = x;
    e->transform.y = y;
    e->transform.prevX = x;
    e->transform.prevY = y;
    e->rigidbody.vx = 0.0f;
    e->rigidbody.vy = 0.0f;
    e->rigidbody.grounded = false;

    slamPending_ = false;
    invulnerableMs_ = 0.0f;
    shieldMs_ = 0.0f;
    history_.clear();
    clearRequests();
    moveIntent_ = 0.0f;
    refreshAppearance(*e);
}

void Player::restoreVitals()
{
    stamina_ = settings_.maxStamina;
    powerCooldownMs_ = 0.0f;
    attackCooldownMs_ = 0.0f;
}

Entity *Player::entity(Scene &scene) const
{
    return entityId_ ? scene.findEntity(entityId_) : nullptr;
}

const Entity *Player::entity(const Scene &scene) const
{
    return entityId_ ? scene.findEntity(entityId_) : nullptr;
}

void Player::clearRequests()
{
    jumpRequested_ = false;
    attackRequested_ = false;
    powerRequested_ = false;
}

void Player::preStep(Scene &scene, ProjectileSystem &projectiles)
{
    Entity *e = entity(scene);
    if (!e)
    {
        clearRequests();
        return;
    }

    RigidBody2D &rb = e->rigidbody;
    rb.vx = moveIntent_ * settings_.speed;
    if (moveIntent_ > 0.0f)
        facing_ = 1.0f;
    else if (moveIntent_ < 0.0f)
        facing_ = -1.0f;

    if (jumpRequested_ && rb.grounded)
    {
        rb.vy = settings_.jumpForce;
        rb.grounded = false;
    }

    if (powerRequested_)
        usePower(*e);

    if (attackRequested_ && attackCooldownMs_ <= 0.0f)
    {
        ProjectileSpawn spawn;
        spawn.x = e->centerX() + facing_ * (kWidth * 0.5f + 8.0f);
        spawn.y = e->centerY();
        spawn.targetX = spawn.x + facing_ * 100.0f;
        spawn.targetY = spawn.y;
        spawn.era = era_;
        spawn.hostile = false;
        projectiles.queue(spawn);
        attackCooldownMs_ = settings_.attackCooldownMs;
    }

    clearRequests();
}

bool Player::usePower(Entity &e)
{
    if (powerCooldownMs_ > 0.0f || stamina_ < settings_.powerStaminaCost)
        return false;

    using PowerFn = void (Player::*)(Entity &);
    static const std::array<PowerFn, kEraCount> powers = {
        &Player::groundSlam,  // Prehistoric
        &Player::shieldBlock, // Medieval
        &Player::timeRewind   // Futuristic
    };

    (this->*powers[EraIndex(era_)])(e);
    stamina_ -= settings_.powerStaminaCost;
    powerCooldownMs_ = GetEraTuning(era_).powerCooldownMs;
    return true;
}

void Player::groundSlam(Entity &e)
{
    e.rigidbody.vy = settings_.jumpForce;
    e.rigidbody.grounded = false;
    slamPending_ = true;
}

void Player::shieldBlock(Entity &e)
{
    shieldMs_ = kShieldMs;
    refreshAppearance(e);
}

void Player::timeRewind(Entity &e)
{
    if (history_.empty())
        return;

    const Sample &oldest = history_.front();
    e.transform.x = oldest.x;
    e.transform.y = oldest.y;
    e.transform.prevX = oldest.x;
    e.transform.prevY = oldest.y;
    e.rigidbody.vx = 0.0f;
    e.rigidbody.vy = 0.0f;
    history_.clear();
}

int Player::resolveSlam(Scene &scene, const Entity &e)
{
    int defeated = 0;
    int damage = settings_.meleeDamage * 2;
    float px = e.centerX();
    float py = e.centerY();

    for (auto &other : scene.entities())
    {
        if (other.kind != EntityKind::Enemy || other.pendingDestroy)
            continue;

        float dx = other.centerX() - px;
        float dy = other.centerY() - py;
        if (std::sqrt(dx * dx + dy * dy) > kSlamRadius)
            continue;

        other.health.current -= damage;
        if (other.health.current <= 0)
        {
            other.health.current = 0;
            other.pendingDestroy = true;
            defeated++;
        }
    }
    return defeated;
}

PlayerStepReport Player::postStep(Scene &scene, float dtMs)
{
    PlayerStepReport report;
    Entity *e = entity(scene);
    if (!e)
        return report;

    if (slamPending_ && e->rigidbody.grounded)
    {
        slamPending_ = false;
        report.landedSlam = true;
        report.enemiesDefeated += resolveSlam(scene, *e);
    }

    float dt = dtMs / 1000.0f;
    stamina_ = std::min(settings_.maxStamina, stamina_ + settings_.staminaRegenPerSec * dt);

    powerCooldownMs_ = std::max(0.0f, powerCooldownMs_ - dtMs);
    attackCooldownMs_ = std::max(0.0f, attackCooldownMs_ - dtMs);
    invulnerableMs_ = std::max(0.0f, invulnerableMs_ - dtMs);
    bool hadShield = shieldMs_ > 0.0f;
    shieldMs_ = std::max(0.0f, shieldMs_ - dtMs);
    if (hadShield && shieldMs_ <= 0.0f)
        refreshAppearance(*e);

    simTimeMs_ += dtMs;
    history_.push_back({e->transform.x, e->transform.y, simTimeMs_});
    while (!history_.empty() && simTimeMs_ - history_.front().timeMs > kRewindWindowMs)
        history_.pop_front();

    // pisca enquanto invulneravel
    e->rect.a = (invulnerableMs_ > 0.0f && ((int)(invulnerableMs_ / 100.0f) % 2) == 0) ? 110 : 255;

    return report;
}

bool Player::takeDamage(Scene &scene, int amount)
{
    Entity *e = entity(scene);
    if (!e || amount <= 0)
        return false;
    if (invulnerableMs_ > 0.0f || shieldMs_ > 0.0f)
        return false;

    e->health.current = std::max(0, e->health.current - amount);
    invulnerableMs_ = kInvulnerableMs;
    return true;
}

void Player::heal(Scene &scene, int amount)
{
    Entity *e = entity(scene);
    if (!e || amount <= 0)
        return;
    e->health.current = std::min(e->health.max, e->health.current + amount);
}

void Player::switchEra(Scene &scene, Era era)
{
    era_ = era;
    powerCooldownMs_ = 0.0f;
    slamPending_ = false;

    if (Entity *e = entity(scene))
    {
        e->era = era;
        refreshAppearance(*e);
    }
    std::printf("Player: era is now %s\n", EraName(era));
}

int Player::health(const Scene &scene) const
{
    const Entity *e = entity(scene);
    return e ? e->health.current : 0;
}

void Player::refreshAppearance(Entity &e) const
{
    const EraColor &c = GetEraTuning(era_).color;
    if (shieldMs_ > 0.0f)
    {
        e.rect.r = (unsigned char)std::min(255, c.r + 90);
        e.rect.g = (unsigned char)std::min(255, c.g + 90);
        e.rect.b = (unsigned char)std::min(255, c.b + 90);
    }
    else
    {
        e.rect.r = c.r;
        e.rect.g = c.g;
        e.rect.b = c.b;
    }
}

PlayerSnapshot Player::snapshot(const Scene &scene) const
{
    PlayerSnapshot snap;
    snap.era = era_;
    snap.stamina = stamina_;
    if (const Entity *e = entity(scene))
    {
        snap.x = e->transform.x;
        snap.y = e->transform.y;
        snap.health = e->health.current;
    }
    return snap;
}

void Player::restore(Scene &scene, const PlayerSnapshot &snap)
{
    era_ = snap.era;
    stamina_ = std::clamp(snap.stamina, 0.0f, std::max(0.0f, settings_.maxStamina));
    powerCooldownMs_ = 0.0f;
    attackCooldownMs_ = 0.0f;

    resetAt(scene, snap.x, snap.y);
    if (Entity *e = entity(scene))
    {
        e->era = era_;
        e->health.current = std::clamp(snap.health, 1, std::max(1, e->health.max));
        refreshAppearance(*e);
    }
}
