#pragma once
#include <deque>
#include "Era.h"
#include "GameSnapshot.h"

class Scene;
class ProjectileSystem;
struct Entity;

struct PlayerSettings
{
    float speed = 300.0f;
    float jumpForce = -600.0f;
    int maxHealth = 100;
    float maxStamina = 100.0f;
    float staminaRegenPerSec = 20.0f;
    float powerStaminaCost = 20.0f;
    int meleeDamage = 20;
    float attackCooldownMs = 300.0f;
};

struct PlayerStepReport
{
    int enemiesDefeated = 0;
    bool landedSlam = false;
};

class Player
{
public:
    static constexpr int kWidth = 32;
    static constexpr int kHeight = 64;
    static constexpr float kInvulnerableMs = 500.0f;
    static constexpr float kShieldMs = 1500.0f;
    static constexpr float kSlamRadius = 150.0f;
    static constexpr float kRewindWindowMs = 3000.0f;

    explicit Player(const PlayerSettings &settings);

    // Cria a entidade do player no scene (mantem era e stats)
    int spawn(Scene &scene, float x, float y);
    // Volta ao spawn: posicao, velocidade e estado transitorio
    void resetAt(Scene &scene, float x, float y);
    void restoreVitals();

    int entityId() const { return entityId_; }
    Entity *entity(Scene &scene) const;
    const Entity *entity(const Scene &scene) const;

    // Intencoes: input 1x por frame, aplicadas no proximo passo fixo
    void setMoveIntent(float axis) { moveIntent_ = axis; }
    float moveIntent() const { return moveIntent_; }
    void requestJump() { jumpRequested_ = true; }
    void requestAttack() { attackRequested_ = true; }
    void requestPower() { powerRequested_ = true; }
    void clearRequests();

    void preStep(Scene &scene, ProjectileSystem &projectiles);
    PlayerStepReport postStep(Scene &scene, float dtMs);

    bool takeDamage(Scene &scene, int amount);
    void heal(Scene &scene, int amount);

    void switchEra(Scene &scene, Era era);
    Era era() const { return era_; }

    int health(const Scene &scene) const;
    int maxHealth() const { return settings_.maxHealth; }
    float stamina() const { return stamina_; }
    float maxStamina() const { return settings_.maxStamina; }
    float powerCooldownMs() const { return powerCooldownMs_; }
    bool shieldActive() const { return shieldMs_ > 0.0f; }
    bool invulnerable() const { return invulnerableMs_ > 0.0f; }
    bool slamPending() const { return slamPending_; }
    float facing() const { return facing_; }
    std::size_t rewindSamples() const { return history_.size(); }

    PlayerSnapshot snapshot(const Scene &scene) const;
    void restore(Scene &scene, const PlayerSnapshot &snap);

private:
    struct Sample
    {
        float x;
        float y;
        double timeMs;
    };

    bool usePower(Entity &e);
    void groundSlam(Entity &e);
    void shieldBlock(Entity &e);
    void timeRewind(Entity &e);
    int resolveSlam(Scene &scene, const Entity &e);
    void refreshAppearance(Entity &e) const;

private:
    PlayerSettings settings_;
    int entityId_ = 0;
    Era era_ = Era::Medieval;

    float stamina_ = 100.0f;
    float powerCooldownMs_ = 0.0f;
    float attackCooldownMs_ = 0.0f;
    float invulnerableMs_ = 0.0f;
    float shieldMs_ = 0.0f;
    bool slamPending_ = false;
    float facing_ = 1.0f;

    float moveIntent_ = 0.0f;
    bool jumpRequested_ = false;
    bool attackRequested_ = false;
    bool powerRequested_ = false;

    double simTimeMs_ = 0.0;
    std::deque<Sample> history_; // posicoes para o Time Rewind
};
