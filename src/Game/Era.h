#pragma once
#include <cstdint>
#include <string>

enum class Era : std::uint8_t
{
    Prehistoric = 0,
    Medieval,
    Futuristic
};

constexpr int kEraCount = 3;

inline int EraIndex(Era era) { return static_cast<int>(era); }

// ordem ciclica: Prehistoric -> Medieval -> Futuristic -> Prehistoric
Era NextEra(Era era);
Era PrevEra(Era era);

const char *EraName(Era era);
bool ParseEra(const std::string &name, Era &out);

struct EraColor
{
    std::uint8_t r = 255;
    std::uint8_t g = 255;
    std::uint8_t b = 255;
};

// Constantes por era. Tabela montada uma vez, nunca alterada.
struct EraTuning
{
    EraColor color;
    EraColor background;

    float powerCooldownMs = 0.0f;
    float projectileDamageMultiplier = 1.0f;
    int projectileW = 8;
    int projectileH = 8;

    int enemyHealth = 100;
    float enemySpeed = 0.0f;       // px/s
    float enemyChargeSpeed = 0.0f; // px/s (Prehistoric)
    float chargeRadius = 0.0f;
    float chargeDurationMs = 0.0f;
    float chargeRestMs = 0.0f;
    float attackRange = 0.0f;
    float attackCooldownMs = 0.0f;
    float teleportRadius = 0.0f;
    float teleportDistance = 0.0f;
    float teleportCooldownMs = 0.0f;
};

const EraTuning &GetEraTuning(Era era);
