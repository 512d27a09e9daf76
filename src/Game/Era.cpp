#include "Era.h"
#include <array>

static const std::array<EraTuning, kEraCount> &EraTable()
{
    static const std::array<EraTuning, kEraCount> table = []
    {
        std::array<EraTuning, kEraCount> t{};

        EraTuning &pre = t[EraIndex(Era::Prehistoric)];
        pre.color = {139, 69, 19};
        pre.background = {44, 30, 22};
        pre.powerCooldownMs = 15000.0f;
        pre.projectileDamageMultiplier = 1.5f;
        pre.projectileW = 10;
        pre.projectileH = 10;
        pre.enemyHealth = 150;
        pre.enemySpeed = 60.0f;
        pre.enemyChargeSpeed = 240.0f;
        pre.chargeRadius = 200.0f;
        pre.chargeDurationMs = 1000.0f;
        pre.chargeRestMs = 3000.0f;

        EraTuning &med = t[EraIndex(Era::Medieval)];
        med.color = {128, 128, 128};
        med.background = {38, 38, 46};
        med.powerCooldownMs = 3000.0f;
        med.projectileDamageMultiplier = 1.0f;
        med.projectileW = 12;
        med.projectileH = 4;
        med.enemyHealth = 80;
        med.enemySpeed = 60.0f;
        med.attackRange = 300.0f;
        med.attackCooldownMs = 2000.0f;

        EraTuning &fut = t[EraIndex(Era::Futuristic)];
        fut.color = {0, 255, 255};
        fut.background = {12, 26, 40};
        fut.powerCooldownMs = 60000.0f;
        fut.projectileDamageMultiplier = 0.8f;
        fut.projectileW = 6;
        fut.projectileH = 6;
        fut.enemyHealth = 60;
        fut.enemySpeed = 90.0f;
        fut.attackRange = 400.0f;
        fut.attackCooldownMs = 1000.0f;
        fut.teleportRadius = 100.0f;
        fut.teleportDistance = 300.0f;
        fut.teleportCooldownMs = 5000.0f;

        return t;
    }();
    return table;
}

Era NextEra(Era era)
{
    return static_cast<Era>((EraIndex(era) + 1) % kEraCount);
}

Era PrevEra(Era era)
{
    return static_cast<Era>((EraIndex(era) + kEraCount - 1) % kEraCount);
}

const char *EraName(Era era)
{
    switch (era)
    {
    case Era::Prehistoric:
        return "Prehistoric";
    case Era::Medieval:
        return "Medieval";
    case Era::Futuristic:
        return "Futuristic";
    }
    return "Unknown";
}

bool ParseEra(const std::string &name, Era &out)
{
    for (int i = 0; i < kEraCount; ++i)
    {
        Era era = static_cast<Era>(i);
        if (name == EraName(era))
        {
            out = era;
            return true;
        }
    }
    return false;
}

const EraTuning &GetEraTuning(Era era)
{
    return EraTable()[EraIndex(era)];
}
