#include "GameConfig.h"
#include <cstdio>
#include <fstream>
#include <functional>
#include <sstream>
#include <unordered_map>

static bool IsCommentOrEmpty(const std::string &line)
{
    for (char c : line)
    {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
            continue;
        return (c == '#' || c == ';');
    }
    return true;
}

template <typename T>
static std::function<bool(std::istringstream &)> Field(T &target)
{
    return [&target](std::istringstream &iss)
    {
        T value{};
        if (!(iss >> value))
            return false;
        target = value;
        return true;
    };
}

// texto: resto da linha, sem espacos nas pontas (titulo pode ter espacos)
static std::function<bool(std::istringstream &)> Field(std::string &target)
{
    return [&target](std::istringstream &iss)
    {
        std::string value;
        std::getline(iss >> std::ws, value);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r'))
            value.pop_back();
        if (value.empty())
            return false;
        target = value;
        return true;
    };
}

bool GameConfig::loadFromFile(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::printf("GameConfig: failed to open '%s', using defaults\n", path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

bool GameConfig::loadFromString(const std::string &text)
{
    const std::unordered_map<std::string, std::function<bool(std::istringstream &)>> fields = {
        {"title", Field(title)},
        {"window_width", Field(windowWidth)},
        {"window_height", Field(windowHeight)},
        {"target_fps", Field(targetFps)},
        {"fixed_step_ms", Field(fixedStepMs)},
        {"max_frame_steps", Field(maxFrameSteps)},
        {"player_speed", Field(playerSpeed)},
        {"jump_force", Field(jumpForce)},
        {"player_max_health", Field(playerMaxHealth)},
        {"player_max_stamina", Field(playerMaxStamina)},
        {"stamina_regen", Field(staminaRegenPerSec)},
        {"power_stamina_cost", Field(powerStaminaCost)},
        {"gravity", Field(gravity)},
        {"max_fall_speed", Field(maxFallSpeed)},
        {"slow_motion_factor", Field(slowMotionFactor)},
        {"slow_motion_duration_ms", Field(slowMotionDurationMs)},
        {"slow_motion_cooldown_ms", Field(slowMotionCooldownMs)},
        {"transition_rate", Field(transitionRate)},
        {"melee_damage", Field(meleeDamage)},
        {"contact_damage", Field(contactDamage)},
        {"projectile_base_damage", Field(projectileBaseDamage)},
        {"projectile_speed", Field(projectileSpeed)},
        {"attack_cooldown_ms", Field(attackCooldownMs)},
        {"save_dir", Field(saveDir)},
        {"asset_manifest", Field(assetManifest)},
    };

    std::istringstream input(text);
    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line))
    {
        lineNumber++;
        if (IsCommentOrEmpty(line))
            continue;

        std::istringstream iss(line);
        std::string key;
        iss >> key;

        auto it = fields.find(key);
        if (it == fields.end())
        {
            std::printf("GameConfig: unknown key '%s' on line %d\n", key.c_str(), lineNumber);
            continue;
        }
        if (!it->second(iss))
            std::printf("GameConfig: invalid value for '%s' on line %d\n", key.c_str(), lineNumber);
    }

    sanitize();
    return true;
}

void GameConfig::sanitize()
{
    GameConfig defaults;

    if (windowWidth <= 0 || windowHeight <= 0)
    {
        windowWidth = defaults.windowWidth;
        windowHeight = defaults.windowHeight;
    }
    if (targetFps <= 0)
        targetFps = defaults.targetFps;
    if (fixedStepMs <= 0.0)
        fixedStepMs = defaults.fixedStepMs;
    if (maxFrameSteps <= 0)
        maxFrameSteps = defaults.maxFrameSteps;
    if (slowMotionFactor <= 0.0f || slowMotionFactor > 1.0f)
        slowMotionFactor = defaults.slowMotionFactor;
    if (slowMotionDurationMs < 0)
        slowMotionDurationMs = defaults.slowMotionDurationMs;
    if (slowMotionCooldownMs < 0)
        slowMotionCooldownMs = defaults.slowMotionCooldownMs;
    if (transitionRate <= 0.0f || transitionRate > 1.0f)
        transitionRate = defaults.transitionRate;

    // zero aqui vira divisao por zero no HUD ou respawn em todo passo
    if (playerMaxHealth <= 0)
        playerMaxHealth = defaults.playerMaxHealth;
    if (playerMaxStamina <= 0.0f)
        playerMaxStamina = defaults.playerMaxStamina;
    if (playerSpeed <= 0.0f)
        playerSpeed = defaults.playerSpeed;
    if (jumpForce >= 0.0f)
        jumpForce = defaults.jumpForce;
    if (staminaRegenPerSec < 0.0f)
        staminaRegenPerSec = defaults.staminaRegenPerSec;
    if (powerStaminaCost < 0.0f)
        powerStaminaCost = defaults.powerStaminaCost;
    if (gravity < 0.0f)
        gravity = defaults.gravity;
    if (maxFallSpeed <= 0.0f)
        maxFallSpeed = defaults.maxFallSpeed;
    if (meleeDamage <= 0)
        meleeDamage = defaults.meleeDamage;
    if (contactDamage < 0)
        contactDamage = defaults.contactDamage;
    if (projectileBaseDamage <= 0)
        projectileBaseDamage = defaults.projectileBaseDamage;
    if (projectileSpeed <= 0.0f)
        projectileSpeed = defaults.projectileSpeed;
    if (attackCooldownMs < 0.0f)
        attackCooldownMs = defaults.attackCooldownMs;
}
