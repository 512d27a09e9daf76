#pragma once
#include <string>

// Configuracao do jogo. Arquivo texto "chave valor" (mesmo formato do manifest).
struct GameConfig
{
    // Janela
    std::string title = "Chronosta";
    int windowWidth = 1280;
    int windowHeight = 720;
    int targetFps = 60;

    // Simulacao
    double fixedStepMs = 1000.0 / 60.0;
    int maxFrameSteps = 5; // maxFrameTime = maxFrameSteps * fixedStep

    // Player (px, px/s)
    float playerSpeed = 300.0f;
    float jumpForce = -600.0f;
    int playerMaxHealth = 100;
    float playerMaxStamina = 100.0f;
    float staminaRegenPerSec = 20.0f;
    float powerStaminaCost = 20.0f;

    // Fisica
    float gravity = 1200.0f;
    float maxFallSpeed = 800.0f;

    // Tempo
    float slowMotionFactor = 0.5f;
    int slowMotionDurationMs = 5000;
    int slowMotionCooldownMs = 30000;
    float transitionRate = 1.0f / 30.0f;

    // Combate
    int meleeDamage = 20;
    int contactDamage = 10;
    int projectileBaseDamage = 15;
    float projectileSpeed = 600.0f;
    float attackCooldownMs = 300.0f;

    // Arquivos
    std::string saveDir = "saves";
    std::string assetManifest = "assets/manifest.txt";

    // false se o arquivo nao abriu (valores padrao continuam valendo)
    bool loadFromFile(const std::string &path);
    bool loadFromString(const std::string &text);

    void sanitize();
};
