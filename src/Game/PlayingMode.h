#pragma once
#include <array>
#include <memory>
#include <vector>
#include "DrawContext.h"
#include "GameConfig.h"
#include "GameModeMachine.h"
#include "GameSnapshot.h"
#include "Player.h"
#include "../World/Level.h"
#include "../World/Scene.h"
#include "../Systems/EnemySystem.h"
#include "../Systems/PhysicsSystem.h"
#include "../Systems/ProjectileSystem.h"
#include "../Systems/RenderSystem.h"

class Input;
class Texture;
class TimeScaleController;
class SaveManager;

using EraBackgrounds = std::array<std::shared_ptr<Texture>, kEraCount>;

class PlayingMode
{
public:
    PlayingMode(const GameConfig &config, const Input &bindings, TimeScaleController &timeScale,
                SaveManager *saves, EraBackgrounds backgrounds);

    // Run nova: level do catalogo, player no spawn, era inicial
    bool startNewRun(int levelIndex);
    bool loadLevel(int levelIndex);

    GameSnapshot exportState() const;
    bool importState(const GameSnapshot &snapshot);

    bool quickSave();
    bool quickLoad();

    // EraTransition aplica a era no passo em que o controller troca
    void applyEra(Era era);

    // Handlers do GameModeMachine
    void onEnter(GameMode previous);
    ModeRequest handleInput(const InputEvent &event);
    void sampleHeld(const Input &input);
    ModeRequest update(float dtMs);
    void draw(DrawContext &ctx) const;

    Scene &scene() { return scene_; }
    const Scene &scene() const { return scene_; }
    Player &player() { return player_; }
    const Player &player() const { return player_; }
    const Level &level() const { return *level_; }
    int levelIndex() const { return levelIndex_; }
    int levelCount() const { return (int)catalog_.size(); }
    bool runCompleted() const { return runCompleted_; }
    bool showColliders() const { return showColliders_; }

private:
    void applyContactDamage();
    void respawnPlayer();
    void drawHud(DrawContext &ctx) const;

private:
    GameConfig config_;
    const Input &bindings_;
    TimeScaleController &timeScale_;
    SaveManager *saves_ = nullptr; // opcional (testes sem disco)
    EraBackgrounds backgrounds_;

    Scene scene_;
    Player player_;
    PhysicsSystem physics_;
    EnemySystem enemies_;
    ProjectileSystem projectiles_;
    RenderSystem renderSystem_;

    std::vector<LevelDef> catalog_;
    std::unique_ptr<Level> level_;
    int levelIndex_ = 0;
    bool runCompleted_ = false;
    bool showColliders_ = false;
};
