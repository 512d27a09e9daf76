#include "PlayingMode.h"
#include "../Input/Input.h"
#include "../Persistence/SaveManager.h"
#include "../Renderer/CommandBuffer.h"
#include "../Time/TimeScaleController.h"
#include <cstdio>

static PlayerSettings MakePlayerSettings(const GameConfig &c)
{
    PlayerSettings s;
    s.speed = c.playerSpeed;
    s.jumpForce = c.jumpForce;
    s.maxHealth = c.playerMaxHealth;
    s.maxStamina = c.playerMaxStamina;
    s.staminaRegenPerSec = c.staminaRegenPerSec;
    s.powerStaminaCost = c.powerStaminaCost;
    s.meleeDamage = c.meleeDamage;
    s.attackCooldownMs = c.attackCooldownMs;
    return s;
}

static PhysicsSettings MakePhysicsSettings(const GameConfig &c)
{
    PhysicsSettings s;
    s.gravity = c.gravity;
    s.maxFallSpeed = c.maxFallSpeed;
    return s;
}

static ProjectileSettings MakeProjectileSettings(const GameConfig &c)
{
    ProjectileSettings s;
    s.speed = c.projectileSpeed;
    s.baseDamage = c.projectileBaseDamage;
    return s;
}

static bool Overlaps(const Entity &a, const Entity &b)
{
    float ax = a.transform.x + a.collider.offsetX;
    float ay = a.transform.y + a.collider.offsetY;
    float bx = b.transform.x + b.collider.offsetX;
    float by = b.transform.y + b.collider.offsetY;
    return ax < bx + b.collider.w && ax + a.collider.w > bx &&
           ay < by + b.collider.h && ay + a.collider.h > by;
}

static float Lerp(float a, float b, float t)
{
    return a + (b - a) * t;
}

PlayingMode::PlayingMode(const GameConfig &config, const Input &bindings, TimeScaleController &timeScale,
                         SaveManager *saves, EraBackgrounds backgrounds)
    : config_(config),
      bindings_(bindings),
      timeScale_(timeScale),
      saves_(saves),
      backgrounds_(std::move(backgrounds)),
      player_(MakePlayerSettings(config)),
      physics_(MakePhysicsSettings(config)),
      projectiles_(MakeProjectileSettings(config)),
      catalog_(BuildLevelCatalog())
{
    loadLevel(0);
}

bool PlayingMode::loadLevel(int levelIndex)
{
    if (levelIndex < 0 || levelIndex >= (int)catalog_.size())
    {
        std::printf("PlayingMode: no level %d\n", levelIndex);
        return false;
    }

    levelIndex_ = levelIndex;
    level_ = std::make_unique<Level>(catalog_[levelIndex]);
    level_->restart();

    scene_.clear();
    physics_.reset();
    projectiles_.reset();
    level_->populate(scene_);

    LevelPoint spawn = level_->spawnPosition();
    player_.spawn(scene_, spawn.x, spawn.y);

    std::printf("PlayingMode: level %d '%s'\n", levelIndex, level_->def().name.c_str());
    return true;
}

bool PlayingMode::startNewRun(int levelIndex)
{
    if (!loadLevel(levelIndex))
        return false;

    runCompleted_ = false;
    player_.restoreVitals();
    player_.switchEra(scene_, Era::Medieval);
    if (!timeScale_.resetEra(Era::Medieval))
        std::printf("PlayingMode: era reset refused during a transition\n");
    return true;
}

GameSnapshot PlayingMode::exportState() const
{
    GameSnapshot snap;
    snap.player = player_.snapshot(scene_);
    snap.world.levelIndex = levelIndex_;
    snap.world.checkpointIndex = level_->checkpointIndex();
    snap.world.enemiesDefeated = level_->enemiesDefeated();
    return snap;
}

bool PlayingMode::importState(const GameSnapshot &snapshot)
{
    if (timeScale_.transitioning())
    {
        std::printf("PlayingMode: cannot import state during an era transition\n");
        return false;
    }
    if (!loadLevel(snapshot.world.levelIndex))
        return false;

    if (!timeScale_.resetEra(snapshot.player.era))
        return false;

    runCompleted_ = false;
    level_->restoreProgress(snapshot.world.checkpointIndex, snapshot.world.enemiesDefeated);
    player_.restore(scene_, snapshot.player);
    return true;
}

bool PlayingMode::quickSave()
{
    if (!saves_)
        return false;
    return saves_->saveGame(exportState(), SaveType::Manual, 0);
}

bool PlayingMode::quickLoad()
{
    if (!saves_)
        return false;

    auto snap = saves_->loadGame(SaveType::Manual, 0);
    if (!snap)
    {
        std::printf("PlayingMode: nothing to load\n");
        return false;
    }
    return importState(*snap);
}

void PlayingMode::applyEra(Era era)
{
    player_.switchEra(scene_, era);
}

void PlayingMode::onEnter(GameMode previous)
{
    (void)previous;
    // teclas soltas durante o pause/transicao nao geram KeyUp aqui
    player_.setMoveIntent(0.0f);
    player_.clearRequests();
}

ModeRequest PlayingMode::handleInput(const InputEvent &event)
{
    if (event.type != InputEventType::KeyDown || event.repeat)
        return std::nullopt;

    Key key = event.key;

    if (bindings_.matches("Pause", key))
        return GameMode::Paused;

    if (bindings_.matches("NextEra", key))
    {
        if (timeScale_.beginTransition(NextEra(timeScale_.currentEra())))
            return GameMode::EraTransition;
        return std::nullopt;
    }
    if (bindings_.matches("PrevEra", key))
    {
        if (timeScale_.beginTransition(PrevEra(timeScale_.currentEra())))
            return GameMode::EraTransition;
        return std::nullopt;
    }

    if (bindings_.matches("Jump", key))
        player_.requestJump();
    if (bindings_.matches("Attack", key))
        player_.requestAttack();
    if (bindings_.matches("EraPower", key))
        player_.requestPower();
    if (bindings_.matches("SlowTime", key))
        timeScale_.startSlowMotion();
    if (bindings_.matches("QuickSave", key))
        quickSave();
    if (bindings_.matches("QuickLoad", key))
        quickLoad();
    if (bindings_.matches("ToggleColliders", key))
        showColliders_ = !showColliders_;

    return std::nullopt;
}

void PlayingMode::sampleHeld(const Input &input)
{
    player_.setMoveIntent(input.getAxis("MoveX"));
}

ModeRequest PlayingMode::update(float dtMs)
{
    scene_.snapshotPositions();
    level_->update(dtMs);

    player_.preStep(scene_, projectiles_);

    EnemyContext ctx;
    if (const Entity *p = player_.entity(scene_))
    {
        ctx.playerX = p->centerX();
        ctx.playerY = p->centerY();
    }
    ctx.worldW = level_->def().width;
    ctx.worldH = level_->def().height;
    ctx.projectiles = &projectiles_;
    enemies_.update(scene_, dtMs, ctx);

    physics_.step(scene_, dtMs);

    PlayerStepReport playerReport = player_.postStep(scene_, dtMs);
    level_->addEnemiesDefeated(playerReport.enemiesDefeated);

    ProjectileReport projectileReport = projectiles_.update(scene_, dtMs, player_.entityId());
    level_->addEnemiesDefeated(projectileReport.enemiesDefeated);
    if (projectileReport.damageToPlayer > 0)
        player_.takeDamage(scene_, projectileReport.damageToPlayer);

    // criados depois do passe: nada acima guarda referencia para entities()
    projectiles_.spawnQueued(scene_);

    applyContactDamage();
    scene_.flushDestroyed();

    if (const Entity *p = player_.entity(scene_))
    {
        if (level_->tryReachCheckpoint(p->centerX(), p->centerY()))
        {
            std::printf("PlayingMode: checkpoint %d reached\n", level_->checkpointIndex());
            if (saves_)
                saves_->createCheckpoint(exportState());
        }
    }

    if (player_.health(scene_) <= 0)
        respawnPlayer();

    if (const Entity *p = player_.entity(scene_))
    {
        if (!runCompleted_ && level_->isCompleted(p->transform.x))
        {
            if (levelIndex_ + 1 < (int)catalog_.size())
            {
                loadLevel(levelIndex_ + 1);
            }
            else
            {
                runCompleted_ = true;
                std::printf("PlayingMode: run completed\n");
            }
        }
    }

    return std::nullopt;
}

void PlayingMode::applyContactDamage()
{
    const Entity *p = player_.entity(scene_);
    if (!p)
        return;

    bool touching = false;
    for (const auto &e : scene_.entities())
    {
        if (e.kind != EntityKind::Enemy || e.pendingDestroy || !e.collider.enabled)
            continue;
        if (Overlaps(*p, e))
        {
            touching = true;
            break;
        }
    }

    if (touching)
        player_.takeDamage(scene_, config_.contactDamage);
}

void PlayingMode::respawnPlayer()
{
    LevelPoint spawn = level_->spawnPosition();
    player_.resetAt(scene_, spawn.x, spawn.y);
    player_.heal(scene_, player_.maxHealth());
    std::printf("PlayingMode: player respawned at %.0f,%.0f\n", spawn.x, spawn.y);
}

void PlayingMode::draw(DrawContext &ctx) const
{
    Era era = player_.era();
    const EraTuning &tuning = GetEraTuning(era);

    if (const auto &bg = backgrounds_[EraIndex(era)])
    {
        RenderCommand cmd;
        cmd.type = RenderCommandType::Texture;
        cmd.layer = -100;
        cmd.screenSpace = true;
        cmd.w = ctx.surfaceW;
        cmd.h = ctx.surfaceH;
        cmd.texture = bg.get();
        ctx.cmds.submit(cmd);
    }
    else
    {
        ctx.cmds.rect(-100, 0.0f, 0.0f, ctx.surfaceW, ctx.surfaceH,
                      tuning.background.r, tuning.background.g, tuning.background.b, 255, true);
    }

    if (const Entity *p = player_.entity(scene_))
    {
        float px = Lerp(p->transform.prevX, p->transform.x, ctx.interpolation) + p->collider.w * 0.5f;
        float py = Lerp(p->transform.prevY, p->transform.y, ctx.interpolation) + p->collider.h * 0.5f;
        ctx.camera.follow(px, py, level_->def().width, level_->def().height, ctx.surfaceW, ctx.surfaceH);
    }

    // checkpoints e saida
    const LevelDef &def = level_->def();
    for (int i = 0; i < (int)def.checkpoints.size(); ++i)
    {
        const LevelPoint &cp = def.checkpoints[i];
        bool reached = i <= level_->checkpointIndex();
        ctx.cmds.rect(1, cp.x, cp.y, 8, 48,
                      reached ? 80 : 230, reached ? 220 : 200, reached ? 80 : 60, 255);
    }
    if (def.exitX > 0.0f)
        ctx.cmds.rect(1, def.exitX, 0.0f, 4, (int)def.height, 255, 255, 255, 90);

    renderSystem_.render(scene_, ctx.cmds, ctx.interpolation);

    if (showColliders_)
        physics_.debugRender(scene_, ctx.cmds);

    drawHud(ctx);
}

void PlayingMode::drawHud(DrawContext &ctx) const
{
    CommandBuffer &cmds = ctx.cmds;
    const int layer = 200;

    // vida
    float healthFrac = player_.maxHealth() > 0 ? (float)player_.health(scene_) / (float)player_.maxHealth() : 0.0f;
    cmds.rect(layer, 10.0f, 10.0f, 200, 20, 60, 0, 0, 255, true);
    cmds.rect(layer + 1, 10.0f, 10.0f, (int)(200 * healthFrac), 20, 220, 40, 40, 255, true);

    // stamina
    float staminaFrac = player_.maxStamina() > 0.0f ? player_.stamina() / player_.maxStamina() : 0.0f;
    cmds.rect(layer, 10.0f, 35.0f, 200, 10, 0, 0, 60, 255, true);
    cmds.rect(layer + 1, 10.0f, 35.0f, (int)(200 * staminaFrac), 10, 60, 120, 230, 255, true);

    char line[128];
    const EraColor &eraColor = GetEraTuning(player_.era()).color;
    std::snprintf(line, sizeof(line), "Era: %s", EraName(player_.era()));
    cmds.text(layer, line, 10.0f, 55.0f, FontStyle::Body, eraColor.r, eraColor.g, eraColor.b, 255);

    switch (timeScale_.slowMotionState())
    {
    case SlowMotionState::Active:
        std::snprintf(line, sizeof(line), "Slow motion: %.1fs",
                      timeScale_.slowMotionRemainingMs() / 1000.0);
        break;
    case SlowMotionState::Cooldown:
        std::snprintf(line, sizeof(line), "Slow motion ready in %.0fs",
                      timeScale_.cooldownRemainingMs() / 1000.0);
        break;
    case SlowMotionState::Idle:
        std::snprintf(line, sizeof(line), "Slow motion ready");
        break;
    }
    cmds.text(layer, line, 10.0f, 80.0f, FontStyle::Body, 200, 200, 255, 255);

    if (player_.powerCooldownMs() > 0.0f)
        std::snprintf(line, sizeof(line), "Power: %.1fs", player_.powerCooldownMs() / 1000.0f);
    else
        std::snprintf(line, sizeof(line), "Power ready");
    cmds.text(layer, line, 10.0f, 105.0f, FontStyle::Body, 200, 200, 200, 255);

    std::snprintf(line, sizeof(line), "%s  (%d/%d)", level_->def().name.c_str(), levelIndex_ + 1, levelCount());
    cmds.text(layer, line, (float)ctx.surfaceW - 220.0f, 10.0f, FontStyle::Body, 220, 220, 220, 255);

    if (const std::string *msg = level_->activeMessage())
        cmds.text(layer, *msg, ctx.surfaceW * 0.5f, 60.0f, FontStyle::Body, 255, 255, 255, 255, true);

    if (runCompleted_)
        cmds.text(layer, "Level complete!", ctx.surfaceW * 0.5f, ctx.surfaceH * 0.5f,
                  FontStyle::Title, 255, 255, 120, 255, true);
}
