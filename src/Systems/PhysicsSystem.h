#pragma once
#include <cstdint>
#include <unordered_map>
#include <vector>

class Scene;
class CommandBuffer;
struct Entity;

struct PhysicsSettings
{
    float gravity = 1200.0f;     // px/s^2
    float maxFallSpeed = 800.0f; // velocidade terminal (px/s)
};

struct PhysicsStats
{
    int bodiesMoved = 0;
    int pairsTested = 0;
    int collisions = 0;
};

class PhysicsSystem
{
public:
    explicit PhysicsSystem(const PhysicsSettings &settings = PhysicsSettings{}) : settings_(settings) {}

    // Um passo fixo: gravidade, integra X e resolve, integra Y e resolve
    void step(Scene &scene, float dtMs);
    void debugRender(const Scene &scene, CommandBuffer &cmds) const;
    void reset();

    const PhysicsStats &stats() const { return stats_; }
    const PhysicsSettings &settings() const { return settings_; }

private:
    void buildStaticGrid(Scene &scene);
    void gatherStatics(const Entity &body, std::vector<int> &out) const;
    void resolveHorizontal(Scene &scene, Entity &body);
    void resolveVertical(Scene &scene, Entity &body);

private:
    PhysicsSettings settings_;
    int cellSize_ = 64;
    std::unordered_map<std::int64_t, std::vector<int>> grid_; // celula -> indices em entities()
    std::vector<int> candidates_;
    PhysicsStats stats_;
};
