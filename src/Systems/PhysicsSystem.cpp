#include "PhysicsSystem.h"
#include "../World/Scene.h"
#include "../World/Entity.h"
#include "../Renderer/CommandBuffer.h"
#include <algorithm>
#include <cmath>

struct AABB
{
    float minX;
    float minY;
    float maxX;
    float maxY;
};

static AABB BuildAABB(const Entity &e)
{
    float x = e.transform.x + e.collider.offsetX;
    float y = e.transform.y + e.collider.offsetY;
    return {x, y, x + e.collider.w, y + e.collider.h};
}

static bool Intersects(const AABB &a, const AABB &b)
{
    return !(a.maxX <= b.minX || a.minX >= b.maxX || a.maxY <= b.minY || a.minY >= b.maxY);
}

static bool IsStatic(const Entity &e)
{
    return e.collider.enabled && !e.collider.isTrigger && e.rigidbody.enabled && e.rigidbody.isKinematic;
}

static bool IsDynamic(const Entity &e)
{
    return e.rigidbody.enabled && !e.rigidbody.isKinematic && !e.pendingDestroy;
}

static std::int64_t CellKey(int cx, int cy)
{
    return (static_cast<std::int64_t>(cx) << 32) ^ (std::uint32_t)cy;
}

void PhysicsSystem::buildStaticGrid(Scene &scene)
{
    grid_.clear();

    float invCell = 1.0f / (float)cellSize_;
    const auto &entities = scene.entities();
    for (int i = 0; i < (int)entities.size(); ++i)
    {
        if (!IsStatic(entities[i]))
            continue;

        AABB b = BuildAABB(entities[i]);
        int minCx = (int)std::floor(b.minX * invCell);
        int maxCx = (int)std::floor(b.maxX * invCell);
        int minCy = (int)std::floor(b.minY * invCell);
        int maxCy = (int)std::floor(b.maxY * invCell);
        for (int cy = minCy; cy <= maxCy; ++cy)
        {
            for (int cx = minCx; cx <= maxCx; ++cx)
                grid_[CellKey(cx, cy)].push_back(i);
        }
    }
}

void PhysicsSystem::gatherStatics(const Entity &body, std::vector<int> &out) const
{
    out.clear();

    float invCell = 1.0f / (float)cellSize_;
    AABB b = BuildAABB(body);
    int minCx = (int)std::floor(b.minX * invCell);
    int maxCx = (int)std::floor(b.maxX * invCell);
    int minCy = (int)std::floor(b.minY * invCell);
    int maxCy = (int)std::floor(b.maxY * invCell);
    for (int cy = minCy; cy <= maxCy; ++cy)
    {
        for (int cx = minCx; cx <= maxCx; ++cx)
        {
            auto it = grid_.find(CellKey(cx, cy));
            if (it == grid_.end())
                continue;
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }

    // paredes grandes ocupam varias celulas
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
}

void PhysicsSystem::resolveHorizontal(Scene &scene, Entity &body)
{
    gatherStatics(body, candidates_);
    auto &entities = scene.entities();

    for (int idx : candidates_)
    {
        const Entity &wall = entities[idx];
        stats_.pairsTested++;

        AABB ab = BuildAABB(body);
        AABB wb = BuildAABB(wall);
        if (!Intersects(ab, wb))
            continue;

        if (body.rigidbody.vx > 0.0f)
            body.transform.x = wb.minX - body.collider.w - body.collider.offsetX;
        else if (body.rigidbody.vx < 0.0f)
            body.transform.x = wb.maxX - body.collider.offsetX;
        else
            continue; // sem movimento horizontal: o passe vertical resolve

        body.rigidbody.vx = 0.0f;
        stats_.collisions++;
    }
}

void PhysicsSystem::resolveVertical(Scene &scene, Entity &body)
{
    gatherStatics(body, candidates_);
    auto &entities = scene.entities();

    for (int idx : candidates_)
    {
        const Entity &wall = entities[idx];
        stats_.pairsTested++;

        AABB ab = BuildAABB(body);
        AABB wb = BuildAABB(wall);
        if (!Intersects(ab, wb))
            continue;

        if (body.rigidbody.vy > 0.0f)
        {
            body.transform.y = wb.minY - body.collider.h - body.collider.offsetY;
            body.rigidbody.vy = 0.0f;
            body.rigidbody.grounded = true;
        }
        else if (body.rigidbody.vy < 0.0f)
        {
            body.transform.y = wb.maxY - body.collider.offsetY;
            body.rigidbody.vy = 0.0f;
        }
        else
        {
            continue;
        }

        stats_.collisions++;
    }
}

void PhysicsSystem::step(Scene &scene, float dtMs)
{
    stats_ = PhysicsStats{};
    buildStaticGrid(scene);

    float dt = dtMs / 1000.0f;

    for (auto &e : scene.entities())
    {
        if (!IsDynamic(e))
            continue;

        RigidBody2D &rb = e.rigidbody;
        rb.grounded = false;

        if (rb.useGravity)
            rb.vy = std::min(rb.vy + settings_.gravity * dt, settings_.maxFallSpeed);

        stats_.bodiesMoved++;

        // um eixo por vez: evita os casos de canto da resolucao combinada
        e.transform.x += rb.vx * dt;
        if (e.collider.enabled && !e.collider.isTrigger)
            resolveHorizontal(scene, e);

        e.transform.y += rb.vy * dt;
        if (e.collider.enabled && !e.collider.isTrigger)
            resolveVertical(scene, e);
    }
}

void PhysicsSystem::debugRender(const Scene &scene, CommandBuffer &cmds) const
{
    for (const auto &e : scene.entities())
    {
        if (!e.collider.enabled)
            continue;

        RenderCommand cmd;
        cmd.type = RenderCommandType::Rect;
        cmd.layer = 100;
        cmd.x = e.transform.x + e.collider.offsetX;
        cmd.y = e.transform.y + e.collider.offsetY;
        cmd.w = (int)e.collider.w;
        cmd.h = (int)e.collider.h;
        cmd.outline = true;
        if (e.rigidbody.grounded)
        {
            cmd.r = 80;
            cmd.g = 220;
            cmd.b = 80;
        }
        else
        {
            cmd.r = 220;
            cmd.g = 80;
            cmd.b = 80;
        }
        cmd.a = 200;
        cmds.submit(cmd);
    }
}

void PhysicsSystem::reset()
{
    grid_.clear();
    candidates_.clear();
    stats_ = PhysicsStats{};
}
