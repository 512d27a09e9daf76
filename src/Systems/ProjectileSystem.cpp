#include "ProjectileSystem.h"
#include "../World/Scene.h"
#include <cmath>

static bool Overlaps(const Entity &a, const Entity &b)
{
    float ax = a.transform.x + a.collider.offsetX;
    float ay = a.transform.y + a.collider.offsetY;
    float bx = b.transform.x + b.collider.offsetX;
    float by = b.transform.y + b.collider.offsetY;
    return !(ax + a.collider.w <= bx || ax >= bx + b.collider.w ||
             ay + a.collider.h <= by || ay >= by + b.collider.h);
}

int ProjectileSystem::damageFor(Era era) const
{
    return (int)(settings_.baseDamage * GetEraTuning(era).projectileDamageMultiplier);
}

void ProjectileSystem::queue(const ProjectileSpawn &spawn)
{
    queued_.push_back(spawn);
}

int ProjectileSystem::spawnQueued(Scene &scene)
{
    for (const auto &s : queued_)
    {
        const EraTuning &tuning = GetEraTuning(s.era);

        auto &e = scene.createEntity(EntityKind::Projectile);
        e.era = s.era;
        e.transform.x = s.x - tuning.projectileW * 0.5f;
        e.transform.y = s.y - tuning.projectileH * 0.5f;
        e.transform.prevX = e.transform.x;
        e.transform.prevY = e.transform.y;
        e.rect.w = tuning.projectileW;
        e.rect.h = tuning.projectileH;
        e.rect.r = tuning.color.r;
        e.rect.g = tuning.color.g;
        e.rect.b = tuning.color.b;
        e.collider.enabled = true;
        e.collider.isTrigger = true;
        e.collider.w = (float)tuning.projectileW;
        e.collider.h = (float)tuning.projectileH;
        e.renderLayer = 3;

        float angle = std::atan2(s.targetY - s.y, s.targetX - s.x);
        e.rigidbody.vx = std::cos(angle) * settings_.speed;
        e.rigidbody.vy = std::sin(angle) * settings_.speed;
        // rigidbody desabilitado: o movimento e daqui, nao do PhysicsSystem

        e.projectile.lifetimeMs = settings_.lifetimeMs;
        e.projectile.damage = damageFor(s.era);
        e.projectile.hostile = s.hostile;
    }

    int n = (int)queued_.size();
    queued_.clear();
    return n;
}

ProjectileReport ProjectileSystem::update(Scene &scene, float dtMs, int playerId)
{
    ProjectileReport report;
    float dt = dtMs / 1000.0f;
    auto &entities = scene.entities();

    for (auto &p : entities)
    {
        if (p.kind != EntityKind::Projectile || p.pendingDestroy)
            continue;

        p.transform.x += p.rigidbody.vx * dt;
        p.transform.y += p.rigidbody.vy * dt;

        p.projectile.aliveMs += dtMs;
        if (p.projectile.aliveMs >= p.projectile.lifetimeMs)
        {
            p.pendingDestroy = true;
            continue;
        }

        for (auto &other : entities)
        {
            if (other.pendingDestroy || other.id == p.id)
                continue;

            if (other.kind == EntityKind::Wall)
            {
                if (Overlaps(p, other))
                {
                    p.pendingDestroy = true;
                    break;
                }
            }
            else if (other.kind == EntityKind::Player && p.projectile.hostile)
            {
                if (other.id == playerId && Overlaps(p, other))
                {
                    report.damageToPlayer += p.projectile.damage;
                    p.pendingDestroy = true;
                    break;
                }
            }
            else if (other.kind == EntityKind::Enemy && !p.projectile.hostile)
            {
                if (Overlaps(p, other))
                {
                    other.health.current -= p.projectile.damage;
                    if (other.health.current <= 0)
                    {
                        other.health.current = 0;
                        other.pendingDestroy = true;
                        report.enemiesDefeated++;
                    }
                    p.pendingDestroy = true;
                    break;
                }
            }
        }
    }

    return report;
}
