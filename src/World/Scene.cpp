#include "Scene.h"
#include <algorithm>

Entity &Scene::createEntity(EntityKind kind)
{
    Entity e;
    e.id = nextEntityId_++;
    e.kind = kind;
    entities_.push_back(e);
    return entities_.back();
}

Entity *Scene::findEntity(int id)
{
    for (auto &e : entities_)
    {
        if (e.id == id)
            return &e;
    }
    return nullptr;
}

const Entity *Scene::findEntity(int id) const
{
    for (const auto &e : entities_)
    {
        if (e.id == id)
            return &e;
    }
    return nullptr;
}

bool Scene::queueDestroy(int id)
{
    Entity *e = findEntity(id);
    if (!e || e->pendingDestroy)
        return false;
    e->pendingDestroy = true;
    return true;
}

int Scene::flushDestroyed()
{
    auto first = std::remove_if(entities_.begin(), entities_.end(),
                                [](const Entity &e)
                                { return e.pendingDestroy; });
    int removed = (int)std::distance(first, entities_.end());
    entities_.erase(first, entities_.end());
    return removed;
}

int Scene::count(EntityKind kind) const
{
    int n = 0;
    for (const auto &e : entities_)
    {
        if (e.kind == kind && !e.pendingDestroy)
            n++;
    }
    return n;
}

void Scene::snapshotPositions()
{
    for (auto &e : entities_)
    {
        e.transform.prevX = e.transform.x;
        e.transform.prevY = e.transform.y;
    }
}

void Scene::clear()
{
    entities_.clear();
    nextEntityId_ = 1;
    bounds_ = Bounds{};
}
