#pragma once
#include <vector>
#include "Entity.h"

class Scene
{
public:
    struct Bounds
    {
        float x = 0.0f;
        float y = 0.0f;
        float w = 2560.0f;
        float h = 720.0f;
    };

    // Invalida referencias anteriores; nunca chamar enquanto itera entities()
    Entity &createEntity(EntityKind kind);
    Entity *findEntity(int id);
    const Entity *findEntity(int id) const;
    std::vector<Entity> &entities() { return entities_; }
    const std::vector<Entity> &entities() const { return entities_; }

    // Remocao adiada: marca agora, remove em flushDestroyed() entre passos
    bool queueDestroy(int id);
    int flushDestroyed();

    int count(EntityKind kind) const;
    void snapshotPositions();

    Bounds &bounds() { return bounds_; }
    const Bounds &bounds() const { return bounds_; }

    void clear();

private:
    std::vector<Entity> entities_;
    int nextEntityId_ = 1;
    Bounds bounds_{};
};
