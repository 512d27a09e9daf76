#include <gtest/gtest.h>

#include "World/Scene.h"

namespace {

TEST(SceneTests, CreatedEntitiesGetUniqueIdsAndKinds) {
    Scene scene;
    int a = scene.createEntity(EntityKind::Wall).id;
    int b = scene.createEntity(EntityKind::Enemy).id;
    EXPECT_NE(a, b);
    ASSERT_NE(scene.findEntity(b), nullptr);
    EXPECT_EQ(scene.findEntity(b)->kind, EntityKind::Enemy);
    EXPECT_EQ(scene.findEntity(999), nullptr);
}

TEST(SceneTests, DestructionIsDeferredUntilFlush) {
    Scene scene;
    int wall = scene.createEntity(EntityKind::Wall).id;
    int enemy = scene.createEntity(EntityKind::Enemy).id;
    scene.createEntity(EntityKind::Enemy);

    ASSERT_TRUE(scene.queueDestroy(enemy));
    EXPECT_FALSE(scene.queueDestroy(enemy));

    // ainda presente, so marcado
    ASSERT_EQ(scene.entities().size(), 3u);
    EXPECT_TRUE(scene.findEntity(enemy)->pendingDestroy);
    EXPECT_EQ(scene.count(EntityKind::Enemy), 1);

    EXPECT_EQ(scene.flushDestroyed(), 1);
    EXPECT_EQ(scene.entities().size(), 2u);
    EXPECT_EQ(scene.findEntity(enemy), nullptr);
    EXPECT_NE(scene.findEntity(wall), nullptr);
}

TEST(SceneTests, MarkingDuringIterationKeepsIterationValid) {
    Scene scene;
    for (int i = 0; i < 10; ++i)
        scene.createEntity(i % 2 ? EntityKind::Enemy : EntityKind::Projectile);

    int visited = 0;
    for (auto &e : scene.entities()) {
        ++visited;
        if (e.kind == EntityKind::Projectile)
            scene.queueDestroy(e.id);
    }
    EXPECT_EQ(visited, 10);
    EXPECT_EQ(scene.flushDestroyed(), 5);
    EXPECT_EQ(scene.count(EntityKind::Projectile), 0);
    EXPECT_EQ(scene.count(EntityKind::Enemy), 5);
}

TEST(SceneTests, SnapshotCopiesCurrentIntoPrevious) {
    Scene scene;
    Entity &e = scene.createEntity(EntityKind::Player);
    e.transform.x = 42.0f;
    e.transform.y = -3.0f;
    scene.snapshotPositions();
    EXPECT_FLOAT_EQ(e.transform.prevX, 42.0f);
    EXPECT_FLOAT_EQ(e.transform.prevY, -3.0f);
}

TEST(SceneTests, ClearResetsIdsAndBounds) {
    Scene scene;
    scene.createEntity(EntityKind::Wall);
    scene.bounds().w = 10.0f;
    scene.clear();
    EXPECT_TRUE(scene.entities().empty());
    EXPECT_EQ(scene.createEntity(EntityKind::Wall).id, 1);
    EXPECT_FLOAT_EQ(scene.bounds().w, Scene::Bounds{}.w);
}

} // namespace
