#include <gtest/gtest.h>

#include "World/Level.h"

namespace {

TEST(LevelTests, CatalogHasTutorialsThenDemo) {
    std::vector<LevelDef> levels = BuildLevelCatalog();
    ASSERT_EQ(levels.size(), 5u);
    EXPECT_EQ(levels[0].name, "Movement");
    EXPECT_EQ(levels[1].name, "Time Manipulation");
    EXPECT_EQ(levels[2].name, "Era Switching");
    EXPECT_EQ(levels[3].name, "Powers");
    EXPECT_EQ(levels[4].name, "Demo");

    for (std::size_t i = 0; i < 4; ++i)
        EXPECT_FLOAT_EQ(levels[i].exitX, 1180.0f) << levels[i].name;

    const LevelDef &demo = levels.back();
    EXPECT_EQ(demo.requiredEnemiesDefeated, 3);
    EXPECT_TRUE(demo.requireAllCheckpoints);
    EXPECT_EQ(demo.checkpoints.size(), 3u);
}

TEST(LevelTests, PopulateCreatesWallsAndEnemies) {
    std::vector<LevelDef> levels = BuildLevelCatalog();
    Level level(levels[2]);

    Scene scene;
    level.populate(scene);
    EXPECT_EQ(scene.count(EntityKind::Wall), (int)levels[2].walls.size());
    EXPECT_EQ(scene.count(EntityKind::Enemy), 3);
    EXPECT_EQ(scene.count(EntityKind::Player), 0);

    for (const Entity &e : scene.entities())
    {
        if (e.kind != EntityKind::Enemy)
            continue;
        EXPECT_EQ(e.health.current, GetEraTuning(e.era).enemyHealth);
    }
}

TEST(LevelTests, CheckpointsAreReachedInOrder) {
    Level level(BuildLevelCatalog().back());
    EXPECT_EQ(level.checkpointIndex(), -1);

    // o segundo checkpoint nao conta antes do primeiro
    EXPECT_FALSE(level.tryReachCheckpoint(500.0f, 450.0f));
    EXPECT_TRUE(level.tryReachCheckpoint(110.0f, 610.0f));
    EXPECT_EQ(level.checkpointIndex(), 0);
    EXPECT_FALSE(level.tryReachCheckpoint(110.0f, 610.0f));

    EXPECT_FALSE(level.tryReachCheckpoint(500.0f, 450.0f + 49.0f));
    EXPECT_TRUE(level.tryReachCheckpoint(500.0f, 450.0f + 47.0f));
    EXPECT_EQ(level.checkpointsReached(), 2);
}

TEST(LevelTests, SpawnFollowsLastCheckpoint) {
    Level level(BuildLevelCatalog().back());
    EXPECT_FLOAT_EQ(level.spawnPosition().x, 100.0f);
    EXPECT_FLOAT_EQ(level.spawnPosition().y, 600.0f);

    level.tryReachCheckpoint(100.0f, 600.0f);
    level.tryReachCheckpoint(500.0f, 450.0f);
    EXPECT_FLOAT_EQ(level.spawnPosition().x, 500.0f);
    EXPECT_FLOAT_EQ(level.spawnPosition().y, 450.0f);

    level.restart();
    EXPECT_EQ(level.checkpointIndex(), -1);
    EXPECT_EQ(level.enemiesDefeated(), 0);
}

TEST(LevelTests, TutorialCompletesAtExit) {
    Level level(BuildLevelCatalog().front());
    EXPECT_FALSE(level.isCompleted(600.0f));
    EXPECT_TRUE(level.isCompleted(1180.0f));
}

TEST(LevelTests, DemoNeedsKillsAndAllCheckpoints) {
    Level level(BuildLevelCatalog().back());
    level.addEnemiesDefeated(3);
    EXPECT_FALSE(level.isCompleted(0.0f));

    level.tryReachCheckpoint(100.0f, 600.0f);
    level.tryReachCheckpoint(500.0f, 450.0f);
    level.tryReachCheckpoint(900.0f, 250.0f);
    EXPECT_TRUE(level.isCompleted(0.0f));
}

TEST(LevelTests, LevelWithoutRequirementsNeverCompletes) {
    LevelDef def;
    def.name = "Empty";
    Level level(def);
    EXPECT_FALSE(level.isCompleted(5000.0f));
}

TEST(LevelTests, RestoreProgressClampsToCheckpointCount) {
    Level level(BuildLevelCatalog().back());
    level.restoreProgress(10, -4);
    EXPECT_EQ(level.checkpointIndex(), 2);
    EXPECT_EQ(level.enemiesDefeated(), 0);

    level.restoreProgress(-7, 2);
    EXPECT_EQ(level.checkpointIndex(), -1);
    EXPECT_EQ(level.enemiesDefeated(), 2);
}

TEST(LevelTests, MessageExpiresAfterFiveSeconds) {
    Level level(BuildLevelCatalog().front());
    ASSERT_NE(level.activeMessage(), nullptr);

    level.update(4999.0f);
    EXPECT_NE(level.activeMessage(), nullptr);
    level.update(2.0f);
    EXPECT_EQ(level.activeMessage(), nullptr);
}

} // namespace
