#include <gtest/gtest.h>
#include "player.hpp"
#include "world/world_gen.hpp"

namespace {

constexpr float DT = 1.0f / 60.0f;

// stone floor whose top face is at y = 4
World flatWorld() {
    World w;
    worldFillBox(w, -16, 0, -16, 16, 4, 16, BLOCK_STONE);
    return w;
}

void run(Player& pl, const World& w, const glm::vec3& wish, int frames) {
    for (int i = 0; i < frames; ++i) pl.simulate(w, wish, DT);
}

} // namespace

TEST(Player, BoxSurroundsFeet) {
    Player pl;
    pl.pos = glm::dvec3(1.0, 2.0, 3.0);
    const AABB b = pl.box();

    EXPECT_NEAR(b.base.x, 1.0 - pl.p.radius, 1e-6);
    EXPECT_EQ(b.base.y, 2.0);
    EXPECT_NEAR(b.max.y, 2.0 + pl.p.height, 1e-6);
    EXPECT_NEAR(b.max.z, 3.0 + pl.p.radius, 1e-6);
}

TEST(Player, FallsAndLandsOnFloor) {
    World w = flatWorld();
    Player pl;
    pl.pos = glm::dvec3(0.0, 10.0, 0.0);

    run(pl, w, glm::vec3(0.0f), 120);

    EXPECT_TRUE(pl.onGround);
    EXPECT_EQ(pl.pos.y, 4.0);
    EXPECT_EQ(pl.vel.y, 0.0f);
    EXPECT_EQ(pl.pos.x, 0.0);
    EXPECT_EQ(pl.pos.z, 0.0);
}

TEST(Player, LandsOnThinPlatformFromAnyHeight) {
    World w;
    worldFillBox(w, -2, 5, -2, 2, 6, 2, BLOCK_STONE);

    for (double y : { 9.3, 9.7, 12.05, 12.95 }) {
        Player pl;
        pl.pos = glm::dvec3(0.0, y, 0.0);
        run(pl, w, glm::vec3(0.0f), 120);

        EXPECT_TRUE(pl.onGround) << "start " << y;
        EXPECT_EQ(pl.pos.y, 6.0) << "start " << y;
    }
}

TEST(Player, WalkStopsAtWall) {
    World w = flatWorld();
    worldFillBox(w, 5, 4, -16, 7, 10, 16, BLOCK_STONE);
    Player pl;
    pl.pos = glm::dvec3(0.0, 4.0, 0.0);

    run(pl, w, glm::vec3(1.0f, 0.0f, 0.0f), 180);

    EXPECT_NEAR(pl.pos.x + pl.p.radius, 5.0, 1e-6);
    EXPECT_EQ(pl.pos.y, 4.0);
    EXPECT_EQ(pl.vel.x, 0.0f);
    EXPECT_TRUE(pl.onGround);

    // pushing for longer never gets it further in
    run(pl, w, glm::vec3(1.0f, 0.0f, 0.0f), 60);
    EXPECT_LE(pl.box().max.x, 5.0 + 1e-9);
}

TEST(Player, SlidesAlongWallDiagonally) {
    World w = flatWorld();
    worldFillBox(w, 5, 4, -16, 7, 10, 16, BLOCK_STONE);
    Player pl;
    pl.pos = glm::dvec3(4.0, 4.0, 0.0);

    run(pl, w, glm::normalize(glm::vec3(1.0f, 0.0f, 1.0f)), 30);

    EXPECT_NEAR(pl.pos.x + pl.p.radius, 5.0, 1e-6);
    EXPECT_GT(pl.pos.z, 0.5);
}

TEST(Player, JumpsAndLandsAgain) {
    World w = flatWorld();
    Player pl;
    pl.pos = glm::dvec3(0.0, 4.0, 0.0);
    run(pl, w, glm::vec3(0.0f), 5);
    ASSERT_TRUE(pl.onGround);

    pl.simulate(w, glm::vec3(0.0f), DT, true);
    EXPECT_FALSE(pl.onGround);
    EXPECT_GT(pl.vel.y, 0.0f);

    run(pl, w, glm::vec3(0.0f), 10);
    EXPECT_GT(pl.pos.y, 4.5);

    run(pl, w, glm::vec3(0.0f), 120);
    EXPECT_TRUE(pl.onGround);
    EXPECT_EQ(pl.pos.y, 4.0);
}

TEST(Player, JumpIgnoredInAir) {
    World w = flatWorld();
    Player pl;
    pl.pos = glm::dvec3(0.0, 20.0, 0.0);

    pl.simulate(w, glm::vec3(0.0f), DT, true);

    EXPECT_LT(pl.vel.y, 0.0f);
}

TEST(Player, CeilingStopsJump) {
    World w = flatWorld();
    worldFillBox(w, -16, 7, -16, 16, 8, 16, BLOCK_STONE);
    Player pl;
    pl.pos = glm::dvec3(0.0, 4.0, 0.0);
    run(pl, w, glm::vec3(0.0f), 2);

    pl.simulate(w, glm::vec3(0.0f), DT, true);
    run(pl, w, glm::vec3(0.0f), 20);

    EXPECT_LE(pl.box().max.y, 7.0 + 1e-9);
    run(pl, w, glm::vec3(0.0f), 120);
    EXPECT_EQ(pl.pos.y, 4.0);
}

TEST(Player, StandsOnGeneratedTerrain) {
    World w;
    TerrainParams tp;
    worldGenerateArea(w, 0, 0, 0, 0, 0, tp);
    const int h = terrainHeight(10, 10, tp, w.seed);

    Player pl;
    pl.pos = glm::dvec3(10.5, 30.0, 10.5);
    run(pl, w, glm::vec3(0.0f), 180);

    EXPECT_TRUE(pl.onGround);
    EXPECT_EQ(pl.pos.y, double(h + 1));
}

TEST(Player, ProbeGroundOnlyNearFloor) {
    World w = flatWorld();
    Player pl;

    pl.pos = glm::dvec3(0.0, 4.0, 0.0);
    EXPECT_TRUE(pl.probeGround(w));
    pl.pos = glm::dvec3(0.0, 4.03, 0.0);
    EXPECT_TRUE(pl.probeGround(w));
    pl.pos = glm::dvec3(0.0, 4.2, 0.0);
    EXPECT_FALSE(pl.probeGround(w));

    // the probe never moves the player
    EXPECT_EQ(pl.pos.y, 4.2);
}

TEST(Player, MoveAndSlideReportsMovement) {
    World w = flatWorld();
    Player pl;
    pl.pos = glm::dvec3(0.0, 4.0, 0.0);

    EXPECT_FALSE(pl.moveAndSlide(w, glm::vec3(0.0f, -1.0f, 0.0f)));
    EXPECT_TRUE(pl.onGround);
    EXPECT_TRUE(pl.moveAndSlide(w, glm::vec3(0.5f, 0.0f, 0.0f)));
    EXPECT_NEAR(pl.pos.x, 0.5, 1e-6);
}

TEST(Player, NoclipIgnoresWorld) {
    World w = flatWorld();
    Player pl;
    pl.physicsEnabled = false;
    pl.pos = glm::dvec3(0.0, 2.0, 0.0);
    pl.vel = glm::vec3(0.0f, -2.0f, 0.0f);

    pl.simulate(w, glm::vec3(1.0f, 0.0f, 0.0f), 0.5f);

    EXPECT_NEAR(pl.pos.y, 1.0, 1e-6);
    EXPECT_EQ(pl.pos.x, 0.0);
    EXPECT_EQ(pl.stats.sweeps, 0u);
}

TEST(Player, CountsSweepWork) {
    World w = flatWorld();
    Player pl;
    pl.pos = glm::dvec3(0.0, 6.0, 0.0);

    run(pl, w, glm::vec3(0.0f), 60);

    EXPECT_GE(pl.stats.sweeps, 60u);
    EXPECT_GT(pl.stats.collisions, 0u);
    EXPECT_GT(pl.stats.voxelQueries, 0u);

    dbgResetSweepStats(pl.stats);
    EXPECT_EQ(pl.stats.sweeps, 0u);
}
