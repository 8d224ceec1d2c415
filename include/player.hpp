#pragma once
#include <glm/glm.hpp>
#include "sweep/aabb.hpp"
#include "sweep/sweep_debug.hpp"
#include "world/world.hpp"

// --- Tunables (world units = voxels) ---
struct PlayerParams {
    float radius = 0.3f;
    float height = 1.8f;
    float gravity = 28.0f;
    float maxFall = 60.0f;
    float moveSpeed = 4.3f;           // target ground speed
    float airSpeed = 2.0f;            // target air speed
    float accel = 40.0f;              // ground accel
    float airAccel = 8.0f;            // air accel
    float friction = 10.0f;           // ground friction
    float jumpSpeed = 8.5f;
    float groundProbe = 0.05f;        // how far below the feet counts as standing
};

// Simple AABB character
struct Player {
    glm::dvec3 pos{ 0.0, 40.0, 0.0 };     // feet position (center of the bottom face), kept on the sweep's grid
    glm::vec3 vel{ 0.0f };
    bool onGround = false;
    bool physicsEnabled = true;

    PlayerParams p;
    SweepStats stats;                     // collision work done by this player

    // Axis-aligned half extents for AABB
    glm::dvec3 halfExtents() const { return { p.radius, p.height * 0.5, p.radius }; }
    AABB box() const;

    // Move by delta, sliding along whatever is hit. Returns true if the player moved.
    bool moveAndSlide(const World& w, const glm::vec3& delta);
    // Step simulation by dt with a desired horizontal wishDir; jump is honored on ground
    void simulate(const World& w, const glm::vec3& wishDir, float dt, bool jump = false);
    bool probeGround(const World& w);
};
