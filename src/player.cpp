#include "player.hpp"
#include "sweep/sweep.hpp"
#include <algorithm>
#include <cmath>

AABB Player::box() const {
    const glm::dvec3 he = halfExtents();
    return AABB(glm::dvec3(pos.x - he.x, pos.y, pos.z - he.z),
        glm::dvec3(pos.x + he.x, pos.y + 2.0 * he.y, pos.z + he.z));
}

bool Player::moveAndSlide(const World& w, const glm::vec3& delta) {
    AABB b = box();
    const glm::dvec3 start = b.base;
    bool blocked[3] = { false, false, false };
    bool landed = false;

    SweepOptions opt;
    opt.stats = &stats;
    sweepAABB(worldVoxelQuery(w), b, glm::dvec3(delta),
        [&](const SweepHit& hit, glm::dvec3& left) {
            blocked[hit.axis] = true;
            if (hit.axis == 1 && hit.dir < 0) landed = true;
            left[hit.axis] = 0.0; // slide along the face
            return false;
        }, opt);

    // feet follow the box
    const glm::dvec3 he = halfExtents();
    pos = glm::dvec3(b.base.x + he.x, b.base.y, b.base.z + he.z);

    // zero out velocity on blocked axes
    for (int i = 0; i < 3; ++i)
        if (blocked[i]) vel[i] = 0.0f;
    if (landed) onGround = true;

    return b.base != start;
}

bool Player::probeGround(const World& w) {
    AABB b = box();
    SweepOptions opt;
    opt.noTranslate = true;
    opt.stats = &stats;
    bool hit = false;
    sweepAABB(worldVoxelQuery(w), b, glm::dvec3(0.0, -p.groundProbe, 0.0),
        [&](const SweepHit&, glm::dvec3&) { hit = true; return true; }, opt);
    return hit;
}

void Player::simulate(const World& w, const glm::vec3& wishDir, float dt, bool jump) {
    if (!physicsEnabled) {
        pos += glm::dvec3(vel * dt);
        return;
    }

    // wishDir is a unit vector in XZ plane (camera-relative), y ignored
    glm::vec2 v2 = { vel.x, vel.z };
    glm::vec2 wish = { wishDir.x, wishDir.z };
    float target = onGround ? p.moveSpeed : p.airSpeed;
    float accel = onGround ? p.accel : p.airAccel;

    // accelerate towards target
    if (glm::length(wish) > 0.0f) {
        glm::vec2 wv = glm::normalize(wish) * target;
        glm::vec2 dv = wv - v2;
        float maxStep = accel * dt;
        if (glm::length(dv) > maxStep) dv = glm::normalize(dv) * maxStep;
        v2 += dv;
    }
    else if (onGround) {
        // friction
        float spd = glm::length(v2);
        float drop = p.friction * dt * spd;
        float newSpd = std::max(0.0f, spd - drop);
        if (spd > 0.0f) v2 *= (newSpd / spd);
    }
    vel.x = v2.x; vel.z = v2.y;

    if (jump && onGround) vel.y = p.jumpSpeed;

    // gravity
    vel.y -= p.gravity * dt;
    if (vel.y < -p.maxFall) vel.y = -p.maxFall;

    // integrate with collision
    onGround = false;
    moveAndSlide(w, vel * dt);

    // standing on something even if this step did not hit it
    if (!onGround && vel.y <= 0.0f) onGround = probeGround(w);
    if (onGround && vel.y < 0.0f) vel.y = 0.0f;
}
