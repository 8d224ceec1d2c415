#include "sweep/sweep_state.hpp"
#include "sweep/sweep_debug.hpp"
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>
#include <utility>

// Raycast along the box's leading corner (fast voxel traversal, Amanatides & Woo) and test
// the whole leading face each time the corner crosses a voxel boundary.

static constexpr double kInf = std::numeric_limits<double>::infinity();

void sweepInit(SweepState& s) {
    s.t = 0.0;
    s.maxT = std::sqrt(s.vec.x * s.vec.x + s.vec.y * s.vec.y + s.vec.z * s.vec.z);
    if (s.maxT == 0.0) return;

    for (int i = 0; i < 3; ++i) {
        const bool pos = s.vec[i] >= 0.0;
        s.step[i] = pos ? 1 : -1;

        s.lead[i] = pos ? s.max[i] : s.base[i];
        s.tr[i] = pos ? s.base[i] : s.max[i];

        s.ldi[i] = leadEdgeToInt(s.lead[i], s.step[i], s.epsilon);
        s.tri[i] = trailEdgeToInt(s.tr[i], s.step[i], s.epsilon);

        s.normed[i] = s.vec[i] / s.maxT;
        s.tDelta[i] = (s.normed[i] == 0.0) ? kInf : std::abs(1.0 / s.normed[i]);

        // leading edge -> next boundary, in units of t
        const double dist = pos ? (s.ldi[i] + 1 - s.lead[i]) : (s.lead[i] - s.ldi[i]);
        s.tNext[i] = (s.tDelta[i] < kInf) ? s.tDelta[i] * dist : kInf;
    }
}

static inline double fract01(double v) { return v - std::floor(v); }

bool sweepLeadingFaceSolid(SweepState& s, int axis, const VoxelQuery& getVoxel) {
    const int sx = s.step.x, sy = s.step.y, sz = s.step.z;
    const int x0 = (axis == 0) ? s.ldi.x : s.tri.x, x1 = s.ldi.x + sx;
    const int y0 = (axis == 1) ? s.ldi.y : s.tri.y, y1 = s.ldi.y + sy;
    const int z0 = (axis == 2) ? s.ldi.z : s.tri.z, z1 = s.ldi.z + sz;

    for (int x = x0; x != x1; x += sx) {
        const double fx = fract01(s.lead.x - x);
        for (int y = y0; y != y1; y += sy) {
            const double fy = fract01(s.lead.y - y);
            for (int z = z0; z != z1; z += sz) {
                ++s.queries;
                if (getVoxel(x, y, z, fx, fy, fract01(s.lead.z - z))) return true;
            }
        }
    }
    return false;
}

bool sweepHandleCollision(SweepState& s, const SweepCallback& onHit) {
    s.cumulativeT += s.t;
    ++s.collisions;
    const int axis = s.axis;
    const int dir = s.step[axis];

    // move up to the hit
    const double done = s.t / s.maxT;
    glm::dvec3 left;
    for (int i = 0; i < 3; ++i) {
        const double dv = s.vec[i] * done;
        s.base[i] += dv;
        s.max[i] += dv;
        left[i] = s.vec[i] - dv;
    }

    // leading edge sits exactly on the boundary, not a hair inside the solid
    if (dir > 0) s.max[axis] = std::round(s.max[axis]);
    else         s.base[axis] = std::round(s.base[axis]);

    const SweepHit hit{ s.cumulativeT, axis, dir };
    const bool stop = onHit(hit, left);
    if (s.trace) {
        std::fprintf(stderr, "[Sweep] hit axis=%d dir=%+d dist=%.6f left=(%.4f, %.4f, %.4f)%s\n",
            axis, dir, s.cumulativeT, left.x, left.y, left.z, stop ? " stop" : "");
    }
    if (stop) {
        s.stoppedByHit = true;
        return true;
    }

    s.vec = left;
    sweepInit(s);
    return s.maxT == 0.0;
}

int sweepStepForward(SweepState& s) {
    // nearest boundary; on ties x wins over y, y over z
    int axis = 0;
    if (s.tNext.y < s.tNext[axis]) axis = 1;
    if (s.tNext.z < s.tNext[axis]) axis = 2;

    const double dt = s.tNext[axis] - s.t;
    s.t = s.tNext[axis];
    s.ldi[axis] += s.step[axis];
    s.tNext[axis] += s.tDelta[axis];
    ++s.crossings;

    for (int i = 0; i < 3; ++i) {
        s.tr[i] += dt * s.normed[i];
        s.tri[i] = trailEdgeToInt(s.tr[i], s.step[i], s.epsilon);
    }
    return axis;
}

// Embedded at the start: probe x, y, z in that order, handle the first hit only.
// Returns true when the sweep is over before it began.
static bool sweepStartingVoxel(SweepState& s, const VoxelQuery& getVoxel, const SweepCallback& onHit) {
    for (int axis = 0; axis < 3; ++axis) {
        if (!sweepLeadingFaceSolid(s, axis, getVoxel)) continue;

        ++s.collisions;
        glm::dvec3 left = s.vec;
        const SweepHit hit{ 0.0, axis, s.step[axis] };
        const bool stop = onHit(hit, left);
        if (s.trace) {
            std::fprintf(stderr, "[Sweep] starting voxel solid, axis=%d dir=%+d%s\n",
                axis, s.step[axis], stop ? " stop" : "");
        }
        if (stop) {
            s.stoppedByHit = true;
            return true;
        }
        if (left != s.vec) {
            s.vec = left;
            sweepInit(s);
            if (s.maxT == 0.0) return true;
        }
        return false;
    }
    return false;
}

double sweepRun(SweepState& s, const VoxelQuery& getVoxel, const SweepCallback& onHit,
    bool checkStartingVoxel)
{
    sweepInit(s);
    if (s.maxT == 0.0) return 0.0;

    if (checkStartingVoxel && sweepStartingVoxel(s, getVoxel, onHit))
        return 0.0;

    s.axis = sweepStepForward(s);
    while (s.t <= s.maxT) {
        if (sweepLeadingFaceSolid(s, s.axis, getVoxel)) {
            if (sweepHandleCollision(s, onHit))
                return s.cumulativeT;
        }
        s.axis = sweepStepForward(s);
    }

    // ran out of vector without a stopping hit
    s.cumulativeT += s.maxT;
    s.base += s.vec;
    s.max += s.vec;
    return s.cumulativeT;
}

double sweepAABB(const VoxelQuery& getVoxel, AABB& box, const glm::dvec3& dir,
    const SweepCallback& onHit, const SweepOptions& opt)
{
    SweepState s;
    s.vec = dir;
    s.base = box.base;
    s.max = box.max;
    s.epsilon = (opt.epsilon > 0.0) ? opt.epsilon : SWEEP_DEFAULT_EPSILON;
    s.trace = opt.trace;

    if (opt.trace) {
        std::string err;
        if (!aabbValid(box, &err)) std::fprintf(stderr, "[Sweep] WARN: %s\n", err.c_str());
    }

    const double dist = sweepRun(s, getVoxel, onHit, opt.checkStartingVoxel);

    if (!opt.noTranslate) {
        // difference on the leading corner, so rounding does not compound
        glm::dvec3 moved;
        for (int i = 0; i < 3; ++i)
            moved[i] = (dir[i] > 0.0) ? (s.max[i] - box.max[i]) : (s.base[i] - box.base[i]);
        box.translate(moved);
    }

    if (opt.stats) dbgAccumulateSweep(*opt.stats, s, dist);
    if (opt.trace) {
        std::fprintf(stderr, "[Sweep] dir=(%.4f, %.4f, %.4f) dist=%.6f crossings=%u queries=%u hits=%u\n",
            dir.x, dir.y, dir.z, dist, s.crossings, s.queries, s.collisions);
    }
    return dist;
}

double sweepAABB(const VoxelQuery& getVoxel, AABB& box, const glm::dvec3& dir,
    const SweepCallback& onHit, bool noTranslate, double epsilon, bool checkStartingVoxel)
{
    SweepOptions opt;
    opt.noTranslate = noTranslate;
    opt.epsilon = epsilon;
    opt.checkStartingVoxel = checkStartingVoxel;
    return sweepAABB(getVoxel, box, dir, onHit, opt);
}

VoxelQuery voxelQueryCells(std::function<bool(int x, int y, int z)> solid) {
    return [solid = std::move(solid)](int x, int y, int z, double, double, double) {
        return solid(x, y, z);
    };
}

SweepCallback sweepStopCallback() {
    return [](const SweepHit&, glm::dvec3&) { return true; };
}

SweepCallback sweepSlideCallback() {
    return [](const SweepHit& hit, glm::dvec3& left) {
        left[hit.axis] = 0.0;
        return false;
    };
}
