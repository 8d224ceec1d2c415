#pragma once
#include <cmath>
#include <cstdint>
#include <glm/glm.hpp>
#include "sweep/sweep.hpp"

// Working data for one sweep call. Lives on the caller's stack, never shared.
struct SweepState {
    // inputs (vec shrinks across sub-sweeps)
    glm::dvec3 vec{ 0.0 };
    glm::dvec3 base{ 0.0 }, max{ 0.0 };
    double     epsilon = SWEEP_DEFAULT_EPSILON;

    // per-axis DDA bookkeeping
    glm::ivec3 step{ 1 };         // +1 / -1
    glm::ivec3 ldi{ 0 };          // voxel holding the leading edge
    glm::ivec3 tri{ 0 };          // voxel holding the trailing edge
    glm::dvec3 lead{ 0.0 };       // leading edge at the start of this sub-sweep
    glm::dvec3 tr{ 0.0 };         // trailing edge, advanced with t
    glm::dvec3 normed{ 0.0 };     // vec / |vec|
    glm::dvec3 tDelta{ 0.0 };     // t per voxel
    glm::dvec3 tNext{ 0.0 };      // t of the next boundary

    double t = 0.0;               // position along this sub-sweep, 0..maxT
    double maxT = 0.0;            // |vec|, 0 means nothing left to do
    double cumulativeT = 0.0;     // distance over all sub-sweeps
    int    axis = 0;              // axis crossed last

    // counters for SweepStats
    uint32_t crossings = 0;
    uint32_t queries = 0;
    uint32_t collisions = 0;
    bool     stoppedByHit = false;   // the callback asked to stop, not just ran out of vector
    bool     trace = false;
};

// Voxel coordinates are int; box edges must stay within the int range (about +-2.1e9 units).
inline int leadEdgeToInt(double coord, int step, double epsilon) {
    return (int)std::floor(coord - step * epsilon);
}
inline int trailEdgeToInt(double coord, int step, double epsilon) {
    return (int)std::floor(coord + step * epsilon);
}

// Derive steps, edge voxels and boundary distances from s.vec. Resets t.
void sweepInit(SweepState& s);

// Any solid voxel on the leading face perpendicular to 'axis'?
bool sweepLeadingFaceSolid(SweepState& s, int axis, const VoxelQuery& getVoxel);

// Move to the hit, snap, ask the callback. Returns true when the sweep is over.
bool sweepHandleCollision(SweepState& s, const SweepCallback& onHit);

// Advance to the nearest boundary; returns the axis crossed.
int sweepStepForward(SweepState& s);

// Whole sweep on an initialized state (vec/base/max/epsilon set). Returns distance.
double sweepRun(SweepState& s, const VoxelQuery& getVoxel, const SweepCallback& onHit,
    bool checkStartingVoxel);
