#pragma once
#include <functional>
#include <glm/glm.hpp>
#include "sweep/aabb.hpp"
#include "sweep/sweep_config.hpp"

// What the callback learns about a collision
struct SweepHit {
    double distance = 0.0; // cumulative distance moved so far in this sweep
    int    axis = 0;       // 0=x 1=y 2=z
    int    dir = 1;        // direction of travel on that axis (+1/-1)
};

// Solid test for voxel (x,y,z). dx/dy/dz: where the box's leading edge sits inside
// that voxel on each axis, in [0,1]. Called at most once per voxel per boundary crossing.
using VoxelQuery = std::function<bool(int x, int y, int z, double dx, double dy, double dz)>;

// Called on every collision. Return true to stop; false to keep sweeping with
// whatever is left in 'left' (zero an axis to slide, flip it to bounce).
using SweepCallback = std::function<bool(const SweepHit& hit, glm::dvec3& left)>;

// Adapter for oracles that only care about whole voxels
VoxelQuery voxelQueryCells(std::function<bool(int x, int y, int z)> solid);

SweepCallback sweepStopCallback();
SweepCallback sweepSlideCallback();

// Sweep 'box' along 'dir' through the voxel grid, calling 'onHit' on each collision.
// Translates the box to where it ended up (unless opt.noTranslate) and returns the
// total distance moved, which is the sum of the sub-sweeps, not |end - start|.
double sweepAABB(const VoxelQuery& getVoxel, AABB& box, const glm::dvec3& dir,
    const SweepCallback& onHit, const SweepOptions& opt = {});

double sweepAABB(const VoxelQuery& getVoxel, AABB& box, const glm::dvec3& dir,
    const SweepCallback& onHit, bool noTranslate,
    double epsilon = SWEEP_DEFAULT_EPSILON, bool checkStartingVoxel = false);
