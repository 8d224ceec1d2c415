#pragma once

struct SweepStats;

// Floor bias applied at voxel boundaries (world units)
constexpr double SWEEP_DEFAULT_EPSILON = 1e-10;

// Per-call switches. Defaults match a plain "move and collide" sweep.
struct SweepOptions {
    bool   noTranslate = false;          // leave the caller's box where it is
    double epsilon = SWEEP_DEFAULT_EPSILON;
    bool   checkStartingVoxel = false;   // report a box that starts embedded (distance 0)
    bool   trace = false;                // log each hit to stderr
    SweepStats* stats = nullptr;         // optional, owned by the caller
};
