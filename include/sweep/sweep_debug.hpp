#pragma once
#include <cstdint>

struct SweepState;

// --------- counters to show in overlay/log ----------
struct SweepStats {
    uint64_t sweeps = 0;
    uint64_t crossings = 0;      // voxel boundaries crossed
    uint64_t voxelQueries = 0;   // oracle calls
    uint64_t collisions = 0;     // callback invocations
    uint64_t stopped = 0;        // sweeps ended by a hit rather than running out
    double   distance = 0.0;     // sum of returned distances
};

void dbgAccumulateSweep(SweepStats& st, const SweepState& s, double dist);
void dbgResetSweepStats(SweepStats& st);
void dbgLogSweepStats(const SweepStats& st, const char* label = "Sweep");
