#include "sweep/sweep_debug.hpp"
#include "sweep/sweep_state.hpp"
#include <cstdio>

void dbgAccumulateSweep(SweepStats& st, const SweepState& s, double dist) {
    st.sweeps++;
    st.crossings += s.crossings;
    st.voxelQueries += s.queries;
    st.collisions += s.collisions;
    if (s.stoppedByHit) st.stopped++;
    st.distance += dist;
}

void dbgResetSweepStats(SweepStats& st) {
    st = SweepStats{};
}

void dbgLogSweepStats(const SweepStats& st, const char* label) {
    const double perSweep = st.sweeps ? double(st.voxelQueries) / double(st.sweeps) : 0.0;
    std::fprintf(stderr, "[%s] sweeps=%llu crossings=%llu queries=%llu (%.1f/sweep) hits=%llu stopped=%llu dist=%.3f\n",
        label,
        (unsigned long long)st.sweeps, (unsigned long long)st.crossings,
        (unsigned long long)st.voxelQueries, perSweep,
        (unsigned long long)st.collisions, (unsigned long long)st.stopped, st.distance);
}
