#include "world/world_gen.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

// --- small deterministic value noise ---
static inline uint32_t wanghash(uint32_t x) {
    x = (x ^ 61u) ^ (x >> 16);
    x *= 9u;
    x = x ^ (x >> 4);
    x *= 0x27d4eb2d;
    x = x ^ (x >> 15);
    return x;
}
static inline float rand01(int x, int z, uint32_t seed) {
    return (wanghash((uint32_t)x * 73856093u ^ (uint32_t)z * 19349663u ^ seed) & 0xFFFFFF) / float(0xFFFFFF);
}
static inline float lerp(float a, float b, float t) { return a + (b - a) * t; }
static inline float smooth(float t) { return t * t * (3.f - 2.f * t); }

// bilinear, smoothed; 0..1
static float valueNoise2D(float x, float z, float freq, uint32_t seed) {
    x *= freq; z *= freq;
    int xi = (int)std::floor(x);
    int zi = (int)std::floor(z);
    float tx = smooth(x - xi);
    float tz = smooth(z - zi);

    float vx0 = lerp(rand01(xi, zi, seed), rand01(xi + 1, zi, seed), tx);
    float vx1 = lerp(rand01(xi, zi + 1, seed), rand01(xi + 1, zi + 1, seed), tx);
    return lerp(vx0, vx1, tz);
}

void generateFlatChunk(Chunk& c, const WorldKey& k, int groundY, BlockID blockId) {
    const int oy = k.cy * CHUNK_SIZE;
    c.fill(0, 0, 0, CHUNK_SIZE, groundY - oy, CHUNK_SIZE, blockId);
}

int terrainHeight(int x, int z, const TerrainParams& p, uint32_t seed) {
    const float n = valueNoise2D((float)x, (float)z, p.freq, seed);
    return p.baseH + (int)std::round(n * (float)std::max(0, p.amp));
}

void generateHeightmapChunk(Chunk& c, const WorldKey& k, const TerrainParams& p, uint32_t seed) {
    const int ox = k.cx * CHUNK_SIZE, oy = k.cy * CHUNK_SIZE, oz = k.cz * CHUNK_SIZE;
    for (int z = 0; z < CHUNK_SIZE; ++z) {
        for (int x = 0; x < CHUNK_SIZE; ++x) {
            const int h = terrainHeight(ox + x, oz + z, p, seed);
            const int top = std::min(h - oy, CHUNK_SIZE - 1);
            for (int y = 0; y <= top; ++y) {
                c.set(x, y, z, (oy + y == h) ? p.topId : p.fillId);
            }
        }
    }
}

int worldGenerateArea(World& w, int centerCx, int centerCz, int radius,
    int cyMin, int cyMax, const TerrainParams& p)
{
    int made = 0;
    for (int cy = cyMin; cy <= cyMax; ++cy)
        for (int dz = -radius; dz <= radius; ++dz)
            for (int dx = -radius; dx <= radius; ++dx) {
                WorldKey k{ centerCx + dx, cy, centerCz + dz };
                if (w.find(k)) continue;
                generateHeightmapChunk(*w.createChunk(k), k, p, w.seed);
                ++made;
            }
    if (made) std::printf("[Gen] center=(%d,%d) radius=%d created=%d loaded=%zu\n",
        centerCx, centerCz, radius, made, w.map.size());
    return made;
}
