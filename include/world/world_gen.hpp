#pragma once
#include <cstdint>
#include "chunk.hpp"
#include "world.hpp"

// Heightmap terrain, in voxels
struct TerrainParams {
    int      baseH = 12;          // base ground height
    int      amp = 6;             // noise amplitude
    float    freq = 0.07f;        // noise frequency
    BlockID  topId = BLOCK_GRASS;
    BlockID  fillId = BLOCK_DIRT;
};

// Solid everywhere below world height groundY
void generateFlatChunk(Chunk& c, const WorldKey& k, int groundY, BlockID blockId = BLOCK_STONE);

// Y of the topmost solid voxel of column (x,z); everything at or below it is solid
int  terrainHeight(int x, int z, const TerrainParams& p, uint32_t seed);

void generateHeightmapChunk(Chunk& c, const WorldKey& k, const TerrainParams& p, uint32_t seed);

// Generate every missing chunk in the square (radius in chunks) around (centerCx, centerCz)
// for cy in [cyMin, cyMax]. Returns the number of chunks created.
int  worldGenerateArea(World& w, int centerCx, int centerCz, int radius,
    int cyMin, int cyMax, const TerrainParams& p = {});
