#pragma once
#include <cstdint>

// one voxel = one world unit; the sweep works on the unit grid directly
constexpr int CHUNK_SIZE = 32;
constexpr int CHUNK_VOLUME = CHUNK_SIZE * CHUNK_SIZE * CHUNK_SIZE;

// Block IDs (extend as you grow)
using BlockID = uint16_t;
static constexpr BlockID BLOCK_AIR = 0;
static constexpr BlockID BLOCK_DIRT = 1;
static constexpr BlockID BLOCK_GRASS = 2;
static constexpr BlockID BLOCK_STONE = 3;
static constexpr BlockID BLOCK_SAND = 4;
static constexpr BlockID BLOCK_WATER = 6;  // never collides
