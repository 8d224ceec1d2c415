// world.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include "chunk.hpp"
#include "sweep/sweep.hpp"

struct WorldKey {
    int cx, cy, cz;
    bool operator==(const WorldKey& o) const { return cx == o.cx && cy == o.cy && cz == o.cz; }
};

struct WorldKeyHash {
    size_t operator()(const WorldKey& k) const {
        uint64_t x = (uint32_t)k.cx, y = (uint32_t)k.cy, z = (uint32_t)k.cz;
        return (x * 73856093u) ^ (y * 19349663u) ^ (z * 83492791u);
    }
};

inline WorldKey worldKeyOf(int vx, int vy, int vz) {
    return { floordiv_i(vx, CHUNK_SIZE), floordiv_i(vy, CHUNK_SIZE), floordiv_i(vz, CHUNK_SIZE) };
}

// Sparse voxel world. Anything not loaded reads as air.
struct World {
    std::unordered_map<WorldKey, std::unique_ptr<Chunk>, WorldKeyHash> map;
    uint32_t seed = 1337;

    void         clearAllChunks();
    Chunk*       createChunk(const WorldKey& k);   // make (or get) the chunk
    Chunk*       find(const WorldKey& k);
    const Chunk* find(const WorldKey& k) const;
    void         destroyChunk(const WorldKey& k);
};

BlockID worldGetBlock(const World& w, int vx, int vy, int vz);
// false if the chunk holding (vx,vy,vz) is not loaded
bool    worldSetBlock(World& w, int vx, int vy, int vz, BlockID id);
void    worldSetBlockCreate(World& w, int vx, int vy, int vz, BlockID id);
// fill world-space box [min,max) (creates chunks); returns voxels written
int     worldFillBox(World& w, int x0, int y0, int z0, int x1, int y1, int z1, BlockID id);

// Every block is a full cube except air and water, which never collide
inline bool blockCollides(BlockID id) {
    return id != BLOCK_AIR && id != BLOCK_WATER;
}

inline bool worldVoxelSolid(const World& w, int vx, int vy, int vz) {
    return blockCollides(worldGetBlock(w, vx, vy, vz));
}

// Oracle for sweepAABB, whole cells only. Holds a reference: the world must outlive the query.
VoxelQuery worldVoxelQuery(const World& w);

// one-line summary to stderr
void worldLogSummary(const World& w, const std::string& tag = "World");
