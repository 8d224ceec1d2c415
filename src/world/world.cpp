// world.cpp
#include "world/world.hpp"
#include <algorithm>
#include <cstdio>
#include <vector>

void Chunk::fill(int x0, int y0, int z0, int x1, int y1, int z1, BlockID id) {
    x0 = std::max(x0, 0); y0 = std::max(y0, 0); z0 = std::max(z0, 0);
    x1 = std::min(x1, CHUNK_SIZE); y1 = std::min(y1, CHUNK_SIZE); z1 = std::min(z1, CHUNK_SIZE);
    for (int y = y0; y < y1; ++y)
        for (int z = z0; z < z1; ++z)
            for (int x = x0; x < x1; ++x)
                set(x, y, z, id);
}

bool Chunk::empty() const {
    return std::all_of(blocks.begin(), blocks.end(), [](BlockID b) { return b == BLOCK_AIR; });
}

void World::clearAllChunks() {
    map.clear();
}

Chunk* World::createChunk(const WorldKey& k) {
    auto it = map.find(k);
    if (it != map.end()) return it->second.get();
    auto c = std::make_unique<Chunk>();
    Chunk* raw = c.get();
    map.emplace(k, std::move(c));
    return raw;
}

Chunk* World::find(const WorldKey& k) {
    auto it = map.find(k);
    return (it == map.end()) ? nullptr : it->second.get();
}

const Chunk* World::find(const WorldKey& k) const {
    auto it = map.find(k);
    return (it == map.end()) ? nullptr : it->second.get();
}

void World::destroyChunk(const WorldKey& k) {
    map.erase(k);
}

BlockID worldGetBlock(const World& w, int vx, int vy, int vz) {
    const Chunk* c = w.find(worldKeyOf(vx, vy, vz));
    if (!c) return BLOCK_AIR; // not loaded -> treat as empty
    return c->get(floormod_i(vx, CHUNK_SIZE), floormod_i(vy, CHUNK_SIZE), floormod_i(vz, CHUNK_SIZE));
}

bool worldSetBlock(World& w, int vx, int vy, int vz, BlockID id) {
    Chunk* c = w.find(worldKeyOf(vx, vy, vz));
    if (!c) return false;
    c->set(floormod_i(vx, CHUNK_SIZE), floormod_i(vy, CHUNK_SIZE), floormod_i(vz, CHUNK_SIZE), id);
    return true;
}

void worldSetBlockCreate(World& w, int vx, int vy, int vz, BlockID id) {
    Chunk* c = w.createChunk(worldKeyOf(vx, vy, vz));
    c->set(floormod_i(vx, CHUNK_SIZE), floormod_i(vy, CHUNK_SIZE), floormod_i(vz, CHUNK_SIZE), id);
}

int worldFillBox(World& w, int x0, int y0, int z0, int x1, int y1, int z1, BlockID id) {
    if (x1 <= x0 || y1 <= y0 || z1 <= z0) return 0;

    // walk every chunk the box touches and fill its local slice
    const WorldKey lo = worldKeyOf(x0, y0, z0);
    const WorldKey hi = worldKeyOf(x1 - 1, y1 - 1, z1 - 1);
    for (int cy = lo.cy; cy <= hi.cy; ++cy)
        for (int cz = lo.cz; cz <= hi.cz; ++cz)
            for (int cx = lo.cx; cx <= hi.cx; ++cx) {
                Chunk* c = w.createChunk({ cx, cy, cz });
                const int ox = cx * CHUNK_SIZE, oy = cy * CHUNK_SIZE, oz = cz * CHUNK_SIZE;
                c->fill(x0 - ox, y0 - oy, z0 - oz, x1 - ox, y1 - oy, z1 - oz, id);
            }
    return (x1 - x0) * (y1 - y0) * (z1 - z0);
}

VoxelQuery worldVoxelQuery(const World& w) {
    const World* wp = &w;
    return voxelQueryCells([wp](int x, int y, int z) {
        return worldVoxelSolid(*wp, x, y, z);
    });
}

void worldLogSummary(const World& w, const std::string& tag) {
    size_t solid = 0;
    for (auto const& kv : w.map)
        for (BlockID b : kv.second->blocks)
            if (b != BLOCK_AIR) ++solid;
    std::fprintf(stderr, "[%s] chunks=%zu blocks=%zu seed=%u\n", tag.c_str(), w.map.size(), solid, w.seed);
}
