#pragma once
#include <vector>
#include "world_config.hpp"

// ----- integer floor-div/mod that work for negatives -----
inline int floordiv_i(int a, int b) {
    int q = a / b, r = a % b;
    return (r && ((r < 0) != (b < 0))) ? (q - 1) : q;
}
inline int floormod_i(int a, int b) {
    int m = a % b;
    if (m < 0) m += (b < 0 ? -b : b);
    return m;
}

struct Chunk {
    std::vector<BlockID> blocks;
    Chunk() : blocks(CHUNK_VOLUME, BLOCK_AIR) {}

    static inline int index(int x, int y, int z) {
        return x + CHUNK_SIZE * (z + CHUNK_SIZE * y);
    }
    inline BlockID get(int x, int y, int z) const {
        return blocks[index(x, y, z)];
    }
    inline void set(int x, int y, int z, BlockID id) {
        blocks[index(x, y, z)] = id;
    }
    // fill a box of local coords [x0,x1) x [y0,y1) x [z0,z1), clipped to the chunk
    void fill(int x0, int y0, int z0, int x1, int y1, int z1, BlockID id);
    bool empty() const;
};
