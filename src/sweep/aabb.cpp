#include "sweep/aabb.hpp"
#include <cstdio>

bool aabbValid(const AABB& box, std::string* err) {
    for (int i = 0; i < 3; ++i) {
        if (box.base[i] <= box.max[i]) continue;
        if (err) {
            char buf[96];
            std::snprintf(buf, sizeof(buf), "inverted box on axis %d (base=%g > max=%g)",
                i, box.base[i], box.max[i]);
            *err = buf;
        }
        return false;
    }
    return true;
}
