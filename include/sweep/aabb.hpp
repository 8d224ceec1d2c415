#pragma once
#include <string>
#include <glm/glm.hpp>

// Axis-aligned box, base = min corner, max = max corner (world units)
struct AABB {
    glm::dvec3 base{ 0.0 };
    glm::dvec3 max{ 0.0 };

    AABB() = default;
    AABB(const glm::dvec3& b, const glm::dvec3& m) : base(b), max(m) {}

    void translate(const glm::dvec3& v) { base += v; max += v; }

    // move so that base lands on p, keeping the size
    void setPosition(const glm::dvec3& p) { translate(p - base); }

    glm::dvec3 size() const { return max - base; }
};

// base <= max on every axis; fills err with the first offending axis
bool aabbValid(const AABB& box, std::string* err = nullptr);
