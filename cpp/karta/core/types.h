#ifndef KARTA_CORE_TYPES_H
#define KARTA_CORE_TYPES_H

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace karta {

using ObjectId = std::string;

struct Point2 {
    float x;
    float y;
};

inline bool operator==(const Point2& a, const Point2& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point2& a, const Point2& b) {
    return !(a == b);
}

// Top-left origin rectangle in document units.
struct Rect {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};

    float right() const { return x + width; }
    float bottom() const { return y + height; }
    float centerX() const { return x + width * 0.5f; }
    float centerY() const { return y + height * 0.5f; }
};

struct AABB {
    float minX, minY, maxX, maxY;
};

inline AABB toAABB(const Rect& r) {
    return AABB{r.x, r.y, r.x + r.width, r.y + r.height};
}

inline Rect toRect(const AABB& a) {
    return Rect{a.minX, a.minY, a.maxX - a.minX, a.maxY - a.minY};
}

// Inclusive overlap: touching edges count as intersecting.
inline bool aabbIntersects(const AABB& a, const AABB& b) {
    return a.minX <= b.maxX && a.maxX >= b.minX && a.minY <= b.maxY && a.maxY >= b.minY;
}

inline bool aabbContains(const AABB& outer, const AABB& inner) {
    return inner.minX >= outer.minX && inner.maxX <= outer.maxX &&
           inner.minY >= outer.minY && inner.maxY <= outer.maxY;
}

enum class KartaError : std::uint8_t {
    Ok = 0,
    MergeInProgress = 1,
    UnknownObject = 2,
    InvalidObject = 3,
    EmptyOperation = 4,
    InvalidGesture = 5,
};

} // namespace karta

#endif // KARTA_CORE_TYPES_H
