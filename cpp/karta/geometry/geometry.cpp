#include "karta/geometry/geometry.h"
#include "karta/core/util.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace karta {

namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kRotationEpsilon = 1e-6f;

float toRadians(float deg) {
    return deg * kPi / 180.0f;
}

bool isUnrotated(float degrees) {
    const float r = normalizeRotation(degrees);
    return r < kRotationEpsilon || 360.0f - r < kRotationEpsilon;
}

bool pointInAxisRect(const Point2& p, const Rect& r) {
    return p.x >= r.x && p.x <= r.right() && p.y >= r.y && p.y <= r.bottom();
}

HandleType oppositeHandle(HandleType h) {
    switch (h) {
        case HandleType::NW: return HandleType::SE;
        case HandleType::N: return HandleType::S;
        case HandleType::NE: return HandleType::SW;
        case HandleType::E: return HandleType::W;
        case HandleType::SE: return HandleType::NW;
        case HandleType::S: return HandleType::N;
        case HandleType::SW: return HandleType::NE;
        case HandleType::W: return HandleType::E;
        case HandleType::None: return HandleType::None;
    }
    return HandleType::None;
}

// Corners win over edge midpoints when they overlap on small objects.
constexpr HandleType kHitOrder[8] = {
    HandleType::NW, HandleType::NE, HandleType::SE, HandleType::SW,
    HandleType::N, HandleType::E, HandleType::S, HandleType::W,
};

struct ScreenFrame {
    Point2 origin;
    Point2 center;
    float width;
    float height;
};

ScreenFrame toScreenFrame(const Rect& r, const Viewport& vp) {
    ScreenFrame f;
    f.origin = canvasToScreen(vp, r.x, r.y);
    f.width = r.width * vp.zoom;
    f.height = r.height * vp.zoom;
    f.center = Point2{f.origin.x + f.width * 0.5f, f.origin.y + f.height * 0.5f};
    return f;
}

} // namespace

// ==============================================================================
// Primitives
// ==============================================================================

Point2 rotatePoint(Point2 p, Point2 center, float degrees) {
    const float rad = toRadians(degrees);
    const float c = std::cos(rad);
    const float s = std::sin(rad);
    const float dx = p.x - center.x;
    const float dy = p.y - center.y;
    return Point2{center.x + dx * c - dy * s, center.y + dx * s + dy * c};
}

std::array<Point2, 4> rotatedCorners(const Rect& r, float degrees) {
    const Point2 center{r.centerX(), r.centerY()};
    return {
        rotatePoint(Point2{r.x, r.y}, center, degrees),
        rotatePoint(Point2{r.right(), r.y}, center, degrees),
        rotatePoint(Point2{r.right(), r.bottom()}, center, degrees),
        rotatePoint(Point2{r.x, r.bottom()}, center, degrees),
    };
}

Rect getRotatedBoundingBox(const Rect& r, float degrees) {
    if (isUnrotated(degrees)) {
        return r;
    }
    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();
    for (const Point2& p : rotatedCorners(r, degrees)) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    }
    return Rect{minX, minY, maxX - minX, maxY - minY};
}

bool pointInRotatedRect(float px, float py, const Rect& r, float degrees) {
    const Point2 center{r.centerX(), r.centerY()};
    const Point2 local = rotatePoint(Point2{px, py}, center, -degrees);
    const float lx = local.x - r.x;
    const float ly = local.y - r.y;
    return lx >= 0.0f && lx <= r.width && ly >= 0.0f && ly <= r.height;
}

Rect normalizeRect(float x1, float y1, float x2, float y2) {
    return Rect{std::min(x1, x2), std::min(y1, y2), std::abs(x2 - x1), std::abs(y2 - y1)};
}

bool rectsIntersect(const Rect& a, const Rect& b) {
    return aabbIntersects(toAABB(a), toAABB(b));
}

Rect unionBounds(const std::vector<Rect>& rects) {
    if (rects.empty()) {
        return Rect{};
    }
    AABB acc = toAABB(rects.front());
    for (const Rect& r : rects) {
        acc.minX = std::min(acc.minX, r.x);
        acc.minY = std::min(acc.minY, r.y);
        acc.maxX = std::max(acc.maxX, r.right());
        acc.maxY = std::max(acc.maxY, r.bottom());
    }
    return toRect(acc);
}

bool marqueeIntersectsRotatedRect(const Rect& marquee, const Rect& r, float degrees) {
    if (isUnrotated(degrees)) {
        return rectsIntersect(marquee, r);
    }

    for (const Point2& corner : rotatedCorners(r, degrees)) {
        if (pointInAxisRect(corner, marquee)) {
            return true;
        }
    }

    const Point2 marqueeCorners[4] = {
        {marquee.x, marquee.y},
        {marquee.right(), marquee.y},
        {marquee.right(), marquee.bottom()},
        {marquee.x, marquee.bottom()},
    };
    for (const Point2& corner : marqueeCorners) {
        if (pointInRotatedRect(corner.x, corner.y, r, degrees)) {
            return true;
        }
    }

    if (pointInRotatedRect(marquee.centerX(), marquee.centerY(), r, degrees)) {
        return true;
    }

    return rectsIntersect(marquee, getRotatedBoundingBox(r, degrees));
}

// ==============================================================================
// Handles
// ==============================================================================

Point2 handleLocalPosition(HandleType h, float width, float height) {
    switch (h) {
        case HandleType::NW: return Point2{0.0f, 0.0f};
        case HandleType::N: return Point2{width * 0.5f, 0.0f};
        case HandleType::NE: return Point2{width, 0.0f};
        case HandleType::E: return Point2{width, height * 0.5f};
        case HandleType::SE: return Point2{width, height};
        case HandleType::S: return Point2{width * 0.5f, height};
        case HandleType::SW: return Point2{0.0f, height};
        case HandleType::W: return Point2{0.0f, height * 0.5f};
        case HandleType::None: return Point2{width * 0.5f, height * 0.5f};
    }
    return Point2{0.0f, 0.0f};
}

HandleType hitTestHandle(float screenX, float screenY, const Rect& r, float degrees, const Viewport& viewport) {
    const ScreenFrame f = toScreenFrame(r, viewport);
    const Point2 p = rotatePoint(Point2{screenX, screenY}, f.center, -degrees);
    const float lx = p.x - f.origin.x;
    const float ly = p.y - f.origin.y;

    const float radius = constants::kHandleSizePx * 0.5f + constants::kHandleTolerancePx;
    const float radiusSq = radius * radius;
    for (HandleType h : kHitOrder) {
        const Point2 hp = handleLocalPosition(h, f.width, f.height);
        const float dx = lx - hp.x;
        const float dy = ly - hp.y;
        if (dx * dx + dy * dy <= radiusSq) {
            return h;
        }
    }
    return HandleType::None;
}

bool hitTestRotationHandle(float screenX, float screenY, const Rect& r, float degrees, const Viewport& viewport) {
    const ScreenFrame f = toScreenFrame(r, viewport);
    const Point2 p = rotatePoint(Point2{screenX, screenY}, f.center, -degrees);
    const float dx = (p.x - f.origin.x) - f.width * 0.5f;
    const float dy = (p.y - f.origin.y) + constants::kRotationHandleOffsetPx;
    const float radius = constants::kHandleSizePx * 0.5f + constants::kRotationHandleTolerancePx;
    return dx * dx + dy * dy <= radius * radius;
}

// ==============================================================================
// Transform math
// ==============================================================================

Rect computeResize(
    HandleType handle,
    const Rect& start,
    float deltaX,
    float deltaY,
    bool freeResize,
    float degrees,
    float minSize) {

    if (handle == HandleType::None) {
        return start;
    }

    // Read the pointer delta in the object's own frame.
    float dx = deltaX;
    float dy = deltaY;
    if (!isUnrotated(degrees)) {
        const Point2 local = rotatePoint(Point2{deltaX, deltaY}, Point2{0.0f, 0.0f}, -degrees);
        dx = local.x;
        dy = local.y;
    }

    float x = start.x;
    float y = start.y;
    float w = start.width;
    float h = start.height;

    const float aspect = start.height > 0.0f ? start.width / start.height : 1.0f;
    const bool proportional = isCornerHandle(handle) && !freeResize;
    auto keepAspect = [&]() {
        if (!proportional) return;
        if (std::abs(dx) > std::abs(dy)) {
            h = w / aspect;
        } else {
            w = h * aspect;
        }
    };

    switch (handle) {
        case HandleType::NW:
            w = start.width - dx;
            h = start.height - dy;
            keepAspect();
            break;
        case HandleType::N:
            h = start.height - dy;
            break;
        case HandleType::NE:
            w = start.width + dx;
            h = start.height - dy;
            keepAspect();
            break;
        case HandleType::E:
            w = start.width + dx;
            break;
        case HandleType::SE:
            w = start.width + dx;
            h = start.height + dy;
            keepAspect();
            break;
        case HandleType::S:
            h = start.height + dy;
            break;
        case HandleType::SW:
            w = start.width - dx;
            h = start.height + dy;
            keepAspect();
            break;
        case HandleType::W:
            w = start.width - dx;
            break;
        case HandleType::None:
            break;
    }

    w = std::max(w, minSize);
    h = std::max(h, minSize);

    const bool movesLeft = handle == HandleType::NW || handle == HandleType::W || handle == HandleType::SW;
    const bool movesTop = handle == HandleType::NW || handle == HandleType::N || handle == HandleType::NE;
    if (movesLeft) {
        x = start.x + start.width - w;
    }
    if (movesTop) {
        y = start.y + start.height - h;
    }

    if (!isUnrotated(degrees)) {
        // Keep the anchored handle fixed in document space.
        const HandleType anchor = oppositeHandle(handle);
        const Point2 a0 = handleLocalPosition(anchor, start.width, start.height);
        const Point2 a1 = handleLocalPosition(anchor, w, h);
        const Point2 before = rotatePoint(
            Point2{start.x + a0.x, start.y + a0.y}, Point2{start.centerX(), start.centerY()}, degrees);
        const Point2 after = rotatePoint(
            Point2{x + a1.x, y + a1.y}, Point2{x + w * 0.5f, y + h * 0.5f}, degrees);
        x += before.x - after.x;
        y += before.y - after.y;
    }

    return Rect{x, y, w, h};
}

float angleFromCenter(Point2 center, Point2 p) {
    return std::atan2(p.y - center.y, p.x - center.x) * 180.0f / kPi + 90.0f;
}

float computeRotation(float startRotation, float startAngle, float currentAngle, bool snap) {
    float rotation = normalizeRotation(startRotation + (currentAngle - startAngle));
    if (snap) {
        rotation = normalizeRotation(std::round(rotation / constants::kRotationSnapDeg) * constants::kRotationSnapDeg);
    }
    return rotation;
}

Point2 snapAngle(Point2 start, Point2 end, float stepDeg) {
    const float dx = end.x - start.x;
    const float dy = end.y - start.y;
    const float length = std::sqrt(dx * dx + dy * dy);
    if (length == 0.0f || stepDeg <= 0.0f) {
        return end;
    }
    const float step = toRadians(stepDeg);
    const float angle = std::round(std::atan2(dy, dx) / step) * step;
    return Point2{start.x + length * std::cos(angle), start.y + length * std::sin(angle)};
}

} // namespace karta
