#pragma once

#include "karta/core/constants.h"
#include "karta/core/types.h"
#include "karta/geometry/viewport.h"

#include <array>
#include <cstdint>
#include <vector>

namespace karta {

enum class HandleType : std::uint8_t {
    None = 0,
    NW,
    N,
    NE,
    E,
    SE,
    S,
    SW,
    W
};

constexpr std::array<HandleType, 8> kResizeHandles = {
    HandleType::NW, HandleType::N, HandleType::NE, HandleType::E,
    HandleType::SE, HandleType::S, HandleType::SW, HandleType::W,
};

inline bool isCornerHandle(HandleType h) {
    return h == HandleType::NW || h == HandleType::NE || h == HandleType::SE || h == HandleType::SW;
}

// ==============================================================================
// Rotation-aware primitives. Rotation is in degrees, clockwise in screen space,
// about the rectangle centre.
// ==============================================================================

Point2 rotatePoint(Point2 p, Point2 center, float degrees);
std::array<Point2, 4> rotatedCorners(const Rect& r, float degrees);
Rect getRotatedBoundingBox(const Rect& r, float degrees);

// Inverse-rotate the point into the rectangle's frame, then test [0,w]x[0,h].
bool pointInRotatedRect(float px, float py, const Rect& r, float degrees);

Rect normalizeRect(float x1, float y1, float x2, float y2);
bool rectsIntersect(const Rect& a, const Rect& b);
Rect unionBounds(const std::vector<Rect>& rects);

// Union of four tests, so containment either way is caught for rotated objects.
bool marqueeIntersectsRotatedRect(const Rect& marquee, const Rect& r, float degrees);

// ==============================================================================
// Handles
// ==============================================================================

// Position of a handle in the rectangle's unrotated frame, relative to its origin.
Point2 handleLocalPosition(HandleType h, float width, float height);

HandleType hitTestHandle(float screenX, float screenY, const Rect& r, float degrees, const Viewport& viewport);
bool hitTestRotationHandle(float screenX, float screenY, const Rect& r, float degrees, const Viewport& viewport);

// ==============================================================================
// Transform math
// ==============================================================================

// Corner handles keep the start aspect ratio unless `freeResize`; edge handles
// change one dimension. Results below `minSize` are clamped with the opposite
// edge held in place. For rotated rectangles the delta is read in the local
// frame and the anchored point stays fixed in document space.
Rect computeResize(
    HandleType handle,
    const Rect& start,
    float deltaX,
    float deltaY,
    bool freeResize,
    float degrees = 0.0f,
    float minSize = constants::kMinObjectSize);

// Angle of `p` around `center` in degrees, offset so a point straight above reads 0.
float angleFromCenter(Point2 center, Point2 p);

float computeRotation(float startRotation, float startAngle, float currentAngle, bool snap);

// Constrain the vector start->end to the nearest multiple of `stepDeg`, keeping its length.
Point2 snapAngle(Point2 start, Point2 end, float stepDeg);

} // namespace karta
