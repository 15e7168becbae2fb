#include <gtest/gtest.h>
#include <cmath>
#include "karta/geometry/geometry.h"
#include "karta/geometry/viewport.h"

using namespace karta;

// =============================================================================
// Rotation-aware hit testing
// =============================================================================

TEST(GeometryTest, PointInRotatedRect) {
    const Rect r{0.0f, 0.0f, 100.0f, 20.0f};
    EXPECT_TRUE(pointInRotatedRect(90.0f, 10.0f, r, 0.0f));
    // Rotated 90 degrees the long side stands upright around (50, 10).
    EXPECT_FALSE(pointInRotatedRect(90.0f, 10.0f, r, 90.0f));
    EXPECT_TRUE(pointInRotatedRect(50.0f, 50.0f, r, 90.0f));
    EXPECT_TRUE(pointInRotatedRect(50.0f, -30.0f, r, 90.0f));
}

TEST(GeometryTest, RotatedBoundingBox) {
    const Rect r{0.0f, 0.0f, 100.0f, 20.0f};
    const Rect b = getRotatedBoundingBox(r, 90.0f);
    EXPECT_NEAR(b.x, 40.0f, 1e-3f);
    EXPECT_NEAR(b.y, -40.0f, 1e-3f);
    EXPECT_NEAR(b.width, 20.0f, 1e-3f);
    EXPECT_NEAR(b.height, 100.0f, 1e-3f);

    const Rect same = getRotatedBoundingBox(r, 360.0f);
    EXPECT_FLOAT_EQ(same.width, 100.0f);
}

TEST(GeometryTest, MarqueeAgainstRotatedRect) {
    const Rect r{0.0f, 0.0f, 100.0f, 20.0f};
    // Marquee fully inside the rotated shape.
    EXPECT_TRUE(marqueeIntersectsRotatedRect(Rect{48.0f, 0.0f, 4.0f, 4.0f}, r, 90.0f));
    // Marquee containing the shape.
    EXPECT_TRUE(marqueeIntersectsRotatedRect(Rect{-100.0f, -100.0f, 300.0f, 300.0f}, r, 45.0f));
    // Outside the unrotated rect, inside its rotated footprint.
    EXPECT_TRUE(marqueeIntersectsRotatedRect(Rect{45.0f, -35.0f, 5.0f, 5.0f}, r, 90.0f));
    EXPECT_FALSE(marqueeIntersectsRotatedRect(Rect{200.0f, 200.0f, 5.0f, 5.0f}, r, 30.0f));
}

TEST(GeometryTest, NormalizeRectAcceptsAnyCornerOrder) {
    const Rect r = normalizeRect(10.0f, 20.0f, 0.0f, 5.0f);
    EXPECT_FLOAT_EQ(r.x, 0.0f);
    EXPECT_FLOAT_EQ(r.y, 5.0f);
    EXPECT_FLOAT_EQ(r.width, 10.0f);
    EXPECT_FLOAT_EQ(r.height, 15.0f);
}

// =============================================================================
// Handles
// =============================================================================

TEST(GeometryTest, HandleHitTestFollowsZoom) {
    const Rect r{10.0f, 10.0f, 100.0f, 50.0f};
    const Viewport vp{0.0f, 0.0f, 2.0f};
    EXPECT_EQ(hitTestHandle(20.0f, 20.0f, r, 0.0f, vp), HandleType::NW);
    EXPECT_EQ(hitTestHandle(220.0f, 120.0f, r, 0.0f, vp), HandleType::SE);
    EXPECT_EQ(hitTestHandle(120.0f, 20.0f, r, 0.0f, vp), HandleType::N);
    EXPECT_EQ(hitTestHandle(120.0f, 70.0f, r, 0.0f, vp), HandleType::None);
}

TEST(GeometryTest, RotationHandleSitsAboveTopEdge) {
    const Rect r{0.0f, 0.0f, 100.0f, 50.0f};
    const Viewport vp;
    EXPECT_TRUE(hitTestRotationHandle(50.0f, -constants::kRotationHandleOffsetPx, r, 0.0f, vp));
    EXPECT_FALSE(hitTestRotationHandle(50.0f, 10.0f, r, 0.0f, vp));
}

// =============================================================================
// Transform math
// =============================================================================

TEST(GeometryTest, CornerResizeKeepsAspectUnlessFree) {
    const Rect start{0.0f, 0.0f, 100.0f, 50.0f};
    const Rect locked = computeResize(HandleType::SE, start, 100.0f, 10.0f, false);
    EXPECT_FLOAT_EQ(locked.width, 200.0f);
    EXPECT_FLOAT_EQ(locked.height, 100.0f);

    const Rect free = computeResize(HandleType::SE, start, 100.0f, 10.0f, true);
    EXPECT_FLOAT_EQ(free.width, 200.0f);
    EXPECT_FLOAT_EQ(free.height, 60.0f);
}

TEST(GeometryTest, EdgeResizeChangesOneDimension) {
    const Rect start{0.0f, 0.0f, 100.0f, 50.0f};
    const Rect r = computeResize(HandleType::W, start, 30.0f, 99.0f, false);
    EXPECT_FLOAT_EQ(r.x, 30.0f);
    EXPECT_FLOAT_EQ(r.width, 70.0f);
    EXPECT_FLOAT_EQ(r.height, 50.0f);
}

TEST(GeometryTest, ResizeFloorKeepsOppositeEdge) {
    const Rect start{0.0f, 0.0f, 100.0f, 50.0f};
    const Rect r = computeResize(HandleType::NW, start, 500.0f, 500.0f, true);
    EXPECT_FLOAT_EQ(r.width, constants::kMinObjectSize);
    EXPECT_FLOAT_EQ(r.height, constants::kMinObjectSize);
    EXPECT_FLOAT_EQ(r.right(), 100.0f);
    EXPECT_FLOAT_EQ(r.bottom(), 50.0f);
}

TEST(GeometryTest, RotatedResizeKeepsAnchorFixed) {
    const Rect start{0.0f, 0.0f, 100.0f, 50.0f};
    const float deg = 30.0f;
    const Point2 anchorBefore = rotatedCorners(start, deg)[0];

    // Drag along the local x axis of the rotated rect.
    const Point2 d = rotatePoint(Point2{40.0f, 0.0f}, Point2{0.0f, 0.0f}, deg);
    const Rect r = computeResize(HandleType::E, start, d.x, d.y, false, deg);
    EXPECT_NEAR(r.width, 140.0f, 1e-3f);
    EXPECT_NEAR(r.height, 50.0f, 1e-3f);

    const Point2 anchorAfter = rotatedCorners(r, deg)[0];
    EXPECT_NEAR(anchorAfter.x, anchorBefore.x, 1e-3f);
    EXPECT_NEAR(anchorAfter.y, anchorBefore.y, 1e-3f);
}

TEST(GeometryTest, RotationAnglesAndSnapping) {
    const Point2 c{0.0f, 0.0f};
    EXPECT_NEAR(angleFromCenter(c, Point2{0.0f, -10.0f}), 0.0f, 1e-4f);
    EXPECT_NEAR(angleFromCenter(c, Point2{10.0f, 0.0f}), 90.0f, 1e-4f);

    EXPECT_NEAR(computeRotation(10.0f, 0.0f, 27.0f, false), 37.0f, 1e-4f);
    EXPECT_NEAR(computeRotation(10.0f, 0.0f, 27.0f, true), 30.0f, 1e-4f);
    EXPECT_NEAR(computeRotation(350.0f, 0.0f, 20.0f, false), 10.0f, 1e-4f);
}

TEST(GeometryTest, SnapAngleKeepsLength) {
    const Point2 end = snapAngle(Point2{0.0f, 0.0f}, Point2{10.0f, 1.0f}, 45.0f);
    EXPECT_NEAR(end.y, 0.0f, 1e-4f);
    EXPECT_NEAR(end.x, std::sqrt(101.0f), 1e-4f);

    const Point2 diag = snapAngle(Point2{0.0f, 0.0f}, Point2{10.0f, 9.0f}, 45.0f);
    EXPECT_NEAR(diag.x, diag.y, 1e-4f);
}

// =============================================================================
// Viewport
// =============================================================================

TEST(ViewportTest, ScreenCanvasRoundTrip) {
    const Viewport vp{15.0f, -5.0f, 2.0f};
    const Point2 s = canvasToScreen(vp, 10.0f, 10.0f);
    EXPECT_FLOAT_EQ(s.x, 50.0f);
    EXPECT_FLOAT_EQ(s.y, 10.0f);
    const Point2 c = screenToCanvas(vp, s.x, s.y);
    EXPECT_FLOAT_EQ(c.x, 10.0f);
    EXPECT_FLOAT_EQ(c.y, 10.0f);
}

TEST(ViewportTest, ZoomAtKeepsAnchorUnderPointer) {
    const Viewport vp{0.0f, 0.0f, 1.0f};
    const Point2 before = screenToCanvas(vp, 200.0f, 100.0f);
    const Viewport zoomed = zoomAt(vp, 200.0f, 100.0f, 2.5f);
    const Point2 after = screenToCanvas(zoomed, 200.0f, 100.0f);
    EXPECT_NEAR(after.x, before.x, 1e-4f);
    EXPECT_NEAR(after.y, before.y, 1e-4f);
    EXPECT_FLOAT_EQ(zoomed.zoom, 2.5f);
}

TEST(ViewportTest, ZoomIsClamped) {
    EXPECT_FLOAT_EQ(clampZoom(100.0f), constants::kMaxZoom);
    EXPECT_FLOAT_EQ(clampZoom(0.0f), constants::kMinZoom);
}

TEST(ViewportTest, ZoomToFitCentresBounds) {
    const Rect bounds{100.0f, 100.0f, 200.0f, 100.0f};
    const Viewport vp = zoomToFit(bounds, 800.0f, 600.0f);
    const Point2 centre = canvasToScreen(vp, bounds.centerX(), bounds.centerY());
    EXPECT_NEAR(centre.x, 400.0f, 1e-3f);
    EXPECT_NEAR(centre.y, 300.0f, 1e-3f);
    EXPECT_FLOAT_EQ(vp.zoom, 3.5f);

    const Viewport empty = zoomToFit(Rect{}, 800.0f, 600.0f);
    EXPECT_FLOAT_EQ(empty.zoom, 1.0f);
}
