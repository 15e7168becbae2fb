#pragma once

#include "karta/core/constants.h"
#include "karta/core/types.h"

namespace karta {

// x/y are the pan offset in document units, zoom the scale factor.
// screen = (canvas + offset) * zoom.
struct Viewport {
    float x{0.0f};
    float y{0.0f};
    float zoom{1.0f};
};

Point2 canvasToScreen(const Viewport& vp, float x, float y);
Point2 screenToCanvas(const Viewport& vp, float sx, float sy);

float clampZoom(float zoom);

// Keeps the canvas point under (screenX, screenY) fixed while zooming.
Viewport zoomAt(const Viewport& vp, float screenX, float screenY, float newZoom);

// Pan by a screen-space delta.
Viewport panBy(const Viewport& vp, float screenDx, float screenDy);

// Fit `bounds` into a canvas of the given screen size with padding. Degenerate
// bounds reset to the identity viewport.
Viewport zoomToFit(const Rect& bounds, float canvasWidth, float canvasHeight);

// Change zoom keeping the centre of the canvas fixed.
Viewport setZoomPreset(const Viewport& vp, float zoom, float canvasWidth, float canvasHeight);

// Visible document area.
Rect visibleCanvasRect(const Viewport& vp, float canvasWidth, float canvasHeight);

} // namespace karta
