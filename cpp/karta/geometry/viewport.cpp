#include "karta/geometry/viewport.h"
#include "karta/core/util.h"

#include <algorithm>

namespace karta {

Point2 canvasToScreen(const Viewport& vp, float x, float y) {
    return Point2{(x + vp.x) * vp.zoom, (y + vp.y) * vp.zoom};
}

Point2 screenToCanvas(const Viewport& vp, float sx, float sy) {
    return Point2{sx / vp.zoom - vp.x, sy / vp.zoom - vp.y};
}

float clampZoom(float zoom) {
    if (!isFiniteNumber(zoom)) return 1.0f;
    return clampValue(zoom, constants::kMinZoom, constants::kMaxZoom);
}

Viewport zoomAt(const Viewport& vp, float screenX, float screenY, float newZoom) {
    const Point2 anchor = screenToCanvas(vp, screenX, screenY);
    Viewport out;
    out.zoom = clampZoom(newZoom);
    out.x = screenX / out.zoom - anchor.x;
    out.y = screenY / out.zoom - anchor.y;
    return out;
}

Viewport panBy(const Viewport& vp, float screenDx, float screenDy) {
    Viewport out = vp;
    out.x += screenDx / vp.zoom;
    out.y += screenDy / vp.zoom;
    return out;
}

Viewport zoomToFit(const Rect& bounds, float canvasWidth, float canvasHeight) {
    if (bounds.width <= 0.0f || bounds.height <= 0.0f || canvasWidth <= 0.0f || canvasHeight <= 0.0f) {
        return Viewport{};
    }

    const float pad = constants::kFitPadding * 2.0f;
    const float scaleX = (canvasWidth - pad) / bounds.width;
    const float scaleY = (canvasHeight - pad) / bounds.height;
    const float zoom = clampZoom(std::min(scaleX, scaleY));

    Viewport out;
    out.zoom = zoom;
    out.x = -bounds.centerX() + (canvasWidth * 0.5f) / zoom;
    out.y = -bounds.centerY() + (canvasHeight * 0.5f) / zoom;
    return out;
}

Viewport setZoomPreset(const Viewport& vp, float zoom, float canvasWidth, float canvasHeight) {
    const float centerX = -vp.x + canvasWidth * 0.5f / vp.zoom;
    const float centerY = -vp.y + canvasHeight * 0.5f / vp.zoom;

    Viewport out;
    out.zoom = clampZoom(zoom);
    out.x = -centerX + canvasWidth * 0.5f / out.zoom;
    out.y = -centerY + canvasHeight * 0.5f / out.zoom;
    return out;
}

Rect visibleCanvasRect(const Viewport& vp, float canvasWidth, float canvasHeight) {
    const Point2 tl = screenToCanvas(vp, 0.0f, 0.0f);
    return Rect{tl.x, tl.y, canvasWidth / vp.zoom, canvasHeight / vp.zoom};
}

} // namespace karta
