#pragma once

#include "karta/core/types.h"

#include <cstdint>

namespace karta {

// Packed 0xRRGGBBAA.
using Rgba = std::uint32_t;

namespace overlay_colors {
constexpr Rgba kMarqueeFill = 0x0066FF1A;
constexpr Rgba kMarqueeStroke = 0x0066FFFF;
constexpr Rgba kSnapGuide = 0xFF3B7FFF;
} // namespace overlay_colors

// Transient drawing target for tool feedback, in screen pixels. Implemented
// by the host renderer; the engine never owns a canvas.
class OverlaySurface {
public:
    virtual ~OverlaySurface() = default;

    virtual float width() const = 0;
    virtual float height() const = 0;

    virtual void fillRect(const Rect& rect, Rgba color) = 0;
    virtual void strokeRect(const Rect& rect, Rgba color, float lineWidth, bool dashed) = 0;
    virtual void strokeLine(Point2 from, Point2 to, Rgba color, float lineWidth) = 0;
};

} // namespace karta
