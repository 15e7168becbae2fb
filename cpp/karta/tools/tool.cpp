#include "karta/tools/tool.h"

namespace karta {

namespace {

struct ToolNameEntry {
    ToolType type;
    const char* name;
};

constexpr ToolNameEntry kToolNames[] = {
    {ToolType::Select, "select"},
    {ToolType::Hand, "hand"},
    {ToolType::Rectangle, "rectangle"},
    {ToolType::Ellipse, "ellipse"},
    {ToolType::Text, "text"},
    {ToolType::Frame, "frame"},
    {ToolType::Pen, "pen"},
    {ToolType::Line, "line"},
    {ToolType::Arrow, "arrow"},
};

} // namespace

const char* toolName(ToolType type) {
    for (const ToolNameEntry& entry : kToolNames) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

std::optional<ToolType> toolFromName(const std::string& name) {
    for (const ToolNameEntry& entry : kToolNames) {
        if (name == entry.name) return entry.type;
    }
    return std::nullopt;
}

const char* cursorName(Cursor cursor) {
    switch (cursor) {
        case Cursor::Default: return "default";
        case Cursor::Crosshair: return "crosshair";
        case Cursor::Text: return "text";
        case Cursor::Move: return "move";
        case Cursor::Grab: return "grab";
        case Cursor::Grabbing: return "grabbing";
        case Cursor::NsResize: return "ns-resize";
        case Cursor::EwResize: return "ew-resize";
        case Cursor::NwseResize: return "nwse-resize";
        case Cursor::NeswResize: return "nesw-resize";
    }
    return "default";
}

// ==============================================================================
// Tool
// ==============================================================================

void Tool::onActivate() {
    resetState();
    active_ = true;
    cursor_ = defaultCursor();
}

void Tool::onDeactivate() {
    resetState();
    active_ = false;
    cursor_ = defaultCursor();
}

void Tool::drawSnapGuides(OverlaySurface& surface) const {
    for (const SnapGuide& guide : ctx_.activeSnapGuides()) {
        if (guide.type == GuideType::Vertical) {
            const float sx = ctx_.canvasToScreen(guide.position, 0.0f).x;
            surface.strokeLine(Point2{sx, 0.0f}, Point2{sx, surface.height()}, overlay_colors::kSnapGuide, 1.0f);
        } else {
            const float sy = ctx_.canvasToScreen(0.0f, guide.position).y;
            surface.strokeLine(Point2{0.0f, sy}, Point2{surface.width(), sy}, overlay_colors::kSnapGuide, 1.0f);
        }
    }
}

} // namespace karta
