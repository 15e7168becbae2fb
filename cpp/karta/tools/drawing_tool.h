#pragma once

#include "karta/scene/scene_object.h"
#include "karta/tools/tool.h"

#include <cstdint>
#include <optional>
#include <unordered_set>

namespace karta {

// Rectangle spanned by a drag, normalised to positive size. `square` grows
// the shorter side to match the longer one, away from the start point.
Rect dragRect(Point2 start, Point2 end, bool square);

// Shared Idle -> Drawing -> Committed | Cancelled machine.
//
// Mouse-down pushes one history snapshot and creates a provisional object;
// every move rewrites its geometry through applyMany so peers see the shape
// grow. Mouse-up keeps the object if it clears the tool's threshold, selects
// it and returns to the select tool; otherwise the object is removed and the
// snapshot discarded, as on Escape.
class DrawingTool : public Tool {
public:
    using Tool::Tool;

    void onActivate() override;
    void onDeactivate() override;

    ToolEventResult onMouseDown(const MouseEvent& e) override;
    ToolEventResult onMouseMove(const MouseEvent& e) override;
    ToolEventResult onMouseUp(const MouseEvent& e) override;
    ToolEventResult onKeyDown(const KeyEvent& e) override;
    ToolEventResult onKeyUp(const KeyEvent& e) override;

    void renderOverlay(OverlaySurface& surface) const override;

    bool isOperationActive() const override { return drawing_; }
    const std::optional<ObjectId>& previewId() const { return previewId_; }

protected:
    Cursor defaultCursor() const override { return Cursor::Crosshair; }
    void resetState() override;

    virtual SceneObject createProvisional(const ObjectId& id, Point2 start, std::int32_t zIndex) = 0;
    // Geometry for the current pointer position and modifiers.
    virtual ObjectPatch previewPatch() = 0;
    virtual bool meetsThreshold(const SceneObject& obj) const = 0;

    virtual bool snapsToGrid() const { return true; }
    // Modifier keys that change the preview while held.
    virtual bool reactsToModifierKeys() const { return false; }
    virtual void pointerMoved(Point2) {}

    // Grid/object snap unless Ctrl/Cmd is held. Updates the active guides.
    Point2 snapPoint(float x, float y);

    bool shiftHeld() const { return (modifiers_ & modifierBit(Modifier::Shift)) != 0; }
    bool altHeld() const { return (modifiers_ & modifierBit(Modifier::Alt)) != 0; }

    bool drawing_ = false;
    std::optional<ObjectId> previewId_;
    Point2 start_{0.0f, 0.0f};
    Point2 pointer_{0.0f, 0.0f};
    std::uint32_t modifiers_ = 0;

private:
    void updatePreview();
    void cancelDrawing();
};

} // namespace karta
