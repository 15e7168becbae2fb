#pragma once

#include "karta/geometry/geometry.h"
#include "karta/scene/scene_object.h"
#include "karta/tools/tool.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace karta {

enum class SelectMode : std::uint8_t {
    Idle = 0,
    Dragging = 1,
    Resizing = 2,
    Rotating = 3,
    Marquee = 4
};

// Idle -> {Dragging, Resizing, Rotating, Marquee} -> Idle.
//
// The document is captured at mouse-down and pushed to history right before
// the first mutation, so a click that moves nothing leaves no undo entry and
// a gesture is always exactly one. Transforms write every frame with
// applyMany. Escape restores the geometry captured at mouse-down.
class SelectTool : public Tool {
public:
    using Tool::Tool;

    ToolType type() const override { return ToolType::Select; }

    ToolEventResult onMouseDown(const MouseEvent& e) override;
    ToolEventResult onMouseMove(const MouseEvent& e) override;
    ToolEventResult onMouseUp(const MouseEvent& e) override;
    ToolEventResult onKeyDown(const KeyEvent& e) override;

    void renderOverlay(OverlaySurface& surface) const override;

    bool isOperationActive() const override { return mode_ != SelectMode::Idle; }
    SelectMode getMode() const { return mode_; }
    HandleType getActiveHandle() const { return activeHandle_; }
    // Marquee in document space, normalised; nullopt outside marquee mode.
    std::optional<Rect> getMarqueeBounds() const;

protected:
    void resetState() override;

private:
    // Geometry of one object at gesture start. `offset` is its parent's
    // absolute origin, so absolute = relative + offset.
    struct StartState {
        ObjectId id;
        Rect rect;
        Point2 offset;
        float rotation;
        float fontSize;
    };

    ToolEventResult startTransform(const SceneObject& obj, const MouseEvent& e);
    ToolEventResult handleDoubleClick(const SceneObject& obj);
    ToolEventResult handleObjectClick(const SceneObject& obj, const MouseEvent& e);
    void startDragging(const MouseEvent& e);
    void startMarquee(const MouseEvent& e);

    ToolEventResult handleDragMove(const MouseEvent& e);
    ToolEventResult handleResizeMove(const MouseEvent& e);
    ToolEventResult handleRotateMove(const MouseEvent& e);
    ToolEventResult handleIdleHover(const MouseEvent& e);
    void finalizeMarquee();

    void commitUpdates(std::vector<ObjectUpdate> updates);
    void ensureHistory();
    void cancelGesture();
    void captureStart(const std::vector<ObjectId>& ids);
    const SceneObject* singleSelected() const;

    SelectMode mode_ = SelectMode::Idle;
    Point2 dragStart_{0.0f, 0.0f};
    HandleType activeHandle_ = HandleType::None;
    float rotationStartAngle_ = 0.0f;
    std::vector<StartState> startStates_;

    std::optional<ObjectMap> preGesture_;
    bool historyPushed_ = false;

    Point2 marqueeStart_{0.0f, 0.0f};
    Point2 marqueeEnd_{0.0f, 0.0f};
    bool marqueeUnion_ = false;
    std::vector<ObjectId> preMarqueeSelection_;

    double lastClickTime_ = -1.0e9;
    std::optional<ObjectId> lastClickId_;
};

Cursor cursorForHandle(HandleType handle);

} // namespace karta
