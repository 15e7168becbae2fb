#include "karta/tools/drawing_tool.h"

#include "karta/core/logging.h"
#include "karta/entity/selection_manager.h"
#include "karta/history/history_manager.h"
#include "karta/store/id_allocator.h"
#include "karta/store/replicated_store.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace karta {

namespace {

bool isModifierKey(const std::string& key) {
    return key == "Shift" || key == "Alt";
}

std::uint32_t modifierForKey(const std::string& key) {
    return key == "Shift" ? modifierBit(Modifier::Shift) : modifierBit(Modifier::Alt);
}

} // namespace

Rect dragRect(Point2 start, Point2 end, bool square) {
    float width = end.x - start.x;
    float height = end.y - start.y;
    if (square) {
        const float size = std::max(std::fabs(width), std::fabs(height));
        width = width >= 0.0f ? size : -size;
        height = height >= 0.0f ? size : -size;
    }
    return Rect{
        width >= 0.0f ? start.x : start.x + width,
        height >= 0.0f ? start.y : start.y + height,
        std::fabs(width),
        std::fabs(height)};
}

void DrawingTool::onActivate() {
    Tool::onActivate();
    ctx_.selection().clearSelection();
}

void DrawingTool::onDeactivate() {
    if (drawing_) {
        cancelDrawing();
    }
    Tool::onDeactivate();
}

ToolEventResult DrawingTool::onMouseDown(const MouseEvent& e) {
    if (e.button != 0) {
        return unhandled();
    }
    if (drawing_) {
        cancelDrawing();
    }

    modifiers_ = e.modifiers;
    start_ = snapsToGrid() ? snapPoint(e.canvasX, e.canvasY) : Point2{e.canvasX, e.canvasY};
    pointer_ = start_;

    ReplicatedStore& store = ctx_.store();
    const ObjectId id = ctx_.ids().next();
    const SceneObject obj = createProvisional(id, start_, store.nextZIndex());

    ctx_.history().pushCurrent();
    if (!store.apply(id, ObjectPatch::full(obj))) {
        KARTA_LOG_WARN("%s: could not create provisional object", name());
        ctx_.history().discardLast();
        ctx_.setActiveSnapGuides({});
        return unhandled();
    }

    drawing_ = true;
    previewId_ = id;
    return handled();
}

ToolEventResult DrawingTool::onMouseMove(const MouseEvent& e) {
    if (!drawing_) {
        return unhandled();
    }
    modifiers_ = e.modifiers;
    pointer_ = Point2{e.canvasX, e.canvasY};
    pointerMoved(pointer_);
    updatePreview();
    return handled(true);
}

ToolEventResult DrawingTool::onMouseUp(const MouseEvent&) {
    if (!drawing_ || !previewId_) {
        return unhandled();
    }

    const ObjectId id = *previewId_;
    const SceneObject* obj = ctx_.store().get(id);
    if (!obj) {
        // Removed remotely mid-gesture; the snapshot would restore it.
        ctx_.history().discardLast();
        resetState();
        return handled(true);
    }
    if (!meetsThreshold(*obj)) {
        cancelDrawing();
        return handled(true);
    }

    resetState();
    ctx_.selection().setSelection({id});
    ctx_.setActiveTool(ToolType::Select);
    return handled(true);
}

ToolEventResult DrawingTool::onKeyDown(const KeyEvent& e) {
    if (!drawing_) {
        return unhandled();
    }
    if (e.key == "Escape") {
        cancelDrawing();
        return handled(true);
    }
    if (reactsToModifierKeys() && isModifierKey(e.key)) {
        modifiers_ |= modifierForKey(e.key);
        updatePreview();
        return handled(true);
    }
    return unhandled();
}

ToolEventResult DrawingTool::onKeyUp(const KeyEvent& e) {
    if (!drawing_ || !reactsToModifierKeys() || !isModifierKey(e.key)) {
        return unhandled();
    }
    modifiers_ &= ~modifierForKey(e.key);
    updatePreview();
    return handled(true);
}

void DrawingTool::renderOverlay(OverlaySurface& surface) const {
    if (drawing_) {
        drawSnapGuides(surface);
    }
}

void DrawingTool::resetState() {
    drawing_ = false;
    previewId_.reset();
    start_ = Point2{0.0f, 0.0f};
    pointer_ = Point2{0.0f, 0.0f};
    modifiers_ = 0;
    ctx_.setActiveSnapGuides({});
}

Point2 DrawingTool::snapPoint(float x, float y) {
    std::unordered_set<ObjectId> excluded;
    if (previewId_) {
        excluded.insert(*previewId_);
    }
    SnapResult snapped = ctx_.snapPosition(x, y, excluded, isSnapSuppressed(modifiers_));
    ctx_.setActiveSnapGuides(std::move(snapped.guides));
    return Point2{snapped.x, snapped.y};
}

void DrawingTool::updatePreview() {
    if (!previewId_) {
        return;
    }
    ObjectPatch patch = previewPatch();
    if (!patch.empty() && !ctx_.store().applyMany({ObjectUpdate{*previewId_, std::move(patch)}})) {
        KARTA_LOG_WARN("%s: preview update rejected", name());
    }
}

void DrawingTool::cancelDrawing() {
    if (previewId_ && ctx_.store().contains(*previewId_) && !ctx_.store().remove(*previewId_)) {
        KARTA_LOG_WARN("%s: could not remove provisional %s", name(), previewId_->c_str());
    }
    ctx_.history().discardLast();
    resetState();
}

} // namespace karta
