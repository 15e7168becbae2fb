#include "karta/tools/select_tool.h"

#include "karta/core/constants.h"
#include "karta/core/logging.h"
#include "karta/entity/group_resolver.h"
#include "karta/entity/selection_manager.h"
#include "karta/history/history_manager.h"
#include "karta/store/replicated_store.h"
#include "karta/tools/inline_editor.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace karta {

Cursor cursorForHandle(HandleType handle) {
    switch (handle) {
        case HandleType::NW:
        case HandleType::SE:
            return Cursor::NwseResize;
        case HandleType::NE:
        case HandleType::SW:
            return Cursor::NeswResize;
        case HandleType::N:
        case HandleType::S:
            return Cursor::NsResize;
        case HandleType::E:
        case HandleType::W:
            return Cursor::EwResize;
        case HandleType::None:
            break;
    }
    return Cursor::Default;
}

// ==============================================================================
// Mouse down
// ==============================================================================

ToolEventResult SelectTool::onMouseDown(const MouseEvent& e) {
    if (e.button != 0) {
        return unhandled();
    }

    InlineEditor& editor = ctx_.inlineEditor();
    if (editor.isEditing()) {
        const SceneObject* hit = ctx_.hitTest(e.screenX, e.screenY);
        if (hit && editor.objectId() && hit->id == *editor.objectId()) {
            return handled();
        }
        if (editor.phase() == EditPhase::Starting) {
            // The click that opened the editor must not close it.
            return handled();
        }
        if (!editor.commit()) {
            KARTA_LOG_WARN("inline edit could not be committed");
        }
    }

    if (const SceneObject* selected = singleSelected()) {
        if (!selected->locked) {
            const Rect abs = ctx_.absoluteRect(*selected);
            if (hitTestRotationHandle(e.screenX, e.screenY, abs, selected->rotation, ctx_.viewport())) {
                mode_ = SelectMode::Rotating;
                return startTransform(*selected, e);
            }
            const HandleType handle = hitTestHandle(e.screenX, e.screenY, abs, selected->rotation, ctx_.viewport());
            if (handle != HandleType::None) {
                mode_ = SelectMode::Resizing;
                activeHandle_ = handle;
                return startTransform(*selected, e);
            }
        }
    }

    const SceneObject* hit = ctx_.hitTest(e.screenX, e.screenY);
    if (hit) {
        const double now = ctx_.now();
        const bool isDoubleClick =
            lastClickId_ && *lastClickId_ == hit->id && now - lastClickTime_ < constants::kDoubleClickMs;
        lastClickTime_ = now;
        lastClickId_ = hit->id;

        if (isDoubleClick) {
            // A third click starts a new pair.
            lastClickId_.reset();
            const ToolEventResult result = handleDoubleClick(*hit);
            if (result.handled) {
                return result;
            }
        }

        if (hit->locked) {
            ctx_.selection().setSelection({hit->id}, e.shift() ? SelectionMode::Toggle : SelectionMode::Replace);
            return handled(true);
        }
        return handleObjectClick(*hit, e);
    }

    lastClickId_.reset();
    if (ctx_.editingGroupId()) {
        ctx_.groups().exitGroupEdit();
    }
    startMarquee(e);
    return handledWithCursor(Cursor::Crosshair, true);
}

ToolEventResult SelectTool::startTransform(const SceneObject& obj, const MouseEvent& e) {
    preGesture_ = ctx_.store().snapshot();
    captureStart({obj.id});
    dragStart_ = Point2{e.canvasX, e.canvasY};

    if (mode_ == SelectMode::Rotating) {
        const StartState& s = startStates_.front();
        const Point2 center = ctx_.canvasToScreen(s.rect.centerX() + s.offset.x, s.rect.centerY() + s.offset.y);
        rotationStartAngle_ = angleFromCenter(center, Point2{e.screenX, e.screenY});
        setCursor(Cursor::Grab);
        return handledWithCursor(Cursor::Grab);
    }

    const Cursor cursor = cursorForHandle(activeHandle_);
    setCursor(cursor);
    return handledWithCursor(cursor);
}

ToolEventResult SelectTool::handleDoubleClick(const SceneObject& obj) {
    switch (obj.kind) {
        case ObjectKind::Text:
            ctx_.selection().setSelection({obj.id});
            if (!ctx_.inlineEditor().begin(obj.id, EditTarget::Text)) {
                return unhandled();
            }
            return handled(true);
        case ObjectKind::Frame:
            ctx_.selection().setSelection({obj.id});
            if (!ctx_.inlineEditor().begin(obj.id, EditTarget::FrameName)) {
                return unhandled();
            }
            return handled(true);
        case ObjectKind::Group:
            if (!ctx_.groups().enterGroupEdit(obj.id)) {
                return unhandled();
            }
            ctx_.selection().clearSelection();
            return handled(true);
        case ObjectKind::Video:
            ctx_.selection().setSelection({obj.id});
            if (!ctx_.toggleVideoPlayback(obj.id)) {
                return unhandled();
            }
            return handled(true);
        default:
            return unhandled();
    }
}

ToolEventResult SelectTool::handleObjectClick(const SceneObject& obj, const MouseEvent& e) {
    SelectionManager& selection = ctx_.selection();
    if (e.shift()) {
        selection.setSelection({obj.id}, SelectionMode::Toggle);
        return handled(true);
    }

    preGesture_ = ctx_.store().snapshot();
    if (selection.isSelected(obj.id)) {
        const ObjectMap& objects = ctx_.store().objects();
        const bool allUnlocked = std::all_of(selection.getSelectedIds().begin(), selection.getSelectedIds().end(), [&](const ObjectId& id) {
            auto it = objects.find(id);
            return it != objects.end() && !it->second.locked;
        });
        if (allUnlocked) {
            startDragging(e);
        }
    } else {
        selection.setSelection({obj.id});
        startDragging(e);
    }
    return handledWithCursor(Cursor::Move, true);
}

void SelectTool::startDragging(const MouseEvent& e) {
    mode_ = SelectMode::Dragging;
    dragStart_ = Point2{e.canvasX, e.canvasY};
    captureStart(ctx_.selection().getSelectedIds());
    setCursor(Cursor::Move);
}

void SelectTool::startMarquee(const MouseEvent& e) {
    mode_ = SelectMode::Marquee;
    marqueeStart_ = Point2{e.canvasX, e.canvasY};
    marqueeEnd_ = marqueeStart_;
    // Read once here; the key may be released before mouse-up.
    marqueeUnion_ = e.shift();
    preMarqueeSelection_ = ctx_.selection().getSelectedIds();
    if (!marqueeUnion_) {
        ctx_.selection().clearSelection();
    }
    setCursor(Cursor::Crosshair);
}

// ==============================================================================
// Mouse move
// ==============================================================================

ToolEventResult SelectTool::onMouseMove(const MouseEvent& e) {
    switch (mode_) {
        case SelectMode::Dragging:
            return handleDragMove(e);
        case SelectMode::Resizing:
            return handleResizeMove(e);
        case SelectMode::Rotating:
            return handleRotateMove(e);
        case SelectMode::Marquee:
            marqueeEnd_ = Point2{e.canvasX, e.canvasY};
            return handledWithCursor(Cursor::Crosshair, true);
        case SelectMode::Idle:
            break;
    }
    return handleIdleHover(e);
}

ToolEventResult SelectTool::handleDragMove(const MouseEvent& e) {
    if (startStates_.empty()) {
        return unhandled();
    }

    float dx = e.canvasX - dragStart_.x;
    float dy = e.canvasY - dragStart_.y;

    // The first object in draw order leads; the rest keep their offsets to it.
    const StartState& lead = startStates_.front();
    const float leadX = lead.rect.x + lead.offset.x;
    const float leadY = lead.rect.y + lead.offset.y;
    SnapResult snapped = ctx_.snapPosition(leadX + dx, leadY + dy, ctx_.selection().getSet(), isSnapSuppressed(e.modifiers));
    dx = snapped.x - leadX;
    dy = snapped.y - leadY;
    ctx_.setActiveSnapGuides(std::move(snapped.guides));

    if (!historyPushed_ && dx == 0.0f && dy == 0.0f) {
        return handledWithCursor(Cursor::Move);
    }

    std::vector<ObjectUpdate> updates;
    updates.reserve(startStates_.size());
    for (const StartState& s : startStates_) {
        ObjectUpdate update{s.id, {}};
        update.patch.setPosition(s.rect.x + dx, s.rect.y + dy);
        updates.push_back(std::move(update));
    }
    commitUpdates(std::move(updates));
    return handledWithCursor(Cursor::Move, true);
}

ToolEventResult SelectTool::handleResizeMove(const MouseEvent& e) {
    if (startStates_.size() != 1 || activeHandle_ == HandleType::None) {
        return unhandled();
    }

    const StartState& s = startStates_.front();
    const Rect absStart{s.rect.x + s.offset.x, s.rect.y + s.offset.y, s.rect.width, s.rect.height};
    const Rect r = computeResize(
        activeHandle_, absStart, e.canvasX - dragStart_.x, e.canvasY - dragStart_.y, e.shift(), s.rotation);

    ObjectUpdate update{s.id, {}};
    update.patch.setRect(Rect{r.x - s.offset.x, r.y - s.offset.y, r.width, r.height});
    const SceneObject* obj = ctx_.store().get(s.id);
    if (obj && obj->kind == ObjectKind::Text) {
        const float scale = r.width / absStart.width;
        update.patch.setFontSize(std::max(1.0f, std::round(s.fontSize * scale)));
    }
    commitUpdates({std::move(update)});
    return handledWithCursor(cursorForHandle(activeHandle_), true);
}

ToolEventResult SelectTool::handleRotateMove(const MouseEvent& e) {
    if (startStates_.size() != 1) {
        return unhandled();
    }

    const StartState& s = startStates_.front();
    const Point2 center = ctx_.canvasToScreen(s.rect.centerX() + s.offset.x, s.rect.centerY() + s.offset.y);
    const float current = angleFromCenter(center, Point2{e.screenX, e.screenY});
    const float rotation = computeRotation(s.rotation, rotationStartAngle_, current, e.shift());

    ObjectUpdate update{s.id, {}};
    update.patch.setRotation(rotation);
    commitUpdates({std::move(update)});
    return handledWithCursor(Cursor::Grab, true);
}

ToolEventResult SelectTool::handleIdleHover(const MouseEvent& e) {
    if (const SceneObject* selected = singleSelected()) {
        if (!selected->locked) {
            const Rect abs = ctx_.absoluteRect(*selected);
            if (hitTestRotationHandle(e.screenX, e.screenY, abs, selected->rotation, ctx_.viewport())) {
                setCursor(Cursor::Grab);
                return handledWithCursor(Cursor::Grab);
            }
            const HandleType handle = hitTestHandle(e.screenX, e.screenY, abs, selected->rotation, ctx_.viewport());
            if (handle != HandleType::None) {
                setCursor(cursorForHandle(handle));
                return handledWithCursor(cursorForHandle(handle));
            }
        }
    }

    const SceneObject* hit = ctx_.hitTest(e.screenX, e.screenY);
    const Cursor cursor = hit && ctx_.selection().isSelected(hit->id) ? Cursor::Move : Cursor::Default;
    setCursor(cursor);
    return handledWithCursor(cursor);
}

// ==============================================================================
// Mouse up / keys
// ==============================================================================

ToolEventResult SelectTool::onMouseUp(const MouseEvent&) {
    const bool wasActive = mode_ != SelectMode::Idle;
    if (mode_ == SelectMode::Marquee) {
        finalizeMarquee();
    }
    resetState();
    return handledWithCursor(Cursor::Default, wasActive);
}

void SelectTool::finalizeMarquee() {
    const std::vector<ObjectId> ids = ctx_.objectsInRect(marqueeStart_.x, marqueeStart_.y, marqueeEnd_.x, marqueeEnd_.y);
    if (marqueeUnion_) {
        ctx_.selection().setSelection(ids, SelectionMode::Add);
    } else {
        ctx_.selection().setSelection(ids, SelectionMode::Replace);
    }
}

ToolEventResult SelectTool::onKeyDown(const KeyEvent& e) {
    if (e.key != "Escape" || mode_ == SelectMode::Idle) {
        return unhandled();
    }
    if (mode_ == SelectMode::Marquee) {
        const std::vector<ObjectId> previous = std::move(preMarqueeSelection_);
        resetState();
        ctx_.selection().setSelection(previous, SelectionMode::Replace);
    } else {
        cancelGesture();
    }
    return handledWithCursor(Cursor::Default, true);
}

void SelectTool::renderOverlay(OverlaySurface& surface) const {
    if (mode_ == SelectMode::Marquee) {
        const Point2 a = ctx_.canvasToScreen(marqueeStart_.x, marqueeStart_.y);
        const Point2 b = ctx_.canvasToScreen(marqueeEnd_.x, marqueeEnd_.y);
        const Rect rect = normalizeRect(a.x, a.y, b.x, b.y);
        surface.fillRect(rect, overlay_colors::kMarqueeFill);
        surface.strokeRect(rect, overlay_colors::kMarqueeStroke, 1.0f, true);
    }
    if (mode_ == SelectMode::Dragging) {
        drawSnapGuides(surface);
    }
}

std::optional<Rect> SelectTool::getMarqueeBounds() const {
    if (mode_ != SelectMode::Marquee) {
        return std::nullopt;
    }
    return normalizeRect(marqueeStart_.x, marqueeStart_.y, marqueeEnd_.x, marqueeEnd_.y);
}

// ==============================================================================
// Gesture bookkeeping
// ==============================================================================

void SelectTool::commitUpdates(std::vector<ObjectUpdate> updates) {
    ensureHistory();
    if (!ctx_.store().applyMany(updates)) {
        KARTA_LOG_WARN("select: transform of %zu objects rejected", updates.size());
    }
}

void SelectTool::ensureHistory() {
    if (historyPushed_ || !preGesture_) {
        return;
    }
    ctx_.history().pushSnapshot(*preGesture_);
    historyPushed_ = true;
}

void SelectTool::cancelGesture() {
    if (historyPushed_) {
        std::vector<ObjectUpdate> restore;
        for (const StartState& s : startStates_) {
            const SceneObject* obj = ctx_.store().get(s.id);
            if (!obj) continue;
            ObjectUpdate update{s.id, {}};
            update.patch.setRect(s.rect).setRotation(s.rotation);
            if (obj->kind == ObjectKind::Text) {
                update.patch.setFontSize(s.fontSize);
            }
            restore.push_back(std::move(update));
        }
        if (!restore.empty() && !ctx_.store().applyMany(restore)) {
            KARTA_LOG_WARN("select: could not restore geometry after cancel");
        }
        ctx_.history().discardLast();
    }
    resetState();
}

void SelectTool::captureStart(const std::vector<ObjectId>& ids) {
    startStates_.clear();
    const ObjectMap& objects = ctx_.store().objects();
    for (const ObjectId& id : ids) {
        auto it = objects.find(id);
        if (it == objects.end()) continue;
        const SceneObject& obj = it->second;
        const Point2 abs = GroupResolver::getAbsolutePosition(obj, objects);
        startStates_.push_back(StartState{
            id, obj.rect(), Point2{abs.x - obj.x, abs.y - obj.y}, obj.rotation, obj.fontSize});
    }
}

const SceneObject* SelectTool::singleSelected() const {
    const SelectionManager& selection = ctx_.selection();
    if (selection.size() != 1) {
        return nullptr;
    }
    return ctx_.store().get(selection.getSelectedIds().front());
}

void SelectTool::resetState() {
    mode_ = SelectMode::Idle;
    dragStart_ = Point2{0.0f, 0.0f};
    activeHandle_ = HandleType::None;
    rotationStartAngle_ = 0.0f;
    startStates_.clear();
    preGesture_.reset();
    historyPushed_ = false;
    marqueeStart_ = Point2{0.0f, 0.0f};
    marqueeEnd_ = Point2{0.0f, 0.0f};
    marqueeUnion_ = false;
    preMarqueeSelection_.clear();
    ctx_.setActiveSnapGuides({});
    setCursor(Cursor::Default);
}

} // namespace karta
