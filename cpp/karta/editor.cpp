#include "karta/editor.h"

#include "karta/core/constants.h"
#include "karta/core/logging.h"
#include "karta/geometry/geometry.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace karta {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Rect unionOfRotatedBounds(const std::vector<const SceneObject*>& objects, const ObjectMap& all) {
    std::vector<Rect> rects;
    rects.reserve(objects.size());
    for (const SceneObject* obj : objects) {
        rects.push_back(getRotatedBoundingBox(GroupResolver::getAbsoluteRect(*obj, all), obj->rotation));
    }
    return unionBounds(rects);
}

} // namespace

Editor::Editor(EditorOptions options, ClockFn clock)
    : clock_(std::move(clock)),
      store_(options.store, clock_),
      history_(store_, options.history),
      selection_(store_),
      ids_(store_.siteId(), [this](const ObjectId& id) {
          return store_.contains(id) || store_.tombstone(id).has_value();
      }),
      groups_(store_, history_, selection_, ids_),
      picker_(store_, options.spatial),
      measurer_(nullptr),
      inlineEditor_(store_, history_, groups_, measurer_, clock_),
      toolContext_(store_, history_, selection_, groups_, picker_, measurer_, inlineEditor_, ids_, clock_),
      tools_(toolContext_),
      clipboard_(store_, history_, selection_, ids_),
      zOrder_(store_, history_) {
    toolContext_.grid() = options.grid;
    tools_.registerDefaultTools();
    if (!tools_.setActiveTool(options.initialTool) && !tools_.setActiveTool(ToolType::Select)) {
        KARTA_LOG_WARN("editor started without an active tool");
    }
}

ToolType Editor::activeTool() const {
    return tools_.activeToolType().value_or(ToolType::Select);
}

// ==============================================================================
// Input
// ==============================================================================

MouseEvent Editor::makeMouseEvent(float screenX, float screenY, int button, std::uint32_t modifiers) const {
    const Point2 canvas = screenToCanvas(toolContext_.viewport(), screenX, screenY);
    MouseEvent e;
    e.screenX = screenX;
    e.screenY = screenY;
    e.canvasX = canvas.x;
    e.canvasY = canvas.y;
    e.button = button;
    e.modifiers = modifiers;
    return e;
}

ToolEventResult Editor::mouseDown(float screenX, float screenY, int button, std::uint32_t modifiers) {
    return tools_.handleMouseDown(makeMouseEvent(screenX, screenY, button, modifiers));
}

ToolEventResult Editor::mouseMove(float screenX, float screenY, int button, std::uint32_t modifiers) {
    return tools_.handleMouseMove(makeMouseEvent(screenX, screenY, button, modifiers));
}

ToolEventResult Editor::mouseUp(float screenX, float screenY, int button, std::uint32_t modifiers) {
    return tools_.handleMouseUp(makeMouseEvent(screenX, screenY, button, modifiers));
}

ToolEventResult Editor::keyDown(const KeyEvent& e) {
    if (inlineEditor_.isEditing()) {
        // Everything else belongs to the host's text field.
        if (e.key == "Escape") {
            inlineEditor_.cancel();
            return handled(true);
        }
        const bool commitKey = e.key == "Enter" &&
            (inlineEditor_.target() == EditTarget::FrameName ? !e.shift() : e.command());
        if (commitKey) {
            return ToolEventResult{inlineEditor_.commit(), std::nullopt, true};
        }
        return unhandled();
    }

    ToolEventResult result = tools_.handleKeyDown(e);
    if (result.handled || tools_.isOperationActive()) {
        return result;
    }
    if (handleShortcut(e)) {
        return handled(true);
    }
    return unhandled();
}

ToolEventResult Editor::keyUp(const KeyEvent& e) {
    return tools_.handleKeyUp(e);
}

bool Editor::handleShortcut(const KeyEvent& e) {
    if (e.key == "Delete" || e.key == "Backspace") {
        return deleteSelection();
    }

    const std::string key = lowercase(e.key);
    if (e.command()) {
        if (key == "z") return e.shift() ? redo() : undo();
        if (key == "y") return redo();
        if (key == "c") return copySelection();
        if (key == "v") return paste();
        if (key == "d") return duplicateSelection();
        if (key == "a") {
            selectAll();
            return true;
        }
        if (key == "g") return e.shift() ? ungroupSelection() : groupSelection();
        if (key == "]") return bringToFront();
        if (key == "[") return sendToBack();
        return false;
    }

    if (key == "]") return bringForward();
    if (key == "[") return sendBackward();

    const float step = e.shift() ? constants::kNudgeStepLarge : constants::kNudgeStep;
    // Auto-repeat extends the undo step of the first press.
    if (e.key == "ArrowLeft") return nudgeSelection(-step, 0.0f, !e.repeat);
    if (e.key == "ArrowRight") return nudgeSelection(step, 0.0f, !e.repeat);
    if (e.key == "ArrowUp") return nudgeSelection(0.0f, -step, !e.repeat);
    if (e.key == "ArrowDown") return nudgeSelection(0.0f, step, !e.repeat);

    if (e.key == "Escape") return handleEscape();

    if (e.alt() || e.repeat) {
        return false;
    }
    return handleToolKey(key);
}

bool Editor::handleToolKey(const std::string& key) {
    static const std::pair<const char*, ToolType> kToolKeys[] = {
        {"v", ToolType::Select},
        {"h", ToolType::Hand},
        {"r", ToolType::Rectangle},
        {"o", ToolType::Ellipse},
        {"t", ToolType::Text},
        {"f", ToolType::Frame},
        {"p", ToolType::Pen},
        {"l", ToolType::Line},
        {"a", ToolType::Arrow},
    };
    for (const auto& [name, type] : kToolKeys) {
        if (key == name) {
            return tools_.setActiveTool(type);
        }
    }
    return false;
}

bool Editor::handleEscape() {
    if (!selection_.isEmpty()) {
        selection_.clearSelection();
        return true;
    }
    if (groups_.editingGroupId()) {
        groups_.exitGroupEdit();
        return true;
    }
    if (activeTool() != ToolType::Select) {
        return tools_.setActiveTool(ToolType::Select);
    }
    return false;
}

// ==============================================================================
// Commands
// ==============================================================================

std::vector<ObjectId> Editor::editableSelection() const {
    std::vector<ObjectId> ids;
    for (const ObjectId& id : selection_.getSelectedIds()) {
        const SceneObject* obj = store_.get(id);
        if (obj && !obj->locked) {
            ids.push_back(id);
        }
    }
    return ids;
}

void Editor::settleInlineEdit() {
    if (inlineEditor_.isEditing() && !inlineEditor_.commit()) {
        inlineEditor_.cancel();
    }
}

bool Editor::deleteSelection() {
    settleInlineEdit();
    const std::vector<ObjectId> ids = editableSelection();
    if (ids.empty()) {
        return false;
    }
    return groups_.deleteObjects(ids);
}

bool Editor::undo() {
    settleInlineEdit();
    return history_.undo();
}

bool Editor::redo() {
    settleInlineEdit();
    return history_.redo();
}

bool Editor::copySelection() {
    if (selection_.isEmpty()) {
        return false;
    }
    return clipboard_.copy(selection_.getSelectedIds());
}

bool Editor::paste() {
    settleInlineEdit();
    return !clipboard_.paste().empty();
}

bool Editor::duplicateSelection() {
    settleInlineEdit();
    if (selection_.isEmpty()) {
        return false;
    }
    return !clipboard_.duplicate(selection_.getSelectedIds()).empty();
}

void Editor::selectAll() {
    selection_.selectAll(groups_.editingGroupId());
}

bool Editor::groupSelection() {
    settleInlineEdit();
    return groups_.groupSelection().has_value();
}

bool Editor::ungroupSelection() {
    settleInlineEdit();
    return groups_.ungroupSelection();
}

bool Editor::bringForward() {
    return zOrder_.bringForward(selection_.getSelectedIds());
}

bool Editor::sendBackward() {
    return zOrder_.sendBackward(selection_.getSelectedIds());
}

bool Editor::bringToFront() {
    return zOrder_.bringToFront(selection_.getSelectedIds());
}

bool Editor::sendToBack() {
    return zOrder_.sendToBack(selection_.getSelectedIds());
}

bool Editor::nudgeSelection(float dx, float dy, bool recordHistory) {
    const std::vector<ObjectId> ids = editableSelection();
    if (ids.empty()) {
        return false;
    }

    std::vector<ObjectUpdate> updates;
    updates.reserve(ids.size());
    for (const ObjectId& id : ids) {
        const SceneObject* obj = store_.get(id);
        ObjectUpdate update{id, {}};
        update.patch.setPosition(obj->x + dx, obj->y + dy);
        updates.push_back(std::move(update));
    }

    if (recordHistory || !history_.canUndo()) {
        history_.pushCurrent();
    }
    if (!store_.applyMany(updates)) {
        KARTA_LOG_WARN("nudge of %zu objects rejected", updates.size());
        return false;
    }
    return true;
}

// ==============================================================================
// Viewport
// ==============================================================================

void Editor::setCanvasSize(float width, float height) {
    canvasWidth_ = std::max(0.0f, width);
    canvasHeight_ = std::max(0.0f, height);
}

void Editor::zoomAt(float screenX, float screenY, float zoom) {
    toolContext_.setViewport(karta::zoomAt(toolContext_.viewport(), screenX, screenY, zoom));
}

void Editor::setZoomPreset(float zoom) {
    toolContext_.setViewport(karta::setZoomPreset(toolContext_.viewport(), zoom, canvasWidth_, canvasHeight_));
}

void Editor::zoomToFit() {
    std::vector<const SceneObject*> visible;
    for (const SceneObject* obj : store_.sortedByZ()) {
        if (obj->visible && !obj->isChild()) {
            visible.push_back(obj);
        }
    }
    if (visible.empty()) {
        toolContext_.setViewport(Viewport{});
        return;
    }
    const Rect bounds = unionOfRotatedBounds(visible, store_.objects());
    toolContext_.setViewport(karta::zoomToFit(bounds, canvasWidth_, canvasHeight_));
}

bool Editor::zoomToSelection() {
    std::vector<const SceneObject*> selected;
    for (const ObjectId& id : selection_.getSelectedIds()) {
        if (const SceneObject* obj = store_.get(id)) {
            selected.push_back(obj);
        }
    }
    if (selected.empty()) {
        return false;
    }
    const Rect bounds = unionOfRotatedBounds(selected, store_.objects());
    toolContext_.setViewport(karta::zoomToFit(bounds, canvasWidth_, canvasHeight_));
    return true;
}

} // namespace karta
