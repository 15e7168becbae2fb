#include "karta/tools/text_tool.h"

#include "karta/core/logging.h"
#include "karta/entity/selection_manager.h"
#include "karta/history/history_manager.h"
#include "karta/store/id_allocator.h"
#include "karta/store/replicated_store.h"
#include "karta/text/text_measurer.h"
#include "karta/tools/inline_editor.h"

namespace karta {

// ==============================================================================
// TextTool
// ==============================================================================

ToolEventResult TextTool::onMouseDown(const MouseEvent& e) {
    if (e.button != 0) {
        return unhandled();
    }

    ReplicatedStore& store = ctx_.store();
    const ObjectId id = ctx_.ids().next();
    SceneObject text = makeObject(ObjectKind::Text, id, e.canvasX, e.canvasY, 0.0f, 0.0f, store.nextZIndex());
    const TextDimensions dims = ctx_.measurer().measure(text);
    text.width = dims.width;
    text.height = dims.height;

    ctx_.history().pushCurrent();
    if (!store.apply(id, ObjectPatch::full(text))) {
        KARTA_LOG_WARN("text: could not create object");
        ctx_.history().discardLast();
        return unhandled();
    }

    ctx_.selection().setSelection({id});
    ctx_.setActiveTool(ToolType::Select);
    if (!ctx_.inlineEditor().begin(id, EditTarget::Text, true)) {
        KARTA_LOG_WARN("text: could not start editing %s", id.c_str());
    }
    return handled(true);
}

// ==============================================================================
// HandTool
// ==============================================================================

ToolEventResult HandTool::onMouseDown(const MouseEvent& e) {
    if (e.button != 0) {
        return unhandled();
    }
    panning_ = true;
    lastScreen_ = Point2{e.screenX, e.screenY};
    setCursor(Cursor::Grabbing);
    return handledWithCursor(Cursor::Grabbing);
}

ToolEventResult HandTool::onMouseMove(const MouseEvent& e) {
    if (!panning_) {
        return unhandled();
    }
    const float dx = e.screenX - lastScreen_.x;
    const float dy = e.screenY - lastScreen_.y;
    if (dx != 0.0f || dy != 0.0f) {
        ctx_.setViewport(panBy(ctx_.viewport(), dx, dy));
    }
    lastScreen_ = Point2{e.screenX, e.screenY};
    return handledWithCursor(Cursor::Grabbing, true);
}

ToolEventResult HandTool::onMouseUp(const MouseEvent&) {
    if (!panning_) {
        return unhandled();
    }
    resetState();
    return handledWithCursor(Cursor::Grab);
}

void HandTool::resetState() {
    panning_ = false;
    lastScreen_ = Point2{0.0f, 0.0f};
    setCursor(Cursor::Grab);
}

} // namespace karta
