#include "karta/tools/tool_context.h"

#include "karta/core/logging.h"
#include "karta/entity/group_resolver.h"
#include "karta/geometry/geometry.h"
#include "karta/interaction/pick_system.h"
#include "karta/interaction/snap_solver.h"
#include "karta/store/replicated_store.h"

#include <utility>

namespace karta {

ToolContext::ToolContext(
    ReplicatedStore& store,
    HistoryManager& history,
    SelectionManager& selection,
    GroupResolver& groups,
    PickSystem& picker,
    TextMeasurer& measurer,
    InlineEditor& inlineEditor,
    IdAllocator& ids,
    ClockFn clock)
    : store_(store),
      history_(history),
      selection_(selection),
      groups_(groups),
      picker_(picker),
      measurer_(measurer),
      inlineEditor_(inlineEditor),
      ids_(ids),
      clock_(std::move(clock)) {}

void ToolContext::setViewport(const Viewport& viewport) {
    if (!isFiniteNumber(viewport.x) || !isFiniteNumber(viewport.y) || !isFiniteNumber(viewport.zoom)) {
        KARTA_LOG_WARN("ignored non-finite viewport");
        return;
    }
    viewport_ = Viewport{viewport.x, viewport.y, clampZoom(viewport.zoom)};
}

SnapResult ToolContext::snapPosition(float x, float y, const std::unordered_set<ObjectId>& excludedIds, bool skipSnap) const {
    return computeSnappedPosition(x, y, grid_, store_.objects(), excludedIds, skipSnap);
}

const SceneObject* ToolContext::hitTest(float screenX, float screenY) {
    const Point2 p = screenToCanvas(screenX, screenY);
    const std::optional<ObjectId> id = picker_.pick(p.x, p.y, editingGroupId());
    return id ? store_.get(*id) : nullptr;
}

std::vector<ObjectId> ToolContext::objectsInRect(float x1, float y1, float x2, float y2) {
    return picker_.queryMarquee(normalizeRect(x1, y1, x2, y2), editingGroupId());
}

Rect ToolContext::absoluteRect(const SceneObject& obj) const {
    return GroupResolver::getAbsoluteRect(obj, store_.objects());
}

std::optional<ObjectId> ToolContext::editingGroupId() const {
    return groups_.editingGroupId();
}

bool ToolContext::setActiveTool(ToolType type) {
    if (!switcher_) {
        return false;
    }
    return switcher_(type);
}

bool ToolContext::toggleVideoPlayback(const ObjectId& id) {
    const SceneObject* obj = store_.get(id);
    if (!obj || obj->kind != ObjectKind::Video) {
        return false;
    }
    if (playingVideos_.erase(id) == 0) {
        playingVideos_.insert(id);
    }
    return true;
}

} // namespace karta
