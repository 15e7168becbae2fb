#pragma once

#include "karta/core/types.h"
#include "karta/core/util.h"
#include "karta/geometry/viewport.h"
#include "karta/interaction/snap_types.h"
#include "karta/scene/scene_object.h"
#include "karta/tools/tool_types.h"

#include <functional>
#include <optional>
#include <unordered_set>
#include <vector>

namespace karta {

class GroupResolver;
class HistoryManager;
class IdAllocator;
class InlineEditor;
class PickSystem;
class ReplicatedStore;
class SelectionManager;
class TextMeasurer;

using ToolSwitcher = std::function<bool(ToolType)>;

// Everything a tool may touch. Non-owning; the editor that builds it owns
// every collaborator and outlives the tools.
class ToolContext {
public:
    ToolContext(
        ReplicatedStore& store,
        HistoryManager& history,
        SelectionManager& selection,
        GroupResolver& groups,
        PickSystem& picker,
        TextMeasurer& measurer,
        InlineEditor& inlineEditor,
        IdAllocator& ids,
        ClockFn clock);

    ToolContext(const ToolContext&) = delete;
    ToolContext& operator=(const ToolContext&) = delete;

    ReplicatedStore& store() { return store_; }
    HistoryManager& history() { return history_; }
    SelectionManager& selection() { return selection_; }
    GroupResolver& groups() { return groups_; }
    PickSystem& picker() { return picker_; }
    TextMeasurer& measurer() { return measurer_; }
    InlineEditor& inlineEditor() { return inlineEditor_; }
    IdAllocator& ids() { return ids_; }
    double now() const { return clock_(); }

    // ==============================================================================
    // Viewport
    // ==============================================================================

    const Viewport& viewport() const { return viewport_; }
    void setViewport(const Viewport& viewport);
    Point2 canvasToScreen(float x, float y) const { return karta::canvasToScreen(viewport_, x, y); }
    Point2 screenToCanvas(float x, float y) const { return karta::screenToCanvas(viewport_, x, y); }

    // ==============================================================================
    // Snapping
    // ==============================================================================

    GridSettings& grid() { return grid_; }
    const GridSettings& grid() const { return grid_; }

    SnapResult snapPosition(float x, float y, const std::unordered_set<ObjectId>& excludedIds = {}, bool skipSnap = false) const;
    void setActiveSnapGuides(std::vector<SnapGuide> guides) { activeGuides_ = std::move(guides); }
    const std::vector<SnapGuide>& activeSnapGuides() const { return activeGuides_; }

    // ==============================================================================
    // Queries
    // ==============================================================================

    // Top-most pickable object under a screen point, honouring group edit mode.
    const SceneObject* hitTest(float screenX, float screenY);
    std::vector<ObjectId> objectsInRect(float x1, float y1, float x2, float y2);
    // Absolute rectangle of an object, following its parent chain.
    Rect absoluteRect(const SceneObject& obj) const;
    std::optional<ObjectId> editingGroupId() const;

    // ==============================================================================
    // Tool switching / local media state
    // ==============================================================================

    void setToolSwitcher(ToolSwitcher switcher) { switcher_ = std::move(switcher); }
    bool setActiveTool(ToolType type);

    // Playback is local UI state and is never replicated.
    bool toggleVideoPlayback(const ObjectId& id);
    bool isVideoPlaying(const ObjectId& id) const { return playingVideos_.count(id) != 0; }

private:
    ReplicatedStore& store_;
    HistoryManager& history_;
    SelectionManager& selection_;
    GroupResolver& groups_;
    PickSystem& picker_;
    TextMeasurer& measurer_;
    InlineEditor& inlineEditor_;
    IdAllocator& ids_;
    ClockFn clock_;

    Viewport viewport_;
    GridSettings grid_;
    std::vector<SnapGuide> activeGuides_;
    ToolSwitcher switcher_;
    std::unordered_set<ObjectId> playingVideos_;
};

} // namespace karta
