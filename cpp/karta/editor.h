#pragma once

#include "karta/core/types.h"
#include "karta/core/util.h"
#include "karta/entity/clipboard.h"
#include "karta/entity/group_resolver.h"
#include "karta/entity/selection_manager.h"
#include "karta/entity/z_order.h"
#include "karta/geometry/viewport.h"
#include "karta/history/history_manager.h"
#include "karta/interaction/pick_system.h"
#include "karta/interaction/snap_types.h"
#include "karta/spatial/quadtree.h"
#include "karta/store/id_allocator.h"
#include "karta/store/replicated_store.h"
#include "karta/text/text_measurer.h"
#include "karta/tools/inline_editor.h"
#include "karta/tools/tool_context.h"
#include "karta/tools/tool_manager.h"

#include <cstdint>
#include <string>
#include <vector>

namespace karta {

struct EditorOptions {
    StoreOptions store;
    QuadTreeOptions spatial;
    GridSettings grid;
    HistoryOptions history;
    ToolType initialTool = ToolType::Select;
};

// One client's editing session: the replicated document plus everything that
// edits it. The host feeds pointer and keyboard events and draws the overlay;
// the replication transport is attached through setChannel().
class Editor {
public:
    explicit Editor(EditorOptions options = {}, ClockFn clock = defaultClock());

    Editor(const Editor&) = delete;
    Editor& operator=(const Editor&) = delete;

    // ==============================================================================
    // Components
    // ==============================================================================

    ReplicatedStore& store() { return store_; }
    HistoryManager& history() { return history_; }
    SelectionManager& selection() { return selection_; }
    GroupResolver& groups() { return groups_; }
    PickSystem& picker() { return picker_; }
    TextMeasurer& textMeasurer() { return measurer_; }
    InlineEditor& inlineEditor() { return inlineEditor_; }
    ToolContext& toolContext() { return toolContext_; }
    ToolManager& tools() { return tools_; }
    Clipboard& clipboard() { return clipboard_; }
    ZOrderController& zOrder() { return zOrder_; }

    void setChannel(ReplicationChannel* channel) { store_.setChannel(channel); }
    // Glyph-accurate text widths; without one, text is measured by estimate.
    void setLineShaper(LineShaper* shaper) { measurer_.setShaper(shaper); }

    // Publishes coalesced writes whose window has elapsed. Call once per frame.
    void pump() { store_.pump(); }

    // ==============================================================================
    // Input
    // ==============================================================================

    ToolEventResult mouseDown(float screenX, float screenY, int button, std::uint32_t modifiers);
    ToolEventResult mouseMove(float screenX, float screenY, int button, std::uint32_t modifiers);
    ToolEventResult mouseUp(float screenX, float screenY, int button, std::uint32_t modifiers);

    // Active tool first, then editor shortcuts.
    ToolEventResult keyDown(const KeyEvent& e);
    ToolEventResult keyUp(const KeyEvent& e);

    // Inline editing, fed by the host's text field.
    bool textInput(const std::string& value) { return inlineEditor_.input(value); }
    bool commitTextEdit() { return inlineEditor_.commit(); }
    void cancelTextEdit() { inlineEditor_.cancel(); }

    void renderOverlay(OverlaySurface& surface) const { tools_.renderOverlay(surface); }
    Cursor cursor() const { return tools_.getCursor(); }

    bool setActiveTool(ToolType type) { return tools_.setActiveTool(type); }
    ToolType activeTool() const;

    // ==============================================================================
    // Commands (each is one undo step, false when there is nothing to do)
    // ==============================================================================

    bool deleteSelection();
    bool undo();
    bool redo();
    bool copySelection();
    bool paste();
    bool duplicateSelection();
    void selectAll();
    bool groupSelection();
    bool ungroupSelection();
    bool bringForward();
    bool sendBackward();
    bool bringToFront();
    bool sendToBack();
    bool nudgeSelection(float dx, float dy, bool recordHistory = true);
    bool alignSelection(AlignMode mode) { return selection_.alignSelection(mode, history_); }
    bool distributeSelection(DistributeAxis axis) { return selection_.distributeSelection(axis, history_); }

    // ==============================================================================
    // Viewport
    // ==============================================================================

    void setCanvasSize(float width, float height);
    const Viewport& viewport() const { return toolContext_.viewport(); }
    void setViewport(const Viewport& viewport) { toolContext_.setViewport(viewport); }
    void zoomAt(float screenX, float screenY, float zoom);
    void setZoomPreset(float zoom);
    // Fits every visible top-level object; an empty document resets the view.
    void zoomToFit();
    bool zoomToSelection();

    GridSettings& grid() { return toolContext_.grid(); }

private:
    bool handleShortcut(const KeyEvent& e);
    bool handleToolKey(const std::string& key);
    bool handleEscape();
    MouseEvent makeMouseEvent(float screenX, float screenY, int button, std::uint32_t modifiers) const;
    std::vector<ObjectId> editableSelection() const;
    // Closes an open inline edit before a command touches the document.
    void settleInlineEdit();

    ClockFn clock_;
    ReplicatedStore store_;
    HistoryManager history_;
    SelectionManager selection_;
    IdAllocator ids_;
    GroupResolver groups_;
    PickSystem picker_;
    TextMeasurer measurer_;
    InlineEditor inlineEditor_;
    ToolContext toolContext_;
    ToolManager tools_;
    Clipboard clipboard_;
    ZOrderController zOrder_;

    float canvasWidth_ = 0.0f;
    float canvasHeight_ = 0.0f;
};

} // namespace karta
