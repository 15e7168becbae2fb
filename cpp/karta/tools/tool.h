#pragma once

#include "karta/tools/overlay_surface.h"
#include "karta/tools/tool_context.h"
#include "karta/tools/tool_types.h"

namespace karta {

class Tool {
public:
    explicit Tool(ToolContext& ctx) : ctx_(ctx) {}
    virtual ~Tool() = default;

    Tool(const Tool&) = delete;
    Tool& operator=(const Tool&) = delete;

    virtual ToolType type() const = 0;
    const char* name() const { return toolName(type()); }

    // Activation starts from a clean state; deactivation abandons any
    // gesture in progress.
    virtual void onActivate();
    virtual void onDeactivate();

    virtual ToolEventResult onMouseDown(const MouseEvent& e) = 0;
    virtual ToolEventResult onMouseMove(const MouseEvent& e) = 0;
    virtual ToolEventResult onMouseUp(const MouseEvent& e) = 0;
    virtual ToolEventResult onKeyDown(const KeyEvent&) { return unhandled(); }
    virtual ToolEventResult onKeyUp(const KeyEvent&) { return unhandled(); }

    virtual void renderOverlay(OverlaySurface&) const {}

    Cursor getCursor() const { return cursor_; }
    bool isActive() const { return active_; }
    virtual bool isOperationActive() const { return false; }

protected:
    virtual void resetState() {}
    virtual Cursor defaultCursor() const { return Cursor::Default; }

    void setCursor(Cursor cursor) { cursor_ = cursor; }

    // Guides along the full overlay height/width.
    void drawSnapGuides(OverlaySurface& surface) const;

    ToolContext& ctx_;

private:
    Cursor cursor_ = Cursor::Default;
    bool active_ = false;
};

} // namespace karta
