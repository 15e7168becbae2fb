#pragma once

#include "karta/tools/tool.h"

#include <functional>
#include <map>
#include <memory>

namespace karta {

using ToolChangedListener = std::function<void(ToolType)>;

// Owns the registered tools and routes input to the active one. Switching
// tools deactivates the outgoing tool before activating the incoming one.
class ToolManager {
public:
    explicit ToolManager(ToolContext& ctx);

    ToolManager(const ToolManager&) = delete;
    ToolManager& operator=(const ToolManager&) = delete;

    void registerTool(std::unique_ptr<Tool> tool);
    // Select, hand, rectangle, ellipse, text, frame, pen, line and arrow.
    void registerDefaultTools();

    // Unknown tools are refused with a warning and leave the current one active.
    bool setActiveTool(ToolType type);
    Tool* getActiveTool() const { return active_; }
    Tool* getTool(ToolType type) const;
    std::optional<ToolType> activeToolType() const;

    ToolEventResult handleMouseDown(const MouseEvent& e);
    ToolEventResult handleMouseMove(const MouseEvent& e);
    ToolEventResult handleMouseUp(const MouseEvent& e);
    ToolEventResult handleKeyDown(const KeyEvent& e);
    ToolEventResult handleKeyUp(const KeyEvent& e);

    void renderOverlay(OverlaySurface& surface) const;

    Cursor getCursor() const;
    bool isOperationActive() const;

    void setToolChangedListener(ToolChangedListener listener) { toolChanged_ = std::move(listener); }

private:
    ToolContext& ctx_;
    std::map<ToolType, std::unique_ptr<Tool>> tools_;
    Tool* active_ = nullptr;
    ToolChangedListener toolChanged_;
};

} // namespace karta
