#include "karta/tools/tool_manager.h"

#include "karta/core/logging.h"
#include "karta/tools/select_tool.h"
#include "karta/tools/shape_tools.h"
#include "karta/tools/text_tool.h"

#include <utility>

namespace karta {

ToolManager::ToolManager(ToolContext& ctx) : ctx_(ctx) {
    ctx_.setToolSwitcher([this](ToolType type) { return setActiveTool(type); });
}

void ToolManager::registerTool(std::unique_ptr<Tool> tool) {
    if (!tool) {
        return;
    }
    const ToolType type = tool->type();
    auto it = tools_.find(type);
    if (it != tools_.end() && it->second.get() == active_) {
        active_->onDeactivate();
        active_ = nullptr;
    }
    tools_[type] = std::move(tool);
}

void ToolManager::registerDefaultTools() {
    registerTool(std::make_unique<SelectTool>(ctx_));
    registerTool(std::make_unique<HandTool>(ctx_));
    registerTool(std::make_unique<ShapeTool>(ctx_, ObjectKind::Rectangle));
    registerTool(std::make_unique<ShapeTool>(ctx_, ObjectKind::Ellipse));
    registerTool(std::make_unique<TextTool>(ctx_));
    registerTool(std::make_unique<FrameTool>(ctx_));
    registerTool(std::make_unique<PenTool>(ctx_));
    registerTool(std::make_unique<LineTool>(ctx_, ObjectKind::Line));
    registerTool(std::make_unique<LineTool>(ctx_, ObjectKind::Arrow));
}

bool ToolManager::setActiveTool(ToolType type) {
    auto it = tools_.find(type);
    if (it == tools_.end()) {
        KARTA_LOG_WARN("tool '%s' is not registered", toolName(type));
        return false;
    }
    Tool* next = it->second.get();
    if (next == active_) {
        return true;
    }

    Tool* previous = active_;
    active_ = next;
    if (previous) {
        previous->onDeactivate();
    }
    next->onActivate();

    if (toolChanged_) {
        toolChanged_(type);
    }
    return true;
}

Tool* ToolManager::getTool(ToolType type) const {
    auto it = tools_.find(type);
    return it != tools_.end() ? it->second.get() : nullptr;
}

std::optional<ToolType> ToolManager::activeToolType() const {
    if (!active_) {
        return std::nullopt;
    }
    return active_->type();
}

// ==============================================================================
// Routing
// ==============================================================================

ToolEventResult ToolManager::handleMouseDown(const MouseEvent& e) {
    return active_ ? active_->onMouseDown(e) : unhandled();
}

ToolEventResult ToolManager::handleMouseMove(const MouseEvent& e) {
    return active_ ? active_->onMouseMove(e) : unhandled();
}

ToolEventResult ToolManager::handleMouseUp(const MouseEvent& e) {
    return active_ ? active_->onMouseUp(e) : unhandled();
}

ToolEventResult ToolManager::handleKeyDown(const KeyEvent& e) {
    return active_ ? active_->onKeyDown(e) : unhandled();
}

ToolEventResult ToolManager::handleKeyUp(const KeyEvent& e) {
    return active_ ? active_->onKeyUp(e) : unhandled();
}

void ToolManager::renderOverlay(OverlaySurface& surface) const {
    if (active_) {
        active_->renderOverlay(surface);
    }
}

Cursor ToolManager::getCursor() const {
    return active_ ? active_->getCursor() : Cursor::Default;
}

bool ToolManager::isOperationActive() const {
    return active_ && active_->isOperationActive();
}

} // namespace karta
