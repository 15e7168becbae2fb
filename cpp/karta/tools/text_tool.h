#pragma once

#include "karta/tools/tool.h"

namespace karta {

// A click places an empty text object, selects it, hands over to the select
// tool and opens inline editing on it.
class TextTool : public Tool {
public:
    using Tool::Tool;

    ToolType type() const override { return ToolType::Text; }

    ToolEventResult onMouseDown(const MouseEvent& e) override;
    ToolEventResult onMouseMove(const MouseEvent&) override { return unhandled(); }
    ToolEventResult onMouseUp(const MouseEvent&) override { return unhandled(); }

protected:
    Cursor defaultCursor() const override { return Cursor::Text; }
};

// Drag pans the viewport by the screen delta divided by zoom.
class HandTool : public Tool {
public:
    using Tool::Tool;

    ToolType type() const override { return ToolType::Hand; }

    ToolEventResult onMouseDown(const MouseEvent& e) override;
    ToolEventResult onMouseMove(const MouseEvent& e) override;
    ToolEventResult onMouseUp(const MouseEvent& e) override;

    bool isOperationActive() const override { return panning_; }

protected:
    Cursor defaultCursor() const override { return Cursor::Grab; }
    void resetState() override;

private:
    bool panning_ = false;
    Point2 lastScreen_{0.0f, 0.0f};
};

} // namespace karta
