#pragma once

#include "karta/tools/drawing_tool.h"

#include <vector>

namespace karta {

// Rectangle and ellipse. Shift constrains to a square/circle, Alt swaps to
// the other kind while held.
class ShapeTool : public DrawingTool {
public:
    ShapeTool(ToolContext& ctx, ObjectKind kind);

    ToolType type() const override;

protected:
    SceneObject createProvisional(const ObjectId& id, Point2 start, std::int32_t zIndex) override;
    ObjectPatch previewPatch() override;
    bool meetsThreshold(const SceneObject& obj) const override;
    bool reactsToModifierKeys() const override { return true; }

private:
    ObjectKind currentKind() const;

    ObjectKind kind_;
};

class FrameTool : public DrawingTool {
public:
    using DrawingTool::DrawingTool;

    ToolType type() const override { return ToolType::Frame; }

protected:
    SceneObject createProvisional(const ObjectId& id, Point2 start, std::int32_t zIndex) override;
    ObjectPatch previewPatch() override;
    bool meetsThreshold(const SceneObject& obj) const override;
};

// Line and arrow. Shift constrains the direction to 45 degree steps.
class LineTool : public DrawingTool {
public:
    LineTool(ToolContext& ctx, ObjectKind kind);

    ToolType type() const override;

protected:
    SceneObject createProvisional(const ObjectId& id, Point2 start, std::int32_t zIndex) override;
    ObjectPatch previewPatch() override;
    bool meetsThreshold(const SceneObject& obj) const override;
    bool reactsToModifierKeys() const override { return true; }

private:
    ObjectKind kind_;
};

// Freehand path. Points are stored relative to the path's bounding box.
class PenTool : public DrawingTool {
public:
    using DrawingTool::DrawingTool;

    ToolType type() const override { return ToolType::Pen; }

    std::size_t pointCount() const { return points_.size(); }

protected:
    SceneObject createProvisional(const ObjectId& id, Point2 start, std::int32_t zIndex) override;
    ObjectPatch previewPatch() override;
    bool meetsThreshold(const SceneObject& obj) const override;
    bool snapsToGrid() const override { return false; }
    void pointerMoved(Point2 p) override { points_.push_back(p); }
    void resetState() override;

private:
    std::vector<Point2> points_;
};

} // namespace karta
