#include "karta/tools/shape_tools.h"

#include "karta/core/constants.h"
#include "karta/geometry/geometry.h"
#include "karta/store/replicated_store.h"

#include <algorithm>
#include <cmath>

namespace karta {

namespace {

bool clearsMinimumSize(const SceneObject& obj) {
    return !(obj.width < constants::kMinObjectSize && obj.height < constants::kMinObjectSize);
}

} // namespace

// ==============================================================================
// ShapeTool
// ==============================================================================

ShapeTool::ShapeTool(ToolContext& ctx, ObjectKind kind) : DrawingTool(ctx), kind_(kind) {}

ToolType ShapeTool::type() const {
    return kind_ == ObjectKind::Ellipse ? ToolType::Ellipse : ToolType::Rectangle;
}

ObjectKind ShapeTool::currentKind() const {
    if (!altHeld()) {
        return kind_;
    }
    return kind_ == ObjectKind::Ellipse ? ObjectKind::Rectangle : ObjectKind::Ellipse;
}

SceneObject ShapeTool::createProvisional(const ObjectId& id, Point2 start, std::int32_t zIndex) {
    return makeObject(currentKind(), id, start.x, start.y, 0.0f, 0.0f, zIndex);
}

ObjectPatch ShapeTool::previewPatch() {
    const Point2 end = snapPoint(pointer_.x, pointer_.y);
    ObjectPatch patch;
    patch.setKind(currentKind());
    patch.setRect(dragRect(start_, end, shiftHeld()));
    return patch;
}

bool ShapeTool::meetsThreshold(const SceneObject& obj) const {
    return clearsMinimumSize(obj);
}

// ==============================================================================
// FrameTool
// ==============================================================================

SceneObject FrameTool::createProvisional(const ObjectId& id, Point2 start, std::int32_t zIndex) {
    return makeObject(ObjectKind::Frame, id, start.x, start.y, 0.0f, 0.0f, zIndex);
}

ObjectPatch FrameTool::previewPatch() {
    const Point2 end = snapPoint(pointer_.x, pointer_.y);
    ObjectPatch patch;
    patch.setRect(dragRect(start_, end, false));
    return patch;
}

bool FrameTool::meetsThreshold(const SceneObject& obj) const {
    return clearsMinimumSize(obj);
}

// ==============================================================================
// LineTool
// ==============================================================================

LineTool::LineTool(ToolContext& ctx, ObjectKind kind) : DrawingTool(ctx), kind_(kind) {}

ToolType LineTool::type() const {
    return kind_ == ObjectKind::Arrow ? ToolType::Arrow : ToolType::Line;
}

SceneObject LineTool::createProvisional(const ObjectId& id, Point2 start, std::int32_t zIndex) {
    return makeObject(kind_, id, start.x, start.y, 1.0f, 1.0f, zIndex);
}

ObjectPatch LineTool::previewPatch() {
    Point2 end;
    if (shiftHeld()) {
        // The angle constraint wins over snapping.
        ctx_.setActiveSnapGuides({});
        end = snapAngle(start_, pointer_, constants::kLineAngleSnapDeg);
    } else {
        end = snapPoint(pointer_.x, pointer_.y);
    }

    const float x = std::min(start_.x, end.x);
    const float y = std::min(start_.y, end.y);
    ObjectPatch patch;
    patch.setRect(Rect{x, y, std::max(std::fabs(end.x - start_.x), 1.0f), std::max(std::fabs(end.y - start_.y), 1.0f)});
    patch.setEndpoints(start_.x - x, start_.y - y, end.x - x, end.y - y);
    return patch;
}

bool LineTool::meetsThreshold(const SceneObject& obj) const {
    const float dx = obj.x2 - obj.x1;
    const float dy = obj.y2 - obj.y1;
    return std::sqrt(dx * dx + dy * dy) >= constants::kMinObjectSize;
}

// ==============================================================================
// PenTool
// ==============================================================================

SceneObject PenTool::createProvisional(const ObjectId& id, Point2 start, std::int32_t zIndex) {
    points_.assign(1, start);
    SceneObject obj = makeObject(ObjectKind::Path, id, start.x, start.y, 1.0f, 1.0f, zIndex);
    obj.points.assign(1, Point2{0.0f, 0.0f});
    return obj;
}

ObjectPatch PenTool::previewPatch() {
    ObjectPatch patch;
    if (points_.empty()) {
        return patch;
    }

    float minX = points_[0].x;
    float minY = points_[0].y;
    float maxX = minX;
    float maxY = minY;
    for (const Point2& p : points_) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    }

    std::vector<Point2> local;
    local.reserve(points_.size());
    for (const Point2& p : points_) {
        local.push_back(Point2{p.x - minX, p.y - minY});
    }

    patch.setRect(Rect{minX, minY, std::max(maxX - minX, 1.0f), std::max(maxY - minY, 1.0f)});
    patch.setPoints(std::move(local));
    return patch;
}

bool PenTool::meetsThreshold(const SceneObject& obj) const {
    return obj.points.size() >= constants::kMinPathPoints;
}

void PenTool::resetState() {
    DrawingTool::resetState();
    points_.clear();
}

} // namespace karta
