#include "karta/interaction/snap_solver.h"

#include <algorithm>
#include <cmath>

namespace karta {

namespace {

bool snapTarget(const SceneObject& obj, const std::unordered_set<ObjectId>& excludedIds) {
    if (!obj.visible || obj.isChild()) return false;
    if (excludedIds.count(obj.id) != 0) return false;
    if (!std::isfinite(obj.width) || !std::isfinite(obj.height)) return false;
    if (obj.width <= 0.0f || obj.height <= 0.0f) return false;
    return std::isfinite(obj.x) && std::isfinite(obj.y);
}

// Returns the first of `a`, `b`, `c` strictly within `threshold` of `v`.
bool nearestEdge(float v, float a, float b, float c, float threshold, float& out) {
    if (std::abs(v - a) < threshold) {
        out = a;
        return true;
    }
    if (std::abs(v - b) < threshold) {
        out = b;
        return true;
    }
    if (std::abs(v - c) < threshold) {
        out = c;
        return true;
    }
    return false;
}

} // namespace

float snapValueToGrid(float value, float gridSize) {
    if (gridSize <= 0.0f) return value;
    return std::round(value / gridSize) * gridSize;
}

SnapResult computeSnappedPosition(
    float x,
    float y,
    const GridSettings& grid,
    const std::vector<const SceneObject*>& objects,
    const std::unordered_set<ObjectId>& excludedIds,
    bool skipSnap) {

    SnapResult result{x, y, {}};
    if (skipSnap || (!grid.snapEnabled && !grid.snapToObjects)) {
        return result;
    }

    if (isGridSnapEnabled(grid)) {
        result.x = snapValueToGrid(x, grid.size);
        result.y = snapValueToGrid(y, grid.size);
    }

    if (!grid.snapToObjects) {
        return result;
    }

    std::vector<const SceneObject*> ordered;
    ordered.reserve(objects.size());
    for (const SceneObject* obj : objects) {
        if (obj && snapTarget(*obj, excludedIds)) {
            ordered.push_back(obj);
        }
    }
    std::sort(ordered.begin(), ordered.end(), [](const SceneObject* a, const SceneObject* b) {
        if (a->zIndex != b->zIndex) return a->zIndex < b->zIndex;
        return a->id < b->id;
    });

    const float threshold = grid.objectSnapThreshold;
    bool xLocked = false;
    bool yLocked = false;
    for (const SceneObject* obj : ordered) {
        float snapped = 0.0f;
        if (!xLocked &&
            nearestEdge(x, obj->x, obj->x + obj->width * 0.5f, obj->x + obj->width, threshold, snapped)) {
            result.x = snapped;
            result.guides.push_back(SnapGuide{GuideType::Vertical, snapped, obj->id});
            xLocked = true;
        }
        if (!yLocked &&
            nearestEdge(y, obj->y, obj->y + obj->height * 0.5f, obj->y + obj->height, threshold, snapped)) {
            result.y = snapped;
            result.guides.push_back(SnapGuide{GuideType::Horizontal, snapped, obj->id});
            yLocked = true;
        }
        if (xLocked && yLocked) break;
    }
    return result;
}

SnapResult computeSnappedPosition(
    float x,
    float y,
    const GridSettings& grid,
    const ObjectMap& objects,
    const std::unordered_set<ObjectId>& excludedIds,
    bool skipSnap) {

    std::vector<const SceneObject*> list;
    list.reserve(objects.size());
    for (const auto& [id, obj] : objects) {
        list.push_back(&obj);
    }
    return computeSnappedPosition(x, y, grid, list, excludedIds, skipSnap);
}

} // namespace karta
