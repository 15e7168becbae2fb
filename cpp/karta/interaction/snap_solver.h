#pragma once

#include "karta/interaction/snap_types.h"
#include "karta/scene/scene_object.h"

#include <unordered_set>
#include <vector>

namespace karta {

float snapValueToGrid(float value, float gridSize);

// Grid snapping rounds each axis independently. Object snapping compares the
// unsnapped point against left/centre/right and top/middle/bottom of every
// visible top-level object not in `excludedIds`; the first object within the
// threshold wins per axis and yields one guide. Objects are visited in draw
// order (zIndex, then id) so the result does not depend on map iteration.
SnapResult computeSnappedPosition(
    float x,
    float y,
    const GridSettings& grid,
    const std::vector<const SceneObject*>& objects,
    const std::unordered_set<ObjectId>& excludedIds,
    bool skipSnap = false);

SnapResult computeSnappedPosition(
    float x,
    float y,
    const GridSettings& grid,
    const ObjectMap& objects,
    const std::unordered_set<ObjectId>& excludedIds,
    bool skipSnap = false);

} // namespace karta
