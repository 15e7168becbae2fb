#include "karta/interaction/pick_system.h"
#include "karta/entity/group_resolver.h"
#include "karta/geometry/geometry.h"

#include <algorithm>

namespace karta {

namespace {

bool drawOrderLess(const SceneObject* a, const SceneObject* b) {
    if (a->zIndex != b->zIndex) return a->zIndex < b->zIndex;
    return a->id < b->id;
}

} // namespace

PickSystem::PickSystem(ReplicatedStore& store, QuadTreeOptions options)
    : store_(store), index_(QuadTree::defaultBounds(), options) {
    subscription_ = store_.subscribe([this](const StoreChange&) { dirty_ = true; });
}

PickSystem::~PickSystem() {
    store_.unsubscribe(subscription_);
}

void PickSystem::ensureIndex() {
    if (!dirty_) return;
    index_.clear();
    const ObjectMap& objects = store_.objects();
    for (const auto& [id, obj] : objects) {
        const Rect abs = GroupResolver::getAbsoluteRect(obj, objects);
        index_.insert(QuadTreeItem{id, toAABB(getRotatedBoundingBox(abs, obj.rotation))});
    }
    dirty_ = false;
    stats_.rebuilds++;
}

std::size_t PickSystem::indexedCount() {
    ensureIndex();
    return index_.size();
}

bool PickSystem::pickable(const SceneObject& obj, const std::optional<ObjectId>& editingGroupId) const {
    if (!obj.visible) return false;
    if (editingGroupId) {
        if (obj.id == *editingGroupId) return false;
        if (obj.isChild()) return *obj.parentId() == *editingGroupId;
        return true;
    }
    return !obj.isChild();
}

std::vector<const SceneObject*> PickSystem::candidates(const AABB& area) {
    ensureIndex();
    std::vector<const SceneObject*> out;
    for (const QuadTreeItem& item : index_.query(area)) {
        if (const SceneObject* obj = store_.get(item.id)) {
            out.push_back(obj);
        }
    }
    stats_.candidatesChecked = static_cast<std::uint32_t>(out.size());
    return out;
}

std::optional<ObjectId> PickSystem::pick(float canvasX, float canvasY, const std::optional<ObjectId>& editingGroupId) {
    ensureIndex();
    std::vector<const SceneObject*> hits;
    const ObjectMap& objects = store_.objects();
    for (const QuadTreeItem& item : index_.queryPoint(canvasX, canvasY)) {
        const SceneObject* obj = store_.get(item.id);
        if (!obj || !pickable(*obj, editingGroupId)) continue;
        const Rect abs = GroupResolver::getAbsoluteRect(*obj, objects);
        if (pointInRotatedRect(canvasX, canvasY, abs, obj->rotation)) {
            hits.push_back(obj);
        }
    }
    if (hits.empty()) {
        return std::nullopt;
    }
    return (*std::max_element(hits.begin(), hits.end(), drawOrderLess))->id;
}

std::vector<ObjectId> PickSystem::queryMarquee(const Rect& marquee, const std::optional<ObjectId>& editingGroupId) {
    const ObjectMap& objects = store_.objects();
    std::vector<const SceneObject*> hits;
    for (const SceneObject* obj : candidates(toAABB(marquee))) {
        if (!pickable(*obj, editingGroupId)) continue;
        const Rect abs = GroupResolver::getAbsoluteRect(*obj, objects);
        if (marqueeIntersectsRotatedRect(marquee, abs, obj->rotation)) {
            hits.push_back(obj);
        }
    }
    std::sort(hits.begin(), hits.end(), drawOrderLess);

    std::vector<ObjectId> ids;
    ids.reserve(hits.size());
    for (const SceneObject* obj : hits) ids.push_back(obj->id);
    return ids;
}

std::vector<ObjectId> PickSystem::queryViewport(const Rect& area) {
    std::vector<const SceneObject*> hits;
    for (const SceneObject* obj : candidates(toAABB(area))) {
        if (obj->visible) hits.push_back(obj);
    }
    std::sort(hits.begin(), hits.end(), drawOrderLess);

    std::vector<ObjectId> ids;
    ids.reserve(hits.size());
    for (const SceneObject* obj : hits) ids.push_back(obj->id);
    return ids;
}

} // namespace karta
