#include "karta/entity/z_order.h"
#include "karta/history/history_manager.h"
#include "karta/store/replicated_store.h"

#include <algorithm>
#include <unordered_set>

namespace karta {

namespace {

ObjectUpdate zUpdate(const ObjectId& id, std::int32_t z) {
    ObjectUpdate update{id, {}};
    update.patch.setZIndex(z);
    return update;
}

bool drawOrderLess(const SceneObject* a, const SceneObject* b) {
    if (a->zIndex != b->zIndex) return a->zIndex < b->zIndex;
    return a->id < b->id;
}

std::vector<const SceneObject*> sortedObjects(const ObjectMap& objects) {
    std::vector<const SceneObject*> out;
    out.reserve(objects.size());
    for (const auto& [id, obj] : objects) {
        out.push_back(&obj);
    }
    std::sort(out.begin(), out.end(), drawOrderLess);
    return out;
}

// Existing selected objects, deduplicated, in draw order.
std::vector<const SceneObject*> resolveSelection(const ObjectMap& objects, const std::vector<ObjectId>& ids) {
    std::vector<const SceneObject*> out;
    std::unordered_set<ObjectId> seen;
    for (const ObjectId& id : ids) {
        auto it = objects.find(id);
        if (it == objects.end() || !seen.insert(id).second) continue;
        out.push_back(&it->second);
    }
    std::sort(out.begin(), out.end(), drawOrderLess);
    return out;
}

// Gives `order` the zIndex slots `current` occupies, strictly increasing.
// Only objects whose zIndex changes get an update.
std::vector<ObjectUpdate> renumber(const std::vector<const SceneObject*>& current,
                                   const std::vector<const SceneObject*>& order) {
    std::vector<ObjectUpdate> updates;
    if (order == current) return updates;

    std::int32_t previous = 0;
    for (std::size_t i = 0; i < order.size(); ++i) {
        std::int32_t z = current[i]->zIndex;
        if (i > 0 && z <= previous) z = previous + 1;
        previous = z;
        if (order[i]->zIndex != z) {
            updates.push_back(zUpdate(order[i]->id, z));
        }
    }
    return updates;
}

} // namespace

std::vector<ObjectUpdate> calculateReorder(const ObjectMap& objects, const ObjectId& id, std::int32_t newZIndex) {
    std::vector<ObjectUpdate> updates;
    auto target = objects.find(id);
    if (target == objects.end()) return updates;

    const std::int32_t oldZ = target->second.zIndex;
    if (oldZ == newZIndex) return updates;

    for (const SceneObject* obj : sortedObjects(objects)) {
        if (obj->id == id) continue;
        if (newZIndex > oldZ && obj->zIndex > oldZ && obj->zIndex <= newZIndex) {
            updates.push_back(zUpdate(obj->id, obj->zIndex - 1));
        } else if (newZIndex < oldZ && obj->zIndex >= newZIndex && obj->zIndex < oldZ) {
            updates.push_back(zUpdate(obj->id, obj->zIndex + 1));
        }
    }
    updates.push_back(zUpdate(id, newZIndex));
    return updates;
}

std::vector<ObjectUpdate> calculateBringToFront(const ObjectMap& objects, const std::vector<ObjectId>& selected) {
    std::vector<ObjectUpdate> updates;
    const auto chosen = resolveSelection(objects, selected);
    if (chosen.empty()) return updates;

    std::int32_t maxZ = chosen.front()->zIndex;
    for (const auto& [id, obj] : objects) {
        maxZ = std::max(maxZ, obj.zIndex);
    }
    for (const SceneObject* obj : chosen) {
        updates.push_back(zUpdate(obj->id, ++maxZ));
    }
    return updates;
}

std::vector<ObjectUpdate> calculateSendToBack(const ObjectMap& objects, const std::vector<ObjectId>& selected) {
    std::vector<ObjectUpdate> updates;
    const auto chosen = resolveSelection(objects, selected);
    if (chosen.empty()) return updates;

    std::int32_t minZ = chosen.front()->zIndex;
    for (const auto& [id, obj] : objects) {
        minZ = std::min(minZ, obj.zIndex);
    }
    std::int32_t z = minZ - static_cast<std::int32_t>(chosen.size());
    for (const SceneObject* obj : chosen) {
        updates.push_back(zUpdate(obj->id, z++));
    }
    return updates;
}

std::vector<ObjectUpdate> calculateBringForward(const ObjectMap& objects, const std::vector<ObjectId>& selected) {
    std::unordered_set<ObjectId> chosenIds;
    for (const SceneObject* obj : resolveSelection(objects, selected)) chosenIds.insert(obj->id);
    if (chosenIds.empty()) return {};

    const auto current = sortedObjects(objects);
    auto order = current;
    // Top down, so a selected run climbs past its neighbour as a block.
    for (std::size_t i = order.size(); i-- > 1;) {
        if (chosenIds.count(order[i - 1]->id) != 0 && chosenIds.count(order[i]->id) == 0) {
            std::swap(order[i - 1], order[i]);
        }
    }
    return renumber(current, order);
}

std::vector<ObjectUpdate> calculateSendBackward(const ObjectMap& objects, const std::vector<ObjectId>& selected) {
    std::unordered_set<ObjectId> chosenIds;
    for (const SceneObject* obj : resolveSelection(objects, selected)) chosenIds.insert(obj->id);
    if (chosenIds.empty()) return {};

    const auto current = sortedObjects(objects);
    auto order = current;
    for (std::size_t i = 1; i < order.size(); ++i) {
        if (chosenIds.count(order[i]->id) != 0 && chosenIds.count(order[i - 1]->id) == 0) {
            std::swap(order[i - 1], order[i]);
        }
    }
    return renumber(current, order);
}

// ==============================================================================
// ZOrderController
// ==============================================================================

ZOrderController::ZOrderController(ReplicatedStore& store, HistoryManager& history)
    : store_(store), history_(history) {}

bool ZOrderController::commit(const std::vector<ObjectUpdate>& updates) {
    if (updates.empty()) {
        return false;
    }
    history_.pushCurrent();
    return store_.applyMany(updates);
}

bool ZOrderController::reorderObject(const ObjectId& id, std::int32_t newZIndex) {
    return commit(calculateReorder(store_.objects(), id, newZIndex));
}

bool ZOrderController::bringToFront(const std::vector<ObjectId>& ids) {
    return commit(calculateBringToFront(store_.objects(), ids));
}

bool ZOrderController::sendToBack(const std::vector<ObjectId>& ids) {
    return commit(calculateSendToBack(store_.objects(), ids));
}

bool ZOrderController::bringForward(const std::vector<ObjectId>& ids) {
    return commit(calculateBringForward(store_.objects(), ids));
}

bool ZOrderController::sendBackward(const std::vector<ObjectId>& ids) {
    return commit(calculateSendBackward(store_.objects(), ids));
}

} // namespace karta
