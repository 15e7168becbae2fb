#include "karta/entity/selection_manager.h"
#include "karta/entity/group_resolver.h"
#include "karta/geometry/geometry.h"
#include "karta/history/history_manager.h"

#include <algorithm>
#include <numeric>

namespace karta {

namespace {

struct Placed {
    const SceneObject* obj;
    Rect bounds;
};

std::vector<Placed> placeObjects(const std::vector<ObjectId>& ids, const ObjectMap& objects) {
    std::vector<Placed> out;
    out.reserve(ids.size());
    for (const ObjectId& id : ids) {
        auto it = objects.find(id);
        if (it == objects.end()) continue;
        const SceneObject& obj = it->second;
        const Rect abs = GroupResolver::getAbsoluteRect(obj, objects);
        out.push_back(Placed{&obj, getRotatedBoundingBox(abs, obj.rotation)});
    }
    return out;
}

} // namespace

SelectionManager::SelectionManager(ReplicatedStore& store)
    : store_(store) {
    storeSubscription_ = store_.subscribe([this](const StoreChange& change) {
        if (!change.removed.empty()) {
            prune();
        }
        // zIndex edits can reorder the selection without changing it.
        if (!set_.empty() && !change.upserted.empty()) {
            rebuildOrder();
        }
    });
}

SelectionManager::~SelectionManager() {
    store_.unsubscribe(storeSubscription_);
}

void SelectionManager::setSelection(const std::vector<ObjectId>& ids, SelectionMode mode) {
    bool changed = false;

    auto applyInsert = [&](const ObjectId& id) {
        if (set_.insert(id).second) {
            changed = true;
        }
    };
    auto applyErase = [&](const ObjectId& id) {
        if (set_.erase(id) != 0) {
            changed = true;
        }
    };

    if (mode == SelectionMode::Replace) {
        std::unordered_set<ObjectId> next;
        for (const ObjectId& id : ids) {
            if (store_.contains(id)) next.insert(id);
        }
        if (next != set_) {
            set_ = std::move(next);
            changed = true;
        }
    } else {
        for (const ObjectId& id : ids) {
            if (!store_.contains(id)) continue;
            switch (mode) {
                case SelectionMode::Replace:
                case SelectionMode::Add:
                    applyInsert(id);
                    break;
                case SelectionMode::Remove:
                    applyErase(id);
                    break;
                case SelectionMode::Toggle:
                    if (set_.count(id) != 0) {
                        applyErase(id);
                    } else {
                        applyInsert(id);
                    }
                    break;
            }
        }
    }

    if (changed) {
        commitChange();
    }
}

void SelectionManager::clearSelection() {
    if (set_.empty()) return;
    set_.clear();
    commitChange();
}

void SelectionManager::selectAll(const std::optional<ObjectId>& editingGroupId) {
    std::vector<ObjectId> ids;
    for (const SceneObject* obj : store_.sortedByZ()) {
        if (editingGroupId) {
            if (obj->parentId() && *obj->parentId() == *editingGroupId) ids.push_back(obj->id);
        } else if (!obj->isChild()) {
            ids.push_back(obj->id);
        }
    }
    setSelection(ids, SelectionMode::Replace);
}

void SelectionManager::prune() {
    bool changed = false;
    for (auto it = set_.begin(); it != set_.end();) {
        if (!store_.contains(*it)) {
            it = set_.erase(it);
            changed = true;
        } else {
            ++it;
        }
    }
    if (changed) {
        commitChange();
    }
}

void SelectionManager::rebuildOrder() {
    ordered_.clear();
    ordered_.reserve(set_.size());
    for (const SceneObject* obj : store_.sortedByZ()) {
        if (set_.count(obj->id) != 0) {
            ordered_.push_back(obj->id);
        }
    }
}

void SelectionManager::commitChange() {
    rebuildOrder();
    generation_++;
    const auto listeners = listeners_;
    for (const auto& [id, listener] : listeners) {
        if (listener) listener(ordered_);
    }
}

SubscriptionId SelectionManager::subscribe(SelectionListener listener) {
    const SubscriptionId id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void SelectionManager::unsubscribe(SubscriptionId id) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
            [id](const auto& entry) { return entry.first == id; }),
        listeners_.end());
}

// ==============================================================================
// Alignment / distribution
// ==============================================================================

bool SelectionManager::alignSelection(AlignMode mode, HistoryManager& history) {
    const std::vector<Placed> placed = placeObjects(ordered_, store_.objects());
    if (placed.size() < 2) {
        return false;
    }

    float target = 0.0f;
    switch (mode) {
        case AlignMode::Left:
            target = placed.front().bounds.x;
            for (const Placed& p : placed) target = std::min(target, p.bounds.x);
            break;
        case AlignMode::Right:
            target = placed.front().bounds.right();
            for (const Placed& p : placed) target = std::max(target, p.bounds.right());
            break;
        case AlignMode::Top:
            target = placed.front().bounds.y;
            for (const Placed& p : placed) target = std::min(target, p.bounds.y);
            break;
        case AlignMode::Bottom:
            target = placed.front().bounds.bottom();
            for (const Placed& p : placed) target = std::max(target, p.bounds.bottom());
            break;
        case AlignMode::CenterH:
            for (const Placed& p : placed) target += p.bounds.centerX();
            target /= static_cast<float>(placed.size());
            break;
        case AlignMode::CenterV:
            for (const Placed& p : placed) target += p.bounds.centerY();
            target /= static_cast<float>(placed.size());
            break;
    }

    std::vector<ObjectUpdate> updates;
    for (const Placed& p : placed) {
        ObjectUpdate update{p.obj->id, {}};
        switch (mode) {
            case AlignMode::Left: update.patch.setX(p.obj->x + (target - p.bounds.x)); break;
            case AlignMode::Right: update.patch.setX(p.obj->x + (target - p.bounds.right())); break;
            case AlignMode::Top: update.patch.setY(p.obj->y + (target - p.bounds.y)); break;
            case AlignMode::Bottom: update.patch.setY(p.obj->y + (target - p.bounds.bottom())); break;
            case AlignMode::CenterH: update.patch.setX(p.obj->x + (target - p.bounds.centerX())); break;
            case AlignMode::CenterV: update.patch.setY(p.obj->y + (target - p.bounds.centerY())); break;
        }
        updates.push_back(std::move(update));
    }

    history.pushCurrent();
    return store_.applyMany(updates);
}

bool SelectionManager::distributeSelection(DistributeAxis axis, HistoryManager& history) {
    std::vector<Placed> placed = placeObjects(ordered_, store_.objects());
    if (placed.size() < 3) {
        return false;
    }

    const bool horizontal = axis == DistributeAxis::Horizontal;
    auto start = [horizontal](const Placed& p) { return horizontal ? p.bounds.x : p.bounds.y; };
    auto extent = [horizontal](const Placed& p) { return horizontal ? p.bounds.width : p.bounds.height; };

    std::stable_sort(placed.begin(), placed.end(), [&](const Placed& a, const Placed& b) {
        return start(a) < start(b);
    });

    const Placed& first = placed.front();
    const Placed& last = placed.back();
    const float span = (start(last) + extent(last)) - start(first);
    const float occupied = std::accumulate(placed.begin(), placed.end(), 0.0f,
        [&](float sum, const Placed& p) { return sum + extent(p); });
    const float gap = (span - occupied) / static_cast<float>(placed.size() - 1);

    std::vector<ObjectUpdate> updates;
    float cursor = start(first);
    for (const Placed& p : placed) {
        ObjectUpdate update{p.obj->id, {}};
        const float delta = cursor - start(p);
        if (horizontal) {
            update.patch.setX(p.obj->x + delta);
        } else {
            update.patch.setY(p.obj->y + delta);
        }
        updates.push_back(std::move(update));
        cursor += extent(p) + gap;
    }

    history.pushCurrent();
    return store_.applyMany(updates);
}

} // namespace karta
