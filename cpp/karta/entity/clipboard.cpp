#include "karta/entity/clipboard.h"
#include "karta/core/logging.h"
#include "karta/entity/group_resolver.h"
#include "karta/entity/selection_manager.h"
#include "karta/history/history_manager.h"
#include "karta/store/id_allocator.h"
#include "karta/store/replicated_store.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace karta {

Clipboard::Clipboard(ReplicatedStore& store, HistoryManager& history, SelectionManager& selection, IdAllocator& ids)
    : store_(store), history_(history), selection_(selection), ids_(ids) {}

std::vector<SceneObject> Clipboard::capture(const std::vector<ObjectId>& ids) const {
    const ObjectMap& objects = store_.objects();
    std::vector<SceneObject> out;
    std::unordered_set<ObjectId> taken;

    std::vector<const SceneObject*> roots;
    for (const ObjectId& id : ids) {
        auto it = objects.find(id);
        if (it == objects.end() || taken.count(id) != 0) continue;
        roots.push_back(&it->second);
        taken.insert(id);
    }
    // A root that is also a descendant of another root is copied with that root.
    std::unordered_set<ObjectId> nested;
    for (const SceneObject* root : roots) {
        for (const ObjectId& d : GroupResolver::collectDescendants(root->id, objects)) {
            nested.insert(d);
        }
    }

    std::unordered_set<ObjectId> emitted;
    for (const SceneObject* root : roots) {
        if (nested.count(root->id) != 0) continue;
        if (!validateObject(*root, fieldsForKind(root->kind))) {
            KARTA_LOG_WARN("clipboard skipped invalid object %s", root->id.c_str());
            continue;
        }

        SceneObject copy = *root;
        const Point2 abs = GroupResolver::getAbsolutePosition(*root, objects);
        copy.x = abs.x;
        copy.y = abs.y;
        GroupResolver::setParent(copy, std::nullopt);
        out.push_back(std::move(copy));
        emitted.insert(root->id);

        for (const ObjectId& d : GroupResolver::collectDescendants(root->id, objects)) {
            const SceneObject& child = objects.at(d);
            if (!validateObject(child, fieldsForKind(child.kind))) {
                KARTA_LOG_WARN("clipboard skipped invalid object %s", d.c_str());
                continue;
            }
            if (emitted.insert(d).second) {
                out.push_back(child);
            }
        }
    }
    return out;
}

std::vector<ObjectId> Clipboard::instantiate(const std::vector<SceneObject>& items, float offset) {
    std::vector<ObjectId> roots;
    if (items.empty()) {
        return roots;
    }

    std::unordered_map<ObjectId, ObjectId> remap;
    for (const SceneObject& item : items) {
        remap.emplace(item.id, ids_.next());
    }

    std::vector<const SceneObject*> ordered;
    ordered.reserve(items.size());
    for (const SceneObject& item : items) ordered.push_back(&item);
    std::stable_sort(ordered.begin(), ordered.end(), [](const SceneObject* a, const SceneObject* b) {
        return a->zIndex < b->zIndex;
    });

    std::int32_t z = store_.nextZIndex();
    std::vector<ObjectUpdate> updates;
    updates.reserve(items.size());
    for (const SceneObject* item : ordered) {
        SceneObject obj = *item;
        obj.id = remap.at(item->id);
        obj.zIndex = z++;

        const bool isRoot = !item->parentId() || remap.count(*item->parentId()) == 0;
        if (isRoot) {
            obj.x += offset;
            obj.y += offset;
            GroupResolver::setParent(obj, std::nullopt);
            roots.push_back(obj.id);
        } else {
            GroupResolver::setParent(obj, remap.at(*item->parentId()));
        }

        std::vector<ObjectId> children;
        for (const ObjectId& c : item->children()) {
            auto it = remap.find(c);
            if (it != remap.end()) children.push_back(it->second);
        }
        GroupResolver::setChildren(obj, std::move(children));

        updates.push_back(ObjectUpdate{obj.id, ObjectPatch::full(obj)});
    }

    history_.pushCurrent();
    if (!store_.applyMany(updates)) {
        KARTA_LOG_WARN("clipboard insert was only partially applied");
    }

    // Roots in the order they were stored.
    std::vector<ObjectId> rootsInOrder;
    for (const SceneObject& item : items) {
        const ObjectId& fresh = remap.at(item.id);
        if (std::find(roots.begin(), roots.end(), fresh) != roots.end() && store_.contains(fresh)) {
            rootsInOrder.push_back(fresh);
        }
    }
    selection_.setSelection(rootsInOrder, SelectionMode::Replace);
    return rootsInOrder;
}

bool Clipboard::copy(const std::vector<ObjectId>& ids) {
    std::vector<SceneObject> captured = capture(ids);
    if (captured.empty()) {
        if (!ids.empty()) {
            KARTA_LOG_WARN("clipboard: no valid objects to copy");
        }
        return false;
    }
    items_ = std::move(captured);
    pasteCount_ = 0;
    return true;
}

std::vector<ObjectId> Clipboard::paste() {
    if (items_.empty()) {
        return {};
    }

    std::vector<ObjectId> pasted = instantiate(items_, constants::kPasteOffset);
    if (pasted.empty()) {
        return pasted;
    }

    // The next paste cascades from this one.
    for (SceneObject& item : items_) {
        if (!item.parentId()) {
            item.x += constants::kPasteOffset;
            item.y += constants::kPasteOffset;
        }
    }
    pasteCount_++;
    return pasted;
}

std::vector<ObjectId> Clipboard::duplicate(const std::vector<ObjectId>& ids) {
    return instantiate(capture(ids), 0.0f);
}

void Clipboard::clear() {
    items_.clear();
    pasteCount_ = 0;
}

} // namespace karta
