#include "karta/entity/group_resolver.h"
#include "karta/core/logging.h"
#include "karta/entity/selection_manager.h"
#include "karta/history/history_manager.h"
#include "karta/store/id_allocator.h"
#include "karta/store/replicated_store.h"

#include <algorithm>
#include <limits>
#include <map>
#include <unordered_set>

namespace karta {

namespace {

const SceneObject* findObject(const ObjectMap& objects, const ObjectId& id) {
    auto it = objects.find(id);
    return it != objects.end() ? &it->second : nullptr;
}

// Parent group of `obj`, or nullptr when the link is absent or dangling.
const SceneObject* parentGroup(const SceneObject& obj, const ObjectMap& objects) {
    if (!obj.parentId()) return nullptr;
    const SceneObject* parent = findObject(objects, *obj.parentId());
    if (!parent || parent->kind != ObjectKind::Group) return nullptr;
    return parent;
}

bool hasAncestorIn(const SceneObject& obj, const ObjectMap& objects, const std::unordered_set<ObjectId>& ids) {
    std::unordered_set<ObjectId> visited{obj.id};
    const SceneObject* cur = parentGroup(obj, objects);
    while (cur) {
        if (ids.count(cur->id) != 0) return true;
        if (!visited.insert(cur->id).second) return false;
        cur = parentGroup(*cur, objects);
    }
    return false;
}

} // namespace

GroupResolver::GroupResolver(ReplicatedStore& store, HistoryManager& history, SelectionManager& selection, IdAllocator& ids)
    : store_(store), history_(history), selection_(selection), ids_(ids) {}

// ==============================================================================
// Pure resolution
// ==============================================================================

Point2 GroupResolver::getAbsolutePosition(const SceneObject& obj, const ObjectMap& objects) {
    Point2 pos{obj.x, obj.y};
    std::unordered_set<ObjectId> visited{obj.id};
    const SceneObject* cur = &obj;
    std::size_t depth = 0;

    while (cur->parentId()) {
        const ObjectId& parentId = *cur->parentId();
        const SceneObject* parent = findObject(objects, parentId);
        if (!parent) {
            KARTA_LOG_WARN("%s references missing parent %s; treating as absolute", cur->id.c_str(), parentId.c_str());
            break;
        }
        if (parent->kind != ObjectKind::Group) {
            KARTA_LOG_WARN("%s references non-group parent %s; treating as absolute", cur->id.c_str(), parentId.c_str());
            break;
        }
        if (!visited.insert(parent->id).second || ++depth > constants::kMaxHierarchyDepth) {
            KARTA_LOG_WARN("parent cycle through %s; treating %s as absolute", parentId.c_str(), obj.id.c_str());
            return Point2{obj.x, obj.y};
        }
        pos.x += parent->x;
        pos.y += parent->y;
        cur = parent;
    }
    return pos;
}

Rect GroupResolver::getAbsoluteRect(const SceneObject& obj, const ObjectMap& objects) {
    const Point2 p = getAbsolutePosition(obj, objects);
    return Rect{p.x, p.y, obj.width, obj.height};
}

std::optional<GroupData> GroupResolver::calculateGroupData(
    const std::vector<ObjectId>& selectedIds,
    const ObjectMap& objects,
    std::int32_t nextZIndex,
    const ObjectId& groupId) {

    std::vector<const SceneObject*> members;
    std::unordered_set<ObjectId> seen;
    for (const ObjectId& id : selectedIds) {
        const SceneObject* obj = findObject(objects, id);
        if (!obj || !seen.insert(id).second) continue;
        members.push_back(obj);
    }
    if (members.size() < 2 || groupId.empty()) {
        return std::nullopt;
    }

    // Members share one coordinate frame, so their relative positions can be
    // compared directly.
    const SceneObject* commonParent = parentGroup(*members.front(), objects);
    for (const SceneObject* obj : members) {
        if (parentGroup(*obj, objects) != commonParent) {
            KARTA_LOG_DEBUG("group request spans several parents");
            return std::nullopt;
        }
    }

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();
    for (const SceneObject* obj : members) {
        minX = std::min(minX, obj->x);
        minY = std::min(minY, obj->y);
        maxX = std::max(maxX, obj->x + obj->width);
        maxY = std::max(maxY, obj->y + obj->height);
    }

    GroupData data;
    data.group = makeObject(ObjectKind::Group, groupId, minX, minY, maxX - minX, maxY - minY, nextZIndex);
    std::vector<ObjectId> children;
    children.reserve(members.size());
    for (const SceneObject* obj : members) {
        children.push_back(obj->id);
    }
    setChildren(data.group, children);
    if (commonParent) {
        setParent(data.group, commonParent->id);
    }

    for (const SceneObject* obj : members) {
        ObjectUpdate update{obj->id, {}};
        update.patch.setPosition(obj->x - minX, obj->y - minY);
        setParent(update.patch, groupId);
        data.childUpdates.push_back(std::move(update));
    }

    if (commonParent) {
        std::vector<ObjectId> siblings;
        bool placed = false;
        for (const ObjectId& id : commonParent->children()) {
            if (seen.count(id) != 0) {
                if (!placed) {
                    siblings.push_back(groupId);
                    placed = true;
                }
                continue;
            }
            siblings.push_back(id);
        }
        if (!placed) {
            siblings.push_back(groupId);
        }
        ObjectUpdate update{commonParent->id, {}};
        setChildren(update.patch, std::move(siblings));
        data.parentUpdate = std::move(update);
    }

    return data;
}

UngroupData GroupResolver::calculateUngroupData(const std::vector<ObjectId>& groupIds, const ObjectMap& objects) {
    UngroupData data;

    std::unordered_set<ObjectId> requested;
    for (const ObjectId& id : groupIds) {
        const SceneObject* obj = findObject(objects, id);
        if (obj && obj->kind == ObjectKind::Group) {
            requested.insert(id);
        }
    }

    // Child lists of surviving parents, edited in place as groups dissolve.
    std::map<ObjectId, std::vector<ObjectId>> parentChildren;
    std::unordered_set<ObjectId> handled;

    for (const ObjectId& groupId : groupIds) {
        if (requested.count(groupId) == 0 || !handled.insert(groupId).second) continue;
        const SceneObject& group = objects.at(groupId);
        // Nested requests dissolve only the outermost group.
        if (hasAncestorIn(group, objects, requested)) continue;

        data.groupsToDelete.push_back(groupId);
        const SceneObject* outer = parentGroup(group, objects);

        std::vector<ObjectId> released;
        for (const ObjectId& childId : group.children()) {
            const SceneObject* child = findObject(objects, childId);
            if (!child) {
                KARTA_LOG_WARN("group %s lists missing child %s", groupId.c_str(), childId.c_str());
                continue;
            }
            if (!child->parentId() || *child->parentId() != groupId) {
                KARTA_LOG_WARN("child %s does not point back to group %s", childId.c_str(), groupId.c_str());
                continue;
            }
            ObjectUpdate update{childId, {}};
            update.patch.setPosition(child->x + group.x, child->y + group.y);
            if (outer) {
                setParent(update.patch, outer->id);
            } else {
                setParent(update.patch, std::nullopt);
            }
            data.childUpdates.push_back(std::move(update));
            data.newSelectedIds.push_back(childId);
            released.push_back(childId);
        }

        if (outer) {
            auto it = parentChildren.find(outer->id);
            if (it == parentChildren.end()) {
                it = parentChildren.emplace(outer->id, outer->children()).first;
            }
            std::vector<ObjectId>& list = it->second;
            auto pos = std::find(list.begin(), list.end(), groupId);
            if (pos != list.end()) {
                pos = list.erase(pos);
                list.insert(pos, released.begin(), released.end());
            } else {
                list.insert(list.end(), released.begin(), released.end());
            }
        }
    }

    for (auto& [parentId, children] : parentChildren) {
        ObjectUpdate update{parentId, {}};
        setChildren(update.patch, std::move(children));
        data.parentUpdates.push_back(std::move(update));
    }
    return data;
}

std::vector<ObjectId> GroupResolver::collectDescendants(const ObjectId& rootId, const ObjectMap& objects) {
    std::vector<ObjectId> out;
    std::unordered_set<ObjectId> visited{rootId};
    std::vector<ObjectId> stack;

    const SceneObject* root = findObject(objects, rootId);
    if (!root) return out;
    stack.assign(root->children().rbegin(), root->children().rend());

    while (!stack.empty()) {
        const ObjectId id = stack.back();
        stack.pop_back();
        if (!visited.insert(id).second) continue;
        const SceneObject* obj = findObject(objects, id);
        if (!obj) continue;
        out.push_back(id);
        stack.insert(stack.end(), obj->children().rbegin(), obj->children().rend());
    }
    return out;
}

// ==============================================================================
// Hierarchy writers
// ==============================================================================

void GroupResolver::setParent(SceneObject& obj, std::optional<ObjectId> parentId) {
    obj.parentId_ = std::move(parentId);
}

void GroupResolver::setChildren(SceneObject& obj, std::vector<ObjectId> children) {
    obj.children_ = std::move(children);
}

ObjectPatch& GroupResolver::setParent(ObjectPatch& patch, std::optional<ObjectId> parentId) {
    patch.values.parentId_ = std::move(parentId);
    patch.mask |= fieldBit(ObjectField::ParentId);
    return patch;
}

ObjectPatch& GroupResolver::setChildren(ObjectPatch& patch, std::vector<ObjectId> children) {
    patch.values.children_ = std::move(children);
    patch.mask |= fieldBit(ObjectField::Children);
    return patch;
}

// ==============================================================================
// Document operations
// ==============================================================================

std::optional<ObjectId> GroupResolver::groupSelection() {
    const std::vector<ObjectId> selected = selection_.getSelectedIds();
    if (selected.size() < 2) {
        return std::nullopt;
    }

    auto data = calculateGroupData(selected, store_.objects(), store_.nextZIndex(), ids_.next());
    if (!data) {
        return std::nullopt;
    }

    std::vector<ObjectUpdate> updates;
    updates.reserve(data->childUpdates.size() + 2);
    updates.push_back(ObjectUpdate{data->group.id, ObjectPatch::full(data->group)});
    for (ObjectUpdate& u : data->childUpdates) {
        updates.push_back(std::move(u));
    }
    if (data->parentUpdate) {
        updates.push_back(std::move(*data->parentUpdate));
    }

    history_.pushCurrent();
    if (!store_.applyMany(updates)) {
        KARTA_LOG_WARN("group %s was only partially applied", data->group.id.c_str());
    }
    selection_.setSelection({data->group.id}, SelectionMode::Replace);
    return data->group.id;
}

bool GroupResolver::ungroupSelection() {
    UngroupData data = calculateUngroupData(selection_.getSelectedIds(), store_.objects());
    if (data.groupsToDelete.empty()) {
        return false;
    }

    std::vector<ObjectUpdate> updates = std::move(data.childUpdates);
    for (ObjectUpdate& u : data.parentUpdates) {
        updates.push_back(std::move(u));
    }

    history_.pushCurrent();
    if (!updates.empty() && !store_.applyMany(updates)) {
        KARTA_LOG_WARN("ungroup was only partially applied");
    }
    if (!store_.removeMany(data.groupsToDelete)) {
        KARTA_LOG_WARN("ungroup could not remove every group");
    }

    if (editingGroupId_ &&
        std::find(data.groupsToDelete.begin(), data.groupsToDelete.end(), *editingGroupId_) != data.groupsToDelete.end()) {
        exitGroupEdit();
    }
    selection_.setSelection(data.newSelectedIds, SelectionMode::Replace);
    return true;
}

bool GroupResolver::deleteObjects(const std::vector<ObjectId>& ids, bool recordHistory) {
    const ObjectMap& objects = store_.objects();

    std::vector<ObjectId> doomed;
    std::unordered_set<ObjectId> doomedSet;
    for (const ObjectId& id : ids) {
        if (!findObject(objects, id) || !doomedSet.insert(id).second) continue;
        doomed.push_back(id);
        for (const ObjectId& d : collectDescendants(id, objects)) {
            if (doomedSet.insert(d).second) {
                doomed.push_back(d);
            }
        }
    }
    if (doomed.empty()) {
        return false;
    }

    std::map<ObjectId, std::vector<ObjectId>> detach;
    for (const ObjectId& id : doomed) {
        const SceneObject* parent = parentGroup(objects.at(id), objects);
        if (!parent || doomedSet.count(parent->id) != 0) continue;
        auto it = detach.find(parent->id);
        if (it == detach.end()) {
            it = detach.emplace(parent->id, parent->children()).first;
        }
        auto& list = it->second;
        list.erase(std::remove(list.begin(), list.end(), id), list.end());
    }

    std::vector<ObjectUpdate> updates;
    for (auto& [parentId, children] : detach) {
        ObjectUpdate update{parentId, {}};
        setChildren(update.patch, std::move(children));
        updates.push_back(std::move(update));
    }

    if (recordHistory) {
        history_.pushCurrent();
    }
    if (!updates.empty() && !store_.applyMany(updates)) {
        KARTA_LOG_WARN("could not detach deleted objects from their parents");
    }
    if (!store_.removeMany(doomed)) {
        KARTA_LOG_WARN("delete removed only part of %zu objects", doomed.size());
    }

    if (editingGroupId_ && doomedSet.count(*editingGroupId_) != 0) {
        exitGroupEdit();
    }
    return true;
}

// ==============================================================================
// Group edit mode
// ==============================================================================

bool GroupResolver::enterGroupEdit(const ObjectId& groupId) {
    const SceneObject* obj = store_.get(groupId);
    if (!obj || obj->kind != ObjectKind::Group) {
        return false;
    }
    editingGroupId_ = groupId;
    return true;
}

void GroupResolver::exitGroupEdit() {
    editingGroupId_.reset();
}

} // namespace karta
