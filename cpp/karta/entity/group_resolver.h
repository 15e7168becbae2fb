#pragma once

#include "karta/core/types.h"
#include "karta/scene/scene_object.h"

#include <optional>
#include <vector>

namespace karta {

class HistoryManager;
class IdAllocator;
class ReplicatedStore;
class SelectionManager;

struct GroupData {
    SceneObject group;
    std::vector<ObjectUpdate> childUpdates;
    // Set when the grouped objects already lived inside a group; that
    // parent's child list swaps them for the new group.
    std::optional<ObjectUpdate> parentUpdate;
};

struct UngroupData {
    std::vector<ObjectId> groupsToDelete;
    std::vector<ObjectUpdate> childUpdates;
    std::vector<ObjectUpdate> parentUpdates;
    std::vector<ObjectId> newSelectedIds;
};

// Owns every write to the parent/child links. Position resolution walks the
// parent chain with a visited set and fails closed: a cycle or a chain deeper
// than kMaxHierarchyDepth resolves to the object's own coordinates, a missing
// or non-group parent is ignored.
class GroupResolver {
public:
    GroupResolver(ReplicatedStore& store, HistoryManager& history, SelectionManager& selection, IdAllocator& ids);

    GroupResolver(const GroupResolver&) = delete;
    GroupResolver& operator=(const GroupResolver&) = delete;

    // ==============================================================================
    // Pure resolution
    // ==============================================================================

    static Point2 getAbsolutePosition(const SceneObject& obj, const ObjectMap& objects);
    static Rect getAbsoluteRect(const SceneObject& obj, const ObjectMap& objects);

    // nullopt for fewer than two resolvable objects, or objects that do not
    // share one parent.
    static std::optional<GroupData> calculateGroupData(
        const std::vector<ObjectId>& selectedIds,
        const ObjectMap& objects,
        std::int32_t nextZIndex,
        const ObjectId& groupId);

    static UngroupData calculateUngroupData(const std::vector<ObjectId>& groupIds, const ObjectMap& objects);

    // Depth-first, each id once, cycles tolerated. Does not include `rootId`.
    static std::vector<ObjectId> collectDescendants(const ObjectId& rootId, const ObjectMap& objects);

    // ==============================================================================
    // Hierarchy writers
    // ==============================================================================

    static void setParent(SceneObject& obj, std::optional<ObjectId> parentId);
    static void setChildren(SceneObject& obj, std::vector<ObjectId> children);
    static ObjectPatch& setParent(ObjectPatch& patch, std::optional<ObjectId> parentId);
    static ObjectPatch& setChildren(ObjectPatch& patch, std::vector<ObjectId> children);

    // ==============================================================================
    // Document operations (one history entry each)
    // ==============================================================================

    std::optional<ObjectId> groupSelection();
    bool ungroupSelection();

    // Deletes the objects with their descendants and detaches them from
    // surviving parents. Callers that already pushed a snapshot for the
    // gesture pass recordHistory = false.
    bool deleteObjects(const std::vector<ObjectId>& ids, bool recordHistory = true);

    // ==============================================================================
    // Group edit mode
    // ==============================================================================

    bool enterGroupEdit(const ObjectId& groupId);
    void exitGroupEdit();
    const std::optional<ObjectId>& editingGroupId() const { return editingGroupId_; }

private:
    ReplicatedStore& store_;
    HistoryManager& history_;
    SelectionManager& selection_;
    IdAllocator& ids_;
    std::optional<ObjectId> editingGroupId_;
};

} // namespace karta
