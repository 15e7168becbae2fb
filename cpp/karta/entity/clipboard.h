#pragma once

#include "karta/scene/scene_object.h"

#include <cstddef>
#include <vector>

namespace karta {

class HistoryManager;
class IdAllocator;
class ReplicatedStore;
class SelectionManager;

// Copies objects together with their descendants. Copied roots are stored at
// their absolute positions and are pasted as top-level objects; hierarchy
// links inside the copy are remapped to the fresh ids.
class Clipboard {
public:
    Clipboard(ReplicatedStore& store, HistoryManager& history, SelectionManager& selection, IdAllocator& ids);

    // Invalid objects are skipped with a warning. Returns false when nothing
    // valid was captured; the previous contents are kept in that case.
    bool copy(const std::vector<ObjectId>& ids);

    // Offsets each successive paste by kPasteOffset. Returns the new root ids,
    // which become the selection.
    std::vector<ObjectId> paste();

    // Copies in place without touching the clipboard contents.
    std::vector<ObjectId> duplicate(const std::vector<ObjectId>& ids);

    void clear();
    bool hasItems() const { return !items_.empty(); }
    const std::vector<SceneObject>& getItems() const { return items_; }
    std::size_t getPasteCount() const { return pasteCount_; }

private:
    std::vector<SceneObject> capture(const std::vector<ObjectId>& ids) const;
    std::vector<ObjectId> instantiate(const std::vector<SceneObject>& items, float offset);

    ReplicatedStore& store_;
    HistoryManager& history_;
    SelectionManager& selection_;
    IdAllocator& ids_;

    std::vector<SceneObject> items_;
    std::size_t pasteCount_ = 0;
};

} // namespace karta
