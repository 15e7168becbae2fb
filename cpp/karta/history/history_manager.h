#pragma once

#include "karta/core/constants.h"
#include "karta/scene/scene_object.h"

#include <cstddef>
#include <vector>

namespace karta {

class ReplicatedStore;

struct HistoryOptions {
    std::size_t maxEntries = constants::kMaxHistoryEntries;
};

// Undo/redo over whole-document snapshots. A snapshot is pushed before a
// mutating gesture starts, so one gesture is one undo step regardless of how
// many intermediate states were replicated.
class HistoryManager {
public:
    explicit HistoryManager(ReplicatedStore& store, HistoryOptions options = {});

    HistoryManager(const HistoryManager&) = delete;
    HistoryManager& operator=(const HistoryManager&) = delete;

    // Clears the redo stack. The oldest entry is dropped past maxEntries.
    void pushSnapshot(const ObjectMap& snapshot);
    // Snapshot of the store as it is now.
    void pushCurrent();

    bool undo();
    bool redo();

    bool canUndo() const noexcept { return !past_.empty(); }
    bool canRedo() const noexcept { return !future_.empty(); }

    // Drops the most recent entry without touching the document. Used when a
    // gesture that already pushed a snapshot is cancelled.
    bool discardLast();
    void clear();

    std::size_t getHistorySize() const noexcept { return past_.size(); }
    std::size_t getFutureSize() const noexcept { return future_.size(); }
    bool isUndoRedoing() const noexcept { return undoRedoing_; }

private:
    bool restore(std::vector<ObjectMap>& from, std::vector<ObjectMap>& to);

    ReplicatedStore& store_;
    HistoryOptions options_;
    std::vector<ObjectMap> past_;
    std::vector<ObjectMap> future_;
    bool undoRedoing_ = false;
};

} // namespace karta
