#pragma once

#include "karta/core/types.h"
#include "karta/store/replicated_store.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace karta {

class HistoryManager;

enum class SelectionMode : std::uint8_t { Replace = 0, Add = 1, Remove = 2, Toggle = 3 };

enum class AlignMode : std::uint8_t { Left = 0, Right = 1, Top = 2, Bottom = 3, CenterH = 4, CenterV = 5 };

enum class DistributeAxis : std::uint8_t { Horizontal = 0, Vertical = 1 };

using SelectionListener = std::function<void(const std::vector<ObjectId>&)>;

class SelectionManager {
public:
    explicit SelectionManager(ReplicatedStore& store);
    ~SelectionManager();

    SelectionManager(const SelectionManager&) = delete;
    SelectionManager& operator=(const SelectionManager&) = delete;

    // Ids not in the store are ignored.
    void setSelection(const std::vector<ObjectId>& ids, SelectionMode mode = SelectionMode::Replace);
    void clearSelection();

    // Top-level objects, or the children of `editingGroupId` while a group is edited.
    void selectAll(const std::optional<ObjectId>& editingGroupId = std::nullopt);

    // Drops ids that no longer exist. Runs on every store removal.
    void prune();

    // Draw order (zIndex, then id).
    const std::vector<ObjectId>& getSelectedIds() const { return ordered_; }
    const std::unordered_set<ObjectId>& getSet() const { return set_; }
    bool isSelected(const ObjectId& id) const { return set_.count(id) != 0; }
    bool isEmpty() const { return set_.empty(); }
    std::size_t size() const { return set_.size(); }
    std::uint32_t getGeneration() const { return generation_; }

    SubscriptionId subscribe(SelectionListener listener);
    void unsubscribe(SubscriptionId id);

    // Both work on rotated bounds at absolute positions and write through one
    // applyMany plus one history entry. Align needs two objects, distribute three.
    bool alignSelection(AlignMode mode, HistoryManager& history);
    bool distributeSelection(DistributeAxis axis, HistoryManager& history);

private:
    void rebuildOrder();
    void commitChange();

    ReplicatedStore& store_;
    SubscriptionId storeSubscription_{0};
    std::unordered_set<ObjectId> set_;
    std::vector<ObjectId> ordered_;
    std::uint32_t generation_ = 0;

    std::vector<std::pair<SubscriptionId, SelectionListener>> listeners_;
    SubscriptionId nextListenerId_{1};
};

} // namespace karta
