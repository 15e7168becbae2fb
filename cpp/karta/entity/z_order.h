#pragma once

#include "karta/scene/scene_object.h"

#include <cstdint>
#include <vector>

namespace karta {

class HistoryManager;
class ReplicatedStore;

// ==============================================================================
// zIndex update calculation. Selected ids are taken in draw order.
// ==============================================================================

// Objects between the old and new position shift by one toward the old
// position, then the target takes `newZIndex`.
std::vector<ObjectUpdate> calculateReorder(const ObjectMap& objects, const ObjectId& id, std::int32_t newZIndex);
std::vector<ObjectUpdate> calculateBringToFront(const ObjectMap& objects, const std::vector<ObjectId>& selected);
std::vector<ObjectUpdate> calculateSendToBack(const ObjectMap& objects, const std::vector<ObjectId>& selected);
// Each selected object trades places with the unselected object directly
// above (below) it in draw order. Selected runs move as a block.
std::vector<ObjectUpdate> calculateBringForward(const ObjectMap& objects, const std::vector<ObjectId>& selected);
std::vector<ObjectUpdate> calculateSendBackward(const ObjectMap& objects, const std::vector<ObjectId>& selected);

// Applies the calculations as one applyMany plus one history entry each.
// Returns false when nothing moves.
class ZOrderController {
public:
    ZOrderController(ReplicatedStore& store, HistoryManager& history);

    bool reorderObject(const ObjectId& id, std::int32_t newZIndex);
    bool bringToFront(const std::vector<ObjectId>& ids);
    bool sendToBack(const std::vector<ObjectId>& ids);
    bool bringForward(const std::vector<ObjectId>& ids);
    bool sendBackward(const std::vector<ObjectId>& ids);

private:
    bool commit(const std::vector<ObjectUpdate>& updates);

    ReplicatedStore& store_;
    HistoryManager& history_;
};

} // namespace karta
