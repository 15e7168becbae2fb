#pragma once

#include "karta/core/types.h"
#include "karta/spatial/quadtree.h"
#include "karta/store/replicated_store.h"

#include <optional>
#include <vector>

namespace karta {

struct PickStats {
    std::uint32_t rebuilds;
    std::uint32_t candidatesChecked;
};

// Derived spatial index over the store. Any store notification marks the
// index dirty; the next query rebuilds it from the store using each object's
// rotated bounding box at its absolute position.
//
// Hit testing is two-phase: quadtree candidates, then a rotation-aware
// precise test. Children take part only while their group is being edited,
// and that group is then hidden from hit testing.
class PickSystem {
public:
    explicit PickSystem(ReplicatedStore& store, QuadTreeOptions options = {});
    ~PickSystem();

    PickSystem(const PickSystem&) = delete;
    PickSystem& operator=(const PickSystem&) = delete;

    // Top-most object under the point, by zIndex then id.
    std::optional<ObjectId> pick(float canvasX, float canvasY, const std::optional<ObjectId>& editingGroupId = std::nullopt);

    // Objects whose rotated shape intersects the marquee, in draw order.
    std::vector<ObjectId> queryMarquee(const Rect& marquee, const std::optional<ObjectId>& editingGroupId = std::nullopt);

    // Visible objects whose bounds intersect the area, in draw order.
    std::vector<ObjectId> queryViewport(const Rect& area);

    bool isDirty() const { return dirty_; }
    void markDirty() { dirty_ = true; }
    std::size_t indexedCount();
    PickStats getLastStats() const { return stats_; }

private:
    void ensureIndex();
    bool pickable(const SceneObject& obj, const std::optional<ObjectId>& editingGroupId) const;
    std::vector<const SceneObject*> candidates(const AABB& area);

    ReplicatedStore& store_;
    SubscriptionId subscription_{0};
    QuadTree index_;
    bool dirty_ = true;
    PickStats stats_{0, 0};
};

} // namespace karta
