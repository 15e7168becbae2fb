#pragma once

#include "karta/core/constants.h"
#include "karta/core/types.h"

#include <array>
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

namespace karta {

struct QuadTreeItem {
    ObjectId id;
    AABB bounds;
};

struct QuadTreeOptions {
    std::size_t maxItems{constants::kQuadTreeMaxItems};
    std::size_t maxDepth{constants::kQuadTreeMaxDepth};
};

// Region quadtree over axis-aligned boxes. An item that straddles a split line
// stays in the node that owns the split, so queries look at every node on the
// way down, not only at leaves. Items outside the root bounds live in the root.
class QuadTree {
public:
    explicit QuadTree(const AABB& bounds = defaultBounds(), QuadTreeOptions options = {});

    QuadTree(const QuadTree&) = delete;
    QuadTree& operator=(const QuadTree&) = delete;

    // Re-inserting an id that is already present replaces it.
    void insert(const QuadTreeItem& item);
    bool remove(const ObjectId& id);
    void update(const QuadTreeItem& item);
    void clear();

    // Items whose bounds intersect `area` (touching counts).
    std::vector<QuadTreeItem> query(const AABB& area) const;
    std::vector<QuadTreeItem> queryPoint(float x, float y) const;
    std::vector<QuadTreeItem> getAll() const;

    std::size_t size() const { return index_.size(); }
    const AABB& bounds() const { return root_->bounds; }

    static AABB defaultBounds() {
        return AABB{constants::kMinCoordinate, constants::kMinCoordinate,
                    constants::kMaxCoordinate, constants::kMaxCoordinate};
    }

private:
    struct Node {
        AABB bounds;
        std::size_t depth{0};
        std::vector<QuadTreeItem> items;
        std::array<std::unique_ptr<Node>, 4> children;

        bool divided() const { return children[0] != nullptr; }
    };

    void insertInto(Node& node, const QuadTreeItem& item);
    bool removeFrom(Node& node, const ObjectId& id, const AABB& bounds);
    void subdivide(Node& node);
    void queryNode(const Node& node, const AABB& area, std::vector<QuadTreeItem>& out) const;
    void collect(const Node& node, std::vector<QuadTreeItem>& out) const;
    static int childIndex(const Node& node, const AABB& bounds);

    QuadTreeOptions options_;
    std::unique_ptr<Node> root_;
    std::unordered_map<ObjectId, AABB> index_;
};

} // namespace karta
