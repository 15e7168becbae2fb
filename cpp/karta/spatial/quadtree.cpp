#include "karta/spatial/quadtree.h"

#include <algorithm>

namespace karta {

QuadTree::QuadTree(const AABB& bounds, QuadTreeOptions options)
    : options_(options), root_(std::make_unique<Node>()) {
    root_->bounds = bounds;
}

void QuadTree::insert(const QuadTreeItem& item) {
    if (index_.count(item.id) != 0) {
        remove(item.id);
    }
    index_[item.id] = item.bounds;
    if (!aabbContains(root_->bounds, item.bounds)) {
        root_->items.push_back(item);
        return;
    }
    insertInto(*root_, item);
}

bool QuadTree::remove(const ObjectId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    const AABB bounds = it->second;
    index_.erase(it);
    return removeFrom(*root_, id, bounds);
}

void QuadTree::update(const QuadTreeItem& item) {
    remove(item.id);
    insert(item);
}

void QuadTree::clear() {
    const AABB bounds = root_->bounds;
    root_ = std::make_unique<Node>();
    root_->bounds = bounds;
    index_.clear();
}

int QuadTree::childIndex(const Node& node, const AABB& b) {
    const float midX = (node.bounds.minX + node.bounds.maxX) * 0.5f;
    const float midY = (node.bounds.minY + node.bounds.maxY) * 0.5f;

    const bool inLeft = b.maxX <= midX;
    const bool inRight = b.minX >= midX;
    const bool inTop = b.maxY <= midY;
    const bool inBottom = b.minY >= midY;

    if (inTop && inLeft) return 0;
    if (inTop && inRight) return 1;
    if (inBottom && inLeft) return 2;
    if (inBottom && inRight) return 3;
    return -1;
}

void QuadTree::subdivide(Node& node) {
    const float midX = (node.bounds.minX + node.bounds.maxX) * 0.5f;
    const float midY = (node.bounds.minY + node.bounds.maxY) * 0.5f;
    const AABB quads[4] = {
        {node.bounds.minX, node.bounds.minY, midX, midY},
        {midX, node.bounds.minY, node.bounds.maxX, midY},
        {node.bounds.minX, midY, midX, node.bounds.maxY},
        {midX, midY, node.bounds.maxX, node.bounds.maxY},
    };
    for (int i = 0; i < 4; ++i) {
        node.children[i] = std::make_unique<Node>();
        node.children[i]->bounds = quads[i];
        node.children[i]->depth = node.depth + 1;
    }
}

void QuadTree::insertInto(Node& node, const QuadTreeItem& item) {
    if (node.divided()) {
        const int idx = childIndex(node, item.bounds);
        if (idx >= 0) {
            insertInto(*node.children[idx], item);
            return;
        }
    }

    node.items.push_back(item);

    if (!node.divided() && node.items.size() > options_.maxItems && node.depth < options_.maxDepth) {
        subdivide(node);
        std::vector<QuadTreeItem> items;
        items.swap(node.items);
        for (const QuadTreeItem& i : items) {
            insertInto(node, i);
        }
    }
}

bool QuadTree::removeFrom(Node& node, const ObjectId& id, const AABB& bounds) {
    auto it = std::find_if(node.items.begin(), node.items.end(),
        [&id](const QuadTreeItem& i) { return i.id == id; });
    if (it != node.items.end()) {
        node.items.erase(it);
        return true;
    }
    if (!node.divided()) {
        return false;
    }
    const int idx = childIndex(node, bounds);
    if (idx >= 0) {
        return removeFrom(*node.children[idx], id, bounds);
    }
    return false;
}

std::vector<QuadTreeItem> QuadTree::query(const AABB& area) const {
    std::vector<QuadTreeItem> out;
    // Root items are always scanned: out-of-bounds items are parked there.
    for (const QuadTreeItem& item : root_->items) {
        if (aabbIntersects(item.bounds, area)) {
            out.push_back(item);
        }
    }
    if (root_->divided()) {
        for (const auto& child : root_->children) {
            queryNode(*child, area, out);
        }
    }
    return out;
}

void QuadTree::queryNode(const Node& node, const AABB& area, std::vector<QuadTreeItem>& out) const {
    if (!aabbIntersects(node.bounds, area)) {
        return;
    }
    for (const QuadTreeItem& item : node.items) {
        if (aabbIntersects(item.bounds, area)) {
            out.push_back(item);
        }
    }
    if (node.divided()) {
        for (const auto& child : node.children) {
            queryNode(*child, area, out);
        }
    }
}

std::vector<QuadTreeItem> QuadTree::queryPoint(float x, float y) const {
    return query(AABB{x - 1.0f, y - 1.0f, x + 1.0f, y + 1.0f});
}

std::vector<QuadTreeItem> QuadTree::getAll() const {
    std::vector<QuadTreeItem> out;
    out.reserve(index_.size());
    collect(*root_, out);
    return out;
}

void QuadTree::collect(const Node& node, std::vector<QuadTreeItem>& out) const {
    out.insert(out.end(), node.items.begin(), node.items.end());
    if (node.divided()) {
        for (const auto& child : node.children) {
            collect(*child, out);
        }
    }
}

} // namespace karta
