/**
 * @file QuadTree.h
 * @brief Capacity-bounded region quad-tree. A circle that does not fit wholly inside one child
 *        stays at the node where the split happened.
 */
#pragma once

#include "SpatialIndex.h"

#include <array>

class QuadTree : public SpatialIndex {
public:
    QuadTree(float x, float y, float width, float height, int capacity = 10, int maxDepth = 8);

    Kind kind() const override { return Kind::QuadTree; }
    void insert(Circle* c) override;
    using SpatialIndex::getNearby;
    void getNearby(float x, float y, float radius, std::vector<Circle*>& out) const override;
    void clear() override;
    std::size_t size() const override { return count; }

    int depth() const;
    int nodeCount() const;
    /** @brief Circles held directly at the root (boundary straddlers and out-of-bounds circles). */
    std::size_t rootCount() const { return root.items.size(); }

private:
    struct Node {
        float x{0.0f}, y{0.0f}, w{0.0f}, h{0.0f};
        int level{0};
        std::vector<Circle*> items;
        std::array<std::unique_ptr<Node>, 4> children;
        bool divided() const { return static_cast<bool>(children[0]); }
        bool contains(const Circle* c) const;
        bool intersects(float minX, float minY, float maxX, float maxY) const;
    };

    void insertInto(Node& n, Circle* c);
    void subdivide(Node& n);
    Node* childContaining(Node& n, const Circle* c);
    void query(const Node& n, float x, float y, float radius, std::vector<Circle*>& out) const;
    static int depthOf(const Node& n);
    static int countNodes(const Node& n);

    Node root;
    int cap;
    int maxLevel;
    std::size_t count{0};
};
