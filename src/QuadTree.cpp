/**
 * @file QuadTree.cpp
 */
#include "QuadTree.h"

#include <algorithm>
#include <memory>

bool QuadTree::Node::contains(const Circle* c) const {
    float r = c->radius();
    return c->x - r >= x && c->x + r <= x + w && c->y - r >= y && c->y + r <= y + h;
}

bool QuadTree::Node::intersects(float minX, float minY, float maxX, float maxY) const {
    return !(maxX < x || minX > x + w || maxY < y || minY > y + h);
}

QuadTree::QuadTree(float x, float y, float width, float height, int capacity, int maxDepth)
    : cap(std::max(1, capacity)), maxLevel(std::max(0, maxDepth)) {
    root.x = x; root.y = y; root.w = width; root.h = height;
}

void QuadTree::insert(Circle* c) {
    if (!c) return;
    insertInto(root, c);
    ++count;
}

QuadTree::Node* QuadTree::childContaining(Node& n, const Circle* c) {
    for (auto& ch : n.children)
        if (ch && ch->contains(c)) return ch.get();
    return nullptr;
}

void QuadTree::subdivide(Node& n) {
    float hw = n.w / 2.0f, hh = n.h / 2.0f;
    const float ox[4] = {0.0f, hw, 0.0f, hw};
    const float oy[4] = {0.0f, 0.0f, hh, hh};
    for (int i = 0; i < 4; ++i) {
        n.children[(size_t)i] = std::make_unique<Node>();
        Node& ch = *n.children[(size_t)i];
        ch.x = n.x + ox[i]; ch.y = n.y + oy[i]; ch.w = hw; ch.h = hh;
        ch.level = n.level + 1;
    }
    // Push down whatever now fits wholly inside a child.
    std::vector<Circle*> keep;
    for (Circle* c : n.items) {
        Node* target = childContaining(n, c);
        if (target) insertInto(*target, c);
        else keep.push_back(c);
    }
    n.items.swap(keep);
}

void QuadTree::insertInto(Node& n, Circle* c) {
    if (n.divided()) {
        Node* target = childContaining(n, c);
        if (target) { insertInto(*target, c); return; }
        n.items.push_back(c);
        return;
    }
    n.items.push_back(c);
    if ((int)n.items.size() > cap && n.level < maxLevel) subdivide(n);
}

void QuadTree::query(const Node& n, float x, float y, float radius, std::vector<Circle*>& out) const {
    for (Circle* c : n.items) {
        float dx = c->x - x, dy = c->y - y;
        float reach = radius + c->radius();
        if (dx * dx + dy * dy <= reach * reach) out.push_back(c);
    }
    if (!n.divided()) return;
    for (const auto& ch : n.children)
        if (ch->intersects(x - radius, y - radius, x + radius, y + radius)) query(*ch, x, y, radius, out);
}

void QuadTree::getNearby(float x, float y, float radius, std::vector<Circle*>& out) const {
    query(root, x, y, radius, out);
}

void QuadTree::clear() {
    root.items.clear();
    for (auto& ch : root.children) ch.reset();
    count = 0;
}

int QuadTree::depthOf(const Node& n) {
    if (!n.divided()) return 1;
    int d = 0;
    for (const auto& ch : n.children) d = std::max(d, depthOf(*ch));
    return d + 1;
}

int QuadTree::countNodes(const Node& n) {
    int k = 1;
    if (n.divided())
        for (const auto& ch : n.children) k += countNodes(*ch);
    return k;
}

int QuadTree::depth() const { return depthOf(root); }
int QuadTree::nodeCount() const { return countNodes(root); }
