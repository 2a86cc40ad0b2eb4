/**
 * @file SpatialIndex.cpp
 * @brief Strategy-independent queries built on getNearby().
 */
#include "SpatialIndex.h"
#include "HashGrid.h"
#include "QuadTree.h"

#include <algorithm>
#include <cmath>
#include <memory>

std::vector<Circle*> SpatialIndex::getNearby(float x, float y, float radius) const {
    std::vector<Circle*> out;
    getNearby(x, y, radius, out);
    return out;
}

void SpatialIndex::rebuild(std::vector<Circle>& circles) {
    clear();
    for (auto& c : circles) insert(&c);
}

float SpatialIndex::getMaxRadiusAt(float x, float y, float spacing, const Bounds& bounds) const {
    if (x < 0.0f || y < 0.0f || x > bounds.width || y > bounds.height) return 0.0f;
    float edge = std::min(std::min(x, y), std::min(bounds.width - x, bounds.height - y));
    float limit = edge * 0.95f;
    std::vector<Circle*> nearby;
    getNearby(x, y, edge + spacing, nearby);
    for (const Circle* n : nearby) {
        float dx = n->x - x, dy = n->y - y;
        float avail = std::sqrt(dx * dx + dy * dy) - n->radius() - spacing;
        limit = std::min(limit, avail);
    }
    return std::max(0.0f, limit * 0.8f);
}

bool SpatialIndex::checkCollision(float x, float y, float r, float spacing, const Circle* ignore) const {
    std::vector<Circle*> nearby;
    getNearby(x, y, r + spacing, nearby);
    for (const Circle* n : nearby) {
        if (n == ignore) continue;
        float dx = n->x - x, dy = n->y - y;
        float minDist = r + n->radius() + spacing;
        if (dx * dx + dy * dy < minDist * minDist) return true;
    }
    return false;
}

float averageRadius(const std::vector<Circle>& circles, float fallback) {
    double sum = 0.0;
    int n = 0;
    for (const auto& c : circles) {
        if (c.isDead()) continue;
        sum += c.radius();
        ++n;
    }
    return n > 0 ? (float)(sum / n) : fallback;
}

std::unique_ptr<SpatialIndex> makeSpatialIndex(SpatialIndex::Kind kind, const Bounds& bounds,
                                               std::vector<Circle>& circles, float fallbackRadius) {
    std::unique_ptr<SpatialIndex> idx;
    if (kind == SpatialIndex::Kind::QuadTree) {
        idx = std::make_unique<QuadTree>(0.0f, 0.0f, bounds.width, bounds.height);
    } else {
        float cell = HashGrid::cellSizeFor(averageRadius(circles, fallbackRadius));
        idx = std::make_unique<HashGrid>(bounds.width, bounds.height, cell);
    }
    idx->rebuild(circles);
    return idx;
}
