/**
 * @file SpatialIndex.h
 * @brief Neighbor-query interface shared by the uniform hash grid and the quad-tree.
 *
 * An index holds non-owning pointers into a circle container; any push_back/erase on that
 * container invalidates it and the owner must rebuild() before the next query.
 */
#pragma once

#include "Circle.h"

#include <cstddef>
#include <memory>
#include <vector>

class SpatialIndex {
public:
    enum class Kind { HashGrid, QuadTree };

    virtual ~SpatialIndex() = default;

    virtual Kind kind() const = 0;
    virtual void insert(Circle* c) = 0;
    /** @brief Append to @p out every indexed circle whose disk intersects the disk (x,y,radius), each once. */
    virtual void getNearby(float x, float y, float radius, std::vector<Circle*>& out) const = 0;
    virtual void clear() = 0;
    virtual std::size_t size() const = 0;

    std::vector<Circle*> getNearby(float x, float y, float radius) const;

    /** @brief clear() and insert every circle of @p circles. */
    void rebuild(std::vector<Circle>& circles);

    /**
     * @brief Largest radius a new circle at (x,y) could take without reaching the canvas edge or
     *        coming within @p spacing of an indexed circle, scaled by 0.8 for float safety.
     *
     * Edge distance is additionally trimmed to 95%. Returns 0 outside the canvas.
     */
    float getMaxRadiusAt(float x, float y, float spacing, const Bounds& bounds) const;

    /** @brief True if a circle (x,y,r) would come closer than r+other.r+spacing to any indexed circle. */
    bool checkCollision(float x, float y, float r, float spacing, const Circle* ignore = nullptr) const;

protected:
    SpatialIndex() = default;
};

/** @brief Connected region of unoccupied grid cells, in canvas units. */
struct EmptyArea {
    float x{0.0f};       /**< centre */
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
    int cellCount{0};
    float score{0.0f};   /**< cellCount / total grid cells */
};

/** @brief Mean radius of live circles, or @p fallback when there are none. */
float averageRadius(const std::vector<Circle>& circles, float fallback);

/** @brief Build an index of the requested strategy over @p circles; grid cells follow the average radius. */
std::unique_ptr<SpatialIndex> makeSpatialIndex(SpatialIndex::Kind kind, const Bounds& bounds,
                                               std::vector<Circle>& circles, float fallbackRadius);
