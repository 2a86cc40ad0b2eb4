/**
 * @file HashGrid.h
 * @brief Uniform grid index; a circle is referenced from every cell its bounding box overlaps.
 */
#pragma once

#include "SpatialIndex.h"

class HashGrid : public SpatialIndex {
public:
    /** @brief Throws std::invalid_argument for non-positive width, height or cell size. */
    HashGrid(float width, float height, float cellSize);

    /** @brief Cell size used for an average circle radius: max(10, 2.5 * avg). */
    static float cellSizeFor(float averageRadius);

    Kind kind() const override { return Kind::HashGrid; }
    void insert(Circle* c) override;
    using SpatialIndex::getNearby;
    void getNearby(float x, float y, float radius, std::vector<Circle*>& out) const override;
    void clear() override;
    std::size_t size() const override { return count; }

    /** @brief 4-connected flood fill over unoccupied cells; regions of at least @p minCells, largest first. */
    std::vector<EmptyArea> findEmptyAreas(int minCells) const;

    int cols() const { return nCols; }
    int rows() const { return nRows; }
    float cellSize() const { return cell; }
    bool cellOccupied(int col, int row) const;

private:
    int cellIndex(int col, int row) const { return row * nCols + col; }
    int colOf(float x) const;
    int rowOf(float y) const;

    float w;
    float h;
    float cell;
    int nCols;
    int nRows;
    std::vector<std::vector<Circle*>> cells;
    std::size_t count{0};
};
