/**
 * @file HashGrid.cpp
 */
#include "HashGrid.h"

#include <algorithm>
#include <cmath>
#include <queue>
#include <stdexcept>
#include <unordered_set>

namespace {
inline int clampi(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
}

HashGrid::HashGrid(float width, float height, float cellSize)
    : w(width), h(height), cell(cellSize) {
    if (!(width > 0.0f) || !(height > 0.0f)) throw std::invalid_argument("HashGrid: canvas must be positive");
    if (!(cellSize > 0.0f)) throw std::invalid_argument("HashGrid: cell size must be positive");
    nCols = std::max(1, (int)std::ceil(width / cellSize));
    nRows = std::max(1, (int)std::ceil(height / cellSize));
    cells.resize((size_t)nCols * (size_t)nRows);
}

float HashGrid::cellSizeFor(float averageRadius) {
    return std::max(10.0f, averageRadius * 2.5f);
}

int HashGrid::colOf(float x) const { return clampi((int)std::floor(x / cell), 0, nCols - 1); }
int HashGrid::rowOf(float y) const { return clampi((int)std::floor(y / cell), 0, nRows - 1); }

void HashGrid::insert(Circle* c) {
    if (!c) return;
    float r = c->radius();
    int c0 = colOf(c->x - r), c1 = colOf(c->x + r);
    int r0 = rowOf(c->y - r), r1 = rowOf(c->y + r);
    for (int row = r0; row <= r1; ++row)
        for (int col = c0; col <= c1; ++col)
            cells[(size_t)cellIndex(col, row)].push_back(c);
    ++count;
}

void HashGrid::getNearby(float x, float y, float radius, std::vector<Circle*>& out) const {
    int c0 = colOf(x - radius), c1 = colOf(x + radius);
    int r0 = rowOf(y - radius), r1 = rowOf(y + radius);
    std::unordered_set<const Circle*> seen;
    for (int row = r0; row <= r1; ++row) {
        for (int col = c0; col <= c1; ++col) {
            for (Circle* c : cells[(size_t)cellIndex(col, row)]) {
                if (!seen.insert(c).second) continue;
                float dx = c->x - x, dy = c->y - y;
                float reach = radius + c->radius();
                if (dx * dx + dy * dy <= reach * reach) out.push_back(c);
            }
        }
    }
}

void HashGrid::clear() {
    for (auto& v : cells) v.clear();
    count = 0;
}

bool HashGrid::cellOccupied(int col, int row) const {
    if (col < 0 || row < 0 || col >= nCols || row >= nRows) return false;
    return !cells[(size_t)cellIndex(col, row)].empty();
}

std::vector<EmptyArea> HashGrid::findEmptyAreas(int minCells) const {
    std::vector<EmptyArea> areas;
    const int total = nCols * nRows;
    std::vector<char> visited((size_t)total, 0);
    const int dc[4] = {1, -1, 0, 0};
    const int dr[4] = {0, 0, 1, -1};
    for (int row = 0; row < nRows; ++row) {
        for (int col = 0; col < nCols; ++col) {
            int seed = cellIndex(col, row);
            if (visited[(size_t)seed] || !cells[(size_t)seed].empty()) continue;
            int minC = col, maxC = col, minR = row, maxR = row, n = 0;
            std::queue<int> q;
            q.push(seed);
            visited[(size_t)seed] = 1;
            while (!q.empty()) {
                int cur = q.front(); q.pop();
                int cc = cur % nCols, rr = cur / nCols;
                ++n;
                minC = std::min(minC, cc); maxC = std::max(maxC, cc);
                minR = std::min(minR, rr); maxR = std::max(maxR, rr);
                for (int k = 0; k < 4; ++k) {
                    int nc = cc + dc[k], nr = rr + dr[k];
                    if (nc < 0 || nr < 0 || nc >= nCols || nr >= nRows) continue;
                    int ni = cellIndex(nc, nr);
                    if (visited[(size_t)ni] || !cells[(size_t)ni].empty()) continue;
                    visited[(size_t)ni] = 1;
                    q.push(ni);
                }
            }
            if (n < minCells) continue;
            EmptyArea a;
            a.x = ((minC + maxC) / 2.0f) * cell + cell / 2.0f;
            a.y = ((minR + maxR) / 2.0f) * cell + cell / 2.0f;
            a.width = (maxC - minC + 1) * cell;
            a.height = (maxR - minR + 1) * cell;
            a.cellCount = n;
            a.score = (float)n / (float)total;
            areas.push_back(a);
        }
    }
    std::stable_sort(areas.begin(), areas.end(), [](const EmptyArea& a, const EmptyArea& b){ return a.cellCount > b.cellCount; });
    return areas;
}
