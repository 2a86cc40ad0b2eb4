/**
 * @file DynamicSpawner.h
 * @brief Periodically injects growing circles into empty regions of the layout.
 */
#pragma once

#include "Circle.h"
#include "Config.h"
#include "Raster.h"
#include "SimulationContext.h"
#include "SpatialIndex.h"

#include <memory>
#include <random>
#include <vector>

class HashGrid;

struct SpawnCandidate {
    float x{0.0f};
    float y{0.0f};
    float maxRadius{0.0f};
};

struct SpawnReport {
    int spawned{0};
    int areasFound{0};
    bool convertedIndex{false}; /**< QuadTree replaced by a HashGrid; spawning deferred to the next cycle */
    bool usedFallback{false};   /**< no empty area found; positions drawn uniformly */
    bool capped{false};
};

class DynamicSpawner {
public:
    static constexpr int kMaxTotalSpawns = 2000;
    static constexpr double kSpawnProtectionMs = 2000.0;

    DynamicSpawner(const PackingConfig& cfg, unsigned seed);
    void setConfig(const PackingConfig& c) { cfg = c; }

    /** @brief True once spawnInterval has elapsed since the last check. */
    bool due(const SimulationContext& ctx) const;

    /**
     * @brief One spawn cycle. Appends new DynamicSpawning circles to @p circles, updates the spawn
     *        counter and rebuilds @p index, which may be replaced.
     */
    SpawnReport runCycle(std::vector<Circle>& circles, std::unique_ptr<SpatialIndex>& index,
                         const Raster& raster, SimulationContext& ctx);

    /** @brief Up to 2 points in each of the 3 best areas, 20% inside their edges, radius >= 2. */
    std::vector<SpawnCandidate> pickAreaPoints(const std::vector<EmptyArea>& areas, const HashGrid& grid,
                                               const Bounds& bounds, int maxPoints);
    /** @brief Uniform fallback with the same radius and separation rules. */
    std::vector<SpawnCandidate> pickRandomPoints(const SpatialIndex& index, const Bounds& bounds, int maxPoints);

private:
    bool separated(const std::vector<SpawnCandidate>& chosen, float x, float y, float maxRadius) const;

    PackingConfig cfg;
    std::mt19937 rng;
};
