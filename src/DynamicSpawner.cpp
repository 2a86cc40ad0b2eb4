/**
 * @file DynamicSpawner.cpp
 */
#include "DynamicSpawner.h"
#include "HashGrid.h"
#include "Logger.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr int kTopAreas = 3;
constexpr int kPointsPerArea = 2;
constexpr int kTriesPerPoint = 20;
constexpr float kMinSpawnRadius = 2.0f;
constexpr float kStartRadius = 5.0f;
}

DynamicSpawner::DynamicSpawner(const PackingConfig& c, unsigned seed)
    : cfg(c), rng(seed) {}

bool DynamicSpawner::due(const SimulationContext& ctx) const {
    return ctx.nowMs - ctx.lastSpawnCheckMs >= cfg.spawnInterval;
}

bool DynamicSpawner::separated(const std::vector<SpawnCandidate>& chosen, float x, float y, float maxRadius) const {
    for (const auto& p : chosen) {
        float minSep = 3.0f * std::max(p.maxRadius, maxRadius);
        float dx = p.x - x, dy = p.y - y;
        if (dx * dx + dy * dy < minSep * minSep) return false;
    }
    return true;
}

std::vector<SpawnCandidate> DynamicSpawner::pickAreaPoints(const std::vector<EmptyArea>& areas, const HashGrid& grid,
                                                           const Bounds& bounds, int maxPoints) {
    std::vector<SpawnCandidate> chosen;
    std::uniform_real_distribution<float> u01(0.0f, 1.0f);
    const int nAreas = std::min(kTopAreas, (int)areas.size());
    for (int a = 0; a < nAreas && (int)chosen.size() < maxPoints; ++a) {
        const EmptyArea& area = areas[(size_t)a];
        float left = area.x - area.width * 0.5f, top = area.y - area.height * 0.5f;
        int taken = 0;
        for (int t = 0; t < kPointsPerArea * kTriesPerPoint; ++t) {
            if (taken >= kPointsPerArea || (int)chosen.size() >= maxPoints) break;
            float x = left + area.width * (0.2f + 0.6f * u01(rng));
            float y = top + area.height * (0.2f + 0.6f * u01(rng));
            float maxR = grid.getMaxRadiusAt(x, y, cfg.circleSpacing, bounds);
            if (maxR < kMinSpawnRadius) continue;
            if (!separated(chosen, x, y, maxR)) continue;
            chosen.push_back(SpawnCandidate{x, y, maxR});
            ++taken;
        }
    }
    return chosen;
}

std::vector<SpawnCandidate> DynamicSpawner::pickRandomPoints(const SpatialIndex& index, const Bounds& bounds, int maxPoints) {
    std::vector<SpawnCandidate> chosen;
    std::uniform_real_distribution<float> ux(0.0f, bounds.width), uy(0.0f, bounds.height);
    for (int t = 0; t < maxPoints * kTriesPerPoint && (int)chosen.size() < maxPoints; ++t) {
        float x = ux(rng), y = uy(rng);
        float maxR = index.getMaxRadiusAt(x, y, cfg.circleSpacing, bounds);
        if (maxR < kMinSpawnRadius) continue;
        if (!separated(chosen, x, y, maxR)) continue;
        chosen.push_back(SpawnCandidate{x, y, maxR});
    }
    return chosen;
}

SpawnReport DynamicSpawner::runCycle(std::vector<Circle>& circles, std::unique_ptr<SpatialIndex>& index,
                                     const Raster& raster, SimulationContext& ctx) {
    SpawnReport rep;
    ctx.lastSpawnCheckMs = ctx.nowMs;
    const Bounds bounds = raster.bounds();
    if (ctx.totalSpawned >= kMaxTotalSpawns) {
        rep.capped = true;
        return rep;
    }
    if (!index || index->kind() != SpatialIndex::Kind::HashGrid) {
        index = makeSpatialIndex(SpatialIndex::Kind::HashGrid, bounds, circles, cfg.minCircleSize);
        rep.convertedIndex = true;
        Logger::info("spawner: converted index to hash grid (cell " +
                     std::to_string(static_cast<const HashGrid&>(*index).cellSize()) + "), spawning deferred");
        return rep;
    }
    const HashGrid& grid = static_cast<const HashGrid&>(*index);
    const int budget = std::min(cfg.maxSpawnsPerCheck, kMaxTotalSpawns - ctx.totalSpawned);
    if (budget <= 0) return rep;

    std::vector<EmptyArea> areas = grid.findEmptyAreas(cfg.minEmptyAreaSize);
    rep.areasFound = (int)areas.size();
    std::vector<SpawnCandidate> points;
    if (!areas.empty()) {
        points = pickAreaPoints(areas, grid, bounds, budget);
    } else {
        rep.usedFallback = true;
        points = pickRandomPoints(grid, bounds, budget);
    }

    std::uniform_real_distribution<float> frac(0.3f, 0.8f);
    std::vector<Circle> fresh;
    fresh.reserve(points.size());
    for (const auto& p : points) {
        float target = std::min(cfg.maxCircleSize, p.maxRadius * frac(rng));
        float start = std::min(kStartRadius, target);
        Circle c(p.x, p.y, start, liftNearBlack(raster.sample(p.x, p.y)));
        c.id = ctx.nextCircleId++;
        c.origin = CircleOrigin::Spawned;
        c.createdAtMs = ctx.nowMs;
        c.spawnProtectedUntilMs = ctx.nowMs + kSpawnProtectionMs;
        c.lifecycle = DynamicSpawning{target};
        fresh.push_back(c);
    }
    if (!fresh.empty()) {
        circles.insert(circles.end(), fresh.begin(), fresh.end());
        index->rebuild(circles);
    }
    rep.spawned = (int)fresh.size();
    ctx.totalSpawned += rep.spawned;
    Logger::info("spawn cycle: areas=" + std::to_string(rep.areasFound) + " spawned=" + std::to_string(rep.spawned)
                 + " total=" + std::to_string(ctx.totalSpawned) + (rep.usedFallback ? " (random fallback)" : ""));
    return rep;
}
