/**
 * @file PlacementEngine.cpp
 */
#include "PlacementEngine.h"
#include "HashGrid.h"
#include "Logger.h"
#include "PhysicsRelaxer.h"
#include "QuadTree.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace {
constexpr float kReferenceArea = 1920.0f * 1080.0f;
constexpr int kBallSteps = 200;
constexpr float kBallSettleSpeed = 0.1f;
constexpr float kBallSpawnY = -50.0f;

static std::unique_ptr<SpatialIndex> emptyIndex(const PackingConfig& cfg, const Bounds& b, float typicalRadius) {
    if (cfg.useQuadTree) return std::make_unique<QuadTree>(0.0f, 0.0f, b.width, b.height);
    return std::make_unique<HashGrid>(b.width, b.height, HashGrid::cellSizeFor(typicalRadius));
}
}

PlacementEngine::PlacementEngine(const PackingConfig& c, unsigned seed)
    : cfg(c), rng(seed), baseSeed(seed) {}

float PlacementEngine::screenAreaRatio(const Bounds& bounds) {
    return bounds.width * bounds.height / kReferenceArea;
}

int PlacementEngine::attemptBudget(const Bounds& bounds, bool hasChangeMap) const {
    int budget = (int)std::floor((float)cfg.totalCircles * screenAreaRatio(bounds) * 10.0f);
    if (hasChangeMap) budget = (int)std::floor(budget * 1.5f);
    return std::max(1, budget);
}

SamplePoint PlacementEngine::sampleWeightedPosition(const ColorChangeMap& map, const Bounds& bounds) {
    std::uniform_real_distribution<float> ux(0.0f, bounds.width), uy(0.0f, bounds.height), u01(0.0f, 1.0f);
    SamplePoint p{ux(rng), uy(rng)};
    for (int i = 0; i < 20; ++i) {
        p = SamplePoint{ux(rng), uy(rng)};
        float accept = 0.3f + map.intensityAt(p.x, p.y) * 0.7f;
        if (u01(rng) < accept) return p;
    }
    return p;
}

std::vector<Circle> PlacementEngine::placeWeightedRandom(const Raster& raster, const ColorChangeMap* changeMap,
                                                         PlacementStats* stats) {
    const Bounds bounds = raster.bounds();
    const bool useMap = changeMap && !changeMap->empty() && cfg.enableColorChangeMap;
    const int budget = attemptBudget(bounds, useMap);
    const int maxFailures = std::max(1, std::min(1000, (int)(budget * 0.1f)));

    std::vector<Circle> circles;
    // The index points into this buffer; it must never reallocate.
    circles.reserve((size_t)cfg.totalCircles);
    auto index = emptyIndex(cfg, bounds, (cfg.minCircleSize + cfg.maxCircleSize) * 0.5f);

    PoissonSampler poisson(bounds.width, bounds.height, std::max(2.0f, cfg.minCircleSize + cfg.maxCircleSize));
    std::vector<SamplePoint> uniformPoints = poisson.generate(rng);
    std::shuffle(uniformPoints.begin(), uniformPoints.end(), rng);
    size_t nextUniform = 0;

    std::uniform_real_distribution<float> ux(0.0f, bounds.width), uy(0.0f, bounds.height), u01(0.0f, 1.0f);
    PlacementStats st;
    st.budget = budget;
    int failures = 0;
    for (int attempt = 0; attempt < budget; ++attempt) {
        if ((int)circles.size() >= cfg.totalCircles) break;
        ++st.attempts;
        SamplePoint p;
        if (useMap && u01(rng) < 0.6f) {
            p = sampleWeightedPosition(*changeMap, bounds);
        } else if (nextUniform < uniformPoints.size()) {
            p = uniformPoints[nextUniform++];
        } else {
            p = SamplePoint{ux(rng), uy(rng)};
        }

        const float intensity = useMap ? changeMap->intensityAt(p.x, p.y) : 0.0f;
        const float spacing = cfg.circleSpacing * (1.0f - 0.3f * intensity);
        float radius = std::min(cfg.maxCircleSize, index->getMaxRadiusAt(p.x, p.y, spacing, bounds));
        radius *= (1.0f - 0.7f * intensity);
        const float minAllowed = intensity > 0.3f ? cfg.minCircleSize * 0.5f : cfg.minCircleSize;

        if (radius < minAllowed || index->checkCollision(p.x, p.y, radius, spacing)) {
            ++st.rejected;
            if (++failures > maxFailures) {
                st.saturated = true;
                Logger::info("placement saturated after " + std::to_string(circles.size()) + " circles ("
                             + std::to_string(st.attempts) + "/" + std::to_string(budget) + " attempts)");
                break;
            }
            continue;
        }
        failures = 0;
        circles.emplace_back(p.x, p.y, radius, liftNearBlack(raster.sample(p.x, p.y)));
        index->insert(&circles.back());
    }
    st.placed = (int)circles.size();
    Logger::info("weighted placement: placed=" + std::to_string(st.placed) + " attempts=" + std::to_string(st.attempts)
                 + " budget=" + std::to_string(budget) + (useMap ? " (change-weighted)" : ""));
    if (stats) *stats = st;
    return circles;
}

bool PlacementEngine::simulateBall(Circle& ball, const SpatialIndex& index, const Bounds& bounds) const {
    const float g = cfg.gravity * 0.5f;
    const float r = ball.radius();
    std::vector<Circle*> nearby;
    for (int step = 0; step < kBallSteps; ++step) {
        float vx = ball.x - ball.prevX;
        float vy = ball.y - ball.prevY;
        ball.prevX = ball.x;
        ball.prevY = ball.y;
        ball.x += vx * cfg.damping;
        ball.y += vy * cfg.damping + g;

        if (ball.x - r < 0.0f) {
            ball.x = r;
            ball.prevX = ball.x + (ball.x - ball.prevX) * 0.6f;
        } else if (ball.x + r > bounds.width) {
            ball.x = bounds.width - r;
            ball.prevX = ball.x + (ball.x - ball.prevX) * 0.6f;
        }
        if (ball.y + r > bounds.height) {
            ball.y = bounds.height - r;
            ball.prevY = ball.y + (ball.y - ball.prevY) * 0.6f;
        }

        bool hasCollision = false;
        nearby.clear();
        index.getNearby(ball.x, ball.y, r + cfg.circleSpacing, nearby);
        for (const Circle* o : nearby) {
            float dx = ball.x - o->x, dy = ball.y - o->y;
            float dist = std::sqrt(dx * dx + dy * dy);
            float minDist = r + o->radius() + cfg.circleSpacing;
            if (dist >= minDist || dist <= 0.0f) continue;
            hasCollision = true;
            float nx = dx / dist, ny = dy / dist;
            float bvx = ball.x - ball.prevX, bvy = ball.y - ball.prevY;
            float dot = bvx * nx + bvy * ny;
            float overlap = minDist - dist;
            ball.x += nx * overlap;
            ball.y += ny * overlap;
            if (dot < 0.0f) {
                // reflect along the contact normal, keeping 70%
                ball.prevX = ball.x - (bvx - 2.0f * dot * nx) * 0.7f;
                ball.prevY = ball.y - (bvy - 2.0f * dot * ny) * 0.7f;
            } else {
                ball.prevX += nx * overlap;
                ball.prevY += ny * overlap;
            }
        }
        if (hasCollision) {
            // pushes must not leave the box
            ball.x = std::max(r, std::min(bounds.width - r, ball.x));
            ball.y = std::min(bounds.height - r, ball.y);
        }

        float speed = std::sqrt(vx * vx + vy * vy);
        bool nearGround = ball.y + r >= bounds.height - 5.0f;
        bool inside = ball.y - r >= 0.0f;
        if (speed < kBallSettleSpeed && (nearGround || hasCollision) && inside) {
            ball.prevX = ball.x;
            ball.prevY = ball.y;
            return true;
        }
    }
    return false;
}

std::vector<Circle> PlacementEngine::placeBouncing(const Raster& raster, PlacementStats* stats) {
    const Bounds bounds = raster.bounds();
    const int count = std::max(1, (int)std::floor(cfg.packingDensity * 2.0f * screenAreaRatio(bounds)));
    std::vector<Circle> settled;
    settled.reserve((size_t)count);
    auto index = emptyIndex(cfg, bounds, (cfg.minCircleSize + cfg.maxCircleSize) * 0.5f);

    std::uniform_real_distribution<float> u01(0.0f, 1.0f);
    PlacementStats st;
    st.budget = count;
    for (int i = 0; i < count; ++i) {
        ++st.attempts;
        float radius = cfg.minCircleSize + u01(rng) * (cfg.maxCircleSize - cfg.minCircleSize);
        radius = std::min(radius, std::min(bounds.width, bounds.height) * 0.5f);
        float x = (float)((i % 10) + 1) * (bounds.width / 11.0f) + (u01(rng) - 0.5f) * 20.0f;
        x = std::max(radius, std::min(bounds.width - radius, x));
        Circle ball(x, kBallSpawnY, radius, Rgb{});
        ball.prevX = x + (u01(rng) - 0.5f) * 2.0f;
        ball.prevY = kBallSpawnY - u01(rng) * 2.0f;
        if (!simulateBall(ball, *index, bounds)) {
            ++st.rejected;
            Logger::debug("bouncing ball " + std::to_string(i) + " did not settle; discarded");
            continue;
        }
        ball.color = liftNearBlack(raster.sample(ball.x, ball.y));
        settled.push_back(ball);
        index->insert(&settled.back());
    }
    st.placed = (int)settled.size();
    Logger::info("bouncing placement: settled=" + std::to_string(st.placed) + "/" + std::to_string(count));
    if (stats) *stats = st;
    return settled;
}

std::vector<Circle> PlacementEngine::generateLayout(const Raster& raster, const ColorChangeMap* changeMap,
                                                    const ProgressFn& progress, PlacementStats* stats) {
    auto report = [&](const std::string& phase, int pct) { if (progress) progress(phase, pct); };
    if (raster.empty()) throw std::invalid_argument("generateLayout: empty raster");

    report(cfg.usePhysicsPlacement ? "dropping circles" : "placing circles", 5);
    std::vector<Circle> circles = cfg.usePhysicsPlacement ? placeBouncing(raster, stats)
                                                          : placeWeightedRandom(raster, changeMap, stats);

    report("relaxing layout", 50);
    PhysicsRelaxer relaxer(cfg, baseSeed + 1u);
    relaxer.relax(circles, raster.bounds());

    report("finalizing", 95);
    std::uint64_t id = 1;
    for (auto& c : circles) {
        c.id = id++;
        c.color = liftNearBlack(raster.sample(c.x, c.y));
    }
    report("complete", 100);
    return circles;
}
