/**
 * @file GrowthController.cpp
 */
#include "GrowthController.h"
#include "Logger.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace {
constexpr float kTwoPi = 6.2831853071795864f;
constexpr double kPi = 3.14159265358979323846;
constexpr double kMaxStaggerMs = 500.0;
constexpr float kResampleRadius = 20.0f;
constexpr int kResampleDirections = 16;
constexpr float kRayMax = 30.0f;
constexpr float kRayStep = 1.0f;
constexpr float kStaleDistance = 5.0f;
constexpr int kFullRebuildThreshold = 10;

// Visitor for the per-frame growth pass.
struct GrowthVisitor {
    GrowthController& gc;
    Circle& c;
    const SpatialIndex& index;
    const Raster& raster;
    double now;
    void operator()(NoLifecycle&) const {}
    void operator()(Adapting&) const {}
    void operator()(Growing&) const { gc.updateGrowth(c, raster, now); }
    void operator()(DynamicSpawning&) const { gc.stepDynamicSpawn(c, index, raster.bounds()); }
};
}

GrowthController::GrowthController(const PackingConfig& c, unsigned seed)
    : cfg(c), rng(seed) {}

void GrowthController::initializeGrowth(std::vector<Circle>& circles, double nowMs) {
    if (!cfg.enableProgressiveGrowth) return;
    std::uniform_real_distribution<double> stagger(0.0, kMaxStaggerMs);
    for (auto& c : circles) {
        Growing g;
        g.targetRadius = c.radius();
        g.startRadius = g.targetRadius * cfg.startSizeMultiplier;
        g.startTimeMs = nowMs + stagger(rng);
        g.lastSampledRadius = g.startRadius;
        c.setRadius(g.startRadius);
        c.lifecycle = g;
    }
}

bool GrowthController::updateGrowth(Circle& c, const Raster& raster, double nowMs) {
    Growing* g = std::get_if<Growing>(&c.lifecycle);
    if (!g || nowMs < g->startTimeMs) return false;
    double elapsed = nowMs - g->startTimeMs;
    float progress = (float)std::min(1.0, elapsed * (double)cfg.growthRate * 0.001);
    float inv = 1.0f - progress;
    float eased = 1.0f - inv * inv * inv;
    float r = g->startRadius + (g->targetRadius - g->startRadius) * eased;
    bool changed = false;
    if (std::fabs(r - c.radius()) > 0.1f || progress >= 1.0f) {
        c.setRadius(progress >= 1.0f ? g->targetRadius : r);
        changed = true;
    }
    if (changed && !g->finalColorSampled && std::fabs(c.radius() - g->lastSampledRadius) > 0.1f) {
        c.color = raster.averageInDisk(c.x, c.y, c.radius(), rng);
        g->lastSampledRadius = c.radius();
    }
    if (!g->finalColorSampled && c.radius() >= g->targetRadius * 0.95f) {
        startColorTransition(c, raster.averageInDisk(c.x, c.y, c.radius(), rng), nowMs, cfg.colorTransitionDuration);
        g->finalColorSampled = true;
    }
    if (progress >= 1.0f) c.lifecycle = NoLifecycle{};
    return changed;
}

SpawnGrowth GrowthController::stepDynamicSpawn(Circle& c, const SpatialIndex& index, const Bounds& bounds) const {
    const DynamicSpawning* d = std::get_if<DynamicSpawning>(&c.lifecycle);
    if (!d) return SpawnGrowth::Reached;
    const float target = d->targetRadius;
    const float step = std::max(0.1f, 0.5f * cfg.growthRate);
    const float next = std::min(c.radius() + step, target);
    if (next <= c.radius()) {
        c.pinned = true;
        c.lifecycle = NoLifecycle{};
        return SpawnGrowth::Reached;
    }
    bool outside = c.x - next < 0.0f || c.y - next < 0.0f || c.x + next > bounds.width || c.y + next > bounds.height;
    if (outside || index.checkCollision(c.x, c.y, next, cfg.circleSpacing, &c)) {
        c.pinned = true;
        c.lifecycle = NoLifecycle{};
        return SpawnGrowth::Collided;
    }
    c.setRadius(next);
    if (next >= target) {
        c.pinned = true;
        c.lifecycle = NoLifecycle{};
        return SpawnGrowth::Reached;
    }
    return SpawnGrowth::Grew;
}

void GrowthController::updateLifecycles(std::vector<Circle>& circles, const SpatialIndex& index,
                                        const Raster& raster, double nowMs) {
    for (auto& c : circles) std::visit(GrowthVisitor{*this, c, index, raster, nowMs}, c.lifecycle);
}

double GrowthController::pollingIntervalMs(float averageIntensity) const {
    double scale = std::max(0.2, std::min(3.0, 3.0 - 2.8 * (double)averageIntensity));
    return cfg.colorUpdateInterval * scale;
}

int GrowthController::scheduleSimilarityChecks(const std::vector<Circle>& circles, const ColorChangeMap* changeMap,
                                               ColorSampler& sampler, double nowMs) {
    std::vector<const Circle*> eligible;
    std::vector<float> weights;
    double weightSum = 0.0;
    for (const auto& c : circles) {
        if (!c.isStable() || c.isDead() || nowMs < c.spawnProtectedUntilMs) continue;
        if (pending.count(c.id)) continue;
        float intensity = changeMap ? changeMap->intensityAt(c.x, c.y) : 0.0f;
        float w = 0.5f + intensity * 1.5f;
        eligible.push_back(&c);
        weights.push_back(w);
        weightSum += w;
    }
    if (eligible.empty()) return 0;
    const double meanWeight = weightSum / (double)eligible.size();
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    int issued = 0;
    for (size_t i = 0; i < eligible.size(); ++i) {
        double p = std::min(1.0, 0.3 * (double)weights[i] / meanWeight);
        if (u01(rng) >= p) continue;
        const Circle* c = eligible[i];
        sampler.submit(SampleRequest{c->id, c->x, c->y, c->radius()});
        pending.insert(c->id);
        ++issued;
    }
    Logger::debug("similarity checks issued: " + std::to_string(issued) + "/" + std::to_string(eligible.size()));
    return issued;
}

int GrowthController::consumeSamples(std::vector<Circle>& circles, const std::vector<SampleResponse>& responses) {
    if (responses.empty()) return 0;
    std::unordered_map<std::uint64_t, size_t> byId;
    byId.reserve(circles.size());
    for (size_t i = 0; i < circles.size(); ++i) byId[circles[i].id] = i;
    int adapting = 0;
    for (const auto& r : responses) {
        pending.erase(r.circleId);
        if (!r.ok) {
            Logger::warn("color sample failed for circle " + std::to_string(r.circleId) + ": " + r.error);
            continue;
        }
        auto it = byId.find(r.circleId);
        if (it == byId.end()) continue; // purged meanwhile
        Circle& c = circles[it->second];
        float dx = c.x - r.x, dy = c.y - r.y;
        if (dx * dx + dy * dy > kStaleDistance * kStaleDistance) {
            Logger::debug("stale color sample for circle " + std::to_string(c.id) + " discarded");
            continue;
        }
        if (!c.isStable()) continue;
        if (colorSimilarity(c.color, r.color) >= cfg.colorSimilarityThreshold) continue;
        Adapting a;
        a.phase = AdaptPhase::Resampling;
        a.originalColor = c.color;
        c.lifecycle = a;
        ++adapting;
    }
    return adapting;
}

bool GrowthController::resample(Circle& c, const Raster& raster) const {
    Adapting* a = std::get_if<Adapting>(&c.lifecycle);
    if (!a) return false;
    float best = 0.0f;
    std::optional<SeekTarget> target;
    for (int i = 0; i < kResampleDirections; ++i) {
        float angle = (float)i / (float)kResampleDirections * kTwoPi;
        float tx = c.x + std::cos(angle) * kResampleRadius;
        float ty = c.y + std::sin(angle) * kResampleRadius;
        if (tx < 0.0f || ty < 0.0f || tx >= (float)raster.width() || ty >= (float)raster.height()) continue;
        Rgb px = raster.sample(tx, ty);
        float s = colorSimilarity(c.color, px);
        if (s > best) {
            best = s;
            target = SeekTarget{tx, ty, px};
        }
    }
    if (target && best > cfg.colorSimilarityThreshold) {
        a->seekTarget = target;
        a->phase = AdaptPhase::Seeking;
        return true;
    }
    c.lifecycle = NoLifecycle{};
    return false;
}

float GrowthController::castRay(const Circle& c, float dirX, float dirY, const SpatialIndex& index,
                                const Bounds& bounds) const {
    const float r = c.radius();
    const float clearance = 3.0f * cfg.circleSpacing;
    std::vector<Circle*> nearby;
    float d = 0.0f;
    while (d < kRayMax) {
        d += kRayStep;
        float px = c.x + dirX * d, py = c.y + dirY * d;
        if (px - r - 2.0f < 0.0f || py - r - 2.0f < 0.0f || px + r + 2.0f > bounds.width || py + r + 2.0f > bounds.height)
            return std::max(0.0f, d - kRayStep);
        nearby.clear();
        index.getNearby(px, py, r + clearance, nearby);
        for (const Circle* o : nearby) {
            if (o == &c || o->id == c.id) continue;
            float dx = o->x - px, dy = o->y - py;
            float minD = r + o->radius() + clearance;
            if (dx * dx + dy * dy < minD * minD) return std::max(0.0f, d - kRayStep);
        }
    }
    return kRayMax;
}

void GrowthController::seek(Circle& c, const SpatialIndex& index, const Bounds& bounds, double nowMs) const {
    Adapting* a = std::get_if<Adapting>(&c.lifecycle);
    if (!a || !a->seekTarget) {
        c.lifecycle = NoLifecycle{};
        return;
    }
    const SeekTarget t = *a->seekTarget;
    float dx = t.x - c.x, dy = t.y - c.y;
    float dist = std::sqrt(dx * dx + dy * dy);
    if (dist > 0.0f) {
        float dirX = dx / dist, dirY = dy / dist;
        float clear = castRay(c, dirX, dirY, index, bounds);
        float move = clear * 0.1f;
        c.translate(dirX * move, dirY * move);
        startColorTransition(c, blendColors(c.color, t.color, 0.5f), nowMs, cfg.colorAnimationDuration);
        if (clear > c.radius() * 2.0f) {
            c.setRadius(std::min(cfg.maxCircleSize, c.radius() + 0.2f));
        } else if (clear < c.radius() * 0.8f) {
            // shrinking never enlarges a circle already under the minimum
            const float lower = std::min(c.radius(), cfg.minCircleSize);
            c.setRadius(std::max(lower, c.radius() * 0.95f));
        }
    }
    c.lifecycle = NoLifecycle{};
}

void GrowthController::updateAdaptations(std::vector<Circle>& circles, const SpatialIndex& index, const Raster& raster,
                                         double nowMs) {
    const Bounds bounds = raster.bounds();
    for (auto& c : circles) {
        Adapting* a = std::get_if<Adapting>(&c.lifecycle);
        if (!a) continue;
        if (a->phase == AdaptPhase::Resampling) resample(c, raster);
        else seek(c, index, bounds, nowMs);
    }
}

void GrowthController::startColorTransition(Circle& c, const Rgb& target, double nowMs, double durationMs) const {
    ColorTransition t;
    t.from = c.color;
    t.to = target;
    t.startMs = nowMs;
    t.durationMs = durationMs;
    c.colorFade = t;
}

int GrowthController::updateColorTransitions(std::vector<Circle>& circles, double nowMs) const {
    int running = 0;
    for (auto& c : circles) {
        if (!c.colorFade) continue;
        const ColorTransition& t = *c.colorFade;
        double p = t.durationMs > 0.0 ? (nowMs - t.startMs) / t.durationMs : 1.0;
        if (p >= 1.0) {
            c.color = t.to;
            c.colorFade.reset();
            continue;
        }
        p = std::max(0.0, p);
        const float eased = (float)(0.5 * (1.0 - std::cos(kPi * p)));
        c.color = blendColors(t.from, t.to, eased);
        ++running;
    }
    return running;
}

PurgeResult GrowthController::purgeDead(std::vector<Circle>& circles, std::unique_ptr<SpatialIndex>& index,
                                        const Bounds& bounds) {
    PurgeResult res;
    auto dead = [](const Circle& c) { return c.isDead(); };
    for (const auto& c : circles) {
        if (!dead(c)) continue;
        ++res.removed;
        if (c.origin == CircleOrigin::Spawned) ++res.removedSpawned;
        pending.erase(c.id);
    }
    if (res.removed == 0) return res;
    circles.erase(std::remove_if(circles.begin(), circles.end(), dead), circles.end());
    if (res.removed > kFullRebuildThreshold || !index) {
        index = makeSpatialIndex(SpatialIndex::Kind::HashGrid, bounds, circles, cfg.minCircleSize);
        res.fullRebuild = true;
    } else {
        index->rebuild(circles);
    }
    Logger::info("purged " + std::to_string(res.removed) + " dead circle(s)" + (res.fullRebuild ? ", index rebuilt" : ""));
    return res;
}
