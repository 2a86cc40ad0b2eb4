/**
 * @file Orchestrator.cpp
 * @brief Frame pipeline and generation hand-off.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Orchestrator.h"
#include "Logger.h"
#include "PlacementEngine.h"

#include <algorithm>
#include <memory>

Orchestrator::Orchestrator(const PackingConfig& c, unsigned seed, ColorSampler::Mode samplerMode)
    : cfg(c),
      seeder(seed),
      relaxer(c, seed ^ 0x9e3779b9u),
      growth(c, seed ^ 0x85ebca6bu),
      spawner(c, seed ^ 0xc2b2ae35u),
      sampler(std::make_unique<ColorSampler>(samplerMode, seed ^ 0x27d4eb2fu)) {
    cfg.validate();
    relaxer.setConfig(cfg);
    growth.setConfig(cfg);
    spawner.setConfig(cfg);
    Logger::info("orchestrator: " + cfg.describe());
}

Orchestrator::~Orchestrator() {
    if (worker) worker->stop();
    if (sampler) sampler->stop();
}

void Orchestrator::setConfig(const PackingConfig& next) {
    PackingConfig v = next;
    v.validate();
    bool regen = cfg.affectsGeneration(v);
    cfg = v;
    relaxer.setConfig(cfg);
    growth.setConfig(cfg);
    spawner.setConfig(cfg);
    if (regen) {
        Logger::info("config change affects layout; regenerating");
        requestRegeneration();
    }
}

void Orchestrator::requestRegeneration() {
    if (genStatus.generating) {
        deferred = true;
        Logger::debug("regeneration deferred until the running job reports back");
        return;
    }
    needsGeneration = true;
}

const ColorChangeMap* Orchestrator::changeMap() const {
    if (!cfg.enableColorChangeMap || !tracker.hasMap()) return nullptr;
    return &tracker.map();
}

void Orchestrator::frame(const Raster& raster, double dtMs) {
    ctx.nowMs += std::max(0.0, dtMs);
    ++ctx.frame;
    if (raster.empty()) return;
    if (raster.width() != canvasW || raster.height() != canvasH) {
        if (canvasW != 0) Logger::info("canvas resized; regenerating");
        canvasW = raster.width();
        canvasH = raster.height();
        requestRegeneration();
    }
    if (cfg.enableColorChangeMap) tracker.update(raster, ctx.nowMs);

    pollWorker(raster);
    if (needsGeneration && !genStatus.generating) startGeneration(raster);
    if (circleList.empty()) return;
    simulate(raster);
}

void Orchestrator::startGeneration(const Raster& raster) {
    needsGeneration = false;
    if (!cfg.useWorker) {
        generateSynchronously(raster);
        return;
    }
    if (!worker) {
        worker = workerJob ? std::make_unique<GenerationWorker>(workerJob) : std::make_unique<GenerationWorker>();
        if (!worker->start()) {
            Logger::warn("generation worker unavailable; generating synchronously");
            worker.reset();
            ++genStatus.fallbacks;
            generateSynchronously(raster);
            return;
        }
    }
    GenerationRequest req;
    req.id = ++requestCounter;
    req.raster = raster;
    if (const ColorChangeMap* m = changeMap()) req.changeMap = *m;
    req.config = cfg;
    req.seed = (unsigned)seeder();
    if (!worker->submit(std::move(req))) {
        Logger::warn("generation worker refused request; generating synchronously");
        ++genStatus.fallbacks;
        generateSynchronously(raster);
        return;
    }
    activeRequest = requestCounter;
    genStatus.generating = true;
    genStatus.phase = "queued";
    genStatus.percent = 0;
    Logger::info("generation " + std::to_string(activeRequest) + " submitted to worker");
}

void Orchestrator::pollWorker(const Raster& raster) {
    if (!worker) return;
    for (auto& msg : worker->poll()) {
        if (msg.requestId != activeRequest) continue;
        switch (msg.kind) {
            case GenerationMessage::Kind::Progress:
                genStatus.phase = msg.phase;
                genStatus.percent = msg.percent;
                Logger::debug("generation progress: " + msg.phase + " " + std::to_string(msg.percent) + "%");
                break;
            case GenerationMessage::Kind::Result:
                genStatus.generating = false;
                adopt(std::move(msg.circles), raster);
                break;
            case GenerationMessage::Kind::Error:
                genStatus.generating = false;
                genStatus.lastError = msg.error;
                ++genStatus.fallbacks;
                Logger::warn("generation failed (" + msg.error + "); falling back to synchronous generation");
                generateSynchronously(raster);
                break;
        }
    }
    if (!genStatus.generating && deferred) {
        deferred = false;
        needsGeneration = true;
    }
}

void Orchestrator::generateSynchronously(const Raster& raster) {
    try {
        PlacementEngine engine(cfg, (unsigned)seeder());
        auto progress = [this](const std::string& phase, int pct) {
            genStatus.phase = phase;
            genStatus.percent = pct;
        };
        adopt(engine.generateLayout(raster, changeMap(), progress), raster);
    } catch (const std::exception& e) {
        Logger::logException("synchronous generation", e);
        genStatus.lastError = e.what();
    }
}

void Orchestrator::adopt(std::vector<Circle>&& layout, const Raster& raster) {
    circleList = std::move(layout);
    for (auto& c : circleList) {
        c.id = ctx.nextCircleId++;
        c.createdAtMs = ctx.nowMs;
    }
    // Size grid cells from the full-grown radii, before growth shrinks them to seeds.
    SpatialIndex::Kind kind = cfg.useQuadTree ? SpatialIndex::Kind::QuadTree : SpatialIndex::Kind::HashGrid;
    spatial = makeSpatialIndex(kind, raster.bounds(), circleList, cfg.minCircleSize);
    growth.forgetPending();
    growth.initializeGrowth(circleList, ctx.nowMs);
    spatial->rebuild(circleList);
    ctx.totalSpawned = 0;
    ctx.lastSpawnCheckMs = ctx.nowMs;
    ctx.lastColorCheckMs = ctx.nowMs;
    ++ctx.generation;
    genStatus.phase = "complete";
    genStatus.percent = 100;
    Logger::info("layout " + std::to_string(ctx.generation) + " adopted: " + std::to_string(circleList.size()) + " circles");
}

void Orchestrator::simulate(const Raster& raster) {
    const Bounds bounds = raster.bounds();
    if (cfg.useVerletPhysics) relaxer.frameStep(circleList, bounds);
    spatial->rebuild(circleList);

    growth.updateLifecycles(circleList, *spatial, raster, ctx.nowMs);

    if (cfg.enableColorMonitoring) {
        growth.consumeSamples(circleList, sampler->drain());
        growth.updateAdaptations(circleList, *spatial, raster, ctx.nowMs);
        const ColorChangeMap* m = changeMap();
        double interval = growth.pollingIntervalMs(m ? m->average() : 0.0f);
        if (ctx.nowMs - ctx.lastColorCheckMs >= interval) {
            sampler->setSource(std::make_shared<const Raster>(raster));
            growth.scheduleSimilarityChecks(circleList, m, *sampler, ctx.nowMs);
            ctx.lastColorCheckMs = ctx.nowMs;
        }
    }
    growth.updateColorTransitions(circleList, ctx.nowMs);

    if (cfg.enableDynamicSpawning && spawner.due(ctx)) spawner.runCycle(circleList, spatial, raster, ctx);

    PurgeResult purged = growth.purgeDead(circleList, spatial, bounds);
    if (purged.removedSpawned > 0) ctx.totalSpawned = std::max(0, ctx.totalSpawned - purged.removedSpawned);
}

std::vector<CircleRecord> Orchestrator::output() const {
    std::vector<CircleRecord> out;
    out.reserve(std::min(kMaxOutputCircles, circleList.size()));
    for (const auto& c : circleList) {
        if (out.size() >= kMaxOutputCircles) break;
        if (c.isDead()) continue;
        out.push_back(CircleRecord{c.x, c.y, c.radius(), c.color});
    }
    return out;
}
