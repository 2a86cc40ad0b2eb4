/**
 * @file Orchestrator.h
 * @brief Per-frame driver: offloaded generation, physics, growth, colour adaptation, spawning and output.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Circle.h"
#include "ColorChangeTracker.h"
#include "ColorSampler.h"
#include "Config.h"
#include "DynamicSpawner.h"
#include "GenerationWorker.h"
#include "GrowthController.h"
#include "PhysicsRelaxer.h"
#include "Raster.h"
#include "SimulationContext.h"
#include "SpatialIndex.h"

#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

/** @brief Generation telemetry surfaced to the front end. */
struct GenerationStatus {
    bool generating{false};
    std::string phase;
    int percent{0};
    std::string lastError;
    int fallbacks{0};        /**< synchronous generations after a worker failure */
};

/**
 * @class Orchestrator
 * @brief Owns the circle list and everything that mutates it.
 *
 * The layout is produced once (on the worker when useWorker is set, else inline) and then evolved
 * frame by frame on the calling thread. A regeneration request while a job is running is deferred
 * until that job reports back; the old layout keeps animating meanwhile.
 */
class Orchestrator {
public:
    static constexpr std::size_t kMaxOutputCircles = 300;

    explicit Orchestrator(const PackingConfig& cfg, unsigned seed = std::random_device{}(),
                          ColorSampler::Mode samplerMode = ColorSampler::Mode::Threaded);
    ~Orchestrator();
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /** @brief Validate and apply; a change to a layout-shaping option schedules regeneration. */
    void setConfig(const PackingConfig& cfg);
    const PackingConfig& config() const { return cfg; }
    void requestRegeneration();
    /** @brief Generator the worker runs; takes effect when the worker is next created. */
    void setWorkerJob(GenerationWorker::Job job) { workerJob = std::move(job); }

    /** @brief Advance the simulation clock by @p dtMs and run one frame against @p raster. */
    void frame(const Raster& raster, double dtMs);

    /** @brief First kMaxOutputCircles live circles in draw order. */
    std::vector<CircleRecord> output() const;

    const std::vector<Circle>& circles() const { return circleList; }
    const SimulationContext& context() const { return ctx; }
    const GenerationStatus& status() const { return genStatus; }
    const ColorChangeTracker& changeTracker() const { return tracker; }
    const SpatialIndex* index() const { return spatial.get(); }
    bool regenerationDeferred() const { return deferred; }

private:
    void pollWorker(const Raster& raster);
    void startGeneration(const Raster& raster);
    void generateSynchronously(const Raster& raster);
    void adopt(std::vector<Circle>&& layout, const Raster& raster);
    void simulate(const Raster& raster);
    const ColorChangeMap* changeMap() const;

    PackingConfig cfg;
    std::mt19937 seeder;
    SimulationContext ctx;
    std::vector<Circle> circleList;
    std::unique_ptr<SpatialIndex> spatial;
    ColorChangeTracker tracker;
    PhysicsRelaxer relaxer;
    GrowthController growth;
    DynamicSpawner spawner;
    std::unique_ptr<ColorSampler> sampler;
    std::unique_ptr<GenerationWorker> worker;
    GenerationWorker::Job workerJob;
    GenerationStatus genStatus;
    bool needsGeneration{true};
    bool deferred{false};
    std::uint64_t activeRequest{0};
    std::uint64_t requestCounter{0};
    int canvasW{0};
    int canvasH{0};
};
