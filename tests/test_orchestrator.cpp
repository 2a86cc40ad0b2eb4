#include "TestSupport.h"

#include "HashGrid.h"
#include "Orchestrator.h"

#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>

namespace {

PackingConfig smallConfig(bool useWorker) {
    PackingConfig cfg;
    cfg.totalCircles = 60;
    cfg.maxCircleSize = 12.0f;
    cfg.useWorker = useWorker;
    return cfg;
}

// Drive frames until the given generation is adopted; ~10 s limit.
bool runUntilGeneration(Orchestrator& orch, const Raster& raster, std::uint64_t generation) {
    for (int i = 0; i < 2000; ++i) {
        orch.frame(raster, 16.0);
        if (orch.context().generation >= generation) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

void testSynchronousFrames() {
    Orchestrator orch(smallConfig(false), 17, ColorSampler::Mode::Inline);
    Raster raster = solidRaster(400, 300, 200, 120, 40);
    orch.frame(raster, 16.0);
    REQUIRE(orch.context().generation == 1, "inline generation adopted in the first frame");
    REQUIRE(!orch.status().generating && orch.status().percent == 100, "generation complete");
    REQUIRE(!orch.circles().empty(), "layout present");
    REQUIRE(orch.index() != nullptr && orch.index()->size() == orch.circles().size(), "index covers the layout");
    std::set<std::uint64_t> ids;
    for (const auto& c : orch.circles()) ids.insert(c.id);
    REQUIRE(ids.size() == orch.circles().size(), "ids are unique");

    for (int i = 0; i < 200; ++i) orch.frame(raster, 16.0);
    REQUIRE_NEAR(orch.context().nowMs, 201.0 * 16.0, 1e-6, "clock advances by dt");
    REQUIRE(orch.context().frame == 201, "frame counter");
    REQUIRE(orch.context().generation == 1, "no spurious regeneration");
    REQUIRE(orch.index()->size() == orch.circles().size(), "index tracks spawns and purges");
    for (const auto& c : orch.circles()) {
        REQUIRE(c.x >= 0.0f && c.x <= 400.0f && c.y >= 0.0f && c.y <= 300.0f, "centres stay on the canvas");
        REQUIRE(c.radius() >= 0.0f, "radius never negative");
    }
    auto out = orch.output();
    REQUIRE(!out.empty() && out.size() <= orch.circles().size(), "records for live circles");
    for (const auto& r : out) REQUIRE(r.radius > 0.0f, "output skips dead circles");

    orch.frame(solidRaster(500, 300, 200, 120, 40), 16.0);
    REQUIRE(orch.context().generation == 2, "resize regenerates");
}

void testConfigChanges() {
    Orchestrator orch(smallConfig(false), 5, ColorSampler::Mode::Inline);
    Raster raster = solidRaster(300, 300, 40, 40, 200);
    orch.frame(raster, 16.0);
    REQUIRE(orch.context().generation == 1, "first layout");

    PackingConfig next = orch.config();
    next.growthRate = 0.9f;
    orch.setConfig(next);
    orch.frame(raster, 16.0);
    REQUIRE(orch.context().generation == 1, "growth rate is a live option");
    REQUIRE_NEAR(orch.config().growthRate, 0.9f, 1e-6, "applied");

    next.circleSpacing = 3.0f;
    orch.setConfig(next);
    orch.frame(raster, 16.0);
    REQUIRE(orch.context().generation == 2, "spacing change regenerates");
}

void testGridSizedForGrownCircles() {
    PackingConfig cfg;
    cfg.useWorker = false;
    cfg.enableDynamicSpawning = false;
    cfg.enableColorMonitoring = false;
    Orchestrator orch(cfg, 11, ColorSampler::Mode::Inline);
    Raster raster = solidRaster(800, 600, 120, 80, 200);
    for (int i = 0; i < 400; ++i) orch.frame(raster, 16.0);
    REQUIRE(orch.context().generation == 1, "single layout");
    for (const auto& c : orch.circles()) REQUIRE(c.isStable(), "growth finished");

    REQUIRE(orch.index()->kind() == SpatialIndex::Kind::HashGrid, "hash grid by default");
    const float avg = averageRadius(orch.circles(), cfg.minCircleSize);
    const float cell = static_cast<const HashGrid*>(orch.index())->cellSize();
    REQUIRE_NEAR(cell, HashGrid::cellSizeFor(avg), 1e-3, "cell follows the grown radii: " << cell << " vs " << HashGrid::cellSizeFor(avg));
    REQUIRE(cell > 10.0f, "not sized from the seed radii: " << cell);
}

void testOutputCap() {
    PackingConfig cfg;
    cfg.totalCircles = 500;
    cfg.maxCircleSize = 10.0f;
    cfg.useWorker = false;
    cfg.enableDynamicSpawning = false;
    Orchestrator orch(cfg, 3, ColorSampler::Mode::Inline);
    orch.frame(solidRaster(1920, 1080, 90, 160, 90), 16.0);
    REQUIRE(orch.circles().size() > Orchestrator::kMaxOutputCircles, "more circles than the cap: " << orch.circles().size());
    auto out = orch.output();
    REQUIRE(out.size() == Orchestrator::kMaxOutputCircles, "output capped: " << out.size());
    REQUIRE(out[0].x == orch.circles()[0].x && out[0].y == orch.circles()[0].y, "draw order preserved");
}

void testWorkerPath() {
    Orchestrator orch(smallConfig(true), 23, ColorSampler::Mode::Inline);
    Raster raster = solidRaster(400, 300, 30, 200, 200);
    orch.frame(raster, 16.0);
    REQUIRE(orch.status().generating, "job handed to the worker");
    REQUIRE(orch.circles().empty(), "nothing adopted yet");
    orch.requestRegeneration();
    REQUIRE(orch.regenerationDeferred(), "request while generating is deferred");
    REQUIRE(runUntilGeneration(orch, raster, 1), "worker result adopted");
    REQUIRE(!orch.regenerationDeferred(), "deferred request picked up");
    REQUIRE(!orch.circles().empty() && orch.status().fallbacks == 0, "worker layout in use");
    REQUIRE(runUntilGeneration(orch, raster, 2), "deferred regeneration completes");
}

void testWorkerFailureFallsBack() {
    Orchestrator orch(smallConfig(true), 29, ColorSampler::Mode::Inline);
    orch.setWorkerJob([](const GenerationRequest&, const ProgressFn&) -> std::vector<Circle> {
        throw std::runtime_error("worker exploded");
    });
    Raster raster = solidRaster(400, 300, 150, 150, 30);
    REQUIRE(runUntilGeneration(orch, raster, 1), "layout adopted despite the failure");
    REQUIRE(orch.status().fallbacks >= 1, "fallback counted");
    REQUIRE(orch.status().lastError == "worker exploded", "error surfaced: " << orch.status().lastError);
    REQUIRE(!orch.status().generating && !orch.circles().empty(), "synchronous layout in use");
}

void testEmptyRasterIgnored() {
    Orchestrator orch(smallConfig(false), 31, ColorSampler::Mode::Inline);
    orch.frame(Raster(), 16.0);
    REQUIRE(orch.context().generation == 0 && orch.circles().empty(), "empty raster skips the frame");
    REQUIRE(orch.context().frame == 1, "clock still advances");
}

} // namespace

int main() {
    testSynchronousFrames();
    testConfigChanges();
    testGridSizedForGrownCircles();
    testOutputCap();
    testWorkerPath();
    testWorkerFailureFallsBack();
    testEmptyRasterIgnored();
    std::cout << "[PASS] test_orchestrator\n";
    return 0;
}
