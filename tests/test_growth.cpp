#include "TestSupport.h"

#include "ColorSampler.h"
#include "Config.h"
#include "GrowthController.h"
#include "HashGrid.h"

#include <memory>

namespace {

const Rgb kBlue{0.0f, 0.0f, 1.0f};

Circle withId(Circle c, std::uint64_t id) {
    c.id = id;
    return c;
}

void testDynamicSpawnReachesTarget() {
    PackingConfig cfg;
    GrowthController gc(cfg, 1);
    const Bounds b{400.0f, 400.0f};
    std::vector<Circle> circles{withId(Circle(200.0f, 200.0f, 5.0f, kBlue), 1)};
    circles[0].lifecycle = DynamicSpawning{20.0f};
    HashGrid grid(400.0f, 400.0f, 20.0f);
    grid.rebuild(circles);

    SpawnGrowth last = SpawnGrowth::Grew;
    int steps = 0;
    while (last == SpawnGrowth::Grew && steps < 1000) {
        last = gc.stepDynamicSpawn(circles[0], grid, b);
        REQUIRE(circles[0].radius() <= 20.0f, "never exceeds target");
        ++steps;
    }
    REQUIRE(last == SpawnGrowth::Reached, "spawn reaches its target");
    REQUIRE(circles[0].radius() == 20.0f, "final radius is exactly the target: " << circles[0].radius());
    REQUIRE(circles[0].pinned, "pinned on completion");
    REQUIRE(circles[0].isStable(), "lifecycle ends");
    REQUIRE(steps == 60, "0.25 per step from 5 to 20: " << steps);
}

void testDynamicSpawnStopsOnCollision() {
    PackingConfig cfg;
    GrowthController gc(cfg, 1);
    const Bounds b{400.0f, 400.0f};
    std::vector<Circle> circles{withId(Circle(200.0f, 200.0f, 5.0f, kBlue), 1),
                                withId(Circle(230.0f, 200.0f, 5.0f, kBlue), 2)};
    circles[0].lifecycle = DynamicSpawning{40.0f};
    HashGrid grid(400.0f, 400.0f, 20.0f);
    grid.rebuild(circles);

    SpawnGrowth last = SpawnGrowth::Grew;
    for (int i = 0; i < 1000 && last == SpawnGrowth::Grew; ++i) last = gc.stepDynamicSpawn(circles[0], grid, b);
    REQUIRE(last == SpawnGrowth::Collided, "growth stops at the neighbour");
    // 30 apart, neighbour radius 5, spacing 1.2: the radius cannot pass 23.8
    REQUIRE(circles[0].radius() <= 23.8f && circles[0].radius() > 23.0f, "stopped just short: " << circles[0].radius());
    REQUIRE(circles[0].pinned && circles[0].isStable(), "frozen on collision");
    REQUIRE(pairGap(circles[0], circles[1]) >= cfg.circleSpacing - 1e-4f, "gap respects spacing");
}

void testProgressiveGrowth() {
    PackingConfig cfg;
    GrowthController gc(cfg, 3);
    Raster raster = solidRaster(200, 200, 0, 0, 255);
    std::vector<Circle> circles{withId(Circle(100.0f, 100.0f, 20.0f, Rgb{1.0f, 0.0f, 0.0f}), 1)};
    gc.initializeGrowth(circles, 1000.0);
    REQUIRE_NEAR(circles[0].radius(), 6.0f, 1e-5, "starts at target * startSizeMultiplier");
    const Growing* g = std::get_if<Growing>(&circles[0].lifecycle);
    REQUIRE(g != nullptr, "growing lifecycle set");
    const double start = g->startTimeMs;
    REQUIRE(start >= 1000.0 && start < 1500.0, "start staggered by at most 500 ms");

    REQUIRE(!gc.updateGrowth(circles[0], raster, start - 1.0), "nothing before the staggered start");

    // growthRate 0.5 -> progress 0.5 after 1000 ms; ease-out cubic gives 0.875
    gc.updateGrowth(circles[0], raster, start + 1000.0);
    REQUIRE_NEAR(circles[0].radius(), 6.0f + 14.0f * 0.875f, 1e-3, "eased radius at half time");
    REQUIRE(!circles[0].isStable(), "still growing");

    gc.updateGrowth(circles[0], raster, start + 2000.0);
    REQUIRE(circles[0].radius() == 20.0f, "full radius at completion");
    REQUIRE(circles[0].isStable(), "growth completes into the stable state");
    REQUIRE(circles[0].colorFade.has_value(), "final colour fades in");
    REQUIRE(circles[0].colorFade->durationMs == cfg.colorTransitionDuration, "fade uses the transition duration");
    REQUIRE(gc.updateColorTransitions(circles, start + 2000.0 + cfg.colorTransitionDuration) == 0, "fade finished");
    REQUIRE(!circles[0].colorFade, "finished fade cleared");
    REQUIRE(circles[0].color.b > 0.9f && circles[0].color.r < 0.1f, "final colour sampled from the image");

    PackingConfig off = cfg;
    off.enableProgressiveGrowth = false;
    GrowthController none(off, 3);
    std::vector<Circle> untouched{Circle(50.0f, 50.0f, 10.0f, kBlue)};
    none.initializeGrowth(untouched, 0.0);
    REQUIRE(untouched[0].radius() == 10.0f && untouched[0].isStable(), "disabled growth leaves circles alone");
}

void testResampleWithoutMatch() {
    PackingConfig cfg;
    GrowthController gc(cfg, 4);
    Raster red = solidRaster(200, 200, 255, 0, 0);
    Circle c = withId(Circle(100.0f, 100.0f, 8.0f, kBlue), 1);
    Adapting a;
    a.originalColor = kBlue;
    c.lifecycle = a;
    REQUIRE(!gc.resample(c, red), "no direction matches");
    REQUIRE(c.isStable(), "back to stable");
    REQUIRE(c.x == 100.0f && c.y == 100.0f && c.color.b == 1.0f && c.color.r == 0.0f, "circle unchanged");
}

void testResampleFindsTarget() {
    PackingConfig cfg;
    GrowthController gc(cfg, 4);
    // right half blue, left half red; a blue circle sitting just left of the border
    Raster img(200, 200);
    for (int y = 0; y < 200; ++y)
        for (int x = 0; x < 200; ++x) img.setPixel(x, y, x >= 110 ? 0 : 255, 0, x >= 110 ? 255 : 0);
    Circle c = withId(Circle(100.0f, 100.0f, 8.0f, kBlue), 1);
    c.lifecycle = Adapting{};
    REQUIRE(gc.resample(c, img), "a matching direction exists");
    const Adapting* a = std::get_if<Adapting>(&c.lifecycle);
    REQUIRE(a && a->phase == AdaptPhase::Seeking && a->seekTarget, "seeking with a target");
    REQUIRE(a->seekTarget->x >= 110.0f, "target lies in the blue half");
}

void testSeekMovesAndGrows() {
    PackingConfig cfg;
    GrowthController gc(cfg, 5);
    const Bounds b{400.0f, 400.0f};
    std::vector<Circle> circles{withId(Circle(100.0f, 100.0f, 5.0f, Rgb{0.0f, 0.0f, 0.0f}), 1)};
    Adapting a;
    a.phase = AdaptPhase::Seeking;
    a.seekTarget = SeekTarget{120.0f, 100.0f, Rgb{1.0f, 1.0f, 1.0f}};
    circles[0].lifecycle = a;
    HashGrid grid(400.0f, 400.0f, 20.0f);
    grid.rebuild(circles);

    REQUIRE_NEAR(gc.castRay(circles[0], 1.0f, 0.0f, grid, b), 30.0f, 1e-5, "open ray runs to its limit");
    gc.seek(circles[0], grid, b, 1000.0);
    REQUIRE_NEAR(circles[0].x, 103.0f, 1e-4, "moves 10% of the clear distance");
    REQUIRE_NEAR(circles[0].prevX, 103.0f, 1e-4, "no velocity injected");
    REQUIRE(circles[0].color.r == 0.0f, "colour changes through a fade");
    REQUIRE(circles[0].colorFade && circles[0].colorFade->durationMs == cfg.colorAnimationDuration, "animation duration");
    REQUIRE_NEAR(circles[0].colorFade->to.r, 0.5f, 1e-5, "fade target blended halfway");
    gc.updateColorTransitions(circles, 1000.0 + cfg.colorAnimationDuration);
    REQUIRE_NEAR(circles[0].color.r, 0.5f, 1e-5, "colour blended halfway");
    REQUIRE_NEAR(circles[0].radius(), 5.2f, 1e-5, "grows in open space");
    REQUIRE(circles[0].isStable(), "seek is a single step");
}

void testSeekShrinksWhenCrowded() {
    PackingConfig cfg;
    GrowthController gc(cfg, 5);
    const Bounds b{400.0f, 400.0f};
    std::vector<Circle> circles{withId(Circle(100.0f, 100.0f, 10.0f, kBlue), 1),
                                withId(Circle(125.0f, 100.0f, 5.0f, kBlue), 2)};
    Adapting a;
    a.phase = AdaptPhase::Seeking;
    a.seekTarget = SeekTarget{130.0f, 100.0f, kBlue};
    circles[0].lifecycle = a;
    HashGrid grid(400.0f, 400.0f, 20.0f);
    grid.rebuild(circles);

    // clearance 10 + 5 + 3 * 1.2 = 18.6 is breached at d = 7
    REQUIRE_NEAR(gc.castRay(circles[0], 1.0f, 0.0f, grid, b), 6.0f, 1e-5, "ray stops before the neighbour");
    gc.seek(circles[0], grid, b, 0.0);
    REQUIRE_NEAR(circles[0].x, 100.6f, 1e-4, "short move");
    REQUIRE_NEAR(circles[0].radius(), 9.5f, 1e-4, "shrinks when crowded");
}

void testSeekNeverEnlargesSmallCircle() {
    PackingConfig cfg; // minCircleSize 2
    GrowthController gc(cfg, 5);
    const Bounds b{400.0f, 400.0f};
    std::vector<Circle> circles{withId(Circle(100.0f, 100.0f, 1.5f, kBlue), 1),
                                withId(Circle(111.0f, 100.0f, 5.0f, kBlue), 2)};
    Adapting a;
    a.phase = AdaptPhase::Seeking;
    a.seekTarget = SeekTarget{130.0f, 100.0f, kBlue};
    circles[0].lifecycle = a;
    HashGrid grid(400.0f, 400.0f, 20.0f);
    grid.rebuild(circles);

    // clearance 1.5 + 5 + 3.6 = 10.1 is breached at the first step
    REQUIRE(gc.castRay(circles[0], 1.0f, 0.0f, grid, b) == 0.0f, "no room toward the target");
    gc.seek(circles[0], grid, b, 0.0);
    REQUIRE(circles[0].radius() <= 1.5f, "crowded circle below the minimum is not enlarged: " << circles[0].radius());
    REQUIRE(circles[0].isStable(), "seek ends the cycle");
}

void testColorTransitionEasing() {
    PackingConfig cfg;
    GrowthController gc(cfg, 8);
    std::vector<Circle> circles{withId(Circle(50.0f, 50.0f, 5.0f, Rgb{0.0f, 0.0f, 0.0f}), 1),
                                withId(Circle(80.0f, 50.0f, 5.0f, kBlue), 2)};
    gc.startColorTransition(circles[0], Rgb{1.0f, 0.8f, 0.4f}, 2000.0, 1500.0);
    REQUIRE(circles[0].color.r == 0.0f, "starting a fade does not jump");

    REQUIRE(gc.updateColorTransitions(circles, 2750.0) == 1, "one fade running");
    REQUIRE_NEAR(circles[0].color.r, 0.5f, 1e-5, "sine easing is half way at mid-transition");
    REQUIRE_NEAR(circles[0].color.g, 0.4f, 1e-5, "green half way");
    REQUIRE_NEAR(circles[0].color.b, 0.2f, 1e-5, "blue half way");
    REQUIRE(circles[1].color.b == 1.0f && !circles[1].colorFade, "circles without a fade untouched");

    // a quarter of the way in, 0.5*(1-cos(pi/4)) ~= 0.1464
    gc.updateColorTransitions(circles, 2375.0);
    REQUIRE_NEAR(circles[0].color.r, 0.1464466f, 1e-4, "eased slowly at the start");

    gc.startColorTransition(circles[0], Rgb{0.0f, 0.0f, 1.0f}, 3000.0, 500.0);
    REQUIRE_NEAR(circles[0].colorFade->from.r, 0.1464466f, 1e-4, "restart fades from the current colour");
    REQUIRE(gc.updateColorTransitions(circles, 4000.0) == 0, "past the end");
    REQUIRE(circles[0].color.b == 1.0f && circles[0].color.r == 0.0f && !circles[0].colorFade, "snaps to the target");
}

void testConsumeSamples() {
    PackingConfig cfg;
    GrowthController gc(cfg, 6);
    std::vector<Circle> circles{withId(Circle(50.0f, 50.0f, 5.0f, kBlue), 1),
                                withId(Circle(80.0f, 50.0f, 5.0f, kBlue), 2),
                                withId(Circle(110.0f, 50.0f, 5.0f, kBlue), 3),
                                withId(Circle(140.0f, 50.0f, 5.0f, kBlue), 4)};
    std::vector<SampleResponse> responses;
    SampleResponse failed{1, 50.0f, 50.0f, 5.0f, Rgb{1.0f, 0.0f, 0.0f}, false, "sample position outside raster"};
    SampleResponse stale{2, 60.0f, 50.0f, 5.0f, Rgb{1.0f, 0.0f, 0.0f}, true, ""};
    SampleResponse similar{3, 110.0f, 50.0f, 5.0f, Rgb{0.0f, 0.05f, 0.95f}, true, ""};
    SampleResponse mismatch{4, 141.0f, 50.0f, 5.0f, Rgb{1.0f, 0.0f, 0.0f}, true, ""};
    SampleResponse orphan{99, 10.0f, 10.0f, 5.0f, Rgb{1.0f, 0.0f, 0.0f}, true, ""};
    responses = {failed, stale, similar, mismatch, orphan};
    int adapting = gc.consumeSamples(circles, responses);
    REQUIRE(adapting == 1, "only the fresh mismatch adapts: " << adapting);
    REQUIRE(circles[0].isStable(), "failed sample skipped");
    REQUIRE(circles[1].isStable(), "stale sample skipped");
    REQUIRE(circles[2].isStable(), "similar colour keeps the circle stable");
    const Adapting* a = std::get_if<Adapting>(&circles[3].lifecycle);
    REQUIRE(a && a->phase == AdaptPhase::Resampling, "mismatch enters resampling");
    REQUIRE(a->originalColor.b == 1.0f, "original colour remembered");
}

void testScheduling() {
    PackingConfig cfg;
    GrowthController gc(cfg, 7);
    ColorSampler sampler(ColorSampler::Mode::Inline, 7);
    sampler.setSource(std::make_shared<const Raster>(solidRaster(400, 400, 0, 0, 255)));
    std::vector<Circle> circles;
    for (int i = 0; i < 100; ++i) circles.push_back(withId(Circle(10.0f + (i % 10) * 38.0f, 10.0f + (i / 10) * 38.0f, 4.0f, kBlue), (std::uint64_t)i + 1));
    circles[0].spawnProtectedUntilMs = 5000.0;
    circles[1].lifecycle = DynamicSpawning{10.0f};

    int first = gc.scheduleSimilarityChecks(circles, nullptr, sampler, 1000.0);
    REQUIRE(first > 5 && first < 70, "roughly 30% sampled: " << first);
    REQUIRE(gc.pendingSamples() == (size_t)first, "requests tracked as pending");
    auto responses = sampler.drain();
    REQUIRE(responses.size() == (size_t)first, "inline sampler answers immediately");
    for (const auto& r : responses) {
        REQUIRE(r.circleId != 1 && r.circleId != 2, "protected and non-stable circles skipped");
        REQUIRE(r.ok, "sample inside the raster succeeds");
    }

    int second = gc.scheduleSimilarityChecks(circles, nullptr, sampler, 1100.0);
    REQUIRE(first + second <= 98, "pending circles are not sampled twice");
    gc.consumeSamples(circles, responses);
    gc.consumeSamples(circles, sampler.drain());
    REQUIRE(gc.pendingSamples() == 0, "consumed responses clear pending");
    for (const auto& c : circles) REQUIRE(c.isStable() || c.id == 2, "matching colours never trigger adaptation");

    REQUIRE_NEAR(gc.pollingIntervalMs(0.0f), 3000.0, 1e-6, "calm image polls slowly");
    REQUIRE_NEAR(gc.pollingIntervalMs(1.0f), 200.0, 1e-3, "busy image polls fast");
    REQUIRE_NEAR(gc.pollingIntervalMs(0.5f), 1600.0, 1e-3, "interpolated interval");
}

void testPurge() {
    PackingConfig cfg;
    GrowthController gc(cfg, 8);
    const Bounds b{400.0f, 400.0f};
    std::vector<Circle> circles;
    for (int i = 0; i < 20; ++i) {
        Circle c = withId(Circle(20.0f + i * 18.0f, 200.0f, 5.0f, kBlue), (std::uint64_t)i + 1);
        if (i % 2 == 0) c.origin = CircleOrigin::Spawned;
        circles.push_back(c);
    }
    std::unique_ptr<SpatialIndex> index = makeSpatialIndex(SpatialIndex::Kind::QuadTree, b, circles, 2.0f);
    circles[0].setRadius(0.0f);
    circles[3].setRadius(0.005f);
    PurgeResult small = gc.purgeDead(circles, index, b);
    REQUIRE(small.removed == 2 && small.removedSpawned == 1, "two dead, one of them spawned");
    REQUIRE(!small.fullRebuild && index->kind() == SpatialIndex::Kind::QuadTree, "few removals rebuild in place");
    REQUIRE(circles.size() == 18 && index->size() == 18, "index matches the list");

    for (int i = 0; i < 12; ++i) circles[(size_t)i].setRadius(0.0f);
    PurgeResult big = gc.purgeDead(circles, index, b);
    REQUIRE(big.removed == 12 && big.fullRebuild, "many removals replace the index");
    REQUIRE(index->kind() == SpatialIndex::Kind::HashGrid && index->size() == 6, "fresh hash grid");
    REQUIRE(gc.purgeDead(circles, index, b).removed == 0, "nothing left to purge");
}

} // namespace

int main() {
    testDynamicSpawnReachesTarget();
    testDynamicSpawnStopsOnCollision();
    testProgressiveGrowth();
    testResampleWithoutMatch();
    testResampleFindsTarget();
    testSeekMovesAndGrows();
    testSeekShrinksWhenCrowded();
    testSeekNeverEnlargesSmallCircle();
    testColorTransitionEasing();
    testConsumeSamples();
    testScheduling();
    testPurge();
    std::cout << "[PASS] test_growth\n";
    return 0;
}
