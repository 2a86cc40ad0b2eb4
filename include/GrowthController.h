/**
 * @file GrowthController.h
 * @brief Per-circle lifecycle: progressive growth, dynamic-spawn growth and the colour-adaptation cycle.
 */
#pragma once

#include "Circle.h"
#include "ColorChangeTracker.h"
#include "ColorSampler.h"
#include "Config.h"
#include "Raster.h"
#include "SpatialIndex.h"

#include <memory>
#include <random>
#include <unordered_set>
#include <vector>

enum class SpawnGrowth { Grew, Collided, Reached };

struct PurgeResult {
    int removed{0};
    int removedSpawned{0};
    bool fullRebuild{false};
};

class GrowthController {
public:
    GrowthController(const PackingConfig& cfg, unsigned seed);

    void setConfig(const PackingConfig& c) { cfg = c; }

    /** @brief Shrink every circle to target*startSizeMultiplier and start a Growing ramp staggered 0..500 ms. */
    void initializeGrowth(std::vector<Circle>& circles, double nowMs);
    /**
     * @brief Advance one Growing circle; returns true when its radius changed.
     *
     * At 95% of the target radius the final colour is sampled once and faded in over
     * colorTransitionDuration.
     */
    bool updateGrowth(Circle& c, const Raster& raster, double nowMs);
    /**
     * @brief Grow a DynamicSpawning circle by one step, never past its target.
     *
     * The step is tested against @p index (ignoring @p c) and the canvas; on collision the radius
     * stays where it is. Collision or reaching the target pins the circle and ends the lifecycle.
     */
    SpawnGrowth stepDynamicSpawn(Circle& c, const SpatialIndex& index, const Bounds& bounds) const;
    /** @brief Growth and dynamic-spawn steps for every circle in the list. */
    void updateLifecycles(std::vector<Circle>& circles, const SpatialIndex& index, const Raster& raster, double nowMs);

    /** @brief Base interval scaled by clamp(3.0 - 2.8 * avgIntensity, 0.2, 3.0). */
    double pollingIntervalMs(float averageIntensity) const;
    /**
     * @brief Issue similarity samples for a weighted ~30% of eligible circles
     *        (stable, outside spawn protection, no request in flight). Returns requests issued.
     */
    int scheduleSimilarityChecks(const std::vector<Circle>& circles, const ColorChangeMap* changeMap,
                                 ColorSampler& sampler, double nowMs);
    /**
     * @brief Apply sample responses. Failed, stale (moved > 5) or orphaned responses are skipped;
     *        a match below colorSimilarityThreshold moves the circle into Adapting/Resampling.
     * @return circles that entered adaptation.
     */
    int consumeSamples(std::vector<Circle>& circles, const std::vector<SampleResponse>& responses);
    /** @brief Run one adaptation phase for every Adapting circle. */
    void updateAdaptations(std::vector<Circle>& circles, const SpatialIndex& index, const Raster& raster, double nowMs);
    /** @brief Ring probe: 16 points at radius 20; best match above threshold becomes the seek target. */
    bool resample(Circle& c, const Raster& raster) const;
    /**
     * @brief Move 10% of the clear distance toward the seek target and adjust radius.
     *
     * The colour fades over colorAnimationDuration toward the halfway blend of the current and target
     * colours. A crowded circle shrinks by 5% but never below minCircleSize, and one that is already
     * smaller than minCircleSize keeps its radius.
     */
    void seek(Circle& c, const SpatialIndex& index, const Bounds& bounds, double nowMs) const;
    /** @brief Free distance along (dirX,dirY) before leaving the canvas or nearing a neighbour (max 30). */
    float castRay(const Circle& c, float dirX, float dirY, const SpatialIndex& index, const Bounds& bounds) const;

    /** @brief Start a fade from the current colour to @p target; replaces any fade in progress. */
    void startColorTransition(Circle& c, const Rgb& target, double nowMs, double durationMs) const;
    /** @brief Advance every fade with 0.5*(1-cos(pi*p)) easing; returns fades still running. */
    int updateColorTransitions(std::vector<Circle>& circles, double nowMs) const;

    /**
     * @brief Erase dead circles and refresh @p index. More than 10 removals replace the index with
     *        a fresh HashGrid sized by the new average radius.
     */
    PurgeResult purgeDead(std::vector<Circle>& circles, std::unique_ptr<SpatialIndex>& index, const Bounds& bounds);

    std::size_t pendingSamples() const { return pending.size(); }
    void forgetPending() { pending.clear(); }

private:
    PackingConfig cfg;
    std::mt19937 rng;
    std::unordered_set<std::uint64_t> pending;
};
