/**
 * @file PlacementEngine.h
 * @brief Initial circle layout: change-weighted random placement or bouncing-ball settling, then relaxation.
 */
#pragma once

#include "Circle.h"
#include "ColorChangeTracker.h"
#include "Config.h"
#include "PoissonSampler.h"
#include "Raster.h"

#include <functional>
#include <random>
#include <string>
#include <vector>

class SpatialIndex;

struct PlacementStats {
    int attempts{0};   /**< attempts made (weighted) or balls dropped (bouncing) */
    int budget{0};
    int placed{0};
    int rejected{0};
    bool saturated{false};
};

/** @brief Progress callback: phase label and percent in [0,100]. */
using ProgressFn = std::function<void(const std::string& phase, int percent)>;

class PlacementEngine {
public:
    PlacementEngine(const PackingConfig& cfg, unsigned seed);

    /** @brief Reference area the attempt budget and ball count scale against (1920x1080). */
    static float screenAreaRatio(const Bounds& bounds);
    /** @brief totalCircles * areaRatio * 10, boosted 1.5x when a change map is available. */
    int attemptBudget(const Bounds& bounds, bool hasChangeMap) const;

    /**
     * @brief Fill the canvas with stable circles at their full radius.
     *
     * Each attempt draws a position (60% change-weighted when @p changeMap is given, otherwise from
     * a shuffled Poisson-disk set, then uniform), takes getMaxRadiusAt under an intensity-reduced
     * spacing, shrinks it by up to 70% in high-change areas and commits if it clears the minimum
     * (relaxed to 50% there). Stops at totalCircles or after 10% of the budget fails in a row.
     */
    std::vector<Circle> placeWeightedRandom(const Raster& raster, const ColorChangeMap* changeMap,
                                            PlacementStats* stats = nullptr);

    /** @brief Drop balls from above the canvas; keep those that settle within 200 steps. */
    std::vector<Circle> placeBouncing(const Raster& raster, PlacementStats* stats = nullptr);

    /** @brief Rejection-sample a position, accepting with probability 0.3 + 0.7 * intensity (20 tries). */
    SamplePoint sampleWeightedPosition(const ColorChangeMap& map, const Bounds& bounds);

    /** @brief Placement by configured mode followed by relaxation; ids are 1..n in placement order. */
    std::vector<Circle> generateLayout(const Raster& raster, const ColorChangeMap* changeMap,
                                       const ProgressFn& progress, PlacementStats* stats = nullptr);

private:
    bool simulateBall(Circle& ball, const SpatialIndex& index, const Bounds& bounds) const;

    PackingConfig cfg;
    std::mt19937 rng;
    unsigned baseSeed;
};
