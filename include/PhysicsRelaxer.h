/**
 * @file PhysicsRelaxer.h
 * @brief Verlet relaxation with mass-weighted pairwise separation and bouncing wall containment,
 *        plus the explicit-force fallback used when Verlet is disabled.
 */
#pragma once

#include "Circle.h"
#include "Config.h"

#include <random>
#include <vector>

struct RelaxStats {
    int steps{0};               /**< integration substeps or force iterations run */
    int settlePasses{0};
    float maxPenetration{0.0f}; /**< after the final pass */
};

class PhysicsRelaxer {
public:
    PhysicsRelaxer(const PackingConfig& cfg, unsigned seed);

    /** @brief Verlet or force relaxation per useVerletPhysics, followed by settle(). */
    RelaxStats relax(std::vector<Circle>& circles, const Bounds& bounds);
    /** @brief physicsIterations x substeps of integrate / resolveCollisions / constrainToBounds. */
    RelaxStats relaxVerlet(std::vector<Circle>& circles, const Bounds& bounds);
    /**
     * @brief Overlap repulsion with linearly decaying damping, at most 3..10 iterations.
     *
     * Stops early once the largest summed force magnitude falls below 0.1. That is the force before
     * the per-step clamp, damping and canvas clamp are applied, not the distance a circle actually
     * moved: a circle held against a wall by a neighbour keeps the loop running although it no
     * longer moves.
     */
    RelaxStats relaxForces(std::vector<Circle>& circles, const Bounds& bounds);

    /** @brief One real-time frame: substeps x (integrate, resolve, contain). */
    void frameStep(std::vector<Circle>& circles, const Bounds& bounds);

    void integrate(std::vector<Circle>& circles, float dt);
    /**
     * @brief Push every pair closer than (r1+r2)*circleSpacing apart along the contact normal.
     * @return the largest penetration seen before correction.
     *
     * Lighter circles move more (ratio = other mass / total * 1.5, of half the overlap). A circle
     * paired with a pinned one takes the whole correction; pinned pairs and coincident centres
     * are skipped.
     */
    float resolveCollisions(std::vector<Circle>& circles) const;
    void constrainToBounds(std::vector<Circle>& circles, const Bounds& bounds) const;
    /** @brief Repeat resolve + contain until penetration < 0.01 or @p maxPasses is reached. */
    int settle(std::vector<Circle>& circles, const Bounds& bounds, int maxPasses = 100) const;
    /** @brief Largest (r1+r2)*circleSpacing - distance over non-pinned pairs; 0 when none overlap. */
    float measurePenetration(const std::vector<Circle>& circles) const;

    void setConfig(const PackingConfig& c) { cfg = c; }
    void setJitter(float amount) { jitter = amount; }

private:
    PackingConfig cfg;
    std::mt19937 rng;
    float jitter{0.01f};
};
